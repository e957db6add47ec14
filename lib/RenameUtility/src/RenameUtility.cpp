// file RenameUtility.cpp
#include "RenameUtility/RenameUtility.hpp"
#include "LogRegistry/LogRegistry.hpp"
#include "RenameReport.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace
{

/**
 * @brief Check that the root exists and is a directory, reporting the problem otherwise.
 *
 * @param[in] rootDir Directory requested by the user
 * @param[in] errorOutput Stream receiving the error message
 * @return true if the directory can be scanned
 */
bool ValidateRootDirectory(const fs::path& rootDir, std::ostream& errorOutput)
{
    std::error_code errorCode;
    const bool rootExists = fs::exists(rootDir, errorCode);
    if (0 != errorCode.value())
    {
        errorOutput << "Error: Cannot access '" << rootDir.string() << "': " << errorCode.message() << '\n';
        return false;
    }
    if (false == rootExists)
    {
        errorOutput << "Error: Directory '" << rootDir.string() << "' does not exist\n";
        return false;
    }

    const bool rootIsDirectory = fs::is_directory(rootDir, errorCode);
    if (0 != errorCode.value())
    {
        errorOutput << "Error: Cannot access '" << rootDir.string() << "': " << errorCode.message() << '\n';
        return false;
    }
    if (false == rootIsDirectory)
    {
        errorOutput << "Error: '" << rootDir.string() << "' is not a directory\n";
        return false;
    }

    return true;
}

fs::path ResolveForDisplay(const fs::path& rootDir)
{
    std::error_code errorCode;
    fs::path resolved = fs::weakly_canonical(rootDir, errorCode);
    if (0 != errorCode.value())
    {
        return rootDir;
    }
    return resolved;
}

} // namespace

bool IsAffirmativeResponse(const std::string& response)
{
    const std::size_t first = response.find_first_not_of(" \t\r\n");
    if (std::string::npos == first)
    {
        return false;
    }
    const std::size_t last = response.find_last_not_of(" \t\r\n");

    std::string answer = response.substr(first, last - first + 1);
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });

    return ("yes" == answer) || ("y" == answer);
}

bool RunRename(const RenameConfig& config)
{
    const auto logger = LogRegistry::Rename();

    if (false == ValidateRootDirectory(config.rootDir, *config.errorOutput))
    {
        return false;
    }

    RenameReport report(*config.output, config.color);
    report.PrintSearchRoot(ResolveForDisplay(config.rootDir));

    const std::vector<RenameCandidate> candidates = ScanRenameCandidates(config.rootDir, config.onProgress);
    if (true == candidates.empty())
    {
        report.PrintNoMatches();
        return true;
    }

    report.PrintDryRun(candidates);

    if (true == config.dryRun)
    {
        return true;
    }

    report.PrintPrompt();
    std::string response;
    if ((false == static_cast<bool>(std::getline(*config.input, response))) || (false == IsAffirmativeResponse(response)))
    {
        logger->info("Confirmation declined, {} files left unchanged", candidates.size());
        report.PrintCancelled();
        return true;
    }

    report.PrintRenameHeader();

    std::size_t processedCount = 0;
    const RenameSummary summary = ExecuteRenames(candidates,
                                                 [&](const RenameResult& result)
                                                 {
                                                     report.PrintResult(result);
                                                     if (nullptr != config.onProgress)
                                                     {
                                                         config.onProgress({"renaming", ++processedCount, candidates.size(), result.source});
                                                     }
                                                 });

    report.PrintSummary(summary);
    logger->info("Summary: {} renamed, {} errors", summary.renamed, summary.failed);
    return true;
}
