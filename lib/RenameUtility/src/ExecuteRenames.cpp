#include "RenameUtility/RenameUtility.hpp"
#include "FileRenamer/FileRenamer.hpp"
#include "LogRegistry/LogRegistry.hpp"

RenameSummary ExecuteRenames(const std::vector<RenameCandidate>& candidates,
                             const std::function<void(const RenameResult&)>& onResult)
{
    const auto logger = LogRegistry::Rename();
    const FileRenamer fileRenamer{};
    RenameSummary summary;

    for (const auto& candidate : candidates)
    {
        RenameResult result;
        result.source = candidate.path;
        result.target = candidate.Target();

        if (true == fileRenamer.Rename(result.source, result.target, result.error))
        {
            ++summary.renamed;
            logger->debug("Renamed '{}' -> '{}'", result.source.string(), result.target.string());
        }
        else
        {
            ++summary.failed;
            logger->warn("Failed to rename '{}' -> '{}': {}", result.source.string(), result.target.string(),
                         result.error.message());
        }

        if (nullptr != onResult)
        {
            onResult(result);
        }
    }

    return summary;
}
