#include "RenameUtility/RenameUtility.hpp"
#include "FileIterator/FileIterator.hpp"
#include "LogRegistry/LogRegistry.hpp"
#include "TimestampRelocator/TimestampRelocator.hpp"

std::vector<RenameCandidate> ScanRenameCandidates(const fs::path& rootDir,
                                                  const std::function<void(const RenameProgress&)>& onProgress)
{
    const auto logger = LogRegistry::Rename();
    const TimestampRelocator relocator;
    const FileIterator fileIterator{};

    std::vector<RenameCandidate> candidates;
    std::size_t scannedCount = 0;

    auto onFile = [&](const fs::path& file)
    {
        const std::string name = file.filename().string();
        const std::string relocated = relocator.Relocate(name);

        if (relocated != name)
        {
            logger->debug("Candidate: {} -> {}", file.string(), relocated);
            candidates.push_back({file, relocated});
        }

        if (nullptr != onProgress)
        {
            onProgress({"scanning", ++scannedCount, 0, file});
        }
    };

    auto onError = [&](const fs::path& entry, const std::error_code& errorCode)
    { logger->warn("Skipping '{}': {}", entry.string(), errorCode.message()); };

    if (false == fileIterator.Iterate(rootDir, onFile, onError))
    {
        logger->error("Cannot scan '{}'", rootDir.string());
    }

    logger->debug("Scanned {} files, {} to rename", scannedCount, candidates.size());
    return candidates;
}
