// file RenameUtility.hpp:

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief A file whose name would change, paired with its proposed new name.
 */
struct RenameCandidate
{
    fs::path path;        /**< Current path of the file */
    std::string newName;  /**< Proposed base name, differs from path.filename() */

    /**
     * @brief Destination path in the same parent directory.
     *
     * @return path.parent_path() / newName
     */
    fs::path Target() const
    {
        return path.parent_path() / newName;
    }
};

/**
 * @brief Outcome of a single rename attempt.
 */
struct RenameResult
{
    fs::path source;          /**< File that was renamed */
    fs::path target;          /**< Requested destination */
    std::error_code error;    /**< Failure reason, empty on success */

    bool Succeeded() const
    {
        return 0 == error.value();
    }
};

/**
 * @brief Counts of a batch rename.
 */
struct RenameSummary
{
    std::size_t renamed = 0;  /**< Successful renames */
    std::size_t failed = 0;   /**< Failed renames */
};

/**
 * @brief Progress information for scan and rename stages.
 */
struct RenameProgress
{
    const char* stage;          /**< "scanning" or "renaming" */
    std::size_t processed;      /**< Number of items processed so far */
    std::size_t total;          /**< Total number of items, 0 while unknown */
    fs::path file;              /**< Currently processed file path */
};

/**
 * @brief Configuration parameters for a batch rename run.
 */
struct RenameConfig
{
    fs::path rootDir;           /**< Directory tree to scan */

    bool dryRun;                /**< Preview only, never prompt or rename */
    bool verbose;               /**< Enable debug logging */
    bool color;                 /**< Use ANSI colors in the report */

    std::istream* input;        /**< Source of the confirmation answer */
    std::ostream* output;       /**< Report destination */
    std::ostream* errorOutput;  /**< Usage error destination */

    std::function<void(const RenameProgress&)> onProgress;  /**< Optional callback for progress notifications */

    /**
     * @brief Initialize configuration with default values bound to the standard streams.
     */
    RenameConfig()
        : dryRun(false)
        , verbose(false)
        , color(false)
        , input(&std::cin)
        , output(&std::cout)
        , errorOutput(&std::cerr)
        , onProgress(nullptr)
    {
    }
};

/**
 * @brief Collect every regular file under a directory whose name would change
 *        by moving its timestamp suffix to the front.
 *
 * The whole tree is walked before returning, in directory iteration order.
 *
 * @param[in] rootDir Directory to scan recursively
 * @param[in] onProgress Optional progress callback
 * @return Candidates in traversal order
 */
std::vector<RenameCandidate> ScanRenameCandidates(const fs::path& rootDir,
                                                  const std::function<void(const RenameProgress&)>& onProgress = nullptr);

/**
 * @brief Rename every candidate within its parent directory.
 *
 * A failing candidate is recorded and the next one is attempted; the batch
 * never stops early and never overwrites an existing file.
 *
 * @param[in] candidates Candidates to apply, in order
 * @param[in] onResult Optional callback invoked after each attempt
 * @return Success and failure counts
 */
RenameSummary ExecuteRenames(const std::vector<RenameCandidate>& candidates,
                             const std::function<void(const RenameResult&)>& onResult = nullptr);

/**
 * @brief Check whether an answer confirms the batch.
 *
 * @param[in] response Raw line typed by the user
 * @return true for "yes" or "y" in any case, surrounding whitespace ignored
 */
bool IsAffirmativeResponse(const std::string& response);

/**
 * @brief Run the scan, preview, confirmation and rename workflow.
 *
 * Nothing is renamed unless the confirmation read from config.input is
 * affirmative.
 *
 * @param[in] config Configuration parameters for the run
 * @return false if the root directory is missing or not a directory, true otherwise
 */
bool RunRename(const RenameConfig& config);
