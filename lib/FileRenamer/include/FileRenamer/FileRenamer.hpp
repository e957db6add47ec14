#pragma once

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

/**
 * @brief Infrastructure component renaming a single file without overwriting.
 */
class FileRenamer
{
  public:
    /**
     * @brief Rename @p source to @p target.
     *
     * Fails with std::errc::no_such_file_or_directory when the source is gone,
     * std::errc::file_exists when the target is already taken, or with the
     * error reported by the operating system.
     *
     * @param[in] source Existing file path
     * @param[in] target Destination path
     * @param[out] errorCode Failure reason, cleared on success
     * @return true on success, false on error
     */
    bool Rename(const fs::path& source, const fs::path& target, std::error_code& errorCode) const;
};
