#pragma once

#include <filesystem>
#include <functional>
#include <system_error>

namespace fs = std::filesystem;

/**
 * @brief Infrastructure component for enumerating regular files on the filesystem.
 */
class FileIterator
{
  public:
    using FileCallback = std::function<void(const fs::path&)>;
    using ErrorCallback = std::function<void(const fs::path&, const std::error_code&)>;

    /**
     * @brief Iterate regular files under the provided path.
     *
     * Directories, symlinks to directories and other non-regular entries are
     * skipped. Entries that cannot be read are reported through @p onError and
     * the walk continues with the next entry; a subdirectory that vanishes or
     * cannot be opened only costs its own subtree.
     *
     * @param[in] path Root file or directory to enumerate
     * @param[in] onFile Callback invoked for each regular file
     * @param[in] onError Optional callback invoked for each entry that fails
     * @return false if @p path itself could not be opened, true otherwise
     */
    bool Iterate(const fs::path& path, const FileCallback& onFile, const ErrorCallback& onError = nullptr) const;
};
