#include "FileIterator/FileIterator.hpp"

namespace
{

/**
 * @brief Visit one directory level, descending into real subdirectories.
 *
 * A directory that cannot be opened or read only loses its own remaining
 * entries; the caller continues with its siblings.
 *
 * @param[in] directory Directory to list
 * @param[in] onFile Callback invoked for each regular file
 * @param[in] reportError Callback invoked for each failing entry
 * @return false if @p directory itself could not be opened
 */
bool WalkDirectory(const fs::path& directory, const FileIterator::FileCallback& onFile,
                   const FileIterator::ErrorCallback& reportError)
{
    std::error_code errorCode;
    fs::directory_iterator iterator(directory, fs::directory_options::skip_permission_denied, errorCode);
    if (0 != errorCode.value())
    {
        reportError(directory, errorCode);
        return false;
    }

    const fs::directory_iterator end;
    while (end != iterator)
    {
        const fs::directory_entry entry = *iterator;

        std::error_code entryError;
        const bool entryIsSymlink = entry.is_symlink(entryError);
        const bool entryIsFile = (0 == entryError.value()) && entry.is_regular_file(entryError);
        const bool entryIsDirectory = (0 == entryError.value()) && (false == entryIsSymlink) && entry.is_directory(entryError);

        if (0 != entryError.value())
        {
            reportError(entry.path(), entryError);
        }
        else if (true == entryIsFile)
        {
            onFile(entry.path());
        }
        else if (true == entryIsDirectory)
        {
            WalkDirectory(entry.path(), onFile, reportError);
        }

        iterator.increment(errorCode);
        if (0 != errorCode.value())
        {
            // The iterator is left at end after a failed increment.
            reportError(directory, errorCode);
            break;
        }
    }

    return true;
}

} // namespace

bool FileIterator::Iterate(const fs::path& path, const FileCallback& onFile, const ErrorCallback& onError) const
{
    auto reportError = [&onError](const fs::path& entryPath, const std::error_code& errorCode)
    {
        if (nullptr != onError)
        {
            onError(entryPath, errorCode);
        }
    };

    std::error_code errorCode;
    const bool isRegularFile = fs::is_regular_file(path, errorCode);
    if ((0 == errorCode.value()) && (true == isRegularFile))
    {
        onFile(path);
        return true;
    }

    errorCode.clear();
    const bool isDirectory = fs::is_directory(path, errorCode);
    if ((0 != errorCode.value()) || (false == isDirectory))
    {
        reportError(path, errorCode ? errorCode : std::make_error_code(std::errc::not_a_directory));
        return false;
    }

    return WalkDirectory(path, onFile, reportError);
}
