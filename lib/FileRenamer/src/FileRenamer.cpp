#include "FileRenamer/FileRenamer.hpp"

bool FileRenamer::Rename(const fs::path& source, const fs::path& target, std::error_code& errorCode) const
{
    errorCode.clear();

    const bool sourceExists = fs::exists(source, errorCode);
    if (0 != errorCode.value())
    {
        return false;
    }
    if (false == sourceExists)
    {
        errorCode = std::make_error_code(std::errc::no_such_file_or_directory);
        return false;
    }

    const bool targetExists = fs::exists(target, errorCode);
    if (0 != errorCode.value())
    {
        return false;
    }
    if (true == targetExists)
    {
        errorCode = std::make_error_code(std::errc::file_exists);
        return false;
    }

    fs::rename(source, target, errorCode);
    return 0 == errorCode.value();
}
