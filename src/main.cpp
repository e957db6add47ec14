// file main.cpp:

#include "LogRegistry/LogRegistry.hpp"
#include "RenameUtility/RenameUtility.hpp"
#include "cxxopts.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace
{

/**
 * @brief Parses command-line arguments using cxxopts.
 *
 * @param[in] argc Argument count.
 * @param[in] argv Argument values.
 * @param[out] exitCode Exit code to use when parsing does not produce a result.
 * @return std::optional<cxxopts::ParseResult> if parsing is successful and help is not requested,
 *         otherwise returns an empty optional (help shown, or the directory is missing).
 */
std::optional<cxxopts::ParseResult> ParseCommandLineOptions(int argc, char* argv[], int& exitCode)
{
    cxxopts::Options options("timestamp-rename", "Move timestamp suffixes of file names to the front");

    // clang-format off
    options.add_options()
        ("directory", "Directory to scan recursively", cxxopts::value<std::string>())
        ("n,dry-run", "Show the files that would be renamed and exit")
        ("v,verbose", "Verbose diagnostic logging")
        ("no-color",  "Disable colored output (always off when stdout is not a terminal)")
        ("h,help",    "Print help");
    // clang-format on

    options.parse_positional({"directory"});
    options.positional_help("<directory>");

    try
    {
        auto parseResult = options.parse(argc, argv);

        if (true == parseResult.count("help"))
        {
            std::cout << options.help() << '\n';
            exitCode = 0;
            return std::nullopt;
        }

        if (false == parseResult.count("directory"))
        {
            std::cout << options.help() << '\n';
            exitCode = 1;
            return std::nullopt;
        }

        return parseResult;
    }
    catch (const std::exception& error)
    {
        std::cerr << error.what() << '\n';
        std::cout << options.help() << '\n';
        exitCode = 1;
        return std::nullopt;
    }
}

/**
 * @brief Check whether standard output is an interactive terminal.
 *
 * @return true if escape sequences will be rendered rather than stored
 */
bool StdoutIsTerminal()
{
#ifdef _WIN32
    return 0 != _isatty(_fileno(stdout));
#else
    return 0 != isatty(fileno(stdout));
#endif
}

/**
 * @brief Builds the RenameConfig from parsed command-line options.
 *
 * @param[in] parseResult The parsed command-line options.
 * @return Configuration bound to the standard streams.
 */
RenameConfig SetupRenameConfiguration(const cxxopts::ParseResult& parseResult)
{
    RenameConfig config;

    config.rootDir = fs::path(parseResult["directory"].as<std::string>());
    config.dryRun = (0 < parseResult.count("dry-run"));
    config.verbose = (0 < parseResult.count("verbose"));
    config.color = (0 == parseResult.count("no-color")) && (true == StdoutIsTerminal());

    if (true == config.verbose)
    {
        config.onProgress = [](const RenameProgress& progress)
        { std::cerr << "[" << progress.stage << "] " << progress.processed << "/" << progress.total << " : " << progress.file.string() << '\n'; };
    }

    return config;
}

} // namespace

int main(int argc, char* argv[])
{
    int exitCode = 0;
    std::optional<cxxopts::ParseResult> parseResult = ParseCommandLineOptions(argc, argv, exitCode);

    if (false == parseResult.has_value())
    {
        return exitCode;
    }

    const RenameConfig renameConfiguration = SetupRenameConfiguration(parseResult.value());
    LogRegistry::Init(renameConfiguration.verbose);

    if (false == RunRename(renameConfiguration))
    {
        return 1; // Invalid directory, error message already printed.
    }

    return 0;
}
