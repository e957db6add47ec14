// file sanitize_main.cpp:

#include "NameSanitizer/NameSanitizer.hpp"
#include "cxxopts.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

/**
 * @brief Parses command-line arguments using cxxopts.
 *
 * @param[in] argc Argument count.
 * @param[in] argv Argument values.
 * @param[out] exitCode Exit code to use when parsing does not produce a result.
 * @return Names given on the command line (possibly none), or an empty optional
 *         when help was shown or the arguments were invalid.
 */
std::optional<std::vector<std::string>> ParseCommandLineOptions(int argc, char* argv[], int& exitCode)
{
    cxxopts::Options options("sanitize-name", "Print file names normalized to a safe character set");

    // clang-format off
    options.add_options()
        ("names", "Names to sanitize; read one per line from stdin when omitted", cxxopts::value<std::vector<std::string>>())
        ("h,help", "Print help");
    // clang-format on

    options.parse_positional({"names"});
    options.positional_help("[name...]");

    try
    {
        auto parseResult = options.parse(argc, argv);

        if (true == parseResult.count("help"))
        {
            std::cout << options.help() << '\n';
            exitCode = 0;
            return std::nullopt;
        }

        if (0 == parseResult.count("names"))
        {
            return std::vector<std::string>();
        }
        return parseResult["names"].as<std::vector<std::string>>();
    }
    catch (const std::exception& error)
    {
        std::cerr << error.what() << '\n';
        exitCode = 1;
        return std::nullopt;
    }
}

} // namespace

int main(int argc, char* argv[])
{
    int exitCode = 0;
    const std::optional<std::vector<std::string>> names = ParseCommandLineOptions(argc, argv, exitCode);
    if (false == names.has_value())
    {
        return exitCode;
    }

    const NameSanitizer sanitizer{};

    if (false == names->empty())
    {
        for (const auto& name : names.value())
        {
            std::cout << sanitizer.Sanitize(name) << '\n';
        }
        return 0;
    }

    std::string line;
    while (std::getline(std::cin, line))
    {
        std::cout << sanitizer.Sanitize(line) << '\n';
    }
    return 0;
}
