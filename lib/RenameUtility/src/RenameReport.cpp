#include "RenameReport.hpp"
#include "ConsoleStyle/ConsoleStyle.hpp"

namespace
{
constexpr std::size_t RuleWidth = 80;
}

RenameReport::RenameReport(std::ostream& output, bool useColor)
    : _output(output), _useColor(useColor)
{
}

void RenameReport::PrintRule()
{
    _output << std::string(RuleWidth, '=') << '\n';
}

void RenameReport::PrintSearchRoot(const fs::path& rootDir)
{
    _output << "Searching in: " << rootDir.string() << '\n';
}

void RenameReport::PrintNoMatches()
{
    _output << '\n' << Colorize("No files matching the timestamp pattern were found.", AnsiColor::Yellow, _useColor) << '\n';
}

void RenameReport::PrintDryRun(const std::vector<RenameCandidate>& candidates)
{
    _output << '\n';
    PrintRule();
    _output << Colorize("DRY RUN - Files that would be renamed:", AnsiColor::Cyan, _useColor) << '\n';
    PrintRule();
    _output << '\n';

    for (const auto& candidate : candidates)
    {
        _output << "FROM: " << candidate.path.string() << '\n';
        _output << "  TO: " << Colorize(candidate.Target().string(), AnsiColor::Sage, _useColor) << '\n';
        _output << '\n';
    }

    _output << "\nTotal files to rename: " << candidates.size() << '\n';
}

void RenameReport::PrintPrompt()
{
    _output << "\nProceed with renaming? (yes/no): " << std::flush;
}

void RenameReport::PrintCancelled()
{
    _output << '\n' << Colorize("Renaming cancelled.", AnsiColor::Yellow, _useColor) << '\n';
}

void RenameReport::PrintRenameHeader()
{
    _output << '\n';
    PrintRule();
    _output << Colorize("Renaming files...", AnsiColor::Cyan, _useColor) << '\n';
    PrintRule();
    _output << '\n';
}

void RenameReport::PrintResult(const RenameResult& result)
{
    const std::string name = result.source.filename().string();
    if (true == result.Succeeded())
    {
        _output << Colorize("✓", AnsiColor::Green, _useColor) << ' ' << name << '\n';
    }
    else
    {
        _output << Colorize("✗", AnsiColor::Red, _useColor) << " Error renaming " << name << ": " << result.error.message()
                << '\n';
    }
}

void RenameReport::PrintSummary(const RenameSummary& summary)
{
    _output << '\n';
    PrintRule();
    _output << "Summary: " << summary.renamed << " renamed, " << summary.failed << " errors" << '\n';
    PrintRule();
}
