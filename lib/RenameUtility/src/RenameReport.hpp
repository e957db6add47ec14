#pragma once

#include "RenameUtility/RenameUtility.hpp"

#include <ostream>
#include <string>
#include <vector>

/**
 * @brief Presentation component writing the human-readable rename report.
 */
class RenameReport
{
  public:
    /**
     * @brief Construct a report bound to an output stream.
     *
     * @param[in] output Destination stream
     * @param[in] useColor Emit ANSI colors
     */
    RenameReport(std::ostream& output, bool useColor);

    void PrintSearchRoot(const fs::path& rootDir);
    void PrintNoMatches();
    void PrintDryRun(const std::vector<RenameCandidate>& candidates);
    void PrintPrompt();
    void PrintCancelled();
    void PrintRenameHeader();
    void PrintResult(const RenameResult& result);
    void PrintSummary(const RenameSummary& summary);

  private:
    void PrintRule();

    std::ostream& _output;
    bool _useColor;
};
