#include "cellscrub/report/ReportText.hpp"
#include "cellscrub/core/Constants.hpp"
#include "cellscrub/core/Path.hpp"
#include "cellscrub/scan/CellScanner.hpp"
#include "cellscrub/unicode/EscapeDecoder.hpp"
#include "cellscrub/utils/TimeUtils.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace cellscrub {
namespace report {

std::string ReportText::contextLines(const std::string& value, size_t position) {
    auto decoded = unicode::fromUtf8(scan::CellScanner::sanitize(value));
    const std::u32string text = decoded ? decoded.value() : std::u32string();

    const size_t radius = core::Constants::kContextRadius;
    const size_t start = position > radius ? position - radius : 0;
    const size_t end = std::min(text.size(), position + radius + 1);
    const std::u32string window = start < end ? text.substr(start, end - start) : std::u32string();

    return fmt::format("Context: ...{}...\n         {}^\n",
                       unicode::toUtf8(window), std::string(position - start, ' '));
}

std::string ReportText::findingBlock(const scan::Finding& finding) {
    std::string out;
    out += fmt::format("Sheet: {}\n", finding.sheet);
    out += fmt::format("Location: Cell {} (Column Header: {})\n", finding.cellRef(), finding.columnHeader);
    out += fmt::format("Problematic Character: {}\n", finding.hexValue);
    if (finding.isPrintable) {
        out += fmt::format("Character: '{}' - {}\n", finding.pattern, finding.description);
    } else {
        out += fmt::format("Character: Non-printable - {}\n", finding.description);
    }
    out += fmt::format("Character Position(s) in Cell: {}\n", finding.positionsText());
    out += fmt::format("Cell Value: {}\n", finding.cellValue);

    for (size_t pos : finding.positions) {
        out += contextLines(finding.cellValue, pos);
    }
    return out;
}

std::string ReportText::separator() {
    return std::string(core::Constants::kSeparatorWidth, '-') + "\n";
}

std::string ReportText::findingsReport(const std::string& source_path,
                                       const std::vector<scan::Finding>& findings,
                                       const std::tm& generated) {
    std::string out;
    out += fmt::format("Problematic Character Report for: {}\n", core::Path(source_path).filename());
    out += fmt::format("Generated on: {}\n\n",
                       utils::TimeUtils::formatTime(generated, core::Constants::kReportTimestampFormat));
    out += fmt::format("Found {} instances of problematic characters:\n", findings.size());
    out += separator();

    for (const auto& finding : findings) {
        out += findingBlock(finding);
        out += separator();
    }
    return out;
}

std::string ReportText::cleaningLog(const std::string& source_path,
                                    const clean::ChangeLog& changes,
                                    const std::tm& created) {
    std::string out;
    out += fmt::format("Excel Cleaning Log for {}\n", source_path);
    out += fmt::format("Created on {}\n\n",
                       utils::TimeUtils::formatTime(created, core::Constants::kReportTimestampFormat));
    out += fmt::format("Total cells cleaned: {}\n\n", changes.size());

    size_t index = 1;
    for (const auto& record : changes.records()) {
        out += fmt::format("Change {}:\n", index++);
        out += fmt::format("  Sheet: {}\n", record.sheet);
        out += fmt::format("  Cell: {}\n", record.cellRef);
        out += fmt::format("  Original: {}\n", record.originalValue);
        out += fmt::format("  Cleaned: {}\n\n", record.newValue);
    }
    return out;
}

}} // namespace cellscrub::report
