#include "cellscrub/report/RecordsCsvWriter.hpp"
#include "cellscrub/core/CSVProcessor.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace cellscrub {
namespace report {

std::vector<std::string> RecordsCsvWriter::header() {
    return {"sheet", "row", "column", "column_header", "cell_value",
            "problematic_char", "hex_value", "char_positions", "is_printable", "char_description"};
}

std::vector<std::string> RecordsCsvWriter::toRow(const scan::Finding& finding) {
    return {
        finding.sheet,
        fmt::format("{}", finding.row),
        finding.columnLetter,
        finding.columnHeader,
        finding.cellValue,
        finding.pattern,
        finding.hexValue,
        finding.positionsText(),
        finding.isPrintable ? "True" : "False",
        finding.description
    };
}

core::VoidResult RecordsCsvWriter::write(const std::string& csv_path, const std::vector<scan::Finding>& findings) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(findings.size() + 1);
    rows.push_back(header());
    for (const auto& finding : findings) {
        rows.push_back(toRow(finding));
    }

    auto result = core::writeCSVToFile(csv_path, rows);
    if (!result) {
        REPORT_ERROR("Failed to write scan results {}: {}", csv_path, result.error().fullMessage());
        return result;
    }
    REPORT_INFO("Results saved to {} ({} rows)", csv_path, findings.size());
    return result;
}

}} // namespace cellscrub::report
