#include "cellscrub/report/FindingsReportWriter.hpp"
#include "cellscrub/report/ReportText.hpp"
#include "cellscrub/core/Constants.hpp"
#include "cellscrub/core/Path.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace cellscrub {
namespace report {

FindingsReportWriter::FindingsReportWriter(const std::string& encoding) : encoder_(encoding) {}

core::VoidResult FindingsReportWriter::write(const std::string& source_path,
                                             const std::vector<scan::Finding>& findings,
                                             const std::string& report_path,
                                             const std::tm& generated) {
    hints_.clear();
    hint_overflow_ = 0;

    const std::string text = ReportText::findingsReport(source_path, findings, generated);
    auto encoded = encoder_.encode(text);
    if (!encoded) {
        REPORT_ERROR("Findings report not written: {}", encoded.error().fullMessage());
        collectHints(findings);
        return encoded.error();
    }

    auto result = core::Path(report_path).writeAll(encoded.value());
    if (!result) {
        REPORT_ERROR("Failed to write findings report {}: {}", report_path, result.error().fullMessage());
        return result;
    }

    REPORT_INFO("Detailed findings report saved to {} ({})", report_path, encoder_.getEncoding());
    return core::ok();
}

void FindingsReportWriter::collectHints(const std::vector<scan::Finding>& findings) {
    std::vector<const scan::Finding*> suspects;
    for (const auto& finding : findings) {
        if (!encoder_.canEncode(finding.cellValue) || !encoder_.canEncode(finding.pattern) ||
            !encoder_.canEncode(finding.sheet) || !encoder_.canEncode(finding.columnHeader) ||
            !encoder_.canEncode(finding.description)) {
            suspects.push_back(&finding);
        }
    }

    // 定位不到具体单元格时退回到前几条 Finding
    if (suspects.empty()) {
        for (const auto& finding : findings) {
            suspects.push_back(&finding);
        }
    }

    const size_t limit = core::Constants::kMaxHintLocations;
    for (size_t i = 0; i < suspects.size() && i < limit; ++i) {
        hints_.push_back(fmt::format("Sheet: {}, Cell: {}", suspects[i]->sheet, suspects[i]->cellRef()));
    }
    hint_overflow_ = suspects.size() > limit ? suspects.size() - limit : 0;
}

}} // namespace cellscrub::report
