#include "cellscrub/report/ChangeLogWriter.hpp"
#include "cellscrub/report/ReportText.hpp"
#include "cellscrub/core/Constants.hpp"
#include "cellscrub/core/Path.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include "cellscrub/utils/TimeUtils.hpp"
#include <fmt/format.h>

namespace cellscrub {
namespace report {

ChangeLogWriter::ChangeLogWriter(const std::string& encoding) : encoder_(encoding) {}

core::VoidResult ChangeLogWriter::writeLog(const clean::ChangeLog& changes, const std::string& source_path,
                                           const std::string& log_path) {
    hints_.clear();

    const std::string text = ReportText::cleaningLog(source_path, changes, utils::TimeUtils::getCurrentTime());
    auto encoded = encoder_.encode(text);
    if (!encoded) {
        REPORT_ERROR("Cleaning log not written: {}", encoded.error().fullMessage());
        collectHints(changes);
        return encoded.error();
    }

    auto result = core::Path(log_path).writeAll(encoded.value());
    if (!result) {
        REPORT_ERROR("Failed to write cleaning log {}: {}", log_path, result.error().fullMessage());
        return result;
    }

    REPORT_INFO("Cleaning log saved as {}", log_path);
    return core::ok();
}

void ChangeLogWriter::collectHints(const clean::ChangeLog& changes) {
    const auto& records = changes.records();
    const size_t limit = core::Constants::kMaxHintLocations;

    for (const auto& record : records) {
        if (hints_.size() >= limit) break;
        if (!encoder_.canEncode(record.originalValue) || !encoder_.canEncode(record.newValue) ||
            !encoder_.canEncode(record.sheet)) {
            hints_.push_back(fmt::format("Sheet: {}, Cell: {}", record.sheet, record.cellRef));
        }
    }

    if (hints_.empty()) {
        const size_t first = records.size() > limit ? records.size() - limit : 0;
        for (size_t i = first; i < records.size(); ++i) {
            hints_.push_back(fmt::format("Sheet: {}, Cell: {}", records[i].sheet, records[i].cellRef));
        }
    }
}

}} // namespace cellscrub::report
