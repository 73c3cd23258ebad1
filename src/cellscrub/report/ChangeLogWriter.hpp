#pragma once

#include "cellscrub/clean/CleaningEngine.hpp"
#include "cellscrub/unicode/TextEncoder.hpp"
#include <string>
#include <vector>

namespace cellscrub {
namespace report {

/**
 * @brief cleaning_log 写出器
 *
 * 与 FindingsReportWriter 相同：编码失败时不创建文件，
 * 提示位置取无法编码的变更记录，找不到时取最近的 5 条记录。
 */
class ChangeLogWriter : public clean::IChangeLogSink {
public:
    explicit ChangeLogWriter(const std::string& encoding = "UTF-8");

    core::VoidResult writeLog(const clean::ChangeLog& changes, const std::string& source_path,
                              const std::string& log_path) override;

    const std::vector<std::string>& getHintLocations() const { return hints_; }

private:
    void collectHints(const clean::ChangeLog& changes);

    unicode::TextEncoder encoder_;
    std::vector<std::string> hints_;
};

}} // namespace cellscrub::report
