#pragma once

#include "cellscrub/core/Expected.hpp"
#include "cellscrub/scan/Finding.hpp"
#include "cellscrub/unicode/TextEncoder.hpp"
#include <ctime>
#include <string>
#include <vector>

namespace cellscrub {
namespace report {

/**
 * @brief findings_report 文本写出器
 *
 * 报告先整体编码到目标编码，成功后才创建文件。编码失败返回 EncodingFailure，
 * 不产生文件，并通过 getHintLocations() 给出最多 5 个可能的单元格位置。
 */
class FindingsReportWriter {
public:
    explicit FindingsReportWriter(const std::string& encoding = "UTF-8");

    core::VoidResult write(const std::string& source_path,
                           const std::vector<scan::Finding>& findings,
                           const std::string& report_path,
                           const std::tm& generated);

    /**
     * @brief 上次编码失败时的提示位置，形如 "Sheet: Data, Cell: B7"
     */
    const std::vector<std::string>& getHintLocations() const { return hints_; }

    /**
     * @brief 剩余未列出的可疑单元格数
     */
    size_t getHintOverflow() const { return hint_overflow_; }

private:
    void collectHints(const std::vector<scan::Finding>& findings);

    unicode::TextEncoder encoder_;
    std::vector<std::string> hints_;
    size_t hint_overflow_ = 0;
};

}} // namespace cellscrub::report
