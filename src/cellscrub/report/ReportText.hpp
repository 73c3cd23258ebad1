#pragma once

#include "cellscrub/clean/ChangeLog.hpp"
#include "cellscrub/scan/Finding.hpp"
#include <ctime>
#include <string>
#include <vector>

namespace cellscrub {
namespace report {

/**
 * @brief 报告与清理日志的文本生成（UTF-8），编码和落盘由各写出器负责
 */
class ReportText {
public:
    /**
     * @brief 一个位置的上下文两行：
     *   "Context: ...<窗口>..."
     *   "         <空格>^"
     * 窗口取码点区间 [pos-10, pos+11)，截断到值的范围内
     */
    static std::string contextLines(const std::string& value, size_t position);

    /**
     * @brief 单条 Finding 的报告块（不含结尾分隔线），控制台与报告文件共用
     */
    static std::string findingBlock(const scan::Finding& finding);

    static std::string separator();

    /**
     * @brief 完整的 findings_report 文本
     */
    static std::string findingsReport(const std::string& source_path,
                                      const std::vector<scan::Finding>& findings,
                                      const std::tm& generated);

    /**
     * @brief 完整的 cleaning_log 文本
     */
    static std::string cleaningLog(const std::string& source_path,
                                   const clean::ChangeLog& changes,
                                   const std::tm& created);
};

}} // namespace cellscrub::report
