#pragma once

#include "cellscrub/app/ScrubOptions.hpp"
#include "cellscrub/clean/CleaningEngine.hpp"
#include "cellscrub/core/Workbook.hpp"
#include "cellscrub/scan/PatternSet.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace cellscrub {
namespace app {

/**
 * @brief 一次运行产生的结果摘要
 */
struct SessionSummary {
    size_t findings = 0;
    size_t cells_cleaned = 0;
    std::string csv_path;        // 写出失败时为空
    std::string report_path;     // 未写出时为空
    std::string cleaned_path;    // 未产生新工作簿时为空
    std::string log_path;
    clean::StopReason stop_reason = clean::StopReason::Exhausted;
};

/**
 * @brief 命令行会话：扫描 -> 展示 -> 写出记录与报告 -> 交互清理 -> 保存
 *
 * 所有提示与输入都走构造时传入的流，便于脚本化测试。
 * 失败在各自步骤内处理，只有打不开源文件会提前结束。
 */
class ScrubSession {
public:
    ScrubSession(std::istream& in, std::ostream& out);

    /**
     * @return 进程退出码（kExitOk / kExitIoFailure / kExitUsage）
     */
    int run(ScrubOptions options);

    const SessionSummary& getSummary() const { return summary_; }

private:
    bool promptForInput(ScrubOptions& options);
    bool readLine(std::string& line);

    void printFindings(const std::vector<scan::Finding>& findings);
    void writeRecords(const std::string& source_path, const std::vector<scan::Finding>& findings);
    void writeReport(const ScrubOptions& options, const std::vector<scan::Finding>& findings);
    void printEncodingHints(const std::vector<std::string>& hints, size_t overflow, const char* artifact);

    bool confirmCleaning(const ScrubOptions& options);
    int cleanWorkbook(const ScrubOptions& options, core::Workbook& workbook,
                      const std::vector<scan::Finding>& findings);

    std::istream& in_;
    std::ostream& out_;
    SessionSummary summary_;
};

}} // namespace cellscrub::app
