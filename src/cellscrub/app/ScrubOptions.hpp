#pragma once

#include "cellscrub/core/Expected.hpp"
#include "cellscrub/utils/Logger.hpp"
#include <string>
#include <vector>

namespace cellscrub {
namespace app {

// 进程退出码
constexpr int kExitOk = 0;          // 成功，或没有任何发现
constexpr int kExitIoFailure = 1;   // 打开或读写失败
constexpr int kExitUsage = 2;       // 命令行用法错误

/**
 * @brief 命令行选项
 */
struct ScrubOptions {
    std::string input_path;                          // 为空时在控制台询问
    std::string pattern;                             // 单个目标字符或转义序列，为空表示默认集合

    // 日志
    std::string log_file = "logs/cellscrub.log";
    Logger::Level log_level = Logger::Level::INFO;
    bool log_to_console = false;                     // 默认关闭，避免与报告输出混杂

    // 报告
    std::string report_encoding = "UTF-8";
    bool write_report = true;                        // 是否写 findings_report 文本

    // 清理
    bool auto_confirm = false;                       // --yes：不询问是否进入清理

    bool show_help = false;

    bool hasPattern() const { return !pattern.empty(); }
};

/**
 * @brief 命令行解析：cellscrub-cli [options] <path> [pattern]
 */
class ScrubOptionsParser {
public:
    /**
     * @return 用法错误时返回 InvalidArgument，消息可直接展示给用户
     */
    static core::Result<ScrubOptions> parse(const std::vector<std::string>& args);
    static core::Result<ScrubOptions> parse(int argc, char** argv);

    static std::string usage(const std::string& program);
};

}} // namespace cellscrub::app
