#pragma once

// CellScrub - 工作簿问题字符扫描与清理

#include <string>

#include "cellscrub/utils/Logger.hpp"
#include "cellscrub/core/Expected.hpp"
#include "cellscrub/scan/PatternSet.hpp"
#include "cellscrub/scan/WorkbookScanner.hpp"
#include "cellscrub/clean/CleaningEngine.hpp"

// 版本信息（构建系统可覆盖）
#ifndef CELLSCRUB_VERSION_STRING
#define CELLSCRUB_VERSION_STRING "1.0.0"
#endif

namespace cellscrub {

inline std::string getVersion() {
    return CELLSCRUB_VERSION_STRING;
}

/**
 * @brief 初始化 CellScrub（日志系统）
 * @param log_file_path 日志文件路径
 * @param level 日志级别
 * @param enable_console 是否同时输出到控制台
 * @return 初始化是否成功
 */
bool initialize(const std::string& log_file_path = "logs/cellscrub.log",
                Logger::Level level = Logger::Level::INFO,
                bool enable_console = false);

/**
 * @brief 清理资源，刷新日志
 */
void cleanup();

} // namespace cellscrub
