#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    CELLSCRUB_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     CELLSCRUB_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     CELLSCRUB_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    CELLSCRUB_LOG_ERROR("[ERR][core] " __VA_ARGS__)
#define CORE_CRITICAL(...) CELLSCRUB_LOG_CRITICAL("[CRT][core] " __VA_ARGS__)

// 扫描模块 (scan)
#define SCAN_DEBUG(...)    CELLSCRUB_LOG_DEBUG("[DBG][scan] " __VA_ARGS__)
#define SCAN_INFO(...)     CELLSCRUB_LOG_INFO("[INF][scan] " __VA_ARGS__)
#define SCAN_WARN(...)     CELLSCRUB_LOG_WARN("[WRN][scan] " __VA_ARGS__)
#define SCAN_ERROR(...)    CELLSCRUB_LOG_ERROR("[ERR][scan] " __VA_ARGS__)

// 清理模块 (clean)
#define CLEAN_DEBUG(...)    CELLSCRUB_LOG_DEBUG("[DBG][clen] " __VA_ARGS__)
#define CLEAN_INFO(...)     CELLSCRUB_LOG_INFO("[INF][clen] " __VA_ARGS__)
#define CLEAN_WARN(...)     CELLSCRUB_LOG_WARN("[WRN][clen] " __VA_ARGS__)
#define CLEAN_ERROR(...)    CELLSCRUB_LOG_ERROR("[ERR][clen] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)    CELLSCRUB_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)     CELLSCRUB_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)     CELLSCRUB_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)    CELLSCRUB_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// 写出模块 (writer)
#define WRITER_DEBUG(...)    CELLSCRUB_LOG_DEBUG("[DBG][writ] " __VA_ARGS__)
#define WRITER_INFO(...)     CELLSCRUB_LOG_INFO("[INF][writ] " __VA_ARGS__)
#define WRITER_WARN(...)     CELLSCRUB_LOG_WARN("[WRN][writ] " __VA_ARGS__)
#define WRITER_ERROR(...)    CELLSCRUB_LOG_ERROR("[ERR][writ] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)    CELLSCRUB_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_INFO(...)     CELLSCRUB_LOG_INFO("[INF][xml ] " __VA_ARGS__)
#define XML_WARN(...)     CELLSCRUB_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)    CELLSCRUB_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...)    CELLSCRUB_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)     CELLSCRUB_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)     CELLSCRUB_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...)    CELLSCRUB_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 报告模块 (report)
#define REPORT_DEBUG(...)    CELLSCRUB_LOG_DEBUG("[DBG][rept] " __VA_ARGS__)
#define REPORT_INFO(...)     CELLSCRUB_LOG_INFO("[INF][rept] " __VA_ARGS__)
#define REPORT_WARN(...)     CELLSCRUB_LOG_WARN("[WRN][rept] " __VA_ARGS__)
#define REPORT_ERROR(...)    CELLSCRUB_LOG_ERROR("[ERR][rept] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)    CELLSCRUB_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_INFO(...)     CELLSCRUB_LOG_INFO("[INF][util] " __VA_ARGS__)
#define UTILS_WARN(...)     CELLSCRUB_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)    CELLSCRUB_LOG_ERROR("[ERR][util] " __VA_ARGS__)
