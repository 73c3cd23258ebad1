#pragma once

#include <cstddef>

namespace cellscrub {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // I/O 缓冲区大小
    static constexpr size_t kIOBufferSize = 8192;

    // 报告中上下文窗口：位置前后各取的码点数
    static constexpr size_t kContextRadius = 10;

    // 报告分隔线宽度
    static constexpr size_t kSeparatorWidth = 80;

    // 编码失败时提示的单元格位置个数上限
    static constexpr size_t kMaxHintLocations = 5;

    // 表头行（1-based 工作表行号）
    static constexpr int kHeaderRow = 1;

    // 报告时间戳与文件名时间戳格式
    static constexpr const char* kReportTimestampFormat = "%Y-%m-%d %H:%M:%S";
    static constexpr const char* kFileTimestampFormat = "%Y%m%d_%H%M%S";
};

}} // namespace cellscrub::core
