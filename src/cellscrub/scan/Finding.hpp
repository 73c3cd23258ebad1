#pragma once

#include <string>
#include <vector>

namespace cellscrub {
namespace scan {

/**
 * @brief 一次命中：某个单元格中某个模式的全部出现位置
 *
 * 每个 (单元格, 模式) 组合最多一条。cellValue 是扫描时的快照，
 * 清理时以工作簿中的实时值为准。
 */
struct Finding {
    std::string sheet;
    int row = 0;                  // 工作表行号（1-based，表头为第 1 行）
    int column = 0;               // 列号（1-based）
    std::string columnLetter;
    std::string columnHeader;
    std::string cellValue;
    std::string pattern;
    std::string hexValue;
    bool isPrintable = false;
    std::string description;
    std::vector<size_t> positions;  // 以码点计的 0-based 偏移，升序

    /**
     * @brief "B3" 形式的单元格引用
     */
    std::string cellRef() const;

    /**
     * @brief 位置列表，以 ", " 连接
     */
    std::string positionsText() const;

    bool operator==(const Finding& other) const;
    bool operator!=(const Finding& other) const { return !(*this == other); }
};

}} // namespace cellscrub::scan
