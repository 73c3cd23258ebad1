#pragma once

#include "cellscrub/scan/PatternSet.hpp"
#include "cellscrub/core/Cell.hpp"
#include <string>
#include <vector>

namespace cellscrub {
namespace scan {

/**
 * @brief 单个模式在一个值中的全部出现位置
 */
struct PatternMatch {
    Pattern pattern;
    std::vector<size_t> positions;  // 码点偏移
};

/**
 * @brief 单元格级扫描
 *
 * 只扫描 String 单元格。每个模式做从左到右的非重叠查找，
 * 命中后从 "起点 + 模式长度" 继续，相邻的命中都会被找到。
 */
class CellScanner {
public:
    static std::vector<PatternMatch> scanCell(const core::Cell& cell, const PatternSet& patterns);

    /**
     * @brief 扫描文本；非法 UTF-8 先用替换字符修复并记录告警
     */
    static std::vector<PatternMatch> scanValue(const std::string& text, const PatternSet& patterns);

    /**
     * @brief needle 在 text 中的全部码点偏移（text 需为合法 UTF-8）
     */
    static std::vector<size_t> findPositions(const std::string& text, const std::string& needle);

    /**
     * @brief 非法 UTF-8 序列替换为 U+FFFD；合法时原样返回
     */
    static std::string sanitize(const std::string& text);
};

}} // namespace cellscrub::scan
