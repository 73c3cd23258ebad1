/**
 * @file ColumnReferenceUtils.hpp
 * @brief 列字母与列号互转、单元格引用拆分
 */

#pragma once

#include <string>
#include <string_view>
#include <cstdint>

namespace cellscrub {
namespace utils {

/**
 * @brief 列引用工具
 *
 * 列字母编码是与正整数一一对应的 26 进制（无零位）：
 * 1 -> A, 26 -> Z, 27 -> AA, 702 -> ZZ, 703 -> AAA。
 */
class ColumnReferenceUtils {
public:
    /**
     * @brief 列号转列字母
     * @param column 列号（1-based），小于 1 时返回空串
     */
    static std::string letterOf(uint32_t column);

    /**
     * @brief 列字母转列号（大小写不敏感）
     * @return 列号（1-based），含非字母字符或为空时返回 0
     */
    static uint32_t columnOf(std::string_view letters);

    /**
     * @brief 从单元格引用中解析列号，如 "C23" -> 3
     */
    static uint32_t parseColumn(std::string_view cell_ref);

    /**
     * @brief 拆分单元格引用 "AB12" -> (28, 12)
     * @return 格式不合法时返回 false
     */
    static bool splitCellRef(std::string_view cell_ref, uint32_t& column, uint32_t& row);

    /**
     * @brief 组合单元格引用 (3, 7) -> "C7"
     */
    static std::string makeCellRef(uint32_t column, uint32_t row);
};

}} // namespace cellscrub::utils
