#pragma once

#include "cellscrub/core/Cell.hpp"
#include <map>
#include <string>
#include <utility>

namespace cellscrub {
namespace core {

/**
 * @brief 工作表：稀疏的 行 -> (列 -> Cell) 映射
 *
 * 行列索引均为 0-based；工作表行号 N 对应内部行 N-1。
 */
class Worksheet {
public:
    using RowCells = std::map<int, Cell>;
    using RowMap = std::map<int, RowCells>;

    explicit Worksheet(const std::string& name);

    const std::string& getName() const { return name_; }

    bool hasCellAt(int row, int col) const;

    /**
     * @brief 获取单元格，不存在时创建空单元格
     */
    Cell& getCell(int row, int col);

    /**
     * @brief 查找单元格，不存在时返回 nullptr
     */
    Cell* findCell(int row, int col);
    const Cell* findCell(int row, int col) const;

    void setCell(int row, int col, const Cell& cell);

    /**
     * @brief 按 A1 引用查找单元格，如 "B3"
     */
    Cell* findCell(const std::string& cell_ref);
    const Cell* findCell(const std::string& cell_ref) const;

    /**
     * @brief 已用区域的最大行列（0-based），空表返回 (-1, -1)
     */
    std::pair<int, int> getUsedRange() const;

    size_t getCellCount() const;

    const RowMap& rows() const { return rows_; }
    RowMap& rows() { return rows_; }

private:
    std::string name_;
    RowMap rows_;
};

}} // namespace cellscrub::core
