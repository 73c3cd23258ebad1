#include "cellscrub/core/Worksheet.hpp"
#include "cellscrub/utils/ColumnReferenceUtils.hpp"
#include <algorithm>

namespace cellscrub {
namespace core {

Worksheet::Worksheet(const std::string& name) : name_(name) {}

bool Worksheet::hasCellAt(int row, int col) const {
    return findCell(row, col) != nullptr;
}

Cell& Worksheet::getCell(int row, int col) {
    return rows_[row][col];
}

Cell* Worksheet::findCell(int row, int col) {
    auto row_it = rows_.find(row);
    if (row_it == rows_.end()) return nullptr;
    auto cell_it = row_it->second.find(col);
    return cell_it == row_it->second.end() ? nullptr : &cell_it->second;
}

const Cell* Worksheet::findCell(int row, int col) const {
    auto row_it = rows_.find(row);
    if (row_it == rows_.end()) return nullptr;
    auto cell_it = row_it->second.find(col);
    return cell_it == row_it->second.end() ? nullptr : &cell_it->second;
}

void Worksheet::setCell(int row, int col, const Cell& cell) {
    rows_[row][col] = cell;
}

Cell* Worksheet::findCell(const std::string& cell_ref) {
    uint32_t col = 0;
    uint32_t row = 0;
    if (!utils::ColumnReferenceUtils::splitCellRef(cell_ref, col, row)) {
        return nullptr;
    }
    return findCell(static_cast<int>(row) - 1, static_cast<int>(col) - 1);
}

const Cell* Worksheet::findCell(const std::string& cell_ref) const {
    uint32_t col = 0;
    uint32_t row = 0;
    if (!utils::ColumnReferenceUtils::splitCellRef(cell_ref, col, row)) {
        return nullptr;
    }
    return findCell(static_cast<int>(row) - 1, static_cast<int>(col) - 1);
}

std::pair<int, int> Worksheet::getUsedRange() const {
    int max_row = -1;
    int max_col = -1;
    for (const auto& [row, cells] : rows_) {
        if (cells.empty()) continue;
        max_row = std::max(max_row, row);
        max_col = std::max(max_col, cells.rbegin()->first);
    }
    return {max_row, max_col};
}

size_t Worksheet::getCellCount() const {
    size_t count = 0;
    for (const auto& entry : rows_) {
        count += entry.second.size();
    }
    return count;
}

}} // namespace cellscrub::core
