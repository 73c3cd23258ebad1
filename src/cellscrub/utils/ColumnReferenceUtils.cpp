/**
 * @file ColumnReferenceUtils.cpp
 * @brief 列引用工具实现
 */

#include "ColumnReferenceUtils.hpp"
#include <cctype>
#include <algorithm>

namespace cellscrub {
namespace utils {

std::string ColumnReferenceUtils::letterOf(uint32_t column) {
    std::string letters;
    while (column > 0) {
        uint32_t rem = (column - 1) % 26;
        letters.push_back(static_cast<char>('A' + rem));
        column = (column - 1) / 26;
    }
    std::reverse(letters.begin(), letters.end());
    return letters;
}

uint32_t ColumnReferenceUtils::columnOf(std::string_view letters) {
    if (letters.empty() || letters.size() > 7) return 0;

    uint32_t col = 0;
    for (char c : letters) {
        if (!std::isalpha(static_cast<unsigned char>(c))) return 0;
        col = col * 26 + static_cast<uint32_t>(std::toupper(static_cast<unsigned char>(c)) - 'A' + 1);
    }
    return col;
}

uint32_t ColumnReferenceUtils::parseColumn(std::string_view cell_ref) {
    size_t col_end = 0;
    while (col_end < cell_ref.size() && std::isalpha(static_cast<unsigned char>(cell_ref[col_end]))) {
        ++col_end;
    }
    if (col_end == 0) return 0;
    return columnOf(cell_ref.substr(0, col_end));
}

bool ColumnReferenceUtils::splitCellRef(std::string_view cell_ref, uint32_t& column, uint32_t& row) {
    size_t col_end = 0;
    while (col_end < cell_ref.size() && std::isalpha(static_cast<unsigned char>(cell_ref[col_end]))) {
        ++col_end;
    }
    if (col_end == 0 || col_end == cell_ref.size()) return false;

    uint32_t parsed_row = 0;
    for (size_t i = col_end; i < cell_ref.size(); ++i) {
        char c = cell_ref[i];
        if (c < '0' || c > '9') return false;
        parsed_row = parsed_row * 10 + static_cast<uint32_t>(c - '0');
        if (parsed_row > 1048576) return false;
    }

    uint32_t parsed_col = columnOf(cell_ref.substr(0, col_end));
    if (parsed_col == 0 || parsed_row == 0) return false;

    column = parsed_col;
    row = parsed_row;
    return true;
}

std::string ColumnReferenceUtils::makeCellRef(uint32_t column, uint32_t row) {
    return letterOf(column) + std::to_string(row);
}

}} // namespace cellscrub::utils
