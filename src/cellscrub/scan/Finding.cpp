#include "cellscrub/scan/Finding.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace cellscrub {
namespace scan {

std::string Finding::cellRef() const {
    return fmt::format("{}{}", columnLetter, row);
}

std::string Finding::positionsText() const {
    return fmt::format("{}", fmt::join(positions, ", "));
}

bool Finding::operator==(const Finding& other) const {
    return sheet == other.sheet && row == other.row && column == other.column &&
           columnLetter == other.columnLetter && columnHeader == other.columnHeader &&
           cellValue == other.cellValue && pattern == other.pattern &&
           hexValue == other.hexValue && isPrintable == other.isPrintable &&
           description == other.description && positions == other.positions;
}

}} // namespace cellscrub::scan
