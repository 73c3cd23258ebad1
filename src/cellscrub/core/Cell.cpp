#include "cellscrub/core/Cell.hpp"
#include "cellscrub/core/Exception.hpp"
#include <fmt/format.h>

namespace cellscrub {
namespace core {

namespace {
const std::string kEmptyString;
}

Cell::Cell(const std::string& value) : type_(CellType::String), text_(value) {}

Cell::Cell(const char* value) : Cell(std::string(value ? value : "")) {}

Cell::Cell(double value) : type_(CellType::Number), number_(value) {}

Cell::Cell(int value) : Cell(static_cast<double>(value)) {}

Cell::Cell(bool value) : type_(CellType::Boolean), boolean_(value) {}

Cell Cell::makeFormula(const std::string& formula, const std::string& cached) {
    Cell cell;
    cell.type_ = CellType::Formula;
    cell.formula_ = formula;
    cell.text_ = cached;
    return cell;
}

Cell Cell::makeError(const std::string& error_text) {
    Cell cell;
    cell.type_ = CellType::Error;
    cell.text_ = error_text;
    return cell;
}

Cell& Cell::operator=(const std::string& value) {
    *this = Cell(value);
    return *this;
}

Cell& Cell::operator=(double value) {
    *this = Cell(value);
    return *this;
}

Cell& Cell::operator=(bool value) {
    *this = Cell(value);
    return *this;
}

const std::string& Cell::getStringValue() const {
    return type_ == CellType::String ? text_ : kEmptyString;
}

void Cell::setStringValue(const std::string& value) {
    if (type_ != CellType::String) {
        CELLSCRUB_THROW(OperationException, "Cannot rewrite text of a non-string cell", "setStringValue");
    }
    text_ = value;
}

std::string Cell::asString() const {
    switch (type_) {
        case CellType::String:
        case CellType::Error:
        case CellType::Formula:
            return text_;
        case CellType::Number:
            return fmt::format("{}", number_);
        case CellType::Boolean:
            return boolean_ ? "TRUE" : "FALSE";
        case CellType::Empty:
        default:
            return std::string();
    }
}

void Cell::clear() {
    *this = Cell();
}

bool Cell::operator==(const Cell& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case CellType::Number:
            return number_ == other.number_;
        case CellType::Boolean:
            return boolean_ == other.boolean_;
        case CellType::Formula:
            return formula_ == other.formula_ && text_ == other.text_;
        case CellType::String:
        case CellType::Error:
            return text_ == other.text_;
        case CellType::Empty:
        default:
            return true;
    }
}

}} // namespace cellscrub::core
