#include "cellscrub/reader/WorksheetParser.hpp"
#include "cellscrub/utils/ColumnReferenceUtils.hpp"
#include <cstdlib>

namespace cellscrub {
namespace reader {

void WorksheetParser::onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name == "row") {
        auto row = findIntAttribute(attributes, "r");
        current_row_ = row ? *row : current_row_ + 1;
        next_col_ = 1;
    } else if (name == "c") {
        beginCell(attributes);
    } else if (!in_cell_) {
        return;
    } else if (name == "v") {
        startCollectingText();
    } else if (name == "f") {
        cell_.has_formula = true;
        startCollectingText();
    } else if (name == "t" && isInElement("is") && !isInElement("rPh")) {
        startCollectingText();
    }
}

void WorksheetParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "c") {
        finishCell();
        return;
    }
    if (!in_cell_ || !state_.collecting_text) {
        return;
    }

    if (name == "v") {
        cell_.value = takeCurrentText();
        stopCollectingText();
    } else if (name == "f") {
        cell_.formula = takeCurrentText();
        stopCollectingText();
    } else if (name == "t") {
        cell_.inline_text += takeCurrentText();
        stopCollectingText();
    }
}

void WorksheetParser::beginCell(span<const xml::XMLAttribute> attributes) {
    cell_.reset();
    in_cell_ = true;

    uint32_t col = 0;
    uint32_t row = 0;
    auto ref = findAttribute(attributes, "r");
    if (ref && utils::ColumnReferenceUtils::splitCellRef(*ref, col, row)) {
        cell_.col = static_cast<int>(col);
        cell_.row = static_cast<int>(row);
    } else {
        cell_.col = next_col_;
        cell_.row = current_row_ > 0 ? current_row_ : 1;
    }
    next_col_ = cell_.col + 1;

    cell_.type = getAttributeOr(attributes, "t", "n");
}

void WorksheetParser::finishCell() {
    in_cell_ = false;
    stopCollectingText();

    const int row = cell_.row - 1;
    const int col = cell_.col - 1;
    const std::string& type = cell_.type;

    if (cell_.has_formula) {
        std::string cached = type == "inlineStr" ? cell_.inline_text : cell_.value;
        worksheet_.setCell(row, col, core::Cell::makeFormula(cell_.formula, cached));
    } else if (type == "s") {
        char* end = nullptr;
        unsigned long index = std::strtoul(cell_.value.c_str(), &end, 10);
        const std::string* text = shared_strings_ && end != cell_.value.c_str()
            ? shared_strings_->getString(index) : nullptr;
        if (!text) {
            READER_WARN("Cell {} in '{}' references missing shared string '{}'",
                        utils::ColumnReferenceUtils::makeCellRef(static_cast<uint32_t>(cell_.col),
                                                         static_cast<uint32_t>(cell_.row)),
                        worksheet_.getName(), cell_.value);
            return;
        }
        worksheet_.setCell(row, col, core::Cell(*text));
    } else if (type == "inlineStr") {
        worksheet_.setCell(row, col, core::Cell(cell_.inline_text));
    } else if (type == "str") {
        // 无 <f> 的字符串结果按普通文本处理
        worksheet_.setCell(row, col, core::Cell(cell_.value));
    } else if (type == "b") {
        if (cell_.value.empty()) return;
        worksheet_.setCell(row, col, core::Cell(cell_.value == "1" || cell_.value == "true"));
    } else if (type == "e") {
        worksheet_.setCell(row, col, core::Cell::makeError(cell_.value));
    } else if (type == "n") {
        if (cell_.value.empty()) return;  // 仅有样式的空单元格
        char* end = nullptr;
        double number = std::strtod(cell_.value.c_str(), &end);
        if (end == cell_.value.c_str()) {
            READER_WARN("Invalid numeric value '{}' in '{}'", cell_.value, worksheet_.getName());
            return;
        }
        worksheet_.setCell(row, col, core::Cell(number));
    } else {
        // t="d" 等日期单元格不参与扫描
        READER_DEBUG("Ignoring cell of type '{}' at row {}", type, cell_.row);
        return;
    }

    cells_parsed_++;
}

}} // namespace cellscrub::reader
