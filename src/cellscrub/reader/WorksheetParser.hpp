#pragma once

#include "cellscrub/reader/BaseSAXParser.hpp"
#include "cellscrub/reader/SharedStringsParser.hpp"
#include "cellscrub/core/Worksheet.hpp"
#include <string>

namespace cellscrub {
namespace reader {

/**
 * @brief 工作表 XML 解析器：把 <sheetData> 中的单元格填入 core::Worksheet
 *
 * 支持的单元格类型：s（共享字符串）、inlineStr、str、b、e、n。
 * 含 <f> 的单元格一律作为公式单元格，缓存值只作展示。
 * 样式、合并区域等结构不读取，写出时由原始 XML 保留。
 */
class WorksheetParser : public BaseSAXParser {
public:
    WorksheetParser(core::Worksheet& worksheet, const SharedStringsParser* shared_strings)
        : worksheet_(worksheet), shared_strings_(shared_strings) {}

    bool parse(std::string_view xml_content) {
        current_row_ = 0;
        next_col_ = 1;
        cells_parsed_ = 0;
        return parseXML(xml_content);
    }

    size_t getCellsParsed() const { return cells_parsed_; }

private:
    struct CellState {
        int row = 0;
        int col = 0;
        std::string type;
        std::string value;
        std::string inline_text;
        std::string formula;
        bool has_formula = false;

        void reset() {
            row = col = 0;
            type.clear();
            value.clear();
            inline_text.clear();
            formula.clear();
            has_formula = false;
        }
    };

    void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

    void beginCell(span<const xml::XMLAttribute> attributes);
    void finishCell();

    core::Worksheet& worksheet_;
    const SharedStringsParser* shared_strings_;

    CellState cell_;
    bool in_cell_ = false;
    int current_row_ = 0;   // 1-based
    int next_col_ = 1;      // 缺少 r 属性时的列号
    size_t cells_parsed_ = 0;
};

}} // namespace cellscrub::reader
