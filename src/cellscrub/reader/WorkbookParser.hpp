#pragma once

#include "cellscrub/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace cellscrub {
namespace reader {

/**
 * @brief workbook.xml 解析器：按文档顺序收集工作表
 */
class WorkbookParser : public BaseSAXParser {
public:
    struct SheetEntry {
        std::string name;
        int sheet_id = 0;
        std::string rel_id;   // r:id
        std::string state;    // visible / hidden / veryHidden
    };

    bool parse(std::string_view xml_content) {
        sheets_.clear();
        return parseXML(xml_content);
    }

    const std::vector<SheetEntry>& getSheets() const { return sheets_; }

private:
    void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view /*name*/, int /*depth*/) override {}

    std::vector<SheetEntry> sheets_;
};

}} // namespace cellscrub::reader
