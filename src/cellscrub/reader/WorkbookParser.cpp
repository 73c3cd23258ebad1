#include "cellscrub/reader/WorkbookParser.hpp"

namespace cellscrub {
namespace reader {

void WorkbookParser::onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name != "sheet" || !isInElement("sheets")) {
        return;
    }

    SheetEntry entry;
    entry.name = getAttributeOr(attributes, "name", "");
    entry.sheet_id = findIntAttribute(attributes, "sheetId").value_or(0);
    entry.state = getAttributeOr(attributes, "state", "visible");

    // 不开启命名空间处理，r:id 的前缀按约定为 "r"，兼容其他前缀
    for (const auto& attr : attributes) {
        if (attr.name == "r:id" ||
            (attr.name.size() > 3 && attr.name.substr(attr.name.size() - 3) == ":id")) {
            entry.rel_id = std::string(attr.value);
            break;
        }
    }

    if (entry.name.empty() || entry.rel_id.empty()) {
        READER_WARN("Skipping sheet entry without name or relationship id");
        return;
    }

    READER_DEBUG("Found sheet '{}' (id {}, {})", entry.name, entry.sheet_id, entry.rel_id);
    sheets_.push_back(std::move(entry));
}

}} // namespace cellscrub::reader
