#pragma once

#include "cellscrub/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace cellscrub {
namespace reader {

/**
 * @brief sharedStrings.xml 解析器
 *
 * 普通字符串取 <si><t>，富文本按顺序拼接各 <r><t>。
 * 注音（<rPh>）不属于单元格文本，忽略。
 */
class SharedStringsParser : public BaseSAXParser {
public:
    bool parse(std::string_view xml_content) {
        clear();
        return parseXML(xml_content);
    }

    /**
     * @brief 根据索引获取字符串，索引无效时返回 nullptr
     */
    const std::string* getString(size_t index) const {
        return index < strings_.size() ? &strings_[index] : nullptr;
    }

    size_t getStringCount() const { return strings_.size(); }
    const std::vector<std::string>& getStrings() const { return strings_; }

    void clear() {
        strings_.clear();
        current_.clear();
        in_si_ = false;
    }

private:
    void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

    std::vector<std::string> strings_;
    std::string current_;
    bool in_si_ = false;
};

}} // namespace cellscrub::reader
