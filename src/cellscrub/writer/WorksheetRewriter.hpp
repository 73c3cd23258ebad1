#pragma once

#include "cellscrub/core/Expected.hpp"
#include <map>
#include <string>
#include <string_view>

namespace cellscrub {
namespace writer {

/**
 * @brief 工作表 XML 转写器
 *
 * 流式读入原工作表 XML 并原样写出，只替换指定单元格：
 * 目标单元格改写为 <c r=".." s=".." t="inlineStr"><is><t>新文本</t></is></c>，
 * 保留样式等其他属性，丢弃原有 <v>/<f>/<is> 子元素。
 */
class WorksheetRewriter {
public:
    using Replacements = std::map<std::string, std::string>;   // A1 引用 -> 新文本

    struct RewriteResult {
        std::string xml;
        size_t cells_replaced = 0;
    };

    /**
     * @param sheet_xml 原工作表 XML
     * @param replacements 需替换的单元格
     * @return 新 XML；解析失败返回 XmlParseError
     */
    static core::Result<RewriteResult> rewrite(std::string_view sheet_xml, const Replacements& replacements);
};

}} // namespace cellscrub::writer
