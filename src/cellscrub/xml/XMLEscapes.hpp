#pragma once

#include <string>
#include <string_view>

namespace cellscrub {
namespace xml {

// XML 转义常量：集中提供实体字面量
struct XMLEscapes {
    inline static constexpr char AMP[]  = "&amp;";   // &  → &amp;
    inline static constexpr char LT[]   = "&lt;";    // <  → &lt;
    inline static constexpr char GT[]   = "&gt;";    // >  → &gt;
    inline static constexpr char QUOT[] = "&quot;";  // " → &quot;
    inline static constexpr char NL[]   = "&#xA;";   // \n（属性上下文）
    inline static constexpr char CR[]   = "&#xD;";   // \r
    inline static constexpr char TAB[]  = "&#x9;";   // \t（属性上下文）

    /**
     * @brief 文本节点转义：& < >，以及 \r（否则读回时被规范化为 \n）
     */
    static void appendEscapedText(std::string& out, std::string_view text) {
        for (char c : text) {
            switch (c) {
                case '&':  out += AMP; break;
                case '<':  out += LT; break;
                case '>':  out += GT; break;
                case '\r': out += CR; break;
                default:   out += c; break;
            }
        }
    }

    /**
     * @brief 属性值转义（双引号包裹）
     */
    static void appendEscapedAttribute(std::string& out, std::string_view value) {
        for (char c : value) {
            switch (c) {
                case '&':  out += AMP; break;
                case '<':  out += LT; break;
                case '>':  out += GT; break;
                case '"':  out += QUOT; break;
                case '\n': out += NL; break;
                case '\r': out += CR; break;
                case '\t': out += TAB; break;
                default:   out += c; break;
            }
        }
    }
};

}} // namespace cellscrub::xml
