#pragma once

#include <string>

namespace cellscrub {
namespace unicode {

/**
 * @brief 单个码点的分类结果
 */
struct Classification {
    bool isPrintable = false;
    std::string category;     // Unicode 通用类别缩写，如 "Lu"、"Cf"
    std::string description;
};

/**
 * @brief 可打印性判断与人类可读描述（基于 ICU 字符属性）
 *
 * - 码点 < 32 或位于 [127, 160)：不可打印，"Control character (non-printable)"
 * - 类别以 C 开头：不可打印，"Unicode category: Cf (SOFT HYPHEN)"
 * - 其余：可打印，"Unicode: LATIN SMALL LETTER E WITH ACUTE (category: Ll)"
 */
class CharacterClassifier {
public:
    static Classification classify(char32_t cp);

    /**
     * @brief 先解析模式文本（字面字符或转义序列）再分类；
     *        无法解析时为不可打印的 "Invalid escape sequence"
     */
    static Classification classifyPattern(const std::string& pattern);

    /**
     * @brief 通用类别缩写
     */
    static std::string categoryOf(char32_t cp);

    /**
     * @brief Unicode 字符名，无名称时返回空串
     */
    static std::string nameOf(char32_t cp);

    static bool isControl(char32_t cp) {
        return cp < 32 || (cp >= 127 && cp < 160);
    }
};

}} // namespace cellscrub::unicode
