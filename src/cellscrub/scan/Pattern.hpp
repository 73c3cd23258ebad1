#pragma once

#include <string>

namespace cellscrub {
namespace scan {

/**
 * @brief 目标模式：一个字面字符，或解码后恰为一个字符的转义序列（如 "\x80"）
 *
 * 以 UTF-8 文本保存；扫描时按字面文本查找。
 */
class Pattern {
public:
    Pattern() = default;
    explicit Pattern(std::string text) : text_(std::move(text)) {}

    const std::string& text() const { return text_; }

    /**
     * @brief 文本含反斜杠即视为转义记号
     */
    bool isEscapeToken() const { return text_.find('\\') != std::string::npos; }

    /**
     * @brief 报告里的十六进制表示：单个码点为 "0x%02x"，否则为文本本身
     */
    std::string hexValue() const;

    /**
     * @brief 文本包含的码点数；非法 UTF-8 时按字节计
     */
    size_t codePointCount() const;

    bool operator==(const Pattern& other) const { return text_ == other.text_; }
    bool operator!=(const Pattern& other) const { return text_ != other.text_; }

private:
    std::string text_;
};

}} // namespace cellscrub::scan
