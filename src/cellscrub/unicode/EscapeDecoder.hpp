#pragma once

#include "cellscrub/core/Expected.hpp"
#include <string>
#include <string_view>

namespace cellscrub {
namespace unicode {

/**
 * @brief 反斜杠转义序列解码
 *
 * 支持 \xHH、\uHHHH、\UHHHHHHHH、\N{NAME}、八进制 \ooo，
 * 以及 \\ \' \" \a \b \f \n \r \t \v；反斜杠后跟换行表示续行。
 * 无法识别的 \c 原样保留。非 ASCII 字符按 UTF-8 读入后原样保留。
 */
class EscapeDecoder {
public:
    /**
     * @brief 解码为码点序列
     * @return 失败时返回 ErrorCode::DecodeError，context 为原文
     */
    static core::Result<std::u32string> decode(std::string_view text);

    /**
     * @brief 解码，要求结果恰好是一个码点
     */
    static core::Result<char32_t> decodeSingle(std::string_view text);

    static bool containsEscape(std::string_view text) {
        return text.find('\\') != std::string_view::npos;
    }
};

/**
 * @brief 码点编码为 UTF-8
 */
std::string toUtf8(char32_t cp);
std::string toUtf8(const std::u32string& text);

/**
 * @brief UTF-8 解码为码点序列；非法序列返回 DecodeError
 */
core::Result<std::u32string> fromUtf8(std::string_view text);

}} // namespace cellscrub::unicode
