#include "cellscrub/unicode/EscapeDecoder.hpp"
#include <utf8.h>
#include <unicode/uchar.h>
#include <iterator>
#include <fmt/format.h>

namespace cellscrub {
namespace unicode {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

core::Error decodeError(std::string_view text, const std::string& why) {
    return core::makeError(core::ErrorCode::DecodeError,
                           fmt::format("Cannot decode escape sequence: {}", why),
                           std::string(text));
}

// 读取定长十六进制码点
bool readHex(std::string_view text, size_t pos, size_t digits, char32_t& out) {
    if (pos + digits > text.size()) return false;
    uint32_t value = 0;
    for (size_t i = 0; i < digits; ++i) {
        int d = hexDigit(text[pos + i]);
        if (d < 0) return false;
        value = (value << 4) | static_cast<uint32_t>(d);
    }
    out = static_cast<char32_t>(value);
    return true;
}

bool isSurrogate(uint32_t cp) {
    return cp >= 0xD800 && cp <= 0xDFFF;
}

} // namespace

std::string toUtf8(char32_t cp) {
    std::string out;
    utf8::append(static_cast<uint32_t>(cp), std::back_inserter(out));
    return out;
}

std::string toUtf8(const std::u32string& text) {
    std::string out;
    for (char32_t cp : text) {
        utf8::append(static_cast<uint32_t>(cp), std::back_inserter(out));
    }
    return out;
}

core::Result<std::u32string> fromUtf8(std::string_view text) {
    if (!utf8::is_valid(text.begin(), text.end())) {
        return core::makeError(core::ErrorCode::DecodeError, "Invalid UTF-8 sequence", std::string(text));
    }
    std::u32string out;
    utf8::utf8to32(text.begin(), text.end(), std::back_inserter(out));
    return out;
}

core::Result<std::u32string> EscapeDecoder::decode(std::string_view text) {
    auto decoded = fromUtf8(text);
    if (!decoded) {
        return decoded.error();
    }
    const std::u32string& src = decoded.value();

    std::u32string out;
    out.reserve(src.size());

    for (size_t i = 0; i < src.size(); ++i) {
        char32_t c = src[i];
        if (c != U'\\') {
            out.push_back(c);
            continue;
        }

        if (i + 1 >= src.size()) {
            return decodeError(text, "trailing backslash");
        }

        char32_t kind = src[++i];
        switch (kind) {
            case U'\\': out.push_back(U'\\'); break;
            case U'\'': out.push_back(U'\''); break;
            case U'"':  out.push_back(U'"'); break;
            case U'a':  out.push_back(U'\a'); break;
            case U'b':  out.push_back(U'\b'); break;
            case U'f':  out.push_back(U'\f'); break;
            case U'n':  out.push_back(U'\n'); break;
            case U'r':  out.push_back(U'\r'); break;
            case U't':  out.push_back(U'\t'); break;
            case U'v':  out.push_back(U'\v'); break;
            case U'\n': break;  // 续行

            case U'x':
            case U'u':
            case U'U': {
                size_t digits = kind == U'x' ? 2 : (kind == U'u' ? 4 : 8);
                // 十六进制位必须是 ASCII，先收窄
                std::string hex;
                for (size_t k = 0; k < digits && i + 1 + k < src.size(); ++k) {
                    char32_t h = src[i + 1 + k];
                    hex.push_back(h < 0x80 ? static_cast<char>(h) : '?');
                }
                char32_t cp = 0;
                if (!readHex(hex, 0, digits, cp)) {
                    return decodeError(text, fmt::format("truncated \\{}XX escape", static_cast<char>(kind)));
                }
                if (cp > 0x10FFFF) {
                    return decodeError(text, "code point out of range");
                }
                if (isSurrogate(cp)) {
                    return decodeError(text, "surrogate code point");
                }
                out.push_back(cp);
                i += digits;
                break;
            }

            case U'N': {
                if (i + 1 >= src.size() || src[i + 1] != U'{') {
                    return decodeError(text, "malformed \\N character escape");
                }
                size_t close = src.find(U'}', i + 2);
                if (close == std::u32string::npos || close == i + 2) {
                    return decodeError(text, "malformed \\N character escape");
                }
                std::string name = toUtf8(src.substr(i + 2, close - i - 2));
                UErrorCode status = U_ZERO_ERROR;
                UChar32 cp = u_charFromName(U_UNICODE_CHAR_NAME, name.c_str(), &status);
                if (U_FAILURE(status)) {
                    return decodeError(text, fmt::format("unknown Unicode character name '{}'", name));
                }
                if (isSurrogate(static_cast<uint32_t>(cp))) {
                    return decodeError(text, "surrogate code point");
                }
                out.push_back(static_cast<char32_t>(cp));
                i = close;
                break;
            }

            default:
                if (kind >= U'0' && kind <= U'7') {
                    uint32_t value = static_cast<uint32_t>(kind - U'0');
                    size_t taken = 1;
                    while (taken < 3 && i + 1 < src.size() && src[i + 1] >= U'0' && src[i + 1] <= U'7') {
                        value = value * 8 + static_cast<uint32_t>(src[++i] - U'0');
                        ++taken;
                    }
                    if (isSurrogate(value)) {
                        return decodeError(text, "surrogate code point");
                    }
                    out.push_back(static_cast<char32_t>(value));
                } else {
                    // 不认识的转义原样保留
                    out.push_back(U'\\');
                    out.push_back(kind);
                }
                break;
        }
    }

    return out;
}

core::Result<char32_t> EscapeDecoder::decodeSingle(std::string_view text) {
    auto decoded = decode(text);
    if (!decoded) {
        return decoded.error();
    }
    if (decoded.value().size() != 1) {
        return decodeError(text, fmt::format("expected exactly one character, got {}", decoded.value().size()));
    }
    return decoded.value().front();
}

}} // namespace cellscrub::unicode
