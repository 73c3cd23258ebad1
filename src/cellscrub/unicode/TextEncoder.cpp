#include "cellscrub/unicode/TextEncoder.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <unicode/ucnv.h>
#include <unicode/ucnv_err.h>
#include <unicode/ustring.h>
#include <utf8.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace cellscrub {
namespace unicode {

namespace {

struct ConverterDeleter {
    void operator()(UConverter* p) const noexcept {
        if (p) ucnv_close(p);
    }
};
using ConverterPtr = std::unique_ptr<UConverter, ConverterDeleter>;

ConverterPtr openStrictConverter(const std::string& encoding, UErrorCode& status) {
    ConverterPtr conv(ucnv_open(encoding.c_str(), &status));
    if (U_FAILURE(status) || !conv) {
        return ConverterPtr(nullptr);
    }
    ucnv_setFromUCallBack(conv.get(), UCNV_FROM_U_CALLBACK_STOP, nullptr, nullptr, nullptr, &status);
    if (U_FAILURE(status)) {
        return ConverterPtr(nullptr);
    }
    return conv;
}

bool toUtf16(const std::string& utf8_text, std::vector<UChar>& out) {
    UErrorCode status = U_ZERO_ERROR;
    int32_t length = 0;
    u_strFromUTF8(nullptr, 0, &length, utf8_text.data(), static_cast<int32_t>(utf8_text.size()), &status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
        return false;
    }
    out.assign(static_cast<size_t>(length) + 1, 0);
    status = U_ZERO_ERROR;
    u_strFromUTF8(out.data(), length + 1, &length, utf8_text.data(), static_cast<int32_t>(utf8_text.size()), &status);
    if (U_FAILURE(status)) {
        return false;
    }
    out.resize(static_cast<size_t>(length));
    return true;
}

// 转换一段 UTF-16；status 返回 ICU 结果
std::string convert(UConverter* conv, const std::vector<UChar>& src, UErrorCode& status) {
    int32_t src_len = static_cast<int32_t>(src.size());
    status = U_ZERO_ERROR;
    int32_t needed = ucnv_fromUChars(conv, nullptr, 0, src.data(), src_len, &status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
        return std::string();
    }

    std::string out(static_cast<size_t>(needed), '\0');
    status = U_ZERO_ERROR;
    ucnv_reset(conv);
    int32_t written = ucnv_fromUChars(conv, out.empty() ? nullptr : &out[0], needed, src.data(), src_len, &status);
    if (status == U_STRING_NOT_TERMINATED_WARNING) {
        status = U_ZERO_ERROR;
    }
    if (U_FAILURE(status)) {
        return std::string();
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

} // namespace

TextEncoder::TextEncoder(const std::string& encoding) : encoding_(encoding) {}

bool TextEncoder::isUtf8Target() const {
    std::string lower;
    for (char c : encoding_) {
        if (c == '-' || c == '_') continue;
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower == "utf8";
}

bool TextEncoder::isSupported(const std::string& encoding) {
    UErrorCode status = U_ZERO_ERROR;
    ConverterPtr conv(ucnv_open(encoding.c_str(), &status));
    return U_SUCCESS(status) && conv != nullptr;
}

core::Result<std::string> TextEncoder::encode(const std::string& utf8_text) const {
    if (!utf8::is_valid(utf8_text.begin(), utf8_text.end())) {
        return core::makeError(core::ErrorCode::EncodingFailure, "Input text is not valid UTF-8", encoding_);
    }
    if (isUtf8Target()) {
        return utf8_text;
    }

    UErrorCode status = U_ZERO_ERROR;
    ConverterPtr conv = openStrictConverter(encoding_, status);
    if (!conv) {
        return core::makeError(core::ErrorCode::EncodingFailure,
                               fmt::format("Unknown encoding: {}", u_errorName(status)), encoding_);
    }

    std::vector<UChar> utf16;
    if (!toUtf16(utf8_text, utf16)) {
        return core::makeError(core::ErrorCode::EncodingFailure, "Cannot convert text to UTF-16", encoding_);
    }

    std::string encoded = convert(conv.get(), utf16, status);
    if (U_FAILURE(status)) {
        // 定位第一个无法表示的码点
        size_t position = 0;
        uint32_t offending = 0;
        auto it = utf8_text.begin();
        while (it != utf8_text.end()) {
            auto start = it;
            uint32_t cp = utf8::next(it, utf8_text.end());
            std::vector<UChar> single;
            toUtf16(std::string(start, it), single);
            UErrorCode probe = U_ZERO_ERROR;
            ucnv_reset(conv.get());
            convert(conv.get(), single, probe);
            if (U_FAILURE(probe)) {
                offending = cp;
                break;
            }
            ++position;
        }
        REPORT_DEBUG("Encoding to {} failed at position {} ({})", encoding_, position, u_errorName(status));
        return core::makeError(core::ErrorCode::EncodingFailure,
                               fmt::format("'{}' codec can't encode character U+{:04X} in position {}",
                                           encoding_, offending, position),
                               encoding_);
    }
    return encoded;
}

bool TextEncoder::canEncode(const std::string& utf8_text) const {
    return encode(utf8_text).hasValue();
}

}} // namespace cellscrub::unicode
