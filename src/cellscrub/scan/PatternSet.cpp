#include "cellscrub/scan/PatternSet.hpp"
#include "cellscrub/unicode/EscapeDecoder.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <utf8.h>

namespace cellscrub {
namespace scan {

PatternSet PatternSet::defaultPatterns() {
    std::vector<Pattern> patterns;
    patterns.reserve(256);

    // 字面字符
    for (char32_t cp = 0x80; cp <= 0xFF; ++cp) {
        patterns.emplace_back(unicode::toUtf8(cp));
    }
    // 转义记号，小写十六进制
    for (unsigned value = 0x80; value <= 0xFF; ++value) {
        patterns.emplace_back(fmt::format("\\x{:02x}", value));
    }

    return PatternSet(std::move(patterns));
}

core::Result<char32_t> PatternSet::resolve(const Pattern& pattern) {
    const std::string& text = pattern.text();
    if (text.empty()) {
        return core::makeError(core::ErrorCode::DecodeError, "Empty pattern");
    }

    if (!pattern.isEscapeToken() && utf8::is_valid(text.begin(), text.end()) &&
        utf8::distance(text.begin(), text.end()) == 1) {
        auto it = text.begin();
        return static_cast<char32_t>(utf8::next(it, text.end()));
    }

    return unicode::EscapeDecoder::decodeSingle(text);
}

core::Result<std::string> PatternSet::decodedText(const Pattern& pattern) {
    auto cp = resolve(pattern);
    if (!cp) {
        return cp.error();
    }
    return unicode::toUtf8(cp.value());
}

core::Result<PatternSet> PatternSet::single(const std::string& user_pattern) {
    if (user_pattern.empty()) {
        return core::makeError(core::ErrorCode::InvalidArgument, "Pattern must not be empty");
    }

    Pattern pattern(user_pattern);
    auto decoded = decodedText(pattern);
    if (!decoded) {
        SCAN_WARN("Cannot use pattern '{}': {}", user_pattern, decoded.error().fullMessage());
        return decoded.error();
    }

    if (pattern.isEscapeToken()) {
        SCAN_INFO("Pattern '{}' decoded to U+{:04X}", user_pattern,
                  static_cast<uint32_t>(resolve(pattern).value()));
    }
    return PatternSet({Pattern(decoded.value())});
}

}} // namespace cellscrub::scan
