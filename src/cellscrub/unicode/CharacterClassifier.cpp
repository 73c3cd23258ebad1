#include "cellscrub/unicode/CharacterClassifier.hpp"
#include "cellscrub/unicode/EscapeDecoder.hpp"
#include <unicode/uchar.h>
#include <utf8.h>
#include <fmt/format.h>

namespace cellscrub {
namespace unicode {

std::string CharacterClassifier::categoryOf(char32_t cp) {
    int8_t type = u_charType(static_cast<UChar32>(cp));
    const char* name = u_getPropertyValueName(UCHAR_GENERAL_CATEGORY, type, U_SHORT_PROPERTY_NAME);
    return name ? std::string(name) : std::string("Cn");
}

std::string CharacterClassifier::nameOf(char32_t cp) {
    char buf[256];
    UErrorCode status = U_ZERO_ERROR;
    int32_t len = u_charName(static_cast<UChar32>(cp), U_UNICODE_CHAR_NAME, buf, sizeof(buf), &status);
    if (U_FAILURE(status) || len <= 0) {
        return std::string();
    }
    return std::string(buf, static_cast<size_t>(len));
}

Classification CharacterClassifier::classify(char32_t cp) {
    Classification result;
    result.category = categoryOf(cp);

    if (isControl(cp)) {
        result.isPrintable = false;
        result.description = "Control character (non-printable)";
        return result;
    }

    std::string name = nameOf(cp);
    if (name.empty()) {
        name = "Unknown character";
    }

    if (!result.category.empty() && result.category[0] == 'C') {
        result.isPrintable = false;
        result.description = fmt::format("Unicode category: {} ({})", result.category, name);
    } else {
        result.isPrintable = true;
        result.description = fmt::format("Unicode: {} (category: {})", name, result.category);
    }
    return result;
}

Classification CharacterClassifier::classifyPattern(const std::string& pattern) {
    // 单个字面码点直接分类
    if (utf8::is_valid(pattern.begin(), pattern.end()) &&
        utf8::distance(pattern.begin(), pattern.end()) == 1) {
        auto it = pattern.begin();
        return classify(static_cast<char32_t>(utf8::next(it, pattern.end())));
    }

    auto cp = EscapeDecoder::decodeSingle(pattern);
    if (!cp) {
        Classification invalid;
        invalid.isPrintable = false;
        invalid.description = "Invalid escape sequence";
        return invalid;
    }
    return classify(cp.value());
}

}} // namespace cellscrub::unicode
