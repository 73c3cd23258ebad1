#include "cellscrub/clean/PatternUnion.hpp"
#include "cellscrub/scan/PatternSet.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace cellscrub {
namespace clean {

std::string replaceAll(const std::string& text, const std::string& needle, const std::string& replacement) {
    if (needle.empty()) {
        return text;
    }
    std::string result;
    result.reserve(text.size());
    size_t start = 0;
    size_t pos = text.find(needle);
    while (pos != std::string::npos) {
        result.append(text, start, pos - start);
        result += replacement;
        start = pos + needle.size();
        pos = text.find(needle, start);
    }
    result.append(text, start, std::string::npos);
    return result;
}

void PatternUnion::add(const std::string& pattern) {
    auto decoded = scan::PatternSet::decodedText(scan::Pattern(pattern));
    if (!decoded) {
        ++undecodable_;
        CLEAN_DEBUG("Pattern '{}' skipped in union: {}", pattern, decoded.error().fullMessage());
        return;
    }
    if (!contains(decoded.value())) {
        characters_.push_back(decoded.value());
    }
}

PatternUnion PatternUnion::fromFindings(const std::vector<scan::Finding>& findings) {
    PatternUnion result;
    for (const auto& finding : findings) {
        result.add(finding.pattern);
    }
    return result;
}

PatternUnion PatternUnion::fromPatterns(const std::vector<std::string>& patterns) {
    PatternUnion result;
    for (const auto& pattern : patterns) {
        result.add(pattern);
    }
    return result;
}

bool PatternUnion::contains(const std::string& character) const {
    return std::find(characters_.begin(), characters_.end(), character) != characters_.end();
}

std::string PatternUnion::apply(const std::string& text, const std::string& replacement) const {
    if (characters_.empty()) {
        return text;
    }
    // 单次从左到右扫描，已写入的替换文本不会再被匹配。
    // UTF-8 无前缀歧义，完整码点只会在码点边界处命中；非法字节原样复制。
    std::string result;
    result.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        const std::string* hit = nullptr;
        for (const auto& character : characters_) {
            if (text.compare(pos, character.size(), character) == 0) {
                hit = &character;
                break;
            }
        }
        if (hit) {
            result += replacement;
            pos += hit->size();
        } else {
            result.push_back(text[pos]);
            ++pos;
        }
    }
    return result;
}

}} // namespace cellscrub::clean
