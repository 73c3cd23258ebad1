#include "cellscrub/scan/CellScanner.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <utf8.h>
#include <iterator>

namespace cellscrub {
namespace scan {

std::string CellScanner::sanitize(const std::string& text) {
    if (utf8::is_valid(text.begin(), text.end())) {
        return text;
    }
    std::string fixed;
    fixed.reserve(text.size());
    utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(fixed));
    return fixed;
}

std::vector<size_t> CellScanner::findPositions(const std::string& text, const std::string& needle) {
    std::vector<size_t> positions;
    if (needle.empty() || text.size() < needle.size()) {
        return positions;
    }

    // 字节偏移增量换算为码点偏移
    size_t last_byte = 0;
    size_t last_cp = 0;
    size_t pos = text.find(needle);
    while (pos != std::string::npos) {
        last_cp += static_cast<size_t>(utf8::distance(text.begin() + static_cast<std::ptrdiff_t>(last_byte),
                                                      text.begin() + static_cast<std::ptrdiff_t>(pos)));
        last_byte = pos;
        positions.push_back(last_cp);
        pos = text.find(needle, pos + needle.size());
    }
    return positions;
}

std::vector<PatternMatch> CellScanner::scanValue(const std::string& text, const PatternSet& patterns) {
    std::vector<PatternMatch> matches;
    if (text.empty()) {
        return matches;
    }

    const bool valid = utf8::is_valid(text.begin(), text.end());
    if (!valid) {
        SCAN_WARN("Cell value is not valid UTF-8; invalid bytes replaced before scanning");
    }
    const std::string value = valid ? text : sanitize(text);

    for (const auto& pattern : patterns) {
        auto positions = findPositions(value, pattern.text());
        if (!positions.empty()) {
            matches.push_back(PatternMatch{pattern, std::move(positions)});
        }
    }
    return matches;
}

std::vector<PatternMatch> CellScanner::scanCell(const core::Cell& cell, const PatternSet& patterns) {
    if (!cell.isString()) {
        return {};
    }
    return scanValue(cell.getStringValue(), patterns);
}

}} // namespace cellscrub::scan
