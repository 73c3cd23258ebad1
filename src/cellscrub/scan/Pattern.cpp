#include "cellscrub/scan/Pattern.hpp"
#include <utf8.h>
#include <fmt/format.h>

namespace cellscrub {
namespace scan {

size_t Pattern::codePointCount() const {
    if (!utf8::is_valid(text_.begin(), text_.end())) {
        return text_.size();
    }
    return static_cast<size_t>(utf8::distance(text_.begin(), text_.end()));
}

std::string Pattern::hexValue() const {
    if (codePointCount() == 1 && utf8::is_valid(text_.begin(), text_.end())) {
        auto it = text_.begin();
        uint32_t cp = utf8::next(it, text_.end());
        return fmt::format("0x{:02x}", cp);
    }
    return text_;
}

}} // namespace cellscrub::scan
