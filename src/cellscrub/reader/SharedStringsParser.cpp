#include "cellscrub/reader/SharedStringsParser.hpp"

namespace cellscrub {
namespace reader {

void SharedStringsParser::onStartElement(std::string_view name, span<const xml::XMLAttribute> /*attributes*/, int /*depth*/) {
    if (name == "si") {
        in_si_ = true;
        current_.clear();
    } else if (name == "t" && in_si_ && !isInElement("rPh")) {
        startCollectingText();
    }
}

void SharedStringsParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "t") {
        if (state_.collecting_text) {
            current_ += takeCurrentText();
            stopCollectingText();
        }
    } else if (name == "si") {
        strings_.push_back(std::move(current_));
        current_.clear();
        in_si_ = false;
    } else if (name == "sst") {
        READER_DEBUG("Parsed {} shared strings", strings_.size());
    }
}

}} // namespace cellscrub::reader
