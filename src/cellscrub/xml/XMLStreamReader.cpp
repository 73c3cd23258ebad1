#include "cellscrub/xml/XMLStreamReader.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cstring>
#include <exception>
#include <fmt/format.h>

namespace cellscrub {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attribute_pool_.reserve(32);
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    XML_SetCommentHandler(parser_, commentHandler);
    XML_SetProcessingInstructionHandler(parser_, processingInstructionHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attribute_pool_.clear();
    pending_text_.clear();
    elements_parsed_ = 0;
}

void XMLStreamReader::setStartElementCallback(StartElementCallback callback) {
    start_element_callback_ = std::move(callback);
}

void XMLStreamReader::setEndElementCallback(EndElementCallback callback) {
    end_element_callback_ = std::move(callback);
}

void XMLStreamReader::setTextCallback(TextCallback callback) {
    text_callback_ = std::move(callback);
}

void XMLStreamReader::setCommentCallback(CommentCallback callback) {
    comment_callback_ = std::move(callback);
}

void XMLStreamReader::setProcessingInstructionCallback(ProcessingInstructionCallback callback) {
    pi_callback_ = std::move(callback);
}

void XMLStreamReader::setErrorCallback(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

XMLParseError XMLStreamReader::parseFromString(std::string_view xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();

    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Invalid buffer or size");
        return XMLParseError::InvalidInput;
    }

    if (!initializeParser()) {
        return last_error_;
    }

    size_t offset = 0;
    while (offset < size) {
        const size_t len = std::min(kChunkSize, size - offset);
        const bool is_final = offset + len == size;

        if (XML_Parse(parser_, buffer + offset, static_cast<int>(len), is_final ? 1 : 0) == XML_STATUS_ERROR) {
            // 回调异常已记录 CallbackError
            if (last_error_ == XMLParseError::Ok) {
                std::string error_msg = fmt::format("Parse error at line {}, column {}: {}",
                    XML_GetCurrentLineNumber(parser_),
                    XML_GetCurrentColumnNumber(parser_),
                    XML_ErrorString(XML_GetErrorCode(parser_)));
                handleError(XMLParseError::ParseFailed, error_msg);
            }
            cleanupParser();
            return last_error_;
        }
        offset += len;
    }

    // 根元素之后的尾随空白
    flushText();

    XML_DEBUG("Parsed {} bytes, {} elements", size, elements_parsed_);
    cleanupParser();
    return last_error_;
}

template<typename Fn>
void XMLStreamReader::invokeCallback(const char* what, Fn&& fn) {
    if (last_error_ != XMLParseError::Ok) {
        return;
    }
    try {
        fn();
    } catch (const std::exception& e) {
        handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", what, e.what()));
        if (parser_) {
            XML_StopParser(parser_, XML_FALSE);
        }
    }
}

void XMLStreamReader::flushText() {
    if (pending_text_.empty()) {
        return;
    }
    if (text_callback_) {
        std::string_view text{pending_text_};
        invokeCallback("Text", [&] { text_callback_(text, current_depth_); });
    }
    pending_text_.clear();
}

void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();

    std::string_view element_name{name, std::strlen(name)};
    reader->elements_parsed_++;

    auto attributes = reader->parseAttributes(attrs);
    if (reader->start_element_callback_) {
        reader->invokeCallback("Start element", [&] {
            reader->start_element_callback_(element_name, attributes, reader->current_depth_);
        });
    }

    reader->current_depth_++;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();

    reader->current_depth_--;
    std::string_view element_name{name, std::strlen(name)};

    if (reader->end_element_callback_) {
        reader->invokeCallback("End element", [&] {
            reader->end_element_callback_(element_name, reader->current_depth_);
        });
    }
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    if (len > 0) {
        reader->pending_text_.append(data, static_cast<size_t>(len));
    }
}

void XMLCALL XMLStreamReader::commentHandler(void* userData, const XML_Char* data) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();

    if (reader->comment_callback_) {
        std::string_view comment{data, std::strlen(data)};
        reader->invokeCallback("Comment", [&] {
            reader->comment_callback_(comment, reader->current_depth_);
        });
    }
}

void XMLCALL XMLStreamReader::processingInstructionHandler(void* userData, const XML_Char* target, const XML_Char* data) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();

    if (reader->pi_callback_) {
        std::string_view target_view{target, std::strlen(target)};
        std::string_view data_view = data ? std::string_view{data, std::strlen(data)} : std::string_view{};
        reader->invokeCallback("Processing instruction", [&] {
            reader->pi_callback_(target_view, data_view, reader->current_depth_);
        });
    }
}

// 属性只在当前回调期间有效，每个元素复用属性池
span<const XMLAttribute> XMLStreamReader::parseAttributes(const XML_Char** attrs) {
    attribute_pool_.clear();

    if (attrs) {
        for (int i = 0; attrs[i]; i += 2) {
            if (attrs[i + 1]) {
                attribute_pool_.emplace_back(
                    std::string_view{attrs[i], std::strlen(attrs[i])},
                    std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
            }
        }
    }

    return span<const XMLAttribute>{attribute_pool_.data(), attribute_pool_.size()};
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    XML_ERROR("XML Parser Error: {}", message);

    if (error_callback_) {
        int line = parser_ ? static_cast<int>(XML_GetCurrentLineNumber(parser_)) : -1;
        int column = parser_ ? static_cast<int>(XML_GetCurrentColumnNumber(parser_)) : -1;
        error_callback_(error, message, line, column);
    }
}

}} // namespace cellscrub::xml
