#include "cellscrub/xml/XMLStreamWriter.hpp"
#include "cellscrub/xml/XMLEscapes.hpp"
#include "cellscrub/core/Exception.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace cellscrub {
namespace xml {

void XMLStreamWriter::startDocument(const std::string& encoding, bool standalone) {
    buffer_ += fmt::format("<?xml version=\"1.0\" encoding=\"{}\"{}?>\n",
                           encoding, standalone ? " standalone=\"yes\"" : "");
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        XML_WARN("Auto-closing unclosed element: {}", element_stack_.top());
        endElement();
    }
}

void XMLStreamWriter::startElement(std::string_view name) {
    if (name.empty()) {
        CELLSCRUB_THROW(core::ParameterException, "Element name cannot be empty", "name");
    }

    ensureElementClosed();

    buffer_ += '<';
    buffer_.append(name.data(), name.size());

    element_stack_.emplace(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        CELLSCRUB_THROW(core::OperationException, "No element to close", "endElement");
    }

    std::string element_name = std::move(element_stack_.top());
    element_stack_.pop();

    if (in_element_) {
        // 自闭合元素
        writeAttributesToBuffer();
        buffer_ += "/>";
        in_element_ = false;
    } else {
        buffer_ += "</";
        buffer_ += element_name;
        buffer_ += '>';
    }
}

void XMLStreamWriter::writeEmptyElement(std::string_view name) {
    startElement(name);
    endElement();
}

void XMLStreamWriter::writeAttribute(std::string_view name, std::string_view value) {
    if (!in_element_) {
        CELLSCRUB_THROW(core::OperationException, "Cannot write attribute outside of element", "writeAttribute");
    }
    if (name.empty()) {
        CELLSCRUB_THROW(core::ParameterException, "Attribute name cannot be empty", "name");
    }

    pending_attributes_.push_back(PendingAttribute{std::string(name), std::string(value)});
}

void XMLStreamWriter::writeAttribute(std::string_view name, int value) {
    writeAttribute(name, fmt::format("{}", value));
}

void XMLStreamWriter::writeText(std::string_view text) {
    ensureElementClosed();
    XMLEscapes::appendEscapedText(buffer_, text);
}

void XMLStreamWriter::writeRaw(std::string_view data) {
    ensureElementClosed();
    buffer_.append(data.data(), data.size());
}

void XMLStreamWriter::writeComment(std::string_view comment) {
    ensureElementClosed();
    buffer_ += "<!--";
    buffer_.append(comment.data(), comment.size());
    buffer_ += "-->";
}

void XMLStreamWriter::writeProcessingInstruction(std::string_view target, std::string_view data) {
    ensureElementClosed();
    buffer_ += "<?";
    buffer_.append(target.data(), target.size());
    if (!data.empty()) {
        buffer_ += ' ';
        buffer_.append(data.data(), data.size());
    }
    buffer_ += "?>";
}

std::string XMLStreamWriter::release() {
    endDocument();
    std::string out;
    out.swap(buffer_);
    return out;
}

void XMLStreamWriter::clear() {
    buffer_.clear();
    while (!element_stack_.empty()) element_stack_.pop();
    pending_attributes_.clear();
    in_element_ = false;
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        writeAttributesToBuffer();
        buffer_ += '>';
        in_element_ = false;
    }
}

void XMLStreamWriter::writeAttributesToBuffer() {
    for (const auto& attr : pending_attributes_) {
        buffer_ += ' ';
        buffer_ += attr.key;
        buffer_ += "=\"";
        XMLEscapes::appendEscapedAttribute(buffer_, attr.value);
        buffer_ += '"';
    }
    pending_attributes_.clear();
}

}} // namespace cellscrub::xml
