#pragma once

#include "cellscrub/xml/XMLStreamReader.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cellscrub {
namespace reader {

using core::span;

/**
 * @brief 通用SAX解析器基类
 *
 * 基于 XMLStreamReader 的事件回调，维护元素栈与文本收集状态，
 * 并提供属性查找工具。子类只需实现 onStartElement / onEndElement。
 * 文本已由 expat 解码实体，这里不再二次解码。
 */
class BaseSAXParser {
protected:
    struct ParseState {
        std::vector<std::string> element_stack;
        std::string current_text;
        bool collecting_text = false;
        bool has_error = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
            current_text.clear();
            collecting_text = false;
            has_error = false;
            error_message.clear();
        }
    };

    ParseState state_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @return 是否解析成功
     */
    bool parseXML(std::string_view xml_content) {
        state_.reset();

        if (xml_content.empty()) {
            setError("Empty XML content");
            return false;
        }

        xml::XMLStreamReader reader;
        reader.setStartElementCallback([this](std::string_view name, span<const xml::XMLAttribute> attributes, int depth) {
            state_.element_stack.emplace_back(name);
            onStartElement(name, attributes, depth);
        });
        reader.setEndElementCallback([this](std::string_view name, int depth) {
            onEndElement(name, depth);
            if (!state_.element_stack.empty()) {
                state_.element_stack.pop_back();
            }
        });
        reader.setTextCallback([this](std::string_view text, int depth) {
            if (state_.collecting_text) {
                state_.current_text.append(text.data(), text.size());
            }
            onText(text, depth);
        });

        auto result = reader.parseFromString(xml_content);
        if (result != xml::XMLParseError::Ok) {
            setError(reader.getLastErrorMessage().empty() ? "XML parsing failed" : reader.getLastErrorMessage());
            return false;
        }
        return !state_.has_error;
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

protected:
    virtual void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    // ==================== 属性工具 ====================

    static std::optional<std::string_view> findAttribute(span<const xml::XMLAttribute> attributes, std::string_view name) {
        for (const auto& attr : attributes) {
            if (attr.name == name) {
                return attr.value;
            }
        }
        return std::nullopt;
    }

    static std::optional<int> findIntAttribute(span<const xml::XMLAttribute> attributes, std::string_view name) {
        auto val = findAttribute(attributes, name);
        if (!val) {
            return std::nullopt;
        }
        int result = 0;
        auto [ptr, ec] = std::from_chars(val->data(), val->data() + val->size(), result);
        if (ec != std::errc() || ptr != val->data() + val->size()) {
            return std::nullopt;
        }
        return result;
    }

    static std::string getAttributeOr(span<const xml::XMLAttribute> attributes, std::string_view name,
                                      std::string_view default_value) {
        auto val = findAttribute(attributes, name);
        return std::string(val ? *val : default_value);
    }

    // ==================== 文本收集 ====================

    void startCollectingText() {
        state_.collecting_text = true;
        state_.current_text.clear();
    }

    void stopCollectingText() {
        state_.collecting_text = false;
    }

    const std::string& getCurrentText() const { return state_.current_text; }

    std::string takeCurrentText() {
        std::string text;
        text.swap(state_.current_text);
        return text;
    }

    bool isInElement(std::string_view element_name) const {
        for (const auto& name : state_.element_stack) {
            if (name == element_name) return true;
        }
        return false;
    }

    void setError(const std::string& message) {
        state_.has_error = true;
        state_.error_message = message;
        READER_ERROR("Parser Error: {}", message);
    }
};

}} // namespace cellscrub::reader
