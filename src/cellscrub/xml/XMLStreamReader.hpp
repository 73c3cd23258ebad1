#pragma once

#include "cellscrub/core/Constants.hpp"
#include "cellscrub/core/span.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <expat.h>

namespace cellscrub {
namespace xml {

using core::span;

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    MemoryError,           // 内存错误
    CallbackError          // 回调函数错误
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

constexpr bool isError(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

// XML属性（引用 expat 缓冲区，仅在回调期间有效）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v) : name(n), value(v) {}
};

/**
 * @brief 基于 libexpat 的流式 XML 解析器
 *
 * 事件按文档顺序回调。字符数据不做裁剪，在下一个元素、注释或处理指令事件
 * 之前合并为一次 Text 回调，因此既能供 SAX 解析器收集文本，
 * 也能原样转写整个文档。实体和 CDATA 由 expat 解码后以文本形式给出。
 * 回调抛出的异常会终止解析并返回 CallbackError。
 */
class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, span<const XMLAttribute> attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;
    using CommentCallback = std::function<void(std::string_view comment, int depth)>;
    using ProcessingInstructionCallback = std::function<void(std::string_view target, std::string_view data, int depth)>;
    using ErrorCallback = std::function<void(XMLParseError error, const std::string& message, int line, int column)>;

    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback);
    void setEndElementCallback(EndElementCallback callback);
    void setTextCallback(TextCallback callback);
    void setCommentCallback(CommentCallback callback);
    void setProcessingInstructionCallback(ProcessingInstructionCallback callback);
    void setErrorCallback(ErrorCallback callback);

    XMLParseError parseFromString(std::string_view xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    size_t getElementsParsed() const { return elements_parsed_; }

private:
    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);
    static void XMLCALL commentHandler(void* userData, const XML_Char* data);
    static void XMLCALL processingInstructionHandler(void* userData, const XML_Char* target, const XML_Char* data);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    span<const XMLAttribute> parseAttributes(const XML_Char** attrs);
    void flushText();
    void handleError(XMLParseError error, const std::string& message);

    // 执行回调；异常转为 CallbackError 并停止解析
    template<typename Fn>
    void invokeCallback(const char* what, Fn&& fn);

    XML_Parser parser_ = nullptr;
    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;

    std::vector<XMLAttribute> attribute_pool_;
    std::string pending_text_;
    size_t elements_parsed_ = 0;

    static constexpr size_t kChunkSize = core::Constants::kIOBufferSize;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    CommentCallback comment_callback_;
    ProcessingInstructionCallback pi_callback_;
    ErrorCallback error_callback_;
};

}} // namespace cellscrub::xml
