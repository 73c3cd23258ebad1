#pragma once

#include <stack>
#include <string>
#include <string_view>
#include <vector>

namespace cellscrub {
namespace xml {

/**
 * @brief 内存缓冲模式的 XML 流写入器
 *
 * 属性在起始标签关闭前暂存，文本和属性值统一转义。
 * 误用（空名称、标签外写属性、多余的 endElement）抛出异常。
 */
class XMLStreamWriter {
public:
    XMLStreamWriter() = default;

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    /**
     * @brief 文档操作
     */
    void startDocument(const std::string& encoding = "UTF-8", bool standalone = true);
    void endDocument();

    /**
     * @brief 元素操作
     */
    void startElement(std::string_view name);
    void endElement();
    void writeEmptyElement(std::string_view name);

    /**
     * @brief 属性操作
     */
    void writeAttribute(std::string_view name, std::string_view value);
    void writeAttribute(std::string_view name, int value);

    /**
     * @brief 文本内容操作
     */
    void writeText(std::string_view text);
    void writeRaw(std::string_view data);
    void writeComment(std::string_view comment);
    void writeProcessingInstruction(std::string_view target, std::string_view data);

    /**
     * @brief 获取输出结果
     */
    const std::string& toString() const { return buffer_; }
    std::string release();

    size_t getDepth() const { return element_stack_.size(); }
    bool isEmpty() const { return buffer_.empty(); }
    void clear();

private:
    struct PendingAttribute {
        std::string key;
        std::string value;
    };

    void ensureElementClosed();
    void writeAttributesToBuffer();

    std::string buffer_;
    std::stack<std::string> element_stack_;
    std::vector<PendingAttribute> pending_attributes_;
    bool in_element_ = false;
};

}} // namespace cellscrub::xml
