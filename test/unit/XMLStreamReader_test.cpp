// CellScrub - 工作簿问题字符扫描与清理
// 组件：XML 流式读取测试（expat）

#include "cellscrub/xml/XMLStreamReader.hpp"
#include "cellscrub/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace cellscrub {
namespace xml {

class XMLStreamReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/XMLStreamReader_test.log", Logger::Level::DEBUG, false);

        reader.setStartElementCallback([this](std::string_view name, span<const XMLAttribute> attrs, int depth) {
            std::string entry = std::string(name) + "@" + std::to_string(depth);
            for (const auto& attr : attrs) {
                entry += " " + std::string(attr.name) + "=" + std::string(attr.value);
            }
            events.push_back("start " + entry);
        });
        reader.setEndElementCallback([this](std::string_view name, int depth) {
            events.push_back("end " + std::string(name) + "@" + std::to_string(depth));
        });
        reader.setTextCallback([this](std::string_view text, int) {
            events.push_back("text " + std::string(text));
        });
    }

    XMLStreamReader reader;
    std::vector<std::string> events;
};

// 测试事件顺序与深度
TEST_F(XMLStreamReaderTest, ParsesElementsAttributesAndText) {
    const std::string xml =
        "<?xml version=\"1.0\"?>"
        "<row r=\"2\"><c r=\"A2\" t=\"s\"><v>0</v></c></row>";

    ASSERT_EQ(reader.parseFromString(xml), XMLParseError::Ok);
    std::vector<std::string> expected = {
        "start row@0 r=2",
        "start c@1 r=A2 t=s",
        "start v@2",
        "text 0",
        "end v@2",
        "end c@1",
        "end row@0",
    };
    EXPECT_EQ(events, expected);
    EXPECT_EQ(reader.getElementsParsed(), 3u);
}

// 实体只解码一次；跨块文本合并为一次回调
TEST_F(XMLStreamReaderTest, TextIsDecodedOnceAndDeliveredWhole) {
    std::string body = "caf&#xE9; &amp;amp; &lt;tag&gt;";
    std::string big(20000, 'x');
    const std::string xml = "<t>" + body + "</t><!-- --><u>" + big + "</u>";

    ASSERT_EQ(reader.parseFromString("<root>" + xml + "</root>"), XMLParseError::Ok);

    std::vector<std::string> texts;
    for (const auto& e : events) {
        if (e.rfind("text ", 0) == 0) texts.push_back(e.substr(5));
    }
    ASSERT_EQ(texts.size(), 2u);
    EXPECT_EQ(texts[0], "caf\xC3\xA9 &amp; <tag>");
    EXPECT_EQ(texts[1], big);
}

// 空白文本不裁剪
TEST_F(XMLStreamReaderTest, WhitespaceIsPreserved) {
    ASSERT_EQ(reader.parseFromString("<t xml:space=\"preserve\">  a  </t>"), XMLParseError::Ok);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[1], "text   a  ");
}

TEST_F(XMLStreamReaderTest, MalformedXmlFails) {
    EXPECT_EQ(reader.parseFromString("<a><b></a>"), XMLParseError::ParseFailed);
    EXPECT_EQ(reader.getLastError(), XMLParseError::ParseFailed);
    EXPECT_NE(reader.getLastErrorMessage().find("line"), std::string::npos);

    EXPECT_EQ(reader.parseFromString(""), XMLParseError::InvalidInput);
}

// 回调抛异常时停止解析并报告 CallbackError
TEST_F(XMLStreamReaderTest, CallbackExceptionStopsParsing) {
    int starts = 0;
    reader.setStartElementCallback([&](std::string_view name, span<const XMLAttribute>, int) {
        ++starts;
        if (name == "bad") throw std::runtime_error("boom");
    });

    std::string error_message;
    reader.setErrorCallback([&](XMLParseError, const std::string& message, int, int) {
        error_message = message;
    });

    EXPECT_EQ(reader.parseFromString("<a><bad/><c/><d/></a>"), XMLParseError::CallbackError);
    EXPECT_EQ(starts, 2);
    EXPECT_NE(error_message.find("boom"), std::string::npos);
}

// 同一个 reader 可以重复使用
TEST_F(XMLStreamReaderTest, ReaderIsReusable) {
    ASSERT_EQ(reader.parseFromString("<a/>"), XMLParseError::Ok);
    events.clear();
    ASSERT_EQ(reader.parseFromString("<b x=\"1\"/>"), XMLParseError::Ok);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], "start b@0 x=1");
}

TEST_F(XMLStreamReaderTest, CommentsAndProcessingInstructions) {
    std::vector<std::string> extras;
    reader.setCommentCallback([&](std::string_view text, int) { extras.push_back("comment" + std::string(text)); });
    reader.setProcessingInstructionCallback([&](std::string_view target, std::string_view data, int) {
        extras.push_back("pi " + std::string(target) + " " + std::string(data));
    });

    ASSERT_EQ(reader.parseFromString("<a><!--note--><?app run?></a>"), XMLParseError::Ok);
    ASSERT_EQ(extras.size(), 2u);
    EXPECT_EQ(extras[0], "commentnote");
    EXPECT_EQ(extras[1], "pi app run");
}

}} // namespace cellscrub::xml
