// CellScrub - 工作簿问题字符扫描与清理
// 组件：目标模式集合测试

#include "cellscrub/scan/PatternSet.hpp"
#include "cellscrub/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <string>

namespace cellscrub {
namespace scan {

class PatternSetTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/PatternSet_test.log", Logger::Level::DEBUG, false);
    }
};

// 默认集合：128 个字面字符 + 128 个 \xNN 记号
TEST_F(PatternSetTest, DefaultPatternsCoverLatin1Range) {
    PatternSet patterns = PatternSet::defaultPatterns();
    ASSERT_EQ(patterns.size(), 256u);

    EXPECT_EQ(patterns[0].text(), "\xC2\x80");
    EXPECT_EQ(patterns[127].text(), "\xC3\xBF");
    EXPECT_EQ(patterns[128].text(), "\\x80");
    EXPECT_EQ(patterns[255].text(), "\\xff");

    EXPECT_FALSE(patterns[0].isEscapeToken());
    EXPECT_TRUE(patterns[128].isEscapeToken());
}

TEST_F(PatternSetTest, SingleLiteralPattern) {
    auto result = PatternSet::single("\xC3\xA9");
    ASSERT_TRUE(result.hasValue());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].text(), "\xC3\xA9");
}

// 含反斜杠的输入先解码
TEST_F(PatternSetTest, SingleEscapedPatternIsDecoded) {
    auto result = PatternSet::single("\\x81");
    ASSERT_TRUE(result.hasValue());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].text(), "\xC2\x81");
    EXPECT_EQ(result.value()[0].hexValue(), "0x81");

    auto named = PatternSet::single("\\u00e9");
    ASSERT_TRUE(named.hasValue());
    EXPECT_EQ(named.value()[0].text(), "\xC3\xA9");
}

TEST_F(PatternSetTest, SingleRejectsBadInput) {
    auto empty = PatternSet::single("");
    ASSERT_TRUE(empty.hasError());
    EXPECT_EQ(empty.error().code, core::ErrorCode::InvalidArgument);

    auto malformed = PatternSet::single("\\xZZ");
    ASSERT_TRUE(malformed.hasError());
    EXPECT_EQ(malformed.error().code, core::ErrorCode::DecodeError);

    auto two = PatternSet::single("ab");
    ASSERT_TRUE(two.hasError());
    EXPECT_EQ(two.error().code, core::ErrorCode::DecodeError);
}

// 代理区转义返回错误而不是抛出异常
TEST_F(PatternSetTest, SingleRejectsSurrogateEscape) {
    core::Result<PatternSet> result = core::makeError(core::ErrorCode::InvalidArgument, "unset");
    EXPECT_NO_THROW(result = PatternSet::single("\\ud800"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::DecodeError);

    core::Result<std::string> text = std::string();
    EXPECT_NO_THROW(text = PatternSet::decodedText(Pattern("\\U0000DFFF")));
    ASSERT_TRUE(text.hasError());
    EXPECT_EQ(text.error().code, core::ErrorCode::DecodeError);
}

TEST_F(PatternSetTest, ResolveLiteralAndToken) {
    auto literal = PatternSet::resolve(Pattern("\xC3\xA9"));
    ASSERT_TRUE(literal.hasValue());
    EXPECT_EQ(literal.value(), U'\xE9');

    auto token = PatternSet::resolve(Pattern("\\xe9"));
    ASSERT_TRUE(token.hasValue());
    EXPECT_EQ(token.value(), U'\xE9');

    auto text = PatternSet::decodedText(Pattern("\\xe9"));
    ASSERT_TRUE(text.hasValue());
    EXPECT_EQ(text.value(), "\xC3\xA9");

    EXPECT_TRUE(PatternSet::resolve(Pattern("")).hasError());
}

// 单码点模式给出两位十六进制；多码点记号原样显示
TEST_F(PatternSetTest, PatternHexValue) {
    EXPECT_EQ(Pattern("\xC2\x80").hexValue(), "0x80");
    EXPECT_EQ(Pattern("A").hexValue(), "0x41");
    EXPECT_EQ(Pattern("\xE2\x82\xAC").hexValue(), "0x20ac");
    EXPECT_EQ(Pattern("\\xe9").hexValue(), "\\xe9");
    EXPECT_EQ(Pattern("\\xe9").codePointCount(), 4u);
}

}} // namespace cellscrub::scan
