// CellScrub - 工作簿问题字符扫描与清理
// 组件：报告文本编码测试（ICU 严格模式）

#include "cellscrub/unicode/TextEncoder.hpp"
#include <gtest/gtest.h>
#include <string>

namespace cellscrub {
namespace unicode {

class TextEncoderTest : public ::testing::Test {
};

TEST_F(TextEncoderTest, Utf8PassesThrough) {
    TextEncoder encoder("UTF-8");
    auto encoded = encoder.encode("caf\xC3\xA9 \xE2\x82\xAC");
    ASSERT_TRUE(encoded.hasValue());
    EXPECT_EQ(encoded.value(), "caf\xC3\xA9 \xE2\x82\xAC");

    TextEncoder alias("utf_8");
    EXPECT_TRUE(alias.canEncode("\xE2\x82\xAC"));
}

// Latin-1 可表示 é，不可表示 €
TEST_F(TextEncoderTest, Latin1EncodesRepresentableText) {
    TextEncoder encoder("ISO-8859-1");
    auto encoded = encoder.encode("caf\xC3\xA9");
    ASSERT_TRUE(encoded.hasValue());
    EXPECT_EQ(encoded.value(), "caf\xE9");
}

TEST_F(TextEncoderTest, UnrepresentableCharacterFails) {
    TextEncoder encoder("ISO-8859-1");
    auto encoded = encoder.encode("abc\xE2\x82\xAC");
    ASSERT_TRUE(encoded.hasError());
    EXPECT_EQ(encoded.error().code, core::ErrorCode::EncodingFailure);
    EXPECT_NE(encoded.error().message.find("U+20AC"), std::string::npos);
    EXPECT_NE(encoded.error().message.find("position 3"), std::string::npos);
    EXPECT_FALSE(encoder.canEncode("\xE2\x82\xAC"));
}

// windows-1252 把 € 放在 0x80
TEST_F(TextEncoderTest, Windows1252HasEuroSign) {
    TextEncoder encoder("windows-1252");
    auto encoded = encoder.encode("\xE2\x82\xAC");
    ASSERT_TRUE(encoded.hasValue());
    EXPECT_EQ(encoded.value(), "\x80");
}

TEST_F(TextEncoderTest, SupportedEncodings) {
    EXPECT_TRUE(TextEncoder::isSupported("UTF-8"));
    EXPECT_TRUE(TextEncoder::isSupported("ISO-8859-1"));
    EXPECT_FALSE(TextEncoder::isSupported("no-such-charset-xyz"));

    TextEncoder unknown("no-such-charset-xyz");
    EXPECT_TRUE(unknown.encode("abc").hasError());
}

TEST_F(TextEncoderTest, InvalidUtf8InputFails) {
    TextEncoder encoder("UTF-8");
    auto encoded = encoder.encode("\xC3");
    ASSERT_TRUE(encoded.hasError());
    EXPECT_EQ(encoded.error().code, core::ErrorCode::EncodingFailure);
}

}} // namespace cellscrub::unicode
