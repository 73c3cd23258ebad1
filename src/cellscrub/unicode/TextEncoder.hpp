#pragma once

#include "cellscrub/core/Expected.hpp"
#include <string>

namespace cellscrub {
namespace unicode {

/**
 * @brief 把 UTF-8 文本转成目标编码（ICU 转换器，遇到无法表示的字符即停止）
 *
 * 用于报告与清理日志落盘前的编码；失败返回 ErrorCode::EncodingFailure，
 * 此时调用方不应创建目标文件。
 */
class TextEncoder {
public:
    explicit TextEncoder(const std::string& encoding = "UTF-8");

    const std::string& getEncoding() const { return encoding_; }

    core::Result<std::string> encode(const std::string& utf8_text) const;

    bool canEncode(const std::string& utf8_text) const;

    /**
     * @brief ICU 是否认识该编码名
     */
    static bool isSupported(const std::string& encoding);

private:
    bool isUtf8Target() const;

    std::string encoding_;
};

}} // namespace cellscrub::unicode
