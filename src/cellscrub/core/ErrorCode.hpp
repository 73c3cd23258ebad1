#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace cellscrub {
namespace core {

/**
 * @brief CellScrub 统一错误码
 *
 * 热路径上以错误码 + Expected 传递，只有接口误用才抛异常。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    OutOfMemory = 2,
    InternalError = 3,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileAccessDenied = 21,
    FileWriteError = 23,
    FileReadError = 24,
    OpenFailure = 25,

    // 工作簿结构错误 (40-59)
    InvalidWorkbook = 40,
    InvalidWorksheet = 41,
    InvalidCellReference = 42,
    CorruptedSharedStrings = 46,
    MissingSheet = 47,
    MissingCell = 48,

    // ZIP/XML处理错误 (60-79)
    ZipError = 60,
    XmlParseError = 61,
    XmlInvalidFormat = 62,
    XmlMissingElement = 63,

    // 文本处理错误 (80-99)
    DecodeError = 80,
    EncodingFailure = 81
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    explicit operator bool() const noexcept { return isError(); }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

inline Error success() {
    return Error(ErrorCode::Ok);
}

/**
 * @brief 把错误转换成对应的异常抛出（Expected::value() 失败时使用）
 */
[[noreturn]] void throwError(const Error& error);

}} // namespace cellscrub::core
