#include "cellscrub/core/ErrorCode.hpp"

namespace cellscrub {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::OutOfMemory:
            return "Out of memory";
        case ErrorCode::InternalError:
            return "Internal error";

        // 文件操作错误
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileAccessDenied:
            return "File access denied";
        case ErrorCode::FileWriteError:
            return "File write error";
        case ErrorCode::FileReadError:
            return "File read error";
        case ErrorCode::OpenFailure:
            return "Cannot open workbook";

        // 工作簿结构错误
        case ErrorCode::InvalidWorkbook:
            return "Invalid workbook";
        case ErrorCode::InvalidWorksheet:
            return "Invalid worksheet";
        case ErrorCode::InvalidCellReference:
            return "Invalid cell reference";
        case ErrorCode::CorruptedSharedStrings:
            return "Corrupted shared strings";
        case ErrorCode::MissingSheet:
            return "Sheet not found";
        case ErrorCode::MissingCell:
            return "Cell not found";

        // ZIP/XML处理错误
        case ErrorCode::ZipError:
            return "ZIP error";
        case ErrorCode::XmlParseError:
            return "XML parse error";
        case ErrorCode::XmlInvalidFormat:
            return "Invalid XML format";
        case ErrorCode::XmlMissingElement:
            return "Missing XML element";

        // 文本处理错误
        case ErrorCode::DecodeError:
            return "Cannot decode escape sequence";
        case ErrorCode::EncodingFailure:
            return "Text not representable in target encoding";

        default:
            return "Unknown error";
    }
}

}} // namespace cellscrub::core
