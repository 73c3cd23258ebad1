/**
 * @file Exception.cpp
 * @brief CellScrub 异常类实现
 */

#include "cellscrub/core/Exception.hpp"
#include <fmt/format.h>

namespace cellscrub {
namespace core {

CellScrubException::CellScrubException(const std::string& message,
                                       ErrorCode code,
                                       const char* file,
                                       int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string CellScrubException::getDetailedMessage() const {
    std::string detailed = fmt::format("[{}] {}", toString(error_code_), what());

    if (file_ && line_ > 0) {
        detailed += fmt::format(" (at {}:{})", file_, line_);
    }

    if (!context_.empty()) {
        detailed += "\nContext:";
        for (const auto& ctx : context_) {
            detailed += "\n  - " + ctx;
        }
    }

    return detailed;
}

void CellScrubException::addContext(const std::string& context) {
    context_.push_back(context);
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : CellScrubException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : CellScrubException(fmt::format("{} (parameter: {})", message, parameter_name),
                         ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       const char* file, int line)
    : CellScrubException(fmt::format("{} (operation: {})", message, operation),
                         ErrorCode::InternalError, file, line)
    , operation_(operation) {
}

XMLException::XMLException(const std::string& message,
                           const std::string& xml_path,
                           const char* file, int line)
    : CellScrubException(message, ErrorCode::XmlParseError, file, line)
    , xml_path_(xml_path) {
}

[[noreturn]] void throwError(const Error& error) {
    switch (error.code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::FileAccessDenied:
        case ErrorCode::FileReadError:
        case ErrorCode::FileWriteError:
        case ErrorCode::OpenFailure:
            throw FileException(error.message, error.context, error.code);
        case ErrorCode::InvalidArgument:
            throw ParameterException(error.message, error.context);
        case ErrorCode::XmlParseError:
        case ErrorCode::XmlInvalidFormat:
        case ErrorCode::XmlMissingElement:
            throw XMLException(error.fullMessage(), error.context);
        default:
            throw CellScrubException(error.fullMessage(), error.code);
    }
}

}} // namespace cellscrub::core
