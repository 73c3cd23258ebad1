/**
 * @file Exception.hpp
 * @brief CellScrub 异常类定义
 *
 * 只在接口误用或 valueOrThrow() 时使用；常规失败走 Result。
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace cellscrub {
namespace core {

/**
 * @brief CellScrub 基础异常类
 */
class CellScrubException : public std::runtime_error {
public:
    /**
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    CellScrubException(const std::string& message,
                       ErrorCode code = ErrorCode::InternalError,
                       const char* file = nullptr,
                       int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 获取详细错误信息：[错误码] 消息 (at 文件:行) + 上下文
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public CellScrubException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public CellScrubException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name,
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作顺序错误（如 XML 写出器状态不对）
 */
class OperationException : public CellScrubException {
public:
    OperationException(const std::string& message,
                       const std::string& operation,
                       const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief XML解析异常
 */
class XMLException : public CellScrubException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path,
                 const char* file = nullptr, int line = 0);

    const std::string& getXMLPath() const { return xml_path_; }

private:
    std::string xml_path_;
};

}} // namespace cellscrub::core

// 便捷宏定义：附加源码位置
#define CELLSCRUB_THROW(ExceptionType, ...) \
    throw ExceptionType(__VA_ARGS__, __FILE__, __LINE__)

#define CELLSCRUB_THROW_IF(condition, ExceptionType, ...) \
    do { if (condition) { CELLSCRUB_THROW(ExceptionType, __VA_ARGS__); } } while(0)
