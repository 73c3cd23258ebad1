#pragma once

#include <string>
#include <cstdint>
#include <cstdio>
#include <ostream>
#include "cellscrub/core/Expected.hpp"

namespace cellscrub {
namespace core {

/**
 * @brief UTF-8 路径封装
 *
 * 统一生成产物路径（同目录、文件名主干 + 后缀）以及整文件读写。
 */
class Path {
private:
    std::string utf8_path_;

public:
    explicit Path(const std::string& path);
    explicit Path(const char* path);
    Path() = default;

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    // 路径分解
    /**
     * @brief 文件名（含扩展名），如 "data/book.xlsx" -> "book.xlsx"
     */
    std::string filename() const;

    /**
     * @brief 文件名主干，如 "data/book.xlsx" -> "book"
     */
    std::string stem() const;

    /**
     * @brief 扩展名（含点），如 ".xlsx"
     */
    std::string extension() const;

    /**
     * @brief 所在目录；无目录部分时为空路径
     */
    Path parent() const;

    /**
     * @brief 拼接子路径
     */
    Path operator/(const std::string& child) const;

    // 文件操作
    bool exists() const;
    bool isFile() const;
    uintmax_t fileSize() const;

    /**
     * @brief 删除文件，失败只记录调试日志
     */
    bool remove() const;

    FILE* openForRead(bool binary = true) const;
    FILE* openForWrite(bool binary = true) const;

    /**
     * @brief 整文件读取
     */
    Result<std::string> readAll() const;

    /**
     * @brief 整文件写入（覆盖）。写入失败时删除半成品文件
     */
    VoidResult writeAll(const std::string& bytes) const;

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

}} // namespace cellscrub::core
