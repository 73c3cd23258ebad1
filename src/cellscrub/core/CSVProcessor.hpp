#pragma once

#include "cellscrub/core/Expected.hpp"
#include <string>
#include <vector>

namespace cellscrub {
namespace core {

struct CSVOptions {
    char delimiter = ',';
    char quote_char = '"';
    std::string line_terminator = "\n";
    bool skip_empty_lines = true;

    static CSVOptions standard() {
        return CSVOptions{};
    }
};

/**
 * @brief RFC-4180 风格的 CSV 读写
 *
 * 含分隔符、引号、CR 或 LF 的字段加引号，字段内引号写成两个引号。
 * 解析时允许引号字段跨行。
 */
class CSVProcessor {
public:
    CSVProcessor() = default;
    explicit CSVProcessor(const CSVOptions& options) : options_(options) {}

    void setOptions(const CSVOptions& options) { options_ = options; }
    const CSVOptions& getOptions() const { return options_; }

    std::vector<std::vector<std::string>> parseString(const std::string& content) const;

    /**
     * @brief 格式化一行（不含行结束符）
     */
    std::string formatRow(const std::vector<std::string>& row) const;

    /**
     * @brief 格式化整张表，每行以 line_terminator 结尾
     */
    std::string formatDocument(const std::vector<std::vector<std::string>>& rows) const;

    bool needsQuoting(const std::string& field) const;
    std::string escapeField(const std::string& field) const;

private:
    CSVOptions options_;
};

/**
 * @brief 写出 CSV 文件（UTF-8，不带 BOM）
 */
VoidResult writeCSVToFile(const std::string& filepath,
                          const std::vector<std::vector<std::string>>& data,
                          const CSVOptions& options = CSVOptions{});

}} // namespace cellscrub::core
