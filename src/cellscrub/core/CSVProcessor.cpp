#include "cellscrub/core/CSVProcessor.hpp"
#include "cellscrub/core/Path.hpp"

namespace cellscrub {
namespace core {

std::vector<std::vector<std::string>> CSVProcessor::parseString(const std::string& content) const {
    std::vector<std::vector<std::string>> result;
    if (content.empty()) {
        return result;
    }

    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool row_has_data = false;

    auto finish_row = [&]() {
        row.push_back(field);
        field.clear();
        bool empty_line = !row_has_data && row.size() == 1 && row[0].empty();
        if (!(options_.skip_empty_lines && empty_line)) {
            result.push_back(std::move(row));
        }
        row.clear();
        row_has_data = false;
    };

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];

        if (in_quotes) {
            if (c == options_.quote_char) {
                if (i + 1 < content.size() && content[i + 1] == options_.quote_char) {
                    field += c;
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == options_.quote_char) {
            in_quotes = true;
            row_has_data = true;
        } else if (c == options_.delimiter) {
            row.push_back(field);
            field.clear();
            row_has_data = true;
        } else if (c == '\r') {
            // CRLF 视为一个行结束符
            if (i + 1 < content.size() && content[i + 1] == '\n') {
                ++i;
            }
            finish_row();
        } else if (c == '\n') {
            finish_row();
        } else {
            field += c;
            row_has_data = true;
        }
    }

    if (row_has_data || !field.empty() || !row.empty()) {
        finish_row();
    }

    return result;
}

bool CSVProcessor::needsQuoting(const std::string& field) const {
    for (char c : field) {
        if (c == options_.delimiter || c == options_.quote_char || c == '\n' || c == '\r') {
            return true;
        }
    }
    return false;
}

std::string CSVProcessor::escapeField(const std::string& field) const {
    if (!needsQuoting(field)) {
        return field;
    }

    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted += options_.quote_char;
    for (char c : field) {
        if (c == options_.quote_char) {
            quoted += options_.quote_char;
        }
        quoted += c;
    }
    quoted += options_.quote_char;
    return quoted;
}

std::string CSVProcessor::formatRow(const std::vector<std::string>& row) const {
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            line += options_.delimiter;
        }
        line += escapeField(row[i]);
    }
    return line;
}

std::string CSVProcessor::formatDocument(const std::vector<std::vector<std::string>>& rows) const {
    std::string document;
    for (const auto& row : rows) {
        document += formatRow(row);
        document += options_.line_terminator;
    }
    return document;
}

VoidResult writeCSVToFile(const std::string& filepath,
                          const std::vector<std::vector<std::string>>& data,
                          const CSVOptions& options) {
    CSVProcessor processor(options);
    return Path(filepath).writeAll(processor.formatDocument(data));
}

}} // namespace cellscrub::core
