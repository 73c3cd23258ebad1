#include "cellscrub/scan/WorkbookScanner.hpp"
#include "cellscrub/scan/CellScanner.hpp"
#include "cellscrub/unicode/CharacterClassifier.hpp"
#include "cellscrub/utils/ColumnReferenceUtils.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include "cellscrub/core/Constants.hpp"
#include <unordered_map>

namespace cellscrub {
namespace scan {

std::string WorkbookScanner::columnHeader(const core::Worksheet& sheet, int col) {
    const core::Cell* header = sheet.findCell(core::Constants::kHeaderRow - 1, col);
    std::string text = header ? header->asString() : std::string();
    if (text.empty()) {
        return fmt::format("Unnamed: {}", col);
    }
    return text;
}

std::vector<Finding> WorkbookScanner::scan(const core::Workbook& workbook, const PatternSet& patterns) {
    std::vector<Finding> findings;
    // 同一模式的分类结果只算一次
    std::unordered_map<std::string, unicode::Classification> classifications;

    for (size_t index = 0; index < workbook.getSheetCount(); ++index) {
        auto sheet = workbook.getSheet(index);
        if (!sheet) continue;

        size_t before = findings.size();
        for (const auto& [row, cells] : sheet->rows()) {
            if (row < core::Constants::kHeaderRow) continue;  // 表头行

            for (const auto& [col, cell] : cells) {
                if (!cell.isString()) continue;

                auto matches = CellScanner::scanCell(cell, patterns);
                if (matches.empty()) continue;

                const std::string snapshot = CellScanner::sanitize(cell.getStringValue());
                const std::string letter = utils::ColumnReferenceUtils::letterOf(static_cast<uint32_t>(col + 1));
                const std::string header = columnHeader(*sheet, col);

                for (auto& match : matches) {
                    const std::string& text = match.pattern.text();
                    auto it = classifications.find(text);
                    if (it == classifications.end()) {
                        it = classifications.emplace(text, unicode::CharacterClassifier::classifyPattern(text)).first;
                    }

                    Finding finding;
                    finding.sheet = sheet->getName();
                    finding.row = row + 1;
                    finding.column = col + 1;
                    finding.columnLetter = letter;
                    finding.columnHeader = header;
                    finding.cellValue = snapshot;
                    finding.pattern = text;
                    finding.hexValue = match.pattern.hexValue();
                    finding.isPrintable = it->second.isPrintable;
                    finding.description = it->second.description;
                    finding.positions = std::move(match.positions);
                    findings.push_back(std::move(finding));
                }
            }
        }

        SCAN_DEBUG("Sheet '{}': {} finding(s)", sheet->getName(), findings.size() - before);
    }

    SCAN_INFO("Scanned {} sheet(s) with {} pattern(s): {} finding(s)",
              workbook.getSheetCount(), patterns.size(), findings.size());
    return findings;
}

core::Result<std::vector<Finding>> WorkbookScanner::scanFile(const std::string& path,
                                                            const PatternSet& patterns,
                                                            IWorkbookSource& source) {
    auto workbook = source.load(path);
    if (!workbook) {
        SCAN_ERROR("Cannot open '{}': {}", path, workbook.error().fullMessage());
        return workbook.error();
    }
    return scan(*workbook.value(), patterns);
}

}} // namespace cellscrub::scan
