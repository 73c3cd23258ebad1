#include "cellscrub/writer/XLSXPackageWriter.hpp"
#include "cellscrub/writer/WorksheetRewriter.hpp"
#include "cellscrub/reader/XLSXReader.hpp"
#include "cellscrub/archive/ZipReader.hpp"
#include "cellscrub/archive/ZipWriter.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <map>

namespace cellscrub {
namespace writer {

core::VoidResult XLSXPackageWriter::write(const core::Workbook& workbook, const clean::ChangeLog& changes,
                                          const std::string& source_path, const std::string& target_path) {
    if (source_path == target_path) {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               "Refusing to overwrite the source workbook", target_path);
    }

    entries_copied_ = 0;
    parts_rewritten_ = 0;

    auto result = writePackage(workbook, changes, source_path, target_path);
    if (!result) {
        core::Path target(target_path);
        if (target.exists()) {
            target.remove();
            WRITER_WARN("Removed partially written workbook {}", target_path);
        }
    }
    return result;
}

core::VoidResult XLSXPackageWriter::writePackage(const core::Workbook& workbook, const clean::ChangeLog& changes,
                                                 const std::string& source_path, const std::string& target_path) {
    archive::ZipReader source(core::Path{source_path});
    if (!source.open()) {
        return core::makeError(core::ErrorCode::OpenFailure, "Cannot open source workbook", source_path);
    }

    auto layout = reader::XLSXReader::readLayout(source);
    if (!layout) {
        return layout.error();
    }

    std::map<std::string, std::string> part_by_sheet;
    for (const auto& sheet : layout->sheets) {
        part_by_sheet.emplace(sheet.name, sheet.part_path);
    }

    // 工作表部件 -> (单元格 -> 新文本)；新文本取工作簿中的当前值
    std::map<std::string, WorksheetRewriter::Replacements> rewrites;
    for (const auto& record : changes.records()) {
        auto part = part_by_sheet.find(record.sheet);
        if (part == part_by_sheet.end()) {
            return core::makeError(core::ErrorCode::MissingSheet,
                                   fmt::format("Sheet '{}' not found in source package", record.sheet),
                                   source_path);
        }

        std::string text = record.newValue;
        if (auto sheet = workbook.getSheet(record.sheet)) {
            if (const core::Cell* cell = sheet->findCell(record.cellRef); cell && cell->isString()) {
                text = cell->getStringValue();
            }
        }
        rewrites[part->second][record.cellRef] = std::move(text);
    }

    archive::ZipWriter target(core::Path{target_path});
    if (!target.open()) {
        return core::makeError(core::ErrorCode::FileWriteError, "Cannot create output workbook", target_path);
    }

    for (const auto& entry : source.listEntriesInfo()) {
        if (entry.is_directory) {
            continue;
        }

        std::string content;
        archive::ZipError zip_result = source.extractFile(entry.path, content);
        if (zip_result != archive::ZipError::Ok) {
            target.close();
            return core::makeError(core::ErrorCode::ZipError,
                                   fmt::format("Failed to read '{}': {}", entry.path, archive::toString(zip_result)),
                                   source_path);
        }

        auto rewrite = rewrites.find(entry.path);
        if (rewrite != rewrites.end()) {
            auto rewritten = WorksheetRewriter::rewrite(content, rewrite->second);
            if (!rewritten) {
                target.close();
                core::Error error = rewritten.error();
                error.context = entry.path;
                return error;
            }
            WRITER_DEBUG("Rewrote {} cell(s) in {}", rewritten->cells_replaced, entry.path);
            content = std::move(rewritten->xml);
            parts_rewritten_++;
        }

        zip_result = target.addFile(entry.path, content, entry.modified_date);
        if (zip_result != archive::ZipError::Ok) {
            target.close();
            return core::makeError(core::ErrorCode::FileWriteError,
                                   fmt::format("Failed to write '{}': {}", entry.path, archive::toString(zip_result)),
                                   target_path);
        }
        entries_copied_++;
    }

    if (!target.close()) {
        return core::makeError(core::ErrorCode::FileWriteError, "Failed to finalize output workbook", target_path);
    }

    WRITER_INFO("Wrote {} ({} entries, {} worksheet(s) rewritten, {} cell(s) changed)",
                target_path, entries_copied_, parts_rewritten_, changes.size());
    return core::ok();
}

}} // namespace cellscrub::writer
