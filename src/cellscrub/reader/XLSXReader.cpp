#include "cellscrub/reader/XLSXReader.hpp"
#include "cellscrub/reader/RelationshipsParser.hpp"
#include "cellscrub/reader/SharedStringsParser.hpp"
#include "cellscrub/reader/WorkbookParser.hpp"
#include "cellscrub/reader/WorksheetParser.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include "cellscrub/utils/TimeUtils.hpp"
#include <fmt/format.h>

namespace cellscrub {
namespace reader {

namespace {

constexpr const char* kOfficeDocumentSuffix = "/officeDocument";
constexpr const char* kWorksheetSuffix = "/worksheet";
constexpr const char* kSharedStringsSuffix = "/sharedStrings";

// "xl/workbook.xml" -> "xl/_rels/workbook.xml.rels"
std::string relsPathFor(const std::string& part) {
    size_t slash = part.rfind('/');
    if (slash == std::string::npos) {
        return "_rels/" + part + ".rels";
    }
    return part.substr(0, slash + 1) + "_rels/" + part.substr(slash + 1) + ".rels";
}

} // namespace

std::string XLSXReader::resolveTarget(const std::string& source_part, const std::string& target) {
    if (!target.empty() && target.front() == '/') {
        return target.substr(1);
    }

    std::vector<std::string> segments;
    size_t slash = source_part.rfind('/');
    std::string base = slash == std::string::npos ? std::string() : source_part.substr(0, slash);

    auto push_segments = [&segments](const std::string& path) {
        size_t start = 0;
        while (start <= path.size()) {
            size_t end = path.find('/', start);
            if (end == std::string::npos) end = path.size();
            std::string segment = path.substr(start, end - start);
            if (segment == "..") {
                if (!segments.empty()) segments.pop_back();
            } else if (!segment.empty() && segment != ".") {
                segments.push_back(std::move(segment));
            }
            start = end + 1;
        }
    };
    push_segments(base);
    push_segments(target);

    std::string result;
    for (const auto& segment : segments) {
        if (!result.empty()) result += '/';
        result += segment;
    }
    return result;
}

core::Result<std::string> XLSXReader::readPart(archive::ZipReader& zip, const std::string& part_path) {
    std::string content;
    archive::ZipError result = zip.extractFile(part_path, content);
    if (result == archive::ZipError::FileNotFound) {
        return core::makeError(core::ErrorCode::InvalidWorkbook,
                               fmt::format("Missing package part '{}'", part_path),
                               zip.getPath().string());
    }
    if (result != archive::ZipError::Ok) {
        return core::makeError(core::ErrorCode::ZipError,
                               fmt::format("Failed to extract '{}': {}", part_path, archive::toString(result)),
                               zip.getPath().string());
    }
    return content;
}

core::Result<XLSXReader::PackageLayout> XLSXReader::readLayout(archive::ZipReader& zip) {
    PackageLayout layout;
    layout.workbook_part = "xl/workbook.xml";

    // 根关系可缺省，缺省时按约定路径
    if (zip.hasFile("_rels/.rels")) {
        auto root_rels_xml = readPart(zip, "_rels/.rels");
        if (!root_rels_xml) {
            return root_rels_xml.error();
        }
        RelationshipsParser root_rels;
        if (!root_rels.parse(root_rels_xml.value())) {
            return core::makeError(core::ErrorCode::XmlParseError, root_rels.getErrorMessage(), "_rels/.rels");
        }
        if (const auto* office = root_rels.findByTypeSuffix(kOfficeDocumentSuffix)) {
            layout.workbook_part = resolveTarget("", office->target);
        }
    }

    auto workbook_xml = readPart(zip, layout.workbook_part);
    if (!workbook_xml) {
        return workbook_xml.error();
    }
    WorkbookParser workbook_parser;
    if (!workbook_parser.parse(workbook_xml.value())) {
        return core::makeError(core::ErrorCode::XmlParseError, workbook_parser.getErrorMessage(), layout.workbook_part);
    }

    const std::string rels_path = relsPathFor(layout.workbook_part);
    auto rels_xml = readPart(zip, rels_path);
    if (!rels_xml) {
        return rels_xml.error();
    }
    RelationshipsParser rels;
    if (!rels.parse(rels_xml.value())) {
        return core::makeError(core::ErrorCode::XmlParseError, rels.getErrorMessage(), rels_path);
    }

    if (const auto* sst = rels.findByTypeSuffix(kSharedStringsSuffix)) {
        layout.shared_strings_part = resolveTarget(layout.workbook_part, sst->target);
    }

    for (const auto& sheet : workbook_parser.getSheets()) {
        const auto* rel = rels.findById(sheet.rel_id);
        if (!rel) {
            READER_WARN("Sheet '{}' references unknown relationship {}", sheet.name, sheet.rel_id);
            continue;
        }
        const std::string& type = rel->type;
        if (type.size() < 10 || type.compare(type.size() - 10, 10, kWorksheetSuffix) != 0) {
            READER_DEBUG("Skipping non-worksheet sheet '{}' ({})", sheet.name, type);
            continue;
        }
        layout.sheets.push_back(SheetPart{sheet.name, resolveTarget(layout.workbook_part, rel->target)});
    }

    return layout;
}

core::Result<std::unique_ptr<core::Workbook>> XLSXReader::load(const std::string& path) {
    utils::TimeUtils::PerformanceTimer timer("xlsx load");
    core::Path file_path(path);

    if (!file_path.exists()) {
        READER_ERROR("Workbook file not found: {}", path);
        return core::makeError(core::ErrorCode::FileNotFound, "Workbook file not found", path);
    }

    archive::ZipReader zip(file_path);
    if (!zip.open()) {
        return core::makeError(core::ErrorCode::OpenFailure, "Not a readable xlsx package", path);
    }

    auto layout = readLayout(zip);
    if (!layout) {
        core::Error error = layout.error();
        if (error.context.empty()) error.context = path;
        READER_ERROR("Failed to read package layout: {}", error.fullMessage());
        return error;
    }

    SharedStringsParser shared_strings;
    if (!layout->shared_strings_part.empty() && zip.hasFile(layout->shared_strings_part)) {
        auto sst_xml = readPart(zip, layout->shared_strings_part);
        if (!sst_xml) {
            return sst_xml.error();
        }
        if (!shared_strings.parse(sst_xml.value())) {
            return core::makeError(core::ErrorCode::CorruptedSharedStrings,
                                   shared_strings.getErrorMessage(), layout->shared_strings_part);
        }
    }

    auto workbook = std::make_unique<core::Workbook>(path);
    for (const auto& sheet : layout->sheets) {
        auto sheet_xml = readPart(zip, sheet.part_path);
        if (!sheet_xml) {
            return sheet_xml.error();
        }

        auto worksheet = workbook->addSheet(sheet.name);
        WorksheetParser parser(*worksheet, &shared_strings);
        if (!parser.parse(sheet_xml.value())) {
            return core::makeError(core::ErrorCode::XmlParseError,
                                   fmt::format("Worksheet '{}': {}", sheet.name, parser.getErrorMessage()),
                                   sheet.part_path);
        }
        READER_DEBUG("Loaded sheet '{}' from {} ({} cells)", sheet.name, sheet.part_path, parser.getCellsParsed());
    }

    READER_INFO("Loaded workbook {} ({} sheets, {} shared strings) in {} ms",
                path, workbook->getSheetCount(), shared_strings.getStringCount(), timer.elapsedMs());
    return workbook;
}

}} // namespace cellscrub::reader
