// CellScrub - 工作簿问题字符扫描与清理
// 组件：测试用 XLSX 包构造器

#include "XlsxFixture.hpp"
#include "cellscrub/archive/ZipWriter.hpp"
#include <fmt/format.h>

namespace cellscrub {
namespace test {

namespace {

constexpr const char* kXmlDecl = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
constexpr const char* kMainNs = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
constexpr const char* kRelNs = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char* kPkgRelNs = "http://schemas.openxmlformats.org/package/2006/relationships";

} // namespace

XlsxFixture& XlsxFixture::addSheet(const std::string& name, const std::string& sheet_data) {
    sheets_.emplace_back(name, sheetXml(sheet_data));
    return *this;
}

size_t XlsxFixture::addSharedString(const std::string& si_inner_xml) {
    shared_strings_.push_back(si_inner_xml);
    return shared_strings_.size() - 1;
}

XlsxFixture& XlsxFixture::addPart(const std::string& path, const std::string& content) {
    extra_parts_.emplace_back(path, content);
    return *this;
}

std::string XlsxFixture::sheetXml(const std::string& sheet_data) {
    return fmt::format("{}<worksheet xmlns=\"{}\" xmlns:r=\"{}\"><dimension ref=\"A1\"/>"
                       "<sheetData>{}</sheetData><pageMargins left=\"0.7\" right=\"0.7\" top=\"0.75\" "
                       "bottom=\"0.75\" header=\"0.3\" footer=\"0.3\"/></worksheet>",
                       kXmlDecl, kMainNs, kRelNs, sheet_data);
}

std::string XlsxFixture::sharedCell(const std::string& ref, size_t index) {
    return fmt::format("<c r=\"{}\" t=\"s\"><v>{}</v></c>", ref, index);
}

std::string XlsxFixture::inlineCell(const std::string& ref, const std::string& text) {
    return fmt::format("<c r=\"{}\" t=\"inlineStr\"><is><t>{}</t></is></c>", ref, text);
}

std::string XlsxFixture::numberCell(const std::string& ref, const std::string& value) {
    return fmt::format("<c r=\"{}\"><v>{}</v></c>", ref, value);
}

bool XlsxFixture::save(const std::string& path) const {
    archive::ZipWriter zip{core::Path(path)};
    if (!zip.open()) {
        return false;
    }

    std::string overrides;
    std::string workbook_sheets;
    std::string workbook_rels;
    for (size_t i = 0; i < sheets_.size(); ++i) {
        overrides += fmt::format(
            "<Override PartName=\"/xl/worksheets/sheet{}.xml\" "
            "ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml\"/>",
            i + 1);
        workbook_sheets += fmt::format("<sheet name=\"{}\" sheetId=\"{}\" r:id=\"rId{}\"/>",
                                       sheets_[i].first, i + 1, i + 1);
        workbook_rels += fmt::format(
            "<Relationship Id=\"rId{}\" "
            "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" "
            "Target=\"worksheets/sheet{}.xml\"/>",
            i + 1, i + 1);
    }
    if (!shared_strings_.empty()) {
        overrides += "<Override PartName=\"/xl/sharedStrings.xml\" "
                     "ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.sharedStrings+xml\"/>";
        workbook_rels += fmt::format(
            "<Relationship Id=\"rId{}\" "
            "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/sharedStrings\" "
            "Target=\"sharedStrings.xml\"/>",
            sheets_.size() + 1);
    }

    std::vector<std::pair<std::string, std::string>> parts;
    parts.emplace_back("[Content_Types].xml", fmt::format(
        "{}<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
        "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
        "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
        "<Override PartName=\"/xl/workbook.xml\" "
        "ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml\"/>"
        "{}</Types>",
        kXmlDecl, overrides));
    if (root_rels_) {
        parts.emplace_back("_rels/.rels", fmt::format(
            "{}<Relationships xmlns=\"{}\"><Relationship Id=\"rId1\" "
            "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" "
            "Target=\"xl/workbook.xml\"/></Relationships>",
            kXmlDecl, kPkgRelNs));
    }
    parts.emplace_back("xl/workbook.xml", fmt::format(
        "{}<workbook xmlns=\"{}\" xmlns:r=\"{}\"><sheets>{}</sheets></workbook>",
        kXmlDecl, kMainNs, kRelNs, workbook_sheets));
    parts.emplace_back("xl/_rels/workbook.xml.rels", fmt::format(
        "{}<Relationships xmlns=\"{}\">{}</Relationships>", kXmlDecl, kPkgRelNs, workbook_rels));
    if (!shared_strings_.empty()) {
        std::string items;
        for (const auto& si : shared_strings_) {
            items += "<si>" + si + "</si>";
        }
        parts.emplace_back("xl/sharedStrings.xml", fmt::format(
            "{}<sst xmlns=\"{}\" count=\"{}\" uniqueCount=\"{}\">{}</sst>",
            kXmlDecl, kMainNs, shared_strings_.size(), shared_strings_.size(), items));
    }
    for (size_t i = 0; i < sheets_.size(); ++i) {
        parts.emplace_back(fmt::format("xl/worksheets/sheet{}.xml", i + 1), sheets_[i].second);
    }
    for (const auto& part : extra_parts_) {
        parts.push_back(part);
    }

    for (const auto& part : parts) {
        if (zip.addFile(part.first, part.second) != archive::ZipError::Ok) {
            zip.close();
            return false;
        }
    }
    return zip.close();
}

}} // namespace cellscrub::test
