// CellScrub - 工作簿问题字符扫描与清理
// 组件：工作簿扫描测试

#include "cellscrub/scan/WorkbookScanner.hpp"
#include "cellscrub/scan/IWorkbookSource.hpp"
#include "cellscrub/unicode/EscapeDecoder.hpp"
#include "cellscrub/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <fmt/format.h>
#include <memory>
#include <string>

namespace cellscrub {
namespace scan {

namespace {

// 固定返回预设结果的数据源
class StubSource : public IWorkbookSource {
public:
    explicit StubSource(std::unique_ptr<core::Workbook> workbook) : workbook_(std::move(workbook)) {}
    explicit StubSource(core::Error error) : error_(std::move(error)) {}

    core::Result<std::unique_ptr<core::Workbook>> load(const std::string& path) override {
        last_path = path;
        if (workbook_) {
            return std::move(workbook_);
        }
        return error_;
    }

    std::string last_path;

private:
    std::unique_ptr<core::Workbook> workbook_;
    core::Error error_;
};

} // namespace

class WorkbookScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/WorkbookScanner_test.log", Logger::Level::DEBUG, false);

        workbook = std::make_unique<core::Workbook>("book.xlsx");
        auto people = workbook->addSheet("People");
        people->setCell(0, 0, core::Cell("Name"));
        people->setCell(0, 1, core::Cell("City"));
        people->setCell(1, 0, core::Cell("Jos\xC3\xA9"));
        people->setCell(1, 1, core::Cell("Z\xC3\xBCrich"));
        people->setCell(2, 0, core::Cell(128.5));
        people->setCell(2, 2, core::Cell("x\xC2\xA0y"));

        auto notes = workbook->addSheet("Notes");
        notes->setCell(0, 0, core::Cell("\xC3\xA9 header is never scanned"));
        notes->setCell(3, 0, core::Cell("caf\xC3\xA9"));
    }

    std::unique_ptr<core::Workbook> workbook;
};

// 测试 Finding 字段
TEST_F(WorkbookScannerTest, FindingFieldsDescribeTheCell) {
    auto findings = WorkbookScanner::scan(*workbook, PatternSet::defaultPatterns());
    ASSERT_EQ(findings.size(), 4u);

    const Finding& first = findings[0];
    EXPECT_EQ(first.sheet, "People");
    EXPECT_EQ(first.row, 2);
    EXPECT_EQ(first.column, 1);
    EXPECT_EQ(first.columnLetter, "A");
    EXPECT_EQ(first.cellRef(), "A2");
    EXPECT_EQ(first.columnHeader, "Name");
    EXPECT_EQ(first.cellValue, "Jos\xC3\xA9");
    EXPECT_EQ(first.pattern, "\xC3\xA9");
    EXPECT_EQ(first.hexValue, "0xe9");
    EXPECT_TRUE(first.isPrintable);
    EXPECT_EQ(first.positions, std::vector<size_t>({3}));
    EXPECT_EQ(first.positionsText(), "3");

    EXPECT_EQ(findings[1].cellRef(), "B2");
    EXPECT_EQ(findings[1].columnHeader, "City");
    EXPECT_EQ(findings[1].hexValue, "0xfc");
}

// 没有表头文字的列用 "Unnamed: <0-based 列号>"
TEST_F(WorkbookScannerTest, MissingHeaderFallsBack) {
    auto findings = WorkbookScanner::scan(*workbook, PatternSet::defaultPatterns());
    ASSERT_GE(findings.size(), 3u);
    EXPECT_EQ(findings[2].cellRef(), "C3");
    EXPECT_EQ(findings[2].columnHeader, "Unnamed: 2");
    EXPECT_EQ(findings[2].hexValue, "0xa0");
}

// 表头行和数值单元格不产生 Finding；工作表按顺序扫描
TEST_F(WorkbookScannerTest, HeaderRowAndNumbersAreSkipped) {
    auto findings = WorkbookScanner::scan(*workbook, PatternSet::defaultPatterns());
    for (const auto& finding : findings) {
        EXPECT_NE(finding.row, 1) << finding.sheet << "!" << finding.cellRef();
    }
    ASSERT_EQ(findings.size(), 4u);
    EXPECT_EQ(findings[3].sheet, "Notes");
    EXPECT_EQ(findings[3].cellRef(), "A4");
    EXPECT_EQ(findings[3].columnHeader, "\xC3\xA9 header is never scanned");
}

TEST_F(WorkbookScannerTest, ScanningIsDeterministic) {
    PatternSet patterns = PatternSet::defaultPatterns();
    auto first = WorkbookScanner::scan(*workbook, patterns);
    auto second = WorkbookScanner::scan(*workbook, patterns);
    EXPECT_EQ(first, second);
}

// 0x80..0xFF 每个字面码点都会被找到
TEST_F(WorkbookScannerTest, EveryLatin1SupplementCodePointIsFound) {
    core::Workbook all("all.xlsx");
    auto sheet = all.addSheet("All");
    sheet->setCell(0, 0, core::Cell("Value"));
    for (int cp = 0x80; cp <= 0xFF; ++cp) {
        sheet->setCell(cp - 0x80 + 1, 0, core::Cell(unicode::toUtf8(static_cast<char32_t>(cp))));
    }

    auto findings = WorkbookScanner::scan(all, PatternSet::defaultPatterns());
    ASSERT_EQ(findings.size(), 128u);
    for (int cp = 0x80; cp <= 0xFF; ++cp) {
        const Finding& finding = findings[static_cast<size_t>(cp - 0x80)];
        EXPECT_EQ(finding.hexValue, fmt::format("0x{:02x}", cp));
        EXPECT_EQ(finding.row, cp - 0x80 + 2);
        EXPECT_EQ(finding.positions, std::vector<size_t>({0}));
    }
}

// 同一单元格中的字面字符与转义记号各算一条
TEST_F(WorkbookScannerTest, LiteralAndEscapeTokenGiveTwoFindings) {
    core::Workbook book("double.xlsx");
    auto sheet = book.addSheet("S");
    sheet->setCell(0, 0, core::Cell("Text"));
    sheet->setCell(1, 0, core::Cell("\xC3\xA9 vs \\xe9"));

    auto findings = WorkbookScanner::scan(book, PatternSet::defaultPatterns());
    ASSERT_EQ(findings.size(), 2u);
    EXPECT_EQ(findings[0].pattern, "\xC3\xA9");
    EXPECT_EQ(findings[0].hexValue, "0xe9");
    EXPECT_EQ(findings[1].pattern, "\\xe9");
    EXPECT_EQ(findings[1].hexValue, "\\xe9");
    EXPECT_EQ(findings[1].description, findings[0].description);
}

TEST_F(WorkbookScannerTest, SinglePatternScan) {
    auto patterns = PatternSet::single("\\xfc");
    ASSERT_TRUE(patterns.hasValue());
    auto findings = WorkbookScanner::scan(*workbook, patterns.value());
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].cellRef(), "B2");
}

TEST_F(WorkbookScannerTest, ScanFileUsesSource) {
    StubSource source(std::move(workbook));
    auto findings = WorkbookScanner::scanFile("book.xlsx", PatternSet::defaultPatterns(), source);
    ASSERT_TRUE(findings.hasValue());
    EXPECT_EQ(findings.value().size(), 4u);
    EXPECT_EQ(source.last_path, "book.xlsx");
}

// 打不开时返回错误，不产生 Finding
TEST_F(WorkbookScannerTest, ScanFileReportsOpenFailure) {
    StubSource source(core::makeError(core::ErrorCode::OpenFailure, "not a zip", "broken.xlsx"));
    auto findings = WorkbookScanner::scanFile("broken.xlsx", PatternSet::defaultPatterns(), source);
    ASSERT_TRUE(findings.hasError());
    EXPECT_EQ(findings.error().code, core::ErrorCode::OpenFailure);
}

}} // namespace cellscrub::scan
