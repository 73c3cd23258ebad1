// CellScrub - 工作簿问题字符扫描与清理
// 组件：扫描-清理-保存 端到端测试

#include "XlsxFixture.hpp"
#include "cellscrub/archive/ZipReader.hpp"
#include "cellscrub/clean/CleaningEngine.hpp"
#include "cellscrub/reader/XLSXReader.hpp"
#include "cellscrub/report/ChangeLogWriter.hpp"
#include "cellscrub/scan/PatternSet.hpp"
#include "cellscrub/scan/WorkbookScanner.hpp"
#include "cellscrub/writer/XLSXPackageWriter.hpp"
#include "cellscrub/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <deque>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace cellscrub {

using clean::Action;
using clean::Decision;
using test::XlsxFixture;

class ScrubPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/ScrubPipeline_test.log", Logger::Level::DEBUG, false);
        test_dir_ = "cellscrub_pipeline_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        source_ = test_dir_ + "/book.xlsx";

        XlsxFixture fixture;
        size_t name = fixture.addSharedString("<t>Name</t>");
        size_t city = fixture.addSharedString("<t>City</t>");
        size_t jose = fixture.addSharedString("<t>Jos\xC3\xA9</t>");
        size_t plain = fixture.addSharedString("<t>plain</t>");

        fixture.addSheet("People",
            "<row r=\"1\">" + XlsxFixture::sharedCell("A1", name) + XlsxFixture::sharedCell("B1", city) + "</row>"
            "<row r=\"2\"><c r=\"A2\" s=\"3\" t=\"s\"><v>" + std::to_string(jose) + "</v></c>" +
            XlsxFixture::inlineCell("B2", "Z\xC3\xBCrich") + "</row>"
            "<row r=\"3\">" + XlsxFixture::numberCell("A3", "42") + XlsxFixture::sharedCell("B3", plain) + "</row>");
        fixture.addSheet("Notes",
            "<row r=\"1\">" + XlsxFixture::inlineCell("A1", "Note") + "</row>"
            "<row r=\"2\">" + XlsxFixture::inlineCell("A2", "na\xC3\xAFve caf\xC3\xA9") + "</row>");
        fixture.addPart("docProps/app.xml", "<Properties><Application>Test</Application></Properties>");
        fixture.addPart("xl/styles.xml", "<styleSheet/>");
        ASSERT_TRUE(fixture.save(source_));

        std::ifstream in(source_, std::ios::binary);
        std::ostringstream bytes;
        bytes << in.rdbuf();
        source_bytes_ = bytes.str();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::unique_ptr<core::Workbook> load(const std::string& path) {
        reader::XLSXReader reader;
        auto result = reader.load(path);
        EXPECT_TRUE(result.hasValue()) << (result.hasError() ? result.error().fullMessage() : "");
        if (!result.hasValue()) {
            return nullptr;
        }
        return std::move(result.value());
    }

    static std::string entry(archive::ZipReader& zip, const std::string& path) {
        std::string content;
        EXPECT_EQ(zip.extractFile(path, content), archive::ZipError::Ok) << path;
        return content;
    }

    std::string test_dir_;
    std::string source_;
    std::string source_bytes_;
};

TEST_F(ScrubPipelineTest, ScanFindsCellsInOrder) {
    auto workbook = load(source_);
    ASSERT_NE(workbook, nullptr);

    auto findings = scan::WorkbookScanner::scan(*workbook, scan::PatternSet::defaultPatterns());
    ASSERT_EQ(findings.size(), 4u);

    EXPECT_EQ(findings[0].sheet, "People");
    EXPECT_EQ(findings[0].cellRef(), "A2");
    EXPECT_EQ(findings[0].columnHeader, "Name");
    EXPECT_EQ(findings[0].hexValue, "0xe9");
    EXPECT_EQ(findings[1].cellRef(), "B2");
    EXPECT_EQ(findings[1].columnHeader, "City");
    EXPECT_EQ(findings[1].hexValue, "0xfc");

    // 同一单元格内按模式集合顺序：U+00E9 先于 U+00EF
    EXPECT_EQ(findings[2].sheet, "Notes");
    EXPECT_EQ(findings[2].hexValue, "0xe9");
    EXPECT_EQ(findings[2].positions, (std::vector<size_t>{9}));
    EXPECT_EQ(findings[3].hexValue, "0xef");
    EXPECT_EQ(findings[3].positions, (std::vector<size_t>{2}));
}

TEST_F(ScrubPipelineTest, CleansIntoNewPackage) {
    auto workbook = load(source_);
    ASSERT_NE(workbook, nullptr);
    auto findings = scan::WorkbookScanner::scan(*workbook, scan::PatternSet::defaultPatterns());
    ASSERT_EQ(findings.size(), 4u);

    std::deque<Decision> script = {
        Decision::of(Action::ReplaceOne, "e"),
        Decision::of(Action::SkipCell),
        Decision::of(Action::DeleteOne),
        Decision::of(Action::ReplaceOne, "i"),
    };
    std::vector<std::string> live_values;
    auto decide = [&](const scan::Finding&, const clean::CleaningContext& context) {
        live_values.push_back(context.liveValue);
        Decision next = script.front();
        script.pop_front();
        return next;
    };

    clean::CleaningOutcome outcome = clean::CleaningEngine::run(*workbook, findings, decide);
    EXPECT_EQ(outcome.stopReason, clean::StopReason::Exhausted);
    ASSERT_EQ(outcome.changeLog.size(), 2u);
    ASSERT_EQ(live_values.size(), 4u);
    // 第二次修改同一单元格时看到的是当前值
    EXPECT_EQ(live_values[3], "na\xC3\xAFve caf");

    const clean::ChangeRecord* notes = outcome.changeLog.find("Notes", "A2");
    ASSERT_NE(notes, nullptr);
    EXPECT_EQ(notes->originalValue, "na\xC3\xAFve caf\xC3\xA9");
    EXPECT_EQ(notes->newValue, "naive caf");

    writer::XLSXPackageWriter package_writer;
    report::ChangeLogWriter log_writer;
    auto persisted = clean::CleaningEngine::persist(outcome, *workbook, source_, package_writer, log_writer);
    ASSERT_TRUE(persisted.hasValue()) << persisted.error().fullMessage();
    const clean::PersistResult& result = persisted.value();

    EXPECT_TRUE(result.written);
    EXPECT_NE(result.workbookPath.find("book_cleaned_"), std::string::npos);
    EXPECT_NE(result.logPath.find("book_cleaning_log_"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(result.workbookPath));
    EXPECT_TRUE(std::filesystem::exists(result.logPath));
    EXPECT_EQ(package_writer.getPartsRewritten(), 2u);

    // 源文件不变
    {
        std::ifstream in(source_, std::ios::binary);
        std::ostringstream bytes;
        bytes << in.rdbuf();
        EXPECT_EQ(bytes.str(), source_bytes_);
    }

    auto cleaned = load(result.workbookPath);
    ASSERT_NE(cleaned, nullptr);
    EXPECT_EQ(cleaned->getSheetNames(), (std::vector<std::string>{"People", "Notes"}));
    auto people = cleaned->getSheet("People");
    ASSERT_NE(people, nullptr);
    ASSERT_NE(people->findCell("A2"), nullptr);
    EXPECT_EQ(people->findCell("A2")->getStringValue(), "Jose");
    ASSERT_NE(people->findCell("B2"), nullptr);
    EXPECT_EQ(people->findCell("B2")->getStringValue(), "Z\xC3\xBCrich");
    ASSERT_NE(people->findCell("A3"), nullptr);
    EXPECT_TRUE(people->findCell("A3")->isNumber());
    auto notes_sheet = cleaned->getSheet("Notes");
    ASSERT_NE(notes_sheet, nullptr);
    ASSERT_NE(notes_sheet->findCell("A2"), nullptr);
    EXPECT_EQ(notes_sheet->findCell("A2")->getStringValue(), "naive caf");

    // 再次扫描只剩跳过的单元格
    auto remaining = scan::WorkbookScanner::scan(*cleaned, scan::PatternSet::defaultPatterns());
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].cellRef(), "B2");
}

TEST_F(ScrubPipelineTest, UntouchedEntriesAreByteEqual) {
    auto workbook = load(source_);
    ASSERT_NE(workbook, nullptr);
    auto findings = scan::WorkbookScanner::scan(*workbook, scan::PatternSet::defaultPatterns());

    auto delete_first = [](const scan::Finding&, const clean::CleaningContext&) {
        return Decision::of(Action::DeleteOne);
    };
    ASSERT_FALSE(findings.empty());
    // 只处理 People 的第一个 Finding
    std::vector<scan::Finding> first(findings.begin(), findings.begin() + 1);
    clean::CleaningOutcome outcome = clean::CleaningEngine::run(*workbook, first, delete_first);
    ASSERT_EQ(outcome.changeLog.size(), 1u);

    writer::XLSXPackageWriter package_writer;
    report::ChangeLogWriter log_writer;
    auto persisted = clean::CleaningEngine::persist(outcome, *workbook, source_, package_writer, log_writer);
    ASSERT_TRUE(persisted.hasValue()) << persisted.error().fullMessage();

    archive::ZipReader original{core::Path(source_)};
    archive::ZipReader cleaned{core::Path(persisted.value().workbookPath)};
    ASSERT_TRUE(original.open());
    ASSERT_TRUE(cleaned.open());
    ASSERT_EQ(cleaned.listFiles(), original.listFiles());

    for (const auto& path : original.listFiles()) {
        if (path == "xl/worksheets/sheet1.xml") {
            continue;
        }
        EXPECT_EQ(entry(cleaned, path), entry(original, path)) << path;
    }

    // 改写的单元格保留样式并转为内联字符串
    const std::string sheet1 = entry(cleaned, "xl/worksheets/sheet1.xml");
    EXPECT_NE(sheet1.find("<c r=\"A2\" s=\"3\" t=\"inlineStr\"><is><t xml:space=\"preserve\">Jos</t></is></c>"),
              std::string::npos);
    EXPECT_NE(sheet1.find("<c r=\"B2\" t=\"inlineStr\"><is><t>Z\xC3\xBCrich</t></is></c>"), std::string::npos);
    EXPECT_NE(sheet1.find("<pageMargins"), std::string::npos);
}

TEST_F(ScrubPipelineTest, NoChangesWritesNothing) {
    auto workbook = load(source_);
    ASSERT_NE(workbook, nullptr);
    auto findings = scan::WorkbookScanner::scan(*workbook, scan::PatternSet::defaultPatterns());

    auto skip_all = [](const scan::Finding&, const clean::CleaningContext&) {
        return Decision::of(Action::SkipAll);
    };
    clean::CleaningOutcome outcome = clean::CleaningEngine::run(*workbook, findings, skip_all);
    EXPECT_EQ(outcome.stopReason, clean::StopReason::SkippedAll);
    EXPECT_FALSE(outcome.hasChanges());

    writer::XLSXPackageWriter package_writer;
    report::ChangeLogWriter log_writer;
    auto persisted = clean::CleaningEngine::persist(outcome, *workbook, source_, package_writer, log_writer);
    ASSERT_TRUE(persisted.hasValue());
    EXPECT_FALSE(persisted.value().written);
    EXPECT_EQ(persisted.value().workbookPath, source_);

    size_t files = 0;
    for (const auto& item : std::filesystem::directory_iterator(test_dir_)) {
        (void)item;
        files++;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(ScrubPipelineTest, EverywhereActionCoversHeaderRow) {
    XlsxFixture fixture;
    fixture.addSheet("S",
        "<row r=\"1\">" + XlsxFixture::inlineCell("A1", "\xC3\xA9t\xC3\xA9") + "</row>"
        "<row r=\"2\">" + XlsxFixture::inlineCell("A2", "caf\xC3\xA9") + XlsxFixture::inlineCell("B2", "\xC2\xB0" "C") + "</row>");
    const std::string path = test_dir_ + "/header.xlsx";
    ASSERT_TRUE(fixture.save(path));

    auto workbook = load(path);
    ASSERT_NE(workbook, nullptr);
    auto findings = scan::WorkbookScanner::scan(*workbook, scan::PatternSet::defaultPatterns());
    ASSERT_EQ(findings.size(), 2u);

    auto delete_everywhere = [](const scan::Finding&, const clean::CleaningContext&) {
        return Decision::of(Action::DeletePatternEverywhere);
    };
    clean::CleaningOutcome outcome = clean::CleaningEngine::run(*workbook, findings, delete_everywhere);
    EXPECT_EQ(outcome.stopReason, clean::StopReason::Everywhere);
    EXPECT_EQ(outcome.decisions, 1u);

    auto sheet = workbook->getSheet("S");
    ASSERT_NE(sheet, nullptr);
    EXPECT_EQ(sheet->findCell("A1")->getStringValue(), "t");
    EXPECT_EQ(sheet->findCell("A2")->getStringValue(), "caf");
    // 其他字符不受影响
    EXPECT_EQ(sheet->findCell("B2")->getStringValue(), "\xC2\xB0" "C");
}

} // namespace cellscrub
