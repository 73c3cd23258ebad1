// CellScrub - 工作簿问题字符扫描与清理
// 组件：清理状态机测试
//
// 决策通过脚本化的 DecideFn 注入，写出目标使用内存中的假实现。

#include "cellscrub/clean/CleaningEngine.hpp"
#include "cellscrub/scan/WorkbookScanner.hpp"
#include "cellscrub/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace cellscrub {
namespace clean {

namespace {

// 按顺序返回预设决策，并记录每次询问
class ScriptedDecider {
public:
    explicit ScriptedDecider(std::vector<Decision> script) : script_(script.begin(), script.end()) {}

    Decision operator()(const scan::Finding& finding, const CleaningContext& context) {
        asked.push_back(finding.sheet + "!" + finding.cellRef());
        live_values.push_back(context.liveValue);
        if (script_.empty()) {
            return Decision::of(Action::SkipCell);
        }
        Decision next = script_.front();
        script_.pop_front();
        return next;
    }

    std::vector<std::string> asked;
    std::vector<std::string> live_values;

private:
    std::deque<Decision> script_;
};

class MemorySink : public IWorkbookSink {
public:
    core::VoidResult write(const core::Workbook&, const ChangeLog& changes,
                           const std::string& source_path, const std::string& target_path) override {
        ++writes;
        last_source = source_path;
        last_target = target_path;
        last_changes = changes.size();
        if (fail) {
            return core::makeError(core::ErrorCode::FileWriteError, "disk full", target_path);
        }
        return core::ok();
    }

    int writes = 0;
    bool fail = false;
    std::string last_source;
    std::string last_target;
    size_t last_changes = 0;
};

class MemoryLogSink : public IChangeLogSink {
public:
    core::VoidResult writeLog(const ChangeLog&, const std::string&, const std::string& log_path) override {
        ++writes;
        last_path = log_path;
        if (fail) {
            return core::makeError(core::ErrorCode::EncodingFailure, "cannot encode", "ascii");
        }
        return core::ok();
    }

    int writes = 0;
    bool fail = false;
    std::string last_path;
};

} // namespace

class CleaningEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/CleaningEngine_test.log", Logger::Level::DEBUG, false);
    }

    static std::unique_ptr<core::Workbook> singleCell(const std::string& value) {
        auto workbook = std::make_unique<core::Workbook>("data/book.xlsx");
        auto sheet = workbook->addSheet("Sheet1");
        sheet->setCell(0, 0, core::Cell("Header"));
        sheet->setCell(1, 0, core::Cell(value));
        return workbook;
    }

    static std::vector<scan::Finding> scanAll(const core::Workbook& workbook) {
        return scan::WorkbookScanner::scan(workbook, scan::PatternSet::defaultPatterns());
    }

    static std::string textAt(core::Workbook& workbook, const std::string& sheet, const std::string& ref) {
        const core::Cell* cell = workbook.getSheet(sheet)->findCell(ref);
        return cell ? cell->getStringValue() : std::string("<missing>");
    }
};

// "héllo" 删除 é 得到 "hllo"
TEST_F(CleaningEngineTest, DeleteOneRemovesTheCharacter) {
    auto workbook = singleCell("h\xC3\xA9llo");
    auto findings = scanAll(*workbook);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].positions, std::vector<size_t>({1}));

    ScriptedDecider decider({Decision::of(Action::DeleteOne)});
    CleaningOutcome outcome = CleaningEngine::run(*workbook, findings, std::ref(decider));

    EXPECT_EQ(textAt(*workbook, "Sheet1", "A2"), "hllo");
    ASSERT_EQ(outcome.changeLog.size(), 1u);
    const ChangeRecord& record = outcome.changeLog.records()[0];
    EXPECT_EQ(record.sheet, "Sheet1");
    EXPECT_EQ(record.cellRef, "A2");
    EXPECT_EQ(record.originalValue, "h\xC3\xA9llo");
    EXPECT_EQ(record.newValue, "hllo");
    EXPECT_EQ(outcome.stopReason, StopReason::Exhausted);
    EXPECT_EQ(outcome.applied, 1u);
}

TEST_F(CleaningEngineTest, ReplaceOneReplacesEveryOccurrenceInTheCell) {
    auto workbook = singleCell("\xC3\xA9t\xC3\xA9");
    auto findings = scanAll(*workbook);
    ASSERT_EQ(findings.size(), 1u);

    ScriptedDecider decider({Decision::of(Action::ReplaceOne, "e")});
    CleaningOutcome outcome = CleaningEngine::run(*workbook, findings, std::ref(decider));

    EXPECT_EQ(textAt(*workbook, "Sheet1", "A2"), "ete");
    EXPECT_EQ(outcome.changeLog.size(), 1u);
}

// 转义记号模式先解码，再作用于真实字符
TEST_F(CleaningEngineTest, EscapeTokenFindingTargetsDecodedCharacter) {
    auto workbook = singleCell("a\\xe9b\xC3\xA9");
    std::vector<scan::Finding> findings = scanAll(*workbook);
    ASSERT_EQ(findings.size(), 2u);
    ASSERT_EQ(findings[1].pattern, "\\xe9");

    ScriptedDecider decider({Decision::of(Action::SkipCell), Decision::of(Action::DeleteOne)});
    CleaningOutcome outcome = CleaningEngine::run(*workbook, findings, std::ref(decider));

    EXPECT_EQ(textAt(*workbook, "Sheet1", "A2"), "a\\xe9b");
    EXPECT_EQ(outcome.changeLog.size(), 1u);
    EXPECT_EQ(outcome.skipped, 1u);
}

TEST_F(CleaningEngineTest, SkipCellLeavesWorkbookUnchanged) {
    auto workbook = singleCell("caf\xC3\xA9");
    auto findings = scanAll(*workbook);

    ScriptedDecider decider({Decision::of(Action::SkipCell)});
    CleaningOutcome outcome = CleaningEngine::run(*workbook, findings, std::ref(decider));

    EXPECT_FALSE(outcome.hasChanges());
    EXPECT_EQ(outcome.skipped, 1u);
    EXPECT_EQ(textAt(*workbook, "Sheet1", "A2"), "caf\xC3\xA9");
}

// 第一条就跳过全部：无记录、不写工作簿
TEST_F(CleaningEngineTest, SkipAllAfterFirstFindingWritesNothing) {
    auto workbook = std::make_unique<core::Workbook>("data/book.xlsx");
    auto sheet = workbook->addSheet("Sheet1");
    sheet->setCell(0, 0, core::Cell("Header"));
    for (int row = 1; row <= 5; ++row) {
        sheet->setCell(row, 0, core::Cell("r\xC3\xA9sum\xC3\xA9"));
    }
    auto findings = scanAll(*workbook);
    ASSERT_EQ(findings.size(), 5u);

    ScriptedDecider decider({Decision::of(Action::SkipAll), Decision::of(Action::DeleteOne)});
    CleaningOutcome outcome = CleaningEngine::run(*workbook, findings, std::ref(decider));

    EXPECT_EQ(decider.asked.size(), 1u);
    EXPECT_TRUE(outcome.changeLog.empty());
    EXPECT_EQ(outcome.stopReason, StopReason::SkippedAll);
    EXPECT_EQ(outcome.skipped, 5u);

    MemorySink sink;
    MemoryLogSink log_sink;
    auto persisted = CleaningEngine::persist(outcome, *workbook, "data/book.xlsx", sink, log_sink);
    ASSERT_TRUE(persisted.hasValue());
    EXPECT_FALSE(persisted.value().written);
    EXPECT_EQ(persisted.value().workbookPath, "data/book.xlsx");
    EXPECT_EQ(sink.writes, 0);
    EXPECT_EQ(log_sink.writes, 0);
}

// 选项 8：两个工作表中的 "café" 都变成 "caf?"，包括表头行
TEST_F(CleaningEngineTest, ReplaceAllPatternsEverywhereCoversAllSheets) {
    core::Workbook workbook("book.xlsx");
    workbook.addSheet("Sheet1")->setCell(0, 0, core::Cell("caf\xC3\xA9"));
    workbook.addSheet("Sheet2")->setCell(2, 1, core::Cell("caf\xC3\xA9"));

    auto findings = scanAll(workbook);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].sheet, "Sheet2");

    ScriptedDecider decider({Decision::of(Action::ReplaceAllPatternsEverywhere, "?")});
    CleaningOutcome outcome = CleaningEngine::run(workbook, findings, std::ref(decider));

    EXPECT_EQ(textAt(workbook, "Sheet1", "A1"), "caf?");
    EXPECT_EQ(textAt(workbook, "Sheet2", "B3"), "caf?");
    ASSERT_EQ(outcome.changeLog.size(), 2u);
    EXPECT_EQ(outcome.changeLog.records()[0].cellRef, "A1");
    EXPECT_EQ(outcome.changeLog.records()[1].cellRef, "B3");
    EXPECT_EQ(outcome.stopReason, StopReason::Everywhere);
}

// "-everywhere" 动作执行后不再询问
TEST_F(CleaningEngineTest, EverywhereActionsAreTerminal) {
    core::Workbook workbook("book.xlsx");
    auto sheet = workbook.addSheet("S");
    sheet->setCell(0, 0, core::Cell("H"));
    sheet->setCell(1, 0, core::Cell("\xC3\xA9\xC3\xBC"));
    sheet->setCell(2, 0, core::Cell("\xC3\xBC\xC3\xA9"));
    sheet->setCell(3, 0, core::Cell(12.0));

    auto findings = scanAll(workbook);
    ASSERT_EQ(findings.size(), 4u);

    ScriptedDecider decider({Decision::of(Action::DeletePatternEverywhere), Decision::of(Action::DeleteOne)});
    CleaningOutcome outcome = CleaningEngine::run(workbook, findings, std::ref(decider));

    EXPECT_EQ(decider.asked.size(), 1u);
    EXPECT_EQ(textAt(workbook, "S", "A2"), "\xC3\xBC");
    EXPECT_EQ(textAt(workbook, "S", "A3"), "\xC3\xBC");
    EXPECT_EQ(outcome.changeLog.size(), 2u);
    EXPECT_EQ(outcome.stopReason, StopReason::Everywhere);
}

TEST_F(CleaningEngineTest, ReplacePatternEverywhereAndDeleteAllPatterns) {
    core::Workbook first("book.xlsx");
    auto s1 = first.addSheet("S");
    s1->setCell(0, 0, core::Cell("\xC3\xA9"));
    s1->setCell(1, 0, core::Cell("\xC3\xA9\xC3\xBC"));

    auto findings = scanAll(first);
    ScriptedDecider replace({Decision::of(Action::ReplacePatternEverywhere, "e")});
    CleaningEngine::run(first, findings, std::ref(replace));
    EXPECT_EQ(textAt(first, "S", "A1"), "e");
    EXPECT_EQ(textAt(first, "S", "A2"), "e\xC3\xBC");

    core::Workbook second("book.xlsx");
    auto s2 = second.addSheet("S");
    s2->setCell(0, 0, core::Cell("H"));
    s2->setCell(1, 0, core::Cell("\xC3\xA9-\xC3\xBC-\xC2\xA0"));
    findings = scanAll(second);
    ScriptedDecider wipe({Decision::of(Action::DeleteAllPatternsEverywhere)});
    CleaningOutcome outcome = CleaningEngine::run(second, findings, std::ref(wipe));
    EXPECT_EQ(textAt(second, "S", "A2"), "--");
    EXPECT_EQ(outcome.changeLog.size(), 1u);
}

// 同一单元格的第二条 Finding 看到的是修改后的值
TEST_F(CleaningEngineTest, DecisionsSeeLiveCellValue) {
    auto workbook = singleCell("\xC3\xA9\xC3\xBC!");
    auto findings = scanAll(*workbook);
    ASSERT_EQ(findings.size(), 2u);

    ScriptedDecider decider({Decision::of(Action::DeleteOne), Decision::of(Action::ReplaceOne, "u")});
    CleaningOutcome outcome = CleaningEngine::run(*workbook, findings, std::ref(decider));

    ASSERT_EQ(decider.live_values.size(), 2u);
    EXPECT_EQ(decider.live_values[0], "\xC3\xA9\xC3\xBC!");
    EXPECT_EQ(decider.live_values[1], "\xC3\xBC!");
    EXPECT_EQ(textAt(*workbook, "Sheet1", "A2"), "u!");

    ASSERT_EQ(outcome.changeLog.size(), 1u);
    EXPECT_EQ(outcome.changeLog.records()[0].originalValue, "\xC3\xA9\xC3\xBC!");
    EXPECT_EQ(outcome.changeLog.records()[0].newValue, "u!");
}

// 按工作表首次出现顺序分组询问
TEST_F(CleaningEngineTest, FindingsAreGroupedBySheet) {
    core::Workbook workbook("book.xlsx");
    workbook.addSheet("A")->setCell(1, 0, core::Cell("\xC3\xA9"));
    workbook.addSheet("B")->setCell(1, 0, core::Cell("\xC3\xA9"));
    workbook.getSheet("A")->setCell(2, 0, core::Cell("\xC3\xA9"));

    auto scanned = scanAll(workbook);
    ASSERT_EQ(scanned.size(), 3u);
    std::vector<scan::Finding> interleaved = {scanned[0], scanned[2], scanned[1]};

    ScriptedDecider decider(std::vector<Decision>{});
    CleaningEngine::run(workbook, interleaved, std::ref(decider));

    ASSERT_EQ(decider.asked.size(), 3u);
    EXPECT_EQ(decider.asked[0], "A!A2");
    EXPECT_EQ(decider.asked[1], "A!A3");
    EXPECT_EQ(decider.asked[2], "B!A2");
}

// 缺失的工作表和单元格只产生告警
TEST_F(CleaningEngineTest, MissingSheetsAndCellsAreWarnings) {
    auto workbook = singleCell("caf\xC3\xA9");
    auto findings = scanAll(*workbook);
    ASSERT_EQ(findings.size(), 1u);

    scan::Finding ghost_sheet = findings[0];
    ghost_sheet.sheet = "Gone";
    scan::Finding ghost_cell = findings[0];
    ghost_cell.row = 40;

    std::vector<scan::Finding> all = {ghost_sheet, ghost_cell, findings[0]};
    ScriptedDecider decider({Decision::of(Action::DeleteOne)});
    CleaningOutcome outcome = CleaningEngine::run(*workbook, all, std::ref(decider));

    EXPECT_EQ(outcome.warnings, 2u);
    ASSERT_EQ(decider.asked.size(), 1u);
    EXPECT_EQ(decider.asked[0], "Sheet1!A2");
    EXPECT_EQ(textAt(*workbook, "Sheet1", "A2"), "caf");
}

TEST_F(CleaningEngineTest, UndecodablePatternIsSkipped) {
    auto workbook = singleCell("odd \\xZZ text");
    scan::Finding finding;
    finding.sheet = "Sheet1";
    finding.row = 2;
    finding.column = 1;
    finding.columnLetter = "A";
    finding.pattern = "\\xZZ";

    ScriptedDecider decider({Decision::of(Action::DeleteOne)});
    CleaningOutcome outcome = CleaningEngine::run(*workbook, {finding}, std::ref(decider));

    EXPECT_TRUE(outcome.changeLog.empty());
    EXPECT_EQ(outcome.warnings, 1u);
    EXPECT_EQ(textAt(*workbook, "Sheet1", "A2"), "odd \\xZZ text");
}

TEST_F(CleaningEngineTest, PersistWritesWorkbookAndLog) {
    auto workbook = singleCell("caf\xC3\xA9");
    auto findings = scanAll(*workbook);
    ScriptedDecider decider({Decision::of(Action::DeleteOne)});
    CleaningOutcome outcome = CleaningEngine::run(*workbook, findings, std::ref(decider));

    MemorySink sink;
    MemoryLogSink log_sink;
    auto persisted = CleaningEngine::persist(outcome, *workbook, "data/book.xlsx", sink, log_sink);
    ASSERT_TRUE(persisted.hasValue());

    EXPECT_TRUE(persisted.value().written);
    EXPECT_EQ(sink.writes, 1);
    EXPECT_EQ(sink.last_changes, 1u);
    EXPECT_EQ(sink.last_source, "data/book.xlsx");
    EXPECT_EQ(persisted.value().workbookPath, sink.last_target);
    EXPECT_EQ(sink.last_target.rfind("data/book_cleaned_", 0), 0u);
    EXPECT_EQ(sink.last_target.substr(sink.last_target.size() - 5), ".xlsx");

    EXPECT_EQ(log_sink.writes, 1);
    EXPECT_EQ(persisted.value().logPath, log_sink.last_path);
    EXPECT_NE(log_sink.last_path.find("book_cleaning_log_"), std::string::npos);
}

// 日志失败不影响工作簿；工作簿失败则整体失败
TEST_F(CleaningEngineTest, PersistFailures) {
    auto workbook = singleCell("caf\xC3\xA9");
    auto findings = scanAll(*workbook);
    ScriptedDecider decider({Decision::of(Action::DeleteOne)});
    CleaningOutcome outcome = CleaningEngine::run(*workbook, findings, std::ref(decider));

    MemorySink sink;
    MemoryLogSink log_sink;
    log_sink.fail = true;
    auto persisted = CleaningEngine::persist(outcome, *workbook, "book.xlsx", sink, log_sink);
    ASSERT_TRUE(persisted.hasValue());
    EXPECT_TRUE(persisted.value().written);
    EXPECT_TRUE(persisted.value().logPath.empty());
    EXPECT_EQ(persisted.value().logError.code, core::ErrorCode::EncodingFailure);

    MemorySink failing;
    failing.fail = true;
    MemoryLogSink unused;
    auto failed = CleaningEngine::persist(outcome, *workbook, "book.xlsx", failing, unused);
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code, core::ErrorCode::FileWriteError);
    EXPECT_EQ(unused.writes, 0);
}

TEST_F(CleaningEngineTest, ActionNames) {
    EXPECT_STREQ(toString(Action::ReplaceAllPatternsEverywhere), "ReplaceAllPatternsEverywhere");
    EXPECT_STREQ(toString(StopReason::SkippedAll), "SkippedAll");
    EXPECT_TRUE(isEverywhere(Action::DeletePatternEverywhere));
    EXPECT_FALSE(isEverywhere(Action::ReplaceOne));
}

}} // namespace cellscrub::clean
