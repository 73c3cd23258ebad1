#pragma once

#include "cellscrub/clean/ChangeLog.hpp"
#include "cellscrub/clean/PatternUnion.hpp"
#include "cellscrub/scan/Finding.hpp"
#include "cellscrub/core/Workbook.hpp"
#include "cellscrub/core/Expected.hpp"
#include <functional>
#include <string>
#include <vector>

namespace cellscrub {
namespace clean {

enum class Action {
    DeleteOne,                     // 1. 删除本单元格中的该字符
    ReplaceOne,                    // 2. 替换本单元格中的该字符
    SkipCell,                      // 3. 跳过本单元格
    SkipAll,                       // 4. 跳过剩余全部
    DeletePatternEverywhere,       // 5. 所有单元格中删除该字符
    ReplacePatternEverywhere,      // 6. 所有单元格中替换该字符
    DeleteAllPatternsEverywhere,   // 7. 所有单元格中删除全部问题字符
    ReplaceAllPatternsEverywhere   // 8. 所有单元格中替换全部问题字符
};

const char* toString(Action action) noexcept;

/**
 * @brief "-everywhere" 动作：作用于所有工作表，成功解码后结束清理
 */
bool isEverywhere(Action action) noexcept;

struct Decision {
    Action action = Action::SkipCell;
    std::string replacement;

    static Decision of(Action action, const std::string& replacement = "") {
        return Decision{action, replacement};
    }
};

/**
 * @brief 询问决策时提供的上下文
 */
struct CleaningContext {
    std::string liveValue;  // 单元格当前值
    size_t index = 0;       // 当前 Finding 序号（1-based）
    size_t total = 0;
};

using DecideFn = std::function<Decision(const scan::Finding&, const CleaningContext&)>;

enum class StopReason {
    Exhausted,    // 所有 Finding 都已处理
    SkippedAll,   // 用户选择跳过剩余全部
    Everywhere    // 执行了 "-everywhere" 动作
};

const char* toString(StopReason reason) noexcept;

struct CleaningOutcome {
    ChangeLog changeLog;
    StopReason stopReason = StopReason::Exhausted;
    size_t decisions = 0;   // 询问次数
    size_t applied = 0;     // 执行的修改动作
    size_t skipped = 0;     // 跳过的 Finding
    size_t warnings = 0;    // 缺失工作表/单元格、解码失败

    bool hasChanges() const { return !changeLog.empty(); }
};

/**
 * @brief 清理后工作簿的写出目标
 */
class IWorkbookSink {
public:
    virtual ~IWorkbookSink() = default;

    /**
     * @brief 写出新文件；只需改写 changes 中列出的单元格。失败时不得留下半成品
     */
    virtual core::VoidResult write(const core::Workbook& workbook, const ChangeLog& changes,
                                   const std::string& source_path, const std::string& target_path) = 0;
};

/**
 * @brief 清理日志的写出目标
 */
class IChangeLogSink {
public:
    virtual ~IChangeLogSink() = default;

    virtual core::VoidResult writeLog(const ChangeLog& changes, const std::string& source_path,
                                      const std::string& log_path) = 0;
};

struct PersistResult {
    std::string workbookPath;   // 新文件路径；无变更时为源文件路径
    std::string logPath;        // 日志写出成功时的路径
    bool written = false;
    core::Error logError;       // 日志写出失败原因（不影响工作簿）
};

/**
 * @brief 清理状态机
 *
 * Finding 按工作表首次出现顺序分组，组内按原顺序逐条询问 DecideFn 并执行。
 * 目标单元格按 (sheet, cellRef) 实时定位，Finding 中的 cellValue 只用于展示。
 * 缺失的工作表、单元格以及解码失败都只记告警并跳过。
 */
class CleaningEngine {
public:
    static CleaningOutcome run(core::Workbook& workbook,
                               const std::vector<scan::Finding>& findings,
                               const DecideFn& decide);

    /**
     * @brief 有变更时写出 <主干>_cleaned_<时间戳>.xlsx 与清理日志，返回新路径；
     *        无变更时什么都不写，返回源路径
     */
    static core::Result<PersistResult> persist(const CleaningOutcome& outcome,
                                               const core::Workbook& workbook,
                                               const std::string& source_path,
                                               IWorkbookSink& sink,
                                               IChangeLogSink& log_sink);

    /**
     * @brief 对所有工作表的所有非空字符串单元格应用 transform，记录变化
     * @return 被修改的单元格数
     */
    static size_t applyEverywhere(core::Workbook& workbook, ChangeLog& log,
                                  const std::function<std::string(const std::string&)>& transform);
};

}} // namespace cellscrub::clean
