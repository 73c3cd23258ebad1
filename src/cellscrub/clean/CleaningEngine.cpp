#include "cellscrub/clean/CleaningEngine.hpp"
#include "cellscrub/scan/PatternSet.hpp"
#include "cellscrub/core/ArtifactNaming.hpp"
#include "cellscrub/utils/ColumnReferenceUtils.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include "cellscrub/utils/TimeUtils.hpp"
#include <algorithm>
#include <utility>

namespace cellscrub {
namespace clean {

const char* toString(Action action) noexcept {
    switch (action) {
        case Action::DeleteOne:                    return "DeleteOne";
        case Action::ReplaceOne:                   return "ReplaceOne";
        case Action::SkipCell:                     return "SkipCell";
        case Action::SkipAll:                      return "SkipAll";
        case Action::DeletePatternEverywhere:      return "DeletePatternEverywhere";
        case Action::ReplacePatternEverywhere:     return "ReplacePatternEverywhere";
        case Action::DeleteAllPatternsEverywhere:  return "DeleteAllPatternsEverywhere";
        case Action::ReplaceAllPatternsEverywhere: return "ReplaceAllPatternsEverywhere";
        default:                                   return "Unknown";
    }
}

bool isEverywhere(Action action) noexcept {
    return action == Action::DeletePatternEverywhere ||
           action == Action::ReplacePatternEverywhere ||
           action == Action::DeleteAllPatternsEverywhere ||
           action == Action::ReplaceAllPatternsEverywhere;
}

const char* toString(StopReason reason) noexcept {
    switch (reason) {
        case StopReason::Exhausted:  return "Exhausted";
        case StopReason::SkippedAll: return "SkippedAll";
        case StopReason::Everywhere: return "Everywhere";
        default:                     return "Unknown";
    }
}

size_t CleaningEngine::applyEverywhere(core::Workbook& workbook, ChangeLog& log,
                                       const std::function<std::string(const std::string&)>& transform) {
    size_t modified = 0;
    for (size_t index = 0; index < workbook.getSheetCount(); ++index) {
        auto sheet = workbook.getSheet(index);
        if (!sheet) continue;

        size_t sheet_modified = 0;
        for (auto& [row, cells] : sheet->rows()) {
            for (auto& [col, cell] : cells) {
                if (!cell.isString() || cell.getStringValue().empty()) continue;

                const std::string original = cell.getStringValue();
                std::string updated = transform(original);
                if (updated == original) continue;

                std::string ref = utils::ColumnReferenceUtils::makeCellRef(
                    static_cast<uint32_t>(col + 1), static_cast<uint32_t>(row + 1));
                cell.setStringValue(updated);
                log.record(sheet->getName(), ref, original, updated);
                ++sheet_modified;
            }
        }

        if (sheet_modified > 0) {
            CLEAN_INFO("Modified {} cell(s) in sheet '{}'", sheet_modified, sheet->getName());
        }
        modified += sheet_modified;
    }
    return modified;
}

CleaningOutcome CleaningEngine::run(core::Workbook& workbook,
                                    const std::vector<scan::Finding>& findings,
                                    const DecideFn& decide) {
    CleaningOutcome outcome;
    if (findings.empty()) {
        return outcome;
    }

    const PatternUnion all_patterns = PatternUnion::fromFindings(findings);
    CLEAN_DEBUG("Pattern union holds {} character(s), {} undecodable",
                all_patterns.size(), all_patterns.undecodableCount());

    // 按工作表首次出现顺序分组
    std::vector<std::pair<std::string, std::vector<size_t>>> groups;
    for (size_t i = 0; i < findings.size(); ++i) {
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const auto& group) { return group.first == findings[i].sheet; });
        if (it == groups.end()) {
            groups.emplace_back(findings[i].sheet, std::vector<size_t>{i});
        } else {
            it->second.push_back(i);
        }
    }

    const size_t total = findings.size();
    size_t position = 0;

    for (const auto& [sheet_name, members] : groups) {
        auto sheet = workbook.getSheet(sheet_name);
        if (!sheet) {
            CELLSCRUB_HANDLE_WARNING(fmt::format("Sheet '{}' not found in the workbook, skipping {} finding(s)",
                                                 sheet_name, members.size()),
                                     core::toString(core::ErrorCode::MissingSheet));
            ++outcome.warnings;
            outcome.skipped += members.size();
            position += members.size();
            continue;
        }

        for (size_t member : members) {
            const scan::Finding& finding = findings[member];
            ++position;

            const std::string ref = finding.cellRef();
            core::Cell* cell = sheet->findCell(ref);
            if (!cell || !cell->isString() || cell->getStringValue().empty()) {
                CELLSCRUB_HANDLE_WARNING(fmt::format("Cell {} in sheet '{}' is empty or not text, skipping",
                                                     ref, sheet_name),
                                         core::toString(core::ErrorCode::MissingCell));
                ++outcome.warnings;
                ++outcome.skipped;
                continue;
            }

            const std::string live = cell->getStringValue();
            Decision decision = decide(finding, CleaningContext{live, position, total});
            ++outcome.decisions;
            CLEAN_DEBUG("{}!{}: {}", sheet_name, ref, toString(decision.action));

            switch (decision.action) {
                case Action::SkipCell:
                    ++outcome.skipped;
                    continue;

                case Action::SkipAll:
                    CLEAN_INFO("Skipping all remaining cells at finding {}/{}", position, total);
                    outcome.stopReason = StopReason::SkippedAll;
                    outcome.skipped += total - position + 1;
                    return outcome;

                case Action::DeleteAllPatternsEverywhere:
                case Action::ReplaceAllPatternsEverywhere: {
                    const std::string replacement =
                        decision.action == Action::DeleteAllPatternsEverywhere ? std::string() : decision.replacement;
                    size_t modified = applyEverywhere(workbook, outcome.changeLog,
                        [&](const std::string& text) { return all_patterns.apply(text, replacement); });
                    CLEAN_INFO("{} over {} character(s): {} cell(s) modified",
                               toString(decision.action), all_patterns.size(), modified);
                    ++outcome.applied;
                    outcome.stopReason = StopReason::Everywhere;
                    return outcome;
                }

                default:
                    break;
            }

            // 其余动作都需要先解码模式
            auto decoded = scan::PatternSet::decodedText(scan::Pattern(finding.pattern));
            if (!decoded) {
                CELLSCRUB_HANDLE_WARNING(fmt::format("Could not decode pattern '{}' for {}!{}, skipping",
                                                     finding.pattern, sheet_name, ref),
                                         decoded.error().fullMessage());
                ++outcome.warnings;
                ++outcome.skipped;
                continue;
            }
            const std::string& target = decoded.value();

            if (decision.action == Action::DeletePatternEverywhere ||
                decision.action == Action::ReplacePatternEverywhere) {
                const std::string replacement =
                    decision.action == Action::DeletePatternEverywhere ? std::string() : decision.replacement;
                size_t modified = applyEverywhere(workbook, outcome.changeLog,
                    [&](const std::string& text) { return replaceAll(text, target, replacement); });
                CLEAN_INFO("{} for {}: {} cell(s) modified", toString(decision.action), finding.hexValue, modified);
                ++outcome.applied;
                outcome.stopReason = StopReason::Everywhere;
                return outcome;
            }

            // DeleteOne / ReplaceOne
            const std::string replacement =
                decision.action == Action::DeleteOne ? std::string() : decision.replacement;
            std::string updated = replaceAll(live, target, replacement);
            ++outcome.applied;
            if (updated != live) {
                cell->setStringValue(updated);
                outcome.changeLog.record(sheet_name, ref, live, updated);
            }
        }
    }

    outcome.stopReason = StopReason::Exhausted;
    CLEAN_INFO("Cleaning finished: {} decision(s), {} cell(s) changed, {} warning(s)",
               outcome.decisions, outcome.changeLog.size(), outcome.warnings);
    return outcome;
}

core::Result<PersistResult> CleaningEngine::persist(const CleaningOutcome& outcome,
                                                    const core::Workbook& workbook,
                                                    const std::string& source_path,
                                                    IWorkbookSink& sink,
                                                    IChangeLogSink& log_sink) {
    PersistResult result;
    result.workbookPath = source_path;

    if (!outcome.hasChanges()) {
        CLEAN_INFO("No changes were made; nothing written");
        return result;
    }

    const std::tm now = utils::TimeUtils::getCurrentTime();
    const std::string target = core::ArtifactNaming::timestamped(source_path, core::ArtifactNaming::kCleaned, ".xlsx", now);

    auto written = sink.write(workbook, outcome.changeLog, source_path, target);
    if (!written) {
        CLEAN_ERROR("Failed to write cleaned workbook '{}': {}", target, written.error().fullMessage());
        return written.error();
    }
    result.workbookPath = target;
    result.written = true;
    CLEAN_INFO("Saved cleaned file as: {}", target);

    const std::string log_path =
        core::ArtifactNaming::timestamped(source_path, core::ArtifactNaming::kCleaningLog, ".txt", now);
    auto logged = log_sink.writeLog(outcome.changeLog, source_path, log_path);
    if (logged) {
        result.logPath = log_path;
    } else {
        CLEAN_WARN("Cleaning log not written: {}", logged.error().fullMessage());
        result.logError = logged.error();
    }

    return result;
}

}} // namespace cellscrub::clean
