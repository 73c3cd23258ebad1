#include "cellscrub/app/ScrubSession.hpp"
#include "cellscrub/app/InteractiveDecider.hpp"
#include "cellscrub/core/ArtifactNaming.hpp"
#include "cellscrub/core/Path.hpp"
#include "cellscrub/reader/XLSXReader.hpp"
#include "cellscrub/report/ChangeLogWriter.hpp"
#include "cellscrub/report/FindingsReportWriter.hpp"
#include "cellscrub/report/RecordsCsvWriter.hpp"
#include "cellscrub/report/ReportText.hpp"
#include "cellscrub/scan/WorkbookScanner.hpp"
#include "cellscrub/utils/Logger.hpp"
#include "cellscrub/utils/TimeUtils.hpp"
#include "cellscrub/writer/XLSXPackageWriter.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <functional>
#include <istream>
#include <ostream>

namespace cellscrub {
namespace app {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

ScrubSession::ScrubSession(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
}

bool ScrubSession::readLine(std::string& line) {
    if (!std::getline(in_, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool ScrubSession::promptForInput(ScrubOptions& options) {
    out_ << "No file specified via command line.\n";
    out_ << "Enter the path to the Excel file: " << std::flush;

    std::string line;
    if (!readLine(line) || trim(line).empty()) {
        out_ << "No file selected. Exiting.\n";
        return false;
    }
    options.input_path = trim(line);

    if (options.pattern.empty()) {
        out_ << "\nDo you want to scan for specific characters? (Leave blank to scan for all)\n";
        out_ << "Enter character or escape sequence (e.g., \\x81): " << std::flush;
        if (readLine(line)) {
            options.pattern = trim(line);
        }
    }
    return true;
}

int ScrubSession::run(ScrubOptions options) {
    summary_ = SessionSummary();

    if (options.input_path.empty() && !promptForInput(options)) {
        return kExitOk;
    }

    const std::string& path = options.input_path;
    if (!core::Path(path).exists()) {
        out_ << fmt::format("Error: File '{}' not found.\n", path);
        CELLSCRUB_LOG_ERROR("Input file not found: {}", path);
        return kExitIoFailure;
    }

    scan::PatternSet patterns;
    if (options.hasPattern()) {
        auto single = scan::PatternSet::single(options.pattern);
        if (!single) {
            out_ << fmt::format("Error: Invalid character or escape sequence '{}': {}\n",
                                options.pattern, single.error().fullMessage());
            CELLSCRUB_LOG_ERROR("Invalid target pattern '{}': {}", options.pattern, single.error().fullMessage());
            return kExitUsage;
        }
        patterns = std::move(single).value();
    } else {
        patterns = scan::PatternSet::defaultPatterns();
    }
    CELLSCRUB_LOG_INFO("Scanning '{}' for {} pattern(s)", path, patterns.size());

    reader::XLSXReader reader;
    auto loaded = reader.load(path);
    if (!loaded) {
        out_ << fmt::format("Error reading Excel file: {}\n", loaded.error().fullMessage());
        CELLSCRUB_LOG_ERROR("Failed to open workbook '{}': {}", path, loaded.error().fullMessage());
        return kExitIoFailure;
    }
    std::unique_ptr<core::Workbook> workbook = std::move(loaded).value();

    const std::vector<scan::Finding> findings = scan::WorkbookScanner::scan(*workbook, patterns);
    summary_.findings = findings.size();

    if (findings.empty()) {
        out_ << fmt::format("No problematic characters found in '{}'.\n", path);
        return kExitOk;
    }

    printFindings(findings);
    writeRecords(path, findings);
    if (options.write_report) {
        writeReport(options, findings);
    }

    if (!confirmCleaning(options)) {
        out_ << "No cleaning performed. You can manually edit the file using the scan results.\n";
        return kExitOk;
    }
    return cleanWorkbook(options, *workbook, findings);
}

void ScrubSession::printFindings(const std::vector<scan::Finding>& findings) {
    out_ << fmt::format("\nFound {} instances of problematic characters:\n", findings.size());
    out_ << report::ReportText::separator();
    for (const auto& finding : findings) {
        out_ << report::ReportText::findingBlock(finding);
        out_ << report::ReportText::separator();
    }
}

void ScrubSession::writeRecords(const std::string& source_path, const std::vector<scan::Finding>& findings) {
    const std::string csv_path = core::ArtifactNaming::timestamped(
        source_path, core::ArtifactNaming::kScanResults, ".csv");
    auto written = report::RecordsCsvWriter::write(csv_path, findings);
    if (!written) {
        out_ << fmt::format("Error saving results to CSV: {}\n", written.error().fullMessage());
        return;
    }
    summary_.csv_path = csv_path;
    out_ << fmt::format("Results saved to {}\n", csv_path);
}

void ScrubSession::writeReport(const ScrubOptions& options, const std::vector<scan::Finding>& findings) {
    const std::tm now = utils::TimeUtils::getCurrentTime();
    const std::string report_path = core::ArtifactNaming::timestamped(
        options.input_path, core::ArtifactNaming::kFindingsReport, ".txt", now);

    report::FindingsReportWriter writer(options.report_encoding);
    auto written = writer.write(options.input_path, findings, report_path, now);
    if (written) {
        summary_.report_path = report_path;
        out_ << fmt::format("Detailed findings report saved to: {}\n", report_path);
        return;
    }

    out_ << fmt::format("Error saving findings to text file: {}\n", written.error().fullMessage());
    if (written.error().code == core::ErrorCode::EncodingFailure) {
        printEncodingHints(writer.getHintLocations(), writer.getHintOverflow(), "findings report");
        out_ << fmt::format("\nTip: The scan was successful, but the report couldn't be written with the {} encoding.\n",
                            options.report_encoding);
        out_ << "Suggestion: Try viewing the CSV results file with UTF-8 encoding.\n";
    }
}

void ScrubSession::printEncodingHints(const std::vector<std::string>& hints, size_t overflow, const char* artifact) {
    out_ << fmt::format("\nThis appears to be an encoding error when writing to the {}.\n", artifact);
    out_ << "The problematic character was likely from one of these cells:\n";
    for (const auto& hint : hints) {
        out_ << fmt::format("  {}\n", hint);
    }
    if (overflow > 0) {
        out_ << fmt::format("  ... and {} more cells\n", overflow);
    }
}

bool ScrubSession::confirmCleaning(const ScrubOptions& options) {
    out_ << "\nWould you like to clean the problematic characters?\n";
    out_ << "This will create a new copy of the Excel file with the problematic characters handled.\n";
    if (options.auto_confirm) {
        out_ << "Clean the file? (y/n): y\n";
        return true;
    }

    out_ << "Clean the file? (y/n): " << std::flush;
    std::string line;
    if (!readLine(line)) {
        out_ << "\n";
        return false;
    }
    const std::string answer = toLower(trim(line));
    return answer == "y" || answer == "yes";
}

int ScrubSession::cleanWorkbook(const ScrubOptions& options, core::Workbook& workbook,
                                const std::vector<scan::Finding>& findings) {
    InteractiveDecider decider(in_, out_);
    clean::CleaningOutcome outcome = clean::CleaningEngine::run(workbook, findings, std::ref(decider));
    summary_.stop_reason = outcome.stopReason;

    if (!outcome.hasChanges()) {
        out_ << "No changes were made.\n";
        return kExitOk;
    }

    writer::XLSXPackageWriter package_writer;
    report::ChangeLogWriter log_writer(options.report_encoding);
    auto persisted = clean::CleaningEngine::persist(outcome, workbook, options.input_path,
                                                    package_writer, log_writer);
    if (!persisted) {
        out_ << fmt::format("Error during cleaning: {}\n", persisted.error().fullMessage());
        out_ << "The original file was not modified.\n";
        return kExitIoFailure;
    }

    const clean::PersistResult& result = persisted.value();
    summary_.cells_cleaned = outcome.changeLog.size();
    summary_.cleaned_path = result.workbookPath;

    out_ << fmt::format("\nCleaned {} cells.\n", outcome.changeLog.size());
    out_ << fmt::format("Saved cleaned file as: {}\n", result.workbookPath);

    if (!result.logPath.empty()) {
        summary_.log_path = result.logPath;
        out_ << fmt::format("Cleaning log saved as: {}\n", result.logPath);
    } else {
        out_ << fmt::format("Error saving cleaning log: {}\n", result.logError.fullMessage());
        if (result.logError.code == core::ErrorCode::EncodingFailure) {
            printEncodingHints(log_writer.getHintLocations(), 0, "cleaning log");
        }
    }

    out_ << fmt::format("\nCleaning complete! You can now use the cleaned file: {}\n", result.workbookPath);
    return kExitOk;
}

}} // namespace cellscrub::app
