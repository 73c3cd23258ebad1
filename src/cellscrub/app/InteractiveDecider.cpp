#include "cellscrub/app/InteractiveDecider.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <istream>
#include <ostream>
#include <string>

namespace cellscrub {
namespace app {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

} // namespace

bool InteractiveDecider::parseChoice(const std::string& input, clean::Action& action) {
    const std::string choice = trim(input);
    if (choice.size() != 1 || choice[0] < '1' || choice[0] > '8') {
        return false;
    }
    action = static_cast<clean::Action>(choice[0] - '1');
    return true;
}

bool InteractiveDecider::needsReplacement(clean::Action action) {
    return action == clean::Action::ReplaceOne ||
           action == clean::Action::ReplacePatternEverywhere ||
           action == clean::Action::ReplaceAllPatternsEverywhere;
}

void InteractiveDecider::printFinding(const scan::Finding& finding, const clean::CleaningContext& context) {
    CLEAN_DEBUG("Asking for finding {} of {}", context.index, context.total);
    out_ << fmt::format("\nCleaning cell {}!{}\n", finding.sheet, finding.cellRef());
    out_ << fmt::format("Current value: {}\n", context.liveValue);
    out_ << fmt::format("Problematic character: {}\n", finding.hexValue);
    if (finding.isPrintable) {
        out_ << fmt::format("Character: '{}' - {}\n", finding.pattern, finding.description);
    } else {
        out_ << fmt::format("Character: Non-printable - {}\n", finding.description);
    }

    out_ << "\nOptions:\n"
         << "1. Delete the character\n"
         << "2. Replace with custom text\n"
         << "3. Skip this cell\n"
         << "4. Skip all remaining cells\n"
         << "5. Delete ALL instances of this character in ALL cells\n"
         << "6. Replace ALL instances of this character in ALL cells\n"
         << "7. Delete ALL problematic characters (all types) in ALL cells\n"
         << "8. Replace ALL problematic characters (all types) in ALL cells\n";
}

clean::Decision InteractiveDecider::operator()(const scan::Finding& finding, const clean::CleaningContext& context) {
    printFinding(finding, context);
    out_ << "Choose an option (1-8): " << std::flush;

    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\nInput closed. Skipping all remaining cells.\n";
        return clean::Decision::of(clean::Action::SkipAll);
    }

    clean::Action action = clean::Action::SkipCell;
    if (!parseChoice(line, action)) {
        out_ << "Invalid choice. Skipping this cell.\n";
        CLEAN_DEBUG("Invalid choice '{}' for {}!{}", line, finding.sheet, finding.cellRef());
        return clean::Decision::of(clean::Action::SkipCell);
    }

    if (action == clean::Action::SkipCell) {
        out_ << fmt::format("Skipping cell {}.\n", finding.cellRef());
    } else if (action == clean::Action::SkipAll) {
        out_ << "Skipping all remaining cells.\n";
    }

    std::string replacement;
    if (needsReplacement(action)) {
        out_ << "Enter replacement text: " << std::flush;
        if (!std::getline(in_, replacement)) {
            out_ << "\nInput closed. Skipping all remaining cells.\n";
            return clean::Decision::of(clean::Action::SkipAll);
        }
        if (!replacement.empty() && replacement.back() == '\r') {
            replacement.pop_back();
        }
    }

    return clean::Decision::of(action, replacement);
}

}} // namespace cellscrub::app
