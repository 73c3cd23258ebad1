#include "cellscrub/clean/ChangeLog.hpp"

namespace cellscrub {
namespace clean {

void ChangeLog::record(const std::string& sheet, const std::string& cell_ref,
                       const std::string& original_value, const std::string& new_value) {
    Key key(sheet, cell_ref);
    auto it = index_.find(key);

    if (it == index_.end()) {
        if (original_value == new_value) {
            return;
        }
        index_.emplace(key, records_.size());
        records_.push_back(ChangeRecord{sheet, cell_ref, original_value, new_value});
        return;
    }

    ChangeRecord& existing = records_[it->second];
    existing.newValue = new_value;
    if (existing.newValue == existing.originalValue) {
        records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(it->second));
        rebuildIndex();
    }
}

const ChangeRecord* ChangeLog::find(const std::string& sheet, const std::string& cell_ref) const {
    auto it = index_.find(Key(sheet, cell_ref));
    return it == index_.end() ? nullptr : &records_[it->second];
}

std::vector<std::string> ChangeLog::cellsInSheet(const std::string& sheet) const {
    std::vector<std::string> cells;
    for (const auto& rec : records_) {
        if (rec.sheet == sheet) {
            cells.push_back(rec.cellRef);
        }
    }
    return cells;
}

void ChangeLog::rebuildIndex() {
    index_.clear();
    for (size_t i = 0; i < records_.size(); ++i) {
        index_.emplace(Key(records_[i].sheet, records_[i].cellRef), i);
    }
}

}} // namespace cellscrub::clean
