#include "cellscrub/core/Workbook.hpp"
#include <algorithm>

namespace cellscrub {
namespace core {

Workbook::Workbook(const std::string& source_path) : source_path_(source_path) {}

std::shared_ptr<Worksheet> Workbook::addSheet(const std::string& name) {
    if (auto existing = getSheet(name)) {
        return existing;
    }
    auto sheet = std::make_shared<Worksheet>(name);
    worksheets_.push_back(sheet);
    return sheet;
}

std::shared_ptr<Worksheet> Workbook::getSheet(const std::string& name) {
    auto it = std::find_if(worksheets_.begin(), worksheets_.end(),
                           [&name](const std::shared_ptr<Worksheet>& ws) { return ws->getName() == name; });
    return it == worksheets_.end() ? nullptr : *it;
}

std::shared_ptr<Worksheet> Workbook::getSheet(size_t index) {
    return index < worksheets_.size() ? worksheets_[index] : nullptr;
}

std::shared_ptr<const Worksheet> Workbook::getSheet(const std::string& name) const {
    auto it = std::find_if(worksheets_.begin(), worksheets_.end(),
                           [&name](const std::shared_ptr<Worksheet>& ws) { return ws->getName() == name; });
    return it == worksheets_.end() ? nullptr : *it;
}

std::shared_ptr<const Worksheet> Workbook::getSheet(size_t index) const {
    return index < worksheets_.size() ? worksheets_[index] : nullptr;
}

std::vector<std::string> Workbook::getSheetNames() const {
    std::vector<std::string> names;
    names.reserve(worksheets_.size());
    for (const auto& ws : worksheets_) {
        names.push_back(ws->getName());
    }
    return names;
}

}} // namespace cellscrub::core
