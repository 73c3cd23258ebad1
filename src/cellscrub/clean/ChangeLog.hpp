#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cellscrub {
namespace clean {

/**
 * @brief 一个单元格的变更：首次的原值与最终的新值
 */
struct ChangeRecord {
    std::string sheet;
    std::string cellRef;
    std::string originalValue;
    std::string newValue;

    bool operator==(const ChangeRecord& other) const {
        return sheet == other.sheet && cellRef == other.cellRef &&
               originalValue == other.originalValue && newValue == other.newValue;
    }
};

/**
 * @brief 按 (sheet, cellRef) 去重的变更记录，保持首次出现顺序
 *
 * 同一单元格再次修改只更新 newValue；最终值回到原值时删除该记录。
 */
class ChangeLog {
public:
    void record(const std::string& sheet, const std::string& cell_ref,
                const std::string& original_value, const std::string& new_value);

    const ChangeRecord* find(const std::string& sheet, const std::string& cell_ref) const;

    const std::vector<ChangeRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    /**
     * @brief 某个工作表中被修改过的单元格引用
     */
    std::vector<std::string> cellsInSheet(const std::string& sheet) const;

private:
    using Key = std::pair<std::string, std::string>;

    void rebuildIndex();

    std::vector<ChangeRecord> records_;
    std::map<Key, size_t> index_;
};

}} // namespace cellscrub::clean
