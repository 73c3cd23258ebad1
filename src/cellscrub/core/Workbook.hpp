#pragma once

#include "cellscrub/core/Worksheet.hpp"
#include <memory>
#include <string>
#include <vector>

namespace cellscrub {
namespace core {

/**
 * @brief 工作簿：有序的工作表集合 + 来源路径
 */
class Workbook {
public:
    Workbook() = default;
    explicit Workbook(const std::string& source_path);

    /**
     * @brief 追加工作表；同名工作表已存在时返回已有的那一个
     */
    std::shared_ptr<Worksheet> addSheet(const std::string& name);

    std::shared_ptr<Worksheet> getSheet(const std::string& name);
    std::shared_ptr<Worksheet> getSheet(size_t index);
    std::shared_ptr<const Worksheet> getSheet(const std::string& name) const;
    std::shared_ptr<const Worksheet> getSheet(size_t index) const;

    size_t getSheetCount() const { return worksheets_.size(); }
    std::vector<std::string> getSheetNames() const;

    const std::string& getSourcePath() const { return source_path_; }
    void setSourcePath(const std::string& path) { source_path_ = path; }

private:
    std::vector<std::shared_ptr<Worksheet>> worksheets_;
    std::string source_path_;
};

}} // namespace cellscrub::core
