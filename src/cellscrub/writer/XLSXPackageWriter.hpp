#pragma once

#include "cellscrub/clean/CleaningEngine.hpp"
#include "cellscrub/core/Expected.hpp"
#include <string>

namespace cellscrub {
namespace writer {

/**
 * @brief 清理后工作簿的 XLSX 写出器
 *
 * 按源包的条目顺序复制全部条目，只有包含变更单元格的工作表部件被转写。
 * 写入目标始终是新文件；任一步失败都会删除半成品。
 */
class XLSXPackageWriter : public clean::IWorkbookSink {
public:
    XLSXPackageWriter() = default;

    core::VoidResult write(const core::Workbook& workbook, const clean::ChangeLog& changes,
                           const std::string& source_path, const std::string& target_path) override;

    size_t getEntriesCopied() const { return entries_copied_; }
    size_t getPartsRewritten() const { return parts_rewritten_; }

private:
    core::VoidResult writePackage(const core::Workbook& workbook, const clean::ChangeLog& changes,
                                  const std::string& source_path, const std::string& target_path);

    size_t entries_copied_ = 0;
    size_t parts_rewritten_ = 0;
};

}} // namespace cellscrub::writer
