#pragma once

#include "cellscrub/scan/Finding.hpp"
#include "cellscrub/scan/PatternSet.hpp"
#include "cellscrub/scan/IWorkbookSource.hpp"
#include "cellscrub/core/Workbook.hpp"
#include <string>
#include <vector>

namespace cellscrub {
namespace scan {

/**
 * @brief 工作簿级扫描，汇总为一个有序的 Finding 列表
 *
 * 顺序：工作表按工作簿顺序，行升序，列升序，模式按集合顺序。
 * 第 1 行为表头，不参与扫描，只提供 columnHeader。
 */
class WorkbookScanner {
public:
    static std::vector<Finding> scan(const core::Workbook& workbook, const PatternSet& patterns);

    /**
     * @brief 通过 source 打开文件后扫描；打开失败时记录错误日志并返回错误
     */
    static core::Result<std::vector<Finding>> scanFile(const std::string& path,
                                                      const PatternSet& patterns,
                                                      IWorkbookSource& source);

    /**
     * @brief 列表头文本；表头单元格为空时为 "Unnamed: <0-based 列号>"
     */
    static std::string columnHeader(const core::Worksheet& sheet, int col);
};

}} // namespace cellscrub::scan
