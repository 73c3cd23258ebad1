#pragma once

#include "cellscrub/core/Workbook.hpp"
#include "cellscrub/core/Expected.hpp"
#include <memory>
#include <string>

namespace cellscrub {
namespace scan {

/**
 * @brief 工作簿来源接口（默认实现为 reader::XLSXReader）
 */
class IWorkbookSource {
public:
    virtual ~IWorkbookSource() = default;

    /**
     * @brief 打开并读取整个工作簿；失败时返回 OpenFailure 等错误
     */
    virtual core::Result<std::unique_ptr<core::Workbook>> load(const std::string& path) = 0;
};

}} // namespace cellscrub::scan
