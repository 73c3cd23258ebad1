#pragma once

#include "cellscrub/scan/IWorkbookSource.hpp"
#include "cellscrub/archive/ZipReader.hpp"
#include "cellscrub/core/Expected.hpp"
#include "cellscrub/core/Workbook.hpp"
#include <memory>
#include <string>
#include <vector>

namespace cellscrub {
namespace reader {

/**
 * @brief XLSX 读取器
 *
 * 只读取扫描需要的内容：工作表顺序、共享字符串和单元格值。
 * 包结构经 _rels/.rels -> workbook.xml -> workbook.xml.rels 定位，
 * 不假设固定的部件路径。
 */
class XLSXReader : public scan::IWorkbookSource {
public:
    struct SheetPart {
        std::string name;
        std::string part_path;   // 如 "xl/worksheets/sheet1.xml"
    };

    struct PackageLayout {
        std::string workbook_part;
        std::string shared_strings_part;   // 可能为空
        std::vector<SheetPart> sheets;     // 工作簿顺序
    };

    XLSXReader() = default;

    /**
     * @brief 打开并读取整个工作簿
     * @return 失败时：FileNotFound / OpenFailure / InvalidWorkbook / XmlParseError
     */
    core::Result<std::unique_ptr<core::Workbook>> load(const std::string& path) override;

    /**
     * @brief 解析包结构，写出器复用它定位工作表部件
     */
    static core::Result<PackageLayout> readLayout(archive::ZipReader& zip);

    /**
     * @brief 把关系中的 Target 解析为包内路径
     * @param source_part 关系所属部件，如 "xl/workbook.xml"
     * @param target 如 "worksheets/sheet1.xml"、"/xl/worksheets/sheet1.xml"
     */
    static std::string resolveTarget(const std::string& source_part, const std::string& target);

private:
    static core::Result<std::string> readPart(archive::ZipReader& zip, const std::string& part_path);
};

}} // namespace cellscrub::reader
