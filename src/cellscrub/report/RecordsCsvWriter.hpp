#pragma once

#include "cellscrub/core/Expected.hpp"
#include "cellscrub/scan/Finding.hpp"
#include <string>
#include <vector>

namespace cellscrub {
namespace report {

/**
 * @brief char_scan_results CSV：每条 Finding 一行，始终 UTF-8
 */
class RecordsCsvWriter {
public:
    static std::vector<std::string> header();
    static std::vector<std::string> toRow(const scan::Finding& finding);

    static core::VoidResult write(const std::string& csv_path, const std::vector<scan::Finding>& findings);
};

}} // namespace cellscrub::report
