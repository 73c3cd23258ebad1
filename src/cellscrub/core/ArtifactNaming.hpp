#pragma once

#include <ctime>
#include <string>

namespace cellscrub {
namespace core {

/**
 * @brief 产物文件命名：<目录>/<主干>_<后缀>_<YYYYmmdd_HHMMSS><扩展名>，与源文件同目录
 */
class ArtifactNaming {
public:
    static std::string timestamped(const std::string& source_path, const std::string& suffix,
                                   const std::string& extension, const std::tm& when);

    /**
     * @brief 使用当前本地时间
     */
    static std::string timestamped(const std::string& source_path, const std::string& suffix,
                                   const std::string& extension);

    static constexpr const char* kScanResults = "char_scan_results";
    static constexpr const char* kFindingsReport = "findings_report";
    static constexpr const char* kCleaned = "cleaned";
    static constexpr const char* kCleaningLog = "cleaning_log";
};

}} // namespace cellscrub::core
