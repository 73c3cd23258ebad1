#include "cellscrub/core/ArtifactNaming.hpp"
#include "cellscrub/core/Path.hpp"
#include "cellscrub/utils/TimeUtils.hpp"
#include <fmt/format.h>

namespace cellscrub {
namespace core {

std::string ArtifactNaming::timestamped(const std::string& source_path, const std::string& suffix,
                                        const std::string& extension, const std::tm& when) {
    Path source(source_path);
    std::string name = fmt::format("{}_{}_{}{}", source.stem(), suffix,
                                   utils::TimeUtils::fileStamp(when), extension);
    return (source.parent() / name).string();
}

std::string ArtifactNaming::timestamped(const std::string& source_path, const std::string& suffix,
                                        const std::string& extension) {
    return timestamped(source_path, suffix, extension, utils::TimeUtils::getCurrentTime());
}

}} // namespace cellscrub::core
