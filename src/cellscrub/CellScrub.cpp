#include "cellscrub/CellScrub.hpp"
#include <iostream>

namespace cellscrub {

bool initialize(const std::string& log_file_path, Logger::Level level, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, level, enable_console);
        CELLSCRUB_LOG_INFO("CellScrub initialized");
        CELLSCRUB_LOG_INFO("Version: {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize CellScrub: " << e.what() << std::endl;
        return false;
    }
}

void cleanup() {
    try {
        CELLSCRUB_LOG_INFO("CellScrub cleanup completed");
        Logger::getInstance().shutdown();
    } catch (const std::exception& e) {
        std::cerr << "Exception during cleanup: " << e.what() << std::endl;
    }
}

} // namespace cellscrub
