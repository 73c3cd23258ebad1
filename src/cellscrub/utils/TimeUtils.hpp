#pragma once

#include <string>
#include <ctime>
#include <chrono>
#include <cstdint>
#include <fmt/chrono.h>

namespace cellscrub {
namespace utils {

/**
 * @brief 时间工具类 - 统一处理时间戳格式
 */
class TimeUtils {
public:
    /**
     * @brief 获取当前本地时间
     */
    static std::tm getCurrentTime() {
        return fmt::localtime(std::time(nullptr));
    }

    /**
     * @brief 按 strftime 风格格式化时间
     * @param time 时间结构
     * @param format 格式字符串（如 "%Y-%m-%d %H:%M:%S"）
     */
    static std::string formatTime(const std::tm& time, const std::string& format = "%Y-%m-%d %H:%M:%S") {
        return fmt::format(fmt::runtime("{:" + format + "}"), time);
    }

    /**
     * @brief 文件名用时间戳，如 20240131_235959
     */
    static std::string fileStamp(const std::tm& time) {
        return formatTime(time, "%Y%m%d_%H%M%S");
    }

    static std::time_t tmToTimeT(const std::tm& tm_time) {
        std::tm temp = tm_time; // mktime 可能会修改输入
        return std::mktime(&temp);
    }

    static int64_t getTimestampMs() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    }

    /**
     * @brief RAII 计时器
     */
    class PerformanceTimer {
    public:
        explicit PerformanceTimer(const std::string& name = "Timer")
            : start_(std::chrono::steady_clock::now()), name_(name) {}

        int64_t elapsedMs() const {
            auto now = std::chrono::steady_clock::now();
            return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_).count();
        }

        const std::string& name() const { return name_; }

    private:
        std::chrono::steady_clock::time_point start_;
        std::string name_;
    };
};

}} // namespace cellscrub::utils
