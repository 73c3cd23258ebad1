#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace cellscrub {

/**
 * @brief 进程级日志器
 *
 * 控制台彩色输出 + 按大小滚动的日志文件，格式化统一走 fmt。
 * 未显式 initialize() 时，首次写日志会以默认参数自动初始化。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    void initialize(const std::string& log_file_path = "logs/cellscrub.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    bool isInitialized() const { return initialized_.load(); }
    const std::string& getLogFilePath() const { return log_file_path_; }

    /**
     * @brief 解析级别名称（trace/debug/info/warn/error/critical/off，大小写不敏感）
     * @return 是否识别成功
     */
    static bool parseLevel(const std::string& name, Level& level);

    void log(Level level, const std::string& message);

    template<typename... Args>
    inline void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        try {
            log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
        } catch (const fmt::format_error&) {
            log(level, fmt_str);
        }
    }

    void flush();
    void shutdown();

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        logf(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    std::atomic<size_t> current_file_size_{0};
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define CELLSCRUB_FUNC __FUNCTION__
#else
#  define CELLSCRUB_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define CELLSCRUB_LOG_TRACE(fmt, ...)    ::cellscrub::Logger::getInstance().logCtx(::cellscrub::Logger::Level::TRACE,    __FILE__, __LINE__, CELLSCRUB_FUNC, fmt, ##__VA_ARGS__)
#define CELLSCRUB_LOG_DEBUG(fmt, ...)    ::cellscrub::Logger::getInstance().logCtx(::cellscrub::Logger::Level::DEBUG,    __FILE__, __LINE__, CELLSCRUB_FUNC, fmt, ##__VA_ARGS__)
#define CELLSCRUB_LOG_INFO(fmt, ...)     ::cellscrub::Logger::getInstance().logCtx(::cellscrub::Logger::Level::INFO,     __FILE__, __LINE__, CELLSCRUB_FUNC, fmt, ##__VA_ARGS__)
#define CELLSCRUB_LOG_WARN(fmt, ...)     ::cellscrub::Logger::getInstance().logCtx(::cellscrub::Logger::Level::WARN,     __FILE__, __LINE__, CELLSCRUB_FUNC, fmt, ##__VA_ARGS__)
#define CELLSCRUB_LOG_ERROR(fmt, ...)    ::cellscrub::Logger::getInstance().logCtx(::cellscrub::Logger::Level::ERROR,    __FILE__, __LINE__, CELLSCRUB_FUNC, fmt, ##__VA_ARGS__)
#define CELLSCRUB_LOG_CRITICAL(fmt, ...) ::cellscrub::Logger::getInstance().logCtx(::cellscrub::Logger::Level::CRITICAL, __FILE__, __LINE__, CELLSCRUB_FUNC, fmt, ##__VA_ARGS__)

// 可恢复告警：仅记录日志，由调用方决定是否继续
#ifndef CELLSCRUB_HANDLE_WARNING
#  define CELLSCRUB_HANDLE_WARNING(message, context) \
    do { CELLSCRUB_LOG_WARN("[ctx:{}] {}", (context), (message)); } while (0)
#endif

} // namespace cellscrub
