#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <atomic>
#include <cstring>
#include <fstream>
#include <mutex>
#include <string>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace calcgrid {

/**
 * @brief 进程级日志器
 *
 * 控制台 + 滚动文件两个输出端，消息使用 fmt 格式化。
 * 在第一次真正输出日志时才会惰性初始化，因此把级别设为 OFF 后不会创建任何文件。
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

    void initialize(const std::string& log_file_path = "logs/calcgrid.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;

    void setConsoleEnabled(bool enabled) { enable_console_.store(enabled); }

    void trace(const std::string& message)    { log(Level::TRACE, message); }
    void debug(const std::string& message)    { log(Level::DEBUG, message); }
    void info(const std::string& message)     { log(Level::INFO, message); }
    void warn(const std::string& message)     { log(Level::WARN, message); }
    void error(const std::string& message)    { log(Level::ERROR, message); }
    void critical(const std::string& message) { log(Level::CRITICAL, message); }

    /**
     * @brief 带源码位置信息的格式化接口（在宏中使用）
     */
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        std::string body;
        try {
            body = fmt::vformat(fmt_str, fmt::make_format_args(args...));
        } catch (const fmt::format_error& ex) {
            body = fmt::format("{} <format error: {}>", fmt_str, ex.what());
        }
        log(level, fmt::format("[{}:{}:{}] {}", baseFilename(file), line, extractFunctionName(func), body));
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(Level level, const std::string& message);
    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;
    void flush_unlocked();

    // 提取文件名（去除路径）
    static const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (slash1 > slash2 ? slash1 : slash2) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    // 提取函数名（去除命名空间和参数）
    static std::string extractFunctionName(const char* func_sig) {
        if (!func_sig) return "";
        std::string sig(func_sig);
        size_t lastColon = sig.rfind("::");
        if (lastColon != std::string::npos) {
            sig = sig.substr(lastColon + 2);
        }
        size_t paren = sig.find('(');
        if (paren != std::string::npos) {
            sig = sig.substr(0, paren);
        }
        return sig;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define CALCGRID_FUNC __FUNCTION__
#else
#  define CALCGRID_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define CALCGRID_LOG_AT(level, fmt, ...) \
    calcgrid::Logger::getInstance().logCtx(level, __FILE__, __LINE__, CALCGRID_FUNC, fmt, ##__VA_ARGS__)

#define CALCGRID_LOG_TRACE(fmt, ...)    CALCGRID_LOG_AT(calcgrid::Logger::Level::TRACE, fmt, ##__VA_ARGS__)
#define CALCGRID_LOG_DEBUG(fmt, ...)    CALCGRID_LOG_AT(calcgrid::Logger::Level::DEBUG, fmt, ##__VA_ARGS__)
#define CALCGRID_LOG_INFO(fmt, ...)     CALCGRID_LOG_AT(calcgrid::Logger::Level::INFO, fmt, ##__VA_ARGS__)
#define CALCGRID_LOG_WARN(fmt, ...)     CALCGRID_LOG_AT(calcgrid::Logger::Level::WARN, fmt, ##__VA_ARGS__)
#define CALCGRID_LOG_ERROR(fmt, ...)    CALCGRID_LOG_AT(calcgrid::Logger::Level::ERROR, fmt, ##__VA_ARGS__)
#define CALCGRID_LOG_CRITICAL(fmt, ...) CALCGRID_LOG_AT(calcgrid::Logger::Level::CRITICAL, fmt, ##__VA_ARGS__)

} // namespace calcgrid
