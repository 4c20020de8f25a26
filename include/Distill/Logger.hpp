// =================================================================
// include/Distill/Logger.hpp
// =================================================================
// Process-wide diagnostics log, written to stderr and optionally to
// a rotating file.

#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace Distill {

struct RunSummary;

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * @brief One diagnostic line before it is rendered
 */
struct LogRecord {
    std::chrono::system_clock::time_point when;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;
    std::thread::id thread;
};

/**
 * @brief Shared logger for the CLI thread and the pipeline workers
 *
 * Level gates are atomics so a worker can drop a DEBUG line without
 * touching the mutex. Console lines go to stderr; stdout is reserved
 * for reports. With a log directory, lines are also appended to
 * <dir>/distill.log, which rolls over to distill.log.1 .. distill.log.N.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Configure file output
     * @param log_dir Directory for distill.log; empty disables file output
     * @param max_log_size Size in bytes after which the file is rolled over
     * @param max_log_files Number of rolled files kept beside the live one
     */
    void initialize(const std::string& log_dir = "",
                    size_t max_log_size = 10 * 1024 * 1024,
                    size_t max_log_files = 5);

    void setConsoleLogLevel(LogLevel level);
    void setFileLogLevel(LogLevel level);
    void setConsoleLogging(bool enabled);

    /// True when a line at this level would reach at least one output.
    bool isEnabled(LogLevel level) const;

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    void logDiscovery(size_t discovered, size_t discovery_errors);
    void logRunSummary(const RunSummary& summary);
    void logSessionStart(const std::string& command, const std::string& root);
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    void flush();

    static const char* levelTag(LogLevel level);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const std::string& component,
               const std::string& message, const std::string& context);
    std::string render(const LogRecord& record, bool color);
    int threadOrdinal(std::thread::id id);
    void rollOver();
    std::string rolledName(size_t index) const;

    std::atomic<int> m_console_level{static_cast<int>(LogLevel::INFO)};
    std::atomic<int> m_file_level{static_cast<int>(LogLevel::DEBUG)};
    std::atomic<bool> m_console_enabled{true};
    std::atomic<bool> m_file_enabled{false};
    bool m_color = false;

    std::mutex m_mutex;
    std::ofstream m_file;
    std::string m_file_path;
    size_t m_file_bytes = 0;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    std::map<std::thread::id, int> m_thread_ordinals;
};

#define LOG_DEBUG(component, message) \
    Distill::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Distill::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Distill::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Distill::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Distill::Logger::getInstance().critical(component, message)

} // namespace Distill
