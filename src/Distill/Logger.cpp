// =================================================================
// src/Distill/Logger.cpp
// =================================================================
// Implementation of the process-wide diagnostics log.

#include "Distill/Logger.hpp"
#include "Distill/Types.hpp"
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace Distill {

namespace {

const char* colorFor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";
        case LogLevel::INFO: return "\033[36m";
        case LogLevel::WARNING: return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::CRITICAL: return "\033[1;91m";
    }
    return "";
}

std::string wallClock(std::chrono::system_clock::time_point when) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // NO_COLOR is honoured the same way most terminal tools do
    m_color = ::isatty(STDERR_FILENO) == 1 && std::getenv("NO_COLOR") == nullptr;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    std::string opened;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_file_enabled = false;
        if (m_file.is_open()) {
            m_file.close();
        }
        m_max_log_size = max_log_size == 0 ? 1 : max_log_size;
        m_max_log_files = max_log_files;

        if (log_dir.empty()) {
            return;
        }

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            std::cerr << "distill: cannot create log directory " << log_dir << ": " << ec.message() << std::endl;
            return;
        }

        m_file_path = (std::filesystem::path(log_dir) / "distill.log").string();
        m_file.open(m_file_path, std::ios::app);
        if (!m_file.is_open()) {
            std::cerr << "distill: cannot open log file " << m_file_path << std::endl;
            return;
        }
        m_file_bytes = static_cast<size_t>(std::filesystem::file_size(m_file_path, ec));
        if (ec) {
            m_file_bytes = 0;
        }
        m_file_enabled = true;
        opened = m_file_path;
    }

    info("Logger", "Writing log file", opened);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = static_cast<int>(level);
}

void Logger::setFileLogLevel(LogLevel level) {
    m_file_level = static_cast<int>(level);
}

void Logger::setConsoleLogging(bool enabled) {
    m_console_enabled = enabled;
}

bool Logger::isEnabled(LogLevel level) const {
    int value = static_cast<int>(level);
    return (m_console_enabled && value >= m_console_level) ||
           (m_file_enabled && value >= m_file_level);
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::INFO, component, message, context);
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::WARNING, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::ERROR, component, message, context);
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    write(LogLevel::CRITICAL, component, message, context);
}

void Logger::logDiscovery(size_t discovered, size_t discovery_errors) {
    if (discovery_errors == 0) {
        info("DirectoryWalker", "Traversal finished", std::to_string(discovered) + " candidate files");
        return;
    }
    warning("DirectoryWalker", "Traversal finished with unreadable entries",
            std::to_string(discovered) + " candidate files, " + std::to_string(discovery_errors) + " unreadable");
}

void Logger::logRunSummary(const RunSummary& summary) {
    std::ostringstream counters;
    counters << "discovered=" << summary.discovered
             << " processed=" << summary.processed
             << " binary=" << summary.skipped_binary
             << " failed=" << summary.failed
             << " tokens=" << summary.total_tokens;
    info("Orchestrator", "Run finished", counters.str());

    if (summary.truncated > 0) {
        warning("Orchestrator", std::to_string(summary.truncated) + " file(s) cut to the per-file token limit");
    }
    if (summary.overflowed > 0) {
        warning("Orchestrator", std::to_string(summary.overflowed) + " file(s) past the context ceiling",
                "ceiling=" + std::to_string(summary.context_ceiling));
    }
    if (summary.cancelled) {
        warning("Orchestrator", "Run cancelled before completion; counters are partial");
    }
}

void Logger::logSessionStart(const std::string& command, const std::string& root) {
    info("Session", "Starting " + command, root);
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::string context = "exit=" + std::to_string(exit_code) + " elapsed=" + std::to_string(duration_ms) + "ms";
    if (exit_code == 0) {
        info("Session", "Finished " + command, context);
    } else {
        error("Session", command + " did not complete", context);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.flush();
    }
    std::cerr.flush();
}

const char* Logger::levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
    }
    return "?";
}

void Logger::write(LogLevel level, const std::string& component,
                   const std::string& message, const std::string& context) {
    int value = static_cast<int>(level);
    bool to_console = m_console_enabled && value >= m_console_level;
    bool to_file = m_file_enabled && value >= m_file_level;
    if (!to_console && !to_file) {
        return;
    }

    LogRecord record{std::chrono::system_clock::now(), level, component, message, context,
                     std::this_thread::get_id()};

    std::lock_guard<std::mutex> lock(m_mutex);
    if (to_console) {
        std::cerr << render(record, m_color) << '\n';
    }
    if (to_file && m_file.is_open()) {
        std::string line = render(record, false);
        m_file << line << '\n';
        m_file_bytes += line.size() + 1;
        if (level >= LogLevel::ERROR) {
            m_file.flush();
        }
        if (m_file_bytes >= m_max_log_size) {
            rollOver();
        }
    }
}

std::string Logger::render(const LogRecord& record, bool color) {
    std::ostringstream line;
    line << wallClock(record.when) << ' ';
    if (color) {
        line << colorFor(record.level);
    }
    line << std::left << std::setw(5) << levelTag(record.level);
    if (color) {
        line << "\033[0m";
    }
    line << " t" << threadOrdinal(record.thread) << ' ' << record.component << " | " << record.message;
    if (!record.context.empty()) {
        line << " {" << record.context << '}';
    }
    return line.str();
}

int Logger::threadOrdinal(std::thread::id id) {
    // Small stable numbers read better than raw thread ids in worker logs
    auto found = m_thread_ordinals.find(id);
    if (found != m_thread_ordinals.end()) {
        return found->second;
    }
    int ordinal = static_cast<int>(m_thread_ordinals.size());
    m_thread_ordinals.emplace(id, ordinal);
    return ordinal;
}

std::string Logger::rolledName(size_t index) const {
    return m_file_path + "." + std::to_string(index);
}

void Logger::rollOver() {
    m_file.close();
    m_file_bytes = 0;

    std::error_code ec;
    if (m_max_log_files == 0) {
        std::filesystem::remove(m_file_path, ec);
    } else {
        std::filesystem::remove(rolledName(m_max_log_files), ec);
        for (size_t index = m_max_log_files; index > 1; --index) {
            if (std::filesystem::exists(rolledName(index - 1), ec)) {
                std::filesystem::rename(rolledName(index - 1), rolledName(index), ec);
            }
        }
        std::filesystem::rename(m_file_path, rolledName(1), ec);
    }
    if (ec) {
        std::cerr << "distill: log rollover failed: " << ec.message() << std::endl;
    }

    m_file.open(m_file_path, std::ios::trunc);
    if (!m_file.is_open()) {
        m_file_enabled = false;
        std::cerr << "distill: cannot reopen log file " << m_file_path << std::endl;
    }
}

} // namespace Distill
