#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <iostream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <unordered_map>

namespace vani {

/**
 * @brief Process-wide logger for the session bridge
 *
 * Thread-safe, callable from the device server, upstream client threads and
 * the per-session playback and usage workers. Messages use "{}" placeholders.
 * Logging before initialize() is a no-op.
 */
class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Critical = 5
    };

    Logger();
    ~Logger();

    // Initialization
    static bool initialize(const std::string& logFile = "",
                          Level minLevel = Level::Info,
                          bool enableConsole = true);
    static void shutdown();
    static bool isInitialized();

    // Configuration
    static void setLevel(Level level);
    static Level getLevel();
    static void setConsoleOutput(bool enable);
    static void setFileOutput(bool enable);
    static void setMaxFileSize(size_t maxSize);
    static void setMaxBackupFiles(size_t maxBackups);
    static Level levelFromString(const std::string& name, Level fallback = Level::Info);

    // Logging methods
    template<typename... Args>
    static void trace(const std::string& format, Args&&... args) {
        log(Level::Trace, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(Level::Debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(Level::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warning(const std::string& format, Args&&... args) {
        log(Level::Warning, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(const std::string& format, Args&&... args) {
        log(Level::Warning, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(Level::Error, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(const std::string& format, Args&&... args) {
        log(Level::Critical, format, std::forward<Args>(args)...);
    }

    // Per-operation counters, e.g. frames that failed to encode
    static void logLatency(const std::string& operation, double latencyMs);
    static void countFailure(const std::string& operation);
    static uint64_t getFailureCount(const std::string& operation);
    static void resetCounters();

    static void flush();

private:
    template<typename... Args>
    static void log(Level level, const std::string& format, Args&&... args) {
        if (!s_initialized.load() || level < s_currentLevel.load()) {
            return;
        }

        try {
            std::ostringstream body;
            formatInto(body, format, 0, std::forward<Args>(args)...);

            auto now = std::chrono::system_clock::now();
            auto time_t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

            std::tm localTime{};
            localtime_r(&time_t, &localTime);

            std::ostringstream ss;
            ss << "[" << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
            ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
            ss << "[" << levelToString(level) << "] ";
            ss << body.str();

            write(level, ss.str());
        } catch (const std::exception& e) {
            std::cerr << "Logger error: " << e.what() << std::endl;
        }
    }

    static void formatInto(std::ostringstream& out, const std::string& format, size_t pos) {
        out << format.substr(pos);
    }

    template<typename T, typename... Rest>
    static void formatInto(std::ostringstream& out, const std::string& format, size_t pos,
                           T&& value, Rest&&... rest) {
        size_t open = format.find('{', pos);
        if (open == std::string::npos) {
            out << format.substr(pos);
            return;
        }
        size_t close = format.find('}', open);
        if (close == std::string::npos) {
            out << format.substr(pos);
            return;
        }
        out << format.substr(pos, open - pos) << value;
        formatInto(out, format, close + 1, std::forward<Rest>(rest)...);
    }

    static std::string levelToString(Level level);
    static void write(Level level, const std::string& message);
    static void rotateLogFile();

    // Instance data
    std::mutex m_mutex;
    std::ofstream m_logFile;
    std::string m_logFilePath;
    size_t m_currentFileSize = 0;
    size_t m_maxFileSize = 10 * 1024 * 1024; // 10MB default
    size_t m_maxBackupFiles = 5;

    struct OperationMetrics {
        double totalLatency = 0.0;
        double maxLatency = 0.0;
        uint64_t operationCount = 0;
        uint64_t failureCount = 0;
    };

    std::unordered_map<std::string, OperationMetrics> m_metrics;
    std::mutex m_metricsMutex;

    static std::unique_ptr<Logger> s_instance;
    static std::mutex s_lifecycleMutex;
    static std::atomic<Level> s_currentLevel;
    static std::atomic<bool> s_consoleEnabled;
    static std::atomic<bool> s_fileEnabled;
    static std::atomic<bool> s_initialized;
};

// Convenience macros
#define LOG_TRACE(...) ::vani::Logger::trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::vani::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...) ::vani::Logger::info(__VA_ARGS__)
#define LOG_WARN(...) ::vani::Logger::warning(__VA_ARGS__)
#define LOG_ERROR(...) ::vani::Logger::error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::vani::Logger::critical(__VA_ARGS__)

#define LOG_LATENCY(op, ms) ::vani::Logger::logLatency(op, ms)

} // namespace vani
