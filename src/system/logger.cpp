#include "system/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace vani {

std::unique_ptr<Logger> Logger::s_instance;
std::mutex Logger::s_lifecycleMutex;
std::atomic<Logger::Level> Logger::s_currentLevel{Logger::Level::Info};
std::atomic<bool> Logger::s_consoleEnabled{true};
std::atomic<bool> Logger::s_fileEnabled{false};
std::atomic<bool> Logger::s_initialized{false};

Logger::Logger() = default;

Logger::~Logger() {
    if (m_logFile.is_open()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

bool Logger::initialize(const std::string& logFile, Level minLevel, bool enableConsole) {
    std::lock_guard<std::mutex> lifecycle(s_lifecycleMutex);

    if (s_initialized.load()) {
        s_currentLevel.store(minLevel);
        s_consoleEnabled.store(enableConsole);
        return true;
    }

    // The instance outlives shutdown() so late writers never see freed memory
    if (!s_instance) {
        s_instance = std::make_unique<Logger>();
    }

    {
        std::lock_guard<std::mutex> lock(s_instance->m_mutex);
        if (!logFile.empty()) {
            s_instance->m_logFile.open(logFile, std::ios::out | std::ios::app);
            if (!s_instance->m_logFile.is_open()) {
                std::cerr << "Logger: cannot open log file " << logFile << std::endl;
                return false;
            }
            s_instance->m_logFilePath = logFile;
            s_instance->m_currentFileSize = static_cast<size_t>(s_instance->m_logFile.tellp());
            s_fileEnabled.store(true);
        } else {
            s_instance->m_logFilePath.clear();
            s_fileEnabled.store(false);
        }
    }

    s_currentLevel.store(minLevel);
    s_consoleEnabled.store(enableConsole);
    s_initialized.store(true);
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lifecycle(s_lifecycleMutex);
    if (!s_initialized.exchange(false)) {
        return;
    }
    flush();
    std::lock_guard<std::mutex> lock(s_instance->m_mutex);
    if (s_instance->m_logFile.is_open()) {
        s_instance->m_logFile.close();
    }
    s_fileEnabled.store(false);
}

bool Logger::isInitialized() {
    return s_initialized.load();
}

void Logger::setLevel(Level level) {
    s_currentLevel.store(level);
}

Logger::Level Logger::getLevel() {
    return s_currentLevel.load();
}

void Logger::setConsoleOutput(bool enable) {
    s_consoleEnabled.store(enable);
}

void Logger::setFileOutput(bool enable) {
    s_fileEnabled.store(enable);
}

void Logger::setMaxFileSize(size_t maxSize) {
    if (s_instance) {
        std::lock_guard<std::mutex> lock(s_instance->m_mutex);
        s_instance->m_maxFileSize = maxSize;
    }
}

void Logger::setMaxBackupFiles(size_t maxBackups) {
    if (s_instance) {
        std::lock_guard<std::mutex> lock(s_instance->m_mutex);
        s_instance->m_maxBackupFiles = maxBackups;
    }
}

Logger::Level Logger::levelFromString(const std::string& name, Level fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warning" || lower == "warn") return Level::Warning;
    if (lower == "error") return Level::Error;
    if (lower == "critical") return Level::Critical;
    return fallback;
}

void Logger::logLatency(const std::string& operation, double latencyMs) {
    if (!s_instance) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(s_instance->m_metricsMutex);
        auto& metrics = s_instance->m_metrics[operation];
        metrics.totalLatency += latencyMs;
        metrics.maxLatency = std::max(metrics.maxLatency, latencyMs);
        metrics.operationCount++;
    }
    debug("Latency {}: {} ms", operation, latencyMs);
}

void Logger::countFailure(const std::string& operation) {
    if (!s_instance) {
        return;
    }
    std::lock_guard<std::mutex> lock(s_instance->m_metricsMutex);
    s_instance->m_metrics[operation].failureCount++;
}

uint64_t Logger::getFailureCount(const std::string& operation) {
    if (!s_instance) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(s_instance->m_metricsMutex);
    auto it = s_instance->m_metrics.find(operation);
    return it == s_instance->m_metrics.end() ? 0 : it->second.failureCount;
}

void Logger::resetCounters() {
    if (!s_instance) {
        return;
    }
    std::lock_guard<std::mutex> lock(s_instance->m_metricsMutex);
    s_instance->m_metrics.clear();
}

void Logger::flush() {
    if (!s_instance) {
        return;
    }
    std::lock_guard<std::mutex> lock(s_instance->m_mutex);
    if (s_instance->m_logFile.is_open()) {
        s_instance->m_logFile.flush();
    }
    std::cout.flush();
}

std::string Logger::levelToString(Level level) {
    switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

void Logger::write(Level level, const std::string& message) {
    Logger* instance = s_instance.get();
    if (!instance) {
        return;
    }

    std::lock_guard<std::mutex> lock(instance->m_mutex);

    if (s_consoleEnabled.load()) {
        if (level >= Level::Error) {
            std::cerr << message << '\n';
        } else {
            std::cout << message << '\n';
        }
    }

    if (s_fileEnabled.load() && instance->m_logFile.is_open()) {
        instance->m_logFile << message << '\n';
        instance->m_currentFileSize += message.size() + 1;
        if (instance->m_currentFileSize >= instance->m_maxFileSize) {
            rotateLogFile();
        }
    }
}

// Called with the instance mutex held
void Logger::rotateLogFile() {
    Logger* instance = s_instance.get();
    if (!instance || instance->m_logFilePath.empty()) {
        return;
    }

    instance->m_logFile.close();

    const std::string& base = instance->m_logFilePath;
    for (size_t i = instance->m_maxBackupFiles; i > 0; --i) {
        std::string from = i == 1 ? base : base + "." + std::to_string(i - 1);
        std::string to = base + "." + std::to_string(i);
        std::rename(from.c_str(), to.c_str());
    }

    instance->m_logFile.open(base, std::ios::out | std::ios::trunc);
    instance->m_currentFileSize = 0;
}

} // namespace vani
