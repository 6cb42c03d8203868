#include "Logger.hpp"
#include <tray-icon/Constants.hpp>
#include <chrono>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

#ifdef Q_OS_LINUX
#include <syslog.h>
#endif

namespace tray_icon {

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string source;
    std::string function;
};

class Logger::Private {
public:
    LogLevel currentLevel{LogLevel::Info};
    LogDestination destination{LogDestination::Console};
    std::string logFile;
    bool includeTimestamps{true};
    bool includeSourceInfo{true};

    std::deque<LogEntry> recentLogs;
    size_t maxRecentLogs{MAX_RECENT_LOGS};
    mutable std::mutex logMutex;
    std::unique_ptr<std::ofstream> fileStream;

    void openLogFile() {
        if (!logFile.empty()) {
            fileStream = std::make_unique<std::ofstream>(
                logFile, std::ios::app);
        }
    }

    void closeLogFile() {
        if (fileStream) {
            fileStream->close();
            fileStream.reset();
        }
    }

    void writeToConsole(LogLevel level, const std::string& formattedMessage) {
        auto& stream = level >= LogLevel::Warning ? std::cerr : std::cout;
        stream << formattedMessage << std::endl;
    }

    void writeToFile(const std::string& formattedMessage) {
        if (!fileStream || !fileStream->is_open()) {
            openLogFile();
        }

        if (fileStream && fileStream->is_open()) {
            (*fileStream) << formattedMessage << std::endl;
        }
    }

    void writeToSystem(LogLevel level, const std::string& formattedMessage) {
#ifdef Q_OS_LINUX
        int priority = LOG_INFO;
        switch (level) {
            case LogLevel::Debug:    priority = LOG_DEBUG; break;
            case LogLevel::Info:     priority = LOG_INFO; break;
            case LogLevel::Warning:  priority = LOG_WARNING; break;
            case LogLevel::Error:    priority = LOG_ERR; break;
            case LogLevel::Critical: priority = LOG_CRIT; break;
        }
        syslog(priority, "%s", formattedMessage.c_str());
#else
        (void)level;
        std::cerr << formattedMessage << std::endl;
#endif
    }

    void pruneRecentLogs() {
        while (recentLogs.size() > maxRecentLogs) {
            recentLogs.pop_front();
        }
    }
};

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : d(std::make_unique<Private>()) {
}

Logger::~Logger() = default;

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->currentLevel = level;
}

LogLevel Logger::logLevel() const {
    std::lock_guard<std::mutex> lock(d->logMutex);
    return d->currentLevel;
}

void Logger::setLogDestination(LogDestination dest) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->destination = dest;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->closeLogFile();
    d->logFile = filename;
    d->openLogFile();
}

void Logger::enableTimestamps(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeTimestamps = enable;
}

void Logger::enableSourceInfo(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeSourceInfo = enable;
}

void Logger::debug(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Debug, message, source, function);
}

void Logger::info(const std::string& message,
                 const std::string& source,
                 const std::string& function) {
    log(LogLevel::Info, message, source, function);
}

void Logger::warning(const std::string& message,
                    const std::string& source,
                    const std::string& function) {
    log(LogLevel::Warning, message, source, function);
}

void Logger::error(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Error, message, source, function);
}

void Logger::critical(const std::string& message,
                     const std::string& source,
                     const std::string& function) {
    log(LogLevel::Critical, message, source, function);
}

void Logger::log(LogLevel level,
                const std::string& message,
                const std::string& source,
                const std::string& function) {
    {
        std::lock_guard<std::mutex> lock(d->logMutex);

        if (level < d->currentLevel) {
            return;
        }

        d->recentLogs.push_back(LogEntry{
            std::chrono::system_clock::now(),
            level,
            message,
            source,
            function
        });
        d->pruneRecentLogs();

        std::string formattedMessage = formatLogMessage(
            level, message, source, function);

        if (d->destination == LogDestination::Console ||
            d->destination == LogDestination::All) {
            d->writeToConsole(level, formattedMessage);
        }

        if (d->destination == LogDestination::File ||
            d->destination == LogDestination::All) {
            d->writeToFile(formattedMessage);
        }

        if (d->destination == LogDestination::System ||
            d->destination == LogDestination::All) {
            d->writeToSystem(level, formattedMessage);
        }
    }

    // Emitted unlocked: slots may log again.
    emit logAdded(level, message);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    if (d->fileStream) {
        d->fileStream->flush();
    }
}

void Logger::clear() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->recentLogs.clear();
}

std::vector<std::string> Logger::getRecentLogs(size_t count) const {
    std::vector<std::string> result;
    std::lock_guard<std::mutex> lock(d->logMutex);

    size_t start = (count >= d->recentLogs.size()) ? 0 :
                   d->recentLogs.size() - count;

    for (size_t i = start; i < d->recentLogs.size(); ++i) {
        const auto& entry = d->recentLogs[i];
        result.push_back(formatLogMessage(
            entry.level,
            entry.message,
            entry.source,
            entry.function
        ));
    }

    return result;
}

LogLevel Logger::levelFromInt(int level) {
    switch (level) {
        case 0:  return LogLevel::Debug;
        case 1:  return LogLevel::Info;
        case 2:  return LogLevel::Warning;
        case 3:  return LogLevel::Error;
        case 4:  return LogLevel::Critical;
        default: return LogLevel::Info;
    }
}

std::string Logger::formatLogMessage(LogLevel level,
                                   const std::string& message,
                                   const std::string& source,
                                   const std::string& function) const {
    std::stringstream ss;

    if (d->includeTimestamps) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << " ";
    }

    ss << "[" << getLevelString(level) << "] ";

    if (d->includeSourceInfo && !source.empty()) {
        ss << source;
        if (!function.empty()) {
            ss << ":" << function;
        }
        ss << " - ";
    }

    ss << message;
    return ss.str();
}

std::string Logger::getLevelString(LogLevel level) const {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

} // namespace tray_icon
