#pragma once
#include <QObject>
#include <string>
#include <memory>
#include <vector>

namespace tray_icon {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

enum class LogDestination {
    Console,
    File,
    System,
    All
};

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // Configuration
    void setLogLevel(LogLevel level);
    LogLevel logLevel() const;
    void setLogDestination(LogDestination dest);
    void setLogFile(const std::string& filename);
    void enableTimestamps(bool enable);
    void enableSourceInfo(bool enable);

    // Logging methods
    void debug(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void info(const std::string& message,
             const std::string& source = "",
             const std::string& function = "");
    void warning(const std::string& message,
                const std::string& source = "",
                const std::string& function = "");
    void error(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void critical(const std::string& message,
                 const std::string& source = "",
                 const std::string& function = "");

    void flush();
    void clear();
    std::vector<std::string> getRecentLogs(size_t count = 100) const;

    static LogLevel levelFromInt(int level);

signals:
    void logAdded(tray_icon::LogLevel level, const std::string& message);

private:
    Logger();
    ~Logger();

    void log(LogLevel level,
             const std::string& message,
             const std::string& source,
             const std::string& function);
    std::string formatLogMessage(LogLevel level,
                               const std::string& message,
                               const std::string& source,
                               const std::string& function) const;
    std::string getLevelString(LogLevel level) const;

    class Private;
    std::unique_ptr<Private> d;
};

#define TRAY_LOG_DEBUG(msg) \
    ::tray_icon::Logger::instance().debug(msg, __FILE__, __FUNCTION__)
#define TRAY_LOG_INFO(msg) \
    ::tray_icon::Logger::instance().info(msg, __FILE__, __FUNCTION__)
#define TRAY_LOG_WARNING(msg) \
    ::tray_icon::Logger::instance().warning(msg, __FILE__, __FUNCTION__)
#define TRAY_LOG_ERROR(msg) \
    ::tray_icon::Logger::instance().error(msg, __FILE__, __FUNCTION__)
#define TRAY_LOG_CRITICAL(msg) \
    ::tray_icon::Logger::instance().critical(msg, __FILE__, __FUNCTION__)

} // namespace tray_icon
