#pragma once

#include <QFile>
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QTextStream>
#include <QVariant>

#include <atomic>

/**
 * @brief Process-wide, thread-safe logger
 *
 * One record per line:
 *   2024-04-01T00:58:30.120Z INFO  [tid] Class::method:42 message
 * Timestamps are UTC. Records go to the log file once one is set and to the
 * Qt message handlers while console output is enabled. Records below the
 * configured level are dropped before they are formatted.
 */
class Logger : public QObject {
    Q_OBJECT
public:
    enum LogLevel {
        Debug,
        Info,
        Warning,
        Error,
        Fatal
    };

    static Logger* instance();

    // Opened in append mode; missing directories are created
    void setLogFile(const QString& filePath);
    void setLogLevel(LogLevel level);

    /**
     * @brief Set the level from its name (debug, info, warning/warn, error, fatal)
     * @return False if the name is not recognised; the level is unchanged then
     */
    bool setLogLevel(const QString& levelName);
    void enableConsoleOutput(bool enable);

    LogLevel getLogLevel() const { return m_logLevel.load(); }
    bool isEnabled(LogLevel level) const { return level >= m_logLevel.load(); }

    void log(LogLevel level, const QString& message, const char* function = nullptr, int line = -1);

    // "key=value key=value" in key order; null values print as NULL
    void logData(LogLevel level, const QMap<QString, QVariant>& fields,
                 const char* function = nullptr, int line = -1);

    static QString logLevelToString(LogLevel level);
    static bool logLevelFromString(const QString& name, LogLevel& level);

private:
    explicit Logger(QObject* parent = nullptr);
    ~Logger() override;

    static QString formatRecord(LogLevel level, const QString& message, const char* function, int line);
    static QString shortFunctionName(const char* function);

    // Caller holds m_mutex
    void closeFile();

    QMutex m_mutex;
    QFile m_logFile;
    QTextStream m_logStream;
    std::atomic<LogLevel> m_logLevel;
    bool m_consoleOutput;
};

#define LOG_DEBUG(msg) Logger::instance()->log(Logger::Debug, msg, Q_FUNC_INFO, __LINE__)
#define LOG_INFO(msg) Logger::instance()->log(Logger::Info, msg, Q_FUNC_INFO, __LINE__)
#define LOG_WARNING(msg) Logger::instance()->log(Logger::Warning, msg, Q_FUNC_INFO, __LINE__)
#define LOG_ERROR(msg) Logger::instance()->log(Logger::Error, msg, Q_FUNC_INFO, __LINE__)
#define LOG_FATAL(msg) Logger::instance()->log(Logger::Fatal, msg, Q_FUNC_INFO, __LINE__)

#define LOG_DATA(level, data) Logger::instance()->logData(level, data, Q_FUNC_INFO, __LINE__)
