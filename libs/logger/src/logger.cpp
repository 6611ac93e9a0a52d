#include "logger/logger.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QStringList>
#include <QThread>


namespace {

    struct LevelName {
        Logger::LogLevel level;
        const char* name;
    };

    const LevelName kLevelNames[] = {
        { Logger::Debug,   "DEBUG" },
        { Logger::Info,    "INFO" },
        { Logger::Warning, "WARNING" },
        { Logger::Error,   "ERROR" },
        { Logger::Fatal,   "FATAL" },
    };

} // namespace

Logger* Logger::instance() {
    // Never destroyed; LOG_* may run during static teardown
    static Logger* logger = new Logger();
    return logger;
}

Logger::Logger(QObject* parent)
    : QObject(parent)
    , m_logLevel(Info)
    , m_consoleOutput(true)
{
}

Logger::~Logger() {
    QMutexLocker locker(&m_mutex);
    closeFile();
}

void Logger::closeFile() {
    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logStream.setDevice(nullptr);
        m_logFile.close();
    }
}

void Logger::setLogFile(const QString& filePath) {
    QMutexLocker locker(&m_mutex);
    closeFile();

    const QFileInfo info(filePath);
    QDir().mkpath(info.absolutePath());

    m_logFile.setFileName(filePath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning().noquote() << "Cannot open log file" << filePath << ":" << m_logFile.errorString();
        return;
    }

    m_logStream.setDevice(&m_logFile);
    m_logStream << formatRecord(Info, QString("Logging to %1").arg(info.absoluteFilePath()), nullptr, -1) << '\n';
    m_logStream.flush();
}

void Logger::setLogLevel(LogLevel level) {
    m_logLevel.store(level);
}

bool Logger::setLogLevel(const QString& levelName) {
    LogLevel level;
    if (!logLevelFromString(levelName, level)) {
        return false;
    }
    setLogLevel(level);
    return true;
}

void Logger::enableConsoleOutput(bool enable) {
    QMutexLocker locker(&m_mutex);
    m_consoleOutput = enable;
}

void Logger::log(LogLevel level, const QString& message, const char* function, int line) {
    if (!isEnabled(level)) {
        return;
    }

    const QString record = formatRecord(level, message, function, line);

    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen()) {
        m_logStream << record << '\n';
        m_logStream.flush();
    }

    if (!m_consoleOutput) {
        return;
    }

    if (level >= Error) {
        qCritical().noquote() << record;
    } else if (level == Warning) {
        qWarning().noquote() << record;
    } else {
        qInfo().noquote() << record;
    }
}

void Logger::logData(LogLevel level, const QMap<QString, QVariant>& fields, const char* function, int line) {
    if (!isEnabled(level)) {
        return;
    }

    QStringList pairs;
    pairs.reserve(fields.size());
    for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
        pairs.append(QString("%1=%2").arg(it.key(), it.value().isNull() ? QStringLiteral("NULL")
                                                                         : it.value().toString()));
    }

    log(level, pairs.join(' '), function, line);
}

QString Logger::logLevelToString(LogLevel level) {
    for (const LevelName& entry : kLevelNames) {
        if (entry.level == level) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QStringLiteral("UNKNOWN");
}

bool Logger::logLevelFromString(const QString& name, LogLevel& level) {
    const QString wanted = name.trimmed().toUpper();
    if (wanted == QLatin1String("WARN")) {
        level = Warning;
        return true;
    }

    for (const LevelName& entry : kLevelNames) {
        if (wanted == QLatin1String(entry.name)) {
            level = entry.level;
            return true;
        }
    }
    return false;
}

QString Logger::shortFunctionName(const char* function) {
    // Q_FUNC_INFO reads "ret Class::method(args) const"
    QString name = QString::fromLatin1(function);
    const int paren = name.indexOf('(');
    if (paren > 0) {
        name.truncate(paren);
    }
    return name.mid(name.lastIndexOf(' ') + 1);
}

QString Logger::formatRecord(LogLevel level, const QString& message, const char* function, int line) {
    const QString timestamp = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const QString thread = QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()), 16);

    QString record = QString("%1 %2 [%3] ")
                         .arg(timestamp, logLevelToString(level).leftJustified(7), thread);

    if (function != nullptr && *function != '\0') {
        record += shortFunctionName(function);
        if (line >= 0) {
            record += QString(":%1").arg(line);
        }
        record += ' ';
    }

    return record + message;
}
