#pragma once
#include <QObject>
#include <QFile>
#include <QMutex>
#include <QString>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance();

    enum Level { Debug, Info, Warning, Error };
    Q_ENUM(Level)

    void initialize(const QString& logDir, Level minLevel = Info);

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& category, const QString& msg)   { log(Debug, category, msg); }
    void info(const QString& category, const QString& msg)    { log(Info, category, msg); }
    void warning(const QString& category, const QString& msg) { log(Warning, category, msg); }
    void error(const QString& category, const QString& msg)   { log(Error, category, msg); }

    static Level levelFromString(const QString& name, Level fallback = Info);

private:
    ~LogManager() override;
    LogManager() = default;
    QFile m_logFile;
    Level m_minLevel = Info;
    QMutex m_mutex;
};

#define LOG_DEBUG(cat, msg) LogManager::instance().debug(QStringLiteral(cat), msg)
#define LOG_INFO(cat, msg) LogManager::instance().info(QStringLiteral(cat), msg)
#define LOG_WARNING(cat, msg) LogManager::instance().warning(QStringLiteral(cat), msg)
#define LOG_ERROR(cat, msg) LogManager::instance().error(QStringLiteral(cat), msg)
