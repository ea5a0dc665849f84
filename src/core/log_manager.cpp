#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>
#include <QDebug>
#include <cstdio>

namespace {

const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

QString currentTimestamp()
{
    return QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
}

}

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::initialize(const QString& logDir, Level minLevel) {
    QMutexLocker locker(&m_mutex);
    m_minLevel = minLevel;

    if (m_logFile.isOpen())
        m_logFile.close();
    if (logDir.isEmpty())
        return;

    QDir().mkpath(logDir);
    QString logPath = logDir + "/promptrelay.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
        m_logFile.close();
    }
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }

    const QString timestamp = currentTimestamp();
    QMutexLocker locker(&m_mutex);
    if (level < m_minLevel)
        return;

    const QString formatted = QString("[%1] [%2] [%3] %4")
        .arg(timestamp, kLevelNames[level], category, message);
    const QByteArray line = formatted.toUtf8() + '\n';

    // console output
    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    std::fflush(stderr);

    // file output
    if (m_logFile.isOpen()) {
        QTextStream stream(&m_logFile);
        stream << formatted << "\n";
        stream.flush();
    }
}

LogManager::Level LogManager::levelFromString(const QString& name, Level fallback) {
    const QString normalized = name.trimmed().toLower();
    if (normalized == "debug")
        return Debug;
    if (normalized == "info")
        return Info;
    if (normalized == "warn" || normalized == "warning")
        return Warning;
    if (normalized == "error")
        return Error;
    return fallback;
}
