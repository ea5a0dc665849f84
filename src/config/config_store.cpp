#include "config_store.h"
#include "core/log_manager.h"
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QStringList>

namespace {

const char* const kUpstreamUrlKey = "COLAB_API_URL";

int clampInt(int value, int minValue, int maxValue)
{
    return qBound(minValue, value, maxValue);
}

QString unquote(const QString& raw)
{
    QString value = raw.trimmed();
    if (value.size() >= 2) {
        const QChar first = value.front();
        const QChar last = value.back();
        if ((first == QLatin1Char('"') || first == QLatin1Char('\'')) && first == last)
            return value.mid(1, value.size() - 2);
    }
    // unquoted values may carry a trailing " # comment"
    const int comment = value.indexOf(QStringLiteral(" #"));
    if (comment >= 0)
        value = value.left(comment).trimmed();
    return value;
}

}

QMap<QString, QString> ConfigStore::parseEnvFile(const QByteArray& content)
{
    QMap<QString, QString> values;
    const QStringList lines = QString::fromUtf8(content).split(QLatin1Char('\n'));
    for (QString line : lines) {
        line = line.trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#')))
            continue;
        if (line.startsWith(QStringLiteral("export ")))
            line = line.mid(7).trimmed();

        const int eq = line.indexOf(QLatin1Char('='));
        if (eq <= 0)
            continue;

        const QString key = line.left(eq).trimmed();
        if (key.isEmpty() || key.contains(QLatin1Char(' ')))
            continue;
        values[key] = unquote(line.mid(eq + 1));
    }
    return values;
}

QString ConfigStore::defaultStaticDir()
{
    return QDir::cleanPath(QCoreApplication::applicationDirPath() + QStringLiteral("/../frontend"));
}

bool ConfigStore::load(const QString& envFilePath, const QProcessEnvironment& environment)
{
    m_values.clear();
    m_loadedEnvFile = false;

    if (!envFilePath.isEmpty()) {
        QFile file(envFilePath);
        if (file.exists()) {
            if (file.open(QIODevice::ReadOnly)) {
                m_values = parseEnvFile(file.readAll());
                m_loadedEnvFile = true;
            } else {
                LOG_WARNING("config", QStringLiteral("ConfigStore: cannot read %1: %2")
                                          .arg(envFilePath, file.errorString()));
            }
        }
    }

    // process environment wins over the .env file
    const QStringList keys = environment.keys();
    for (const QString& key : keys)
        m_values[key] = environment.value(key);

    resolve();
    return m_loadedEnvFile;
}

QString ConfigStore::value(const QString& key, const QString& fallback) const
{
    return m_values.value(key, fallback);
}

int ConfigStore::intValue(const QString& key, int fallback, int minValue, int maxValue) const
{
    const QString raw = m_values.value(key).trimmed();
    if (raw.isEmpty())
        return fallback;

    bool ok = false;
    const int parsed = raw.toInt(&ok);
    if (!ok) {
        LOG_WARNING("config", QStringLiteral("ConfigStore: %1=%2 is not an integer, using %3")
                                  .arg(key, raw)
                                  .arg(fallback));
        return fallback;
    }
    return clampInt(parsed, minValue, maxValue);
}

void ConfigStore::resolve()
{
    RelayConfig config;

    config.upstream.baseUrl = m_values.value(QString::fromLatin1(kUpstreamUrlKey)).trimmed();
    config.upstream.generateTimeout = intValue(QStringLiteral("RELAY_GENERATE_TIMEOUT_MS"),
                                               config.upstream.generateTimeout, 1000, 3600000);
    config.upstream.statusTimeout = intValue(QStringLiteral("RELAY_STATUS_TIMEOUT_MS"),
                                             config.upstream.statusTimeout, 100, 300000);

    const QString host = m_values.value(QStringLiteral("RELAY_HOST")).trimmed();
    if (!host.isEmpty())
        config.server.listenAddress = host;
    config.server.port = intValue(QStringLiteral("RELAY_PORT"), config.server.port, 0, 65535);
    config.server.workerThreads = intValue(QStringLiteral("RELAY_WORKER_THREADS"),
                                           config.server.workerThreads, 1, 1024);
    config.server.maxRequestBytes = intValue(QStringLiteral("RELAY_MAX_REQUEST_BYTES"),
                                             config.server.maxRequestBytes, 1024, 64 * 1024 * 1024);

    const QString staticDir = m_values.value(QStringLiteral("RELAY_STATIC_DIR")).trimmed();
    config.staticDir = staticDir.isEmpty() ? defaultStaticDir() : staticDir;
    config.logDir = m_values.value(QStringLiteral("RELAY_LOG_DIR")).trimmed();

    const QString level = m_values.value(QStringLiteral("RELAY_LOG_LEVEL")).trimmed();
    if (!level.isEmpty())
        config.logLevel = level.toLower();

    m_config = config;
}

void ConfigStore::overrideListenAddress(const QString& address)
{
    if (!address.trimmed().isEmpty())
        m_config.server.listenAddress = address.trimmed();
}

void ConfigStore::overridePort(int port)
{
    m_config.server.port = clampInt(port, 0, 65535);
}
