#pragma once
#include "config_types.h"
#include <QMap>
#include <QProcessEnvironment>
#include <QString>

// Resolves RelayConfig once at startup. Values come from an optional .env
// file overlaid by the process environment; process values win.
class ConfigStore {
public:
    ConfigStore() = default;

    bool load(const QString& envFilePath,
              const QProcessEnvironment& environment = QProcessEnvironment::systemEnvironment());

    void overrideListenAddress(const QString& address);
    void overridePort(int port);

    const RelayConfig& relayConfig() const { return m_config; }
    QString value(const QString& key, const QString& fallback = QString()) const;
    bool loadedEnvFile() const { return m_loadedEnvFile; }

    static QMap<QString, QString> parseEnvFile(const QByteArray& content);
    static QString defaultStaticDir();

private:
    RelayConfig m_config;
    QMap<QString, QString> m_values;
    bool m_loadedEnvFile = false;

    int intValue(const QString& key, int fallback, int minValue, int maxValue) const;
    void resolve();
};
