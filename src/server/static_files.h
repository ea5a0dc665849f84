#pragma once
#include "http_message.h"
#include <QString>
#include <optional>

// Serves files from one fixed directory. Paths that leave the directory
// are treated as missing.
class StaticFiles {
public:
    explicit StaticFiles(const QString& rootDir);

    HttpResponse serve(const QString& relativePath) const;
    HttpResponse serveIndex() const { return serve(QStringLiteral("index.html")); }

    std::optional<QString> resolve(const QString& relativePath) const;
    const QString& rootDir() const { return m_root; }

private:
    QString m_root;
};
