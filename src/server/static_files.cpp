#include "static_files.h"
#include "core/log_manager.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMimeDatabase>

StaticFiles::StaticFiles(const QString& rootDir)
    : m_root(QDir::cleanPath(QFileInfo(rootDir).absoluteFilePath()))
{
}

std::optional<QString> StaticFiles::resolve(const QString& relativePath) const
{
    if (relativePath.isEmpty() || QDir::isAbsolutePath(relativePath))
        return std::nullopt;
    if (relativePath.contains(QLatin1Char('\\')) || relativePath.contains(QChar(0)))
        return std::nullopt;

    const QString candidate = QDir::cleanPath(m_root + QLatin1Char('/') + relativePath);
    if (!candidate.startsWith(m_root + QLatin1Char('/')))
        return std::nullopt;

    const QFileInfo info(candidate);
    if (!info.exists() || !info.isFile())
        return std::nullopt;

    // symlinks must not lead out of the root either
    const QString canonicalRoot = QFileInfo(m_root).canonicalFilePath();
    const QString canonical = info.canonicalFilePath();
    if (canonicalRoot.isEmpty() || !canonical.startsWith(canonicalRoot + QLatin1Char('/')))
        return std::nullopt;

    return candidate;
}

HttpResponse StaticFiles::serve(const QString& relativePath) const
{
    const auto path = resolve(relativePath);
    if (!path) {
        LOG_DEBUG("static", QStringLiteral("not found: %1").arg(relativePath));
        return HttpResponse::detail(404, QStringLiteral("Not Found"));
    }

    QFile file(*path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARNING("static", QStringLiteral("cannot read %1: %2").arg(*path, file.errorString()));
        return HttpResponse::detail(404, QStringLiteral("Not Found"));
    }

    static const QMimeDatabase mimeDb;
    QString contentType = mimeDb.mimeTypeForFile(*path, QMimeDatabase::MatchExtension).name();
    if (contentType.startsWith(QStringLiteral("text/"))
        || contentType == QStringLiteral("application/javascript"))
        contentType += QStringLiteral("; charset=utf-8");

    return HttpResponse::raw(file.readAll(), contentType);
}
