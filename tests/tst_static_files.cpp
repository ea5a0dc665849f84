#include <QTest>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <memory>
#include "server/static_files.h"

class TestStaticFiles : public QObject {
    Q_OBJECT

private slots:
    void init() {
        m_dir.reset(new QTemporaryDir);
        QVERIFY(m_dir->isValid());
        m_root = m_dir->path() + QStringLiteral("/frontend");
        QVERIFY(QDir().mkpath(m_root + QStringLiteral("/css")));
        writeFile(m_root + QStringLiteral("/index.html"), "<html><body>relay</body></html>");
        writeFile(m_root + QStringLiteral("/css/app.css"), "body { margin: 0; }");
        writeFile(m_root + QStringLiteral("/app.js"), "console.log('hi');");
        writeFile(m_dir->path() + QStringLiteral("/secret.env"), "COLAB_API_URL=http://x");
    }

    void testServesIndex() {
        StaticFiles files(m_root);
        const HttpResponse resp = files.serveIndex();
        QCOMPARE(resp.status, 200);
        QVERIFY(resp.contentType.startsWith(QStringLiteral("text/html")));
        QCOMPARE(resp.body, QByteArrayLiteral("<html><body>relay</body></html>"));
    }

    void testServesNestedAsset() {
        StaticFiles files(m_root);
        const HttpResponse resp = files.serve(QStringLiteral("css/app.css"));
        QCOMPARE(resp.status, 200);
        QVERIFY(resp.contentType.startsWith(QStringLiteral("text/css")));
        QCOMPARE(resp.body, QByteArrayLiteral("body { margin: 0; }"));
    }

    void testScriptContentType() {
        StaticFiles files(m_root);
        const HttpResponse resp = files.serve(QStringLiteral("app.js"));
        QCOMPARE(resp.status, 200);
        QVERIFY(resp.contentType.contains(QStringLiteral("javascript")));
    }

    void testMissingFileIs404() {
        StaticFiles files(m_root);
        QCOMPARE(files.serve(QStringLiteral("nope.png")).status, 404);
        QCOMPARE(files.serve(QStringLiteral("css")).status, 404);
        QCOMPARE(files.serve(QString()).status, 404);
    }

    void testTraversalIsRejected_data() {
        QTest::addColumn<QString>("path");
        QTest::newRow("parent") << QStringLiteral("../secret.env");
        QTest::newRow("nested parent") << QStringLiteral("css/../../secret.env");
        QTest::newRow("absolute") << QStringLiteral("/etc/passwd");
        QTest::newRow("backslash") << QStringLiteral("..\\secret.env");
    }

    void testTraversalIsRejected() {
        QFETCH(QString, path);
        StaticFiles files(m_root);
        QVERIFY(!files.resolve(path).has_value());
        QCOMPARE(files.serve(path).status, 404);
    }

    void testMissingRootServesNothing() {
        StaticFiles files(m_dir->path() + QStringLiteral("/does-not-exist"));
        QCOMPARE(files.serveIndex().status, 404);
    }

private:
    static void writeFile(const QString& path, const QByteArray& content) {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(content);
    }

    std::unique_ptr<QTemporaryDir> m_dir;
    QString m_root;
};

QTEST_MAIN(TestStaticFiles)
#include "tst_static_files.moc"
