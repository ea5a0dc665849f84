#include <QTest>

#include "server/request_router.h"

Q_DECLARE_METATYPE(Endpoint)

class TestRequestRouter : public QObject {
    Q_OBJECT

private slots:
    void defaultRoutesResolve_data();
    void defaultRoutesResolve();
    void methodNormalized();
    void wildcardNeedsRemainder();
    void unknownPathIsNotFound();
    void wrongMethodIsNotAllowed();
};

void TestRequestRouter::defaultRoutesResolve_data()
{
    QTest::addColumn<QString>("method");
    QTest::addColumn<QString>("path");
    QTest::addColumn<Endpoint>("endpoint");

    QTest::newRow("health") << QStringLiteral("GET") << QStringLiteral("/health") << Endpoint::Health;
    QTest::newRow("generate") << QStringLiteral("POST") << QStringLiteral("/api/generate") << Endpoint::Generate;
    QTest::newRow("status") << QStringLiteral("GET") << QStringLiteral("/api/colab-status") << Endpoint::UpstreamStatus;
    QTest::newRow("index") << QStringLiteral("GET") << QStringLiteral("/") << Endpoint::Index;
    QTest::newRow("asset") << QStringLiteral("GET") << QStringLiteral("/static/css/app.css") << Endpoint::StaticAsset;
}

void TestRequestRouter::defaultRoutesResolve()
{
    QFETCH(QString, method);
    QFETCH(QString, path);
    QFETCH(Endpoint, endpoint);

    RequestRouter router;
    router.registerDefaults();

    const auto route = router.match(method, path);
    QVERIFY(route.has_value());
    QCOMPARE(route->endpoint, endpoint);
}

void TestRequestRouter::methodNormalized()
{
    RequestRouter router;
    router.registerDefaults();

    const auto route = router.match(QStringLiteral(" post "), QStringLiteral("/api/generate"));
    QVERIFY(route.has_value());
    QCOMPARE(route->endpoint, Endpoint::Generate);
}

void TestRequestRouter::wildcardNeedsRemainder()
{
    RequestRouter router;
    router.registerDefaults();

    QVERIFY(!router.match(QStringLiteral("GET"), QStringLiteral("/static/")).has_value());
    QVERIFY(!router.match(QStringLiteral("GET"), QStringLiteral("/staticfoo")).has_value());
}

void TestRequestRouter::unknownPathIsNotFound()
{
    RequestRouter router;
    router.registerDefaults();

    QVERIFY(!router.match(QStringLiteral("GET"), QStringLiteral("/api/unknown")).has_value());
    QCOMPARE(router.explainMiss(QStringLiteral("/api/unknown")), RequestRouter::MatchError::NotFound);
}

void TestRequestRouter::wrongMethodIsNotAllowed()
{
    RequestRouter router;
    router.registerDefaults();

    QVERIFY(!router.match(QStringLiteral("GET"), QStringLiteral("/api/generate")).has_value());
    QCOMPARE(router.explainMiss(QStringLiteral("/api/generate")),
             RequestRouter::MatchError::MethodNotAllowed);
    QCOMPARE(router.allowedMethods(QStringLiteral("/api/generate")), QStringList{QStringLiteral("POST")});
}

QTEST_MAIN(TestRequestRouter)
#include "tst_request_router.moc"
