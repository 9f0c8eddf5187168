#include <QtTest/QtTest>

#include "core/sidecar/health_probe.h"
#include "fake_status_server.h"

#include <QElapsedTimer>
#include <QHostAddress>
#include <QTcpServer>

namespace {

quint16 unusedLocalPort()
{
    QTcpServer probe;
    if (!probe.listen(QHostAddress::LocalHost, 0)) {
        return 0;
    }
    const quint16 port = probe.serverPort();
    probe.close();
    return port;
}

} // namespace

class TestHealthProbe : public QObject {
    Q_OBJECT

private slots:
    void testStatusUrlFormat();
    void testSuccessStatusIsReady();
    void testServiceUnavailableIsNotReady();
    void testUnknownPathIsNotReady();
    void testConnectionRefusedIsNotReady();
    void testSilentServerTimesOut();
};

void TestHealthProbe::testStatusUrlFormat()
{
    QCOMPARE(oni::statusUrl(5173, QStringLiteral("/api/oni/status")).toString(),
             QStringLiteral("http://127.0.0.1:5173/api/oni/status"));
    QCOMPARE(oni::statusUrl(8080, QStringLiteral("health")).toString(),
             QStringLiteral("http://127.0.0.1:8080/health"));
}

void TestHealthProbe::testSuccessStatusIsReady()
{
    oni::test::FakeStatusServer server;
    QVERIFY(server.listen());

    oni::HttpHealthProbe probe;
    QVERIFY(probe.probe(oni::statusUrl(server.port(), QStringLiteral("/api/oni/status")), 2000));
    QCOMPARE(probe.lastStatusCode(), 200);
    QCOMPARE(server.requestedPaths(), QStringList{QStringLiteral("/api/oni/status")});
}

void TestHealthProbe::testServiceUnavailableIsNotReady()
{
    oni::test::FakeStatusServer server;
    server.setStatusCode(503);
    QVERIFY(server.listen());

    oni::HttpHealthProbe probe;
    QVERIFY(!probe.probe(oni::statusUrl(server.port(), QStringLiteral("/api/oni/status")), 2000));
    QCOMPARE(probe.lastStatusCode(), 503);

    // Same probe object recovers once the endpoint does.
    server.setStatusCode(200);
    QVERIFY(probe.probe(oni::statusUrl(server.port(), QStringLiteral("/api/oni/status")), 2000));
    QCOMPARE(server.requestCount(), 2);
}

void TestHealthProbe::testUnknownPathIsNotReady()
{
    oni::test::FakeStatusServer server;
    QVERIFY(server.listen());

    oni::HttpHealthProbe probe;
    QVERIFY(!probe.probe(oni::statusUrl(server.port(), QStringLiteral("/healthz")), 2000));
    QCOMPARE(probe.lastStatusCode(), 404);
}

void TestHealthProbe::testConnectionRefusedIsNotReady()
{
    const quint16 port = unusedLocalPort();
    QVERIFY(port != 0);

    oni::HttpHealthProbe probe;
    QElapsedTimer timer;
    timer.start();
    QVERIFY(!probe.probe(oni::statusUrl(port, QStringLiteral("/api/oni/status")), 2000));
    QCOMPARE(probe.lastStatusCode(), 0);
    QVERIFY(timer.elapsed() < 2000);
}

void TestHealthProbe::testSilentServerTimesOut()
{
    // Accepts connections but never answers.
    QTcpServer silent;
    QVERIFY(silent.listen(QHostAddress::LocalHost, 0));

    oni::HttpHealthProbe probe;
    QElapsedTimer timer;
    timer.start();
    QVERIFY(!probe.probe(oni::statusUrl(silent.serverPort(), QStringLiteral("/api/oni/status")), 300));
    QCOMPARE(probe.lastStatusCode(), 0);
    QVERIFY2(timer.elapsed() < 2000, "Probe ignored its timeout");
}

QTEST_MAIN(TestHealthProbe)
#include "test_health_probe.moc"
