#include <QtTest/QtTest>

#include "core/sidecar/sidecar_supervisor.h"
#include "fake_status_server.h"
#include "process_test_utils.h"

#include <QElapsedTimer>
#include <QSignalSpy>
#include <QTemporaryDir>

class TestSidecarLifecycle : public QObject {
    Q_OBJECT

private slots:
    void testStartWaitsForStatusEndpointThenStops();
    void testNonSuccessStatusTimesOut();
    void testStopDuringStartupFromProbeCallback();
};

namespace {

oni::SidecarConfig sleeperConfig(const QString& scriptPath, quint16 port)
{
    oni::SidecarConfig config;
    config.port = port;
    config.interpreter = QStringLiteral("/bin/sh");
    config.interpreterArgs = {};
    config.devScriptPath = scriptPath;
    return config;
}

} // namespace

void TestSidecarLifecycle::testStartWaitsForStatusEndpointThenStops()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString script = tempDir.filePath(QStringLiteral("server.sh"));
    QVERIFY(oni::test::writeSleeperScript(script));

    oni::test::FakeStatusServer server;
    QVERIFY(server.listen());

    oni::SidecarSupervisor supervisor(sleeperConfig(script, server.port()));
    QSignalSpy readySpy(&supervisor, &oni::SidecarSupervisor::sidecarReady);

    QElapsedTimer timer;
    timer.start();
    const oni::SidecarStartResult result = supervisor.start(oni::BuildMode::Development);
    QVERIFY2(result.ok, qPrintable(result.errorMessage));
    QVERIFY(timer.elapsed() >= 300);
    QVERIFY(timer.elapsed() < 5000);

    QCOMPARE(result.port, server.port());
    QCOMPARE(readySpy.count(), 1);
    QVERIFY(server.requestCount() >= 1);
    QCOMPARE(server.requestedPaths().first(), QStringLiteral("/api/oni/status"));

    const QJsonObject snapshot = supervisor.snapshot();
    QCOMPARE(snapshot.value(QStringLiteral("state")).toString(), QStringLiteral("ready"));
    QVERIFY(snapshot.value(QStringLiteral("running")).toBool());

    const qint64 pid = supervisor.processId();
    QVERIFY(oni::test::processIsAlive(pid));
    supervisor.stop();
    QVERIFY(!oni::test::processIsAlive(pid));
    QCOMPARE(supervisor.state(), oni::SidecarState::Stopped);
}

void TestSidecarLifecycle::testNonSuccessStatusTimesOut()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString script = tempDir.filePath(QStringLiteral("server.sh"));
    QVERIFY(oni::test::writeSleeperScript(script));

    oni::test::FakeStatusServer server;
    server.setStatusCode(503);
    QVERIFY(server.listen());

    oni::SidecarConfig config = sleeperConfig(script, server.port());
    config.readyTimeoutMs = 1200;
    oni::SidecarSupervisor supervisor(config);

    const oni::SidecarStartResult result = supervisor.start(oni::BuildMode::Development);
    QVERIFY(!result.ok);
    QCOMPARE(result.errorKind, oni::SidecarErrorKind::ReadinessTimeout);
    QCOMPARE(result.errorMessage,
             QStringLiteral("Sidecar server did not become ready within 1.2 seconds"));
    QVERIFY(server.requestCount() >= 2);

    const qint64 pid = supervisor.processId();
    QVERIFY(oni::test::processIsAlive(pid));
    supervisor.stop();
    QVERIFY(!oni::test::processIsAlive(pid));
}

void TestSidecarLifecycle::testStopDuringStartupFromProbeCallback()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString script = tempDir.filePath(QStringLiteral("server.sh"));
    QVERIFY(oni::test::writeSleeperScript(script));

    // Nothing listens on the port; the wait would run the full budget.
    oni::test::FakeStatusServer server;
    QVERIFY(server.listen());
    const quint16 deadPort = server.port();
    server.close();

    oni::SidecarSupervisor supervisor(sleeperConfig(script, deadPort));
    QTimer::singleShot(800, &supervisor, [&supervisor]() { supervisor.stop(); });

    QElapsedTimer timer;
    timer.start();
    const oni::SidecarStartResult result = supervisor.start(oni::BuildMode::Development);
    QVERIFY(!result.ok);
    QCOMPARE(result.errorKind, oni::SidecarErrorKind::Cancelled);
    QVERIFY2(timer.elapsed() < 5000, "stop() must end the readiness wait early");
    QVERIFY(!supervisor.hasTrackedProcess());
    QCOMPARE(supervisor.state(), oni::SidecarState::Stopped);
}

QTEST_MAIN(TestSidecarLifecycle)
#include "test_sidecar_lifecycle.moc"
