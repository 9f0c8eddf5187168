#include "core/sidecar/sidecar_supervisor.h"
#include "core/sidecar/script_locator.h"
#include "core/shared/logging.h"

#include <QProcessEnvironment>

#include <algorithm>

namespace oni {

namespace {

std::unique_ptr<HealthProbe> probeOrDefault(std::unique_ptr<HealthProbe> probe)
{
    if (probe) {
        return probe;
    }
    return std::make_unique<HttpHealthProbe>();
}

std::unique_ptr<Clock> clockOrDefault(std::unique_ptr<Clock> clock)
{
    if (clock) {
        return clock;
    }
    return std::make_unique<SteadyClock>();
}

// Forceful kill followed by a synchronous reap so no zombie is left behind.
void killAndReap(QProcess& process, int timeoutMs)
{
    if (process.state() == QProcess::NotRunning) {
        return;
    }
    process.kill();
    if (!process.waitForFinished(timeoutMs)) {
        LOG_WARN(oniSidecar, "Sidecar (pid=%lld) did not exit within %dms after kill: %s",
                 process.processId(), timeoutMs, qPrintable(process.errorString()));
    }
}

} // namespace

SidecarSupervisor::SidecarSupervisor(SidecarConfig config, QObject* parent)
    : SidecarSupervisor(std::move(config), nullptr, nullptr, parent)
{
}

SidecarSupervisor::SidecarSupervisor(SidecarConfig config,
                                     std::unique_ptr<HealthProbe> probe,
                                     std::unique_ptr<Clock> clock,
                                     QObject* parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_probe(probeOrDefault(std::move(probe)))
    , m_clock(clockOrDefault(std::move(clock)))
    , m_poller(*m_clock, m_config.pollIntervalMs, m_config.readyTimeoutMs)
    , m_port(m_config.port)
{
}

SidecarSupervisor::~SidecarSupervisor()
{
    stop();
}

void SidecarSupervisor::setExecutableDir(const QString& dir)
{
    m_executableDir = dir;
}

void SidecarSupervisor::transitionState(SidecarState nextState)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == nextState) {
            return;
        }
        m_state = nextState;
    }
    emit stateChanged(sidecarStateToString(nextState));
}

SidecarStartResult SidecarSupervisor::fail(SidecarErrorKind kind, const QString& message)
{
    LOG_ERROR(oniSidecar, "%s", qPrintable(message));
    transitionState(SidecarState::Failed);
    emit sidecarFailed(message);

    SidecarStartResult result;
    result.ok = false;
    result.port = port();
    result.errorKind = kind;
    result.errorMessage = message;
    return result;
}

SidecarStartResult SidecarSupervisor::start(BuildMode mode)
{
    std::unique_ptr<QProcess> previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = std::move(m_process);
    }
    if (previous) {
        LOG_WARN(oniSidecar, "Sidecar already tracked (pid=%lld), stopping it before restart",
                 previous->processId());
        killAndReap(*previous, m_config.stopTimeoutMs);
        previous->disconnect();
        previous.reset();
    }

    m_poller.reset();
    transitionState(SidecarState::Starting);

    QString error;
    const QString exeDir = (mode == BuildMode::Production && m_executableDir.isEmpty())
        ? currentExecutableDir()
        : m_executableDir;
    const QString scriptPath = resolveServerScript(mode, exeDir, m_config, &error);
    if (scriptPath.isEmpty()) {
        return fail(SidecarErrorKind::PathResolution,
                    QStringLiteral("Failed to locate sidecar server script: %1").arg(error));
    }

    LOG_INFO(oniSidecar, "Starting sidecar server (%s): %s %s",
             qPrintable(buildModeToString(mode)),
             qPrintable(m_config.interpreter), qPrintable(scriptPath));

    std::unique_ptr<QProcess> process = spawn(scriptPath, &error);
    if (!process) {
        return fail(SidecarErrorKind::Spawn,
                    QStringLiteral("Failed to start sidecar server: %1").arg(error));
    }
    const qint64 pid = process->processId();

    bool stoppedMeanwhile = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == SidecarState::Starting) {
            m_process = std::move(process);
            m_port = m_config.port;
        } else {
            stoppedMeanwhile = true;
        }
    }
    if (stoppedMeanwhile) {
        killAndReap(*process, m_config.stopTimeoutMs);
        process->disconnect();
        SidecarStartResult result;
        result.port = port();
        result.errorKind = SidecarErrorKind::Cancelled;
        result.errorMessage = QStringLiteral("Sidecar was stopped while starting");
        return result;
    }

    LOG_INFO(oniSidecar, "Sidecar server started (pid=%lld), waiting for %s",
             pid, qPrintable(statusUrl(m_config.port, m_config.statusPath).toString()));

    const QUrl url = statusUrl(m_config.port, m_config.statusPath);
    const ReadinessPoller::Result wait = m_poller.waitUntilReady([this, &url](int remainingMs) {
        const int timeoutMs = std::min(m_config.probeTimeoutMs,
                                       std::max(remainingMs, m_config.pollIntervalMs));
        return m_probe->probe(url, timeoutMs);
    });

    if (state() != SidecarState::Starting) {
        SidecarStartResult result;
        result.port = port();
        result.errorKind = SidecarErrorKind::Cancelled;
        result.errorMessage = QStringLiteral("Sidecar was stopped while waiting for readiness");
        return result;
    }

    switch (wait.outcome) {
    case ReadinessPoller::Outcome::Ready:
        break;
    case ReadinessPoller::Outcome::Cancelled:
        return fail(SidecarErrorKind::Cancelled,
                    QStringLiteral("Sidecar readiness wait cancelled after %1ms")
                        .arg(wait.elapsedMs));
    case ReadinessPoller::Outcome::TimedOut:
        // The child stays tracked so shutdown still reaps it.
        return fail(SidecarErrorKind::ReadinessTimeout,
                    QStringLiteral("Sidecar server did not become ready within %1 seconds")
                        .arg(QString::number(m_config.readyTimeoutMs / 1000.0)));
    }

    const quint16 readyPort = port();
    LOG_INFO(oniSidecar, "Sidecar server ready on port %d (%d probe(s), %lldms)",
             static_cast<int>(readyPort), wait.attempts, wait.elapsedMs);
    transitionState(SidecarState::Ready);
    emit sidecarReady(readyPort);

    SidecarStartResult result;
    result.ok = true;
    result.port = readyPort;
    return result;
}

std::unique_ptr<QProcess> SidecarSupervisor::spawn(const QString& scriptPath, QString* error)
{
    auto process = std::make_unique<QProcess>();
    process->setProgram(m_config.interpreter);
    process->setArguments(QStringList(m_config.interpreterArgs) << scriptPath);
    process->setProcessEnvironment(QProcessEnvironment::systemEnvironment());
    process->setProcessChannelMode(QProcess::SeparateChannels);

    QProcess* raw = process.get();
    connect(raw, &QProcess::readyReadStandardOutput, raw, [raw]() {
        drainOutput(raw, QProcess::StandardOutput);
    });
    connect(raw, &QProcess::readyReadStandardError, raw, [raw]() {
        drainOutput(raw, QProcess::StandardError);
    });

    process->start();
    if (!process->waitForStarted(m_config.spawnTimeoutMs)) {
        if (error) {
            *error = process->errorString();
        }
        return nullptr;
    }
    return process;
}

void SidecarSupervisor::drainOutput(QProcess* process, QProcess::ProcessChannel channel)
{
    const bool isStdout = channel == QProcess::StandardOutput;
    const QByteArray data = isStdout ? process->readAllStandardOutput()
                                     : process->readAllStandardError();
    const QList<QByteArray> lines = data.split('\n');
    for (const QByteArray& line : lines) {
        const QByteArray trimmed = line.trimmed();
        if (trimmed.isEmpty()) {
            continue;
        }
        LOG_DEBUG(oniSidecar, "sidecar %s: %s",
                  isStdout ? "stdout" : "stderr", trimmed.constData());
    }
}

void SidecarSupervisor::stop()
{
    // Unblocks a start() stuck in the readiness wait.
    m_poller.cancel();

    std::unique_ptr<QProcess> process;
    SidecarState current;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        process = std::move(m_process);
        current = m_state;
    }

    if (process) {
        LOG_INFO(oniSidecar, "Stopping sidecar server (pid=%lld)", process->processId());
        killAndReap(*process, m_config.stopTimeoutMs);
        // Late finished/readyRead signals must not reach a dying object.
        process->disconnect();
        process.reset();
    }

    if (current != SidecarState::NotStarted) {
        transitionState(SidecarState::Stopped);
    }
}

void SidecarSupervisor::cancelStart()
{
    LOG_INFO(oniSidecar, "Cancelling sidecar readiness wait");
    m_poller.cancel();
}

quint16 SidecarSupervisor::port() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_port;
}

SidecarState SidecarSupervisor::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool SidecarSupervisor::hasTrackedProcess() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_process != nullptr;
}

qint64 SidecarSupervisor::processId() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_process ? static_cast<qint64>(m_process->processId()) : 0;
}

QJsonObject SidecarSupervisor::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QJsonObject entry;
    entry[QStringLiteral("state")] = sidecarStateToString(m_state);
    entry[QStringLiteral("port")] = static_cast<int>(m_port);
    entry[QStringLiteral("pid")] =
        m_process ? static_cast<qint64>(m_process->processId()) : static_cast<qint64>(0);
    entry[QStringLiteral("running")] =
        (m_process && m_process->state() == QProcess::Running);
    return entry;
}

} // namespace oni
