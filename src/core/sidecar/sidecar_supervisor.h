#pragma once

#include "core/sidecar/health_probe.h"
#include "core/sidecar/readiness_poller.h"
#include "core/sidecar/sidecar_types.h"

#include <QJsonObject>
#include <QObject>
#include <QProcess>

#include <memory>
#include <mutex>

namespace oni {

// Launches the bundled API server as a child process, blocks until its status
// endpoint answers, and kills it again on shutdown. Tracks at most one child.
class SidecarSupervisor : public QObject {
    Q_OBJECT
public:
    explicit SidecarSupervisor(SidecarConfig config = {}, QObject* parent = nullptr);
    SidecarSupervisor(SidecarConfig config,
                      std::unique_ptr<HealthProbe> probe,
                      std::unique_ptr<Clock> clock,
                      QObject* parent = nullptr);
    ~SidecarSupervisor() override;

    // Resolve the script for `mode`, spawn it and wait for readiness. Blocks
    // the calling thread for at most config().readyTimeoutMs plus one poll
    // interval.
    SidecarStartResult start(BuildMode mode);

    // Kill and reap the tracked child, if any. Never fails.
    void stop();

    // Abort a start() blocked in the readiness wait.
    void cancelStart();

    quint16 port() const;
    SidecarState state() const;
    bool hasTrackedProcess() const;
    qint64 processId() const;
    QJsonObject snapshot() const;

    const SidecarConfig& config() const { return m_config; }

    // Overrides the executable directory used for production resolution.
    void setExecutableDir(const QString& dir);

signals:
    void stateChanged(const QString& state);
    void sidecarReady(quint16 port);
    void sidecarFailed(const QString& message);

private:
    std::unique_ptr<QProcess> spawn(const QString& scriptPath, QString* error);
    SidecarStartResult fail(SidecarErrorKind kind, const QString& message);
    void transitionState(SidecarState nextState);
    static void drainOutput(QProcess* process, QProcess::ProcessChannel channel);

    const SidecarConfig m_config;
    std::unique_ptr<HealthProbe> m_probe;
    std::unique_ptr<Clock> m_clock;
    ReadinessPoller m_poller;
    QString m_executableDir;

    // Guards the tracked child, port and state. Never held across spawn,
    // readiness polling or kill/wait.
    mutable std::mutex m_mutex;
    std::unique_ptr<QProcess> m_process;
    quint16 m_port = SidecarConfig::kDefaultPort;
    SidecarState m_state = SidecarState::NotStarted;
};

} // namespace oni
