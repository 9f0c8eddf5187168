#pragma once

#include "command_bridge.h"
#include "core/shared/settings.h"
#include "core/sidecar/sidecar_supervisor.h"

#include <QObject>
#include <QPointer>

#include <memory>

namespace oni {

// Top-level context of the shell: owns the sidecar supervisor and the command
// bridge, and ties the sidecar's lifetime to the main window.
class ShellController : public QObject {
    Q_OBJECT

    Q_PROPERTY(int serverPort READ serverPort NOTIFY sidecarStateChanged)
    Q_PROPERTY(QString sidecarState READ sidecarState NOTIFY sidecarStateChanged)

public:
    explicit ShellController(ShellSettings settings, QObject* parent = nullptr);
    ShellController(ShellSettings settings,
                    std::unique_ptr<SidecarSupervisor> supervisor,
                    QObject* parent = nullptr);
    ~ShellController() override;

    // Starts the sidecar in production builds only. Failures are logged and
    // the shell keeps running without it.
    SidecarStartResult launch(BuildMode mode);

    // Stop the sidecar once `window` is destroyed.
    void attachWindow(QObject* window);

    int serverPort() const;
    QString sidecarState() const;

    SidecarSupervisor& supervisor() { return *m_supervisor; }
    CommandBridge& commands() { return m_commands; }

public slots:
    void shutdown();

signals:
    void sidecarStateChanged();

private:
    void registerCommands();

    ShellSettings m_settings;
    std::unique_ptr<SidecarSupervisor> m_supervisor;
    CommandBridge m_commands;
    QPointer<QObject> m_window;
};

} // namespace oni
