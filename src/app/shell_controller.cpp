#include "shell_controller.h"
#include "core/shared/logging.h"

namespace oni {

ShellController::ShellController(ShellSettings settings, QObject* parent)
    : ShellController(settings, std::make_unique<SidecarSupervisor>(settings.sidecar), parent)
{
}

ShellController::ShellController(ShellSettings settings,
                                 std::unique_ptr<SidecarSupervisor> supervisor,
                                 QObject* parent)
    : QObject(parent)
    , m_settings(std::move(settings))
    , m_supervisor(std::move(supervisor))
{
    if (!m_supervisor) {
        m_supervisor = std::make_unique<SidecarSupervisor>(m_settings.sidecar);
    }
    connect(m_supervisor.get(), &SidecarSupervisor::stateChanged,
            this, &ShellController::sidecarStateChanged);
    registerCommands();
}

ShellController::~ShellController()
{
    shutdown();
}

void ShellController::registerCommands()
{
    m_commands.registerCommand(QStringLiteral("get_server_port"),
                               [this](const QVariantMap&) -> QVariant {
        return static_cast<int>(m_supervisor->port());
    });
    m_commands.registerCommand(QStringLiteral("get_sidecar_status"),
                               [this](const QVariantMap&) -> QVariant {
        return m_supervisor->snapshot().toVariantMap();
    });
}

SidecarStartResult ShellController::launch(BuildMode mode)
{
    if (mode != BuildMode::Production) {
        LOG_INFO(oniApp, "Development build, sidecar not started (port %d expected from dev server)",
                 serverPort());
        SidecarStartResult skipped;
        skipped.port = m_supervisor->port();
        return skipped;
    }

    const SidecarStartResult result = m_supervisor->start(mode);
    if (result.ok) {
        LOG_INFO(oniApp, "Production server on port %d", static_cast<int>(result.port));
    } else {
        LOG_WARN(oniApp, "Continuing without sidecar (%s): %s",
                 qPrintable(sidecarErrorKindToString(result.errorKind)),
                 qPrintable(result.errorMessage));
    }
    return result;
}

void ShellController::attachWindow(QObject* window)
{
    if (!window) {
        return;
    }
    if (m_window && m_window != window) {
        disconnect(m_window.data(), &QObject::destroyed, this, &ShellController::shutdown);
    }
    m_window = window;
    connect(window, &QObject::destroyed, this, &ShellController::shutdown);
}

int ShellController::serverPort() const
{
    return static_cast<int>(m_supervisor->port());
}

QString ShellController::sidecarState() const
{
    return sidecarStateToString(m_supervisor->state());
}

void ShellController::shutdown()
{
    if (!m_supervisor) {
        return;
    }
    m_supervisor->stop();
}

} // namespace oni
