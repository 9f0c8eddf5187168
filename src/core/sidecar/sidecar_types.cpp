#include "core/sidecar/sidecar_types.h"

namespace oni {

QString buildModeToString(BuildMode mode)
{
    switch (mode) {
    case BuildMode::Development:
        return QStringLiteral("development");
    case BuildMode::Production:
        return QStringLiteral("production");
    }
    return QStringLiteral("unknown");
}

bool buildModeFromString(const QString& str, BuildMode* mode)
{
    const QString normalized = str.trimmed().toLower();
    BuildMode parsed = BuildMode::Development;
    if (normalized == QLatin1String("development") || normalized == QLatin1String("dev")) {
        parsed = BuildMode::Development;
    } else if (normalized == QLatin1String("production") || normalized == QLatin1String("prod")) {
        parsed = BuildMode::Production;
    } else {
        return false;
    }
    if (mode) {
        *mode = parsed;
    }
    return true;
}

BuildMode compiledBuildMode()
{
#ifdef NDEBUG
    return BuildMode::Production;
#else
    return BuildMode::Development;
#endif
}

QString sidecarStateToString(SidecarState state)
{
    switch (state) {
    case SidecarState::NotStarted:
        return QStringLiteral("not_started");
    case SidecarState::Starting:
        return QStringLiteral("starting");
    case SidecarState::Ready:
        return QStringLiteral("ready");
    case SidecarState::Failed:
        return QStringLiteral("failed");
    case SidecarState::Stopped:
        return QStringLiteral("stopped");
    }
    return QStringLiteral("unknown");
}

QString sidecarErrorKindToString(SidecarErrorKind kind)
{
    switch (kind) {
    case SidecarErrorKind::None:
        return QStringLiteral("none");
    case SidecarErrorKind::PathResolution:
        return QStringLiteral("path_resolution");
    case SidecarErrorKind::Spawn:
        return QStringLiteral("spawn");
    case SidecarErrorKind::ReadinessTimeout:
        return QStringLiteral("readiness_timeout");
    case SidecarErrorKind::Cancelled:
        return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

QString defaultBundledScriptPath()
{
#if defined(Q_OS_MACOS)
    // <App>.app/Contents/MacOS -> Contents/Resources
    return QStringLiteral("../Resources/bin/server.mjs");
#elif defined(Q_OS_WIN)
    return QStringLiteral("resources/bin/server.mjs");
#else
    return QStringLiteral("../lib/onishell/bin/server.mjs");
#endif
}

} // namespace oni
