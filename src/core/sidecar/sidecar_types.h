#pragma once

#include <QString>
#include <QStringList>
#include <QtGlobal>

namespace oni {

// Selects how the sidecar script is located.
enum class BuildMode {
    Development,
    Production,
};

QString buildModeToString(BuildMode mode);
// Accepts "development"/"dev" and "production"/"prod" (case-insensitive).
bool buildModeFromString(const QString& str, BuildMode* mode);

// Mode the binary was compiled in: Development unless NDEBUG is defined.
BuildMode compiledBuildMode();

enum class SidecarState {
    NotStarted,
    Starting,
    Ready,
    Failed,
    Stopped,
};

QString sidecarStateToString(SidecarState state);

enum class SidecarErrorKind {
    None,
    PathResolution,
    Spawn,
    ReadinessTimeout,
    Cancelled,
};

QString sidecarErrorKindToString(SidecarErrorKind kind);

struct SidecarStartResult {
    bool ok = false;
    quint16 port = 0;
    SidecarErrorKind errorKind = SidecarErrorKind::None;
    QString errorMessage;
};

QString defaultBundledScriptPath();

struct SidecarConfig {
    static constexpr quint16 kDefaultPort = 5173;

    quint16 port = kDefaultPort;

    // Runtime used to execute the server script, and the flags placed
    // before the script path.
    QString interpreter = QStringLiteral("node");
    QStringList interpreterArgs = {QStringLiteral("--experimental-modules")};

    QString statusPath = QStringLiteral("/api/oni/status");

    // Development: used verbatim, relative to the working directory.
    QString devScriptPath = QStringLiteral("../../electron/server.mjs");
    // Production: both relative to the executable's directory.
    QString bundledScriptPath = defaultBundledScriptPath();
    QString siblingScriptPath = QStringLiteral("bin/server.mjs");

    int readyTimeoutMs = 15000;
    int pollIntervalMs = 300;
    int probeTimeoutMs = 1000;
    int spawnTimeoutMs = 5000;
    int stopTimeoutMs = 5000;
};

} // namespace oni
