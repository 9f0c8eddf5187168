#pragma once

#include "core/sidecar/sidecar_types.h"

#include <QString>

namespace oni {

// Resolve the server script the sidecar runtime is launched with.
//
// Development returns config.devScriptPath untouched. Production tries
// <executableDir>/<bundledScriptPath> and, when that file does not exist,
// falls back to <executableDir>/<siblingScriptPath> without checking it.
// Returns an empty string (and sets *error) only when production mode has
// no executable directory to work from.
QString resolveServerScript(BuildMode mode,
                            const QString& executableDir,
                            const SidecarConfig& config,
                            QString* error = nullptr);

// Directory of the running executable, empty if it cannot be determined.
QString currentExecutableDir();

} // namespace oni
