#pragma once

#include "core/sidecar/sidecar_types.h"

namespace oni {

struct ShellSettings {
    // Sidecar launch and readiness parameters
    SidecarConfig sidecar;
};

} // namespace oni
