#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(oniCore, "onishell.core")
Q_LOGGING_CATEGORY(oniSidecar, "onishell.sidecar")
Q_LOGGING_CATEGORY(oniApp, "onishell.app")
