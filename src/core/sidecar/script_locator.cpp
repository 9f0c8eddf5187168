#include "core/sidecar/script_locator.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

namespace oni {

QString resolveServerScript(BuildMode mode,
                            const QString& executableDir,
                            const SidecarConfig& config,
                            QString* error)
{
    if (mode == BuildMode::Development) {
        return config.devScriptPath;
    }

    if (executableDir.trimmed().isEmpty()) {
        if (error) {
            *error = QStringLiteral("Unable to determine the executable directory");
        }
        return {};
    }

    const QDir exeDir(executableDir);
    const QString bundledPath = QDir::cleanPath(exeDir.filePath(config.bundledScriptPath));
    if (QFileInfo::exists(bundledPath)) {
        return bundledPath;
    }

    LOG_DEBUG(oniSidecar, "No bundled script at %s, using sibling bin directory",
              qPrintable(bundledPath));
    return QDir::cleanPath(exeDir.filePath(config.siblingScriptPath));
}

QString currentExecutableDir()
{
    if (QCoreApplication::instance()) {
        return QCoreApplication::applicationDirPath();
    }

    // No application object yet: fall back to the kernel's view of the binary.
    const QFileInfo self(QStringLiteral("/proc/self/exe"));
    if (self.exists()) {
        return QFileInfo(self.symLinkTarget()).absolutePath();
    }
    return {};
}

} // namespace oni
