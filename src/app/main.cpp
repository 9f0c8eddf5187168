#include "shell_controller.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QFileInfo>
#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>

#include <optional>

int main(int argc, char* argv[])
{
    qSetMessagePattern(QStringLiteral("[%{if-category}%{category}%{endif}] %{message}"));

    QGuiApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("OniShell"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));
    app.setOrganizationName(QStringLiteral("OniOS"));

    oni::ShellSettings settings;
    if (const std::optional<oni::ShellSettings> loaded = oni::SettingsManager::load()) {
        settings = *loaded;
    } else if (!QFileInfo::exists(oni::SettingsManager::settingsFilePath())) {
        // First run: leave an editable copy of the defaults behind.
        if (!oni::SettingsManager::save(settings)) {
            LOG_WARN(oniApp, "Could not write default settings to %s",
                     qUtf8Printable(oni::SettingsManager::settingsFilePath()));
        }
    }

    oni::BuildMode mode = oni::compiledBuildMode();
    const QString modeOverride = qEnvironmentVariable("ONISHELL_BUILD_MODE");
    if (!modeOverride.isEmpty() && !oni::buildModeFromString(modeOverride, &mode)) {
        LOG_WARN(oniApp, "Ignoring unknown ONISHELL_BUILD_MODE '%s'", qPrintable(modeOverride));
    }

    LOG_INFO(oniApp, "OniShell starting (%s build)", qPrintable(oni::buildModeToString(mode)));

    // --- Sidecar (blocks until ready or timed out) ---

    oni::ShellController controller(settings);
    controller.launch(mode);

    QObject::connect(&app, &QCoreApplication::aboutToQuit,
                     &controller, &oni::ShellController::shutdown);

    // --- Set up QML engine ---

    QQmlApplicationEngine engine;
    engine.rootContext()->setContextProperty(QStringLiteral("shellCommands"), &controller.commands());
    engine.rootContext()->setContextProperty(QStringLiteral("shellController"), &controller);
    engine.load(QUrl(QStringLiteral("qrc:/OniShell/Main.qml")));

    if (engine.rootObjects().isEmpty()) {
        LOG_ERROR(oniApp, "Failed to load QML");
        return 1;
    }

    for (QObject* root : engine.rootObjects()) {
        controller.attachWindow(root);
    }

    return app.exec();
}
