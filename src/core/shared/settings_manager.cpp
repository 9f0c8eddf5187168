#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace oni {

namespace {

void readPositiveInt(const QJsonObject& json, const QString& key, int* target)
{
    if (!json.contains(key)) {
        return;
    }
    const int value = json.value(key).toInt(-1);
    if (value <= 0) {
        LOG_WARN(oniCore, "Ignoring invalid value for sidecar.%s", qPrintable(key));
        return;
    }
    *target = value;
}

void readString(const QJsonObject& json, const QString& key, QString* target)
{
    const QString value = json.value(key).toString();
    if (!value.isEmpty()) {
        *target = value;
    }
}

} // namespace

std::optional<ShellSettings> SettingsManager::load()
{
    return loadFrom(settingsFilePath());
}

std::optional<ShellSettings> SettingsManager::loadFrom(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(oniCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(oniCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const ShellSettings& settings)
{
    return saveTo(settings, settingsFilePath());
}

bool SettingsManager::saveTo(const ShellSettings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(oniCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(oniCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(oniCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/onishell/settings.json");
}

QJsonObject SettingsManager::toJson(const ShellSettings& settings)
{
    const SidecarConfig& sidecar = settings.sidecar;

    QJsonObject sidecarJson;
    sidecarJson.insert(QStringLiteral("interpreter"), sidecar.interpreter);
    sidecarJson.insert(QStringLiteral("devScriptPath"), sidecar.devScriptPath);
    sidecarJson.insert(QStringLiteral("bundledScriptPath"), sidecar.bundledScriptPath);
    sidecarJson.insert(QStringLiteral("siblingScriptPath"), sidecar.siblingScriptPath);
    sidecarJson.insert(QStringLiteral("spawnTimeoutMs"), sidecar.spawnTimeoutMs);
    sidecarJson.insert(QStringLiteral("stopTimeoutMs"), sidecar.stopTimeoutMs);

    QJsonObject json;
    json.insert(QStringLiteral("sidecar"), sidecarJson);
    return json;
}

ShellSettings SettingsManager::fromJson(const QJsonObject& json)
{
    ShellSettings settings;
    SidecarConfig& sidecar = settings.sidecar;

    const QJsonObject sidecarJson = json.value(QStringLiteral("sidecar")).toObject();

    // The port, status endpoint, interpreter flags and readiness budget are
    // part of the server contract and stay at their built-in values.
    static const QStringList kFixedKeys = {
        QStringLiteral("port"),
        QStringLiteral("statusPath"),
        QStringLiteral("interpreterArgs"),
        QStringLiteral("readyTimeoutMs"),
        QStringLiteral("pollIntervalMs"),
        QStringLiteral("probeTimeoutMs"),
    };
    for (const QString& key : kFixedKeys) {
        if (sidecarJson.contains(key)) {
            LOG_WARN(oniCore, "sidecar.%s is not configurable, ignoring", qPrintable(key));
        }
    }

    readString(sidecarJson, QStringLiteral("interpreter"), &sidecar.interpreter);
    readString(sidecarJson, QStringLiteral("devScriptPath"), &sidecar.devScriptPath);
    readString(sidecarJson, QStringLiteral("bundledScriptPath"), &sidecar.bundledScriptPath);
    readString(sidecarJson, QStringLiteral("siblingScriptPath"), &sidecar.siblingScriptPath);

    readPositiveInt(sidecarJson, QStringLiteral("spawnTimeoutMs"), &sidecar.spawnTimeoutMs);
    readPositiveInt(sidecarJson, QStringLiteral("stopTimeoutMs"), &sidecar.stopTimeoutMs);

    return settings;
}

} // namespace oni
