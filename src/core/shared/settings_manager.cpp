#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace pa {

namespace {

QString dataDirectory()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/phoneadvisor");
}

QJsonObject endpointToJson(const GeneratorEndpoint& endpoint)
{
    QJsonObject json;
    json.insert(QStringLiteral("endpoint"), endpoint.endpoint);
    json.insert(QStringLiteral("model"), endpoint.model);
    return json;
}

GeneratorEndpoint endpointFromJson(const QJsonObject& json)
{
    GeneratorEndpoint endpoint;
    endpoint.endpoint = json.value(QStringLiteral("endpoint")).toString().trimmed();
    endpoint.model = json.value(QStringLiteral("model")).toString().trimmed();
    return endpoint;
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(paCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(paCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

Settings SettingsManager::loadOrDefault()
{
    Settings settings = load().value_or(Settings{});
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = defaultDbPath();
    }
    return settings;
}

bool SettingsManager::save(const Settings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(paCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(paCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(paCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("PHONEADVISOR_SETTINGS").trimmed();
    if (!overridePath.isEmpty()) {
        return QDir::cleanPath(overridePath);
    }
    return dataDirectory() + QStringLiteral("/settings.json");
}

QString SettingsManager::defaultDbPath()
{
    return dataDirectory() + QStringLiteral("/catalog.db");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("seedCatalogPath"), settings.seedCatalogPath);
    json.insert(QStringLiteral("primaryGenerator"), endpointToJson(settings.primaryGenerator));
    json.insert(QStringLiteral("secondaryGenerator"), endpointToJson(settings.secondaryGenerator));
    json.insert(QStringLiteral("generatorTimeoutMs"), static_cast<int>(settings.generatorTimeoutMs));
    json.insert(QStringLiteral("maxPromptRecords"), settings.maxPromptRecords);
    json.insert(QStringLiteral("minQuestionLength"), settings.minQuestionLength);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.seedCatalogPath =
        json.value(QStringLiteral("seedCatalogPath")).toString(settings.seedCatalogPath);

    settings.primaryGenerator =
        endpointFromJson(json.value(QStringLiteral("primaryGenerator")).toObject());
    settings.secondaryGenerator =
        endpointFromJson(json.value(QStringLiteral("secondaryGenerator")).toObject());

    if (json.contains(QStringLiteral("generatorTimeoutMs"))) {
        // Read wide so negative and oversized values clamp instead of wrapping.
        const double timeoutMs = json.value(QStringLiteral("generatorTimeoutMs"))
                                     .toDouble(settings.generatorTimeoutMs);
        settings.generatorTimeoutMs = static_cast<uint32_t>(
            std::clamp(timeoutMs, 1.0, static_cast<double>(kMaxGeneratorTimeoutMs)));
    }

    settings.maxPromptRecords = std::max(
        1, json.value(QStringLiteral("maxPromptRecords")).toInt(settings.maxPromptRecords));
    settings.minQuestionLength = std::max(
        0, json.value(QStringLiteral("minQuestionLength")).toInt(settings.minQuestionLength));

    return settings;
}

} // namespace pa
