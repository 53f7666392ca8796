#include "core/shared/settings_manager.h"
#include "core/shared/json_file.h"

#include <QStandardPaths>

namespace ie {

std::optional<Settings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    const auto json = readJsonObjectFile(filePath);
    if (!json) {
        return std::nullopt;
    }
    return fromJson(*json);
}

bool SettingsManager::save(const Settings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    return writeJsonObjectFile(filePath, toJson(settings));
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/iecore/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("sentencesPerChunk"), settings.sentencesPerChunk);
    json.insert(QStringLiteral("overlapSentences"), settings.overlapSentences);
    json.insert(QStringLiteral("maxTokensPerChunk"), settings.maxTokensPerChunk);
    json.insert(QStringLiteral("requireSegmentation"), settings.requireSegmentation);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.sentencesPerChunk = json.value(QStringLiteral("sentencesPerChunk"))
                                     .toInt(settings.sentencesPerChunk);
    settings.overlapSentences = json.value(QStringLiteral("overlapSentences"))
                                    .toInt(settings.overlapSentences);
    settings.maxTokensPerChunk = json.value(QStringLiteral("maxTokensPerChunk"))
                                     .toInt(settings.maxTokensPerChunk);
    settings.requireSegmentation = json.value(QStringLiteral("requireSegmentation"))
                                       .toBool(settings.requireSegmentation);

    return settings;
}

} // namespace ie
