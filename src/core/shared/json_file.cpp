#include "core/shared/json_file.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

namespace ie {

std::optional<QJsonObject> readJsonObjectFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(ieIo, "Cannot read %s: %s",
                 qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(ieIo, "Invalid JSON in %s at offset %d: %s",
                 qUtf8Printable(filePath), parseError.offset,
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }
    if (!doc.isObject()) {
        LOG_WARN(ieIo, "%s does not hold a JSON object", qUtf8Printable(filePath));
        return std::nullopt;
    }
    return doc.object();
}

bool writeJsonObjectFile(const QString& filePath, const QJsonObject& json)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(ieIo, "Cannot create directory %s", qUtf8Printable(parentDir));
        return false;
    }

    // QSaveFile keeps the previous contents if anything below fails.
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR(ieIo, "Cannot write %s: %s",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }
    file.write(QJsonDocument(json).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        LOG_ERROR(ieIo, "Cannot commit %s: %s",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }
    return true;
}

} // namespace ie
