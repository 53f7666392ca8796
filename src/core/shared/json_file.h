#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>

namespace ie {

// Reads a file holding a single JSON object. Returns nullopt when the file
// is absent (silently), unreadable, not JSON, or not an object (logged).
std::optional<QJsonObject> readJsonObjectFile(const QString& filePath);

// Writes `json` indented, creating parent directories. Returns true on success.
bool writeJsonObjectFile(const QString& filePath, const QJsonObject& json);

} // namespace ie
