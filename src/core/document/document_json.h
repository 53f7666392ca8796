#pragma once

#include "core/document/document.h"
#include "core/document/entity.h"
#include "core/shared/chunk.h"
#include "core/shared/errors.h"

#include <QJsonObject>

#include <optional>

namespace ie {

// JSON encoding of the data model, using the storage field names
// (human_identifier, preprocess_metadata, postags, ...). Decoders fail with
// MalformedJson when a required field is missing or a kind is unknown.

QJsonObject entityToJson(const Entity& entity);
std::optional<Entity> entityFromJson(const QJsonObject& json, Error* errorOut = nullptr);

QJsonObject documentToJson(const Document& document);
std::optional<Document> documentFromJson(const QJsonObject& json, Error* errorOut = nullptr);

QJsonObject chunkToJson(const TextChunk& chunk);
std::optional<TextChunk> chunkFromJson(const QJsonObject& json, Error* errorOut = nullptr);

} // namespace ie
