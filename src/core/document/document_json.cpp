#include "core/document/document_json.h"
#include "core/shared/logging.h"

#include <QJsonArray>

#include <initializer_list>

namespace ie {

namespace {

QString isoTimestamp(const QDateTime& dt)
{
    return dt.toString(Qt::ISODateWithMs);
}

std::optional<QDateTime> parseTimestamp(const QJsonValue& value, const QString& field,
                                        Error* errorOut)
{
    const QDateTime dt = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
    if (!dt.isValid()) {
        const QString message = QStringLiteral("'%1' is not an ISO-8601 timestamp: '%2'")
            .arg(field, value.toString());
        LOG_WARN(ieIo, "%s", qUtf8Printable(message));
        reportError(errorOut, ErrorCode::MalformedJson, message);
        return std::nullopt;
    }
    return dt;
}

QJsonArray intArray(const std::vector<int>& values)
{
    QJsonArray out;
    for (int value : values) {
        out.append(value);
    }
    return out;
}

std::vector<int> intVector(const QJsonValue& value)
{
    const QJsonArray array = value.toArray();
    std::vector<int> out;
    out.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& item : array) {
        out.push_back(item.toInt());
    }
    return out;
}

QStringList stringList(const QJsonValue& value)
{
    const QJsonArray array = value.toArray();
    QStringList out;
    out.reserve(array.size());
    for (const QJsonValue& item : array) {
        out.append(item.toString());
    }
    return out;
}

std::optional<QString> optionalString(const QJsonObject& json, const QString& key)
{
    const QJsonValue value = json.value(key);
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.toString();
}

bool requireFields(const QJsonObject& json, std::initializer_list<const char*> fields,
                   const char* what, Error* errorOut)
{
    for (const char* field : fields) {
        if (!json.contains(QLatin1String(field))) {
            const QString message = QStringLiteral("%1 JSON is missing '%2'")
                .arg(QLatin1String(what), QLatin1String(field));
            LOG_WARN(ieIo, "%s", qUtf8Printable(message));
            reportError(errorOut, ErrorCode::MalformedJson, message);
            return false;
        }
    }
    return true;
}

std::optional<EntityKind> parseKind(const QJsonValue& value, Error* errorOut)
{
    const auto kind = entityKindFromString(value.toString());
    if (!kind) {
        const QString message = QStringLiteral("Unknown entity kind '%1'").arg(value.toString());
        LOG_WARN(ieIo, "%s", qUtf8Printable(message));
        reportError(errorOut, ErrorCode::MalformedJson, message);
    }
    return kind;
}

} // anonymous namespace

// ── Entity ──────────────────────────────────────────────────

QJsonObject entityToJson(const Entity& entity)
{
    QJsonObject json;
    json.insert(QStringLiteral("key"), entity.key);
    json.insert(QStringLiteral("canonical_form"), entity.canonicalForm);
    json.insert(QStringLiteral("kind"), entityKindToString(entity.kind));
    return json;
}

std::optional<Entity> entityFromJson(const QJsonObject& json, Error* errorOut)
{
    if (!requireFields(json, {"key", "canonical_form", "kind"}, "Entity", errorOut)) {
        return std::nullopt;
    }
    const auto kind = parseKind(json.value(QStringLiteral("kind")), errorOut);
    if (!kind) {
        return std::nullopt;
    }

    Entity entity;
    entity.key = json.value(QStringLiteral("key")).toString();
    entity.canonicalForm = json.value(QStringLiteral("canonical_form")).toString();
    entity.kind = *kind;
    return entity;
}

// ── Document ────────────────────────────────────────────────

QJsonObject documentToJson(const Document& document)
{
    QJsonObject json;
    json.insert(QStringLiteral("human_identifier"), document.humanIdentifier);
    json.insert(QStringLiteral("title"), document.title);
    json.insert(QStringLiteral("url"), document.url);
    json.insert(QStringLiteral("text"), document.text);
    json.insert(QStringLiteral("creation_date"), isoTimestamp(document.creationDate));
    json.insert(QStringLiteral("metadata"), QJsonObject::fromVariantMap(document.metadata));

    QJsonObject preprocess;
    for (auto it = document.preprocessMetadata.doneAt.constBegin();
         it != document.preprocessMetadata.doneAt.constEnd(); ++it) {
        QJsonObject step;
        step.insert(QStringLiteral("done_at"), isoTimestamp(it.value()));
        preprocess.insert(it.key(), step);
    }
    json.insert(QStringLiteral("preprocess_metadata"), preprocess);

    json.insert(QStringLiteral("tokens"), QJsonArray::fromStringList(document.tokens));
    json.insert(QStringLiteral("offsets"), intArray(document.offsets));
    json.insert(QStringLiteral("postags"), QJsonArray::fromStringList(document.postags));
    json.insert(QStringLiteral("sentences"), intArray(document.sentences));

    QJsonArray entities;
    for (const EntityOccurrence& occ : document.entities) {
        QJsonObject item;
        item.insert(QStringLiteral("entity"), occ.entityKey);
        item.insert(QStringLiteral("offset"), occ.offset);
        if (occ.alias) {
            item.insert(QStringLiteral("alias"), *occ.alias);
        }
        entities.append(item);
    }
    json.insert(QStringLiteral("entities"), entities);

    return json;
}

std::optional<Document> documentFromJson(const QJsonObject& json, Error* errorOut)
{
    if (!requireFields(json, {"human_identifier"}, "Document", errorOut)) {
        return std::nullopt;
    }

    Document document;
    document.humanIdentifier = json.value(QStringLiteral("human_identifier")).toString();
    document.title = json.value(QStringLiteral("title")).toString();
    document.url = json.value(QStringLiteral("url")).toString();
    document.text = json.value(QStringLiteral("text")).toString();
    if (json.contains(QStringLiteral("creation_date"))) {
        const auto created = parseTimestamp(json.value(QStringLiteral("creation_date")),
                                            QStringLiteral("creation_date"), errorOut);
        if (!created) {
            return std::nullopt;
        }
        document.creationDate = *created;
    }
    document.metadata = json.value(QStringLiteral("metadata")).toObject().toVariantMap();

    const QJsonObject preprocess = json.value(QStringLiteral("preprocess_metadata")).toObject();
    for (auto it = preprocess.constBegin(); it != preprocess.constEnd(); ++it) {
        const auto doneAt = parseTimestamp(it.value().toObject().value(QStringLiteral("done_at")),
                                           it.key() + QStringLiteral(".done_at"), errorOut);
        if (!doneAt) {
            return std::nullopt;
        }
        document.preprocessMetadata.doneAt.insert(it.key(), *doneAt);
    }

    document.tokens = stringList(json.value(QStringLiteral("tokens")));
    document.offsets = intVector(json.value(QStringLiteral("offsets")));
    document.postags = stringList(json.value(QStringLiteral("postags")));
    document.sentences = intVector(json.value(QStringLiteral("sentences")));

    const QJsonArray entities = json.value(QStringLiteral("entities")).toArray();
    document.entities.reserve(static_cast<size_t>(entities.size()));
    for (const QJsonValue& value : entities) {
        const QJsonObject item = value.toObject();
        if (!requireFields(item, {"entity", "offset"}, "Entity occurrence", errorOut)) {
            return std::nullopt;
        }
        EntityOccurrence occ;
        occ.entityKey = item.value(QStringLiteral("entity")).toString();
        occ.offset = item.value(QStringLiteral("offset")).toInt();
        occ.alias = optionalString(item, QStringLiteral("alias"));
        document.entities.push_back(std::move(occ));
    }

    if (!document.entitiesSorted()) {
        LOG_WARN(ieIo, "%s: decoded entity occurrences are not sorted by offset",
                 qUtf8Printable(document.humanIdentifier));
    }

    return document;
}

// ── Chunk ───────────────────────────────────────────────────

QJsonObject chunkToJson(const TextChunk& chunk)
{
    QJsonObject json;
    json.insert(QStringLiteral("id"), chunk.chunkId);
    json.insert(QStringLiteral("document"), chunk.documentId);
    json.insert(QStringLiteral("text"), chunk.text);
    json.insert(QStringLiteral("offset"), chunk.offset);
    json.insert(QStringLiteral("tokens"), QJsonArray::fromStringList(chunk.tokens));
    json.insert(QStringLiteral("postags"), QJsonArray::fromStringList(chunk.postags));

    QJsonArray entities;
    for (const EntityInChunk& entity : chunk.entities) {
        QJsonObject item;
        item.insert(QStringLiteral("key"), entity.key);
        item.insert(QStringLiteral("canonical_form"), entity.canonicalForm);
        item.insert(QStringLiteral("kind"), entityKindToString(entity.kind));
        item.insert(QStringLiteral("offset"), entity.offset);
        if (entity.alias) {
            item.insert(QStringLiteral("alias"), *entity.alias);
        }
        entities.append(item);
    }
    json.insert(QStringLiteral("entities"), entities);

    return json;
}

std::optional<TextChunk> chunkFromJson(const QJsonObject& json, Error* errorOut)
{
    if (!requireFields(json, {"document", "text"}, "Chunk", errorOut)) {
        return std::nullopt;
    }

    TextChunk chunk;
    chunk.documentId = json.value(QStringLiteral("document")).toString();
    chunk.text = json.value(QStringLiteral("text")).toString();
    chunk.offset = json.value(QStringLiteral("offset")).toInt();
    chunk.tokens = stringList(json.value(QStringLiteral("tokens")));
    chunk.postags = stringList(json.value(QStringLiteral("postags")));
    chunk.chunkId = json.contains(QStringLiteral("id"))
        ? json.value(QStringLiteral("id")).toString()
        : computeChunkId(chunk.documentId, chunk.offset, chunk.tokenOffsetEnd());

    const QJsonArray entities = json.value(QStringLiteral("entities")).toArray();
    chunk.entities.reserve(static_cast<size_t>(entities.size()));
    for (const QJsonValue& value : entities) {
        const QJsonObject item = value.toObject();
        if (!requireFields(item, {"key", "canonical_form", "kind", "offset"},
                           "Chunk entity", errorOut)) {
            return std::nullopt;
        }
        const auto kind = parseKind(item.value(QStringLiteral("kind")), errorOut);
        if (!kind) {
            return std::nullopt;
        }
        EntityInChunk entity;
        entity.key = item.value(QStringLiteral("key")).toString();
        entity.canonicalForm = item.value(QStringLiteral("canonical_form")).toString();
        entity.kind = *kind;
        entity.offset = item.value(QStringLiteral("offset")).toInt();
        entity.alias = optionalString(item, QStringLiteral("alias"));
        chunk.entities.push_back(std::move(entity));
    }

    return chunk;
}

} // namespace ie
