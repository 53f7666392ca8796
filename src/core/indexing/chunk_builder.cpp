#include "core/indexing/chunk_builder.h"
#include "core/indexing/range_indexer.h"
#include "core/shared/logging.h"

namespace ie {

ChunkBuilder::ChunkBuilder(const EntityDirectory& entities)
    : m_entities(entities)
{
}

std::optional<TextChunk> ChunkBuilder::build(const Document& document,
                                             int tokenOffset,
                                             int tokenOffsetEnd,
                                             const QString& text,
                                             Error* errorOut) const
{
    const int tokenCount = document.tokenCount();
    if (tokenOffset < 0 || tokenOffset > tokenOffsetEnd || tokenOffsetEnd > tokenCount) {
        const QString message = QStringLiteral("Token range [%1, %2) is invalid for %3 tokens")
            .arg(tokenOffset).arg(tokenOffsetEnd).arg(tokenCount);
        LOG_WARN(ieChunking, "%s: %s",
                 qUtf8Printable(document.humanIdentifier), qUtf8Printable(message));
        reportError(errorOut, ErrorCode::InvalidRange, message);
        return std::nullopt;
    }

    const auto bounds = findBounds(
        document.entities, tokenOffset, tokenOffsetEnd,
        [](const EntityOccurrence& occ) { return occ.offset; },
        errorOut);
    if (!bounds) {
        return std::nullopt;
    }

    const qsizetype length = tokenOffsetEnd - tokenOffset;

    TextChunk chunk;
    chunk.chunkId = computeChunkId(document.humanIdentifier, tokenOffset, tokenOffsetEnd);
    chunk.documentId = document.humanIdentifier;
    chunk.text = text;
    chunk.offset = tokenOffset;
    chunk.tokens = document.tokens.mid(tokenOffset, length);
    // An untagged document has no tags to slice; mid() clips to what exists.
    chunk.postags = document.postags.mid(tokenOffset, length);

    chunk.entities.reserve(static_cast<size_t>(bounds->count()));
    for (qsizetype i = bounds->lower; i < bounds->upper; ++i) {
        const EntityOccurrence& occ = document.entities[static_cast<size_t>(i)];
        const std::optional<Entity> entity = m_entities.find(occ.entityKey);
        if (!entity) {
            const QString message = QStringLiteral("Entity '%1' at token %2 is unknown")
                .arg(occ.entityKey).arg(occ.offset);
            LOG_WARN(ieChunking, "%s: %s",
                     qUtf8Printable(document.humanIdentifier), qUtf8Printable(message));
            reportError(errorOut, ErrorCode::UnknownEntity, message);
            return std::nullopt;
        }

        EntityInChunk projected;
        projected.key = entity->key;
        projected.canonicalForm = entity->canonicalForm;
        projected.kind = entity->kind;
        projected.offset = occ.offset - tokenOffset;
        projected.alias = occ.alias;
        chunk.entities.push_back(std::move(projected));
    }

    LOG_DEBUG(ieChunking, "%s: chunk [%d, %d) with %d entities",
              qUtf8Printable(document.humanIdentifier),
              tokenOffset, tokenOffsetEnd,
              static_cast<int>(chunk.entities.size()));

    return chunk;
}

} // namespace ie
