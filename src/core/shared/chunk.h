#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace ie {

// Entity mention projected into a chunk. The offset is relative to the
// chunk's first token.
struct EntityInChunk {
    QString key;
    QString canonicalForm;
    EntityKind kind = EntityKind::Person;
    int offset = 0;
    std::optional<QString> alias;
};

// Token-range projection of a document: [offset, offset + tokens.size()).
// Owns copies of everything it carries so it can outlive the document.
struct TextChunk {
    QString chunkId;
    QString documentId;     // human identifier of the parent document
    QString text;           // caller-supplied, human readable
    int offset = 0;         // token offset of the chunk within the document

    // Same length, 1-to-1 (postags may be empty when the document is untagged)
    QStringList tokens;
    QStringList postags;

    std::vector<EntityInChunk> entities;

    int tokenOffsetEnd() const { return offset + static_cast<int>(tokens.size()); }
};

bool operator==(const EntityInChunk& a, const EntityInChunk& b);
bool operator!=(const EntityInChunk& a, const EntityInChunk& b);
bool operator==(const TextChunk& a, const TextChunk& b);
bool operator!=(const TextChunk& a, const TextChunk& b);

// Stable chunk ID: SHA-256 of "documentId#tokenOffset:tokenOffsetEnd"
QString computeChunkId(const QString& documentId, int tokenOffset, int tokenOffsetEnd);

} // namespace ie
