#pragma once

#include "core/document/document.h"
#include "core/document/entity_directory.h"
#include "core/shared/chunk.h"
#include "core/shared/errors.h"

#include <QString>

#include <optional>

namespace ie {

// ChunkBuilder -- projects a token range of a document into a TextChunk.
//
// Tokens and tags in [tokenOffset, tokenOffsetEnd) are copied verbatim.
// Entity occurrences with offsets in the same range are located with
// findBounds (the occurrence list must be sorted by offset), resolved through
// the EntityDirectory and re-based so that offset 0 is the chunk's first token.
class ChunkBuilder {
public:
    explicit ChunkBuilder(const EntityDirectory& entities);

    // `text` is the human-readable form of the range. It is stored as given
    // and not checked against the tokens.
    //
    // Fails with InvalidRange unless 0 <= tokenOffset <= tokenOffsetEnd <=
    // token count, and with UnknownEntity if an occurrence in range cannot be
    // resolved.
    std::optional<TextChunk> build(const Document& document,
                                   int tokenOffset,
                                   int tokenOffsetEnd,
                                   const QString& text,
                                   Error* errorOut = nullptr) const;

private:
    const EntityDirectory& m_entities;
};

} // namespace ie
