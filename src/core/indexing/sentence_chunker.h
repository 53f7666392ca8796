#pragma once

#include "core/document/document.h"
#include "core/document/entity_directory.h"
#include "core/indexing/chunk_builder.h"
#include "core/shared/chunk.h"
#include "core/shared/errors.h"
#include "core/shared/settings.h"

#include <QString>

#include <optional>
#include <vector>

namespace ie {

// Configuration for the SentenceChunker.
struct SentenceChunkerConfig {
    int sentencesPerChunk = 1;
    int overlapSentences = 0;    // sentences shared by consecutive windows
    int maxTokensPerChunk = 0;   // 0 = unlimited
    bool requireSegmentation = false;
};

// Half-open token range [begin, end).
struct TokenRange {
    int begin = 0;
    int end = 0;
};

inline bool operator==(const TokenRange& a, const TokenRange& b)
{
    return a.begin == b.begin && a.end == b.end;
}

// SentenceChunker -- carves a whole document into chunks along sentence
// boundaries and builds each one with ChunkBuilder.
//
// Windows hold sentencesPerChunk sentences and advance by
// sentencesPerChunk - overlapSentences, so overlapSentences == 0 partitions
// the document. A window longer than maxTokensPerChunk is split further into
// consecutive token ranges.
//
// Without segmentation the document is a single chunk, unless
// requireSegmentation is set, in which case it yields no chunks.
class SentenceChunker {
public:
    using Config = SentenceChunkerConfig;

    explicit SentenceChunker(const EntityDirectory& entities, const Config& config = {});

    // Returns nullopt if building any chunk failed.
    std::optional<std::vector<TextChunk>> chunkDocument(const Document& document,
                                                        Error* errorOut = nullptr) const;

    // The token ranges chunkDocument() would build, in order.
    std::vector<TokenRange> planRanges(const Document& document) const;

    // Text of [begin, end) cut from document.text through the character
    // offsets, or the tokens joined by spaces when offsets are unusable.
    static QString rangeText(const Document& document, int begin, int end);

    const Config& config() const { return m_config; }

private:
    void appendRange(std::vector<TokenRange>& ranges, int begin, int end) const;

    ChunkBuilder m_builder;
    Config m_config;
};

SentenceChunkerConfig chunkerConfigFromSettings(const Settings& settings);

} // namespace ie
