#include "core/indexing/sentence_chunker.h"
#include "core/document/preprocess_state.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace ie {

// ── Construction ────────────────────────────────────────────

SentenceChunker::SentenceChunker(const EntityDirectory& entities, const Config& config)
    : m_builder(entities)
    , m_config(config)
{
    // Sanity-check config bounds
    if (m_config.sentencesPerChunk < 1) {
        m_config.sentencesPerChunk = 1;
    }
    if (m_config.overlapSentences < 0) {
        m_config.overlapSentences = 0;
    }
    if (m_config.overlapSentences >= m_config.sentencesPerChunk) {
        m_config.overlapSentences = m_config.sentencesPerChunk - 1;
    }
    if (m_config.maxTokensPerChunk < 0) {
        m_config.maxTokensPerChunk = 0;
    }
}

// ── Public API ──────────────────────────────────────────────

std::optional<std::vector<TextChunk>> SentenceChunker::chunkDocument(
    const Document& document, Error* errorOut) const
{
    const std::vector<TokenRange> ranges = planRanges(document);

    std::vector<TextChunk> chunks;
    chunks.reserve(ranges.size());
    for (const TokenRange& range : ranges) {
        auto chunk = m_builder.build(document, range.begin, range.end,
                                     rangeText(document, range.begin, range.end),
                                     errorOut);
        if (!chunk) {
            LOG_WARN(ieChunking, "%s: chunking aborted at [%d, %d)",
                     qUtf8Printable(document.humanIdentifier), range.begin, range.end);
            return std::nullopt;
        }
        chunks.push_back(std::move(*chunk));
    }

    LOG_DEBUG(ieChunking, "Chunked %s: %d chunks from %d tokens, %d sentences",
              qUtf8Printable(document.humanIdentifier),
              static_cast<int>(chunks.size()),
              document.tokenCount(),
              document.sentenceCount());

    return chunks;
}

std::vector<TokenRange> SentenceChunker::planRanges(const Document& document) const
{
    std::vector<TokenRange> ranges;
    const int tokenCount = document.tokenCount();

    if (!PreprocessState::wasDone(document, PreprocessStage::Segmentation)) {
        if (m_config.requireSegmentation) {
            LOG_WARN(ieChunking, "%s: not segmented, no chunks produced",
                     qUtf8Printable(document.humanIdentifier));
            return ranges;
        }
        if (tokenCount > 0) {
            appendRange(ranges, 0, tokenCount);
        }
        return ranges;
    }

    const std::vector<int>& bounds = document.sentences;
    const int sentenceCount = document.sentenceCount();
    const int step = m_config.sentencesPerChunk - m_config.overlapSentences;

    for (int first = 0; first < sentenceCount; first += step) {
        const int last = std::min(first + m_config.sentencesPerChunk, sentenceCount);
        appendRange(ranges,
                    bounds[static_cast<size_t>(first)],
                    bounds[static_cast<size_t>(last)]);
        if (last == sentenceCount) {
            break;
        }
    }

    return ranges;
}

QString SentenceChunker::rangeText(const Document& document, int begin, int end)
{
    if (begin >= end) {
        return QString();
    }

    const int tokenCount = document.tokenCount();
    const bool offsetsUsable = document.offsets.size() == static_cast<size_t>(tokenCount)
        && begin >= 0 && end <= tokenCount;
    if (offsetsUsable) {
        const qsizetype textStart = document.offsets[static_cast<size_t>(begin)];
        const qsizetype textEnd = end < tokenCount
            ? document.offsets[static_cast<size_t>(end)]
            : document.text.size();
        if (textStart >= 0 && textStart <= textEnd && textEnd <= document.text.size()) {
            return document.text.mid(textStart, textEnd - textStart).trimmed();
        }
    }

    return document.tokens.mid(begin, end - begin).join(QLatin1Char(' '));
}

SentenceChunkerConfig chunkerConfigFromSettings(const Settings& settings)
{
    SentenceChunkerConfig config;
    config.sentencesPerChunk = settings.sentencesPerChunk;
    config.overlapSentences = settings.overlapSentences;
    config.maxTokensPerChunk = settings.maxTokensPerChunk;
    config.requireSegmentation = settings.requireSegmentation;
    return config;
}

// ── Private helpers ─────────────────────────────────────────

void SentenceChunker::appendRange(std::vector<TokenRange>& ranges, int begin, int end) const
{
    if (m_config.maxTokensPerChunk <= 0) {
        ranges.push_back({begin, end});
        return;
    }

    int pos = begin;
    while (pos < end) {
        const int len = std::min(m_config.maxTokensPerChunk, end - pos);
        ranges.push_back({pos, pos + len});
        pos += len;
    }
}

} // namespace ie
