#include "core/document/document.h"

#include <algorithm>

namespace ie {

int Document::sentenceCount() const
{
    if (sentences.size() < 2) {
        return 0;
    }
    return static_cast<int>(sentences.size()) - 1;
}

void Document::addEntityOccurrence(const EntityOccurrence& occurrence)
{
    const auto pos = std::upper_bound(
        entities.begin(), entities.end(), occurrence.offset,
        [](int offset, const EntityOccurrence& occ) { return offset < occ.offset; });
    entities.insert(pos, occurrence);
}

bool Document::entitiesSorted() const
{
    return std::is_sorted(entities.begin(), entities.end(),
                          [](const EntityOccurrence& a, const EntityOccurrence& b) {
                              return a.offset < b.offset;
                          });
}

bool operator==(const Document& a, const Document& b)
{
    return a.humanIdentifier == b.humanIdentifier
        && a.title == b.title
        && a.url == b.url
        && a.text == b.text
        && a.creationDate == b.creationDate
        && a.metadata == b.metadata
        && a.preprocessMetadata == b.preprocessMetadata
        && a.tokens == b.tokens
        && a.offsets == b.offsets
        && a.postags == b.postags
        && a.sentences == b.sentences
        && a.entities == b.entities;
}

bool operator!=(const Document& a, const Document& b)
{
    return !(a == b);
}

} // namespace ie
