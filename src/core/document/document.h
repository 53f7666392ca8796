#pragma once

#include "core/document/entity.h"

#include <QDateTime>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVariantMap>

#include <vector>

namespace ie {

// Completion markers of the preprocessing stages, keyed by stage name
// ("tokenization", "segmentation", ...). A stage is done iff present.
struct PreprocessMetadata {
    QHash<QString, QDateTime> doneAt;
};

inline bool operator==(const PreprocessMetadata& a, const PreprocessMetadata& b)
{
    return a.doneAt == b.doneAt;
}

// A document travelling through the preprocessing pipeline.
//
// tokens, offsets and postags have one item per token once the matching
// stages ran. sentences holds the token offsets where sentences start, closed
// by the token count. entities is sorted by offset.
struct Document {
    QString humanIdentifier;
    QString title;
    QString url;
    QString text;
    QDateTime creationDate = QDateTime::currentDateTimeUtc();
    QVariantMap metadata;

    PreprocessMetadata preprocessMetadata;

    QStringList tokens;
    std::vector<int> offsets;  // character offset of each token in text
    QStringList postags;
    std::vector<int> sentences;
    std::vector<EntityOccurrence> entities;

    int tokenCount() const { return static_cast<int>(tokens.size()); }

    // Number of sentences described by the boundary list (0 if unsegmented).
    int sentenceCount() const;

    // Inserts after any occurrence with the same offset, keeping the list
    // sorted and stable.
    void addEntityOccurrence(const EntityOccurrence& occurrence);

    bool entitiesSorted() const;
};

bool operator==(const Document& a, const Document& b);
bool operator!=(const Document& a, const Document& b);

} // namespace ie
