#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>

namespace ie {

// Canonical, deduplicated referent. Owned by the external store.
struct Entity {
    QString key;
    QString canonicalForm;
    EntityKind kind = EntityKind::Person;
};

// A mention of an entity at a token offset of a document. The entity is
// referenced by key and resolved through an EntityDirectory.
struct EntityOccurrence {
    QString entityKey;
    int offset = 0;
    std::optional<QString> alias;  // surface text, if different from canonicalForm
};

inline bool operator==(const Entity& a, const Entity& b)
{
    return a.key == b.key && a.canonicalForm == b.canonicalForm && a.kind == b.kind;
}

inline bool operator==(const EntityOccurrence& a, const EntityOccurrence& b)
{
    return a.entityKey == b.entityKey && a.offset == b.offset && a.alias == b.alias;
}

inline bool operator!=(const EntityOccurrence& a, const EntityOccurrence& b)
{
    return !(a == b);
}

} // namespace ie
