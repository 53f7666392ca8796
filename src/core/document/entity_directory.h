#pragma once

#include "core/document/entity.h"

#include <QHash>
#include <QString>

#include <optional>

namespace ie {

// Lookup contract for resolving an occurrence's entity key. Implemented by
// whatever store owns the entities.
class EntityDirectory {
public:
    virtual ~EntityDirectory() = default;

    virtual std::optional<Entity> find(const QString& key) const = 0;
};

// Hash-map backed directory. Not synchronized.
class InMemoryEntityDirectory : public EntityDirectory {
public:
    InMemoryEntityDirectory() = default;

    std::optional<Entity> find(const QString& key) const override;

    // Replaces any entity already stored under the same key.
    void insert(const Entity& entity);
    bool remove(const QString& key);
    bool contains(const QString& key) const;
    int size() const;
    void clear();

private:
    QHash<QString, Entity> m_entities;
};

} // namespace ie
