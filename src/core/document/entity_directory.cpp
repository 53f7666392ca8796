#include "core/document/entity_directory.h"

namespace ie {

std::optional<Entity> InMemoryEntityDirectory::find(const QString& key) const
{
    const auto it = m_entities.constFind(key);
    if (it == m_entities.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

void InMemoryEntityDirectory::insert(const Entity& entity)
{
    m_entities.insert(entity.key, entity);
}

bool InMemoryEntityDirectory::remove(const QString& key)
{
    return m_entities.remove(key);
}

bool InMemoryEntityDirectory::contains(const QString& key) const
{
    return m_entities.contains(key);
}

int InMemoryEntityDirectory::size() const
{
    return static_cast<int>(m_entities.size());
}

void InMemoryEntityDirectory::clear()
{
    m_entities.clear();
}

} // namespace ie
