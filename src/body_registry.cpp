#include "dropcatch/body_registry.hpp"

namespace dropcatch
{

void BodyRegistry::Add(b2BodyId id, BodyRole role)
{
    BodyRecord record;
    record.bodyId = id;
    record.role = role;
    m_records[BodyKey(id)] = record;
}

void BodyRegistry::Remove(b2BodyId id)
{
    m_records.erase(BodyKey(id));
}

void BodyRegistry::Clear()
{
    m_records.clear();
}

BodyRecord* BodyRegistry::Find(b2BodyId id)
{
    auto it = m_records.find(BodyKey(id));
    return (it != m_records.end()) ? &it->second : nullptr;
}

const BodyRecord* BodyRegistry::Find(b2BodyId id) const
{
    auto it = m_records.find(BodyKey(id));
    return (it != m_records.end()) ? &it->second : nullptr;
}

std::optional<BodyRole> BodyRegistry::RoleOf(b2BodyId id) const
{
    const BodyRecord* record = Find(id);
    if (!record) return std::nullopt;
    return record->role;
}

} // namespace dropcatch
