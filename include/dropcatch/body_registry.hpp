#pragma once

#include "dropcatch/physics_types.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>

namespace dropcatch
{

struct BodyRecord
{
    b2BodyId bodyId = b2_nullBodyId;
    BodyRole role = BodyRole::Droplet;
    bool markedForRemoval = false;
};

// Role and removal flag of every body the world created, keyed by the
// packed body id.
class BodyRegistry
{
public:
    void Add(b2BodyId id, BodyRole role);
    void Remove(b2BodyId id);
    void Clear();

    BodyRecord* Find(b2BodyId id);
    const BodyRecord* Find(b2BodyId id) const;

    std::optional<BodyRole> RoleOf(b2BodyId id) const;

    size_t Size() const
    {
        return m_records.size();
    }

    template <typename Fn>
    void ForEach(Fn&& fn)
    {
        for (auto& entry : m_records)
        {
            fn(entry.second);
        }
    }

private:
    std::unordered_map<uint64_t, BodyRecord> m_records;
};

} // namespace dropcatch
