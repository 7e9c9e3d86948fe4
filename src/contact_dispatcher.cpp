#include "dropcatch/contact_dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace dropcatch
{

std::optional<ContactEvent> ContactDispatcher::Classify(const BodyRegistry& registry, b2BodyId a, b2BodyId b)
{
    std::optional<BodyRole> roleA = registry.RoleOf(a);
    std::optional<BodyRole> roleB = registry.RoleOf(b);
    if (!roleA || !roleB) return std::nullopt;

    // Normalise so the droplet, if any, is on side b.
    if (*roleA == BodyRole::Droplet)
    {
        std::swap(roleA, roleB);
        std::swap(a, b);
    }
    if (*roleB != BodyRole::Droplet) return std::nullopt;

    ContactEvent event;
    event.droplet = b;
    switch (*roleA)
    {
        case BodyRole::Bucket:
            event.kind = ContactKind::Caught;
            return event;
        case BodyRole::Ground:
            event.kind = ContactKind::Missed;
            return event;
        case BodyRole::Wall:
        case BodyRole::Droplet:
            break;
    }
    return std::nullopt;
}

bool ContactDispatcher::Dispatch(BodyRegistry& registry, b2BodyId a, b2BodyId b)
{
    std::optional<ContactEvent> event = Classify(registry, a, b);
    if (!event) return false;

    const BodyRecord* droplet = registry.Find(event->droplet);
    if (!droplet || droplet->markedForRemoval)
    {
        // Already caught or missed earlier in this step.
        return false;
    }

    spdlog::debug("Droplet {} {}", BodyKey(event->droplet), (event->kind == ContactKind::Caught) ? "caught" : "missed");
    if (m_handler)
    {
        m_handler->OnContact(*event);
    }

    if (BodyRecord* record = registry.Find(event->droplet))
    {
        record->markedForRemoval = true;
    }
    return true;
}

int ContactDispatcher::DispatchBeginEvents(BodyRegistry& registry, const b2ContactEvents& events)
{
    int emitted = 0;
    for (int i = 0; i < events.beginCount; ++i)
    {
        const b2ContactBeginTouchEvent& begin = events.beginEvents[i];
        if (!b2Shape_IsValid(begin.shapeIdA) || !b2Shape_IsValid(begin.shapeIdB)) continue;
        b2BodyId a = b2Shape_GetBody(begin.shapeIdA);
        b2BodyId b = b2Shape_GetBody(begin.shapeIdB);
        if (Dispatch(registry, a, b)) ++emitted;
    }
    return emitted;
}

} // namespace dropcatch
