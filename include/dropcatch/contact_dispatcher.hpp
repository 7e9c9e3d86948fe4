#pragma once

#include "dropcatch/body_registry.hpp"

#include <optional>

namespace dropcatch
{

enum class ContactKind
{
    Caught,
    Missed
};

struct ContactEvent
{
    ContactKind kind = ContactKind::Caught;
    b2BodyId droplet = b2_nullBodyId;
};

// Receives catch/miss events while the contact is still live. Handlers may
// update game state but must not create or destroy bodies.
class ContactHandler
{
public:
    virtual ~ContactHandler() = default;
    virtual void OnContact(const ContactEvent& event) = 0;
};

class ContactDispatcher
{
public:
    // Replaces the current handler. nullptr detaches.
    void SetHandler(ContactHandler* handler)
    {
        m_handler = handler;
    }

    ContactHandler* Handler() const
    {
        return m_handler;
    }

    // Pure role matching: Bucket x Droplet -> Caught, Ground x Droplet -> Missed,
    // anything else (or an unregistered body) -> nothing.
    static std::optional<ContactEvent> Classify(const BodyRegistry& registry, b2BodyId a, b2BodyId b);

    // Classifies one begin-touch pair, emits the event and flags the droplet.
    // Returns true when an event was emitted.
    bool Dispatch(BodyRegistry& registry, b2BodyId a, b2BodyId b);

    // Walks the begin-touch events buffered by the last b2World_Step.
    int DispatchBeginEvents(BodyRegistry& registry, const b2ContactEvents& events);

private:
    ContactHandler* m_handler = nullptr;
};

} // namespace dropcatch
