//----------------------------------------------------------------------------------------------------------------------
// File: Publisher.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Publisher.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

Event::Publisher::Publisher()
    : m_suspended(false)
    , m_listeners()
    , m_advertised(0)
    , m_mutex()
    , m_events()
{
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::SuspendSubscriptions()
{
    m_suspended = true;
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::Advertise(Type type)
{
    m_advertised.fetch_or(ToMask(type));
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::Advertise(std::initializer_list<Type> types)
{
    std::uint32_t mask = 0;
    for (auto const type : types) { mask |= ToMask(type); }
    m_advertised.fetch_or(mask);
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::IsAdvertised(Type type) const
{
    return (m_advertised.load() & ToMask(type)) != 0;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::EventCount() const
{
    std::scoped_lock lock(m_mutex);
    return m_events.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::Dispatch()
{
    decltype(m_events) events;
    {
        std::scoped_lock lock(m_mutex);
        events.swap(m_events);
    }

    for (auto const& upEvent : events) {
        auto const& listeners = m_listeners[static_cast<std::size_t>(upEvent->GetType())];
        assert(!listeners.empty()); // Events without a listener are never queued.
        for (auto const& listener : listeners) { listener(*upEvent); }
    }

    return events.size();
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::Listen(Type type, Listener&& listener)
{
    m_listeners[static_cast<std::size_t>(type)].emplace_back(std::move(listener));
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::Enqueue(Type type, std::unique_ptr<IMessage>&& upEvent)
{
    assert(m_suspended); // The listener table must be closed before any event is raised.
    if (m_listeners[static_cast<std::size_t>(type)].empty()) { return; }

    std::scoped_lock lock(m_mutex);
    m_events.emplace_back(std::move(upEvent));
}

//----------------------------------------------------------------------------------------------------------------------
