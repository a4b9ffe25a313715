//----------------------------------------------------------------------------------------------------------------------
// File: Publisher.hpp
// Description: Queues the events raised by the hub's components and delivers them on the core thread. Components
// advertise the events they may raise, the core only subscribes to what has been advertised.
// Notes: Subscriptions are made on the core thread before the network thread starts. Once suspended, the listener
// table is only read and publishing from any thread is allowed.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Events.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <deque>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Event {
//----------------------------------------------------------------------------------------------------------------------

class Publisher;
using SharedPublisher = std::shared_ptr<Publisher>;

//----------------------------------------------------------------------------------------------------------------------
} // Event namespace
//----------------------------------------------------------------------------------------------------------------------

class Event::Publisher
{
public:
    Publisher();

    Publisher(Publisher const&) = delete;
    Publisher(Publisher&&) = delete;
    Publisher& operator=(Publisher const&) = delete;
    Publisher& operator=(Publisher&&) = delete;

    template<Type SpecificType> requires MessageWithContent<SpecificType>
    bool Subscribe(typename Event::Message<SpecificType>::CallbackTrait const& callback)
    {
        if (m_suspended) { return false; }
        Listen(SpecificType, [callback] (IMessage const& event) {
            std::apply(callback, static_cast<Event::Message<SpecificType> const&>(event).GetContent());
        });
        return true;
    }

    template<Type SpecificType> requires MessageWithoutContent<SpecificType>
    bool Subscribe(typename Event::Message<SpecificType>::CallbackTrait const& callback)
    {
        if (m_suspended) { return false; }
        Listen(SpecificType, [callback] (IMessage const&) { std::invoke(callback); });
        return true;
    }

    // Closes the listener table. Subscriptions made afterwards are refused.
    void SuspendSubscriptions();

    void Advertise(Type type);
    void Advertise(std::initializer_list<Type> types);
    [[nodiscard]] bool IsAdvertised(Type type) const;

    template<Type SpecificType, typename... Arguments> requires MessageWithContent<SpecificType>
    void Publish(Arguments&&... arguments)
    {
        Enqueue(SpecificType, std::make_unique<Event::Message<SpecificType>>(std::forward<Arguments>(arguments)...));
    }

    template<Type SpecificType> requires MessageWithoutContent<SpecificType>
    void Publish()
    {
        Enqueue(SpecificType, std::make_unique<Event::Message<SpecificType>>());
    }

    [[nodiscard]] std::size_t EventCount() const;

    // Delivers the queued events to their listeners, returning the number of events delivered.
    std::size_t Dispatch();

private:
    using Listener = std::function<void(IMessage const&)>;

    [[nodiscard]] static constexpr std::uint32_t ToMask(Type type)
    {
        return std::uint32_t{ 1 } << static_cast<std::uint32_t>(type);
    }

    void Listen(Type type, Listener&& listener);
    void Enqueue(Type type, std::unique_ptr<IMessage>&& upEvent);

    std::atomic_bool m_suspended;
    std::array<std::vector<Listener>, TypeCount> m_listeners;
    std::atomic_uint32_t m_advertised;

    mutable std::mutex m_mutex;
    std::deque<std::unique_ptr<IMessage>> m_events;
};

static_assert(Event::TypeCount <= 32, "The advertisement mask holds at most 32 event types.");

//----------------------------------------------------------------------------------------------------------------------
