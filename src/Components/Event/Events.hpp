//----------------------------------------------------------------------------------------------------------------------
// File: Events.hpp
// Description: The typed events published by the hub's components and consumed on the core thread.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Connection/State.hpp"
#include "Components/Device/Device.hpp"
#include "Components/Network/Address.hpp"
#include "Components/Pairing/Code.hpp"
#include "Components/Transfer/Status.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/facilities/empty.hpp>
#include <boost/preprocessor/facilities/va_opt.hpp>
#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Event {
//----------------------------------------------------------------------------------------------------------------------

enum class Type : std::uint32_t
{
    BindingFailed,
    PairingCodeExpired,
    PairingCodeIssued,
    PairingFailed,
    PeerConnected,
    PeerDisconnected,
    PeerPaired,
    PeerReconnecting,
    PeerUnpaired,
    ReconnectExhausted,
    RuntimeStarted,
    RuntimeStopped,
    ServiceDiscovered,
    ServiceRemoved,
    TransferFinished
};

constexpr std::size_t TypeCount = static_cast<std::size_t>(Type::TransferFinished) + 1;

class IMessage;

// By default, the message constructor is deleted to prevent usage of unspecialized types.
template<Type SpecificType>
class Message { Message() = delete; };

template<Type SpecificType>
concept MessageWithContent = requires { typename Message<SpecificType>::EventContent; };

template<Type SpecificType>
concept MessageWithoutContent = !MessageWithContent<SpecificType>;

//----------------------------------------------------------------------------------------------------------------------
} // Event namespace
//----------------------------------------------------------------------------------------------------------------------

class Event::IMessage
{
public:
    virtual ~IMessage() = default;
    virtual Event::Type GetType() = 0;
};

//----------------------------------------------------------------------------------------------------------------------
// Note: The following macros define the boilerplate  types, methods, and variables that should be present in event
// specializations. This breakout is done to provide a decent level of flexibility between the traits as well as
// enable further customization if needed.
//----------------------------------------------------------------------------------------------------------------------

// Allows the event to define custom causes, (e.g. the event fired because of a defined error).
#define EVENT_MESSAGE_CAUSE(...) \
public: enum class Cause : std::uint32_t { __VA_ARGS__ };

// Converts a callback type into an unqualified content store type (e.g. std::string const& becomes std::string).
#define EVENT_MESSAGE_CONTENT_STORE_TYPES(r, data, i, elem) BOOST_PP_COMMA_IF(i) std::remove_cvref_t<elem>
// Converts a callback type into a named parameter (e.g. std::string const& becomes std::string const& arg_0).
#define EVENT_MESSAGE_CONTENT_STORE_ARGS(r, data, i, elem) BOOST_PP_COMMA_IF(i) elem arg_##i
// Converted a callback type into the name argument (e.g. std::string const& becomes arg_0)
#define EVENT_MESSAGE_CONTENT_STORE_NAMES(r, data, i, elem) BOOST_PP_COMMA_IF(i) arg_##i

// Creates the types, methods, and variables needed to support storing and providing callback content.
#define EVENT_MESSAGE_CONTENT_STORE(...) \
public:\
    using EventContent = std::tuple<\
        BOOST_PP_SEQ_FOR_EACH_I(EVENT_MESSAGE_CONTENT_STORE_TYPES, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))>; \
    explicit Message(BOOST_PP_SEQ_FOR_EACH_I(\
        EVENT_MESSAGE_CONTENT_STORE_ARGS, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))) \
        : m_content(std::make_tuple(BOOST_PP_SEQ_FOR_EACH_I( \
            EVENT_MESSAGE_CONTENT_STORE_NAMES, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)))) {} \
    explicit Message(EventContent&& content) : m_content(std::move(content)) {} \
    auto const& GetContent() const { return m_content; } \
private: \
    EventContent m_content;
#define EVENT_MESSAGE_CONTENT_STORE_EMPTY \
private: \
    using EventContent = void;

// Creates the core types and methods needed to define an event specialization.
#define EVENT_MESSAGE_CORE(type, ...) \
public:\
    using CallbackTrait = std::function<void(__VA_ARGS__)>; \
    static constexpr Event::Type Type = type; \
    Message() = default; \
    ~Message() = default; \
    Message(Message const&) = delete; \
    Message(Message&& ) = default; \
    Message& operator=(Message const&) = delete; \
    Message& operator=(Message&&) = default; \
    virtual Event::Type GetType() override { return Type; } \
    BOOST_PP_VA_OPT((EVENT_MESSAGE_CONTENT_STORE(__VA_ARGS__)), (EVENT_MESSAGE_CONTENT_STORE_EMPTY), __VA_ARGS__)

//----------------------------------------------------------------------------------------------------------------------
// Schema: The uri of the socket that could not be bound and the cause of the failure.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::BindingFailed> : public Event::IMessage
{
    EVENT_MESSAGE_CAUSE(AddressInUse, Permissions, UnexpectedError)
    EVENT_MESSAGE_CORE(Event::Type::BindingFailed, std::string const&, Cause)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The value of the code that elapsed without being consumed.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::PairingCodeExpired> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::PairingCodeExpired, std::string const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The newly outstanding pairing code.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::PairingCodeIssued> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::PairingCodeIssued, Pairing::Code const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The identifier of the device that attempted to pair and the reason it was rejected.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::PairingFailed> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::PairingFailed, Device::Identifier const&, Pairing::Error)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The details of the authenticated device and the address of its transport.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::PeerConnected> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::PeerConnected, Device::Details const&, Network::RemoteAddress const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The identifier of the device and the cause of the closure.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::PeerDisconnected> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::PeerDisconnected, Device::Identifier const&, Connection::Cause)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The details of the device that has been promoted to trusted.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::PeerPaired> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::PeerPaired, Device::Details const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The identifier of the device, the attempt number, and the delay before the attempt.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::PeerReconnecting> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(
        Event::Type::PeerReconnecting, Device::Identifier const&, std::uint32_t, std::chrono::milliseconds)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The identifier of the device and the side that requested the unpairing.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::PeerUnpaired> : public Event::IMessage
{
    EVENT_MESSAGE_CAUSE(LocalRequest, PeerRequest)
    EVENT_MESSAGE_CORE(Event::Type::PeerUnpaired, Device::Identifier const&, Cause)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The identifier of the device and the number of attempts made before giving up.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::ReconnectExhausted> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::ReconnectExhausted, Device::Identifier const&, std::uint32_t)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: No event data to be captured.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::RuntimeStarted> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::RuntimeStarted)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The case of the runtime stopping.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::RuntimeStopped> : public Event::IMessage
{
    EVENT_MESSAGE_CAUSE(ShutdownRequest, UnexpectedError)
    EVENT_MESSAGE_CORE(Event::Type::RuntimeStopped, Cause)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The advertised instance name and the first resolved address of the service.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::ServiceDiscovered> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::ServiceDiscovered, std::string const&, Network::RemoteAddress const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The advertised instance name of the service.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::ServiceRemoved> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::ServiceRemoved, std::string const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The identifier of the device and the final state of the transfer.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::TransferFinished> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::TransferFinished, Device::Identifier const&, Transfer::Summary const&)
};

//----------------------------------------------------------------------------------------------------------------------
