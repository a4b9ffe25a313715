//----------------------------------------------------------------------------------------------------------------------
// File: Channel.hpp
// Description: Mirrors the notifications posted and removed on one device to the connections that have opted into
// notification mirroring. Notifications are keyed by their origin and stable identifier, a repeated post with the same
// identifier replaces the mirrored copy.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Device/Device.hpp"
#include "Components/Message/Messages.hpp"
#include "Interfaces/PeerObserver.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

class INotificationSink;
class IPeerMessenger;

namespace spdlog { class logger; }
namespace Route { class Context; }

//----------------------------------------------------------------------------------------------------------------------
namespace Notification {
//----------------------------------------------------------------------------------------------------------------------

class Channel;

//----------------------------------------------------------------------------------------------------------------------
} // Notification namespace
//----------------------------------------------------------------------------------------------------------------------

class Notification::Channel : public IPeerObserver
{
public:
    struct Options
    {
        bool enabled = true;
        bool relay = false; // Forward the notifications of one peer to the other peers.
    };

    Channel(
        Device::Identifier const& local,
        IPeerMessenger& messenger,
        INotificationSink* const pSink,
        Options const& options);

    Channel(Channel const&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(Channel const&) = delete;
    Channel& operator=(Channel&&) = delete;

    // Captured on the local device. Returns the number of peers the event was forwarded to.
    std::size_t OnLocalPosted(Message::Notification notification);
    std::size_t OnLocalRemoved(std::string const& id);

    // Dismisses a mirrored notification on the local device and asks its origin to remove it.
    [[nodiscard]] bool Dismiss(Device::Identifier const& origin, std::string const& id);

    // Route Handlers {
    [[nodiscard]] bool Handle(Route::Context const& context, Message::Notification const& notification);
    [[nodiscard]] bool Handle(Route::Context const& context, Message::NotificationRemoved const& removed);
    // } Route Handlers

    // IPeerObserver {
    virtual void OnPeerConnected(Device::Identifier const& peer) override;
    virtual void OnPeerDisconnected(Device::Identifier const& peer, Connection::Cause cause) override;
    // } IPeerObserver

    [[nodiscard]] bool IsEnabled() const;
    [[nodiscard]] std::size_t GetMirroredCount() const;
    [[nodiscard]] std::optional<Message::Notification> FindMirrored(
        Device::Identifier const& origin, std::string const& id) const;

private:
    using Key = std::pair<Device::Identifier, std::string>;

    std::size_t Forward(Message::Variant const& message, Device::Identifier const& origin);

    Device::Identifier const m_local;
    IPeerMessenger& m_messenger;
    INotificationSink* const m_pSink;
    Options const m_options;
    std::shared_ptr<spdlog::logger> m_logger;

    std::map<Key, Message::Notification> m_mirrored;
};

//----------------------------------------------------------------------------------------------------------------------
