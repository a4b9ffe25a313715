//----------------------------------------------------------------------------------------------------------------------
// File: Channel.hpp
// Description: Propagates clipboard content between the hub and its peers. The channel remembers the last content
// exchanged with each peer so content is never sent to a peer that already holds it, which suppresses the echo of an
// update back to its origin and the repetition of identical consecutive values.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Device/Device.hpp"
#include "Components/Message/Messages.hpp"
#include "Interfaces/PeerObserver.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

class IClipboardAccess;
class IPeerMessenger;

namespace spdlog { class logger; }
namespace Route { class Context; }

//----------------------------------------------------------------------------------------------------------------------
namespace Clipboard {
//----------------------------------------------------------------------------------------------------------------------

struct Entry;
class Channel;

//----------------------------------------------------------------------------------------------------------------------
} // Clipboard namespace
//----------------------------------------------------------------------------------------------------------------------

struct Clipboard::Entry
{
    std::string text;
    Device::Identifier origin;
    TimeUtils::Timestamp timestamp;
};

//----------------------------------------------------------------------------------------------------------------------

class Clipboard::Channel : public IPeerObserver
{
public:
    struct Options
    {
        bool enabled = true;
        bool relay = false; // Forward the updates received from one peer to the other peers.
    };

    Channel(
        Device::Identifier const& local,
        IPeerMessenger& messenger,
        IClipboardAccess* const pAccess,
        Options const& options);

    Channel(Channel const&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(Channel const&) = delete;
    Channel& operator=(Channel&&) = delete;

    // Handles a content change reported by the local clipboard. Returns the number of peers the content was sent to.
    std::size_t OnLocalChange(std::string const& text);

    // Route Handlers {
    [[nodiscard]] bool Handle(Route::Context const& context, Message::ClipboardUpdate const& update);
    // } Route Handlers

    // IPeerObserver {
    virtual void OnPeerConnected(Device::Identifier const& peer) override;
    virtual void OnPeerDisconnected(Device::Identifier const& peer, Connection::Cause cause) override;
    // } IPeerObserver

    [[nodiscard]] bool IsEnabled() const;
    [[nodiscard]] std::optional<Entry> const& GetCurrent() const;
    [[nodiscard]] std::optional<std::string> GetLastExchanged(Device::Identifier const& peer) const;

private:
    std::size_t Broadcast(Entry const& entry, Device::Identifier const& excluded);

    Device::Identifier const m_local;
    IPeerMessenger& m_messenger;
    IClipboardAccess* const m_pAccess;
    Options const m_options;
    std::shared_ptr<spdlog::logger> m_logger;

    std::optional<Entry> m_optCurrent;
    std::unordered_map<Device::Identifier, std::string> m_exchanged;
};

//----------------------------------------------------------------------------------------------------------------------
