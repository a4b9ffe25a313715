//----------------------------------------------------------------------------------------------------------------------
// File: Channel.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Channel.hpp"
#include "Components/Route/MessageHandler.hpp"
#include "Interfaces/ClipboardAccess.hpp"
#include "Interfaces/PeerMessenger.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Clipboard::Channel::Channel(
    Device::Identifier const& local,
    IPeerMessenger& messenger,
    IClipboardAccess* const pAccess,
    Options const& options)
    : m_local(local)
    , m_messenger(messenger)
    , m_pAccess(pAccess)
    , m_options(options)
    , m_logger(Logger::Get(Logger::Name::Clipboard))
    , m_optCurrent()
    , m_exchanged()
{
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Clipboard::Channel::OnLocalChange(std::string const& text)
{
    if (!m_options.enabled || text.empty()) { return 0; }

    // The content applied from a peer is reported back by the local clipboard, it is the current entry and is dropped.
    if (m_optCurrent && m_optCurrent->text == text) { return 0; }

    m_optCurrent = Entry{ .text = text, .origin = m_local, .timestamp = TimeUtils::GetSystemTimestamp() };
    auto const sent = Broadcast(*m_optCurrent, {});
    m_logger->debug("Local clipboard change sent to {} peer(s).", sent);
    return sent;
}

//----------------------------------------------------------------------------------------------------------------------

bool Clipboard::Channel::Handle(Route::Context const& context, Message::ClipboardUpdate const& update)
{
    auto const& peer = context.GetPeer();
    if (!m_options.enabled) {
        m_logger->debug("Ignoring a clipboard update from {}, clipboard sync is disabled.", peer);
        return true;
    }

    m_exchanged.insert_or_assign(peer, update.text); // The peer holds this content, it is never sent back to them.

    if (m_optCurrent && m_optCurrent->text == update.text) {
        m_logger->debug("Suppressed a repeated clipboard update from {}.", peer);
        return true;
    }

    auto const& origin = update.originDeviceId.empty() ? peer : update.originDeviceId;
    m_optCurrent = Entry{ .text = update.text, .origin = origin, .timestamp = update.timestamp };
    m_logger->debug("Received a clipboard update from {}.", peer);
    m_logger->trace("Clipboard content: {}", update.text);

    if (m_pAccess && !m_pAccess->Apply(update.text, origin)) {
        m_logger->warn("Unable to apply the clipboard update from {}.", peer);
    }

    if (m_options.relay) {
        auto const relayed = Broadcast(*m_optCurrent, peer);
        if (relayed != 0) { m_logger->debug("Relayed the clipboard update to {} peer(s).", relayed); }
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Clipboard::Channel::OnPeerConnected(Device::Identifier const&)
{
}

//----------------------------------------------------------------------------------------------------------------------

void Clipboard::Channel::OnPeerDisconnected(Device::Identifier const& peer, Connection::Cause)
{
    m_exchanged.erase(peer); // The peer's clipboard may change while it is disconnected.
}

//----------------------------------------------------------------------------------------------------------------------

bool Clipboard::Channel::IsEnabled() const
{
    return m_options.enabled;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Clipboard::Entry> const& Clipboard::Channel::GetCurrent() const
{
    return m_optCurrent;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Clipboard::Channel::GetLastExchanged(Device::Identifier const& peer) const
{
    if (auto const itr = m_exchanged.find(peer); itr != m_exchanged.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Clipboard::Channel::Broadcast(Entry const& entry, Device::Identifier const& excluded)
{
    Message::ClipboardUpdate const update{
        .text = entry.text, .timestamp = entry.timestamp, .originDeviceId = entry.origin };

    std::size_t sent = 0;
    for (auto const& peer : m_messenger.GetInterestedPeers(Connection::Setting::ClipboardSync)) {
        if (peer == excluded || peer == entry.origin) { continue; }
        if (auto const itr = m_exchanged.find(peer); itr != m_exchanged.end() && itr->second == entry.text) {
            continue;
        }

        if (!m_messenger.Send(peer, update)) {
            m_logger->warn("Unable to send the clipboard update to {}.", peer);
            continue;
        }

        m_exchanged.insert_or_assign(peer, entry.text);
        ++sent;
    }
    return sent;
}

//----------------------------------------------------------------------------------------------------------------------
