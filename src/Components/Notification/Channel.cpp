//----------------------------------------------------------------------------------------------------------------------
// File: Channel.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Channel.hpp"
#include "Components/Route/MessageHandler.hpp"
#include "Interfaces/NotificationSink.hpp"
#include "Interfaces/PeerMessenger.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Notification::Channel::Channel(
    Device::Identifier const& local,
    IPeerMessenger& messenger,
    INotificationSink* const pSink,
    Options const& options)
    : m_local(local)
    , m_messenger(messenger)
    , m_pSink(pSink)
    , m_options(options)
    , m_logger(Logger::Get(Logger::Name::Notification))
    , m_mirrored()
{
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Notification::Channel::OnLocalPosted(Message::Notification notification)
{
    if (!m_options.enabled || notification.id.empty()) { return 0; }
    notification.originDeviceId = m_local;
    return Forward(notification, m_local);
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Notification::Channel::OnLocalRemoved(std::string const& id)
{
    if (!m_options.enabled || id.empty()) { return 0; }
    return Forward(Message::NotificationRemoved{ .id = id }, m_local);
}

//----------------------------------------------------------------------------------------------------------------------

bool Notification::Channel::Dismiss(Device::Identifier const& origin, std::string const& id)
{
    if (m_mirrored.erase({ origin, id }) == 0) { return false; }
    if (m_pSink) { m_pSink->Dismiss(origin, id); }

    if (!m_messenger.Send(origin, Message::NotificationRemoved{ .id = id })) {
        m_logger->debug("Unable to send the dismissal of {} to {}.", id, origin);
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Notification::Channel::Handle(Route::Context const& context, Message::Notification const& notification)
{
    auto const& peer = context.GetPeer();
    if (!m_options.enabled) {
        m_logger->debug("Ignoring a notification from {}, notification mirroring is disabled.", peer);
        return true;
    }

    auto mirrored = notification;
    if (!mirrored.originDeviceId || mirrored.originDeviceId->empty()) { mirrored.originDeviceId = peer; }
    auto const& origin = *mirrored.originDeviceId;

    auto const [itr, emplaced] = m_mirrored.insert_or_assign({ origin, mirrored.id }, mirrored);
    m_logger->debug("{} notification {} from {}.", emplaced ? "Mirroring" : "Updating", mirrored.id, peer);
    m_logger->trace("[{}] {}: {}", mirrored.appName, mirrored.title, mirrored.content);

    if (m_pSink) { m_pSink->Present(origin, itr->second); }
    if (m_options.relay) { Forward(mirrored, peer); }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Notification::Channel::Handle(Route::Context const& context, Message::NotificationRemoved const& removed)
{
    auto const& peer = context.GetPeer();
    if (!m_options.enabled) { return true; }

    // A removal from the peer either withdraws one of its own notifications or acknowledges the dismissal of one the
    // hub forwarded to it.
    if (m_mirrored.erase({ peer, removed.id }) != 0) {
        m_logger->debug("Removed notification {} mirrored from {}.", removed.id, peer);
        if (m_pSink) { m_pSink->Dismiss(peer, removed.id); }
        if (m_options.relay) { Forward(removed, peer); }
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Notification::Channel::OnPeerConnected(Device::Identifier const&)
{
}

//----------------------------------------------------------------------------------------------------------------------

void Notification::Channel::OnPeerDisconnected(Device::Identifier const& peer, Connection::Cause cause)
{
    // Mirrored notifications are kept across reconnects, the peer will update or remove them by their identifier. An
    // unpaired peer will never send the removals, so its notifications are withdrawn.
    if (cause != Connection::Cause::Unpaired) { return; }
    for (auto itr = m_mirrored.begin(); itr != m_mirrored.end(); ) {
        if (itr->first.first != peer) { ++itr; continue; }
        if (m_pSink) { m_pSink->Dismiss(peer, itr->first.second); }
        itr = m_mirrored.erase(itr);
    }
}

//----------------------------------------------------------------------------------------------------------------------

bool Notification::Channel::IsEnabled() const
{
    return m_options.enabled;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Notification::Channel::GetMirroredCount() const
{
    return m_mirrored.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::Notification> Notification::Channel::FindMirrored(
    Device::Identifier const& origin, std::string const& id) const
{
    if (auto const itr = m_mirrored.find({ origin, id }); itr != m_mirrored.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Notification::Channel::Forward(Message::Variant const& message, Device::Identifier const& origin)
{
    std::size_t forwarded = 0;
    for (auto const& peer : m_messenger.GetInterestedPeers(Connection::Setting::NotificationMirroring)) {
        if (peer == origin) { continue; }
        if (!m_messenger.Send(peer, message)) {
            m_logger->warn("Unable to forward the notification event to {}.", peer);
            continue;
        }
        ++forwarded;
    }
    return forwarded;
}

//----------------------------------------------------------------------------------------------------------------------
