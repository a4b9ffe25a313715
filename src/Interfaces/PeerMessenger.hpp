//----------------------------------------------------------------------------------------------------------------------
// File: PeerMessenger.hpp
// Description: The outbound surface of the connection manager. Channels and the transfer engine address peers by
// device identifier and never hold a reference to a connection.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Connection/State.hpp"
#include "Components/Device/Device.hpp"
#include "Components/Message/Chunk.hpp"
#include "Components/Message/Messages.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IPeerMessenger
{
public:
    virtual ~IPeerMessenger() = default;

    // Sends to the open connection of the peer. Returns false if the peer is not connected.
    [[nodiscard]] virtual bool Send(Device::Identifier const& peer, Message::Variant const& message) = 0;
    [[nodiscard]] virtual bool Send(Device::Identifier const& peer, Message::Chunk const& chunk) = 0;

    // Sends to a specific connection regardless of its state (e.g. a protocol error during the handshake).
    [[nodiscard]] virtual bool Reply(
        Connection::Key key, Message::Variant const& message, std::optional<std::string> const& correlation) = 0;

    [[nodiscard]] virtual bool IsOpen(Device::Identifier const& peer) const = 0;
    [[nodiscard]] virtual std::vector<Device::Identifier> GetOpenPeers() const = 0;
    [[nodiscard]] virtual std::vector<Device::Identifier> GetInterestedPeers(Connection::Setting setting) const = 0;
};

//----------------------------------------------------------------------------------------------------------------------
