//----------------------------------------------------------------------------------------------------------------------
// File: PeerObserver.hpp
// Description: Receives the open and close transitions of the peer connections. Observers are invoked on the network
// thread by the connection manager.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Connection/State.hpp"
#include "Components/Device/Device.hpp"
//----------------------------------------------------------------------------------------------------------------------

class IPeerObserver
{
public:
    virtual ~IPeerObserver() = default;

    virtual void OnPeerConnected(Device::Identifier const& peer) = 0;
    virtual void OnPeerDisconnected(Device::Identifier const& peer, Connection::Cause cause) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
