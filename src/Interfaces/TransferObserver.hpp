//----------------------------------------------------------------------------------------------------------------------
// File: TransferObserver.hpp
// Description: Receives the progress and the outcome of the transfers managed by the transfer engine. Observers are
// invoked on the network thread.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Device/Device.hpp"
#include "Components/Transfer/Status.hpp"
//----------------------------------------------------------------------------------------------------------------------

class ITransferObserver
{
public:
    virtual ~ITransferObserver() = default;

    virtual void OnTransferProgress(
        Device::Identifier const& peer, Transfer::Summary const& summary, Transfer::Progress const& progress) = 0;
    virtual void OnTransferFinished(Device::Identifier const& peer, Transfer::Summary const& summary) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
