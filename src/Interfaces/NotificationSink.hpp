//----------------------------------------------------------------------------------------------------------------------
// File: NotificationSink.hpp
// Description: The boundary to the platform notification presenter used to display the notifications mirrored from
// the peers.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Device/Device.hpp"
#include "Components/Message/Messages.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string>
//----------------------------------------------------------------------------------------------------------------------

class INotificationSink
{
public:
    virtual ~INotificationSink() = default;

    // A notification posted again with the same identifier replaces the presented copy.
    virtual void Present(Device::Identifier const& origin, Message::Notification const& notification) = 0;
    virtual void Dismiss(Device::Identifier const& origin, std::string const& id) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
