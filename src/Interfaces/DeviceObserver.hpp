//----------------------------------------------------------------------------------------------------------------------
// File: DeviceObserver.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Device/Device.hpp"
//----------------------------------------------------------------------------------------------------------------------

class IDeviceObserver
{
public:
    virtual ~IDeviceObserver() = default;

    // Called after a device's trust state has changed. The details reflect the state after the transition.
    virtual void OnTrustStateChanged(Device::Details const& details) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
