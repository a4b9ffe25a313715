//----------------------------------------------------------------------------------------------------------------------
// File: ClipboardAccess.hpp
// Description: The boundary to the platform clipboard. Local content changes are reported to the clipboard channel by
// the platform layer, the channel only ever writes through this interface.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Device/Device.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string>
//----------------------------------------------------------------------------------------------------------------------

class IClipboardAccess
{
public:
    virtual ~IClipboardAccess() = default;

    [[nodiscard]] virtual bool Apply(std::string const& text, Device::Identifier const& origin) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
