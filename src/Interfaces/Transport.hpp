//----------------------------------------------------------------------------------------------------------------------
// File: Transport.hpp
// Description: The duplex, frame oriented transport that carries a connection (e.g. a WebSocket session). The
// connection manager only depends on this boundary; the protocol is unaware of the carrying transport.
// Notes: Transports are expected to invoke their callbacks on the network thread. The stop callback is invoked once.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Network/Address.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class ITransport
{
public:
    enum class StopCause : std::uint32_t { Requested, Closed, UnexpectedError };

    using TextCallback = std::function<void(std::string_view)>;
    using BinaryCallback = std::function<void(std::span<std::uint8_t const>)>;
    using StopCallback = std::function<void(StopCause)>;

    virtual ~ITransport() = default;

    virtual void Attach(TextCallback const& onText, BinaryCallback const& onBinary, StopCallback const& onStop) = 0;

    [[nodiscard]] virtual bool SendText(std::string&& frame) = 0;
    [[nodiscard]] virtual bool SendBinary(std::vector<std::uint8_t>&& frame) = 0;

    // Requests a graceful closure. Frames scheduled before the request are flushed first.
    virtual void Close() = 0;

    [[nodiscard]] virtual bool IsActive() const = 0;
    [[nodiscard]] virtual Network::RemoteAddress const& GetAddress() const = 0;
};

using SharedTransport = std::shared_ptr<ITransport>;

//----------------------------------------------------------------------------------------------------------------------

class ITransportConnector
{
public:
    // Invoked with the opened transport, or with nullptr when the address could not be reached.
    using ConnectCallback = std::function<void(SharedTransport const&)>;

    virtual ~ITransportConnector() = default;

    [[nodiscard]] virtual bool ScheduleConnect(
        Network::RemoteAddress const& address, ConnectCallback const& callback) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
