//----------------------------------------------------------------------------------------------------------------------
// File: MessageHandler.hpp
// Description: The interface of the handlers attached to the router and the context of the frame being handled.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Connection/State.hpp"
#include "Components/Device/Device.hpp"
#include "Components/Message/Messages.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

class IPeerMessenger;

namespace spdlog { class logger; }
namespace Hub { class ServiceProvider; }
namespace Message { struct Chunk; struct Frame; }

//----------------------------------------------------------------------------------------------------------------------
namespace Route {
//----------------------------------------------------------------------------------------------------------------------

class Context;
class IMessageHandler;

//----------------------------------------------------------------------------------------------------------------------
} // Route namespace
//----------------------------------------------------------------------------------------------------------------------

class Route::Context
{
public:
    Context(Device::Identifier const& peer, Connection::Key key, IPeerMessenger& messenger);

    [[nodiscard]] Device::Identifier const& GetPeer() const;
    [[nodiscard]] Connection::Key GetKey() const;

    // Sends a message back over the connection the frame was received from.
    [[nodiscard]] bool Reply(
        Message::Variant const& message, std::optional<std::string> const& correlation = {}) const;

private:
    Device::Identifier const& m_peer;
    Connection::Key m_key;
    IPeerMessenger& m_messenger;
};

//----------------------------------------------------------------------------------------------------------------------

class Route::IMessageHandler
{
public:
    IMessageHandler();
    virtual ~IMessageHandler() = default;

    [[nodiscard]] virtual bool OnFetchServices(std::shared_ptr<Hub::ServiceProvider> const& spServiceProvider) = 0;
    [[nodiscard]] virtual bool OnMessage(Context const& context, Message::Frame const& frame) = 0;

    // Only the handler registered for binary chunk frames is expected to override this method.
    [[nodiscard]] virtual bool OnChunk(Context const& context, Message::Chunk const& chunk);

protected:
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
