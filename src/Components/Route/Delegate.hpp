//----------------------------------------------------------------------------------------------------------------------
// File: Delegate.hpp
// Description: A message handler that decodes a specific message type and forwards it to the service that owns the
// message's channel. The service is fetched from the service provider when the router is initialized and is required
// to provide a Handle(Route::Context const&, MessageType const&) method.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "MessageHandler.hpp"
#include "Components/Core/ServiceProvider.hpp"
#include "Components/Message/Chunk.hpp"
#include "Components/Message/Codec.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Route {
//----------------------------------------------------------------------------------------------------------------------

template<typename ServiceType, typename MessageType>
concept MessageService = requires(ServiceType& service, Context const& context, MessageType const& message) {
    { service.Handle(context, message) } -> std::same_as<bool>;
};

template<Message::ProtocolMessage MessageType, MessageService<MessageType> ServiceType>
class Delegate;

template<MessageService<Message::Chunk> ServiceType>
class ChunkDelegate;

//----------------------------------------------------------------------------------------------------------------------
} // Route namespace
//----------------------------------------------------------------------------------------------------------------------

template<Message::ProtocolMessage MessageType, Route::MessageService<MessageType> ServiceType>
class Route::Delegate : public Route::IMessageHandler
{
public:
    Delegate() = default;

    // IMessageHandler {
    [[nodiscard]] virtual bool OnFetchServices(std::shared_ptr<Hub::ServiceProvider> const& spServiceProvider) override
    {
        m_wpService = spServiceProvider->Fetch<ServiceType>();
        return !m_wpService.expired();
    }

    [[nodiscard]] virtual bool OnMessage(Context const& context, Message::Frame const& frame) override
    {
        // Decoding may raise a malformed payload error, the router is responsible for reporting it to the sender.
        auto const message = Message::Decode<MessageType>(frame.payload);
        if (auto const spService = m_wpService.lock(); spService) { return spService->Handle(context, message); }
        return false;
    }
    // } IMessageHandler

private:
    std::weak_ptr<ServiceType> m_wpService;
};

//----------------------------------------------------------------------------------------------------------------------

template<Route::MessageService<Message::Chunk> ServiceType>
class Route::ChunkDelegate : public Route::IMessageHandler
{
public:
    ChunkDelegate() = default;

    // IMessageHandler {
    [[nodiscard]] virtual bool OnFetchServices(std::shared_ptr<Hub::ServiceProvider> const& spServiceProvider) override
    {
        m_wpService = spServiceProvider->Fetch<ServiceType>();
        return !m_wpService.expired();
    }

    [[nodiscard]] virtual bool OnMessage(Context const&, Message::Frame const&) override { return false; }

    [[nodiscard]] virtual bool OnChunk(Context const& context, Message::Chunk const& chunk) override
    {
        if (auto const spService = m_wpService.lock(); spService) { return spService->Handle(context, chunk); }
        return false;
    }
    // } IMessageHandler

private:
    std::weak_ptr<ServiceType> m_wpService;
};

//----------------------------------------------------------------------------------------------------------------------
