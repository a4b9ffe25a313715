//----------------------------------------------------------------------------------------------------------------------
// File: Router.hpp
// Description: Dispatches the frames received over an open connection to the handler registered for the frame's type.
// The router holds no per connection state, handlers are registered and initialized before the network is started.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "MessageHandler.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Route {
//----------------------------------------------------------------------------------------------------------------------

class Router;

// The route used for binary chunk frames, which do not carry a type discriminator.
constexpr std::string_view ChunkRoute = "file_chunk";

//----------------------------------------------------------------------------------------------------------------------
} // Route namespace
//----------------------------------------------------------------------------------------------------------------------

class Route::Router
{
public:
    Router();

    Router(Router const&) = delete;
    Router(Router&&) = delete;
    Router& operator=(Router const&) = delete;
    Router& operator=(Router&&) = delete;

    template<typename HandlerType, typename... Arguments>
        requires std::derived_from<HandlerType, IMessageHandler>
    [[nodiscard]] bool Register(std::string_view type, Arguments&&... arguments)
    {
        if (type.empty()) { return false; }
        auto upHandler = std::make_unique<HandlerType>(std::forward<Arguments>(arguments)...);
        auto const [itr, emplaced] = m_handlers.insert_or_assign(std::string{ type }, std::move(upHandler));
        if (!emplaced) { m_logger->warn("The message handler for \"{}\" was replaced.", type); }
        return true;
    }

    [[nodiscard]] bool Initialize(std::shared_ptr<Hub::ServiceProvider> const& spServiceProvider);

    [[nodiscard]] bool Contains(std::string_view type) const;
    [[nodiscard]] std::size_t Size() const;

    bool Route(Context const& context, std::string_view frame) const;
    bool Route(Context const& context, std::span<std::uint8_t const> frame) const;

private:
    using Handlers = std::unordered_map<std::string, std::unique_ptr<IMessageHandler>>;

    [[nodiscard]] IMessageHandler* Match(std::string_view type) const;

    std::shared_ptr<spdlog::logger> m_logger;
    Handlers m_handlers;
};

//----------------------------------------------------------------------------------------------------------------------
