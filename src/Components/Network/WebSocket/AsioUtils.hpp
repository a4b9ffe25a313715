//----------------------------------------------------------------------------------------------------------------------
// File: AsioUtils.hpp
// Description: Helpers shared by the coroutines of the WebSocket sessions and endpoint.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/system/error_code.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Network::WebSocket {
//----------------------------------------------------------------------------------------------------------------------

enum class CompletionOrigin : std::uint8_t { Self, Peer, Error };
using SocketProcessor = boost::asio::awaitable<CompletionOrigin>;

// Errors caused by an intentional cancellation or shutdown of the local socket.
[[nodiscard]] bool IsInducedError(boost::system::error_code const& error);

// Errors caused by the peer closing or abandoning the connection.
[[nodiscard]] bool IsClosureError(boost::system::error_code const& error);

//----------------------------------------------------------------------------------------------------------------------
} // Network::WebSocket namespace
//----------------------------------------------------------------------------------------------------------------------

inline bool Network::WebSocket::IsInducedError(boost::system::error_code const& error)
{
    switch (error.value()) {
        case boost::asio::error::operation_aborted:
        case boost::asio::error::shut_down: {
            return true;
        }
        default: return false;
    }
}

//----------------------------------------------------------------------------------------------------------------------

inline bool Network::WebSocket::IsClosureError(boost::system::error_code const& error)
{
    if (error == boost::beast::websocket::error::closed) { return true; }
    if (error == boost::beast::error::timeout) { return true; }
    if (error == boost::asio::error::eof) { return true; }
    switch (error.value()) {
        case boost::asio::error::connection_reset:
        case boost::asio::error::connection_aborted:
        case boost::asio::error::broken_pipe: {
            return error.category() == boost::asio::error::get_system_category();
        }
        default: return false;
    }
}

//----------------------------------------------------------------------------------------------------------------------
