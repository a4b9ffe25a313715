//----------------------------------------------------------------------------------------------------------------------
// File: Session.hpp
// Description: A WebSocket session carrying the text and binary frames of one connection. Frames are received and
// dispatched by two coroutines running on the network context; the session keeps itself alive while they run.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "AsioUtils.hpp"
#include "Components/Network/Address.hpp"
#include "Interfaces/Transport.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Network::WebSocket {
//----------------------------------------------------------------------------------------------------------------------

class Session;
using SharedSession = std::shared_ptr<Session>;

// The request target used by the hub's WebSocket handshake.
constexpr std::string_view Target = "/";

//----------------------------------------------------------------------------------------------------------------------
} // Network::WebSocket namespace
//----------------------------------------------------------------------------------------------------------------------

class Network::WebSocket::Session : public ITransport, public std::enable_shared_from_this<Session>
{
public:
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    Session(boost::asio::io_context& context, std::shared_ptr<spdlog::logger> const& spLogger);
    ~Session();

    Session(Session const&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session const&) = delete;
    Session& operator=(Session&&) = delete;

    [[nodiscard]] boost::asio::ip::tcp::socket& GetSocket();
    [[nodiscard]] std::optional<StopCause> GetStopCause() const;

    // Completes the WebSocket upgrade of a socket accepted by a listener.
    [[nodiscard]] boost::asio::awaitable<bool> Accept();

    // Connects to a resolved remote endpoint and requests the WebSocket upgrade.
    [[nodiscard]] boost::asio::awaitable<bool> Connect(
        boost::asio::ip::tcp::resolver::results_type resolved, RemoteAddress address);

    void Start();
    void Stop();

    // ITransport {
    virtual void Attach(TextCallback const& onText, BinaryCallback const& onBinary, StopCallback const& onStop) override;
    [[nodiscard]] virtual bool SendText(std::string&& frame) override;
    [[nodiscard]] virtual bool SendBinary(std::vector<std::uint8_t>&& frame) override;
    virtual void Close() override;
    [[nodiscard]] virtual bool IsActive() const override;
    [[nodiscard]] virtual RemoteAddress const& GetAddress() const override;
    // } ITransport

private:
    using Frame = std::variant<std::string, std::vector<std::uint8_t>>;
    using Switchboard = std::deque<Frame>;

    [[nodiscard]] SocketProcessor Receiver();
    [[nodiscard]] SocketProcessor Dispatcher();

    [[nodiscard]] bool ScheduleSend(Frame&& frame);
    void Signal();

    void Configure(boost::beast::role_type role);
    [[nodiscard]] CompletionOrigin OnSocketError(boost::system::error_code const& error);
    void OnStopped(spdlog::level::level_enum level, std::string_view reason, StopCause cause);
    void NotifyStopped(StopCause cause);

    std::shared_ptr<spdlog::logger> m_logger;
    std::atomic_bool m_active;
    bool m_closing;
    Stream m_stream;
    RemoteAddress m_address;

    boost::beast::flat_buffer m_buffer;
    Switchboard m_switchboard;
    boost::asio::steady_timer m_signal;
    boost::system::error_code m_receiveError;
    boost::system::error_code m_dispatchError;

    TextCallback m_onText;
    BinaryCallback m_onBinary;
    StopCallback m_onStopped;
    std::optional<StopCause> m_optStopCause;
};

//----------------------------------------------------------------------------------------------------------------------
