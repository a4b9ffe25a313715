//----------------------------------------------------------------------------------------------------------------------
// File: Endpoint.hpp
// Description: The WebSocket endpoint of the hub. The endpoint listens on the configured binding for peers that open
// a connection and establishes the connections requested by the connection manager. Sessions are handed off once the
// WebSocket upgrade completes; the endpoint is unaware of the protocol carried by the session.
// Notes: All methods are expected to be called on the thread running the provided io_context.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "AsioUtils.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Network/Address.hpp"
#include "Interfaces/Transport.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <memory>
#include <optional>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Network::WebSocket {
//----------------------------------------------------------------------------------------------------------------------

class Endpoint;

class Session;
using SharedSession = std::shared_ptr<Session>;

//----------------------------------------------------------------------------------------------------------------------
} // Network::WebSocket namespace
//----------------------------------------------------------------------------------------------------------------------

class Network::WebSocket::Endpoint final : public ITransportConnector
{
public:
    using AcceptHandler = std::function<void(SharedTransport const&)>;

    Endpoint(boost::asio::io_context& context, Event::SharedPublisher const& spEventPublisher);
    ~Endpoint() override;

    Endpoint(Endpoint const&) = delete;
    Endpoint(Endpoint&&) = delete;
    Endpoint& operator=(Endpoint const&) = delete;
    Endpoint& operator=(Endpoint&&) = delete;

    void SetAcceptHandler(AcceptHandler const& handler);

    // Opens the listener. On failure a BindingFailed event is published and the endpoint remains closed.
    [[nodiscard]] bool Bind(BindingAddress const& binding);

    // The binding in use, with the port assigned by the system when an ephemeral port was requested.
    [[nodiscard]] std::optional<BindingAddress> const& GetBinding() const;
    [[nodiscard]] bool IsListening() const;
    [[nodiscard]] std::size_t GetSessionCount() const;

    void Shutdown();

    // ITransportConnector {
    [[nodiscard]] virtual bool ScheduleConnect(RemoteAddress const& address, ConnectCallback const& callback) override;
    // } ITransportConnector

private:
    using Sessions = std::vector<std::weak_ptr<Session>>;

    [[nodiscard]] SharedSession CreateSession();
    void Track(SharedSession const& spSession);

    [[nodiscard]] SocketProcessor Listener();
    [[nodiscard]] boost::asio::awaitable<void> Upgrade(SharedSession spSession);
    [[nodiscard]] boost::asio::awaitable<void> Establish(RemoteAddress address, ConnectCallback callback);

    [[nodiscard]] bool OnBindError(BindingAddress const& binding, boost::system::error_code const& error);

    boost::asio::io_context& m_context;
    Event::SharedPublisher const m_spEventPublisher;
    std::shared_ptr<spdlog::logger> m_logger;

    boost::asio::ip::tcp::acceptor m_acceptor;
    boost::asio::ip::tcp::resolver m_resolver;
    std::optional<BindingAddress> m_optBinding;
    AcceptHandler m_onAccepted;
    Sessions m_sessions;
    bool m_active;
    boost::system::error_code m_error;
};

//----------------------------------------------------------------------------------------------------------------------
