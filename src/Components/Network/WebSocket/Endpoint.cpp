//----------------------------------------------------------------------------------------------------------------------
// File: Endpoint.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Endpoint.hpp"
#include "Session.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <coroutine>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using BindingFailure = Event::Message<Event::Type::BindingFailed>::Cause;

// Addresses store IPv6 hosts wrapped in brackets, the socket layer expects the bare address.
[[nodiscard]] std::string GetSocketHost(Network::Address const& address);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Network::WebSocket::Endpoint::Endpoint(
    boost::asio::io_context& context, Event::SharedPublisher const& spEventPublisher)
    : m_context(context)
    , m_spEventPublisher(spEventPublisher)
    , m_logger(Logger::Get(Logger::Name::WebSocket))
    , m_acceptor(context)
    , m_resolver(context)
    , m_optBinding()
    , m_onAccepted()
    , m_sessions()
    , m_active(true)
    , m_error()
{
    assert(m_spEventPublisher);
    m_spEventPublisher->Advertise(Event::Type::BindingFailed);
}

//----------------------------------------------------------------------------------------------------------------------

Network::WebSocket::Endpoint::~Endpoint()
{
    Shutdown();
}

//----------------------------------------------------------------------------------------------------------------------

void Network::WebSocket::Endpoint::SetAcceptHandler(AcceptHandler const& handler)
{
    m_onAccepted = handler;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::WebSocket::Endpoint::Bind(BindingAddress const& binding)
{
    assert(binding.IsValid());
    m_logger->info("Opening endpoint on {}.", binding);

    // If the acceptor has already been opened, the prior listener will observe the cancellation and exit.
    if (m_acceptor.is_open()) {
        boost::system::error_code ignored;
        m_acceptor.close(ignored);
        m_optBinding.reset();
    }

    boost::system::error_code error;
    auto const address = boost::asio::ip::make_address(local::GetSocketHost(binding), error);
    if (error) [[unlikely]] { return OnBindError(binding, error); }

    boost::asio::ip::tcp::endpoint const endpoint(address, binding.GetPort());

    m_acceptor.open(endpoint.protocol(), error);
    if (error) [[unlikely]] { return OnBindError(binding, error); }

    m_acceptor.set_option(boost::asio::ip::tcp::acceptor::keep_alive(true), error);
    if (error) [[unlikely]] { return OnBindError(binding, error); }

    m_acceptor.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), error);
    if (error) [[unlikely]] { return OnBindError(binding, error); }

    m_acceptor.bind(endpoint, error);
    if (error) [[unlikely]] { return OnBindError(binding, error); }

    m_acceptor.listen(boost::asio::ip::tcp::acceptor::max_listen_connections, error);
    if (error) [[unlikely]] { return OnBindError(binding, error); }

    // Capture the port assigned by the system in case an ephemeral port was requested.
    auto const bound = m_acceptor.local_endpoint(error);
    if (error) [[unlikely]] { return OnBindError(binding, error); }
    m_optBinding = BindingAddress{ binding.GetHost(), bound.port() };
    m_active = true;

    boost::asio::co_spawn(m_context, Listener(),
        [this, binding = *m_optBinding] (std::exception_ptr exception, CompletionOrigin origin)
        {
            constexpr std::string_view ErrorMessage = "An unexpected error caused the listener on {} to shutdown!";
            if (bool const error = (exception || origin == CompletionOrigin::Error); error) {
                m_logger->error(ErrorMessage, binding);
            }
        });

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Network::BindingAddress> const& Network::WebSocket::Endpoint::GetBinding() const
{
    return m_optBinding;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::WebSocket::Endpoint::IsListening() const
{
    return m_acceptor.is_open();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Network::WebSocket::Endpoint::GetSessionCount() const
{
    return static_cast<std::size_t>(std::ranges::count_if(m_sessions, [] (auto const& wpSession) {
        auto const spSession = wpSession.lock();
        return spSession && spSession->IsActive();
    }));
}

//----------------------------------------------------------------------------------------------------------------------

void Network::WebSocket::Endpoint::Shutdown()
{
    if (!m_active && !m_acceptor.is_open() && m_sessions.empty()) { return; }
    m_logger->debug("Shutting down endpoint.");
    m_active = false;

    boost::system::error_code ignored;
    m_acceptor.close(ignored);
    m_resolver.cancel();

    // Stop any sessions that are still alive. Each session's coroutines will observe the cancellation.
    for (auto const& wpSession : m_sessions) {
        if (auto const spSession = wpSession.lock(); spSession) { spSession->Stop(); }
    }
    m_sessions.clear();
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::WebSocket::Endpoint::ScheduleConnect(RemoteAddress const& address, ConnectCallback const& callback)
{
    assert(callback);
    if (!m_active || !address.IsValid()) { return false; }
    m_logger->info("Attempting a connection with {}.", address);
    boost::asio::co_spawn(m_context, Establish(address, callback), boost::asio::detached);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

Network::WebSocket::SharedSession Network::WebSocket::Endpoint::CreateSession()
{
    return std::make_shared<Session>(m_context, m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

void Network::WebSocket::Endpoint::Track(SharedSession const& spSession)
{
    std::erase_if(m_sessions, [] (auto const& wpSession) { return wpSession.expired(); });
    m_sessions.emplace_back(spSession);
}

//----------------------------------------------------------------------------------------------------------------------

Network::WebSocket::SocketProcessor Network::WebSocket::Endpoint::Listener()
{
    constexpr std::string_view AcceptError = "An unexpected error occured while accepting a connection on {}!";

    while (m_active && m_acceptor.is_open()) {
        // Create a new session that can be used for the peer that connects.
        auto const spSession = CreateSession();

        // Start the acceptor coroutine, if successful the session's socket will be open on return.
        co_await m_acceptor.async_accept(
            spSession->GetSocket(), boost::asio::redirect_error(boost::asio::use_awaitable, m_error));
        if (m_error) {
            // If the error is caused by an intentional operation (i.e. shutdown), then it is not unexpected.
            if (IsInducedError(m_error)) { co_return CompletionOrigin::Self; }
            m_logger->error(AcceptError, m_optBinding ? m_optBinding->GetUri() : std::string{});
            co_return CompletionOrigin::Error;
        }

        // The upgrade may take a while; the listener resumes accepting while the peer completes the handshake.
        Track(spSession);
        boost::asio::co_spawn(m_context, Upgrade(spSession), boost::asio::detached);
    }

    co_return CompletionOrigin::Self;
}

//----------------------------------------------------------------------------------------------------------------------

boost::asio::awaitable<void> Network::WebSocket::Endpoint::Upgrade(SharedSession spSession)
{
    if (bool const accepted = co_await spSession->Accept(); !accepted || !m_active) {
        spSession->Stop();
        co_return;
    }

    m_logger->debug("Accepted a connection from {}.", spSession->GetAddress());

    // The session's processors are spawned before the handoff, they will not run until the handler returns.
    spSession->Start();
    if (m_onAccepted) { m_onAccepted(spSession); } else { spSession->Close(); }
}

//----------------------------------------------------------------------------------------------------------------------

boost::asio::awaitable<void> Network::WebSocket::Endpoint::Establish(RemoteAddress address, ConnectCallback callback)
{
    boost::system::error_code error;
    auto const resolved = co_await m_resolver.async_resolve(
        local::GetSocketHost(address), std::to_string(address.GetPort()),
        boost::asio::redirect_error(boost::asio::use_awaitable, error));
    if (error || resolved.empty()) {
        if (!IsInducedError(error)) { m_logger->warn("Unable to resolve an endpoint for {}.", address); }
        callback(nullptr);
        co_return;
    }

    auto const spSession = CreateSession();
    Track(spSession);

    if (bool const connected = co_await spSession->Connect(resolved, address); !connected || !m_active) {
        spSession->Stop();
        callback(nullptr);
        co_return;
    }

    m_logger->debug("Established a connection with {}.", address);
    spSession->Start();
    callback(spSession);
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::WebSocket::Endpoint::OnBindError(BindingAddress const& binding, boost::system::error_code const& error)
{
    boost::system::error_code ignored;
    m_acceptor.close(ignored);
    m_optBinding.reset();

    auto cause = local::BindingFailure::UnexpectedError;
    if (error == boost::asio::error::address_in_use) {
        cause = local::BindingFailure::AddressInUse;
    } else if (error == boost::asio::error::access_denied) {
        cause = local::BindingFailure::Permissions;
    }

    m_logger->error("A listener on {} could not be established: {}", binding, error.message());
    m_spEventPublisher->Publish<Event::Type::BindingFailed>(binding.GetUri(), cause);
    return false;
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::GetSocketHost(Network::Address const& address)
{
    auto const& host = address.GetHost();
    if (address.GetType() == Network::AddressType::IPv6 && host.size() > 2) {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

//----------------------------------------------------------------------------------------------------------------------
