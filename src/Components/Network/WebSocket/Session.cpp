//----------------------------------------------------------------------------------------------------------------------
// File: Session.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Session.hpp"
#include "Components/Message/Codec.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <chrono>
#include <coroutine>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::chrono::seconds ConnectTimeout = std::chrono::seconds{ 5 };

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Network::WebSocket::Session::Session(boost::asio::io_context& context, std::shared_ptr<spdlog::logger> const& spLogger)
    : m_logger(spLogger)
    , m_active(false)
    , m_closing(false)
    , m_stream(context)
    , m_address()
    , m_buffer()
    , m_switchboard()
    , m_signal(context)
    , m_receiveError()
    , m_dispatchError()
    , m_onText()
    , m_onBinary()
    , m_onStopped()
    , m_optStopCause()
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Network::WebSocket::Session::~Session()
{
    Stop(); // Ensure the socket resources are cleaned up on destruction.
}

//----------------------------------------------------------------------------------------------------------------------

boost::asio::ip::tcp::socket& Network::WebSocket::Session::GetSocket()
{
    return boost::beast::get_lowest_layer(m_stream).socket();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<ITransport::StopCause> Network::WebSocket::Session::GetStopCause() const
{
    return m_optStopCause;
}

//----------------------------------------------------------------------------------------------------------------------

boost::asio::awaitable<bool> Network::WebSocket::Session::Accept()
{
    boost::system::error_code error;
    auto const endpoint = GetSocket().remote_endpoint(error);
    if (error) { co_return false; }
    m_address = RemoteAddress{ endpoint.address().to_string(), endpoint.port(), RemoteAddress::Origin::Network };

    Configure(boost::beast::role_type::server);
    co_await m_stream.async_accept(boost::asio::redirect_error(boost::asio::use_awaitable, error));
    if (error) {
        if (!IsInducedError(error)) { m_logger->warn("The upgrade requested by {} failed: {}", m_address, error.message()); }
        co_return false;
    }

    co_return true;
}

//----------------------------------------------------------------------------------------------------------------------

boost::asio::awaitable<bool> Network::WebSocket::Session::Connect(
    boost::asio::ip::tcp::resolver::results_type resolved, RemoteAddress address)
{
    m_address = std::move(address);

    boost::system::error_code error;
    auto& layer = boost::beast::get_lowest_layer(m_stream);
    layer.expires_after(local::ConnectTimeout);
    co_await layer.async_connect(resolved, boost::asio::redirect_error(boost::asio::use_awaitable, error));
    if (error) {
        if (!IsInducedError(error)) { m_logger->debug("Unable to connect to {}: {}", m_address, error.message()); }
        co_return false;
    }

    Configure(boost::beast::role_type::client);
    co_await m_stream.async_handshake(
        m_address.GetAuthority(), std::string{ Target },
        boost::asio::redirect_error(boost::asio::use_awaitable, error));
    if (error) {
        if (!IsInducedError(error)) { m_logger->warn("{} refused the upgrade: {}", m_address, error.message()); }
        co_return false;
    }

    co_return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Network::WebSocket::Session::Start()
{
    m_active = true;

    // Spawn the receiver coroutine.
    boost::asio::co_spawn(
        m_stream.get_executor(),
        Receiver(),
        [self(shared_from_this()), logger(m_logger)] (std::exception_ptr exception, CompletionOrigin origin)
        {
            if (bool const error = (exception || origin == CompletionOrigin::Error); error) {
                logger->error("An unexpected error caused the receiver for {} to shutdown!", self->GetAddress());
            }
        });

    // Spawn the dispatcher coroutine.
    boost::asio::co_spawn(
        m_stream.get_executor(),
        Dispatcher(),
        [self(shared_from_this()), logger(m_logger)] (std::exception_ptr exception, CompletionOrigin origin)
        {
            if (bool const error = (exception || origin == CompletionOrigin::Error); error) {
                logger->error("An unexpected error caused the dispatcher for {} to shutdown!", self->GetAddress());
            }
        });

    m_logger->debug("Session started with {}.", m_address);
}

//----------------------------------------------------------------------------------------------------------------------

void Network::WebSocket::Session::Stop()
{
    if (m_active.exchange(false)) { m_logger->debug("Shutting down session with {}.", m_address); }
    boost::system::error_code error;
    GetSocket().close(error);
    m_signal.cancel();
}

//----------------------------------------------------------------------------------------------------------------------

void Network::WebSocket::Session::Attach(
    TextCallback const& onText, BinaryCallback const& onBinary, StopCallback const& onStop)
{
    m_onText = onText;
    m_onBinary = onBinary;
    m_onStopped = onStop;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::WebSocket::Session::SendText(std::string&& frame)
{
    return ScheduleSend(std::move(frame));
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::WebSocket::Session::SendBinary(std::vector<std::uint8_t>&& frame)
{
    return ScheduleSend(std::move(frame));
}

//----------------------------------------------------------------------------------------------------------------------

void Network::WebSocket::Session::Close()
{
    if (!m_active || m_closing) { return; }
    m_closing = true;
    Signal(); // Wake the dispatcher, the closing handshake follows the frames already scheduled.
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::WebSocket::Session::IsActive() const
{
    return m_active && !m_closing;
}

//----------------------------------------------------------------------------------------------------------------------

Network::RemoteAddress const& Network::WebSocket::Session::GetAddress() const
{
    return m_address;
}

//----------------------------------------------------------------------------------------------------------------------

Network::WebSocket::SocketProcessor Network::WebSocket::Session::Receiver()
{
    while (m_active) {
        co_await m_stream.async_read(m_buffer, boost::asio::redirect_error(boost::asio::use_awaitable, m_receiveError));
        if (m_receiveError) { co_return OnSocketError(m_receiveError); }

        auto const data = m_buffer.cdata();
        m_logger->trace("Received {} bytes from {}.", data.size(), m_address);

        if (m_stream.got_text()) {
            std::string_view const frame{ static_cast<char const*>(data.data()), data.size() };
            if (m_onText) { m_onText(frame); }
        } else {
            std::span<std::uint8_t const> const frame{ static_cast<std::uint8_t const*>(data.data()), data.size() };
            if (m_onBinary) { m_onBinary(frame); }
        }

        m_buffer.consume(m_buffer.size());
    }

    co_return CompletionOrigin::Self;
}

//----------------------------------------------------------------------------------------------------------------------

Network::WebSocket::SocketProcessor Network::WebSocket::Session::Dispatcher()
{
    while (m_active) {
        if (m_switchboard.empty()) {
            if (m_closing) {
                co_await m_stream.async_close(
                    boost::beast::websocket::close_code::normal,
                    boost::asio::redirect_error(boost::asio::use_awaitable, m_dispatchError));
                if (m_dispatchError) { co_return OnSocketError(m_dispatchError); }
                co_return CompletionOrigin::Self; // The receiver observes the completion of the closing handshake.
            }

            // The signal is canceled to wake the dispatcher, the cause of waking is determined by the next iteration.
            m_signal.expires_at(boost::asio::steady_timer::time_point::max());
            co_await m_signal.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, m_dispatchError));
            continue;
        }

        // References to the front of the switchboard remain valid while frames are appended.
        auto const& frame = m_switchboard.front();
        std::size_t sent = 0;
        if (auto const pText = std::get_if<std::string>(&frame); pText) {
            m_stream.text(true);
            sent = co_await m_stream.async_write(
                boost::asio::buffer(*pText), boost::asio::redirect_error(boost::asio::use_awaitable, m_dispatchError));
        } else {
            auto const& binary = std::get<std::vector<std::uint8_t>>(frame);
            m_stream.binary(true);
            sent = co_await m_stream.async_write(
                boost::asio::buffer(binary), boost::asio::redirect_error(boost::asio::use_awaitable, m_dispatchError));
        }

        if (m_dispatchError) { co_return OnSocketError(m_dispatchError); }
        m_switchboard.pop_front();
        m_logger->trace("Dispatched {} bytes to {}.", sent, m_address);
    }

    co_return CompletionOrigin::Self;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::WebSocket::Session::ScheduleSend(Frame&& frame)
{
    if (!IsActive()) { return false; }
    m_switchboard.emplace_back(std::move(frame)); // Store the frame for the dispatcher coroutine.
    Signal(); // Wake the dispatcher if it is waiting for data.
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Network::WebSocket::Session::Signal()
{
    m_signal.cancel();
}

//----------------------------------------------------------------------------------------------------------------------

void Network::WebSocket::Session::Configure(boost::beast::role_type role)
{
    // The WebSocket stream manages its own timeouts once the transport has been established.
    boost::beast::get_lowest_layer(m_stream).expires_never();
    m_stream.set_option(boost::beast::websocket::stream_base::timeout::suggested(role));
    m_stream.read_message_max(Message::MaximumFrameSize);
    m_stream.auto_fragment(false);
}

//----------------------------------------------------------------------------------------------------------------------

Network::WebSocket::CompletionOrigin Network::WebSocket::Session::OnSocketError(boost::system::error_code const& error)
{
    // Determine if the error is expected from an intentional session shutdown.
    if (IsInducedError(error)) {
        NotifyStopped(StopCause::Requested);
        return CompletionOrigin::Self;
    }

    if (IsClosureError(error)) {
        auto const cause = m_closing ? StopCause::Requested : StopCause::Closed;
        OnStopped(spdlog::level::debug, "Session closed", cause);
        return CompletionOrigin::Peer;
    }

    OnStopped(spdlog::level::warn, error.message(), StopCause::UnexpectedError);
    return CompletionOrigin::Error;
}

//----------------------------------------------------------------------------------------------------------------------

void Network::WebSocket::Session::OnStopped(spdlog::level::level_enum level, std::string_view reason, StopCause cause)
{
    assert(!reason.empty());
    m_logger->log(level, "{} on {}.", reason, m_address);
    NotifyStopped(cause);
    Stop(); // Stop the session processors. If the socket has already been stopped this is a no-op.
}

//----------------------------------------------------------------------------------------------------------------------

void Network::WebSocket::Session::NotifyStopped(StopCause cause)
{
    if (m_optStopCause) { return; }
    m_optStopCause = cause;
    if (auto const callback = m_onStopped; callback) { callback(cause); }
}

//----------------------------------------------------------------------------------------------------------------------
