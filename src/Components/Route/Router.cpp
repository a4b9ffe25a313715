//----------------------------------------------------------------------------------------------------------------------
// File: Router.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Router.hpp"
#include "Components/Message/Chunk.hpp"
#include "Components/Message/Codec.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

Route::Router::Router()
    : m_logger(Logger::Get(Logger::Name::Router))
    , m_handlers()
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Route::Router::Initialize(std::shared_ptr<Hub::ServiceProvider> const& spServiceProvider)
{
    bool success = true;
    for (auto const& [type, upHandler] : m_handlers) {
        if (!upHandler->OnFetchServices(spServiceProvider)) {
            m_logger->error("The message handler for \"{}\" could not acquire its services.", type);
            success = false;
        }
    }
    return success;
}

//----------------------------------------------------------------------------------------------------------------------

bool Route::Router::Contains(std::string_view type) const
{
    return Match(type) != nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Route::Router::Size() const
{
    return m_handlers.size();
}

//----------------------------------------------------------------------------------------------------------------------

bool Route::Router::Route(Context const& context, std::string_view frame) const
{
    constexpr std::string_view UnrecognizedType =
        "Dropping a message of an unrecognized type [\"{}\"] received from {}.";
    constexpr std::string_view HandlerWarning =
        "Handler [\"{}\"] failed to handle a message received from {}.";
    constexpr std::string_view MalformedWarning =
        "Dropping a malformed message received from {}: \"{}\"";
    constexpr std::string_view ExceptionError =
        "Handler [\"{}\"] encountered an exception handling a message received from {}: \"{}\"";

    std::optional<std::string> optType;
    std::optional<std::string> optCorrelation;
    try {
        auto const parsed = Message::ParseFrame(frame);
        optType = parsed.type;
        optCorrelation = parsed.correlation;

        if (auto const pHandler = Match(parsed.type); pHandler) {
            bool const success = pHandler->OnMessage(context, parsed);
            if (!success) { m_logger->warn(HandlerWarning, parsed.type, context.GetPeer()); }
            return success;
        }

        // Unknown types are dropped without a reply such that newer peers may introduce message types.
        m_logger->warn(UnrecognizedType, parsed.type, context.GetPeer());
    } catch (Message::MalformedPayload const& e) {
        m_logger->warn(MalformedWarning, context.GetPeer(), e.what());
        Message::ProtocolError error{ .message = e.what(), .reference = optType };
        if (!context.Reply(error, optCorrelation)) {
            m_logger->debug("Unable to report a protocol error to {}.", context.GetPeer());
        }
    } catch (std::exception const& e) {
        m_logger->error(ExceptionError, optType.value_or(""), context.GetPeer(), e.what());
    }

    return false;
}

//----------------------------------------------------------------------------------------------------------------------

bool Route::Router::Route(Context const& context, std::span<std::uint8_t const> frame) const
{
    auto const optChunk = Message::DecodeChunk(frame);
    if (!optChunk) {
        m_logger->warn("Dropping a malformed chunk frame received from {}.", context.GetPeer());
        Message::ProtocolError error{ .message = "The chunk frame is malformed.", .reference = std::string{ ChunkRoute } };
        if (!context.Reply(error)) {
            m_logger->debug("Unable to report a protocol error to {}.", context.GetPeer());
        }
        return false;
    }

    auto const pHandler = Match(ChunkRoute);
    if (!pHandler) {
        m_logger->warn("Dropping a chunk frame received from {} without a registered handler.", context.GetPeer());
        return false;
    }

    try {
        return pHandler->OnChunk(context, *optChunk);
    } catch (std::exception const& e) {
        m_logger->error("The chunk handler encountered an exception handling a frame from {}: \"{}\"", context.GetPeer(), e.what());
    }

    return false;
}

//----------------------------------------------------------------------------------------------------------------------

Route::IMessageHandler* Route::Router::Match(std::string_view type) const
{
    if (type.empty()) [[unlikely]] { return nullptr; }
    if (auto const itr = m_handlers.find(std::string{ type }); itr != m_handlers.end()) { return itr->second.get(); }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------
