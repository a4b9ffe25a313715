//----------------------------------------------------------------------------------------------------------------------
// File: MessageHandler.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "MessageHandler.hpp"
#include "Components/Message/Chunk.hpp"
#include "Interfaces/PeerMessenger.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------

Route::Context::Context(Device::Identifier const& peer, Connection::Key key, IPeerMessenger& messenger)
    : m_peer(peer)
    , m_key(key)
    , m_messenger(messenger)
{
}

//----------------------------------------------------------------------------------------------------------------------

Device::Identifier const& Route::Context::GetPeer() const { return m_peer; }

//----------------------------------------------------------------------------------------------------------------------

Connection::Key Route::Context::GetKey() const { return m_key; }

//----------------------------------------------------------------------------------------------------------------------

bool Route::Context::Reply(Message::Variant const& message, std::optional<std::string> const& correlation) const
{
    return m_messenger.Reply(m_key, message, correlation);
}

//----------------------------------------------------------------------------------------------------------------------

Route::IMessageHandler::IMessageHandler()
    : m_logger(Logger::Get(Logger::Name::Router))
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Route::IMessageHandler::OnChunk(Context const&, Message::Chunk const&)
{
    return false;
}

//----------------------------------------------------------------------------------------------------------------------
