//----------------------------------------------------------------------------------------------------------------------
// File: Codec.hpp
// Description: Conversion between the typed protocol messages and the JSON text frames that carry them.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Messages.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Message {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t MaximumFrameSize = 4 * 1024 * 1024;

class MalformedPayload;
struct Frame;

// Parses the envelope of a text frame. A frame that is not a JSON object or that is missing its "type" discriminator
// results in a MalformedPayload error, the fields specific to the type are not inspected.
[[nodiscard]] Frame ParseFrame(std::string_view raw);

[[nodiscard]] std::string Encode(Variant const& message, std::optional<std::string> const& correlation = {});

// Decodes the fields of a specific message type. Missing required fields or fields of the wrong shape result in a
// MalformedPayload error.
template<ProtocolMessage MessageType>
[[nodiscard]] MessageType Decode(boost::json::object const& payload);

template<> [[nodiscard]] PairingRequest Decode<PairingRequest>(boost::json::object const& payload);
template<> [[nodiscard]] PairingResponse Decode<PairingResponse>(boost::json::object const& payload);
template<> [[nodiscard]] Hello Decode<Hello>(boost::json::object const& payload);
template<> [[nodiscard]] HelloResponse Decode<HelloResponse>(boost::json::object const& payload);
template<> [[nodiscard]] Unpair Decode<Unpair>(boost::json::object const& payload);
template<> [[nodiscard]] Ping Decode<Ping>(boost::json::object const& payload);
template<> [[nodiscard]] Pong Decode<Pong>(boost::json::object const& payload);
template<> [[nodiscard]] ProtocolError Decode<ProtocolError>(boost::json::object const& payload);
template<> [[nodiscard]] ClipboardUpdate Decode<ClipboardUpdate>(boost::json::object const& payload);
template<> [[nodiscard]] Notification Decode<Notification>(boost::json::object const& payload);
template<> [[nodiscard]] NotificationRemoved Decode<NotificationRemoved>(boost::json::object const& payload);
template<> [[nodiscard]] ClientSetting Decode<ClientSetting>(boost::json::object const& payload);
template<> [[nodiscard]] FileUploadRequest Decode<FileUploadRequest>(boost::json::object const& payload);
template<> [[nodiscard]] FileDownloadRequest Decode<FileDownloadRequest>(boost::json::object const& payload);
template<> [[nodiscard]] FileTransferResponse Decode<FileTransferResponse>(boost::json::object const& payload);
template<> [[nodiscard]] ChunkAck Decode<ChunkAck>(boost::json::object const& payload);
template<> [[nodiscard]] TransferUpdate Decode<TransferUpdate>(boost::json::object const& payload);
template<> [[nodiscard]] CancelTransfer Decode<CancelTransfer>(boost::json::object const& payload);

//----------------------------------------------------------------------------------------------------------------------
} // Message namespace
//----------------------------------------------------------------------------------------------------------------------

class Message::MalformedPayload : public std::runtime_error
{
public:
    MalformedPayload(std::string_view type, std::string_view field, std::string_view expectation);
    explicit MalformedPayload(std::string const& description);

    [[nodiscard]] std::string const& GetType() const;
    [[nodiscard]] std::string const& GetField() const;

private:
    std::string m_type;
    std::string m_field;
};

//----------------------------------------------------------------------------------------------------------------------

struct Message::Frame
{
    std::string type;
    std::optional<std::string> correlation;
    boost::json::object payload;
};

//----------------------------------------------------------------------------------------------------------------------
