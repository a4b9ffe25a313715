//----------------------------------------------------------------------------------------------------------------------
// File: Messages.hpp
// Description: The typed protocol messages exchanged over a connection's text frames. Each message declares the
// discriminator carried in the "type" field of its frame.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Device/Device.hpp"
#include "Components/Transfer/Status.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Message {
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Handshake {
//----------------------------------------------------------------------------------------------------------------------

struct PairingRequest
{
    static constexpr std::string_view Type = "pairing_request";
    std::string code;
    Device::Identifier deviceId;
    std::string deviceName;
    std::string deviceType;
};

struct PairingResponse
{
    static constexpr std::string_view Type = "pairing_response";
    bool success;
    std::optional<std::string> message;
    std::optional<Device::Identifier> deviceId; // The identity of the responding side, present on success.
    std::optional<std::string> deviceName;
};

// The authentication exchange used by devices that have previously completed pairing.
struct Hello
{
    static constexpr std::string_view Type = "hello";
    Device::Identifier deviceId;
    std::string deviceName;
    std::string deviceType;
};

struct HelloResponse
{
    static constexpr std::string_view Type = "hello_response";
    bool success;
    std::optional<std::string> message;
    std::optional<Device::Identifier> deviceId;
    std::optional<std::string> deviceName;
};

struct Unpair
{
    static constexpr std::string_view Type = "unpair";
    Device::Identifier deviceId;
};

struct Ping
{
    static constexpr std::string_view Type = "ping";
    TimeUtils::Timestamp timestamp;
};

struct Pong
{
    static constexpr std::string_view Type = "pong";
    TimeUtils::Timestamp timestamp;
};

struct ProtocolError
{
    static constexpr std::string_view Type = "protocol_error";
    std::string message;
    std::optional<std::string> reference; // The type of the offending frame, if it could be determined.
};

//----------------------------------------------------------------------------------------------------------------------
// } Handshake
//----------------------------------------------------------------------------------------------------------------------
// Channels {
//----------------------------------------------------------------------------------------------------------------------

struct ClipboardUpdate
{
    static constexpr std::string_view Type = "clipboard_update";
    std::string text;
    TimeUtils::Timestamp timestamp;
    Device::Identifier originDeviceId;
};

struct Notification
{
    static constexpr std::string_view Type = "notification";
    std::string id;
    std::string appName;
    std::string title;
    std::string content;
    TimeUtils::Timestamp timestamp;
    std::optional<Device::Identifier> originDeviceId;
};

struct NotificationRemoved
{
    static constexpr std::string_view Type = "notification_removed";
    std::string id;
};

struct ClientSetting
{
    static constexpr std::string_view Type = "client_setting";
    std::string setting;
    bool value;
};

//----------------------------------------------------------------------------------------------------------------------
// } Channels
//----------------------------------------------------------------------------------------------------------------------
// File Transfer {
//----------------------------------------------------------------------------------------------------------------------

struct FileUploadRequest
{
    static constexpr std::string_view Type = "file_upload_request";
    Transfer::Identifier transferId;
    std::string fileName;
    std::uint64_t fileSize;
    std::string fileType;
    std::optional<std::string> checksum;
    bool resume = false;
};

struct FileDownloadRequest
{
    static constexpr std::string_view Type = "file_download_request";
    Transfer::Identifier transferId;
    std::string fileId;
};

struct FileTransferResponse
{
    static constexpr std::string_view Type = "file_transfer_response";
    Transfer::Identifier transferId;
    bool accept;
    std::optional<std::uint64_t> offset;
    std::optional<std::string> fileName;
    std::optional<std::uint64_t> fileSize;
    std::optional<std::string> checksum;
    std::optional<std::string> message;
};

struct ChunkAck
{
    static constexpr std::string_view Type = "chunk_ack";
    Transfer::Identifier transferId;
    std::uint64_t sequence;
};

struct TransferUpdate
{
    static constexpr std::string_view Type = "transfer_update";
    Transfer::Identifier transferId;
    double progress;
    Transfer::Status status;
    std::uint64_t bytesTransferred;
    std::optional<std::string> message;
    std::optional<Transfer::Error> reason; // Present when the status is failed.
};

struct CancelTransfer
{
    static constexpr std::string_view Type = "cancel_transfer";
    Transfer::Identifier transferId;
};

//----------------------------------------------------------------------------------------------------------------------
// } File Transfer
//----------------------------------------------------------------------------------------------------------------------

using Variant = std::variant<
    PairingRequest, PairingResponse, Hello, HelloResponse, Unpair, Ping, Pong, ProtocolError,
    ClipboardUpdate, Notification, NotificationRemoved, ClientSetting,
    FileUploadRequest, FileDownloadRequest, FileTransferResponse, ChunkAck, TransferUpdate, CancelTransfer>;

template<typename MessageType>
concept ProtocolMessage = requires { { MessageType::Type } -> std::convertible_to<std::string_view>; };

//----------------------------------------------------------------------------------------------------------------------
} // Message namespace
//----------------------------------------------------------------------------------------------------------------------
