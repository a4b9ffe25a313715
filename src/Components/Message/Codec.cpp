//----------------------------------------------------------------------------------------------------------------------
// File: Codec.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Codec.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cmath>
#include <limits>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Accept = "accept";
constexpr std::string_view AppName = "app_name";
constexpr std::string_view BytesTransferred = "bytes_transferred";
constexpr std::string_view Checksum = "checksum";
constexpr std::string_view Code = "code";
constexpr std::string_view Content = "content";
constexpr std::string_view Correlation = "correlation_id";
constexpr std::string_view DeviceId = "device_id";
constexpr std::string_view DeviceName = "device_name";
constexpr std::string_view DeviceType = "device_type";
constexpr std::string_view FileId = "file_id";
constexpr std::string_view FileName = "file_name";
constexpr std::string_view FileSize = "file_size";
constexpr std::string_view FileType = "file_type";
constexpr std::string_view Id = "id";
constexpr std::string_view Message = "message";
constexpr std::string_view Offset = "offset";
constexpr std::string_view OriginDeviceId = "origin_device_id";
constexpr std::string_view Progress = "progress";
constexpr std::string_view Reason = "reason";
constexpr std::string_view Reference = "reference";
constexpr std::string_view Resume = "resume";
constexpr std::string_view Sequence = "sequence";
constexpr std::string_view Setting = "setting";
constexpr std::string_view Status = "status";
constexpr std::string_view Text = "text";
constexpr std::string_view Timestamp = "timestamp";
constexpr std::string_view Title = "title";
constexpr std::string_view TransferId = "transfer_id";
constexpr std::string_view Type = "type";
constexpr std::string_view Value = "value";

constexpr std::string_view Success = "success";
constexpr std::string_view Failure = "failure";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
//----------------------------------------------------------------------------------------------------------------------
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class Reader;

void Serialize(Message::PairingRequest const& message, boost::json::object& json);
void Serialize(Message::PairingResponse const& message, boost::json::object& json);
void Serialize(Message::Hello const& message, boost::json::object& json);
void Serialize(Message::HelloResponse const& message, boost::json::object& json);
void Serialize(Message::Unpair const& message, boost::json::object& json);
void Serialize(Message::Ping const& message, boost::json::object& json);
void Serialize(Message::Pong const& message, boost::json::object& json);
void Serialize(Message::ProtocolError const& message, boost::json::object& json);
void Serialize(Message::ClipboardUpdate const& message, boost::json::object& json);
void Serialize(Message::Notification const& message, boost::json::object& json);
void Serialize(Message::NotificationRemoved const& message, boost::json::object& json);
void Serialize(Message::ClientSetting const& message, boost::json::object& json);
void Serialize(Message::FileUploadRequest const& message, boost::json::object& json);
void Serialize(Message::FileDownloadRequest const& message, boost::json::object& json);
void Serialize(Message::FileTransferResponse const& message, boost::json::object& json);
void Serialize(Message::ChunkAck const& message, boost::json::object& json);
void Serialize(Message::TransferUpdate const& message, boost::json::object& json);
void Serialize(Message::CancelTransfer const& message, boost::json::object& json);

template<typename ValueType>
void SerializeOptional(std::string_view field, std::optional<ValueType> const& optValue, boost::json::object& json)
{
    if (optValue) { json[field] = *optValue; }
}

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Provides typed access to the fields of a message payload. Each accessor raises a MalformedPayload error
// naming the offending field when a required field is missing or a present field has the wrong shape.
//----------------------------------------------------------------------------------------------------------------------
class local::Reader
{
public:
    Reader(std::string_view type, boost::json::object const& json) : m_type(type), m_json(json) {}

    [[nodiscard]] std::string RequireString(std::string_view field) const
    {
        auto optValue = OptionalString(field);
        if (!optValue) { throw Message::MalformedPayload{ m_type, field, "string" }; }
        return std::move(*optValue);
    }

    [[nodiscard]] std::string RequireNonEmptyString(std::string_view field) const
    {
        auto value = RequireString(field);
        if (value.empty()) { throw Message::MalformedPayload{ m_type, field, "non-empty string" }; }
        return value;
    }

    [[nodiscard]] std::optional<std::string> OptionalString(std::string_view field) const
    {
        auto const pValue = Find(field);
        if (!pValue) { return {}; }
        if (!pValue->is_string()) { throw Message::MalformedPayload{ m_type, field, "string" }; }
        auto const& value = pValue->get_string();
        return std::string{ value.data(), value.size() };
    }

    [[nodiscard]] Device::Identifier RequireIdentifier(std::string_view field) const
    {
        auto identifier = RequireString(field);
        if (!Device::IsValidIdentifier(identifier)) { throw Message::MalformedPayload{ m_type, field, "identifier" }; }
        return identifier;
    }

    [[nodiscard]] std::uint64_t RequireUnsigned(std::string_view field) const
    {
        auto const optValue = OptionalUnsigned(field);
        if (!optValue) { throw Message::MalformedPayload{ m_type, field, "unsigned integer" }; }
        return *optValue;
    }

    [[nodiscard]] std::optional<std::uint64_t> OptionalUnsigned(std::string_view field) const
    {
        auto const pValue = Find(field);
        if (!pValue) { return {}; }
        if (pValue->is_uint64()) { return pValue->get_uint64(); }
        if (pValue->is_int64() && pValue->get_int64() >= 0) { return static_cast<std::uint64_t>(pValue->get_int64()); }
        if (pValue->is_double()) {
            double const value = pValue->get_double();
            if (value >= 0 && std::trunc(value) == value && value < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
                return static_cast<std::uint64_t>(value);
            }
        }
        throw Message::MalformedPayload{ m_type, field, "unsigned integer" };
    }

    [[nodiscard]] double RequireNumber(std::string_view field) const
    {
        auto const pValue = Find(field);
        if (pValue) {
            if (pValue->is_double()) { return pValue->get_double(); }
            if (pValue->is_int64()) { return static_cast<double>(pValue->get_int64()); }
            if (pValue->is_uint64()) { return static_cast<double>(pValue->get_uint64()); }
        }
        throw Message::MalformedPayload{ m_type, field, "number" };
    }

    [[nodiscard]] bool RequireBoolean(std::string_view field) const
    {
        auto const optValue = OptionalBoolean(field);
        if (!optValue) { throw Message::MalformedPayload{ m_type, field, "boolean" }; }
        return *optValue;
    }

    [[nodiscard]] std::optional<bool> OptionalBoolean(std::string_view field) const
    {
        auto const pValue = Find(field);
        if (!pValue) { return {}; }
        if (pValue->is_bool()) { return pValue->get_bool(); }
        // Some clients encode toggles as strings or integers.
        if (pValue->is_string()) {
            if (pValue->get_string() == "true") { return true; }
            if (pValue->get_string() == "false") { return false; }
        }
        if (pValue->is_int64() && (pValue->get_int64() == 0 || pValue->get_int64() == 1)) {
            return pValue->get_int64() == 1;
        }
        throw Message::MalformedPayload{ m_type, field, "boolean" };
    }

    // Timestamps are milliseconds since the epoch. When absent the time of receipt is assumed.
    [[nodiscard]] TimeUtils::Timestamp OptionalTimestamp(std::string_view field) const
    {
        auto const pValue = Find(field);
        if (!pValue) { return TimeUtils::GetSystemTimestamp(); }
        if (pValue->is_int64()) { return TimeUtils::Timestamp{ pValue->get_int64() }; }
        if (pValue->is_uint64() && pValue->get_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return TimeUtils::Timestamp{ static_cast<std::int64_t>(pValue->get_uint64()) };
        }
        if (pValue->is_double()) {
            // Fractional milliseconds are truncated. The bounds are exact powers of two.
            double const value = std::trunc(pValue->get_double());
            constexpr auto lower = static_cast<double>(std::numeric_limits<std::int64_t>::min());
            constexpr auto upper = static_cast<double>(std::numeric_limits<std::int64_t>::max());
            if (value >= lower && value < upper) { return TimeUtils::Timestamp{ static_cast<std::int64_t>(value) }; }
        }
        throw Message::MalformedPayload{ m_type, field, "timestamp" };
    }

    [[nodiscard]] bool RequireStatus(std::string_view field) const
    {
        auto const status = RequireString(field);
        if (status == symbols::Success) { return true; }
        if (status == symbols::Failure) { return false; }
        throw Message::MalformedPayload{ m_type, field, "\"success\" or \"failure\"" };
    }

private:
    [[nodiscard]] boost::json::value const* Find(std::string_view field) const
    {
        auto const itr = m_json.find(field);
        if (itr == m_json.end() || itr->value().is_null()) { return nullptr; }
        return &itr->value();
    }

    std::string_view m_type;
    boost::json::object const& m_json;
};

//----------------------------------------------------------------------------------------------------------------------

Message::MalformedPayload::MalformedPayload(std::string_view type, std::string_view field, std::string_view expectation)
    : std::runtime_error(
        "The \"" + std::string{ field } + "\" field of a \"" + std::string{ type } + "\" message must be a " +
        std::string{ expectation } + ".")
    , m_type(type)
    , m_field(field)
{
}

//----------------------------------------------------------------------------------------------------------------------

Message::MalformedPayload::MalformedPayload(std::string const& description)
    : std::runtime_error(description)
    , m_type()
    , m_field()
{
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Message::MalformedPayload::GetType() const { return m_type; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Message::MalformedPayload::GetField() const { return m_field; }

//----------------------------------------------------------------------------------------------------------------------

Message::Frame Message::ParseFrame(std::string_view raw)
{
    if (raw.empty() || raw.size() > MaximumFrameSize) { throw MalformedPayload{ "The frame size is out of bounds." }; }

    boost::json::error_code error;
    auto value = boost::json::parse(raw, error);
    if (error || !value.is_object()) { throw MalformedPayload{ "The frame is not a JSON object." }; }

    auto& json = value.get_object();
    auto const itr = json.find(symbols::Type);
    if (itr == json.end() || !itr->value().is_string() || itr->value().get_string().empty()) {
        throw MalformedPayload{ "The frame is missing its \"type\" discriminator." };
    }

    Frame frame;
    frame.type = std::string{ itr->value().get_string().data(), itr->value().get_string().size() };
    if (auto const jtr = json.find(symbols::Correlation); jtr != json.end() && jtr->value().is_string()) {
        auto const& correlation = jtr->value().get_string();
        frame.correlation = std::string{ correlation.data(), correlation.size() };
    }
    frame.payload = std::move(json);
    return frame;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Message::Encode(Variant const& message, std::optional<std::string> const& correlation)
{
    boost::json::object json;
    std::visit([&json] (auto const& specific) {
        json[symbols::Type] = std::remove_cvref_t<decltype(specific)>::Type;
        local::Serialize(specific, json);
    }, message);

    if (correlation) { json[symbols::Correlation] = *correlation; }
    return boost::json::serialize(json);
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::PairingRequest Message::Decode<Message::PairingRequest>(boost::json::object const& payload)
{
    local::Reader const reader{ PairingRequest::Type, payload };
    return {
        .code = reader.RequireNonEmptyString(symbols::Code),
        .deviceId = reader.RequireIdentifier(symbols::DeviceId),
        .deviceName = reader.OptionalString(symbols::DeviceName).value_or(""),
        .deviceType = reader.OptionalString(symbols::DeviceType).value_or("unknown"),
    };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::PairingResponse Message::Decode<Message::PairingResponse>(boost::json::object const& payload)
{
    local::Reader const reader{ PairingResponse::Type, payload };
    return {
        .success = reader.RequireStatus(symbols::Status),
        .message = reader.OptionalString(symbols::Message),
        .deviceId = reader.OptionalString(symbols::DeviceId),
        .deviceName = reader.OptionalString(symbols::DeviceName),
    };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::Hello Message::Decode<Message::Hello>(boost::json::object const& payload)
{
    local::Reader const reader{ Hello::Type, payload };
    return {
        .deviceId = reader.RequireIdentifier(symbols::DeviceId),
        .deviceName = reader.OptionalString(symbols::DeviceName).value_or(""),
        .deviceType = reader.OptionalString(symbols::DeviceType).value_or("unknown"),
    };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::HelloResponse Message::Decode<Message::HelloResponse>(boost::json::object const& payload)
{
    local::Reader const reader{ HelloResponse::Type, payload };
    return {
        .success = reader.RequireStatus(symbols::Status),
        .message = reader.OptionalString(symbols::Message),
        .deviceId = reader.OptionalString(symbols::DeviceId),
        .deviceName = reader.OptionalString(symbols::DeviceName),
    };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::Unpair Message::Decode<Message::Unpair>(boost::json::object const& payload)
{
    local::Reader const reader{ Unpair::Type, payload };
    return { .deviceId = reader.RequireIdentifier(symbols::DeviceId) };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::Ping Message::Decode<Message::Ping>(boost::json::object const& payload)
{
    local::Reader const reader{ Ping::Type, payload };
    return { .timestamp = reader.OptionalTimestamp(symbols::Timestamp) };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::Pong Message::Decode<Message::Pong>(boost::json::object const& payload)
{
    local::Reader const reader{ Pong::Type, payload };
    return { .timestamp = reader.OptionalTimestamp(symbols::Timestamp) };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::ProtocolError Message::Decode<Message::ProtocolError>(boost::json::object const& payload)
{
    local::Reader const reader{ ProtocolError::Type, payload };
    return {
        .message = reader.OptionalString(symbols::Message).value_or(""),
        .reference = reader.OptionalString(symbols::Reference),
    };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::ClipboardUpdate Message::Decode<Message::ClipboardUpdate>(boost::json::object const& payload)
{
    local::Reader const reader{ ClipboardUpdate::Type, payload };
    return {
        .text = reader.RequireString(symbols::Text),
        .timestamp = reader.OptionalTimestamp(symbols::Timestamp),
        .originDeviceId = reader.OptionalString(symbols::OriginDeviceId).value_or(""),
    };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::Notification Message::Decode<Message::Notification>(boost::json::object const& payload)
{
    local::Reader const reader{ Notification::Type, payload };
    return {
        .id = reader.RequireNonEmptyString(symbols::Id),
        .appName = reader.OptionalString(symbols::AppName).value_or(""),
        .title = reader.OptionalString(symbols::Title).value_or(""),
        .content = reader.OptionalString(symbols::Content).value_or(""),
        .timestamp = reader.OptionalTimestamp(symbols::Timestamp),
        .originDeviceId = reader.OptionalString(symbols::OriginDeviceId),
    };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::NotificationRemoved Message::Decode<Message::NotificationRemoved>(boost::json::object const& payload)
{
    local::Reader const reader{ NotificationRemoved::Type, payload };
    return { .id = reader.RequireNonEmptyString(symbols::Id) };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::ClientSetting Message::Decode<Message::ClientSetting>(boost::json::object const& payload)
{
    local::Reader const reader{ ClientSetting::Type, payload };
    return {
        .setting = reader.RequireNonEmptyString(symbols::Setting),
        .value = reader.RequireBoolean(symbols::Value),
    };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::FileUploadRequest Message::Decode<Message::FileUploadRequest>(boost::json::object const& payload)
{
    local::Reader const reader{ FileUploadRequest::Type, payload };
    return {
        .transferId = reader.RequireNonEmptyString(symbols::TransferId),
        .fileName = reader.RequireNonEmptyString(symbols::FileName),
        .fileSize = reader.RequireUnsigned(symbols::FileSize),
        .fileType = reader.OptionalString(symbols::FileType).value_or("application/octet-stream"),
        .checksum = reader.OptionalString(symbols::Checksum),
        .resume = reader.OptionalBoolean(symbols::Resume).value_or(false),
    };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::FileDownloadRequest Message::Decode<Message::FileDownloadRequest>(boost::json::object const& payload)
{
    local::Reader const reader{ FileDownloadRequest::Type, payload };
    return {
        .transferId = reader.RequireNonEmptyString(symbols::TransferId),
        .fileId = reader.RequireNonEmptyString(symbols::FileId),
    };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::FileTransferResponse Message::Decode<Message::FileTransferResponse>(boost::json::object const& payload)
{
    local::Reader const reader{ FileTransferResponse::Type, payload };
    return {
        .transferId = reader.RequireNonEmptyString(symbols::TransferId),
        .accept = reader.RequireBoolean(symbols::Accept),
        .offset = reader.OptionalUnsigned(symbols::Offset),
        .fileName = reader.OptionalString(symbols::FileName),
        .fileSize = reader.OptionalUnsigned(symbols::FileSize),
        .checksum = reader.OptionalString(symbols::Checksum),
        .message = reader.OptionalString(symbols::Message),
    };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::ChunkAck Message::Decode<Message::ChunkAck>(boost::json::object const& payload)
{
    local::Reader const reader{ ChunkAck::Type, payload };
    return {
        .transferId = reader.RequireNonEmptyString(symbols::TransferId),
        .sequence = reader.RequireUnsigned(symbols::Sequence),
    };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::TransferUpdate Message::Decode<Message::TransferUpdate>(boost::json::object const& payload)
{
    local::Reader const reader{ TransferUpdate::Type, payload };
    auto const status = Transfer::StringToStatus(reader.RequireString(symbols::Status));
    if (!status) { throw MalformedPayload{ TransferUpdate::Type, symbols::Status, "transfer status" }; }
    return {
        .transferId = reader.RequireNonEmptyString(symbols::TransferId),
        .progress = reader.RequireNumber(symbols::Progress),
        .status = *status,
        .bytesTransferred = reader.OptionalUnsigned(symbols::BytesTransferred).value_or(0),
        .message = reader.OptionalString(symbols::Message),
        // Unrecognized reasons are tolerated, the status alone determines the outcome.
        .reason = Transfer::StringToError(reader.OptionalString(symbols::Reason).value_or("")),
    };
}

//----------------------------------------------------------------------------------------------------------------------

template<>
Message::CancelTransfer Message::Decode<Message::CancelTransfer>(boost::json::object const& payload)
{
    local::Reader const reader{ CancelTransfer::Type, payload };
    return { .transferId = reader.RequireNonEmptyString(symbols::TransferId) };
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::PairingRequest const& message, boost::json::object& json)
{
    json[symbols::Code] = message.code;
    json[symbols::DeviceId] = message.deviceId;
    json[symbols::DeviceName] = message.deviceName;
    json[symbols::DeviceType] = message.deviceType;
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::PairingResponse const& message, boost::json::object& json)
{
    json[symbols::Status] = message.success ? symbols::Success : symbols::Failure;
    SerializeOptional(symbols::Message, message.message, json);
    SerializeOptional(symbols::DeviceId, message.deviceId, json);
    SerializeOptional(symbols::DeviceName, message.deviceName, json);
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::Hello const& message, boost::json::object& json)
{
    json[symbols::DeviceId] = message.deviceId;
    json[symbols::DeviceName] = message.deviceName;
    json[symbols::DeviceType] = message.deviceType;
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::HelloResponse const& message, boost::json::object& json)
{
    json[symbols::Status] = message.success ? symbols::Success : symbols::Failure;
    SerializeOptional(symbols::Message, message.message, json);
    SerializeOptional(symbols::DeviceId, message.deviceId, json);
    SerializeOptional(symbols::DeviceName, message.deviceName, json);
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::Unpair const& message, boost::json::object& json)
{
    json[symbols::DeviceId] = message.deviceId;
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::Ping const& message, boost::json::object& json)
{
    json[symbols::Timestamp] = message.timestamp.count();
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::Pong const& message, boost::json::object& json)
{
    json[symbols::Timestamp] = message.timestamp.count();
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::ProtocolError const& message, boost::json::object& json)
{
    json[symbols::Message] = message.message;
    SerializeOptional(symbols::Reference, message.reference, json);
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::ClipboardUpdate const& message, boost::json::object& json)
{
    json[symbols::Text] = message.text;
    json[symbols::Timestamp] = message.timestamp.count();
    json[symbols::OriginDeviceId] = message.originDeviceId;
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::Notification const& message, boost::json::object& json)
{
    json[symbols::Id] = message.id;
    json[symbols::AppName] = message.appName;
    json[symbols::Title] = message.title;
    json[symbols::Content] = message.content;
    json[symbols::Timestamp] = message.timestamp.count();
    SerializeOptional(symbols::OriginDeviceId, message.originDeviceId, json);
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::NotificationRemoved const& message, boost::json::object& json)
{
    json[symbols::Id] = message.id;
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::ClientSetting const& message, boost::json::object& json)
{
    json[symbols::Setting] = message.setting;
    json[symbols::Value] = message.value;
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::FileUploadRequest const& message, boost::json::object& json)
{
    json[symbols::TransferId] = message.transferId;
    json[symbols::FileName] = message.fileName;
    json[symbols::FileSize] = message.fileSize;
    json[symbols::FileType] = message.fileType;
    SerializeOptional(symbols::Checksum, message.checksum, json);
    if (message.resume) { json[symbols::Resume] = true; }
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::FileDownloadRequest const& message, boost::json::object& json)
{
    json[symbols::TransferId] = message.transferId;
    json[symbols::FileId] = message.fileId;
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::FileTransferResponse const& message, boost::json::object& json)
{
    json[symbols::TransferId] = message.transferId;
    json[symbols::Accept] = message.accept;
    SerializeOptional(symbols::Offset, message.offset, json);
    SerializeOptional(symbols::FileName, message.fileName, json);
    SerializeOptional(symbols::FileSize, message.fileSize, json);
    SerializeOptional(symbols::Checksum, message.checksum, json);
    SerializeOptional(symbols::Message, message.message, json);
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::ChunkAck const& message, boost::json::object& json)
{
    json[symbols::TransferId] = message.transferId;
    json[symbols::Sequence] = message.sequence;
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::TransferUpdate const& message, boost::json::object& json)
{
    json[symbols::TransferId] = message.transferId;
    json[symbols::Progress] = message.progress;
    json[symbols::Status] = Transfer::StatusToString(message.status);
    json[symbols::BytesTransferred] = message.bytesTransferred;
    SerializeOptional(symbols::Message, message.message, json);
    if (message.reason) { json[symbols::Reason] = Transfer::ErrorToString(*message.reason); }
}

//----------------------------------------------------------------------------------------------------------------------

void local::Serialize(Message::CancelTransfer const& message, boost::json::object& json)
{
    json[symbols::TransferId] = message.transferId;
}

//----------------------------------------------------------------------------------------------------------------------
