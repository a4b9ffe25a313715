//----------------------------------------------------------------------------------------------------------------------
#include "Components/Message/Codec.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

template<typename MessageType>
MessageType Reparse(Message::Variant const& message)
{
    auto const frame = Message::ParseFrame(Message::Encode(message));
    EXPECT_EQ(frame.type, MessageType::Type);
    return Message::Decode<MessageType>(frame.payload);
}

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

Device::Identifier const DeviceIdentifier = "9f2c6a51-desktop";
constexpr std::string_view PairingCode = "7KQ2MX";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(CodecSuite, ParseFrameTest)
{
    auto const frame = Message::ParseFrame(R"({"type":"ping","timestamp":1700000000000,"correlation_id":"abc"})");
    EXPECT_EQ(frame.type, "ping");
    ASSERT_TRUE(frame.correlation);
    EXPECT_EQ(*frame.correlation, "abc");

    auto const ping = Message::Decode<Message::Ping>(frame.payload);
    EXPECT_EQ(ping.timestamp.count(), 1700000000000);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CodecSuite, MalformedFrameTest)
{
    EXPECT_THROW(auto const frame = Message::ParseFrame(""), Message::MalformedPayload);
    EXPECT_THROW(auto const frame = Message::ParseFrame("not json"), Message::MalformedPayload);
    EXPECT_THROW(auto const frame = Message::ParseFrame("[1, 2, 3]"), Message::MalformedPayload);
    EXPECT_THROW(auto const frame = Message::ParseFrame(R"({"text":"hello"})"), Message::MalformedPayload);
    EXPECT_THROW(auto const frame = Message::ParseFrame(R"({"type":""})"), Message::MalformedPayload);
    EXPECT_THROW(auto const frame = Message::ParseFrame(R"({"type":42})"), Message::MalformedPayload);

    std::string oversized(Message::MaximumFrameSize + 1, ' ');
    EXPECT_THROW(auto const frame = Message::ParseFrame(oversized), Message::MalformedPayload);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CodecSuite, UnknownTypeIsParsedTest)
{
    // The envelope does not restrict the discriminator, routing decides whether the type is supported.
    auto const frame = Message::ParseFrame(R"({"type":"telepathy","value":true})");
    EXPECT_EQ(frame.type, "telepathy");
    EXPECT_FALSE(frame.correlation);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CodecSuite, PairingRequestTest)
{
    Message::PairingRequest const request{
        .code = std::string{ test::PairingCode },
        .deviceId = test::DeviceIdentifier,
        .deviceName = "Workstation",
        .deviceType = "desktop",
    };

    auto const decoded = local::Reparse<Message::PairingRequest>(request);
    EXPECT_EQ(decoded.code, test::PairingCode);
    EXPECT_EQ(decoded.deviceId, test::DeviceIdentifier);
    EXPECT_EQ(decoded.deviceName, "Workstation");
    EXPECT_EQ(decoded.deviceType, "desktop");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CodecSuite, PairingRequestMissingFieldTest)
{
    {
        auto const frame = Message::ParseFrame(R"({"type":"pairing_request","device_id":"abc"})");
        try {
            [[maybe_unused]] auto const request = Message::Decode<Message::PairingRequest>(frame.payload);
            FAIL() << "A pairing request without a code must be rejected.";
        } catch (Message::MalformedPayload const& error) {
            EXPECT_EQ(error.GetType(), "pairing_request");
            EXPECT_EQ(error.GetField(), "code");
        }
    }

    {
        auto const frame = Message::ParseFrame(R"({"type":"pairing_request","code":"7KQ2MX","device_id":"a b"})");
        try {
            [[maybe_unused]] auto const request = Message::Decode<Message::PairingRequest>(frame.payload);
            FAIL() << "A pairing request with an invalid identifier must be rejected.";
        } catch (Message::MalformedPayload const& error) {
            EXPECT_EQ(error.GetField(), "device_id");
        }
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CodecSuite, PairingResponseStatusTest)
{
    auto const accepted = local::Reparse<Message::PairingResponse>(Message::PairingResponse{
        .success = true, .message = {}, .deviceId = test::DeviceIdentifier, .deviceName = "Hub" });
    EXPECT_TRUE(accepted.success);
    EXPECT_EQ(accepted.deviceId, test::DeviceIdentifier);
    EXPECT_FALSE(accepted.message);

    auto const rejected = local::Reparse<Message::PairingResponse>(Message::PairingResponse{
        .success = false, .message = "code_expired", .deviceId = {}, .deviceName = {} });
    EXPECT_FALSE(rejected.success);
    ASSERT_TRUE(rejected.message);
    EXPECT_EQ(*rejected.message, "code_expired");

    auto const frame = Message::ParseFrame(R"({"type":"pairing_response","status":"maybe"})");
    EXPECT_THROW(
        [[maybe_unused]] auto const response = Message::Decode<Message::PairingResponse>(frame.payload),
        Message::MalformedPayload);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CodecSuite, EncodedFieldNamesTest)
{
    auto const encoded = Message::Encode(Message::ClipboardUpdate{
        .text = "hello", .timestamp = TimeUtils::Timestamp{ 42 }, .originDeviceId = test::DeviceIdentifier },
        "correlation");

    auto const json = boost::json::parse(encoded).as_object();
    EXPECT_EQ(json.at("type").as_string(), "clipboard_update");
    EXPECT_EQ(json.at("text").as_string(), "hello");
    EXPECT_EQ(json.at("timestamp").as_int64(), 42);
    EXPECT_EQ(json.at("origin_device_id").as_string(), test::DeviceIdentifier);
    EXPECT_EQ(json.at("correlation_id").as_string(), "correlation");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CodecSuite, OptionalFieldDefaultsTest)
{
    {
        auto const frame = Message::ParseFrame(R"({"type":"notification","id":"n-1"})");
        auto const notification = Message::Decode<Message::Notification>(frame.payload);
        EXPECT_EQ(notification.id, "n-1");
        EXPECT_TRUE(notification.appName.empty());
        EXPECT_TRUE(notification.title.empty());
        EXPECT_FALSE(notification.originDeviceId);
        EXPECT_GT(notification.timestamp.count(), 0); // The time of receipt is assumed.
    }

    {
        auto const frame = Message::ParseFrame(
            R"({"type":"file_upload_request","transfer_id":"t-1","file_name":"a.txt","file_size":12})");
        auto const request = Message::Decode<Message::FileUploadRequest>(frame.payload);
        EXPECT_EQ(request.fileSize, 12u);
        EXPECT_EQ(request.fileType, "application/octet-stream");
        EXPECT_FALSE(request.checksum);
        EXPECT_FALSE(request.resume);
    }

    {
        auto const frame = Message::ParseFrame(R"({"type":"notification","id":null})");
        EXPECT_THROW(
            [[maybe_unused]] auto const notification = Message::Decode<Message::Notification>(frame.payload),
            Message::MalformedPayload);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CodecSuite, ClientSettingBooleanShapesTest)
{
    auto const decode = [] (std::string_view raw) {
        return Message::Decode<Message::ClientSetting>(Message::ParseFrame(raw).payload);
    };

    EXPECT_TRUE(decode(R"({"type":"client_setting","setting":"clipboard_sync","value":true})").value);
    EXPECT_FALSE(decode(R"({"type":"client_setting","setting":"clipboard_sync","value":"false"})").value);
    EXPECT_TRUE(decode(R"({"type":"client_setting","setting":"clipboard_sync","value":1})").value);
    EXPECT_THROW(
        [[maybe_unused]] auto const setting = decode(R"({"type":"client_setting","setting":"clipboard_sync","value":7})"),
        Message::MalformedPayload);
    EXPECT_THROW(
        [[maybe_unused]] auto const setting = decode(R"({"type":"client_setting","value":true})"),
        Message::MalformedPayload);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CodecSuite, FileSizeShapesTest)
{
    auto const decode = [] (std::string_view size) {
        std::string raw = R"({"type":"file_upload_request","transfer_id":"t","file_name":"f","file_size":)";
        raw.append(size).append("}");
        return Message::Decode<Message::FileUploadRequest>(Message::ParseFrame(raw).payload);
    };

    EXPECT_EQ(decode("1024").fileSize, 1024u);
    EXPECT_EQ(decode("2048.0").fileSize, 2048u);
    EXPECT_THROW([[maybe_unused]] auto const request = decode("-1"), Message::MalformedPayload);
    EXPECT_THROW([[maybe_unused]] auto const request = decode("1.5"), Message::MalformedPayload);
    EXPECT_THROW([[maybe_unused]] auto const request = decode("\"1024\""), Message::MalformedPayload);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CodecSuite, TimestampShapesTest)
{
    auto const decode = [] (std::string_view timestamp) {
        std::string raw = R"({"type":"pong","timestamp":)";
        raw.append(timestamp).append("}");
        return Message::Decode<Message::Pong>(Message::ParseFrame(raw).payload).timestamp.count();
    };

    EXPECT_EQ(decode("1700000000000"), 1700000000000);
    EXPECT_EQ(decode("1.7e12"), 1700000000000);
    EXPECT_EQ(decode("1700000000000.75"), 1700000000000);
    EXPECT_EQ(decode("-1.5"), -1);

    // Values outside of the range of a millisecond count are rejected.
    EXPECT_THROW([[maybe_unused]] auto const timestamp = decode("1e300"), Message::MalformedPayload);
    EXPECT_THROW([[maybe_unused]] auto const timestamp = decode("-1e300"), Message::MalformedPayload);
    EXPECT_THROW([[maybe_unused]] auto const timestamp = decode("9.3e18"), Message::MalformedPayload);
    EXPECT_THROW([[maybe_unused]] auto const timestamp = decode("18446744073709551615"), Message::MalformedPayload);
    EXPECT_THROW([[maybe_unused]] auto const timestamp = decode("\"now\""), Message::MalformedPayload);

    auto const frame = Message::ParseFrame(R"({"type":"ping","timestamp":1e300})");
    EXPECT_THROW(
        [[maybe_unused]] auto const ping = Message::Decode<Message::Ping>(frame.payload), Message::MalformedPayload);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CodecSuite, TransferUpdateTest)
{
    auto const update = local::Reparse<Message::TransferUpdate>(Message::TransferUpdate{
        .transferId = "t-7",
        .progress = 0.5,
        .status = Transfer::Status::Failed,
        .bytesTransferred = 512,
        .message = "checksum mismatch",
        .reason = Transfer::Error::ChecksumMismatch,
    });

    EXPECT_EQ(update.transferId, "t-7");
    EXPECT_DOUBLE_EQ(update.progress, 0.5);
    EXPECT_EQ(update.status, Transfer::Status::Failed);
    EXPECT_EQ(update.bytesTransferred, 512u);
    ASSERT_TRUE(update.reason);
    EXPECT_EQ(*update.reason, Transfer::Error::ChecksumMismatch);

    auto const frame = Message::ParseFrame(
        R"({"type":"transfer_update","transfer_id":"t-7","progress":0.1,"status":"exploded"})");
    EXPECT_THROW(
        [[maybe_unused]] auto const invalid = Message::Decode<Message::TransferUpdate>(frame.payload),
        Message::MalformedPayload);
}

//----------------------------------------------------------------------------------------------------------------------
