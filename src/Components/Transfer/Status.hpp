//----------------------------------------------------------------------------------------------------------------------
// File: Status.hpp
// Description: The states, directions, and failure reasons of a file transfer.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Transfer {
//----------------------------------------------------------------------------------------------------------------------

using Identifier = std::string;

enum class Status : std::uint32_t { Pending, Active, Paused, Completed, Failed, Canceled };

// The protocol request that created the transfer. The requester of an upload sends, the requester of a download
// receives.
enum class Direction : std::uint32_t { Upload, Download };

enum class Role : std::uint32_t { Sender, Receiver };

enum class Error : std::uint32_t { ChecksumMismatch, PeerRejected, PeerCanceled, IoFailure, ProtocolViolation };

struct Summary;
struct Progress;

[[nodiscard]] bool IsTerminal(Status status);

[[nodiscard]] std::string_view StatusToString(Status status);
[[nodiscard]] std::optional<Status> StringToStatus(std::string_view value);
[[nodiscard]] std::string_view DirectionToString(Direction direction);
[[nodiscard]] std::string_view ErrorToString(Error error);
[[nodiscard]] std::optional<Error> StringToError(std::string_view value);

//----------------------------------------------------------------------------------------------------------------------
} // Transfer namespace
//----------------------------------------------------------------------------------------------------------------------

struct Transfer::Summary
{
    Identifier identifier;
    std::string name;
    Direction direction;
    Role role;
    Status status;
    std::optional<Error> error;
    std::uint64_t size;
    std::uint64_t acknowledged;
};

//----------------------------------------------------------------------------------------------------------------------

// Derived from the acknowledged bytes only.
struct Transfer::Progress
{
    double percent;
    double throughput; // Bytes per second since the transfer was last activated.
    std::optional<std::chrono::seconds> eta;
};

//----------------------------------------------------------------------------------------------------------------------

inline bool Transfer::IsTerminal(Status status)
{
    return status == Status::Completed || status == Status::Failed || status == Status::Canceled;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string_view Transfer::StatusToString(Status status)
{
    switch (status) {
        case Status::Pending: return "pending";
        case Status::Active: return "active";
        case Status::Paused: return "paused";
        case Status::Completed: return "completed";
        case Status::Failed: return "failed";
        case Status::Canceled: return "canceled";
        default: return "unknown";
    }
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<Transfer::Status> Transfer::StringToStatus(std::string_view value)
{
    if (value == "pending") { return Status::Pending; }
    if (value == "active") { return Status::Active; }
    if (value == "paused") { return Status::Paused; }
    if (value == "completed") { return Status::Completed; }
    if (value == "failed") { return Status::Failed; }
    if (value == "canceled" || value == "cancelled") { return Status::Canceled; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string_view Transfer::DirectionToString(Direction direction)
{
    return direction == Direction::Upload ? "upload" : "download";
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string_view Transfer::ErrorToString(Error error)
{
    switch (error) {
        case Error::ChecksumMismatch: return "CHECKSUM_MISMATCH";
        case Error::PeerRejected: return "PEER_REJECTED";
        case Error::PeerCanceled: return "PEER_CANCELED";
        case Error::IoFailure: return "IO_FAILURE";
        case Error::ProtocolViolation: return "PROTOCOL_VIOLATION";
        default: return "UNKNOWN";
    }
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<Transfer::Error> Transfer::StringToError(std::string_view value)
{
    if (value == "CHECKSUM_MISMATCH") { return Error::ChecksumMismatch; }
    if (value == "PEER_REJECTED") { return Error::PeerRejected; }
    if (value == "PEER_CANCELED") { return Error::PeerCanceled; }
    if (value == "IO_FAILURE") { return Error::IoFailure; }
    if (value == "PROTOCOL_VIOLATION") { return Error::ProtocolViolation; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
