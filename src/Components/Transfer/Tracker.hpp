//----------------------------------------------------------------------------------------------------------------------
// File: Tracker.hpp
// Description: The state machine and byte accounting of a single transfer. Transfers move from pending to active and
// may be paused by a connection loss. The completed, failed, and canceled states are final; once a tracker reaches one
// of them every mutator is refused. The acknowledged byte count never decreases.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Checksum.hpp"
#include "Status.hpp"
#include "Components/Device/Device.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Transfer {
//----------------------------------------------------------------------------------------------------------------------

using Clock = std::chrono::steady_clock;

struct Descriptor;
class Tracker;

//----------------------------------------------------------------------------------------------------------------------
} // Transfer namespace
//----------------------------------------------------------------------------------------------------------------------

struct Transfer::Descriptor
{
    Identifier identifier;
    Direction direction;
    Role role;
    std::string name;
    std::uint64_t size = 0;
    std::string type;
    std::string fileId; // The storage key of the source for senders, the requested file for download receivers.
    std::optional<std::string> checksum;
};

//----------------------------------------------------------------------------------------------------------------------

class Transfer::Tracker
{
public:
    enum class Acknowledgement : std::uint32_t { Accepted, Duplicate, OutOfSequence };
    enum class Receipt : std::uint32_t { Accepted, Duplicate, OutOfSequence, InvalidSize };

    Tracker(
        Device::Identifier const& peer,
        Descriptor const& descriptor,
        std::size_t chunkSize,
        Clock::time_point const& now);

    Tracker(Tracker const&) = delete;
    Tracker(Tracker&&) = delete;
    Tracker& operator=(Tracker const&) = delete;
    Tracker& operator=(Tracker&&) = delete;

    [[nodiscard]] Device::Identifier const& GetPeer() const;
    [[nodiscard]] Identifier const& GetIdentifier() const;
    [[nodiscard]] Descriptor const& GetDescriptor() const;
    [[nodiscard]] Direction GetDirection() const;
    [[nodiscard]] Role GetRole() const;
    [[nodiscard]] Status GetStatus() const;
    [[nodiscard]] std::optional<Error> GetError() const;
    [[nodiscard]] std::uint64_t GetSize() const;
    [[nodiscard]] std::uint64_t GetAcknowledged() const;
    [[nodiscard]] std::size_t GetChunkSize() const;
    [[nodiscard]] std::uint64_t GetChunkCount() const;
    [[nodiscard]] std::size_t GetChunkLength(std::uint64_t sequence) const;
    [[nodiscard]] std::uint64_t GetInFlight() const;
    [[nodiscard]] Clock::time_point GetLastActivity() const;
    [[nodiscard]] Clock::time_point GetLastTransition() const;

    [[nodiscard]] bool IsTerminal() const;
    [[nodiscard]] bool IsRequester() const;
    [[nodiscard]] bool IsComplete() const;
    [[nodiscard]] Summary GetSummary() const;
    [[nodiscard]] Progress GetProgress(Clock::time_point const& now) const;

    // Supplies the file details a download receiver only learns from the sender's response.
    [[nodiscard]] bool Describe(std::string const& name, std::uint64_t size, std::optional<std::string> const& checksum);

    [[nodiscard]] bool Activate(std::uint64_t offset, Clock::time_point const& now);
    [[nodiscard]] bool Pause(Clock::time_point const& now);
    [[nodiscard]] bool Complete(Clock::time_point const& now);
    [[nodiscard]] bool Fail(Error error, Clock::time_point const& now);
    [[nodiscard]] bool Cancel(std::optional<Error> const& error, Clock::time_point const& now);

    // Sender {
    [[nodiscard]] std::optional<std::uint64_t> GetNextChunk(std::uint32_t window) const;
    void OnChunkSent();
    [[nodiscard]] Acknowledgement Acknowledge(std::uint64_t sequence, Clock::time_point const& now);
    // } Sender

    // Receiver {
    [[nodiscard]] Receipt Validate(std::uint64_t sequence, std::size_t size) const;
    void OnChunkWritten(std::span<std::uint8_t const> data, Clock::time_point const& now);
    [[nodiscard]] std::optional<std::string> FinalizeDigest();
    // } Receiver

private:
    [[nodiscard]] bool Terminate(Status status, std::optional<Error> const& error, Clock::time_point const& now);

    Device::Identifier const m_peer;
    Descriptor m_descriptor;
    std::size_t const m_chunkSize;

    Status m_status;
    std::optional<Error> m_optError;
    std::uint64_t m_acknowledged;
    std::uint64_t m_nextSequence; // The next chunk to be sent or the next chunk expected.
    std::uint64_t m_acknowledgedChunks;

    Clock::time_point m_lastActivity;
    Clock::time_point m_lastTransition;
    Clock::time_point m_activated;
    std::uint64_t m_activatedBytes;

    Checksum m_digest;
};

//----------------------------------------------------------------------------------------------------------------------
