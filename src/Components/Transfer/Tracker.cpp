//----------------------------------------------------------------------------------------------------------------------
// File: Tracker.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Tracker.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Transfer::Tracker::Tracker(
    Device::Identifier const& peer,
    Descriptor const& descriptor,
    std::size_t chunkSize,
    Clock::time_point const& now)
    : m_peer(peer)
    , m_descriptor(descriptor)
    , m_chunkSize(chunkSize)
    , m_status(Status::Pending)
    , m_optError()
    , m_acknowledged(0)
    , m_nextSequence(0)
    , m_acknowledgedChunks(0)
    , m_lastActivity(now)
    , m_lastTransition(now)
    , m_activated(now)
    , m_activatedBytes(0)
    , m_digest()
{
    assert(m_chunkSize > 0);
}

//----------------------------------------------------------------------------------------------------------------------

Device::Identifier const& Transfer::Tracker::GetPeer() const { return m_peer; }

//----------------------------------------------------------------------------------------------------------------------

Transfer::Identifier const& Transfer::Tracker::GetIdentifier() const { return m_descriptor.identifier; }

//----------------------------------------------------------------------------------------------------------------------

Transfer::Descriptor const& Transfer::Tracker::GetDescriptor() const { return m_descriptor; }

//----------------------------------------------------------------------------------------------------------------------

Transfer::Direction Transfer::Tracker::GetDirection() const { return m_descriptor.direction; }

//----------------------------------------------------------------------------------------------------------------------

Transfer::Role Transfer::Tracker::GetRole() const { return m_descriptor.role; }

//----------------------------------------------------------------------------------------------------------------------

Transfer::Status Transfer::Tracker::GetStatus() const { return m_status; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Transfer::Error> Transfer::Tracker::GetError() const { return m_optError; }

//----------------------------------------------------------------------------------------------------------------------

std::uint64_t Transfer::Tracker::GetSize() const { return m_descriptor.size; }

//----------------------------------------------------------------------------------------------------------------------

std::uint64_t Transfer::Tracker::GetAcknowledged() const { return m_acknowledged; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Transfer::Tracker::GetChunkSize() const { return m_chunkSize; }

//----------------------------------------------------------------------------------------------------------------------

std::uint64_t Transfer::Tracker::GetChunkCount() const
{
    return (m_descriptor.size + m_chunkSize - 1) / m_chunkSize;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Transfer::Tracker::GetChunkLength(std::uint64_t sequence) const
{
    if (sequence >= GetChunkCount()) { return 0; }
    std::uint64_t const offset = sequence * m_chunkSize;
    return static_cast<std::size_t>(std::min<std::uint64_t>(m_chunkSize, m_descriptor.size - offset));
}

//----------------------------------------------------------------------------------------------------------------------

std::uint64_t Transfer::Tracker::GetInFlight() const
{
    if (m_descriptor.role != Role::Sender) { return 0; }
    return m_nextSequence - m_acknowledgedChunks;
}

//----------------------------------------------------------------------------------------------------------------------

Transfer::Clock::time_point Transfer::Tracker::GetLastActivity() const { return m_lastActivity; }

//----------------------------------------------------------------------------------------------------------------------

Transfer::Clock::time_point Transfer::Tracker::GetLastTransition() const { return m_lastTransition; }

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Tracker::IsTerminal() const { return Transfer::IsTerminal(m_status); }

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Tracker::IsRequester() const
{
    // The requester of an upload sends the file, the requester of a download receives it.
    return (m_descriptor.direction == Direction::Upload) == (m_descriptor.role == Role::Sender);
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Tracker::IsComplete() const
{
    return m_acknowledged == m_descriptor.size;
}

//----------------------------------------------------------------------------------------------------------------------

Transfer::Summary Transfer::Tracker::GetSummary() const
{
    return {
        .identifier = m_descriptor.identifier,
        .name = m_descriptor.name,
        .direction = m_descriptor.direction,
        .role = m_descriptor.role,
        .status = m_status,
        .error = m_optError,
        .size = m_descriptor.size,
        .acknowledged = m_acknowledged,
    };
}

//----------------------------------------------------------------------------------------------------------------------

Transfer::Progress Transfer::Tracker::GetProgress(Clock::time_point const& now) const
{
    Progress progress{ .percent = 100.0, .throughput = 0.0, .eta = {} };
    if (m_descriptor.size != 0) {
        progress.percent = static_cast<double>(m_acknowledged) * 100.0 / static_cast<double>(m_descriptor.size);
    }

    auto const elapsed = std::chrono::duration<double>(now - m_activated).count();
    if (m_status == Status::Active && elapsed > 0.0) {
        progress.throughput = static_cast<double>(m_acknowledged - m_activatedBytes) / elapsed;
    }

    if (progress.throughput > 0.0) {
        auto const remaining = static_cast<double>(m_descriptor.size - m_acknowledged);
        progress.eta = std::chrono::seconds{ static_cast<std::int64_t>(remaining / progress.throughput) };
    }

    return progress;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Tracker::Describe(
    std::string const& name, std::uint64_t size, std::optional<std::string> const& checksum)
{
    if (m_status != Status::Pending) { return false; }
    if (!name.empty()) { m_descriptor.name = name; }
    m_descriptor.size = size;
    m_descriptor.checksum = checksum;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Tracker::Activate(std::uint64_t offset, Clock::time_point const& now)
{
    if (m_status != Status::Pending && m_status != Status::Paused) { return false; }
    if (offset > m_descriptor.size) { return false; }

    // Resumption is only possible at a chunk boundary or at the end of the payload.
    if (offset % m_chunkSize != 0 && offset != m_descriptor.size) { return false; }

    if (m_descriptor.role == Role::Sender) {
        // The receiver may have acknowledged chunks whose acknowledgements were lost with the connection.
        if (offset < m_acknowledged) { return false; }
        m_acknowledged = offset;
        m_acknowledgedChunks = m_nextSequence = (offset + m_chunkSize - 1) / m_chunkSize;
    } else {
        // The receiver's position is authoritative. Chunks before it are acknowledged again without being written.
        if (offset > m_acknowledged) { return false; }
        m_nextSequence = m_acknowledged / m_chunkSize;
    }

    m_status = Status::Active;
    m_lastActivity = m_lastTransition = m_activated = now;
    m_activatedBytes = m_acknowledged;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Tracker::Pause(Clock::time_point const& now)
{
    if (m_status != Status::Active && m_status != Status::Pending) { return false; }
    m_status = Status::Paused;
    m_lastTransition = now;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Tracker::Complete(Clock::time_point const& now)
{
    if (m_status != Status::Active || !IsComplete()) { return false; }
    return Terminate(Status::Completed, {}, now);
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Tracker::Fail(Error error, Clock::time_point const& now)
{
    return Terminate(Status::Failed, error, now);
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Tracker::Cancel(std::optional<Error> const& error, Clock::time_point const& now)
{
    return Terminate(Status::Canceled, error, now);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint64_t> Transfer::Tracker::GetNextChunk(std::uint32_t window) const
{
    assert(m_descriptor.role == Role::Sender);
    if (m_status != Status::Active) { return {}; }
    if (m_nextSequence >= GetChunkCount()) { return {}; }
    if (GetInFlight() >= window) { return {}; }
    return m_nextSequence;
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Tracker::OnChunkSent()
{
    assert(m_descriptor.role == Role::Sender && m_nextSequence < GetChunkCount());
    ++m_nextSequence;
}

//----------------------------------------------------------------------------------------------------------------------

Transfer::Tracker::Acknowledgement Transfer::Tracker::Acknowledge(
    std::uint64_t sequence, Clock::time_point const& now)
{
    assert(m_descriptor.role == Role::Sender);
    if (sequence < m_acknowledgedChunks) { return Acknowledgement::Duplicate; }
    if (sequence != m_acknowledgedChunks || sequence >= m_nextSequence) { return Acknowledgement::OutOfSequence; }

    m_acknowledged += GetChunkLength(sequence);
    ++m_acknowledgedChunks;
    m_lastActivity = now;
    return Acknowledgement::Accepted;
}

//----------------------------------------------------------------------------------------------------------------------

Transfer::Tracker::Receipt Transfer::Tracker::Validate(std::uint64_t sequence, std::size_t size) const
{
    assert(m_descriptor.role == Role::Receiver);
    if (sequence < m_nextSequence) { return Receipt::Duplicate; }
    if (sequence > m_nextSequence) { return Receipt::OutOfSequence; }
    if (size == 0 || size != GetChunkLength(sequence)) { return Receipt::InvalidSize; }
    return Receipt::Accepted;
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Tracker::OnChunkWritten(std::span<std::uint8_t const> data, Clock::time_point const& now)
{
    assert(m_descriptor.role == Role::Receiver && data.size() == GetChunkLength(m_nextSequence));
    [[maybe_unused]] bool const updated = m_digest.Update(data); // An invalid digest is reported on finalization.
    m_acknowledged += data.size();
    ++m_nextSequence;
    m_lastActivity = now;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Transfer::Tracker::FinalizeDigest()
{
    return m_digest.Finalize();
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Tracker::Terminate(Status status, std::optional<Error> const& error, Clock::time_point const& now)
{
    assert(Transfer::IsTerminal(status));
    if (IsTerminal()) { return false; }
    m_status = status;
    m_optError = error;
    m_lastTransition = now;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
