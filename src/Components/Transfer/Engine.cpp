//----------------------------------------------------------------------------------------------------------------------
// File: Engine.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Engine.hpp"
#include "Components/Route/MessageHandler.hpp"
#include "Interfaces/FileStorage.hpp"
#include "Interfaces/PeerMessenger.hpp"
#include "Interfaces/TransferObserver.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/hex.hpp>
#include <openssl/rand.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cassert>
#include <iterator>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t IdentifierBytes = 8;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Transfer::Identifier Transfer::GenerateIdentifier()
{
    std::array<std::uint8_t, local::IdentifierBytes> buffer = {};
    if (RAND_bytes(buffer.data(), static_cast<std::int32_t>(buffer.size())) != 1) { return {}; }

    Identifier identifier;
    identifier.reserve(buffer.size() * 2);
    boost::algorithm::hex_lower(buffer.begin(), buffer.end(), std::back_inserter(identifier));
    return identifier;
}

//----------------------------------------------------------------------------------------------------------------------

Transfer::Engine::Engine(
    IPeerMessenger& messenger,
    IFileStorage& storage,
    Event::SharedPublisher const& spEventPublisher,
    Options const& options,
    TimeSource const& time)
    : m_messenger(messenger)
    , m_storage(storage)
    , m_spEventPublisher(spEventPublisher)
    , m_options(options)
    , m_time(time)
    , m_logger(Logger::Get(Logger::Name::Transfer))
    , m_transfers()
    , m_allowances()
    , m_observers()
{
    assert(m_spEventPublisher);
    assert(m_options.chunkSize > 0 && m_options.chunkSize <= Message::MaximumChunkDataSize);
    assert(m_options.window > 0);
    m_spEventPublisher->Advertise(Event::Type::TransferFinished);
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Engine::Register(ITransferObserver* const observer)
{
    assert(observer);
    if (std::ranges::find(m_observers, observer) == m_observers.end()) { m_observers.emplace_back(observer); }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Transfer::Identifier> Transfer::Engine::StartUpload(
    Device::Identifier const& peer, std::string const& fileId)
{
    if (!m_messenger.IsOpen(peer)) {
        m_logger->warn("Unable to start an upload to {}, the peer is not connected.", peer);
        return {};
    }

    auto const optSource = m_storage.Describe(fileId);
    if (!optSource) {
        m_logger->warn("Unable to start an upload of an unknown file ({}).", fileId);
        return {};
    }

    auto const identifier = GenerateIdentifier();
    if (identifier.empty()) { return {}; }

    auto const pTracker = CreateTracker(peer, {
        .identifier = identifier,
        .direction = Direction::Upload,
        .role = Role::Sender,
        .name = optSource->name,
        .size = optSource->size,
        .type = optSource->type,
        .fileId = optSource->fileId,
        .checksum = optSource->checksum,
    });

    Message::FileUploadRequest const request{
        .transferId = identifier,
        .fileName = optSource->name,
        .fileSize = optSource->size,
        .fileType = optSource->type,
        .checksum = optSource->checksum,
        .resume = false,
    };

    if (!m_messenger.Send(peer, request)) {
        m_transfers[peer].erase(identifier);
        return {};
    }

    m_logger->info("Requested an upload of \"{}\" ({} bytes) to {}.", pTracker->GetDescriptor().name, optSource->size, peer);
    return identifier;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Transfer::Identifier> Transfer::Engine::RequestDownload(
    Device::Identifier const& peer, std::string const& fileId)
{
    if (!m_messenger.IsOpen(peer)) {
        m_logger->warn("Unable to request a download from {}, the peer is not connected.", peer);
        return {};
    }

    auto const identifier = GenerateIdentifier();
    if (identifier.empty() || fileId.empty()) { return {}; }

    // The name, size, and checksum of the file are only known once the sender has accepted the request.
    CreateTracker(peer, {
        .identifier = identifier,
        .direction = Direction::Download,
        .role = Role::Receiver,
        .name = fileId,
        .size = 0,
        .type = {},
        .fileId = fileId,
        .checksum = {},
    });

    if (!m_messenger.Send(peer, Message::FileDownloadRequest{ .transferId = identifier, .fileId = fileId })) {
        m_transfers[peer].erase(identifier);
        return {};
    }

    m_logger->info("Requested a download of {} from {}.", fileId, peer);
    return identifier;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Engine::Cancel(Device::Identifier const& peer, Identifier const& identifier)
{
    auto const pTracker = FindTracker(peer, identifier);
    if (!pTracker || !pTracker->Cancel({}, m_time())) { return false; }

    m_logger->info("Canceling the transfer of \"{}\" with {}.", pTracker->GetDescriptor().name, peer);
    if (m_messenger.IsOpen(peer) && !m_messenger.Send(peer, Message::CancelTransfer{ .transferId = identifier })) {
        m_logger->debug("Unable to notify {} of the cancellation.", peer);
    }

    OnCanceled(*pTracker);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Engine::Handle(Route::Context const& context, Message::FileUploadRequest const& request)
{
    auto const& peer = context.GetPeer();
    auto const now = m_time();

    if (auto const pTracker = FindTracker(peer, request.transferId); pTracker) {
        if (!pTracker->IsTerminal()) {
            bool const resumable = request.resume &&
                pTracker->GetStatus() == Status::Paused &&
                pTracker->GetRole() == Role::Receiver &&
                pTracker->GetSize() == request.fileSize;

            auto const offset = pTracker->GetAcknowledged();
            if (!resumable || !pTracker->Activate(offset, now)) {
                Message::FileTransferResponse const response{
                    .transferId = request.transferId,
                    .accept = false,
                    .message = "The transfer identifier is already in use.",
                };
                [[maybe_unused]] bool const replied = context.Reply(response);
                return true;
            }

            m_logger->info("Resuming the upload of \"{}\" from {} at {} bytes.", pTracker->GetDescriptor().name, peer, offset);
            [[maybe_unused]] bool const replied = context.Reply(Message::FileTransferResponse{
                .transferId = request.transferId, .accept = true, .offset = offset });
            if (pTracker->IsComplete()) { FinalizeReceipt(*pTracker); }
            return true;
        }

        // The receiver may have completed the transfer after the sender lost the final acknowledgements.
        bool const finished = request.resume &&
            pTracker->GetStatus() == Status::Completed &&
            pTracker->GetRole() == Role::Receiver &&
            pTracker->GetSize() == request.fileSize;

        if (!finished) {
            [[maybe_unused]] bool const replied = context.Reply(Message::FileTransferResponse{
                .transferId = request.transferId,
                .accept = false,
                .message = "The transfer identifier has already been used.",
            });
            return true;
        }

        m_logger->info("The upload of \"{}\" from {} was completed before the connection was lost.",
            pTracker->GetDescriptor().name, peer);
        [[maybe_unused]] bool const replied = context.Reply(Message::FileTransferResponse{
            .transferId = request.transferId, .accept = true, .offset = pTracker->GetSize() });
        SendUpdate(*pTracker);
        return true;
    }

    if (!m_storage.Open(peer, request.transferId, request.fileName, request.fileSize)) {
        m_logger->warn("Rejected the upload of \"{}\" from {}, the file could not be stored.", request.fileName, peer);
        [[maybe_unused]] bool const replied = context.Reply(Message::FileTransferResponse{
            .transferId = request.transferId, .accept = false, .message = "The file could not be stored." });
        return true;
    }

    auto const pTracker = CreateTracker(peer, {
        .identifier = request.transferId,
        .direction = Direction::Upload,
        .role = Role::Receiver,
        .name = request.fileName,
        .size = request.fileSize,
        .type = request.fileType,
        .fileId = {},
        .checksum = request.checksum,
    });

    [[maybe_unused]] bool const activated = pTracker->Activate(0, now);
    assert(activated);

    m_logger->info("Accepted the upload of \"{}\" ({} bytes) from {}.", request.fileName, request.fileSize, peer);
    if (!context.Reply(Message::FileTransferResponse{
        .transferId = request.transferId, .accept = true, .offset = std::uint64_t{ 0 } })) {
        m_logger->debug("Unable to answer the upload request from {}.", peer);
    }

    if (pTracker->IsComplete()) { FinalizeReceipt(*pTracker); } // An empty file has nothing to wait for.
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Engine::Handle(Route::Context const& context, Message::FileDownloadRequest const& request)
{
    auto const& peer = context.GetPeer();
    auto const now = m_time();

    if (auto const pTracker = FindTracker(peer, request.transferId); pTracker) {
        if (!pTracker->IsTerminal()) {
            bool const resumable = pTracker->GetStatus() == Status::Paused &&
                pTracker->GetRole() == Role::Sender &&
                pTracker->GetDescriptor().fileId == request.fileId;

            auto const offset = pTracker->GetAcknowledged();
            if (!resumable || !pTracker->Activate(offset, now)) {
                [[maybe_unused]] bool const replied = context.Reply(Message::FileTransferResponse{
                    .transferId = request.transferId,
                    .accept = false,
                    .message = "The transfer identifier is already in use.",
                });
                return true;
            }

            auto const& descriptor = pTracker->GetDescriptor();
            m_logger->info("Resuming the download of \"{}\" by {} at {} bytes.", descriptor.name, peer, offset);
            [[maybe_unused]] bool const replied = context.Reply(Message::FileTransferResponse{
                .transferId = request.transferId,
                .accept = true,
                .offset = offset,
                .fileName = descriptor.name,
                .fileSize = descriptor.size,
                .checksum = descriptor.checksum,
            });
            Pump(peer);
            return true;
        }

        [[maybe_unused]] bool const replied = context.Reply(Message::FileTransferResponse{
            .transferId = request.transferId,
            .accept = false,
            .message = "The transfer identifier has already been used.",
        });
        return true;
    }

    auto const optSource = m_storage.Describe(request.fileId);
    if (!optSource) {
        m_logger->warn("Rejected a download of an unknown file ({}) by {}.", request.fileId, peer);
        [[maybe_unused]] bool const replied = context.Reply(Message::FileTransferResponse{
            .transferId = request.transferId, .accept = false, .message = "The requested file is not available." });
        return true;
    }

    auto const pTracker = CreateTracker(peer, {
        .identifier = request.transferId,
        .direction = Direction::Download,
        .role = Role::Sender,
        .name = optSource->name,
        .size = optSource->size,
        .type = optSource->type,
        .fileId = optSource->fileId,
        .checksum = optSource->checksum,
    });

    [[maybe_unused]] bool const activated = pTracker->Activate(0, now);
    assert(activated);

    m_logger->info("Accepted the download of \"{}\" ({} bytes) by {}.", optSource->name, optSource->size, peer);
    if (!context.Reply(Message::FileTransferResponse{
        .transferId = request.transferId,
        .accept = true,
        .offset = std::uint64_t{ 0 },
        .fileName = optSource->name,
        .fileSize = optSource->size,
        .checksum = optSource->checksum,
    })) {
        m_logger->debug("Unable to answer the download request from {}.", peer);
    }

    Pump(peer);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Engine::Handle(Route::Context const& context, Message::FileTransferResponse const& response)
{
    auto const& peer = context.GetPeer();
    auto const pTracker = FindTracker(peer, response.transferId);
    if (!pTracker || !pTracker->IsRequester()) {
        m_logger->debug("Received a response for an unknown transfer from {}.", peer);
        return false;
    }

    auto const status = pTracker->GetStatus();
    if (status != Status::Pending && status != Status::Paused) {
        m_logger->debug("Received an unexpected response for a {} transfer from {}.", StatusToString(status), peer);
        return false;
    }

    if (!response.accept) {
        m_logger->warn("{} rejected the transfer of \"{}\": {}.",
            peer, pTracker->GetDescriptor().name, response.message.value_or("no reason given"));
        Fail(*pTracker, Error::PeerRejected, false, response.message);
        return true;
    }

    if (pTracker->GetRole() == Role::Receiver && status == Status::Pending) {
        if (!response.fileSize) {
            Fail(*pTracker, Error::ProtocolViolation, true, "The response did not describe the file.");
            return true;
        }

        auto const name = response.fileName.value_or(pTracker->GetDescriptor().name);
        [[maybe_unused]] bool const described = pTracker->Describe(name, *response.fileSize, response.checksum);
        if (!m_storage.Open(peer, response.transferId, pTracker->GetDescriptor().name, *response.fileSize)) {
            Fail(*pTracker, Error::IoFailure, true, "The file could not be stored.");
            return true;
        }
    }

    auto const offset = response.offset.value_or(0);
    if (!pTracker->Activate(offset, m_time())) {
        Fail(*pTracker, Error::ProtocolViolation, true, "The resume offset is not valid.");
        return true;
    }

    m_logger->info("{} accepted the transfer of \"{}\"{}.", peer, pTracker->GetDescriptor().name,
        offset != 0 ? fmt::format(", resuming at {} bytes", offset) : "");

    if (pTracker->GetRole() == Role::Sender) {
        Pump(peer);
    } else if (pTracker->IsComplete()) {
        FinalizeReceipt(*pTracker);
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Engine::Handle(Route::Context const& context, Message::ChunkAck const& acknowledgement)
{
    auto const& peer = context.GetPeer();
    auto const pTracker = FindTracker(peer, acknowledgement.transferId);
    if (!pTracker || pTracker->GetRole() != Role::Sender) {
        m_logger->debug("Received an acknowledgement for an unknown transfer from {}.", peer);
        return false;
    }

    // Acknowledgements that were in flight when the transfer was paused or finished are ignored.
    if (pTracker->GetStatus() != Status::Active) { return true; }

    switch (pTracker->Acknowledge(acknowledgement.sequence, m_time())) {
        case Tracker::Acknowledgement::Accepted: {
            OnProgress(*pTracker);
            Pump(peer);
        } break;
        case Tracker::Acknowledgement::Duplicate: break;
        case Tracker::Acknowledgement::OutOfSequence: {
            m_logger->warn("Received an out of sequence acknowledgement ({}) from {}.", acknowledgement.sequence, peer);
            Fail(*pTracker, Error::ProtocolViolation, true, "Chunk acknowledged out of sequence.");
        } break;
        default: assert(false); break;
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Engine::Handle(Route::Context const& context, Message::TransferUpdate const& update)
{
    auto const& peer = context.GetPeer();
    auto const pTracker = FindTracker(peer, update.transferId);
    if (!pTracker || pTracker->IsTerminal()) { return true; }

    switch (update.status) {
        case Status::Completed: {
            if (pTracker->GetRole() != Role::Sender) { break; } // The receiver decides when it has completed.
            // A paused sender may have lost the final acknowledgements with the previous connection.
            if (pTracker->GetStatus() == Status::Paused) {
                [[maybe_unused]] bool const activated = pTracker->Activate(update.bytesTransferred, m_time());
            }
            if (!pTracker->Complete(m_time())) {
                Fail(*pTracker, Error::ProtocolViolation, true, "Completed before all chunks were acknowledged.");
                break;
            }
            OnFinished(*pTracker);
        } break;
        case Status::Failed: {
            Fail(*pTracker, update.reason.value_or(Error::IoFailure), false, update.message);
        } break;
        case Status::Canceled: {
            if (pTracker->Cancel(Error::PeerCanceled, m_time())) { OnCanceled(*pTracker); }
        } break;
        case Status::Pending:
        case Status::Active:
        case Status::Paused: {
            m_logger->debug("{} reports \"{}\" at {:.1f}%.", peer, pTracker->GetDescriptor().name, update.progress);
        } break;
        default: assert(false); break;
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Engine::Handle(Route::Context const& context, Message::CancelTransfer const& cancel)
{
    auto const& peer = context.GetPeer();
    auto const pTracker = FindTracker(peer, cancel.transferId);
    if (!pTracker) {
        m_logger->debug("Received a cancellation for an unknown transfer from {}.", peer);
        return false;
    }

    // The cancellation is observed at the next chunk boundary, any chunk that arrives afterwards is dropped.
    if (pTracker->Cancel(Error::PeerCanceled, m_time())) {
        m_logger->info("{} canceled the transfer of \"{}\".", peer, pTracker->GetDescriptor().name);
        OnCanceled(*pTracker);
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Engine::Handle(Route::Context const& context, Message::Chunk const& chunk)
{
    auto const& peer = context.GetPeer();
    auto const pTracker = FindTracker(peer, chunk.transferId);
    if (!pTracker) {
        m_logger->debug("Dropped a chunk for an unknown transfer from {}.", peer);
        return false;
    }

    if (pTracker->GetRole() != Role::Receiver) {
        Fail(*pTracker, Error::ProtocolViolation, true, "Chunk received by the sender.");
        return false;
    }

    if (pTracker->GetStatus() != Status::Active) {
        m_logger->trace("Dropped chunk {} of a {} transfer.", chunk.sequence, StatusToString(pTracker->GetStatus()));
        return true;
    }

    Accept(context, *pTracker, chunk);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Engine::OnPeerConnected(Device::Identifier const& peer)
{
    auto const itr = m_transfers.find(peer);
    if (itr == m_transfers.end()) { return; }

    // Only the requester of a transfer re-announces it, the other side waits for the request.
    for (auto& [identifier, tracker] : itr->second) {
        if (!tracker.IsRequester()) { continue; }

        // A completed download is reported again, its final update may have been lost with the connection.
        if (tracker.GetStatus() == Status::Completed && tracker.GetRole() == Role::Receiver) {
            SendUpdate(tracker);
            continue;
        }

        if (tracker.GetStatus() != Status::Paused) { continue; }

        auto const& descriptor = tracker.GetDescriptor();
        bool sent = false;
        if (tracker.GetRole() == Role::Sender) {
            sent = m_messenger.Send(peer, Message::FileUploadRequest{
                .transferId = identifier,
                .fileName = descriptor.name,
                .fileSize = descriptor.size,
                .fileType = descriptor.type,
                .checksum = descriptor.checksum,
                .resume = true,
            });
        } else {
            sent = m_messenger.Send(peer, Message::FileDownloadRequest{
                .transferId = identifier, .fileId = descriptor.fileId });
        }

        if (sent) { m_logger->info("Requested the resumption of \"{}\" with {}.", descriptor.name, peer); }
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Engine::OnPeerDisconnected(Device::Identifier const& peer, Connection::Cause cause)
{
    m_allowances.erase(peer);

    auto const itr = m_transfers.find(peer);
    if (itr == m_transfers.end()) { return; }

    bool const resumable = m_options.resumable &&
        cause != Connection::Cause::Unpaired && cause != Connection::Cause::Shutdown;

    auto const now = m_time();
    for (auto& [identifier, tracker] : itr->second) {
        if (tracker.IsTerminal()) { continue; }
        if (resumable && tracker.Pause(now)) {
            m_logger->info("Paused the transfer of \"{}\" at {} bytes.", tracker.GetDescriptor().name, tracker.GetAcknowledged());
            continue;
        }
        Fail(tracker, Error::IoFailure, false, "The connection was lost.");
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Engine::Tick()
{
    auto const now = m_time();
    for (auto& [peer, trackers] : m_transfers) {
        for (auto itr = trackers.begin(); itr != trackers.end(); ) {
            auto& tracker = itr->second;
            switch (tracker.GetStatus()) {
                case Status::Pending:
                case Status::Active: {
                    if (now - tracker.GetLastActivity() >= m_options.stallTimeout) {
                        m_logger->warn("The transfer of \"{}\" with {} has stalled.", tracker.GetDescriptor().name, peer);
                        Fail(tracker, Error::IoFailure, true, "The transfer stalled.");
                    }
                } break;
                case Status::Paused: {
                    if (now - tracker.GetLastTransition() >= m_options.resumeTimeout) {
                        Fail(tracker, Error::IoFailure, false, "The transfer was not resumed.");
                    }
                } break;
                default: break;
            }

            if (tracker.IsTerminal() && now - tracker.GetLastTransition() >= m_options.gracePeriod) {
                itr = trackers.erase(itr);
                continue;
            }
            ++itr;
        }
    }

    std::erase_if(m_transfers, [] (auto const& entry) { return entry.second.empty(); });

    std::vector<Device::Identifier> peers;
    peers.reserve(m_transfers.size());
    for (auto const& [peer, trackers] : m_transfers) { peers.emplace_back(peer); }
    for (auto const& peer : peers) { Pump(peer); }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Transfer::Summary> Transfer::Engine::Find(
    Device::Identifier const& peer, Identifier const& identifier) const
{
    auto const itr = m_transfers.find(peer);
    if (itr == m_transfers.end()) { return {}; }
    auto const jtr = itr->second.find(identifier);
    if (jtr == itr->second.end()) { return {}; }
    return jtr->second.GetSummary();
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Transfer::Summary> Transfer::Engine::GetSummaries(Device::Identifier const& peer) const
{
    std::vector<Summary> summaries;
    if (auto const itr = m_transfers.find(peer); itr != m_transfers.end()) {
        for (auto const& [identifier, tracker] : itr->second) { summaries.emplace_back(tracker.GetSummary()); }
    }
    return summaries;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Transfer::Engine::GetActiveCount() const
{
    std::size_t count = 0;
    for (auto const& [peer, trackers] : m_transfers) {
        count += static_cast<std::size_t>(std::ranges::count_if(trackers, [] (auto const& entry) {
            return entry.second.GetStatus() == Status::Active;
        }));
    }
    return count;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Transfer::Engine::Size() const
{
    std::size_t size = 0;
    for (auto const& [peer, trackers] : m_transfers) { size += trackers.size(); }
    return size;
}

//----------------------------------------------------------------------------------------------------------------------

Transfer::Engine::Options const& Transfer::Engine::GetOptions() const
{
    return m_options;
}

//----------------------------------------------------------------------------------------------------------------------

Transfer::Tracker* Transfer::Engine::FindTracker(Device::Identifier const& peer, Identifier const& identifier)
{
    auto const itr = m_transfers.find(peer);
    if (itr == m_transfers.end()) { return nullptr; }
    auto const jtr = itr->second.find(identifier);
    if (jtr == itr->second.end()) { return nullptr; }
    return &jtr->second;
}

//----------------------------------------------------------------------------------------------------------------------

Transfer::Tracker* Transfer::Engine::CreateTracker(Device::Identifier const& peer, Descriptor const& descriptor)
{
    auto& trackers = m_transfers[peer];
    auto const [itr, emplaced] = trackers.try_emplace(descriptor.identifier, peer, descriptor, m_options.chunkSize, m_time());
    assert(emplaced);
    return &itr->second;
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Engine::Pump(Device::Identifier const& peer)
{
    auto const itr = m_transfers.find(peer);
    if (itr == m_transfers.end()) { return; }

    // Each pass sends at most one chunk per transfer so that concurrent transfers share the connection evenly.
    bool progressed = true;
    while (progressed) {
        progressed = false;
        for (auto& [identifier, tracker] : itr->second) {
            if (tracker.GetRole() != Role::Sender || tracker.GetStatus() != Status::Active) { continue; }
            if (SendNextChunk(tracker)) { progressed = true; }
        }
    }
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Engine::SendNextChunk(Tracker& tracker)
{
    auto const optSequence = tracker.GetNextChunk(m_options.window);
    if (!optSequence) { return false; }

    auto const& peer = tracker.GetPeer();
    auto const length = tracker.GetChunkLength(*optSequence);
    if (!ConsumeAllowance(peer, length)) { return false; }

    auto const& descriptor = tracker.GetDescriptor();
    auto optData = m_storage.Read(descriptor.fileId, *optSequence * tracker.GetChunkSize(), length);
    if (!optData || optData->size() != length) {
        m_logger->error("Unable to read chunk {} of \"{}\".", *optSequence, descriptor.name);
        Fail(tracker, Error::IoFailure, true, "The file could not be read.");
        return false;
    }

    Message::Chunk chunk{ .transferId = descriptor.identifier, .sequence = *optSequence, .data = std::move(*optData) };
    if (!m_messenger.Send(peer, chunk)) { return false; }

    tracker.OnChunkSent();
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Engine::ConsumeAllowance(Device::Identifier const& peer, std::size_t bytes)
{
    if (m_options.rateLimit == 0) { return true; }

    auto const now = m_time();
    auto const rate = static_cast<double>(m_options.rateLimit);
    auto const burst = std::max(rate, static_cast<double>(m_options.chunkSize));

    auto [itr, emplaced] = m_allowances.try_emplace(peer, Allowance{ .tokens = burst, .refilled = now });
    auto& allowance = itr->second;
    auto const elapsed = std::chrono::duration<double>(now - allowance.refilled).count();
    allowance.tokens = std::min(burst, allowance.tokens + elapsed * rate);
    allowance.refilled = now;

    if (allowance.tokens < static_cast<double>(bytes)) { return false; }
    allowance.tokens -= static_cast<double>(bytes);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Engine::Accept(Route::Context const& context, Tracker& tracker, Message::Chunk const& chunk)
{
    auto const& peer = context.GetPeer();
    Message::ChunkAck const acknowledgement{ .transferId = chunk.transferId, .sequence = chunk.sequence };

    switch (tracker.Validate(chunk.sequence, chunk.data.size())) {
        case Tracker::Receipt::Accepted: break;
        case Tracker::Receipt::Duplicate: {
            // The chunk was written before the connection was lost, only the acknowledgement is repeated.
            [[maybe_unused]] bool const sent = m_messenger.Send(peer, acknowledgement);
        } return;
        case Tracker::Receipt::OutOfSequence: {
            m_logger->warn("Received chunk {} of \"{}\" out of sequence.", chunk.sequence, tracker.GetDescriptor().name);
            Fail(tracker, Error::ProtocolViolation, true, "Chunk received out of sequence.");
        } return;
        case Tracker::Receipt::InvalidSize: {
            m_logger->warn("Received chunk {} of \"{}\" with an invalid size.", chunk.sequence, tracker.GetDescriptor().name);
            Fail(tracker, Error::ProtocolViolation, true, "Chunk size is not valid.");
        } return;
        default: assert(false); return;
    }

    auto const offset = chunk.sequence * tracker.GetChunkSize();
    if (!m_storage.Write(peer, chunk.transferId, offset, chunk.data)) {
        m_logger->error("Unable to write chunk {} of \"{}\".", chunk.sequence, tracker.GetDescriptor().name);
        Fail(tracker, Error::IoFailure, true, "The file could not be written.");
        return;
    }

    tracker.OnChunkWritten(chunk.data, m_time());
    if (!m_messenger.Send(peer, acknowledgement)) {
        m_logger->debug("Unable to acknowledge chunk {} to {}.", chunk.sequence, peer);
    }

    OnProgress(tracker);

    if (tracker.IsComplete()) {
        FinalizeReceipt(tracker);
    } else if ((chunk.sequence + 1) % m_options.progressInterval == 0) {
        SendUpdate(tracker);
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Engine::FinalizeReceipt(Tracker& tracker)
{
    assert(tracker.GetRole() == Role::Receiver && tracker.IsComplete());

    auto const& descriptor = tracker.GetDescriptor();
    auto const optDigest = tracker.FinalizeDigest();
    if (descriptor.checksum) {
        if (!optDigest || !Checksum::IsMatching(*descriptor.checksum, *optDigest)) {
            m_logger->warn("The checksum of \"{}\" does not match the announced checksum.", descriptor.name);
            Fail(tracker, Error::ChecksumMismatch, true, "The checksum does not match.");
            return;
        }
    }

    if (!m_storage.Commit(tracker.GetPeer(), descriptor.identifier)) {
        Fail(tracker, Error::IoFailure, true, "The file could not be saved.");
        return;
    }

    [[maybe_unused]] bool const completed = tracker.Complete(m_time());
    assert(completed);
    SendUpdate(tracker);
    OnFinished(tracker);
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Engine::SendUpdate(Tracker& tracker, std::optional<std::string> const& message)
{
    auto const progress = tracker.GetProgress(m_time());
    Message::TransferUpdate const update{
        .transferId = tracker.GetIdentifier(),
        .progress = progress.percent,
        .status = tracker.GetStatus(),
        .bytesTransferred = tracker.GetAcknowledged(),
        .message = message,
        .reason = tracker.GetError(),
    };

    if (!m_messenger.Send(tracker.GetPeer(), update)) {
        m_logger->debug("Unable to send a transfer update to {}.", tracker.GetPeer());
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Engine::Fail(Tracker& tracker, Error error, bool notify, std::optional<std::string> const& message)
{
    if (!tracker.Fail(error, m_time())) { return; }
    if (notify) { SendUpdate(tracker, message); }
    if (tracker.GetRole() == Role::Receiver) { m_storage.Discard(tracker.GetPeer(), tracker.GetIdentifier()); }
    OnFinished(tracker);
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Engine::OnCanceled(Tracker& tracker)
{
    assert(tracker.GetStatus() == Status::Canceled);
    if (tracker.GetRole() == Role::Receiver) { m_storage.Discard(tracker.GetPeer(), tracker.GetIdentifier()); }
    OnFinished(tracker);
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Engine::OnFinished(Tracker& tracker)
{
    assert(tracker.IsTerminal());
    auto const summary = tracker.GetSummary();
    auto const& peer = tracker.GetPeer();

    if (summary.status == Status::Completed) {
        m_logger->info("The {} of \"{}\" with {} has completed.", DirectionToString(summary.direction), summary.name, peer);
    } else {
        m_logger->warn("The {} of \"{}\" with {} has {}{}.", DirectionToString(summary.direction), summary.name, peer,
            StatusToString(summary.status),
            summary.error ? fmt::format(" ({})", ErrorToString(*summary.error)) : "");
    }

    for (auto const observer : m_observers) { observer->OnTransferFinished(peer, summary); }
    m_spEventPublisher->Publish<Event::Type::TransferFinished>(peer, summary);
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::Engine::OnProgress(Tracker& tracker)
{
    if (m_observers.empty()) { return; }
    auto const summary = tracker.GetSummary();
    auto const progress = tracker.GetProgress(m_time());
    for (auto const observer : m_observers) { observer->OnTransferProgress(tracker.GetPeer(), summary, progress); }
}

//----------------------------------------------------------------------------------------------------------------------
