//----------------------------------------------------------------------------------------------------------------------
// File: Engine.hpp
// Description: Manages the chunked file transfers of every connection. Each transfer is an independent state machine;
// many transfers may be active on one connection and each keeps its own accounting. Senders never have more than a
// window of unacknowledged chunks outstanding and acknowledgements are only accepted in sequence.
// The engine performs no I/O of its own. Frames leave through the peer messenger, bytes are read from and written to
// the storage collaborator, and time is supplied by the time source so the engine is driven entirely by its callers.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Status.hpp"
#include "Tracker.hpp"
#include "Components/Device/Device.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Message/Chunk.hpp"
#include "Components/Message/Messages.hpp"
#include "Interfaces/PeerObserver.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IFileStorage;
class IPeerMessenger;
class ITransferObserver;

namespace spdlog { class logger; }
namespace Route { class Context; }

//----------------------------------------------------------------------------------------------------------------------
namespace Transfer {
//----------------------------------------------------------------------------------------------------------------------

class Engine;

[[nodiscard]] Identifier GenerateIdentifier();

//----------------------------------------------------------------------------------------------------------------------
} // Transfer namespace
//----------------------------------------------------------------------------------------------------------------------

class Transfer::Engine : public IPeerObserver
{
public:
    using TimeSource = std::function<Clock::time_point()>;

    struct Options
    {
        std::size_t chunkSize = 64 * 1024;
        std::uint32_t window = 8;
        bool resumable = true;
        std::uint64_t rateLimit = 0; // Bytes per second across all transfers of a connection, zero is unlimited.
        std::chrono::milliseconds gracePeriod = std::chrono::seconds{ 60 };
        std::chrono::milliseconds stallTimeout = std::chrono::seconds{ 30 };
        std::chrono::milliseconds resumeTimeout = std::chrono::minutes{ 5 };
        std::uint32_t progressInterval = 16;
    };

    Engine(
        IPeerMessenger& messenger,
        IFileStorage& storage,
        Event::SharedPublisher const& spEventPublisher,
        Options const& options,
        TimeSource const& time = &Clock::now);

    Engine(Engine const&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine const&) = delete;
    Engine& operator=(Engine&&) = delete;

    void Register(ITransferObserver* const observer);

    // Local Requests {
    [[nodiscard]] std::optional<Identifier> StartUpload(Device::Identifier const& peer, std::string const& fileId);
    [[nodiscard]] std::optional<Identifier> RequestDownload(Device::Identifier const& peer, std::string const& fileId);
    [[nodiscard]] bool Cancel(Device::Identifier const& peer, Identifier const& identifier);
    // } Local Requests

    // Route Handlers {
    [[nodiscard]] bool Handle(Route::Context const& context, Message::FileUploadRequest const& request);
    [[nodiscard]] bool Handle(Route::Context const& context, Message::FileDownloadRequest const& request);
    [[nodiscard]] bool Handle(Route::Context const& context, Message::FileTransferResponse const& response);
    [[nodiscard]] bool Handle(Route::Context const& context, Message::ChunkAck const& acknowledgement);
    [[nodiscard]] bool Handle(Route::Context const& context, Message::TransferUpdate const& update);
    [[nodiscard]] bool Handle(Route::Context const& context, Message::CancelTransfer const& cancel);
    [[nodiscard]] bool Handle(Route::Context const& context, Message::Chunk const& chunk);
    // } Route Handlers

    // IPeerObserver {
    virtual void OnPeerConnected(Device::Identifier const& peer) override;
    virtual void OnPeerDisconnected(Device::Identifier const& peer, Connection::Cause cause) override;
    // } IPeerObserver

    // Detects stalled and abandoned transfers, evicts finished transfers after the grace period, and resumes the
    // senders held back by the rate limit.
    void Tick();

    [[nodiscard]] std::optional<Summary> Find(Device::Identifier const& peer, Identifier const& identifier) const;
    [[nodiscard]] std::vector<Summary> GetSummaries(Device::Identifier const& peer) const;
    [[nodiscard]] std::size_t GetActiveCount() const;
    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] Options const& GetOptions() const;

private:
    using Trackers = std::map<Identifier, Tracker>;

    struct Allowance
    {
        double tokens;
        Clock::time_point refilled;
    };

    [[nodiscard]] Tracker* FindTracker(Device::Identifier const& peer, Identifier const& identifier);
    [[nodiscard]] Tracker* CreateTracker(Device::Identifier const& peer, Descriptor const& descriptor);

    void Pump(Device::Identifier const& peer);
    [[nodiscard]] bool SendNextChunk(Tracker& tracker);
    [[nodiscard]] bool ConsumeAllowance(Device::Identifier const& peer, std::size_t bytes);

    void Accept(Route::Context const& context, Tracker& tracker, Message::Chunk const& chunk);
    void FinalizeReceipt(Tracker& tracker);
    void SendUpdate(Tracker& tracker, std::optional<std::string> const& message = {});

    void Fail(Tracker& tracker, Error error, bool notify, std::optional<std::string> const& message = {});
    void OnCanceled(Tracker& tracker);
    void OnFinished(Tracker& tracker);
    void OnProgress(Tracker& tracker);

    IPeerMessenger& m_messenger;
    IFileStorage& m_storage;
    Event::SharedPublisher const m_spEventPublisher;
    Options const m_options;
    TimeSource const m_time;
    std::shared_ptr<spdlog::logger> m_logger;

    std::unordered_map<Device::Identifier, Trackers> m_transfers;
    std::unordered_map<Device::Identifier, Allowance> m_allowances;
    std::vector<ITransferObserver*> m_observers;
};

//----------------------------------------------------------------------------------------------------------------------
