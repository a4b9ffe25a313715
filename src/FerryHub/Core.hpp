//----------------------------------------------------------------------------------------------------------------------
// File: Core.hpp
// Description: Owns and wires together the components of a hub. The core thread creates the components, subscribes
// to their events, and then dispatches the published events until a stop is requested. The network thread runs the
// asio context that drives the sockets, the timers, and every component operation.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Console.hpp"
#include "ExecutionToken.hpp"
#include "Components/Device/Device.hpp"
#include "Components/Discovery/Service.hpp"
#include "Components/Network/Address.hpp"
#include "Utilities/ExecutionStatus.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Forward Declarations
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

namespace Clipboard { class Channel; }
namespace Configuration { class Parser; class DevicePersistor; }
namespace Connection { class Manager; }
namespace Device { class Registry; }
namespace Event { class Publisher; }
namespace Network::WebSocket { class Endpoint; }
namespace Notification { class Channel; }
namespace Pairing { class Manager; }
namespace Route { class Router; }
namespace Transfer { class Engine; class FileStorage; }

//----------------------------------------------------------------------------------------------------------------------
namespace Hub {
//----------------------------------------------------------------------------------------------------------------------

class Core;
class ServiceProvider;

//----------------------------------------------------------------------------------------------------------------------
} // Hub namespace
//----------------------------------------------------------------------------------------------------------------------

class Hub::Core final
{
public:
    // The role of the process. Without a hub target the process listens and advertises as a hub, otherwise it
    // connects to the targeted hub as a peer.
    struct Directives
    {
        bool issueCode = false;
        std::optional<std::string> optHubTarget = {};
        std::optional<std::string> optPairingCode = {};
    };

    Core(
        std::reference_wrapper<ExecutionToken> const& token,
        Configuration::Parser const& parser,
        std::shared_ptr<Configuration::DevicePersistor> const& spPersistor,
        Directives const& directives = {});

    Core(Core const& other) = delete;
    Core(Core&& other) = delete;
    Core& operator=(Core const& other) = delete;
    Core& operator=(Core&& other) = delete;

    ~Core();

    [[nodiscard]] bool IsInitialized() const noexcept;
    [[nodiscard]] bool IsActive() const noexcept;
    [[nodiscard]] bool IsPeerRole() const noexcept;

    // Blocks the calling thread, dispatching events until execution has been stopped.
    [[nodiscard]] ExecutionStatus Startup();
    ExecutionStatus Shutdown(ExecutionStatus reason = ExecutionStatus::RequestedShutdown);

    [[nodiscard]] Device::Details const& GetDeviceDetails() const;

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    void CreateResources(Configuration::Parser const& parser);
    void RegisterRoutes();
    void SubscribeToEvents();

    [[nodiscard]] ExecutionStatus StartComponents();
    [[nodiscard]] bool StartListening();
    [[nodiscard]] bool StartDiscovery();
    [[nodiscard]] bool StartPeerRole();
    void StartNetwork();
    void StopNetwork();

    void OnRuntimeStopped(ExecutionStatus status);
    void OnUnexpectedError();

    [[nodiscard]] boost::asio::awaitable<void> Ticker();
    [[nodiscard]] boost::asio::awaitable<void> Teardown();

    void OnHubDiscovered(Discovery::Change change, Discovery::Record const& record);
    void ConnectToHub(Network::RemoteAddress const& address);

    void OnCommand(Command const& command);
    void Execute(Command const& command);
    void ListPeers() const;
    void IssueCode(Command const& command);
    void PostNotification(Command const& command);
    void ListTransfers(Device::Identifier const& peer) const;

    std::reference_wrapper<ExecutionToken> m_token;
    std::shared_ptr<spdlog::logger> m_logger;
    Directives const m_directives;
    Device::Details m_details;
    Network::BindingAddress m_binding;

    boost::asio::io_context m_context;
    std::optional<WorkGuard> m_optWorkGuard;
    std::unique_ptr<boost::asio::steady_timer> m_upTickTimer;
    bool m_ticking;

    std::shared_ptr<ServiceProvider> m_spServiceProvider;
    std::shared_ptr<Event::Publisher> m_spEventPublisher;
    std::shared_ptr<Route::Router> m_spRouter;
    std::shared_ptr<Device::Registry> m_spRegistry;
    std::shared_ptr<Configuration::DevicePersistor> m_spPersistor;
    std::shared_ptr<Pairing::Manager> m_spPairingManager;
    std::unique_ptr<Network::WebSocket::Endpoint> m_upEndpoint;
    std::shared_ptr<Connection::Manager> m_spConnectionManager;

    ConsoleClipboard m_clipboard;
    ConsoleNotifications m_notifications;
    ConsoleTransferReporter m_reporter;
    std::shared_ptr<Clipboard::Channel> m_spClipboardChannel;
    std::shared_ptr<Notification::Channel> m_spNotificationChannel;
    std::unique_ptr<Transfer::FileStorage> m_upFileStorage;
    std::shared_ptr<Transfer::Engine> m_spTransferEngine;

    bool m_discoveryEnabled;
    std::unique_ptr<Discovery::Service> m_upDiscovery;
    std::optional<Discovery::Service::WatchToken> m_optWatchToken;
    bool m_hubSelected;

    std::unique_ptr<CommandConsole> m_upConsole;
    std::uint64_t m_notificationCount;

    std::jthread m_network;
    std::future<void> m_networkStopped;
    bool m_initialized;
};

//----------------------------------------------------------------------------------------------------------------------
