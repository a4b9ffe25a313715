//----------------------------------------------------------------------------------------------------------------------
// File: Core.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Core.hpp"
#include "StartupOptions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Clipboard/Channel.hpp"
#include "Components/Configuration/DevicePersistor.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Connection/Manager.hpp"
#include "Components/Core/ServiceProvider.hpp"
#include "Components/Device/Registry.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Network/Address.hpp"
#include "Components/Network/WebSocket/Endpoint.hpp"
#include "Components/Notification/Channel.hpp"
#include "Components/Pairing/Manager.hpp"
#include "Components/Route/Delegate.hpp"
#include "Components/Route/Router.hpp"
#include "Components/Transfer/Engine.hpp"
#include "Components/Transfer/FileStorage.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/TimeUtils.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <charconv>
#include <iostream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr auto TickInterval = std::chrono::milliseconds{ 50 };
constexpr auto DispatchInterval = std::chrono::milliseconds{ 25 };
constexpr auto DrainPeriod = std::chrono::milliseconds{ 250 };
constexpr auto ShutdownTimeout = std::chrono::seconds{ 3 };

template<typename MessageType, typename ServiceType>
void RegisterRoute(Route::Router& router)
{
    [[maybe_unused]] bool const success = router.Register<Route::Delegate<MessageType, ServiceType>>(MessageType::Type);
    assert(success); // The message types are unique and should always register.
}

[[nodiscard]] std::optional<std::chrono::seconds> ParseLifetime(std::string const& value);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Hub::Core::Core(
    std::reference_wrapper<ExecutionToken> const& token,
    Configuration::Parser const& parser,
    std::shared_ptr<Configuration::DevicePersistor> const& spPersistor,
    Directives const& directives)
    : m_token(token)
    , m_logger(Logger::Get(Logger::Name::Core))
    , m_directives(directives)
    , m_details()
    , m_binding()
    , m_context()
    , m_optWorkGuard()
    , m_upTickTimer()
    , m_ticking(false)
    , m_spServiceProvider(std::make_shared<ServiceProvider>())
    , m_spEventPublisher(std::make_shared<Event::Publisher>())
    , m_spRouter(std::make_shared<Route::Router>())
    , m_spRegistry(std::make_shared<Device::Registry>())
    , m_spPersistor(spPersistor)
    , m_spPairingManager()
    , m_upEndpoint()
    , m_spConnectionManager()
    , m_clipboard()
    , m_notifications()
    , m_reporter()
    , m_spClipboardChannel()
    , m_spNotificationChannel()
    , m_upFileStorage()
    , m_spTransferEngine()
    , m_discoveryEnabled(false)
    , m_upDiscovery()
    , m_optWatchToken()
    , m_hubSelected(false)
    , m_upConsole()
    , m_notificationCount(0)
    , m_network()
    , m_networkStopped()
    , m_initialized(false)
{
    assert(m_logger);
    assert(parser.Validated());
    CreateResources(parser);
}

//----------------------------------------------------------------------------------------------------------------------

Hub::Core::~Core()
{
    // Note: The ResourceShutdown status is a variant of RequestedShutdown that indicates the runtime shouldn't
    // attempt to use resources that may have been destroyed.
    Shutdown(ExecutionStatus::ResourceShutdown);
    StopNetwork(); // The network thread must be joined before the components it operates on are destroyed.
    if (m_spPersistor) { m_spPersistor->SetRegistry(nullptr); }
}

//----------------------------------------------------------------------------------------------------------------------

bool Hub::Core::IsInitialized() const noexcept { return m_initialized; }

//----------------------------------------------------------------------------------------------------------------------

bool Hub::Core::IsActive() const noexcept { return m_token.get().IsExecutionActive(); }

//----------------------------------------------------------------------------------------------------------------------

bool Hub::Core::IsPeerRole() const noexcept { return m_directives.optHubTarget.has_value(); }

//----------------------------------------------------------------------------------------------------------------------

ExecutionStatus Hub::Core::Startup()
{
    if (m_token.get().Status() != ExecutionStatus::Standby) { return ExecutionStatus::AlreadyStarted; }

    // If we fail to prepare for the execution, return the reason why.
    if (auto const result = StartComponents(); result != ExecutionStatus::Standby) {
        StopNetwork();
        m_token.get().OnExecutionStopped({});
        return result;
    }

    m_logger->debug("Starting the hub's core runtime.");
    m_token.get().OnExecutionStarted({});

    // Note: The runtime can be stopped by a signal, a console request, or an unexpected error on the network thread.
    // Each of these set the cause through the execution token.
    while (m_token.get().IsExecutionRequested()) {
        m_spEventPublisher->Dispatch();
        std::this_thread::sleep_for(local::DispatchInterval);
    }

    auto const result = m_token.get().Status();
    m_logger->debug("Stopping the hub's core runtime.");
    m_token.get().OnExecutionStopped({});
    OnRuntimeStopped(result);
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

ExecutionStatus Hub::Core::Shutdown(ExecutionStatus reason)
{
    #if !defined(NDEBUG)
    auto const IsTokenInExpectedState = [reason] (bool success, ExecutionToken const& token) -> bool
    {
        // If we are the first to request the stop, then the token's status should match the reason. Otherwise, a
        // non-executing state is expected (e.g. we have already stopped due to a prior shutdown request).
        if (auto const status = token.Status(); success) { return status == reason; }
        else { return status != ExecutionStatus::Executing; }
    };
    #endif

    [[maybe_unused]] bool const success = m_token.get().RequestStop(reason);
    assert(IsTokenInExpectedState(success, m_token)); // Ensure the token is in a non-executing state.
    return m_token.get().Status();
}

//----------------------------------------------------------------------------------------------------------------------

Device::Details const& Hub::Core::GetDeviceDetails() const { return m_details; }

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::CreateResources(Configuration::Parser const& parser)
{
    auto const& network = parser.GetNetworkOptions();
    auto const& discovery = parser.GetDiscoveryOptions();
    auto const& pairing = parser.GetPairingOptions();
    auto const& sync = parser.GetSyncOptions();
    auto const& transfer = parser.GetTransferOptions();

    m_details = parser.GetDeviceDetails();
    m_binding = Network::BindingAddress{ network.GetInterface(), network.GetPort() };

    // Restore the devices trusted in prior runs before any connection can be authenticated.
    if (m_spPersistor) {
        m_spPersistor->SetRegistry(m_spRegistry.get());
        auto const [status, message] = m_spPersistor->FetchDevices();
        if (status != Configuration::StatusCode::Success) {
            m_logger->warn("The paired devices could not be restored, devices must pair again: {}", message);
        }
    }

    m_spPairingManager = std::make_shared<Pairing::Manager>(
        m_details.identifier, *m_spRegistry, m_spEventPublisher,
        Pairing::Manager::Options{
            .lifetime = std::chrono::duration_cast<std::chrono::seconds>(pairing.GetLifetime()),
            .length = pairing.GetCodeLength(),
        });

    m_upEndpoint = std::make_unique<Network::WebSocket::Endpoint>(m_context, m_spEventPublisher);

    {
        auto const& connection = network.GetConnection();
        auto const& retry = connection.GetRetry();
        Connection::Manager::Options const options{
            .handshakeTimeout = connection.GetTimeout(),
            .heartbeatInterval = connection.GetHeartbeat().GetInterval(),
            .heartbeatTolerance = connection.GetHeartbeat().GetTolerance(),
            .retry = {
                .base = retry.GetBase(),
                .ceiling = retry.GetCeiling(),
                .limit = retry.GetLimit(),
                .jitter = retry.GetJitter(),
            },
        };

        m_spConnectionManager = std::make_shared<Connection::Manager>(
            m_details, *m_spRegistry, m_spPairingManager.get(), m_spEventPublisher, *m_spRouter,
            m_upEndpoint.get(), options);
    }

    m_upEndpoint->SetAcceptHandler([this] (SharedTransport const& spTransport)
    {
        if (auto const optKey = m_spConnectionManager->OnTransportAccepted(spTransport); !optKey) {
            m_logger->warn("A connection from {} could not be adopted.", spTransport->GetAddress());
        }
    });

    m_spClipboardChannel = std::make_shared<Clipboard::Channel>(
        m_details.identifier, *m_spConnectionManager, &m_clipboard,
        Clipboard::Channel::Options{ .enabled = sync.UseClipboard(), .relay = sync.UseRelay() });

    m_spNotificationChannel = std::make_shared<Notification::Channel>(
        m_details.identifier, *m_spConnectionManager, &m_notifications,
        Notification::Channel::Options{ .enabled = sync.UseNotifications(), .relay = sync.UseRelay() });

    m_upFileStorage = std::make_unique<Transfer::FileStorage>(transfer.GetDirectory());
    m_spTransferEngine = std::make_shared<Transfer::Engine>(
        *m_spConnectionManager, *m_upFileStorage, m_spEventPublisher,
        Transfer::Engine::Options{
            .chunkSize = transfer.GetChunkSize(),
            .window = transfer.GetWindow(),
            .resumable = transfer.IsResumable(),
            .rateLimit = transfer.GetRateLimit(),
            .gracePeriod = transfer.GetGracePeriod(),
            .stallTimeout = transfer.GetStallTimeout(),
            .resumeTimeout = transfer.GetResumeTimeout(),
            .progressInterval = transfer.GetProgressInterval(),
        });
    m_spTransferEngine->Register(&m_reporter);

    // The channels observe the connection lifecycle to prime newly opened peers and to forget departed ones.
    m_spConnectionManager->RegisterObserver(m_spClipboardChannel.get());
    m_spConnectionManager->RegisterObserver(m_spNotificationChannel.get());
    m_spConnectionManager->RegisterObserver(m_spTransferEngine.get());

    m_discoveryEnabled = discovery.IsEnabled();
    if (m_discoveryEnabled) {
        m_upDiscovery = std::make_unique<Discovery::Service>(
            m_context, m_spEventPublisher,
            Discovery::Service::Options{
                .serviceType = discovery.GetServiceType(),
                .group = discovery.GetGroup(),
                .port = discovery.GetPort(),
                .interval = discovery.GetInterval(),
                .expiration = discovery.GetExpiration(),
            });
    }

    m_spEventPublisher->Advertise({ Event::Type::RuntimeStarted, Event::Type::RuntimeStopped });

    m_spServiceProvider->Register(m_spEventPublisher);
    m_spServiceProvider->Register(m_spRouter);
    m_spServiceProvider->Register(m_spRegistry);
    m_spServiceProvider->Register(m_spPairingManager);
    m_spServiceProvider->Register(m_spConnectionManager);
    m_spServiceProvider->Register(m_spClipboardChannel);
    m_spServiceProvider->Register(m_spNotificationChannel);
    m_spServiceProvider->Register(m_spTransferEngine);

    RegisterRoutes();
    SubscribeToEvents();

    m_upConsole = std::make_unique<CommandConsole>([this] (Command const& command) { OnCommand(command); });

    m_initialized = true;
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::RegisterRoutes()
{
    auto& router = *m_spRouter;

    local::RegisterRoute<Message::PairingRequest, Connection::Manager>(router);
    local::RegisterRoute<Message::Hello, Connection::Manager>(router);
    local::RegisterRoute<Message::Unpair, Connection::Manager>(router);
    local::RegisterRoute<Message::Ping, Connection::Manager>(router);
    local::RegisterRoute<Message::Pong, Connection::Manager>(router);
    local::RegisterRoute<Message::ClientSetting, Connection::Manager>(router);
    local::RegisterRoute<Message::ProtocolError, Connection::Manager>(router);

    local::RegisterRoute<Message::ClipboardUpdate, Clipboard::Channel>(router);

    local::RegisterRoute<Message::Notification, Notification::Channel>(router);
    local::RegisterRoute<Message::NotificationRemoved, Notification::Channel>(router);

    local::RegisterRoute<Message::FileUploadRequest, Transfer::Engine>(router);
    local::RegisterRoute<Message::FileDownloadRequest, Transfer::Engine>(router);
    local::RegisterRoute<Message::FileTransferResponse, Transfer::Engine>(router);
    local::RegisterRoute<Message::ChunkAck, Transfer::Engine>(router);
    local::RegisterRoute<Message::TransferUpdate, Transfer::Engine>(router);
    local::RegisterRoute<Message::CancelTransfer, Transfer::Engine>(router);

    [[maybe_unused]] bool const success = router.Register<Route::ChunkDelegate<Transfer::Engine>>(Route::ChunkRoute);
    assert(success);
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::SubscribeToEvents()
{
    using namespace Event;
    auto& publisher = *m_spEventPublisher;

    publisher.Subscribe<Type::RuntimeStarted>([this] { m_logger->debug("The hub runtime has started."); });

    publisher.Subscribe<Type::RuntimeStopped>([this] (Message<Type::RuntimeStopped>::Cause cause)
    {
        using Cause = Message<Type::RuntimeStopped>::Cause;
        if (cause == Cause::UnexpectedError) { m_logger->warn("The hub runtime stopped due to an error."); }
        else { m_logger->debug("The hub runtime has stopped."); }
    });

    publisher.Subscribe<Type::BindingFailed>([this] (std::string const& uri, Message<Type::BindingFailed>::Cause cause)
    {
        using Cause = Message<Type::BindingFailed>::Cause;
        switch (cause) {
            case Cause::AddressInUse: m_logger->error("Unable to bind {}, the address is in use.", uri); break;
            case Cause::Permissions: m_logger->error("Unable to bind {}, permission was denied.", uri); break;
            default: m_logger->error("Unable to bind {}.", uri); break;
        }
    });

    // Discovery events are only raised when the discovery service has been created.
    if (publisher.IsAdvertised(Type::ServiceDiscovered)) {
        publisher.Subscribe<Type::ServiceDiscovered>(
            [this] (std::string const& name, Network::RemoteAddress const& address)
        {
            m_logger->debug("Discovered \"{}\" at {}.", name, address);
        });

        publisher.Subscribe<Type::ServiceRemoved>([this] (std::string const& name)
        {
            m_logger->debug("The \"{}\" service is no longer advertised.", name);
        });
    }

    publisher.Subscribe<Type::PairingCodeIssued>([this] (Pairing::Code const& code)
    {
        m_logger->info("A pairing code has been issued, it expires in {} seconds.", code.lifetime.count());
        m_logger->trace("Pairing code: {}", code.value);

        // The code is presented to the operator rather than logged, it is read from the screen by the peer's user.
        std::cout << "Pairing code: " << code.value << "\n" << Pairing::CreatePairingUri(code) << std::endl;
    });

    publisher.Subscribe<Type::PairingCodeExpired>([this] (std::string const& value)
    {
        m_logger->info("The outstanding pairing code has expired.");
        m_logger->trace("Expired pairing code: {}", value);
    });

    publisher.Subscribe<Type::PeerPaired>([this] (Device::Details const& details)
    {
        m_logger->info("Paired with \"{}\" ({}).", details.name, details.identifier);
    });

    publisher.Subscribe<Type::PairingFailed>([this] (Device::Identifier const& identifier, Pairing::Error error)
    {
        m_logger->warn("Pairing with {} failed: {}", identifier, Pairing::ErrorToDescription(error));
    });

    publisher.Subscribe<Type::PeerConnected>(
        [this] (Device::Details const& details, Network::RemoteAddress const& address)
        {
            m_logger->info("Connected to \"{}\" ({}) at {}.", details.name, details.identifier, address);
        });

    publisher.Subscribe<Type::PeerDisconnected>([this] (Device::Identifier const& identifier, Connection::Cause cause)
    {
        m_logger->info("Disconnected from {}: {}.", identifier, Connection::CauseToString(cause));
    });

    publisher.Subscribe<Type::PeerReconnecting>(
        [this] (Device::Identifier const& identifier, std::uint32_t attempt, std::chrono::milliseconds delay)
        {
            m_logger->info("Reconnecting to {} in {}ms (attempt {}).", identifier, delay.count(), attempt);
        });

    publisher.Subscribe<Type::ReconnectExhausted>([this] (Device::Identifier const& identifier, std::uint32_t attempts)
    {
        m_logger->warn("Unable to reconnect to {} after {} attempts.", identifier, attempts);
    });

    publisher.Subscribe<Type::PeerUnpaired>(
        [this] (Device::Identifier const& identifier, Message<Type::PeerUnpaired>::Cause cause)
        {
            using Cause = Message<Type::PeerUnpaired>::Cause;
            auto const requester = (cause == Cause::LocalRequest) ? "this device" : "the peer";
            m_logger->info("Unpaired from {} at the request of {}.", identifier, requester);
        });

    publisher.Subscribe<Type::TransferFinished>(
        [this] (Device::Identifier const& identifier, Transfer::Summary const& summary)
        {
            auto const direction = Transfer::DirectionToString(summary.direction);
            switch (summary.status) {
                case Transfer::Status::Completed: {
                    m_logger->info("The {} of \"{}\" with {} completed.", direction, summary.name, identifier);
                } break;
                case Transfer::Status::Canceled: {
                    m_logger->info("The {} of \"{}\" with {} was canceled.", direction, summary.name, identifier);
                } break;
                default: {
                    auto const reason = summary.error ? Transfer::ErrorToString(*summary.error) : "unknown";
                    m_logger->warn(
                        "The {} of \"{}\" with {} failed ({}), it may be retried as a new transfer.",
                        direction, summary.name, identifier, reason);
                } break;
            }
        });
}

//----------------------------------------------------------------------------------------------------------------------

ExecutionStatus Hub::Core::StartComponents()
{
    if (!m_token.get().RequestStart({})) { return ExecutionStatus::AlreadyStarted; }

    assert(m_initialized);

    // Initialize the router to ensure the message handlers can use the service provider to get their requisite
    // dependencies.
    if (!m_spRouter->Initialize(m_spServiceProvider)) { return ExecutionStatus::InitializationFailed; }

    assert(m_spEventPublisher->EventCount() == std::size_t(0)); // All events should be flushed between cycles.
    m_spEventPublisher->SuspendSubscriptions(); // Event subscriptions are disabled after this point.
    m_spEventPublisher->Publish<Event::Type::RuntimeStarted>(); // Publish the first event indicating execution start.

    m_spPairingManager->Attach(m_context);

    if (IsPeerRole()) {
        if (!StartPeerRole()) { return ExecutionStatus::InitializationFailed; }
    } else {
        if (!StartListening()) { return ExecutionStatus::InitializationFailed; }
        if (m_discoveryEnabled && !StartDiscovery()) {
            m_logger->warn("The hub will not be advertised, peers must connect by address.");
        }
    }

    StartNetwork();

    if (m_directives.issueCode) {
        boost::asio::post(m_context, [this] {
            if (!m_spPairingManager->IssueCode()) { m_logger->warn("A pairing code could not be issued."); }
        });
    }

    m_upConsole->Start();
    m_logger->info("Enter \"help\" to list the available commands.");

    return ExecutionStatus::Standby;
}

//----------------------------------------------------------------------------------------------------------------------


bool Hub::Core::StartListening()
{
    if (!m_upEndpoint->Bind(m_binding)) {
        m_logger->critical("Unable to listen for peers on {}!", m_binding);
        return false;
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Hub::Core::StartDiscovery()
{
    assert(m_upDiscovery);
    if (!m_upDiscovery->Start()) { return false; }

    auto const& optBinding = m_upEndpoint->GetBinding();
    assert(optBinding); // The endpoint must be listening before the hub can be advertised.

    Discovery::Advertisement advertisement{
        .serviceName = m_details.name,
        .instance = m_details.identifier,
        .port = optBinding->GetPort(),
        .addresses = {},
        .metadata = {
            { "id", m_details.identifier },
            { "name", m_details.name },
            { "kind", std::string{ Device::KindToString(m_details.kind) } },
            { "version", std::string{ Ferry::Version } },
        },
    };

    // A wildcard binding is reachable through the address the announcement is received from.
    if (!optBinding->IsWildcard()) { advertisement.addresses.emplace_back(optBinding->GetHost()); }

    m_upDiscovery->Advertise(advertisement);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Hub::Core::StartPeerRole()
{
    assert(m_directives.optHubTarget);
    auto const& target = *m_directives.optHubTarget;

    if (target != Startup::AutomaticHub) {
        auto const optAddress = Network::RemoteAddress::FromUri(target, Network::RemoteAddress::Origin::User);
        if (!optAddress) {
            m_logger->critical("The hub address \"{}\" is not valid!", target);
            return false;
        }
        boost::asio::post(m_context, [this, address = *optAddress] { ConnectToHub(address); });
        return true;
    }

    if (!m_upDiscovery) {
        m_logger->critical("A hub can not be found automatically while discovery is disabled!");
        return false;
    }

    // The watch is registered before the service is started such that the startup query solicits the hubs.
    m_optWatchToken = m_upDiscovery->Watch(
        m_upDiscovery->GetOptions().serviceType,
        [this] (Discovery::Change change, Discovery::Record const& record) { OnHubDiscovered(change, record); });

    if (!m_upDiscovery->Start()) {
        m_logger->critical("Unable to search for a hub on the local network!");
        return false;
    }

    m_logger->info("Searching for a hub on the local network.");
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::StartNetwork()
{
    assert(!m_network.joinable());

    m_optWorkGuard.emplace(boost::asio::make_work_guard(m_context));
    m_upTickTimer = std::make_unique<boost::asio::steady_timer>(m_context);
    m_ticking = true;

    boost::asio::co_spawn(m_context, Ticker(), [this] (std::exception_ptr exception)
    {
        if (exception) {
            m_logger->critical("An unexpected error caused the hub's timers to stop!");
            OnUnexpectedError();
        }
    });

    std::promise<void> stopped;
    m_networkStopped = stopped.get_future();
    m_network = std::jthread([this, stopped = std::move(stopped)] () mutable
    {
        try {
            m_context.run();
        } catch (std::exception const& exception) {
            m_logger->critical("An unexpected error caused the network thread to exit: {}", exception.what());
            OnUnexpectedError();
        }
        stopped.set_value();
    });
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::StopNetwork()
{
    if (!m_network.joinable()) { return; }

    // Connections are drained on the network thread, which exits after the remaining work has completed.
    boost::asio::co_spawn(m_context, Teardown(), boost::asio::detached);
    if (m_networkStopped.wait_for(local::ShutdownTimeout) != std::future_status::ready) {
        m_logger->warn("The network did not stop in time, the remaining connections will be dropped.");
        m_context.stop();
    }

    m_network.join();
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::OnRuntimeStopped(ExecutionStatus status)
{
    m_upConsole->Stop();
    StopNetwork();

    // Note: Durning the destruction of the core it is no longer safe to use the event publisher. Some subscribers
    // may have been destroyed and may not be executed.
    if (status != ExecutionStatus::ResourceShutdown) {
        using StopCause = Event::Message<Event::Type::RuntimeStopped>::Cause;
        auto const cause = (status == ExecutionStatus::UnexpectedShutdown) ?
            StopCause::UnexpectedError : StopCause::ShutdownRequest;
        m_spEventPublisher->Publish<Event::Type::RuntimeStopped>(cause);
        m_spEventPublisher->Dispatch(); // Flush remaining events to the subscribers.
        assert(!m_token.get().IsExecutionActive() && m_token.get().Status() == ExecutionStatus::Standby);
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::OnUnexpectedError()
{
    // If the stop has already been requested, the prior cause is preserved.
    [[maybe_unused]] bool const success = m_token.get().RequestStop(ExecutionStatus::UnexpectedShutdown);
}

//----------------------------------------------------------------------------------------------------------------------

boost::asio::awaitable<void> Hub::Core::Ticker()
{
    // Connection handshakes and heartbeats, reconnect backoff, transfer stalls, and discovery announcements are all
    // evaluated against the time observed on each tick.
    while (m_ticking) {
        boost::system::error_code error;
        m_upTickTimer->expires_after(local::TickInterval);
        co_await m_upTickTimer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error));
        if (error || !m_ticking) { break; }

        m_spConnectionManager->Tick();
        m_spTransferEngine->Tick();
        if (m_upDiscovery) { m_upDiscovery->Tick(); }
    }
}

//----------------------------------------------------------------------------------------------------------------------

boost::asio::awaitable<void> Hub::Core::Teardown()
{
    m_ticking = false;
    if (m_upTickTimer) { m_upTickTimer->cancel(); }

    if (m_upDiscovery) {
        if (m_optWatchToken) { m_upDiscovery->Unwatch(*m_optWatchToken); m_optWatchToken.reset(); }
        m_upDiscovery->Stop();
    }

    m_spConnectionManager->Shutdown();
    m_spPairingManager->Detach();

    // Give the peers an opportunity to observe the closure of their connections before the sockets are stopped.
    boost::system::error_code ignored;
    boost::asio::steady_timer timer{ m_context, local::DrainPeriod };
    co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ignored));

    m_upEndpoint->Shutdown();
    m_optWorkGuard.reset();
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::OnHubDiscovered(Discovery::Change change, Discovery::Record const& record)
{
    if (change == Discovery::Change::Removed || m_hubSelected) { return; }
    if (record.instance == m_details.identifier || record.addresses.empty()) { return; }

    auto const hub = Device::KindToString(Device::Kind::Hub);
    if (auto const itr = record.metadata.find("kind"); itr != record.metadata.end() && itr->second != hub) { return; }

    m_logger->info("Found the hub \"{}\" at {}.", record.serviceName, record.addresses.front());
    ConnectToHub(record.addresses.front());
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::ConnectToHub(Network::RemoteAddress const& address)
{
    // After the first connection the connection manager owns reconnecting to the hub.
    m_hubSelected = m_spConnectionManager->Connect(address, m_directives.optPairingCode);
    if (!m_hubSelected) { m_logger->error("Unable to connect to the hub at {}.", address); }
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::OnCommand(Command const& command)
{
    // Commands are read on the console thread, the components may only be used on the network thread.
    boost::asio::post(m_context, [this, command] { Execute(command); });
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::Execute(Command const& command)
{
    auto const& arguments = command.arguments;
    switch (command.verb) {
        case Verb::Help: std::cout << GenerateCommandHelpText() << std::endl; break;
        case Verb::Peers: ListPeers(); break;
        case Verb::Code: IssueCode(command); break;
        case Verb::Clip: {
            auto const shared = m_spClipboardChannel->OnLocalChange(arguments[0]);
            m_logger->info("The clipboard was shared with {} peer(s).", shared);
        } break;
        case Verb::Notify: PostNotification(command); break;
        case Verb::Dismiss: {
            if (!m_spNotificationChannel->Dismiss(arguments[0], arguments[1])) {
                m_logger->warn("Notification {} from {} is not mirrored on this device.", arguments[1], arguments[0]);
            }
        } break;
        case Verb::Offer: {
            if (auto const optFileId = m_upFileStorage->Offer(arguments[0]); optFileId) {
                m_logger->info("Offered \"{}\" as {}.", arguments[0], *optFileId);
            } else {
                m_logger->warn("Unable to offer \"{}\", it is not a readable file.", arguments[0]);
            }
        } break;
        case Verb::Upload: {
            if (auto const optTransfer = m_spTransferEngine->StartUpload(arguments[0], arguments[1]); optTransfer) {
                m_logger->info("Requested transfer {} with {}.", *optTransfer, arguments[0]);
            } else {
                m_logger->warn("Unable to upload {} to {}.", arguments[1], arguments[0]);
            }
        } break;
        case Verb::Download: {
            if (auto const optTransfer = m_spTransferEngine->RequestDownload(arguments[0], arguments[1]); optTransfer) {
                m_logger->info("Requested transfer {} with {}.", *optTransfer, arguments[0]);
            } else {
                m_logger->warn("Unable to download {} from {}.", arguments[1], arguments[0]);
            }
        } break;
        case Verb::Cancel: {
            if (!m_spTransferEngine->Cancel(arguments[0], arguments[1])) {
                m_logger->warn("Transfer {} with {} can not be canceled.", arguments[1], arguments[0]);
            }
        } break;
        case Verb::Transfers: ListTransfers(arguments[0]); break;
        case Verb::Unpair: {
            if (!m_spConnectionManager->Unpair(arguments[0])) {
                m_logger->warn("{} is not a paired device.", arguments[0]);
            }
        } break;
        case Verb::Quit: {
            [[maybe_unused]] bool const result = m_token.get().RequestStop();
        } break;
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::ListPeers() const
{
    auto const devices = m_spRegistry->GetSnapshot();
    if (devices.empty()) {
        m_logger->info("There are no known devices.");
        return;
    }

    for (auto const& device : devices) {
        auto const connected = m_spConnectionManager->IsOpen(device.identifier) ? ", connected" : "";
        m_logger->info(
            "{} \"{}\" ({}): {}{}", device.identifier, device.name, Device::KindToString(device.kind),
            Device::TrustStateToString(device.trust), connected);
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::IssueCode(Command const& command)
{
    std::optional<Pairing::Code> optCode;
    if (command.arguments.empty()) {
        optCode = m_spPairingManager->IssueCode();
    } else {
        auto const optLifetime = local::ParseLifetime(command.arguments.front());
        if (!optLifetime) {
            m_logger->warn("The lifetime of a pairing code must be a positive number of seconds.");
            return;
        }
        optCode = m_spPairingManager->IssueCode(*optLifetime);
    }

    if (!optCode) { m_logger->warn("A pairing code could not be issued."); }
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::PostNotification(Command const& command)
{
    auto const& arguments = command.arguments;
    assert(arguments.size() == 3);

    Message::Notification notification{
        .id = fmt::format("{}-{}", TimeUtils::GetSystemTimestamp().count(), ++m_notificationCount),
        .appName = arguments[0],
        .title = arguments[1],
        .content = arguments[2],
        .timestamp = TimeUtils::GetSystemTimestamp(),
        .originDeviceId = m_details.identifier,
    };

    auto const id = notification.id;
    auto const forwarded = m_spNotificationChannel->OnLocalPosted(std::move(notification));
    m_logger->info("Notification {} was posted to {} peer(s).", id, forwarded);
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::Core::ListTransfers(Device::Identifier const& peer) const
{
    auto const summaries = m_spTransferEngine->GetSummaries(peer);
    if (summaries.empty()) {
        m_logger->info("There are no transfers with {}.", peer);
        return;
    }

    for (auto const& summary : summaries) {
        auto const error = summary.error ? fmt::format(" ({})", Transfer::ErrorToString(*summary.error)) : "";
        m_logger->info(
            "{}: {} of \"{}\" is {}{}, {} of {} bytes acknowledged.", summary.identifier,
            Transfer::DirectionToString(summary.direction), summary.name, Transfer::StatusToString(summary.status),
            error, summary.acknowledged, summary.size);
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::chrono::seconds> local::ParseLifetime(std::string const& value)
{
    std::uint32_t seconds = 0;
    auto const end = value.data() + value.size();
    auto const [ptr, error] = std::from_chars(value.data(), end, seconds);
    if (error != std::errc{} || ptr != end || seconds == 0) { return {}; }
    return std::chrono::seconds{ seconds };
}

//----------------------------------------------------------------------------------------------------------------------
