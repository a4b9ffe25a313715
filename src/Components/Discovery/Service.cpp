//----------------------------------------------------------------------------------------------------------------------
// File: Service.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Service.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <coroutine>
#include <ranges>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using BindingFailure = Event::Message<Event::Type::BindingFailed>::Cause;

// Announcements are not forwarded beyond the local network.
constexpr std::int32_t MulticastHops = 1;

[[nodiscard]] bool IsReachable(std::string const& host);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Discovery::Service::Service(
    boost::asio::io_context& context,
    Event::SharedPublisher const& spEventPublisher,
    Options const& options,
    TimeSource const& time)
    : m_context(context)
    , m_spEventPublisher(spEventPublisher)
    , m_options(options)
    , m_time(time)
    , m_logger(Logger::Get(Logger::Name::Discovery))
    , m_socket(context)
    , m_group()
    , m_buffer()
    , m_failed(false)
    , m_optAdvertisement()
    , m_optLastAnnounced()
    , m_known()
    , m_watchers()
    , m_nextToken(0)
{
    assert(m_spEventPublisher);
    assert(m_time);
    m_spEventPublisher->Advertise({
        Event::Type::BindingFailed,
        Event::Type::ServiceDiscovered,
        Event::Type::ServiceRemoved,
    });
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Service::~Service()
{
    Stop();
}

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::Service::Start()
{
    if (m_socket.is_open()) { return true; }
    if (m_failed) { return false; } // The failure to bind has already been reported.

    auto const binding = fmt::format("udp://{}:{}", m_options.group, m_options.port);
    auto const OnBindError = [&] (boost::system::error_code const& error) -> bool
    {
        boost::system::error_code ignored;
        m_socket.close(ignored);
        m_failed = true;

        auto cause = local::BindingFailure::UnexpectedError;
        if (error == boost::asio::error::address_in_use) {
            cause = local::BindingFailure::AddressInUse;
        } else if (error == boost::asio::error::access_denied) {
            cause = local::BindingFailure::Permissions;
        }

        m_logger->error("Unable to open the discovery socket on {}: {}", binding, error.message());
        m_spEventPublisher->Publish<Event::Type::BindingFailed>(binding, cause);
        return false;
    };

    boost::system::error_code error;
    auto const group = boost::asio::ip::make_address(m_options.group, error);
    if (error) { return OnBindError(error); }
    if (!group.is_multicast()) { return OnBindError(boost::asio::error::invalid_argument); }

    m_group = boost::asio::ip::udp::endpoint{ group, m_options.port };
    boost::asio::ip::udp::endpoint const listener{
        group.is_v4() ? boost::asio::ip::udp::v4() : boost::asio::ip::udp::v6(), m_options.port };

    m_socket.open(listener.protocol(), error);
    if (error) { return OnBindError(error); }

    m_socket.set_option(boost::asio::ip::udp::socket::reuse_address(true), error);
    if (error) { return OnBindError(error); }

    m_socket.bind(listener, error);
    if (error) { return OnBindError(error); }

    m_socket.set_option(boost::asio::ip::multicast::join_group(group), error);
    if (error) { return OnBindError(error); }

    m_socket.set_option(boost::asio::ip::multicast::enable_loopback(true), error);
    if (error) { return OnBindError(error); }

    m_socket.set_option(boost::asio::ip::multicast::hops(local::MulticastHops), error);
    if (error) { return OnBindError(error); }

    m_logger->info("Listening for {} services on {}.", m_options.serviceType, binding);

    boost::asio::co_spawn(m_context, Receiver(),
        [logger = m_logger] (std::exception_ptr exception)
        {
            if (exception) { logger->error("An unexpected error caused the discovery receiver to shutdown!"); }
        });

    // Solicit the current advertisers for each watched type and announce any local instance.
    std::vector<std::string> types;
    for (auto const& watcher : m_watchers | std::views::values) {
        if (std::ranges::find(types, watcher.serviceType) == types.end()) { types.emplace_back(watcher.serviceType); }
    }
    std::ranges::for_each(types, [this] (auto const& type) { Query(type); });
    Announce();

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::Stop()
{
    if (!m_socket.is_open()) { return; }

    // The goodbye is sent synchronously, a pending send would be canceled by the closure.
    if (m_optAdvertisement) {
        Datagram const goodbye{
            .intent = Intent::Goodbye,
            .serviceType = m_options.serviceType,
            .serviceName = m_optAdvertisement->serviceName,
            .instance = m_optAdvertisement->instance,
        };

        boost::system::error_code error;
        auto const payload = Encode(goodbye);
        m_socket.send_to(boost::asio::buffer(payload), m_group, 0, error);
        if (error) { m_logger->warn("Unable to send the discovery goodbye: {}", error.message()); }
    }

    boost::system::error_code ignored;
    m_socket.close(ignored);
    m_optLastAnnounced.reset();
    m_logger->debug("Discovery has been stopped.");
}

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::Service::IsActive() const
{
    return m_socket.is_open();
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::Advertise(Advertisement const& advertisement)
{
    assert(!advertisement.instance.empty());
    if (m_optAdvertisement && m_optAdvertisement->instance != advertisement.instance) { Withdraw(); }

    m_optAdvertisement = advertisement;
    m_optLastAnnounced.reset();
    m_logger->info("Advertising \"{}\" on port {}.", advertisement.serviceName, advertisement.port);
    Announce();
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::Withdraw()
{
    if (!m_optAdvertisement) { return; }

    Transmit({
        .intent = Intent::Goodbye,
        .serviceType = m_options.serviceType,
        .serviceName = m_optAdvertisement->serviceName,
        .instance = m_optAdvertisement->instance,
    });

    m_optAdvertisement.reset();
    m_optLastAnnounced.reset();
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Service::WatchToken Discovery::Service::Watch(std::string const& serviceType, WatchCallback const& callback)
{
    assert(callback);
    auto const token = m_nextToken++;
    m_watchers.emplace(token, Watcher{ serviceType, callback });

    // Restarting a watch replays every instance that is currently known.
    for (auto const& known : m_known | std::views::values) {
        if (known.record.serviceType == serviceType) { callback(Change::Added, known.record); }
    }

    Query(serviceType);
    return token;
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::Unwatch(WatchToken token)
{
    m_watchers.erase(token);
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::Tick()
{
    auto const now = m_time();
    if (m_optAdvertisement && (!m_optLastAnnounced || now - *m_optLastAnnounced >= m_options.interval)) {
        Announce();
    }
    Prune();
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::OnDatagram(std::string_view buffer, std::string const& sender)
{
    auto optDatagram = Decode(buffer);
    if (!optDatagram) {
        m_logger->debug("Dropping a malformed discovery datagram from {}.", sender);
        return;
    }

    switch (optDatagram->intent) {
        case Intent::Announce: OnAnnounce(std::move(*optDatagram), sender); break;
        case Intent::Goodbye: OnGoodbye(*optDatagram); break;
        case Intent::Query: OnQuery(*optDatagram); break;
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Discovery::Record> Discovery::Service::GetKnown(std::string_view serviceType) const
{
    std::vector<Record> records;
    for (auto const& known : m_known | std::views::values) {
        if (known.record.serviceType == serviceType) { records.emplace_back(known.record); }
    }
    return records;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Discovery::Service::GetKnownCount() const
{
    return m_known.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Discovery::Advertisement> const& Discovery::Service::GetAdvertisement() const
{
    return m_optAdvertisement;
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Service::Options const& Discovery::Service::GetOptions() const
{
    return m_options;
}

//----------------------------------------------------------------------------------------------------------------------

boost::asio::awaitable<void> Discovery::Service::Receiver()
{
    while (m_socket.is_open()) {
        boost::system::error_code error;
        boost::asio::ip::udp::endpoint sender;
        auto const received = co_await m_socket.async_receive_from(
            boost::asio::buffer(m_buffer), sender, boost::asio::redirect_error(boost::asio::use_awaitable, error));

        if (error) {
            if (error == boost::asio::error::operation_aborted || !m_socket.is_open()) { co_return; }
            // A failure to read one datagram does not stop the watch.
            m_logger->warn("Unable to receive a discovery datagram: {}", error.message());
            continue;
        }

        OnDatagram(std::string_view{ m_buffer.data(), received }, sender.address().to_string());
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::OnAnnounce(Datagram&& datagram, std::string const& sender)
{
    // Ignore the reflection of the local advertisement.
    if (m_optAdvertisement && m_optAdvertisement->instance == datagram.instance) { return; }

    Record record{
        .serviceType = std::move(datagram.serviceType),
        .serviceName = std::move(datagram.serviceName),
        .instance = std::move(datagram.instance),
        .addresses = {},
        .metadata = std::move(datagram.metadata),
    };

    // The advertised addresses are preferred, the sender's address is considered last.
    datagram.addresses.emplace_back(sender);
    for (auto const& host : datagram.addresses) {
        if (!local::IsReachable(host)) { continue; }
        Network::RemoteAddress address{ host, datagram.port, Network::RemoteAddress::Origin::Discovery };
        if (!address.IsValid() || std::ranges::find(record.addresses, address) != record.addresses.end()) { continue; }
        record.addresses.emplace_back(std::move(address));
    }

    if (record.addresses.empty()) {
        m_logger->debug("Dropping the announcement of {}, no address could be resolved.", record.instance);
        return;
    }

    auto const now = m_time();
    if (auto const itr = m_known.find(record.instance); itr != m_known.end()) {
        auto& known = itr->second;
        known.lastSeen = now;

        bool const changed = known.record.addresses != record.addresses ||
            known.record.metadata != record.metadata ||
            known.record.serviceName != record.serviceName ||
            known.record.serviceType != record.serviceType;
        if (!changed) { return; }

        known.record = std::move(record);
        m_logger->debug("The service \"{}\" has been updated.", known.record.serviceName);
        Notify(Change::Updated, known.record);
        return;
    }

    auto const [itr, emplaced] = m_known.emplace(record.instance, Known{ std::move(record), now });
    assert(emplaced);
    auto const& added = itr->second.record;
    m_logger->info("Discovered \"{}\" at {}.", added.serviceName, added.addresses.front());
    m_spEventPublisher->Publish<Event::Type::ServiceDiscovered>(added.instance, added.addresses.front());
    Notify(Change::Added, added);
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::OnGoodbye(Datagram const& datagram)
{
    auto const itr = m_known.find(datagram.instance);
    if (itr == m_known.end()) { return; }

    auto const record = std::move(itr->second.record);
    m_known.erase(itr);

    m_logger->info("The service \"{}\" has been withdrawn.", record.serviceName);
    m_spEventPublisher->Publish<Event::Type::ServiceRemoved>(record.instance);
    Notify(Change::Removed, record);
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::OnQuery(Datagram const& datagram)
{
    if (datagram.serviceType != m_options.serviceType) { return; }
    Announce();
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::Announce()
{
    if (!m_optAdvertisement || !m_socket.is_open()) { return; }

    Transmit({
        .intent = Intent::Announce,
        .serviceType = m_options.serviceType,
        .serviceName = m_optAdvertisement->serviceName,
        .instance = m_optAdvertisement->instance,
        .port = m_optAdvertisement->port,
        .addresses = m_optAdvertisement->addresses,
        .metadata = m_optAdvertisement->metadata,
    });

    m_optLastAnnounced = m_time();
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::Query(std::string const& serviceType)
{
    Transmit({ .intent = Intent::Query, .serviceType = serviceType });
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::Transmit(Datagram const& datagram)
{
    if (!m_socket.is_open()) { return; }

    auto const spPayload = std::make_shared<std::string>(Encode(datagram));
    if (spPayload->size() > MaximumDatagramSize) {
        m_logger->warn("Unable to send a discovery {}, the datagram is too large.", IntentToString(datagram.intent));
        return;
    }

    m_socket.async_send_to(boost::asio::buffer(*spPayload), m_group,
        [spPayload, logger = m_logger] (boost::system::error_code const& error, std::size_t)
        {
            if (error && error != boost::asio::error::operation_aborted) {
                logger->warn("Unable to send a discovery datagram: {}", error.message());
            }
        });
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::Notify(Change change, Record const& record)
{
    // Watchers may unwatch from within their callback.
    std::vector<WatchCallback> callbacks;
    for (auto const& watcher : m_watchers | std::views::values) {
        if (watcher.serviceType == record.serviceType) { callbacks.emplace_back(watcher.callback); }
    }
    std::ranges::for_each(callbacks, [&] (auto const& callback) { callback(change, record); });
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Service::Prune()
{
    auto const now = m_time();
    std::vector<Record> expired;
    std::erase_if(m_known, [&] (auto const& entry) {
        auto const& [instance, known] = entry;
        if (now - known.lastSeen <= m_options.expiration) { return false; }
        expired.emplace_back(known.record);
        return true;
    });

    for (auto const& record : expired) {
        m_logger->info("The service \"{}\" has expired.", record.serviceName);
        m_spEventPublisher->Publish<Event::Type::ServiceRemoved>(record.instance);
        Notify(Change::Removed, record);
    }
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsReachable(std::string const& host)
{
    // Wildcard addresses advertise every interface, they do not name one that can be connected to.
    boost::system::error_code error;
    auto const address = boost::asio::ip::make_address(host, error);
    if (error) { return !host.empty(); } // Hostnames are resolved by the connecting side.
    return !address.is_unspecified() && !address.is_multicast();
}

//----------------------------------------------------------------------------------------------------------------------
