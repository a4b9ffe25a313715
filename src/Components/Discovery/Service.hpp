//----------------------------------------------------------------------------------------------------------------------
// File: Service.hpp
// Description: Local network service discovery over UDP multicast. The service advertises the hub's presence and
// watches for the instances advertised by others. Watchers receive added, updated and removed notifications; a new
// watcher is first given every currently known instance of the watched type as added.
// Notes: All methods are expected to be called on the thread running the provided io_context. Announcements and
// expiration are driven by Tick().
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Datagram.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Network/Address.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

class Service;

using Clock = std::chrono::steady_clock;

struct Advertisement
{
    std::string serviceName;
    std::string instance;
    std::uint16_t port = 0;
    std::vector<std::string> addresses;
    Metadata metadata;
};

struct Record
{
    std::string serviceType;
    std::string serviceName;
    std::string instance;
    std::vector<Network::RemoteAddress> addresses;
    Metadata metadata;
};

enum class Change : std::uint8_t { Added, Updated, Removed };

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------

class Discovery::Service
{
public:
    using TimeSource = std::function<Clock::time_point()>;
    using WatchCallback = std::function<void(Change, Record const&)>;
    using WatchToken = std::uint32_t;

    struct Options
    {
        std::string serviceType = "_ferry-sync._tcp";
        std::string group = "239.255.77.77";
        std::uint16_t port = 53535;
        std::chrono::milliseconds interval = std::chrono::seconds{ 5 };
        std::chrono::milliseconds expiration = std::chrono::seconds{ 20 };
    };

    Service(
        boost::asio::io_context& context,
        Event::SharedPublisher const& spEventPublisher,
        Options const& options,
        TimeSource const& time = &Clock::now);

    ~Service();

    Service(Service const&) = delete;
    Service(Service&&) = delete;
    Service& operator=(Service const&) = delete;
    Service& operator=(Service&&) = delete;

    // Opens the multicast socket. A failure is reported once through a BindingFailed event.
    [[nodiscard]] bool Start();

    // Sends a goodbye for the advertised instance and closes the socket.
    void Stop();

    [[nodiscard]] bool IsActive() const;

    // Publishes the presence of a local instance. Replaces any prior advertisement.
    void Advertise(Advertisement const& advertisement);
    void Withdraw();

    [[nodiscard]] WatchToken Watch(std::string const& serviceType, WatchCallback const& callback);
    void Unwatch(WatchToken token);

    void Tick();

    // Processes one datagram received from the sender's host. Invoked by the receiver for each datagram read.
    void OnDatagram(std::string_view buffer, std::string const& sender);

    [[nodiscard]] std::vector<Record> GetKnown(std::string_view serviceType) const;
    [[nodiscard]] std::size_t GetKnownCount() const;
    [[nodiscard]] std::optional<Advertisement> const& GetAdvertisement() const;
    [[nodiscard]] Options const& GetOptions() const;

private:
    struct Known
    {
        Record record;
        Clock::time_point lastSeen;
    };

    struct Watcher
    {
        std::string serviceType;
        WatchCallback callback;
    };

    using Buffer = std::array<char, MaximumDatagramSize>;

    [[nodiscard]] boost::asio::awaitable<void> Receiver();

    void OnAnnounce(Datagram&& datagram, std::string const& sender);
    void OnGoodbye(Datagram const& datagram);
    void OnQuery(Datagram const& datagram);

    void Announce();
    void Query(std::string const& serviceType);
    void Transmit(Datagram const& datagram);
    void Notify(Change change, Record const& record);
    void Prune();

    boost::asio::io_context& m_context;
    Event::SharedPublisher const m_spEventPublisher;
    Options const m_options;
    TimeSource const m_time;
    std::shared_ptr<spdlog::logger> m_logger;

    boost::asio::ip::udp::socket m_socket;
    boost::asio::ip::udp::endpoint m_group;
    Buffer m_buffer;
    bool m_failed;

    std::optional<Advertisement> m_optAdvertisement;
    std::optional<Clock::time_point> m_optLastAnnounced;
    std::map<std::string, Known> m_known;
    std::map<WatchToken, Watcher> m_watchers;
    WatchToken m_nextToken;
};

//----------------------------------------------------------------------------------------------------------------------
