//----------------------------------------------------------------------------------------------------------------------
// File: Manager.hpp
// Description: Issues the hub's pairing codes and validates the pairing requests submitted by candidate devices. Only
// one unconsumed code may be outstanding at a time; issuing a new code invalidates the previous one.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Code.hpp"
#include "Components/Device/Device.hpp"
#include "Components/Event/Publisher.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }
namespace Device { class Registry; }

//----------------------------------------------------------------------------------------------------------------------
namespace Pairing {
//----------------------------------------------------------------------------------------------------------------------

class Manager;

//----------------------------------------------------------------------------------------------------------------------
} // Pairing namespace
//----------------------------------------------------------------------------------------------------------------------

class Pairing::Manager
{
public:
    using TimeSource = std::function<Clock::time_point()>;
    using CodeGenerator = std::function<std::string(std::size_t)>;

    struct Options
    {
        std::chrono::seconds lifetime = DefaultCodeLifetime;
        std::size_t length = DefaultCodeLength;
    };

    Manager(
        Device::Identifier const& hub,
        Device::Registry& registry,
        Event::SharedPublisher const& spEventPublisher,
        Options const& options,
        TimeSource const& time = &Clock::now,
        CodeGenerator const& generator = &GenerateCode);

    ~Manager();

    Manager(Manager const&) = delete;
    Manager(Manager&&) = delete;
    Manager& operator=(Manager const&) = delete;
    Manager& operator=(Manager&&) = delete;

    // Binds the expiration timer to the network context. Without a bound context expiration is only observed when the
    // state is queried or a code is submitted.
    void Attach(boost::asio::io_context& context);
    void Detach();

    [[nodiscard]] std::optional<Code> IssueCode();
    [[nodiscard]] std::optional<Code> IssueCode(std::chrono::seconds lifetime);
    [[nodiscard]] Result SubmitPairingRequest(std::string_view code, Device::Details const& candidate);

    [[nodiscard]] State GetState() const;
    [[nodiscard]] std::optional<Code> GetOutstandingCode() const;
    [[nodiscard]] Device::Identifier const& GetHubIdentifier() const;

private:
    static constexpr std::size_t GenerationAttempts = 16;

    [[nodiscard]] State UpdateState(Clock::time_point const& now) const;
    void ScheduleExpiration(Code const& code);
    void OnExpirationTimer(std::string const& value);

    [[nodiscard]] Rejected Reject(Device::Identifier const& identifier, Error reason);

    Device::Identifier const m_hub;
    Device::Registry& m_registry;
    Event::SharedPublisher const m_spEventPublisher;
    Options const m_options;
    TimeSource const m_time;
    CodeGenerator const m_generator;
    std::shared_ptr<spdlog::logger> m_logger;

    mutable std::mutex m_mutex;
    mutable State m_state;
    std::optional<Code> m_optCode;
    std::unordered_set<std::string> m_issued;
    std::unordered_set<std::string> m_consumed;

    std::unique_ptr<boost::asio::steady_timer> m_upExpirationTimer;
};

//----------------------------------------------------------------------------------------------------------------------
