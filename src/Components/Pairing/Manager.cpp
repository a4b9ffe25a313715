//----------------------------------------------------------------------------------------------------------------------
// File: Manager.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Manager.hpp"
#include "Components/Device/Registry.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/post.hpp>
#include <openssl/crypto.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string Normalize(std::string_view code);
[[nodiscard]] bool IsMatchingCode(std::string const& expected, std::string const& submitted);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Pairing::Manager::Manager(
    Device::Identifier const& hub,
    Device::Registry& registry,
    Event::SharedPublisher const& spEventPublisher,
    Options const& options,
    TimeSource const& time,
    CodeGenerator const& generator)
    : m_hub(hub)
    , m_registry(registry)
    , m_spEventPublisher(spEventPublisher)
    , m_options(options)
    , m_time(time)
    , m_generator(generator)
    , m_logger(Logger::Get(Logger::Name::Pairing))
    , m_mutex()
    , m_state(State::NoCode)
    , m_optCode()
    , m_issued()
    , m_consumed()
    , m_upExpirationTimer()
{
    assert(m_spEventPublisher);
    assert(m_options.length >= MinimumCodeLength && m_options.length <= MaximumCodeLength);

    m_spEventPublisher->Advertise({
        Event::Type::PairingCodeIssued,
        Event::Type::PairingCodeExpired,
        Event::Type::PeerPaired,
        Event::Type::PairingFailed
    });
}

//----------------------------------------------------------------------------------------------------------------------

Pairing::Manager::~Manager()
{
    Detach();
}

//----------------------------------------------------------------------------------------------------------------------

void Pairing::Manager::Attach(boost::asio::io_context& context)
{
    std::scoped_lock lock(m_mutex);
    m_upExpirationTimer = std::make_unique<boost::asio::steady_timer>(context);
}

//----------------------------------------------------------------------------------------------------------------------

void Pairing::Manager::Detach()
{
    std::scoped_lock lock(m_mutex);
    if (m_upExpirationTimer) { m_upExpirationTimer->cancel(); }
    m_upExpirationTimer.reset();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Pairing::Code> Pairing::Manager::IssueCode()
{
    return IssueCode(m_options.lifetime);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Pairing::Code> Pairing::Manager::IssueCode(std::chrono::seconds lifetime)
{
    assert(lifetime > std::chrono::seconds::zero());

    Code code;
    {
        std::scoped_lock lock(m_mutex);

        // A code is never reused, if the generator produces a previously issued value another value is requested.
        std::string value;
        for (std::size_t attempt = 0; attempt < GenerationAttempts; ++attempt) {
            value = local::Normalize(m_generator(m_options.length));
            if (!value.empty() && !m_issued.contains(value)) { break; }
            value.clear();
        }

        if (value.empty()) {
            m_logger->error("Unable to generate a unique pairing code.");
            return {};
        }

        if (m_optCode && !m_optCode->consumed) { m_logger->info("The outstanding pairing code has been replaced."); }

        code = Code{ .value = value, .issuer = m_hub, .created = m_time(), .lifetime = lifetime, .consumed = false };
        m_issued.emplace(value);
        m_optCode = code;
        m_state = State::CodeIssued;
    }

    m_logger->info("Issued a pairing code valid for {}s.", lifetime.count());
    m_logger->trace("Pairing code: {}.", code.value);

    ScheduleExpiration(code);
    m_spEventPublisher->Publish<Event::Type::PairingCodeIssued>(code);
    return code;
}

//----------------------------------------------------------------------------------------------------------------------

Pairing::Result Pairing::Manager::SubmitPairingRequest(std::string_view submitted, Device::Details const& candidate)
{
    assert(Device::IsValidIdentifier(candidate.identifier));
    auto const code = local::Normalize(submitted);

    {
        std::scoped_lock lock(m_mutex);
        auto const state = UpdateState(m_time());

        bool const matches = m_optCode && local::IsMatchingCode(m_optCode->value, code);
        if (!matches) {
            // Previously consumed codes are distinguished so the requester can be told to ask for a fresh code. Any
            // other code, including one superseded before it was used, is simply invalid.
            auto const reason = m_consumed.contains(code) ? Error::CodeAlreadyUsed : Error::CodeInvalid;
            return Reject(candidate.identifier, reason);
        }

        switch (state) {
            case State::Consumed: return Reject(candidate.identifier, Error::CodeAlreadyUsed);
            case State::Expired: return Reject(candidate.identifier, Error::CodeExpired);
            case State::CodeIssued: break;
            case State::NoCode:
            default: assert(false); return Reject(candidate.identifier, Error::CodeInvalid);
        }

        m_optCode->consumed = true;
        m_consumed.emplace(m_optCode->value);
        m_state = State::Consumed;
        if (m_upExpirationTimer) { m_upExpirationTimer->cancel(); }
    }

    // Trust is granted outside of the code lock. The registry notifies its observers (e.g. persistence) of the change.
    if (!m_registry.Trust(candidate)) {
        m_logger->error("Unable to trust {} after a successful pairing.", candidate.identifier);
    }

    auto const optDetails = m_registry.Find(candidate.identifier);
    m_logger->info("Paired with {} ({}).", candidate.identifier, candidate.name);
    m_spEventPublisher->Publish<Event::Type::PeerPaired>(optDetails.value_or(candidate));

    return Accepted{ candidate.identifier };
}

//----------------------------------------------------------------------------------------------------------------------

Pairing::State Pairing::Manager::GetState() const
{
    std::scoped_lock lock(m_mutex);
    return UpdateState(m_time());
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Pairing::Code> Pairing::Manager::GetOutstandingCode() const
{
    std::scoped_lock lock(m_mutex);
    if (UpdateState(m_time()) != State::CodeIssued) { return {}; }
    return m_optCode;
}

//----------------------------------------------------------------------------------------------------------------------

Device::Identifier const& Pairing::Manager::GetHubIdentifier() const
{
    return m_hub;
}

//----------------------------------------------------------------------------------------------------------------------

Pairing::State Pairing::Manager::UpdateState(Clock::time_point const& now) const
{
    // Note: The caller must hold the code lock. Expiration is derived from the time source rather than the timer, the
    // timer only serves to announce the expiration.
    if (m_state == State::CodeIssued && m_optCode && m_optCode->IsExpired(now)) { m_state = State::Expired; }
    return m_state;
}

//----------------------------------------------------------------------------------------------------------------------

void Pairing::Manager::ScheduleExpiration(Code const& code)
{
    std::scoped_lock lock(m_mutex);
    if (!m_upExpirationTimer) { return; }

    // The timer may only be touched from the network thread, the request is posted to the timer's executor.
    boost::asio::post(m_upExpirationTimer->get_executor(), [this, value = code.value, lifetime = code.lifetime] () {
        std::scoped_lock lock(m_mutex);
        if (!m_upExpirationTimer || !m_optCode || m_optCode->value != value) { return; }
        m_upExpirationTimer->expires_after(lifetime);
        m_upExpirationTimer->async_wait([this, value] (boost::system::error_code const& error) {
            if (error) { return; } // The timer was canceled by consumption, replacement, or shutdown.
            OnExpirationTimer(value);
        });
    });
}

//----------------------------------------------------------------------------------------------------------------------

void Pairing::Manager::OnExpirationTimer(std::string const& value)
{
    {
        std::scoped_lock lock(m_mutex);
        if (!m_optCode || m_optCode->value != value) { return; }
        if (UpdateState(m_time()) != State::Expired) { return; }
    }

    m_logger->info("The outstanding pairing code has expired.");
    m_spEventPublisher->Publish<Event::Type::PairingCodeExpired>(value);
}

//----------------------------------------------------------------------------------------------------------------------

Pairing::Rejected Pairing::Manager::Reject(Device::Identifier const& identifier, Error reason)
{
    m_logger->warn("Rejected a pairing request from {}: {}.", identifier, ErrorToString(reason));
    m_spEventPublisher->Publish<Event::Type::PairingFailed>(identifier, reason);
    return Rejected{ reason };
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::Normalize(std::string_view code)
{
    std::string normalized(code);
    boost::algorithm::trim(normalized);
    boost::algorithm::to_upper(normalized);
    return normalized;
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsMatchingCode(std::string const& expected, std::string const& submitted)
{
    if (expected.size() != submitted.size()) { return false; }
    return CRYPTO_memcmp(expected.data(), submitted.data(), expected.size()) == 0;
}

//----------------------------------------------------------------------------------------------------------------------
