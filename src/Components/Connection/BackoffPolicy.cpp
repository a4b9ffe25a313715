//----------------------------------------------------------------------------------------------------------------------
// File: BackoffPolicy.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "BackoffPolicy.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <memory>
#include <random>
//----------------------------------------------------------------------------------------------------------------------

Connection::BackoffPolicy::BackoffPolicy(Options const& options, RandomSource const& random)
    : m_options(options)
    , m_random(random ? random : CreateDefaultRandomSource())
    , m_attempts(0)
    , m_previous(std::chrono::milliseconds::zero())
{
    assert(m_options.base > std::chrono::milliseconds::zero());
    assert(m_options.ceiling >= m_options.base);
    assert(m_options.jitter >= 0.0 && m_options.jitter <= 0.5);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::chrono::milliseconds> Connection::BackoffPolicy::Next()
{
    if (IsExhausted()) { return {}; }
    ++m_attempts;

    auto const nominal = GetNominalDelay(m_attempts);
    auto const sample = std::clamp(m_random(), 0.0, 1.0);
    auto const reduction = static_cast<std::chrono::milliseconds::rep>(
        static_cast<double>(nominal.count()) * m_options.jitter * sample);

    // Jitter is only ever subtracted from the nominal delay and the result is clamped to the previous delay. Once the
    // ceiling has been reached the delay holds at the largest value produced.
    auto const jittered = std::chrono::milliseconds{ nominal.count() - reduction };
    m_previous = std::clamp(jittered, m_previous, m_options.ceiling);
    return m_previous;
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::BackoffPolicy::Reset()
{
    m_attempts = 0;
    m_previous = std::chrono::milliseconds::zero();
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Connection::BackoffPolicy::GetAttempts() const
{
    return m_attempts;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::BackoffPolicy::IsExhausted() const
{
    return m_attempts >= m_options.limit;
}

//----------------------------------------------------------------------------------------------------------------------

Connection::BackoffPolicy::Options const& Connection::BackoffPolicy::GetOptions() const
{
    return m_options;
}

//----------------------------------------------------------------------------------------------------------------------

Connection::BackoffPolicy::RandomSource Connection::BackoffPolicy::CreateDefaultRandomSource()
{
    auto const spEngine = std::make_shared<std::mt19937>(std::random_device{}());
    return [spEngine] () -> double {
        std::uniform_real_distribution<double> distribution(0.0, 1.0);
        return distribution(*spEngine);
    };
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Connection::BackoffPolicy::GetNominalDelay(std::uint32_t attempt) const
{
    assert(attempt > 0);
    auto delay = m_options.base;
    for (std::uint32_t idx = 1; idx < attempt && delay < m_options.ceiling; ++idx) { delay *= 2; }
    return std::min(delay, m_options.ceiling);
}

//----------------------------------------------------------------------------------------------------------------------
