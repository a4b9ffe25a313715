//----------------------------------------------------------------------------------------------------------------------
// File: BackoffPolicy.hpp
// Description: Computes the delays between the reconnect attempts to a peer. The base delay doubles on each attempt
// until it reaches the ceiling and is reduced by a random jitter. The delays produced for one peer never decrease and
// never exceed the ceiling. Once the retry budget has been spent no further delay is produced.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Connection {
//----------------------------------------------------------------------------------------------------------------------

class BackoffPolicy;

//----------------------------------------------------------------------------------------------------------------------
} // Connection namespace
//----------------------------------------------------------------------------------------------------------------------

class Connection::BackoffPolicy
{
public:
    // Produces a uniformly distributed value in [0, 1).
    using RandomSource = std::function<double()>;

    struct Options
    {
        std::chrono::milliseconds base = std::chrono::milliseconds{ 500 };
        std::chrono::milliseconds ceiling = std::chrono::seconds{ 30 };
        std::uint32_t limit = 8;
        double jitter = 0.2; // The maximum fraction of the nominal delay that may be removed.
    };

    explicit BackoffPolicy(Options const& options, RandomSource const& random = {});

    [[nodiscard]] std::optional<std::chrono::milliseconds> Next();
    void Reset();

    [[nodiscard]] std::uint32_t GetAttempts() const;
    [[nodiscard]] bool IsExhausted() const;
    [[nodiscard]] Options const& GetOptions() const;

    [[nodiscard]] static RandomSource CreateDefaultRandomSource();

private:
    [[nodiscard]] std::chrono::milliseconds GetNominalDelay(std::uint32_t attempt) const;

    Options m_options;
    RandomSource m_random;
    std::uint32_t m_attempts;
    std::chrono::milliseconds m_previous;
};

//----------------------------------------------------------------------------------------------------------------------
