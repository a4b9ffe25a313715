//----------------------------------------------------------------------------------------------------------------------
// File: ExecutionToken.hpp
// Description: The hub's run state, shared by the core, the console, and the process signal handlers. A stop may be
// requested from any thread or from a signal handler, only the core moves the token in and out of execution.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/ExecutionStatus.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Hub {
//----------------------------------------------------------------------------------------------------------------------

class Core;
class ExecutionToken;

//----------------------------------------------------------------------------------------------------------------------
} // Hub namespace
//----------------------------------------------------------------------------------------------------------------------

class Hub::ExecutionToken
{
private:
    class CoreKey { public: friend class Core; private: CoreKey() = default; };

public:
    ExecutionToken() noexcept : m_requested(false), m_status(ExecutionStatus::Standby) {}

    [[nodiscard]] ExecutionStatus Status() const { return m_status.load(); }
    [[nodiscard]] bool IsExecutionActive() const { return m_status.load() == ExecutionStatus::Executing; }

    // True from a successful start request until a stop has been requested or the core has stopped.
    [[nodiscard]] bool IsExecutionRequested() const { return m_requested.load(); }

    [[nodiscard]] bool RequestStart(CoreKey)
    {
        if (m_status.load() != ExecutionStatus::Standby) { return false; }
        bool expected = false;
        return m_requested.compare_exchange_strong(expected, true);
    }

    // Lock free, it may be called from a signal handler. Only the first request while executing records its reason.
    [[nodiscard]] bool RequestStop(ExecutionStatus reason = ExecutionStatus::RequestedShutdown)
    {
        auto expected = ExecutionStatus::Executing;
        if (!m_status.compare_exchange_strong(expected, reason)) { return false; }
        m_requested.store(false);
        return true;
    }

    void OnExecutionStarted(CoreKey) { m_status.store(ExecutionStatus::Executing); }

    void OnExecutionStopped(CoreKey)
    {
        m_requested.store(false);
        m_status.store(ExecutionStatus::Standby);
    }

private:
    std::atomic_bool m_requested;
    std::atomic<ExecutionStatus> m_status;
};

static_assert(std::atomic<ExecutionStatus>::is_always_lock_free);

//----------------------------------------------------------------------------------------------------------------------
