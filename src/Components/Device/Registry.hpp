//----------------------------------------------------------------------------------------------------------------------
// File: Registry.hpp
// Description: The set of known devices and their trust states. The registry is the only device state shared by the
// sessions; writers take exclusive ownership while readers are handed consistent copies.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Device.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IDeviceObserver;

//----------------------------------------------------------------------------------------------------------------------
namespace Device {
//----------------------------------------------------------------------------------------------------------------------

class Registry;

//----------------------------------------------------------------------------------------------------------------------
} // Device namespace
//----------------------------------------------------------------------------------------------------------------------

class Device::Registry
{
public:
    using Snapshot = std::vector<Details>;

    Registry();
    ~Registry() = default;

    Registry(Registry const&) = delete;
    Registry(Registry&&) = delete;
    Registry& operator=(Registry const&) = delete;
    Registry& operator=(Registry&&) = delete;

    void Register(IDeviceObserver* const observer);
    void Unregister(IDeviceObserver* const observer);

    // Replaces the known devices with a persisted set without notifying the observers.
    void Restore(Snapshot const& devices);

    // Records the first contact with a device or refreshes its descriptive fields. The trust state is never changed.
    void Observe(Details const& candidate);

    [[nodiscard]] bool MarkPending(Identifier const& identifier);
    [[nodiscard]] bool Trust(Details const& candidate);
    [[nodiscard]] bool Revoke(Identifier const& identifier);

    [[nodiscard]] std::optional<Details> Find(Identifier const& identifier) const;
    [[nodiscard]] TrustState GetTrustState(Identifier const& identifier) const;
    [[nodiscard]] bool IsTrusted(Identifier const& identifier) const;
    [[nodiscard]] Snapshot GetSnapshot() const;
    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] std::size_t TrustedCount() const;

private:
    void NotifyObservers(Details const& details) const;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<Identifier, Details> m_devices;

    mutable std::shared_mutex m_observersMutex;
    std::vector<IDeviceObserver*> m_observers;
};

//----------------------------------------------------------------------------------------------------------------------
