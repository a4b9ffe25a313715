//----------------------------------------------------------------------------------------------------------------------
// File: Registry.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Registry.hpp"
#include "Interfaces/DeviceObserver.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <mutex>
//----------------------------------------------------------------------------------------------------------------------

Device::Registry::Registry()
    : m_mutex()
    , m_devices()
    , m_observersMutex()
    , m_observers()
{
}

//----------------------------------------------------------------------------------------------------------------------

void Device::Registry::Register(IDeviceObserver* const observer)
{
    assert(observer);
    std::scoped_lock lock(m_observersMutex);
    if (std::ranges::find(m_observers, observer) == m_observers.end()) { m_observers.emplace_back(observer); }
}

//----------------------------------------------------------------------------------------------------------------------

void Device::Registry::Unregister(IDeviceObserver* const observer)
{
    std::scoped_lock lock(m_observersMutex);
    std::erase(m_observers, observer);
}

//----------------------------------------------------------------------------------------------------------------------

void Device::Registry::Restore(Snapshot const& devices)
{
    std::scoped_lock lock(m_mutex);
    m_devices.clear();
    for (auto const& details : devices) {
        if (!IsValidIdentifier(details.identifier)) { continue; }
        m_devices.insert_or_assign(details.identifier, details);
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Device::Registry::Observe(Details const& candidate)
{
    assert(IsValidIdentifier(candidate.identifier));
    std::scoped_lock lock(m_mutex);
    auto [itr, emplaced] = m_devices.try_emplace(candidate.identifier, candidate);
    if (emplaced) {
        itr->second.trust = TrustState::Unknown;
        itr->second.pairings = 0;
        itr->second.paired = {};
        return;
    }

    if (!candidate.name.empty()) { itr->second.name = candidate.name; }
    if (candidate.kind != Kind::Unknown) { itr->second.kind = candidate.kind; }
}

//----------------------------------------------------------------------------------------------------------------------

bool Device::Registry::MarkPending(Identifier const& identifier)
{
    Details updated;
    {
        std::scoped_lock lock(m_mutex);
        auto const itr = m_devices.find(identifier);
        if (itr == m_devices.end() || itr->second.trust != TrustState::Unknown) { return false; }
        itr->second.trust = TrustState::Pending;
        updated = itr->second;
    }

    NotifyObservers(updated);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Device::Registry::Trust(Details const& candidate)
{
    if (!IsValidIdentifier(candidate.identifier)) { return false; }

    Details updated;
    {
        std::scoped_lock lock(m_mutex);
        auto [itr, emplaced] = m_devices.try_emplace(candidate.identifier, candidate);
        auto& details = itr->second;
        if (!emplaced) {
            if (!candidate.name.empty()) { details.name = candidate.name; }
            if (candidate.kind != Kind::Unknown) { details.kind = candidate.kind; }
        }
        details.trust = TrustState::Trusted;
        details.paired = TimeUtils::GetSystemTimestamp();
        details.pairings = emplaced ? 1 : details.pairings + 1;
        updated = details;
    }

    NotifyObservers(updated);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Device::Registry::Revoke(Identifier const& identifier)
{
    Details updated;
    {
        std::scoped_lock lock(m_mutex);
        auto const itr = m_devices.find(identifier);
        if (itr == m_devices.end() || itr->second.trust == TrustState::Revoked) { return false; }
        itr->second.trust = TrustState::Revoked;
        updated = itr->second;
    }

    NotifyObservers(updated);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Device::Details> Device::Registry::Find(Identifier const& identifier) const
{
    std::shared_lock lock(m_mutex);
    if (auto const itr = m_devices.find(identifier); itr != m_devices.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

Device::TrustState Device::Registry::GetTrustState(Identifier const& identifier) const
{
    std::shared_lock lock(m_mutex);
    if (auto const itr = m_devices.find(identifier); itr != m_devices.end()) { return itr->second.trust; }
    return TrustState::Unknown;
}

//----------------------------------------------------------------------------------------------------------------------

bool Device::Registry::IsTrusted(Identifier const& identifier) const
{
    return GetTrustState(identifier) == TrustState::Trusted;
}

//----------------------------------------------------------------------------------------------------------------------

Device::Registry::Snapshot Device::Registry::GetSnapshot() const
{
    Snapshot snapshot;
    {
        std::shared_lock lock(m_mutex);
        snapshot.reserve(m_devices.size());
        for (auto const& [identifier, details] : m_devices) { snapshot.emplace_back(details); }
    }

    std::ranges::sort(snapshot, [] (auto const& lhs, auto const& rhs) { return lhs.identifier < rhs.identifier; });
    return snapshot;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Device::Registry::Size() const
{
    std::shared_lock lock(m_mutex);
    return m_devices.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Device::Registry::TrustedCount() const
{
    std::shared_lock lock(m_mutex);
    return static_cast<std::size_t>(std::ranges::count_if(
        m_devices, [] (auto const& entry) { return entry.second.trust == TrustState::Trusted; }));
}

//----------------------------------------------------------------------------------------------------------------------

void Device::Registry::NotifyObservers(Details const& details) const
{
    // Observers are notified outside of the device lock such that they may read the registry.
    std::shared_lock lock(m_observersMutex);
    for (auto const observer : m_observers) { observer->OnTrustStateChanged(details); }
}

//----------------------------------------------------------------------------------------------------------------------
