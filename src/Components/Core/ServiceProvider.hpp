//----------------------------------------------------------------------------------------------------------------------
// File: ServiceProvider.hpp
// Description: A type indexed store of weak references to the hub's long lived services. Message handlers fetch
// the services they delegate to when the router is initialized.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <typeindex>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Hub {
//----------------------------------------------------------------------------------------------------------------------

class ServiceProvider;

//----------------------------------------------------------------------------------------------------------------------
} // Hub namespace
//----------------------------------------------------------------------------------------------------------------------

class Hub::ServiceProvider final
{
public:
    ServiceProvider() : m_services() {}

    // Services are keyed by the static type they are registered as, a later registration replaces an earlier one.
    template<typename Service>
    bool Register(std::shared_ptr<Service> const& spService)
    {
        if (!spService) { return false; }
        m_services.insert_or_assign(typeid(Service), std::weak_ptr<void>{ spService });
        return true;
    }

    // An empty reference is returned when the service was never registered or has since been destroyed.
    template<typename Service>
    [[nodiscard]] std::weak_ptr<Service> Fetch() const
    {
        auto const itr = m_services.find(typeid(Service));
        if (itr == m_services.end()) { return {}; }
        return std::static_pointer_cast<Service>(itr->second.lock());
    }

private:
    std::unordered_map<std::type_index, std::weak_ptr<void>> m_services;
};

//----------------------------------------------------------------------------------------------------------------------
