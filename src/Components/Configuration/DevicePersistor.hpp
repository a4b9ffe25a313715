//----------------------------------------------------------------------------------------------------------------------
// File: DevicePersistor.hpp
// Description: Stores the paired devices such that trust survives a restart of the hub.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "StatusCode.hpp"
#include "Components/Device/Device.hpp"
#include "Interfaces/DeviceObserver.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }
namespace Device { class Registry; }

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class DevicePersistor;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::DevicePersistor final : public IDeviceObserver
{
public:
    explicit DevicePersistor(std::filesystem::path const& filepath, bool shouldBuildPath = true);
    ~DevicePersistor();

    DevicePersistor(DevicePersistor const&) = delete;
    DevicePersistor(DevicePersistor&&) = delete;
    DevicePersistor& operator=(DevicePersistor const&) = delete;
    DevicePersistor& operator=(DevicePersistor&&) = delete;

    [[nodiscard]] std::filesystem::path const& GetFilepath() const;

    void SetRegistry(Device::Registry* const registry);

    // Loads the stored devices into the registry. A missing or corrupt file leaves the registry without devices.
    [[nodiscard]] DeserializationResult FetchDevices();
    [[nodiscard]] SerializationResult Serialize();

    // IDeviceObserver {
    virtual void OnTrustStateChanged(Device::Details const& details) override;
    // } IDeviceObserver

private:
    [[nodiscard]] DeserializationResult DecodeDevicesFile(std::vector<Device::Details>& devices) const;

    std::shared_ptr<spdlog::logger> m_logger;
    Device::Registry* m_registry;

    mutable std::mutex m_fileMutex;
    std::filesystem::path m_filepath;
};

//----------------------------------------------------------------------------------------------------------------------
