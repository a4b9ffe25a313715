//----------------------------------------------------------------------------------------------------------------------
// File: Defaults.hpp
// Description: The values used for any option omitted from the configuration file.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration::Defaults {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t FileSizeLimit = 12'000; // Limit the configuration files to 12KB
constexpr std::uint32_t DeviceFileSizeLimit = 1'000'000;

std::filesystem::path const FallbackConfigurationFolder = "/etc/";

constexpr std::string_view DeviceKind = "hub";

constexpr std::string_view NetworkInterface = "0.0.0.0";
constexpr std::uint16_t NetworkPort = 8765;

constexpr auto ConnectionTimeout = std::chrono::milliseconds{ 5'000 };
constexpr auto HeartbeatInterval = std::chrono::milliseconds{ 10'000 };
constexpr std::uint32_t HeartbeatTolerance = 3;
constexpr auto RetryBase = std::chrono::milliseconds{ 500 };
constexpr auto RetryCeiling = std::chrono::milliseconds{ 30'000 };
constexpr std::uint32_t RetryLimit = 8;
constexpr double RetryJitter = 0.2;

constexpr bool DiscoveryEnabled = true;
constexpr std::string_view DiscoveryServiceType = "_ferry-sync._tcp";
constexpr std::string_view DiscoveryGroup = "239.255.77.77";
constexpr std::uint16_t DiscoveryPort = 53535;
constexpr auto DiscoveryInterval = std::chrono::milliseconds{ 5'000 };
constexpr auto DiscoveryExpiration = std::chrono::milliseconds{ 20'000 };

constexpr auto PairingLifetime = std::chrono::milliseconds{ 120'000 };
constexpr std::uint32_t PairingCodeLength = 6;

constexpr bool SyncClipboard = true;
constexpr bool SyncNotifications = true;
constexpr bool SyncRelay = false;

constexpr std::string_view TransferDirectory = "~/Downloads/Ferry";
constexpr std::uint32_t TransferChunkSize = 64 * 1024;
constexpr std::uint32_t TransferWindow = 8;
constexpr bool TransferResumable = true;
constexpr std::uint64_t TransferRateLimit = 0;
constexpr auto TransferGracePeriod = std::chrono::milliseconds{ 60'000 };
constexpr auto TransferStallTimeout = std::chrono::milliseconds{ 30'000 };
constexpr auto TransferResumeTimeout = std::chrono::milliseconds{ 300'000 };
constexpr std::uint32_t TransferProgressInterval = 16;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration::Defaults namespace
//----------------------------------------------------------------------------------------------------------------------
