//----------------------------------------------------------------------------------------------------------------------
// File: Parser.hpp
// Description: Reads the hub's configuration file, merging any values the file provides beneath the values set at
// runtime. A missing file is generated with the defaults and a freshly generated device identifier.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Field.hpp"
#include "Options.hpp"
#include "StatusCode.hpp"
#include "Components/Device/Device.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Parser;

//----------------------------------------------------------------------------------------------------------------------
namespace Symbols {
//----------------------------------------------------------------------------------------------------------------------

DEFINE_FIELD_NAME(Identifier);
DEFINE_FIELD_NAME(Version);

//----------------------------------------------------------------------------------------------------------------------
} // Symbols namespace
//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Parser final
{
public:
    // Note: A parser constructed without a filepath does not use the filesystem.
    Parser();
    explicit Parser(std::filesystem::path const& filepath);
    ~Parser();

    Parser(Parser const&) = delete;
    Parser(Parser&&) = delete;
    Parser& operator=(Parser const&) = delete;
    Parser& operator=(Parser&&) = delete;

    [[nodiscard]] DeserializationResult FetchOptions();
    [[nodiscard]] SerializationResult Serialize();

    [[nodiscard]] std::filesystem::path const& GetFilepath() const;
    void DisableFilesystem();
    [[nodiscard]] bool FilesystemDisabled() const;

    [[nodiscard]] Device::Identifier const& GetIdentifier() const;
    [[nodiscard]] Device::Details GetDeviceDetails() const;
    [[nodiscard]] Options::Details const& GetDetailsOptions() const;
    [[nodiscard]] Options::Network const& GetNetworkOptions() const;
    [[nodiscard]] Options::Discovery const& GetDiscoveryOptions() const;
    [[nodiscard]] Options::Pairing const& GetPairingOptions() const;
    [[nodiscard]] Options::Sync const& GetSyncOptions() const;
    [[nodiscard]] Options::Transfer const& GetTransferOptions() const;

    [[nodiscard]] bool Validated() const;
    [[nodiscard]] bool Changed() const;

    // Runtime overrides take precedence over the values in the file. They are applied before fetching the options.
    [[nodiscard]] bool SetDeviceName(std::string_view name);
    [[nodiscard]] bool SetNetworkInterface(std::string_view interface);
    [[nodiscard]] bool SetNetworkPort(std::uint16_t port);
    [[nodiscard]] bool SetDiscoveryEnabled(bool enabled);
    [[nodiscard]] bool SetClipboardSync(bool enabled);
    [[nodiscard]] bool SetNotificationMirroring(bool enabled);
    [[nodiscard]] bool SetRelay(bool enabled);

private:
    [[nodiscard]] DeserializationResult ProcessFile();
    [[nodiscard]] DeserializationResult Deserialize();
    [[nodiscard]] ValidationResult ValidateOptions();

    void InitializeIdentifier();

    std::shared_ptr<spdlog::logger> m_logger;

    Field<Symbols::Version, std::string> m_version;
    OptionalField<Symbols::Identifier, std::string> m_optIdentifier;
    std::filesystem::path m_filepath;

    Options::Details m_details;
    Options::Network m_network;
    Options::Discovery m_discovery;
    Options::Pairing m_pairing;
    Options::Sync m_sync;
    Options::Transfer m_transfer;

    bool m_validated;
    bool m_changed;
};

//----------------------------------------------------------------------------------------------------------------------
