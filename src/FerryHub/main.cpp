//----------------------------------------------------------------------------------------------------------------------
// File: main.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Core.hpp"
#include "ExecutionToken.hpp"
#include "StartupOptions.hpp"
#include "Components/Configuration/DevicePersistor.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Utilities/ExecutionStatus.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/core/quick_exit.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <tuple>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace Signal {
//----------------------------------------------------------------------------------------------------------------------

Hub::ExecutionToken ExecutionToken;

extern "C" void OnShutdownRequested(std::int32_t signal);

//----------------------------------------------------------------------------------------------------------------------
} // Signal namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

using Resources = std::tuple<
    ParseCode,
    std::unique_ptr<Configuration::Parser>,
    std::shared_ptr<Configuration::DevicePersistor>,
    Hub::Core::Directives>;

Resources InitializeResources(std::int32_t argc, char** argv);

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------

extern "C" void Signal::OnShutdownRequested(std::int32_t signal)
{
    // Note: If we haven't started the hub yet, there is no additional cleanup required (std::exit() is not signal
    // safe). boost::quick_exit will alias to the best alternative available on the platform.
    if (!ExecutionToken.IsExecutionActive()) { boost::quick_exit(signal); }
    // Use the token to notify the hub that a shutdown has been requested. In the context of the console application,
    // SIGINT and SIGTERM are considered are expected shutdown signals (i.e. not errors).
    [[maybe_unused]] bool const result = ExecutionToken.RequestStop();
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t main(std::int32_t argc, char** argv)
{
    // Register listeners such that we can properly handle shutdown requests via process signals.
    if (SIG_ERR == std::signal(SIGINT, Signal::OnShutdownRequested)) { return 1; }
    if (SIG_ERR == std::signal(SIGTERM, Signal::OnShutdownRequested)) { return 1; }

    auto const [code, upParser, spPersistor, directives] = Startup::InitializeResources(argc, argv);
    switch (code) {
        case Startup::ParseCode::Success: assert(upParser && spPersistor); break;
        case Startup::ParseCode::ExitRequested: return 0;
        case Startup::ParseCode::Malformed: return 1;
    }

    auto const logger = Logger::Get(Logger::Name::Core);
    logger->info("Welcome to Ferry! (v{})", Ferry::Version);
    logger->info("Device Identifier: {}", upParser->GetIdentifier());

    Hub::Core core(Signal::ExecutionToken, *upParser, spPersistor, directives);

    auto const status = core.Startup(); // Start the core, the runtime will block will until execution completes.
    switch (status) {
        case ExecutionStatus::RequestedShutdown: break;
        // Log an error and return a non-success code if the core fails to begin execution due to an initialization error.
        case ExecutionStatus::InitializationFailed: {
            logger->critical("Failed to initialize the hub's resources!");
            return 1;
        }
        // Log an error and return a non-success code if the runtime is shutdown due to an unexpected error.
        case ExecutionStatus::UnexpectedShutdown: {
            logger->critical("An unexpected error caused the hub to shutdown!");
            return 1;
        }
        // Currently, only the explicit status cases are expected for a foreground process.
        default: assert(false); return 1;
    }

    return 0;
}

//----------------------------------------------------------------------------------------------------------------------

Startup::Resources Startup::InitializeResources(std::int32_t argc, char** argv)
{
    Options options;
    switch (options.Parse(argc, argv)) {
        // On success, we can continue directly to initializing the runtime resources.
        case ParseCode::Success: break;
        // Early return when we don't need initialize the resources (e.g. when "--help" is used).
        case ParseCode::ExitRequested: return { ParseCode::ExitRequested, nullptr, nullptr, {} };
        // Log out an error and early return when the provided flags were malformed.
        default: {
            std::cout << "Unable to parse startup options!" << std::endl;
            return { ParseCode::Malformed, nullptr, nullptr, {} };
        }
    }

    // Initialize the logging resources for the application.
    Logger::Initialize(options.GetVerbosityLevel());
    auto const logger = Logger::Get(Logger::Name::Core); // From here on we should use the logger for errors.

    // Create a configuration parser to read the configuration file at the provided location. The command line
    // overrides are applied before the file is read, such that a generated file captures them.
    auto upParser = std::make_unique<Configuration::Parser>(options.GetConfigPath());
    if (!options.ApplyOverrides(*upParser)) {
        logger->critical("An option provided on the command line is not an allowable value!");
        return { ParseCode::Malformed, nullptr, nullptr, {} };
    }

    // Note: Generating the device identifier draws from the system's random source, which may fail.
    try {
        if (auto const [status, message] = upParser->FetchOptions(); status != Configuration::StatusCode::Success) {
            logger->critical("An unexpected error occured while parsing the configuration file: {}", message);
            return { ParseCode::Malformed, nullptr, nullptr, {} };
        }
    } catch (std::exception const& exception) {
        logger->critical("Unable to generate the device identifier: {}", exception.what());
        return { ParseCode::Malformed, nullptr, nullptr, {} };
    }

    // Create the device persistor, the trusted devices are restored when the core attaches its registry.
    auto spPersistor = std::make_shared<Configuration::DevicePersistor>(options.GetDevicesPath());

    Hub::Core::Directives const directives{
        .issueCode = options.ShouldIssueCode(),
        .optHubTarget = options.GetHubTarget(),
        .optPairingCode = options.GetPairingCode(),
    };

    // Indicate that the startup resources have been successfully initialized and provide them to the caller.
    return { ParseCode::Success, std::move(upParser), std::move(spPersistor), directives };
}

//----------------------------------------------------------------------------------------------------------------------
