//----------------------------------------------------------------------------------------------------------------------
// File: Logger.hpp
// Description: Registration of the named loggers used by each component.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#define SPDLOG_NO_THREAD_ID
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Logger {
//----------------------------------------------------------------------------------------------------------------------

void Initialize(spdlog::level::level_enum verbosity = spdlog::level::info);

// Fetch a registered logger. If the logger has not been registered (e.g. a unit test that did not initialize the
// loggers) a logger without any sinks will be created so callers never need to null check.
[[nodiscard]] std::shared_ptr<spdlog::logger> Get(std::string_view name);

//----------------------------------------------------------------------------------------------------------------------
namespace Name {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "core";
constexpr std::string_view Discovery = "discovery";
constexpr std::string_view Pairing = "pairing";
constexpr std::string_view Connection = "connection";
constexpr std::string_view Router = "router";
constexpr std::string_view Clipboard = "clipboard";
constexpr std::string_view Notification = "notification";
constexpr std::string_view Transfer = "transfer";
constexpr std::string_view WebSocket = "websocket";

//----------------------------------------------------------------------------------------------------------------------
} // Name namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Pattern {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Prefix = "==";
constexpr std::string_view TagOpen = "[";
constexpr std::string_view TagClose = "]";
constexpr std::string_view TagSeperator = " ";
constexpr std::string_view Date = "[%a, %d %b %Y %T]";
constexpr std::string_view Message = "%^[%l] - %v%$";

[[nodiscard]] std::string Generate(std::string_view color, std::vector<std::string> const& tags);

//----------------------------------------------------------------------------------------------------------------------
} // Pattern namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Color {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "\x1b[1;38;2;0;255;175m";
constexpr std::string_view Discovery = "\x1b[1;38;2;186;104;200m";
constexpr std::string_view Session = "\x1b[1;38;2;0;195;255m";
constexpr std::string_view Channel = "\x1b[1;38;2;255;170;0m";

constexpr spdlog::string_view_t Info = "\x1b[38;2;26;204;148m";
constexpr spdlog::string_view_t Warn = "\x1b[38;2;255;214;102m";
constexpr spdlog::string_view_t Error = "\x1b[38;2;255;56;56m";
constexpr spdlog::string_view_t Critical = "\x1b[1;38;2;255;56;56m";
constexpr spdlog::string_view_t Debug = "\x1b[38;2;45;204;255m";
constexpr spdlog::string_view_t Trace = "\x1b[38;2;255;255;255m";

constexpr std::string_view Reset = "\x1b[0m";

[[nodiscard]] std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> CreateTrueColorConsole();

//----------------------------------------------------------------------------------------------------------------------
} // Color namespace
} // Logger namespace
//----------------------------------------------------------------------------------------------------------------------

inline void Logger::Initialize(spdlog::level::level_enum verbosity)
{
    struct Registration { std::string_view name; std::string_view color; std::vector<std::string> tags; };
    std::array<Registration, 9> const registrations = {{
        { Name::Core, Color::Core, { "core" } },
        { Name::Discovery, Color::Discovery, { "discovery" } },
        { Name::Pairing, Color::Core, { "pairing" } },
        { Name::Connection, Color::Session, { "connection" } },
        { Name::Router, Color::Channel, { "router" } },
        { Name::Clipboard, Color::Channel, { "clipboard" } },
        { Name::Notification, Color::Channel, { "notification" } },
        { Name::Transfer, Color::Channel, { "transfer" } },
        { Name::WebSocket, Color::Session, { "websocket" } },
    }};

    auto const spSink = Color::CreateTrueColorConsole();
    for (auto const& [name, color, tags] : registrations) {
        if (spdlog::get(name.data())) { continue; } // The loggers may only be registered once per process.
        auto spLogger = std::make_shared<spdlog::logger>(name.data(), spSink);
        spLogger->set_pattern(Pattern::Generate(color, tags));
        spdlog::register_logger(spLogger);
    }

    spdlog::set_level(verbosity);
}

//----------------------------------------------------------------------------------------------------------------------

inline std::shared_ptr<spdlog::logger> Logger::Get(std::string_view name)
{
    if (auto spLogger = spdlog::get(name.data()); spLogger) { return spLogger; }
    return std::make_shared<spdlog::logger>(name.data());
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string Logger::Pattern::Generate(std::string_view color, std::vector<std::string> const& tags)
{
    std::ostringstream oss;
    oss << Prefix << TagSeperator << Date << TagSeperator;
    for (auto const& tag : tags) {
        oss << TagOpen << color << tag << Color::Reset << TagClose << TagSeperator;
    }
    oss << Message;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> Logger::Color::CreateTrueColorConsole()
{
    auto spColorSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

    spColorSink->set_color_mode(spdlog::color_mode::automatic);
    spColorSink->set_color(spdlog::level::info, Color::Info);
    spColorSink->set_color(spdlog::level::warn, Color::Warn);
    spColorSink->set_color(spdlog::level::err, Color::Error);
    spColorSink->set_color(spdlog::level::critical, Color::Critical);
    spColorSink->set_color(spdlog::level::debug, Color::Debug);
    spColorSink->set_color(spdlog::level::trace, Color::Trace);

    return spColorSink;
}

//----------------------------------------------------------------------------------------------------------------------
