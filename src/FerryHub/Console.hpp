//----------------------------------------------------------------------------------------------------------------------
// File: Console.hpp
// Description: The console stand ins for the platform collaborators of the hub. The clipboard and notification
// adapters print what a platform layer would present, and the command console reads the operator's requests from
// standard input.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Interfaces/ClipboardAccess.hpp"
#include "Interfaces/NotificationSink.hpp"
#include "Interfaces/TransferObserver.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Hub {
//----------------------------------------------------------------------------------------------------------------------

class ConsoleClipboard;
class ConsoleNotifications;
class ConsoleTransferReporter;
class CommandConsole;

struct Command;

enum class Verb : std::uint32_t
{
    Help, Peers, Code, Clip, Notify, Dismiss, Offer, Upload, Download, Cancel, Transfers, Unpair, Quit
};

// Splits a line into a verb and its arguments. The final argument of clip and notify captures the rest of the line.
[[nodiscard]] std::optional<Command> ParseCommand(std::string_view line);
[[nodiscard]] std::string GenerateCommandHelpText();

//----------------------------------------------------------------------------------------------------------------------
} // Hub namespace
//----------------------------------------------------------------------------------------------------------------------

struct Hub::Command
{
    Verb verb;
    std::vector<std::string> arguments;
};

//----------------------------------------------------------------------------------------------------------------------

class Hub::ConsoleClipboard final : public IClipboardAccess
{
public:
    ConsoleClipboard();

    // IClipboardAccess {
    [[nodiscard]] virtual bool Apply(std::string const& text, Device::Identifier const& origin) override;
    // } IClipboardAccess

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------

class Hub::ConsoleNotifications final : public INotificationSink
{
public:
    ConsoleNotifications();

    // INotificationSink {
    virtual void Present(Device::Identifier const& origin, Message::Notification const& notification) override;
    virtual void Dismiss(Device::Identifier const& origin, std::string const& id) override;
    // } INotificationSink

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------

class Hub::ConsoleTransferReporter final : public ITransferObserver
{
public:
    ConsoleTransferReporter();

    // ITransferObserver {
    virtual void OnTransferProgress(
        Device::Identifier const& peer, Transfer::Summary const& summary, Transfer::Progress const& progress) override;
    virtual void OnTransferFinished(Device::Identifier const& peer, Transfer::Summary const& summary) override;
    // } ITransferObserver

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------

class Hub::CommandConsole final
{
public:
    using CommandHandler = std::function<void(Command const&)>;

    explicit CommandConsole(CommandHandler const& handler);
    ~CommandConsole();

    CommandConsole(CommandConsole const&) = delete;
    CommandConsole(CommandConsole&&) = delete;
    CommandConsole& operator=(CommandConsole const&) = delete;
    CommandConsole& operator=(CommandConsole&&) = delete;

    void Start();
    void Stop();

private:
    void Reader(std::stop_token token);

    CommandHandler const m_handler;
    std::shared_ptr<spdlog::logger> m_logger;
    std::jthread m_reader;
};

//----------------------------------------------------------------------------------------------------------------------
