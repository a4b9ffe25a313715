//----------------------------------------------------------------------------------------------------------------------
// File: Console.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Console.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/string.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cassert>
#include <cerrno>
#include <poll.h>
#include <sstream>
#include <unistd.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

struct Usage
{
    std::string_view name;
    Hub::Verb verb;
    std::size_t minimum;
    std::size_t maximum; // The last argument captures the remainder of the line.
    std::string_view arguments;
    std::string_view description;
};

constexpr std::array<Usage, 13> Usages = {{
    { "help", Hub::Verb::Help, 0, 0, "", "Display the available commands." },
    { "peers", Hub::Verb::Peers, 0, 0, "", "List the known devices and their connection state." },
    { "code", Hub::Verb::Code, 0, 1, "[seconds]", "Issue a pairing code." },
    { "clip", Hub::Verb::Clip, 1, 1, "<text>", "Set the local clipboard and share it with the peers." },
    { "notify", Hub::Verb::Notify, 3, 3, "<app> <title> <content>", "Post a local notification to the peers." },
    { "dismiss", Hub::Verb::Dismiss, 2, 2, "<device> <id>", "Dismiss a notification mirrored from a peer." },
    { "offer", Hub::Verb::Offer, 1, 1, "<filepath>", "Register a local file that peers may download." },
    { "upload", Hub::Verb::Upload, 2, 2, "<device> <file id>", "Send an offered file to a peer." },
    { "download", Hub::Verb::Download, 2, 2, "<device> <file id>", "Request a file offered by a peer." },
    { "cancel", Hub::Verb::Cancel, 2, 2, "<device> <transfer id>", "Cancel a transfer." },
    { "transfers", Hub::Verb::Transfers, 1, 1, "<device>", "List the transfers of a peer." },
    { "unpair", Hub::Verb::Unpair, 1, 1, "<device>", "Revoke the trust of a paired device." },
    { "quit", Hub::Verb::Quit, 0, 0, "", "Shutdown the hub." },
}};

constexpr auto PollTimeout = 250; // milliseconds
constexpr std::size_t ReadBufferSize = 4096;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::optional<Hub::Command> Hub::ParseCommand(std::string_view line)
{
    auto const trimmed = boost::algorithm::trim_copy(std::string{ line });
    if (trimmed.empty()) { return {}; }

    auto const separator = trimmed.find_first_of(" \t");
    auto const name = boost::algorithm::to_lower_copy(trimmed.substr(0, separator));
    auto const itr = std::ranges::find_if(local::Usages, [&name] (auto const& usage) { return usage.name == name; });
    if (itr == local::Usages.end()) { return {}; }

    Command command{ .verb = itr->verb, .arguments = {} };

    std::string remainder = (separator == std::string::npos) ? std::string{} : trimmed.substr(separator);
    boost::algorithm::trim_left(remainder);
    while (!remainder.empty()) {
        if (command.arguments.size() == itr->maximum) { return {}; } // Too many arguments have been supplied.

        // The final argument captures the rest of the line, which permits spaces in text and titles.
        if (command.arguments.size() + 1 == itr->maximum) {
            command.arguments.emplace_back(remainder);
            break;
        }

        auto const next = remainder.find_first_of(" \t");
        command.arguments.emplace_back(remainder.substr(0, next));
        remainder = (next == std::string::npos) ? std::string{} : remainder.substr(next);
        boost::algorithm::trim_left(remainder);
    }

    if (command.arguments.size() < itr->minimum) { return {}; }

    return command;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Hub::GenerateCommandHelpText()
{
    std::ostringstream oss;
    oss << "Commands:";
    for (auto const& usage : local::Usages) {
        oss << "\n  " << usage.name;
        if (!usage.arguments.empty()) { oss << " " << usage.arguments; }
        oss << " - " << usage.description;
    }
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

Hub::ConsoleClipboard::ConsoleClipboard()
    : m_logger(Logger::Get(Logger::Name::Core))
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Hub::ConsoleClipboard::Apply(std::string const& text, Device::Identifier const& origin)
{
    m_logger->info("The clipboard was updated by {} ({} characters).", origin, text.size());
    m_logger->trace("Clipboard contents: \"{}\"", text);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

Hub::ConsoleNotifications::ConsoleNotifications()
    : m_logger(Logger::Get(Logger::Name::Core))
{
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::ConsoleNotifications::Present(Device::Identifier const& origin, Message::Notification const& notification)
{
    m_logger->info("Received notification {} of {} from {}.", notification.id, notification.appName, origin);
    m_logger->trace("Notification {}: {} - {}", notification.id, notification.title, notification.content);
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::ConsoleNotifications::Dismiss(Device::Identifier const& origin, std::string const& id)
{
    m_logger->info("Notification {} from {} was dismissed.", id, origin);
}

//----------------------------------------------------------------------------------------------------------------------

Hub::ConsoleTransferReporter::ConsoleTransferReporter()
    : m_logger(Logger::Get(Logger::Name::Transfer))
{
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::ConsoleTransferReporter::OnTransferProgress(
    Device::Identifier const& peer, Transfer::Summary const& summary, Transfer::Progress const& progress)
{
    auto const eta = progress.eta ? fmt::format("{}s", progress.eta->count()) : std::string{ "unknown" };
    m_logger->info(
        "{} of \"{}\" with {}: {:.1f}% ({:.0f} B/s, eta {}).",
        Transfer::DirectionToString(summary.direction), summary.name, peer, progress.percent, progress.throughput, eta);
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::ConsoleTransferReporter::OnTransferFinished(Device::Identifier const& peer, Transfer::Summary const& summary)
{
    m_logger->debug(
        "Transfer {} with {} settled as {}.", summary.identifier, peer, Transfer::StatusToString(summary.status));
}

//----------------------------------------------------------------------------------------------------------------------

Hub::CommandConsole::CommandConsole(CommandHandler const& handler)
    : m_handler(handler)
    , m_logger(Logger::Get(Logger::Name::Core))
    , m_reader()
{
    assert(m_handler);
}

//----------------------------------------------------------------------------------------------------------------------

Hub::CommandConsole::~CommandConsole()
{
    Stop();
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::CommandConsole::Start()
{
    if (m_reader.joinable()) { return; }
    m_reader = std::jthread([this] (std::stop_token token) { Reader(token); });
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::CommandConsole::Stop()
{
    if (!m_reader.joinable()) { return; }
    m_reader.request_stop();
    m_reader.join();
}

//----------------------------------------------------------------------------------------------------------------------

void Hub::CommandConsole::Reader(std::stop_token token)
{
    std::string pending;
    std::array<char, local::ReadBufferSize> buffer = {};

    while (!token.stop_requested()) {
        // Standard input is polled such that a stop request is observed without waiting on the operator.
        pollfd descriptor{ .fd = STDIN_FILENO, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&descriptor, 1, local::PollTimeout);
        if (ready < 0) {
            if (errno == EINTR) { continue; }
            m_logger->warn("Unable to read commands from the console.");
            return;
        }
        if (ready == 0) { continue; }

        auto const received = ::read(STDIN_FILENO, buffer.data(), buffer.size());
        if (received <= 0) {
            if (received < 0 && errno == EINTR) { continue; }
            m_logger->debug("The console input has been closed.");
            return;
        }

        pending.append(buffer.data(), static_cast<std::size_t>(received));
        for (auto end = pending.find('\n'); end != std::string::npos; end = pending.find('\n')) {
            auto const line = pending.substr(0, end);
            pending.erase(0, end + 1);
            if (boost::algorithm::trim_copy(line).empty()) { continue; }

            if (auto const optCommand = ParseCommand(line); optCommand) {
                m_handler(*optCommand);
            } else {
                m_logger->warn("Unrecognized command \"{}\". Enter \"help\" to list the commands.", line);
            }
        }
    }
}

//----------------------------------------------------------------------------------------------------------------------
