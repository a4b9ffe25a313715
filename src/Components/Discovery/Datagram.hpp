//----------------------------------------------------------------------------------------------------------------------
// File: Datagram.hpp
// Description: The JSON payload of the multicast discovery datagrams. Announcements advertise a service instance and
// the addresses it may be reached on, queries solicit an immediate announcement from every advertiser, and goodbyes
// withdraw an instance before its announcements would expire.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

enum class Intent : std::uint8_t { Announce, Goodbye, Query };

using Metadata = std::map<std::string, std::string>;

struct Datagram
{
    Intent intent = Intent::Announce;
    std::string serviceType;
    std::string serviceName;
    std::string instance;
    std::uint16_t port = 0;
    std::vector<std::string> addresses;
    Metadata metadata;
};

// Datagrams larger than this are neither sent nor accepted.
constexpr std::size_t MaximumDatagramSize = 8192;

[[nodiscard]] std::string_view IntentToString(Intent intent);
[[nodiscard]] std::optional<Intent> IntentFromString(std::string_view intent);

[[nodiscard]] std::string Encode(Datagram const& datagram);

// Returns nothing when the buffer is not a well formed datagram. Announcements and goodbyes must name an instance,
// announcements must also carry a valid port.
[[nodiscard]] std::optional<Datagram> Decode(std::string_view buffer);

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------
