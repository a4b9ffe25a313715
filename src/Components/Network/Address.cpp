//----------------------------------------------------------------------------------------------------------------------
// File: Address.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Address.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/ip/address.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cctype>
#include <charconv>
//----------------------------------------------------------------------------------------------------------------------

Network::AddressType Network::ParseHostType(std::string_view host)
{
    if (host.empty()) { return AddressType::Invalid; }

    // IPv6 addresses must be wrapped with [..] in order to distinguish the port separator.
    bool const isIPv6Assumed = host.front() == '[' && host.back() == ']';
    std::string const check = isIPv6Assumed ?
        std::string{ host.begin() + 1, host.end() - 1 } : std::string{ host.begin(), host.end() };

    boost::system::error_code error;
    auto const address = boost::asio::ip::make_address(check, error);
    if (!error) {
        if (address.is_v6() && !isIPv6Assumed) { return AddressType::Invalid; }
        return address.is_v4() ? AddressType::IPv4 : AddressType::IPv6;
    }

    if (isIPv6Assumed) { return AddressType::Invalid; }

    bool const isHostname = std::ranges::all_of(check, [] (char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.' || c == '_';
    });

    return isHostname ? AddressType::Hostname : AddressType::Invalid;
}

//----------------------------------------------------------------------------------------------------------------------

Network::Address::Address()
    : m_uri()
    , m_host()
    , m_port(0)
    , m_type(AddressType::Invalid)
{
}

//----------------------------------------------------------------------------------------------------------------------

Network::Address::Address(std::string_view host, std::uint16_t port)
    : m_uri()
    , m_host(host)
    , m_port(port)
    , m_type(AddressType::Invalid)
{
    // Addresses sourced from the network stack (e.g. discovery) will not have the IPv6 brackets applied.
    boost::system::error_code error;
    if (auto const address = boost::asio::ip::make_address(m_host, error); !error && address.is_v6()) {
        m_host = "[" + m_host + "]";
    }

    m_type = ParseHostType(m_host);
    if (m_type == AddressType::Invalid) { Reset(); return; }

    m_uri.append(Scheme).append(SchemeSeperator).append(GetAuthority());
}

//----------------------------------------------------------------------------------------------------------------------

std::strong_ordering Network::Address::operator<=>(Address const& other) const
{
    return m_uri <=> other.m_uri;
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::Address::operator==(Address const& other) const
{
    return m_uri == other.m_uri;
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Network::Address::GetUri() const { return m_uri; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Network::Address::GetHost() const { return m_host; }

//----------------------------------------------------------------------------------------------------------------------

std::uint16_t Network::Address::GetPort() const { return m_port; }

//----------------------------------------------------------------------------------------------------------------------

std::string Network::Address::GetAuthority() const
{
    return m_host + std::string{ ComponentSeperator } + std::to_string(m_port);
}

//----------------------------------------------------------------------------------------------------------------------

Network::AddressType Network::Address::GetType() const { return m_type; }

//----------------------------------------------------------------------------------------------------------------------

bool Network::Address::IsValid() const
{
    return m_type != AddressType::Invalid && !m_uri.empty();
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::Address::ParseUri(std::string_view uri)
{
    if (auto const boundary = uri.find(SchemeSeperator); boundary != std::string_view::npos) {
        if (uri.substr(0, boundary) != Scheme) { return false; }
        uri.remove_prefix(boundary + SchemeSeperator.size());
    }

    // Any trailing resource path (e.g. "/ws") is not part of the authority.
    if (auto const path = uri.find('/'); path != std::string_view::npos) { uri = uri.substr(0, path); }

    auto const separator = uri.find_last_of(ComponentSeperator);
    if (separator == std::string_view::npos || separator == 0) { return false; }

    std::string_view const host = uri.substr(0, separator);
    std::string_view const port = uri.substr(separator + 1);
    if (port.empty() || port.size() > 5 || !std::ranges::all_of(port, [] (char c) { return c >= '0' && c <= '9'; })) { return false; }

    std::uint32_t number = 0;
    auto const [end, error] = std::from_chars(port.data(), port.data() + port.size(), number);
    if (error != std::errc{} || end != port.data() + port.size() || number == 0 || number > 65535) { return false; }

    m_type = ParseHostType(host);
    if (m_type == AddressType::Invalid) { return false; }

    m_host = host;
    m_port = static_cast<std::uint16_t>(number);
    m_uri.clear();
    m_uri.append(Scheme).append(SchemeSeperator).append(GetAuthority());
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Network::Address::Reset()
{
    m_uri.clear();
    m_host.clear();
    m_port = 0;
    m_type = AddressType::Invalid;
}

//----------------------------------------------------------------------------------------------------------------------

Network::BindingAddress::BindingAddress()
    : Address()
{
}

//----------------------------------------------------------------------------------------------------------------------

Network::BindingAddress::BindingAddress(std::string_view interface, std::uint16_t port)
    : Address(interface, port)
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Network::BindingAddress::IsWildcard() const
{
    return m_host == "0.0.0.0" || m_host == "[::]";
}

//----------------------------------------------------------------------------------------------------------------------

Network::RemoteAddress::RemoteAddress()
    : Address()
    , m_origin(Origin::Invalid)
{
}

//----------------------------------------------------------------------------------------------------------------------

Network::RemoteAddress::RemoteAddress(std::string_view host, std::uint16_t port, Origin origin)
    : Address(host, port)
    , m_origin(IsValid() ? origin : Origin::Invalid)
{
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Network::RemoteAddress> Network::RemoteAddress::FromUri(std::string_view uri, Origin origin)
{
    RemoteAddress address;
    if (!address.ParseUri(uri)) { return {}; }
    address.m_origin = origin;
    return address;
}

//----------------------------------------------------------------------------------------------------------------------

Network::RemoteAddress::Origin Network::RemoteAddress::GetOrigin() const { return m_origin; }

//----------------------------------------------------------------------------------------------------------------------
