//----------------------------------------------------------------------------------------------------------------------
// File: Address.hpp
// Description: Classes to encapsulate the uris of listening interfaces and remote peers (i.e. ws://127.0.0.1:8765).
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <compare>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Network {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Scheme = "ws";
constexpr std::string_view SchemeSeperator = "://";
constexpr std::string_view ComponentSeperator = ":";

class Address;
class BindingAddress;
class RemoteAddress;

template<typename AddressType>
concept ValidAddressType = std::derived_from<AddressType, Network::Address>;

enum class AddressType : std::uint8_t { IPv4, IPv6, Hostname, Invalid };

[[nodiscard]] AddressType ParseHostType(std::string_view host);

//----------------------------------------------------------------------------------------------------------------------
} // Network namespace
//----------------------------------------------------------------------------------------------------------------------

class Network::Address
{
public:
    virtual ~Address() = default;

    Address(Address const& other) = default;
    Address(Address&& other) = default;
    Address& operator=(Address const& other) = default;
    Address& operator=(Address&& other) = default;

    [[nodiscard]] std::strong_ordering operator<=>(Address const& other) const;
    [[nodiscard]] bool operator==(Address const& other) const;

    [[nodiscard]] std::string const& GetUri() const;
    [[nodiscard]] std::string const& GetHost() const;
    [[nodiscard]] std::uint16_t GetPort() const;
    [[nodiscard]] std::string GetAuthority() const;
    [[nodiscard]] AddressType GetType() const;

    [[nodiscard]] bool IsValid() const;

protected:
    Address();
    Address(std::string_view host, std::uint16_t port);

    // Parses an authority with an optional scheme (e.g. "ws://[::1]:8765" or "192.168.1.2:8765").
    [[nodiscard]] bool ParseUri(std::string_view uri);
    void Reset();

    std::string m_uri;
    std::string m_host;
    std::uint16_t m_port;
    AddressType m_type;
};

//----------------------------------------------------------------------------------------------------------------------

class Network::BindingAddress : public Network::Address
{
public:
    BindingAddress();
    BindingAddress(std::string_view interface, std::uint16_t port);
    ~BindingAddress() = default;

    BindingAddress(BindingAddress const& other) = default;
    BindingAddress(BindingAddress&& other) = default;
    BindingAddress& operator=(BindingAddress const& other) = default;
    BindingAddress& operator=(BindingAddress&& other) = default;

    [[nodiscard]] bool IsWildcard() const;
};

//----------------------------------------------------------------------------------------------------------------------

class Network::RemoteAddress : public Network::Address
{
public:
    enum class Origin : std::uint32_t { Invalid, Discovery, Network, User };

    RemoteAddress();
    RemoteAddress(std::string_view host, std::uint16_t port, Origin origin = Origin::Network);
    ~RemoteAddress() = default;

    RemoteAddress(RemoteAddress const& other) = default;
    RemoteAddress(RemoteAddress&& other) = default;
    RemoteAddress& operator=(RemoteAddress const& other) = default;
    RemoteAddress& operator=(RemoteAddress&& other) = default;

    [[nodiscard]] static std::optional<RemoteAddress> FromUri(std::string_view uri, Origin origin = Origin::User);

    [[nodiscard]] Origin GetOrigin() const;

private:
    Origin m_origin;
};

//----------------------------------------------------------------------------------------------------------------------

template <Network::ValidAddressType AddressType>
struct fmt::formatter<AddressType>
{
    template<typename ParseContext>
    constexpr auto parse(ParseContext& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(AddressType const& address, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", address.GetUri());
    }
};

//----------------------------------------------------------------------------------------------------------------------
