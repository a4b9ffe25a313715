//----------------------------------------------------------------------------------------------------------------------
// File: FileStorage.hpp
// Description: The boundary to the storage that holds the files offered to peers and the files received from them.
// The transfer engine only moves bytes, the storage decides where the bytes live and what happens to partial files.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Device/Device.hpp"
#include "Components/Transfer/Status.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IFileStorage
{
public:
    struct Source
    {
        std::string fileId;
        std::string name;
        std::uint64_t size;
        std::string type;
        std::optional<std::string> checksum;
    };

    virtual ~IFileStorage() = default;

    // Sending {
    [[nodiscard]] virtual std::optional<Source> Describe(std::string const& fileId) = 0;
    [[nodiscard]] virtual std::optional<std::vector<std::uint8_t>> Read(
        std::string const& fileId, std::uint64_t offset, std::size_t size) = 0;
    // } Sending

    // Receiving {
    [[nodiscard]] virtual bool Open(
        Device::Identifier const& peer, Transfer::Identifier const& transfer,
        std::string const& name, std::uint64_t size) = 0;
    [[nodiscard]] virtual bool Write(
        Device::Identifier const& peer, Transfer::Identifier const& transfer,
        std::uint64_t offset, std::span<std::uint8_t const> data) = 0;
    [[nodiscard]] virtual bool Commit(Device::Identifier const& peer, Transfer::Identifier const& transfer) = 0;
    virtual void Discard(Device::Identifier const& peer, Transfer::Identifier const& transfer) = 0;
    // } Receiving
};

//----------------------------------------------------------------------------------------------------------------------
