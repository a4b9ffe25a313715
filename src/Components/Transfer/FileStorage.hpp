//----------------------------------------------------------------------------------------------------------------------
// File: FileStorage.hpp
// Description: The default storage of transferred files. Received files are written beside the final destination as a
// partial file and moved into place when the transfer completes. Existing files are never overwritten; a numeric
// suffix is appended to the name of the incoming file instead.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Interfaces/FileStorage.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Transfer {
//----------------------------------------------------------------------------------------------------------------------

class FileStorage;

constexpr std::string_view PartialExtension = ".part";

// Reduces a name announced by a peer to a single path component without separators or reserved characters.
[[nodiscard]] std::string SanitizeFilename(std::string_view name);

//----------------------------------------------------------------------------------------------------------------------
} // Transfer namespace
//----------------------------------------------------------------------------------------------------------------------

class Transfer::FileStorage : public IFileStorage
{
public:
    explicit FileStorage(std::filesystem::path const& directory);
    ~FileStorage();

    FileStorage(FileStorage const&) = delete;
    FileStorage(FileStorage&&) = delete;
    FileStorage& operator=(FileStorage const&) = delete;
    FileStorage& operator=(FileStorage&&) = delete;

    // Registers a local file that may be sent to peers. Returns the identifier peers use to request it.
    [[nodiscard]] std::optional<std::string> Offer(std::filesystem::path const& path);
    [[nodiscard]] bool Withdraw(std::string const& fileId);

    [[nodiscard]] std::filesystem::path const& GetDirectory() const;
    [[nodiscard]] std::optional<std::filesystem::path> GetOfferedPath(std::string const& fileId) const;
    [[nodiscard]] std::optional<std::filesystem::path> GetCommittedPath(
        Device::Identifier const& peer, Transfer::Identifier const& transfer) const;
    [[nodiscard]] std::size_t GetPendingCount() const;

    // IFileStorage {
    [[nodiscard]] virtual std::optional<Source> Describe(std::string const& fileId) override;
    [[nodiscard]] virtual std::optional<std::vector<std::uint8_t>> Read(
        std::string const& fileId, std::uint64_t offset, std::size_t size) override;

    [[nodiscard]] virtual bool Open(
        Device::Identifier const& peer, Transfer::Identifier const& transfer,
        std::string const& name, std::uint64_t size) override;
    [[nodiscard]] virtual bool Write(
        Device::Identifier const& peer, Transfer::Identifier const& transfer,
        std::uint64_t offset, std::span<std::uint8_t const> data) override;
    [[nodiscard]] virtual bool Commit(Device::Identifier const& peer, Transfer::Identifier const& transfer) override;
    virtual void Discard(Device::Identifier const& peer, Transfer::Identifier const& transfer) override;
    // } IFileStorage

private:
    using Key = std::pair<Device::Identifier, Transfer::Identifier>;

    struct Offered
    {
        std::filesystem::path path;
        Source source;
    };

    struct Pending
    {
        std::filesystem::path destination;
        std::filesystem::path partial;
        std::uint64_t size;
        std::uint64_t written;
        std::fstream stream;
    };

    [[nodiscard]] std::filesystem::path ReserveDestination(std::string const& name) const;
    [[nodiscard]] bool IsReserved(std::filesystem::path const& path) const;

    std::filesystem::path const m_directory;
    std::shared_ptr<spdlog::logger> m_logger;

    mutable std::mutex m_mutex;
    std::map<std::string, Offered> m_offered;
    std::map<Key, Pending> m_pending;
    std::map<Key, std::filesystem::path> m_committed;
};

//----------------------------------------------------------------------------------------------------------------------
