//----------------------------------------------------------------------------------------------------------------------
// File: FileStorage.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "FileStorage.hpp"
#include "Checksum.hpp"
#include "Engine.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view DefaultFilename = "file";
constexpr std::string_view ReservedCharacters = "/\\:*?\"<>|";
constexpr std::size_t MaximumFilenameSize = 200;

[[nodiscard]] std::string GuessType(std::filesystem::path const& path);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::string Transfer::SanitizeFilename(std::string_view name)
{
    std::string sanitized;
    sanitized.reserve(name.size());

    // Only the final component of the announced name is used. Both separators are considered as the name may have
    // been produced on another platform.
    auto const separator = name.find_last_of("/\\");
    if (separator != std::string_view::npos) { name.remove_prefix(separator + 1); }

    for (char const c : name) {
        bool const reserved = static_cast<unsigned char>(c) < 0x20 || local::ReservedCharacters.find(c) != std::string_view::npos;
        sanitized.push_back(reserved ? '_' : c);
    }

    boost::algorithm::trim(sanitized);
    auto const first = sanitized.find_first_not_of('.');
    sanitized.erase(0, std::min(first, sanitized.size()));
    if (sanitized.size() > local::MaximumFilenameSize) { sanitized.resize(local::MaximumFilenameSize); }
    if (sanitized.empty()) { return std::string{ local::DefaultFilename }; }
    return sanitized;
}

//----------------------------------------------------------------------------------------------------------------------

Transfer::FileStorage::FileStorage(std::filesystem::path const& directory)
    : m_directory(directory)
    , m_logger(Logger::Get(Logger::Name::Transfer))
    , m_mutex()
    , m_offered()
    , m_pending()
    , m_committed()
{
}

//----------------------------------------------------------------------------------------------------------------------

Transfer::FileStorage::~FileStorage()
{
    // Partial files are not kept across runs, a transfer can not be resumed by a new process.
    std::scoped_lock lock{ m_mutex };
    for (auto& [key, pending] : m_pending) {
        pending.stream.close();
        std::error_code error;
        std::filesystem::remove(pending.partial, error);
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Transfer::FileStorage::Offer(std::filesystem::path const& path)
{
    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) {
        m_logger->warn("Unable to offer \"{}\", the path is not a regular file.", path.string());
        return {};
    }

    auto const size = std::filesystem::file_size(path, error);
    if (error) { return {}; }

    auto optChecksum = Checksum::Compute(path);
    if (!optChecksum) {
        m_logger->warn("Unable to compute the checksum of \"{}\".", path.string());
        return {};
    }

    auto fileId = GenerateIdentifier();
    if (fileId.empty()) { return {}; }

    Source source{
        .fileId = fileId,
        .name = path.filename().string(),
        .size = size,
        .type = local::GuessType(path),
        .checksum = std::move(optChecksum),
    };

    {
        std::scoped_lock lock{ m_mutex };
        m_offered.emplace(fileId, Offered{ .path = path, .source = std::move(source) });
    }

    m_logger->info("Offering \"{}\" ({} bytes) as {}.", path.filename().string(), size, fileId);
    return fileId;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::FileStorage::Withdraw(std::string const& fileId)
{
    std::scoped_lock lock{ m_mutex };
    return m_offered.erase(fileId) != 0;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Transfer::FileStorage::GetDirectory() const
{
    return m_directory;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::filesystem::path> Transfer::FileStorage::GetOfferedPath(std::string const& fileId) const
{
    std::scoped_lock lock{ m_mutex };
    if (auto const itr = m_offered.find(fileId); itr != m_offered.end()) { return itr->second.path; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::filesystem::path> Transfer::FileStorage::GetCommittedPath(
    Device::Identifier const& peer, Transfer::Identifier const& transfer) const
{
    std::scoped_lock lock{ m_mutex };
    if (auto const itr = m_committed.find({ peer, transfer }); itr != m_committed.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Transfer::FileStorage::GetPendingCount() const
{
    std::scoped_lock lock{ m_mutex };
    return m_pending.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<IFileStorage::Source> Transfer::FileStorage::Describe(std::string const& fileId)
{
    std::scoped_lock lock{ m_mutex };
    auto const itr = m_offered.find(fileId);
    if (itr == m_offered.end()) { return {}; }

    // The file may have been changed since it was offered, an offer is only valid for the contents it was taken with.
    std::error_code error;
    auto const size = std::filesystem::file_size(itr->second.path, error);
    if (error || size != itr->second.source.size) {
        m_logger->warn("The offered file \"{}\" has changed or been removed.", itr->second.path.string());
        return {};
    }

    return itr->second.source;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::vector<std::uint8_t>> Transfer::FileStorage::Read(
    std::string const& fileId, std::uint64_t offset, std::size_t size)
{
    std::filesystem::path path;
    {
        std::scoped_lock lock{ m_mutex };
        auto const itr = m_offered.find(fileId);
        if (itr == m_offered.end()) { return {}; }
        if (offset > itr->second.source.size || size > itr->second.source.size - offset) { return {}; }
        path = itr->second.path;
    }

    std::ifstream reader(path, std::ios::binary);
    if (!reader.good()) { return {}; }

    reader.seekg(static_cast<std::streamoff>(offset));
    std::vector<std::uint8_t> buffer(size);
    reader.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size));
    if (static_cast<std::size_t>(reader.gcount()) != size) { return {}; }

    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::FileStorage::Open(
    Device::Identifier const& peer, Transfer::Identifier const& transfer, std::string const& name, std::uint64_t size)
{
    if (!FileUtils::CreateFolderIfNoneExist(m_directory)) {
        m_logger->error("Unable to create the download directory \"{}\".", m_directory.string());
        return false;
    }

    std::scoped_lock lock{ m_mutex };
    Key key{ peer, transfer };
    if (m_pending.contains(key)) { return false; }

    auto destination = ReserveDestination(SanitizeFilename(name));
    auto partial = destination;
    partial += PartialExtension;

    std::fstream stream(partial, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!stream.good()) {
        m_logger->error("Unable to open \"{}\" for writing.", partial.string());
        return false;
    }

    m_pending.emplace(std::move(key), Pending{
        .destination = std::move(destination),
        .partial = std::move(partial),
        .size = size,
        .written = 0,
        .stream = std::move(stream),
    });

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::FileStorage::Write(
    Device::Identifier const& peer,
    Transfer::Identifier const& transfer,
    std::uint64_t offset,
    std::span<std::uint8_t const> data)
{
    std::scoped_lock lock{ m_mutex };
    auto const itr = m_pending.find({ peer, transfer });
    if (itr == m_pending.end()) { return false; }

    auto& pending = itr->second;
    if (offset > pending.size || data.size() > pending.size - offset) { return false; }

    pending.stream.seekp(static_cast<std::streamoff>(offset));
    pending.stream.write(reinterpret_cast<char const*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!pending.stream.good()) { return false; }

    pending.written = std::max<std::uint64_t>(pending.written, offset + data.size());
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::FileStorage::Commit(Device::Identifier const& peer, Transfer::Identifier const& transfer)
{
    std::scoped_lock lock{ m_mutex };
    auto const itr = m_pending.find({ peer, transfer });
    if (itr == m_pending.end()) { return false; }

    auto& pending = itr->second;
    pending.stream.close();
    if (pending.stream.fail() || pending.written != pending.size) { return false; }

    // Another process may have created the destination while the transfer was active.
    std::error_code error;
    if (std::filesystem::exists(pending.destination, error)) {
        pending.destination = ReserveDestination(pending.destination.filename().string());
    }

    std::filesystem::rename(pending.partial, pending.destination, error);
    if (error) {
        m_logger->error("Unable to move \"{}\" into place: {}.", pending.partial.string(), error.message());
        return false;
    }

    m_logger->info("Saved \"{}\".", pending.destination.string());
    m_committed.insert_or_assign(itr->first, pending.destination);
    m_pending.erase(itr);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Transfer::FileStorage::Discard(Device::Identifier const& peer, Transfer::Identifier const& transfer)
{
    std::scoped_lock lock{ m_mutex };
    auto const itr = m_pending.find({ peer, transfer });
    if (itr == m_pending.end()) { return; }

    auto& pending = itr->second;
    pending.stream.close();

    std::error_code error;
    if (!std::filesystem::remove(pending.partial, error) && error) {
        m_logger->warn("Unable to remove the partial file \"{}\".", pending.partial.string());
    }

    m_pending.erase(itr);
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Transfer::FileStorage::ReserveDestination(std::string const& name) const
{
    std::filesystem::path const base{ name };
    auto const stem = base.stem().string();
    auto const extension = base.extension().string();

    auto candidate = m_directory / base;
    for (std::uint32_t suffix = 1; IsReserved(candidate); ++suffix) {
        candidate = m_directory / fmt::format("{} ({}){}", stem, suffix, extension);
    }

    return candidate;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::FileStorage::IsReserved(std::filesystem::path const& path) const
{
    std::error_code error;
    if (std::filesystem::exists(path, error)) { return true; }

    auto partial = path;
    partial += PartialExtension;
    if (std::filesystem::exists(partial, error)) { return true; }

    return std::ranges::any_of(m_pending, [&path] (auto const& entry) { return entry.second.destination == path; });
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::GuessType(std::filesystem::path const& path)
{
    struct Mapping { std::string_view extension; std::string_view type; };
    constexpr std::array<Mapping, 14> Mappings = {{
        { ".txt", "text/plain" },
        { ".pdf", "application/pdf" },
        { ".png", "image/png" },
        { ".jpg", "image/jpeg" },
        { ".jpeg", "image/jpeg" },
        { ".gif", "image/gif" },
        { ".webp", "image/webp" },
        { ".mp3", "audio/mpeg" },
        { ".mp4", "video/mp4" },
        { ".zip", "application/zip" },
        { ".json", "application/json" },
        { ".apk", "application/vnd.android.package-archive" },
        { ".html", "text/html" },
        { ".csv", "text/csv" },
    }};

    auto const extension = boost::algorithm::to_lower_copy(path.extension().string());
    for (auto const& [key, type] : Mappings) {
        if (extension == key) { return std::string{ type }; }
    }

    return "application/octet-stream";
}

//----------------------------------------------------------------------------------------------------------------------
