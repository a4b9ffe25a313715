//----------------------------------------------------------------------------------------------------------------------
// File: FileUtils.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace FileUtils {
//----------------------------------------------------------------------------------------------------------------------

bool CreateFolderIfNoneExist(std::filesystem::path const& folder);
bool CreateParentFolderIfNoneExist(std::filesystem::path const& filepath);

// Replaces a leading "~" with the user's home directory. Paths without the prefix are returned unchanged.
[[nodiscard]] std::filesystem::path ExpandUserDirectory(std::string_view path);

//----------------------------------------------------------------------------------------------------------------------
} // FileUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline bool FileUtils::CreateFolderIfNoneExist(std::filesystem::path const& folder)
{
    // If the directories exist, there is nothing to do.
    if (std::filesystem::exists(folder)) { return std::filesystem::is_directory(folder); }

    std::error_code error;
    bool const success = std::filesystem::create_directories(folder, error);
    if (success) {
        // Only the user may read, write, and traverse the created folders.
        std::filesystem::permissions(folder, std::filesystem::perms::owner_all, error);
    }

    return success && !error;
}

//----------------------------------------------------------------------------------------------------------------------

inline bool FileUtils::CreateParentFolderIfNoneExist(std::filesystem::path const& filepath)
{
    auto const parent = filepath.parent_path();
    if (parent.empty()) { return true; } // A relative filename refers to the working directory.
    return CreateFolderIfNoneExist(parent);
}

//----------------------------------------------------------------------------------------------------------------------

inline std::filesystem::path FileUtils::ExpandUserDirectory(std::string_view path)
{
    if (path.empty() || path.front() != '~') { return std::filesystem::path{ path }; }
    if (path.size() > 1 && path[1] != '/') { return std::filesystem::path{ path }; } // Other users are not supported.

    auto const pHome = std::getenv("HOME");
    if (!pHome) { return std::filesystem::path{ path }; }

    std::filesystem::path expanded{ pHome };
    if (path.size() > 2) { expanded /= std::filesystem::path{ path.substr(2) }; }
    return expanded;
}

//----------------------------------------------------------------------------------------------------------------------
