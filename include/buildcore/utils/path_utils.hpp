#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace buildcore {

// File type checks
[[nodiscard]] auto IsConfigFile(std::filesystem::path path) -> bool;
[[nodiscard]] auto IsExecutableFile(const std::filesystem::path& path) -> bool;

// URI operations
[[nodiscard]] auto UriToPath(std::string_view uri) -> std::filesystem::path;
[[nodiscard]] auto PathToUri(std::filesystem::path path) -> std::string;
[[nodiscard]] auto NormalizePath(std::filesystem::path path)
    -> std::filesystem::path;

}  // namespace buildcore
