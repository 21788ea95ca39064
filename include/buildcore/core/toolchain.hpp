#pragma once

#include <compare>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "buildcore/utils/canonical_path.hpp"

namespace buildcore {

enum class ToolchainCapability {
  kClang,
  kClangd,
  kSwift,
  kSwiftc,
  kSourceKitD,
  kLibIndexStore,
};

[[nodiscard]] auto ToString(ToolchainCapability capability) -> std::string_view;

struct ToolchainVersion {
  int major = 0;
  int minor = 0;
  int patch = 0;

  auto operator==(const ToolchainVersion&) const -> bool = default;
  auto operator<=>(const ToolchainVersion&) const = default;

  // Accepts "17", "17.0" and "17.0.6"; nullopt otherwise
  static auto Parse(std::string_view text) -> std::optional<ToolchainVersion>;

  // Finds the first dotted version inside a name such as "llvm-17.0.6" or
  // "swift-5.10-RELEASE"
  static auto FromName(std::string_view name)
      -> std::optional<ToolchainVersion>;

  // True if every component written in `prefix` matches, so "5" matches
  // 5.10.1 and "5.10" matches 5.10.0 but not 5.1.0
  [[nodiscard]] auto MatchesPrefix(std::string_view prefix) const -> bool;
};

// A compiler installation rooted at one directory
class Toolchain {
 public:
  static constexpr auto kManifestName = "toolchain.yaml";

  Toolchain(
      std::string identifier, std::string display_name, CanonicalPath path,
      std::optional<ToolchainVersion> version,
      std::map<ToolchainCapability, std::filesystem::path> tools);

  // Inspects `directory`; nullopt if it does not contain a compiler
  static auto FromDirectory(
      const CanonicalPath& directory,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<Toolchain>;

  [[nodiscard]] auto Identifier() const -> const std::string& {
    return identifier_;
  }

  [[nodiscard]] auto DisplayName() const -> const std::string& {
    return display_name_;
  }

  [[nodiscard]] auto Path() const -> const CanonicalPath& {
    return path_;
  }

  [[nodiscard]] auto Version() const -> const std::optional<ToolchainVersion>& {
    return version_;
  }

  [[nodiscard]] auto Tools() const
      -> const std::map<ToolchainCapability, std::filesystem::path>& {
    return tools_;
  }

  [[nodiscard]] auto Supports(ToolchainCapability capability) const -> bool {
    return tools_.contains(capability);
  }

  [[nodiscard]] auto ToolPath(ToolchainCapability capability) const
      -> std::optional<std::filesystem::path>;

  auto operator==(const Toolchain&) const -> bool = default;

 private:
  std::string identifier_;
  std::string display_name_;
  CanonicalPath path_;
  std::optional<ToolchainVersion> version_;
  std::map<ToolchainCapability, std::filesystem::path> tools_;
};

void to_json(nlohmann::json& j, const ToolchainVersion& v);
void to_json(nlohmann::json& j, const Toolchain& t);

}  // namespace buildcore

template <>
struct fmt::formatter<buildcore::ToolchainVersion>
    : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const buildcore::ToolchainVersion& v, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(
        fmt::format("{}.{}.{}", v.major, v.minor, v.patch), ctx);
  }
};
