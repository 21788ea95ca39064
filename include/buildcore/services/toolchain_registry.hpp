#pragma once

#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "buildcore/core/toolchain.hpp"
#include "buildcore/error/error.hpp"
#include "buildcore/utils/canonical_path.hpp"

namespace buildcore::services {

struct ToolchainSearchOptions {
  // Each entry is a toolchain or a directory of toolchains
  std::vector<std::filesystem::path> search_paths;

  // Consult BUILDCORE_TOOLCHAIN_PATH and PATH
  bool include_environment = true;

  // Consult /usr, /usr/local, /opt/* (and the Xcode locations on Apple)
  bool include_platform_defaults = true;

  // Preferred toolchain identifier when it satisfies a request
  std::optional<std::string> default_identifier;
};

struct ToolchainRequest {
  // Version prefix such as "17" or "5.10"
  std::optional<std::string> version;
  std::optional<ToolchainCapability> capability;
};

struct ScanSummary {
  size_t added = 0;
  size_t removed = 0;
  size_t unchanged = 0;
  size_t skipped_locations = 0;
};

using ToolchainPtr = std::shared_ptr<const Toolchain>;

// Discovers installed toolchains and resolves requests against them.
// Toolchain objects are immutable and shared; a rescan keeps the same object
// for every toolchain that did not change.
class ToolchainRegistry {
 public:
  static constexpr auto kEnvironmentVariable = "BUILDCORE_TOOLCHAIN_PATH";

  explicit ToolchainRegistry(
      ToolchainSearchOptions options,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  static auto Create(
      ToolchainSearchOptions options,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::shared_ptr<ToolchainRegistry>;

  // Re-reads every search location and merges the result
  auto Scan() -> ScanSummary;

  // Adds a single toolchain directory outside the search locations
  auto RegisterToolchain(const CanonicalPath& directory)
      -> std::expected<ToolchainPtr, BuildCoreError>;

  auto SetOptions(ToolchainSearchOptions options) -> void;

  [[nodiscard]] auto ToolchainWithIdentifier(const std::string& identifier)
      const -> std::expected<ToolchainPtr, BuildCoreError>;

  [[nodiscard]] auto ToolchainAtPath(const CanonicalPath& path) const
      -> std::expected<ToolchainPtr, BuildCoreError>;

  // The configured default if it satisfies `request`, otherwise the newest
  // toolchain that does
  [[nodiscard]] auto SelectToolchain(const ToolchainRequest& request = {})
      const -> std::expected<ToolchainPtr, BuildCoreError>;

  // Newest first; unversioned toolchains last
  [[nodiscard]] auto Toolchains() const -> std::vector<ToolchainPtr>;

  // Locations Scan() would visit, in priority order
  [[nodiscard]] auto SearchLocations() const -> std::vector<CanonicalPath>;

 private:
  static auto Satisfies(
      const Toolchain& toolchain, const ToolchainRequest& request) -> bool;

  static auto LocationsFor(
      const ToolchainSearchOptions& options,
      const std::vector<CanonicalPath>& registered)
      -> std::vector<CanonicalPath>;

  // Toolchains found at a location that is a toolchain or contains some
  auto DiscoverAt(const CanonicalPath& location) const
      -> std::optional<std::vector<Toolchain>>;

  auto SortLocked() -> void;

  std::shared_ptr<spdlog::logger> logger_;

  // Guards options_, registered_paths_ and toolchains_
  mutable std::mutex mutex_;
  ToolchainSearchOptions options_;
  std::vector<CanonicalPath> registered_paths_;
  std::vector<ToolchainPtr> toolchains_;
};

}  // namespace buildcore::services
