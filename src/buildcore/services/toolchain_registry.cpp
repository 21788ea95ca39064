#include "buildcore/services/toolchain_registry.hpp"

#include <algorithm>
#include <cstdlib>
#include <set>
#include <sstream>
#include <unordered_map>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace buildcore::services {

namespace {

auto SplitPathList(std::string_view list) -> std::vector<std::string> {
  std::vector<std::string> entries;
  std::string entry;
  std::istringstream stream{std::string(list)};
  while (std::getline(stream, entry, ':')) {
    if (!entry.empty()) {
      entries.push_back(entry);
    }
  }
  return entries;
}

auto EnvironmentLocations() -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> locations;

  if (const char* explicit_paths =
          std::getenv(ToolchainRegistry::kEnvironmentVariable)) {
    for (const auto& entry : SplitPathList(explicit_paths)) {
      locations.emplace_back(entry);
    }
  }

  // A toolchain's compiler lives in <root>/bin, so PATH entries point at
  // toolchains one level up
  if (const char* path_env = std::getenv("PATH")) {
    for (const auto& entry : SplitPathList(path_env)) {
      std::filesystem::path bin_dir(entry);
      if (bin_dir.filename() == "bin" && bin_dir.has_parent_path()) {
        locations.push_back(bin_dir.parent_path());
      }
    }
  }

  return locations;
}

auto PlatformDefaultLocations() -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> locations;

#ifdef __APPLE__
  locations.emplace_back(
      "/Applications/Xcode.app/Contents/Developer/Toolchains");
  locations.emplace_back("/Library/Developer/Toolchains");
  if (const char* home = std::getenv("HOME")) {
    locations.push_back(
        std::filesystem::path(home) / "Library" / "Developer" / "Toolchains");
  }
#endif

  locations.emplace_back("/usr");
  locations.emplace_back("/usr/local");

  std::error_code ec;
  std::vector<std::filesystem::path> opt_children;
  for (const auto& entry : std::filesystem::directory_iterator("/opt", ec)) {
    if (entry.is_directory(ec)) {
      opt_children.push_back(entry.path());
    }
  }
  std::ranges::sort(opt_children);
  locations.insert(locations.end(), opt_children.begin(), opt_children.end());

  return locations;
}

auto DescribeRequest(const ToolchainRequest& request) -> std::string {
  std::vector<std::string> parts;
  if (request.capability) {
    parts.push_back(fmt::format("capability {}", ToString(*request.capability)));
  }
  if (request.version) {
    parts.push_back(fmt::format("version {}", *request.version));
  }
  if (parts.empty()) {
    return "any toolchain";
  }
  return fmt::format("{}", fmt::join(parts, ", "));
}

}  // namespace

ToolchainRegistry::ToolchainRegistry(
    ToolchainSearchOptions options, std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      options_(std::move(options)) {
}

auto ToolchainRegistry::Create(
    ToolchainSearchOptions options, std::shared_ptr<spdlog::logger> logger)
    -> std::shared_ptr<ToolchainRegistry> {
  return std::make_shared<ToolchainRegistry>(
      std::move(options), std::move(logger));
}

auto ToolchainRegistry::LocationsFor(
    const ToolchainSearchOptions& options,
    const std::vector<CanonicalPath>& registered)
    -> std::vector<CanonicalPath> {
  std::vector<std::filesystem::path> raw(
      options.search_paths.begin(), options.search_paths.end());
  for (const auto& path : registered) {
    raw.push_back(path.Path());
  }
  if (options.include_environment) {
    auto env = EnvironmentLocations();
    raw.insert(raw.end(), env.begin(), env.end());
  }
  if (options.include_platform_defaults) {
    auto defaults = PlatformDefaultLocations();
    raw.insert(raw.end(), defaults.begin(), defaults.end());
  }

  std::vector<CanonicalPath> locations;
  std::set<CanonicalPath> seen;
  for (const auto& path : raw) {
    CanonicalPath location(path);
    if (seen.insert(location).second) {
      locations.push_back(std::move(location));
    }
  }
  return locations;
}

auto ToolchainRegistry::SearchLocations() const -> std::vector<CanonicalPath> {
  std::lock_guard<std::mutex> lock(mutex_);
  return LocationsFor(options_, registered_paths_);
}

auto ToolchainRegistry::DiscoverAt(const CanonicalPath& location) const
    -> std::optional<std::vector<Toolchain>> {
  if (!location.IsDirectory()) {
    return std::nullopt;
  }

  if (auto toolchain = Toolchain::FromDirectory(location, logger_)) {
    return std::vector<Toolchain>{std::move(*toolchain)};
  }

  std::vector<Toolchain> found;
  try {
    std::vector<std::filesystem::path> children;
    for (const auto& entry : std::filesystem::directory_iterator(
             location.Path(),
             std::filesystem::directory_options::skip_permission_denied)) {
      if (entry.is_directory()) {
        children.push_back(entry.path());
      }
    }
    std::ranges::sort(children);

    for (const auto& child : children) {
      if (auto toolchain =
              Toolchain::FromDirectory(CanonicalPath(child), logger_)) {
        found.push_back(std::move(*toolchain));
      }
    }
  } catch (const std::filesystem::filesystem_error& e) {
    logger_->debug("Skipping unreadable location {}: {}", location, e.what());
    return std::nullopt;
  }

  return found;
}

auto ToolchainRegistry::Scan() -> ScanSummary {
  std::vector<CanonicalPath> locations;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    locations = LocationsFor(options_, registered_paths_);
  }

  // Filesystem work happens without the lock
  ScanSummary summary;
  std::vector<Toolchain> discovered;
  std::set<CanonicalPath> discovered_paths;
  for (const auto& location : locations) {
    auto found = DiscoverAt(location);
    if (!found) {
      logger_->debug("Skipping toolchain location {}", location);
      summary.skipped_locations++;
      continue;
    }
    for (auto& toolchain : *found) {
      if (discovered_paths.insert(toolchain.Path()).second) {
        discovered.push_back(std::move(toolchain));
      }
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);

  std::unordered_map<CanonicalPath, ToolchainPtr> previous;
  for (const auto& toolchain : toolchains_) {
    previous.emplace(toolchain->Path(), toolchain);
  }

  std::vector<ToolchainPtr> merged;
  merged.reserve(discovered.size());
  for (auto& toolchain : discovered) {
    auto it = previous.find(toolchain.Path());
    if (it != previous.end() && *it->second == toolchain) {
      merged.push_back(it->second);
      previous.erase(it);
      summary.unchanged++;
      continue;
    }
    logger_->debug(
        "Found toolchain {} at {}", toolchain.Identifier(), toolchain.Path());
    merged.push_back(std::make_shared<const Toolchain>(std::move(toolchain)));
    summary.added++;
  }

  for (const auto& [path, toolchain] : previous) {
    logger_->debug("Toolchain {} at {} is gone", toolchain->Identifier(), path);
  }
  summary.removed = previous.size();

  toolchains_ = std::move(merged);
  SortLocked();

  logger_->info(
      "Toolchain scan: {} added, {} removed, {} unchanged ({} total)",
      summary.added, summary.removed, summary.unchanged, toolchains_.size());
  return summary;
}

auto ToolchainRegistry::RegisterToolchain(const CanonicalPath& directory)
    -> std::expected<ToolchainPtr, BuildCoreError> {
  auto toolchain = Toolchain::FromDirectory(directory, logger_);
  if (!toolchain) {
    return BuildCoreError::Unexpected(
        BuildCoreErrorCode::NoToolchainFound,
        fmt::format("{} does not contain a compiler", directory));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (std::ranges::find(registered_paths_, directory) ==
      registered_paths_.end()) {
    registered_paths_.push_back(directory);
  }

  auto existing = std::ranges::find_if(
      toolchains_, [&](const ToolchainPtr& t) { return t->Path() == directory; });
  if (existing != toolchains_.end()) {
    if (**existing == *toolchain) {
      return *existing;
    }
    toolchains_.erase(existing);
  }

  auto ptr = std::make_shared<const Toolchain>(std::move(*toolchain));
  toolchains_.push_back(ptr);
  SortLocked();
  return ptr;
}

auto ToolchainRegistry::SetOptions(ToolchainSearchOptions options) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  options_ = std::move(options);
}

auto ToolchainRegistry::ToolchainWithIdentifier(
    const std::string& identifier) const
    -> std::expected<ToolchainPtr, BuildCoreError> {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& toolchain : toolchains_) {
    if (toolchain->Identifier() == identifier) {
      return toolchain;
    }
  }
  return BuildCoreError::Unexpected(
      BuildCoreErrorCode::NoToolchainFound,
      fmt::format("no toolchain with identifier '{}'", identifier));
}

auto ToolchainRegistry::ToolchainAtPath(const CanonicalPath& path) const
    -> std::expected<ToolchainPtr, BuildCoreError> {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& toolchain : toolchains_) {
    if (toolchain->Path() == path) {
      return toolchain;
    }
  }
  return BuildCoreError::Unexpected(
      BuildCoreErrorCode::NoToolchainFound,
      fmt::format("no toolchain at {}", path));
}

auto ToolchainRegistry::Satisfies(
    const Toolchain& toolchain, const ToolchainRequest& request) -> bool {
  if (request.capability && !toolchain.Supports(*request.capability)) {
    return false;
  }
  if (request.version) {
    return toolchain.Version() &&
           toolchain.Version()->MatchesPrefix(*request.version);
  }
  return true;
}

auto ToolchainRegistry::SelectToolchain(const ToolchainRequest& request) const
    -> std::expected<ToolchainPtr, BuildCoreError> {
  std::lock_guard<std::mutex> lock(mutex_);

  if (options_.default_identifier) {
    for (const auto& toolchain : toolchains_) {
      if (toolchain->Identifier() == *options_.default_identifier &&
          Satisfies(*toolchain, request)) {
        return toolchain;
      }
    }
  }

  // toolchains_ is kept newest first
  for (const auto& toolchain : toolchains_) {
    if (Satisfies(*toolchain, request)) {
      return toolchain;
    }
  }

  return BuildCoreError::Unexpected(
      BuildCoreErrorCode::NoToolchainFound,
      fmt::format("nothing satisfies {}", DescribeRequest(request)));
}

auto ToolchainRegistry::Toolchains() const -> std::vector<ToolchainPtr> {
  std::lock_guard<std::mutex> lock(mutex_);
  return toolchains_;
}

auto ToolchainRegistry::SortLocked() -> void {
  std::ranges::stable_sort(
      toolchains_, [](const ToolchainPtr& lhs, const ToolchainPtr& rhs) {
        const auto& lv = lhs->Version();
        const auto& rv = rhs->Version();
        if (lv.has_value() != rv.has_value()) {
          return lv.has_value();
        }
        if (lv && rv && *lv != *rv) {
          return *lv > *rv;
        }
        return lhs->Identifier() < rhs->Identifier();
      });
}

}  // namespace buildcore::services
