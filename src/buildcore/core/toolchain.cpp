#include "buildcore/core/toolchain.hpp"

#include <charconv>
#include <regex>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "buildcore/utils/path_utils.hpp"

namespace buildcore {

namespace {

auto ParseComponents(std::string_view text) -> std::optional<std::vector<int>> {
  std::vector<int> components;
  while (!text.empty()) {
    int value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || value < 0) {
      return std::nullopt;
    }
    components.push_back(value);
    text.remove_prefix(ptr - text.data());
    if (text.empty()) {
      break;
    }
    if (text.front() != '.' || text.size() == 1) {
      return std::nullopt;
    }
    text.remove_prefix(1);
  }
  if (components.empty() || components.size() > 3) {
    return std::nullopt;
  }
  return components;
}

// Executables searched for under <root>/usr/bin and <root>/bin
const std::vector<std::pair<ToolchainCapability, std::string>> kExecutables = {
    {ToolchainCapability::kClang, "clang"},
    {ToolchainCapability::kClangd, "clangd"},
    {ToolchainCapability::kSwift, "swift"},
    {ToolchainCapability::kSwiftc, "swiftc"},
};

// Libraries searched for under <root>/usr/lib and <root>/lib
const std::vector<std::pair<ToolchainCapability, std::string>> kLibraries = {
    {ToolchainCapability::kSourceKitD, "sourcekitd.framework/sourcekitd"},
    {ToolchainCapability::kSourceKitD, "libsourcekitdInProc.so"},
    {ToolchainCapability::kLibIndexStore, "libIndexStore.so"},
    {ToolchainCapability::kLibIndexStore, "libIndexStore.dylib"},
};

auto FindTools(const std::filesystem::path& root)
    -> std::map<ToolchainCapability, std::filesystem::path> {
  std::map<ToolchainCapability, std::filesystem::path> tools;
  std::error_code ec;

  for (const auto& bin_dir : {root / "usr" / "bin", root / "bin"}) {
    for (const auto& [capability, name] : kExecutables) {
      auto candidate = bin_dir / name;
      if (!tools.contains(capability) && IsExecutableFile(candidate)) {
        tools.emplace(capability, candidate);
      }
    }
  }

  for (const auto& lib_dir : {root / "usr" / "lib", root / "lib"}) {
    for (const auto& [capability, name] : kLibraries) {
      auto candidate = lib_dir / name;
      if (!tools.contains(capability) &&
          std::filesystem::is_regular_file(candidate, ec)) {
        tools.emplace(capability, candidate);
      }
    }
  }

  return tools;
}

}  // namespace

auto ToString(ToolchainCapability capability) -> std::string_view {
  switch (capability) {
    case ToolchainCapability::kClang:
      return "clang";
    case ToolchainCapability::kClangd:
      return "clangd";
    case ToolchainCapability::kSwift:
      return "swift";
    case ToolchainCapability::kSwiftc:
      return "swiftc";
    case ToolchainCapability::kSourceKitD:
      return "sourcekitd";
    case ToolchainCapability::kLibIndexStore:
      return "libIndexStore";
  }
  return "unknown";
}

auto ToolchainVersion::Parse(std::string_view text)
    -> std::optional<ToolchainVersion> {
  auto components = ParseComponents(text);
  if (!components) {
    return std::nullopt;
  }

  ToolchainVersion version;
  version.major = (*components)[0];
  if (components->size() > 1) {
    version.minor = (*components)[1];
  }
  if (components->size() > 2) {
    version.patch = (*components)[2];
  }
  return version;
}

auto ToolchainVersion::FromName(std::string_view name)
    -> std::optional<ToolchainVersion> {
  static const std::regex kVersionPattern(R"((\d+(?:\.\d+){0,2}))");

  std::string text(name);
  std::smatch match;
  if (!std::regex_search(text, match, kVersionPattern)) {
    return std::nullopt;
  }
  return Parse(match.str(1));
}

auto ToolchainVersion::MatchesPrefix(std::string_view prefix) const -> bool {
  auto components = ParseComponents(prefix);
  if (!components) {
    return false;
  }

  const int own[] = {major, minor, patch};
  for (size_t i = 0; i < components->size(); ++i) {
    if ((*components)[i] != own[i]) {
      return false;
    }
  }
  return true;
}

Toolchain::Toolchain(
    std::string identifier, std::string display_name, CanonicalPath path,
    std::optional<ToolchainVersion> version,
    std::map<ToolchainCapability, std::filesystem::path> tools)
    : identifier_(std::move(identifier)),
      display_name_(std::move(display_name)),
      path_(std::move(path)),
      version_(version),
      tools_(std::move(tools)) {
}

auto Toolchain::FromDirectory(
    const CanonicalPath& directory, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<Toolchain> {
  if (!logger) {
    logger = spdlog::default_logger();
  }

  if (!directory.IsDirectory()) {
    return std::nullopt;
  }

  auto tools = FindTools(directory.Path());
  bool has_compiler = tools.contains(ToolchainCapability::kClang) ||
                      tools.contains(ToolchainCapability::kSwift) ||
                      tools.contains(ToolchainCapability::kSwiftc);
  if (!has_compiler) {
    return std::nullopt;
  }

  std::string identifier = directory.String();
  std::string display_name = directory.Filename();
  auto version = ToolchainVersion::FromName(directory.Filename());

  auto manifest_path = directory / kManifestName;
  if (manifest_path.Exists()) {
    try {
      YAML::Node manifest = YAML::LoadFile(manifest_path.String());

      if (manifest["Identifier"]) {
        identifier = manifest["Identifier"].as<std::string>();
      }
      if (manifest["DisplayName"]) {
        display_name = manifest["DisplayName"].as<std::string>();
      }
      if (manifest["Version"]) {
        auto raw = manifest["Version"].as<std::string>();
        if (auto parsed = ToolchainVersion::Parse(raw)) {
          version = parsed;
        } else {
          logger->warn(
              "Ignoring invalid version '{}' in {}", raw, manifest_path);
        }
      }
    } catch (const YAML::Exception& e) {
      logger->warn(
          "Ignoring unreadable toolchain manifest {}: {}", manifest_path,
          e.what());
    }
  }

  return Toolchain(
      std::move(identifier), std::move(display_name), directory, version,
      std::move(tools));
}

auto Toolchain::ToolPath(ToolchainCapability capability) const
    -> std::optional<std::filesystem::path> {
  if (auto it = tools_.find(capability); it != tools_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void to_json(nlohmann::json& j, const ToolchainVersion& v) {
  j = fmt::format("{}", v);
}

void to_json(nlohmann::json& j, const Toolchain& t) {
  j["identifier"] = t.Identifier();
  j["displayName"] = t.DisplayName();
  j["path"] = t.Path().String();
  if (t.Version()) {
    j["version"] = *t.Version();
  }
  auto tools = nlohmann::json::object();
  for (const auto& [capability, path] : t.Tools()) {
    tools[std::string(ToString(capability))] = path.string();
  }
  j["tools"] = std::move(tools);
}

}  // namespace buildcore
