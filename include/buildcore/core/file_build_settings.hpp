#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace buildcore {

enum class Language { kC, kCpp, kObjectiveC, kObjectiveCpp, kSwift };

[[nodiscard]] auto ToString(Language language) -> std::string_view;
[[nodiscard]] auto LanguageFromString(std::string_view name)
    -> std::optional<Language>;

// Language implied by the file extension, nullopt for headers and unknown
// extensions
[[nodiscard]] auto LanguageForPath(const std::filesystem::path& path)
    -> std::optional<Language>;

// Compiler invocation for one source file in one configured target.
// Snapshots are replaced, never mutated; equality suppresses no-op change
// notifications.
struct FileBuildSettings {
  std::vector<std::string> compiler_arguments;
  std::optional<std::string> working_directory;
  Language language = Language::kC;

  // Produced by a heuristic rather than a real build description
  bool is_fallback = false;

  auto operator==(const FileBuildSettings&) const -> bool = default;
};

void to_json(nlohmann::json& j, const Language& l);
void from_json(const nlohmann::json& j, Language& l);

void to_json(nlohmann::json& j, const FileBuildSettings& s);
void from_json(const nlohmann::json& j, FileBuildSettings& s);

}  // namespace buildcore
