#include "buildcore/core/file_build_settings.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

#include "buildcore/core/json_utils.hpp"

namespace buildcore {

auto ToString(Language language) -> std::string_view {
  switch (language) {
    case Language::kC:
      return "c";
    case Language::kCpp:
      return "cpp";
    case Language::kObjectiveC:
      return "objective-c";
    case Language::kObjectiveCpp:
      return "objective-cpp";
    case Language::kSwift:
      return "swift";
  }
  return "unknown";
}

auto LanguageFromString(std::string_view name) -> std::optional<Language> {
  static const std::unordered_map<std::string_view, Language> kLanguages = {
      {"c", Language::kC},
      {"cpp", Language::kCpp},
      {"objective-c", Language::kObjectiveC},
      {"objective-cpp", Language::kObjectiveCpp},
      {"swift", Language::kSwift},
  };

  if (auto it = kLanguages.find(name); it != kLanguages.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto LanguageForPath(const std::filesystem::path& path)
    -> std::optional<Language> {
  static const std::unordered_map<std::string, Language> kExtensions = {
      {".c", Language::kC},          {".cc", Language::kCpp},
      {".cpp", Language::kCpp},      {".cxx", Language::kCpp},
      {".c++", Language::kCpp},      {".m", Language::kObjectiveC},
      {".mm", Language::kObjectiveCpp}, {".swift", Language::kSwift},
  };

  auto ext = path.extension().string();
  std::ranges::transform(
      ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
  if (auto it = kExtensions.find(ext); it != kExtensions.end()) {
    return it->second;
  }
  return std::nullopt;
}

void to_json(nlohmann::json& j, const Language& l) {
  j = std::string(ToString(l));
}

void from_json(const nlohmann::json& j, Language& l) {
  auto language = LanguageFromString(j.get<std::string>());
  if (!language) {
    throw std::runtime_error("Invalid language: " + j.get<std::string>());
  }
  l = *language;
}

void to_json(nlohmann::json& j, const FileBuildSettings& s) {
  to_json_required(j, "compilerArguments", s.compiler_arguments);
  to_json_optional(j, "workingDirectory", s.working_directory);
  to_json_required(j, "language", s.language);
  to_json_required(j, "isFallback", s.is_fallback);
}

void from_json(const nlohmann::json& j, FileBuildSettings& s) {
  from_json_required(j, "compilerArguments", s.compiler_arguments);
  from_json_optional(j, "workingDirectory", s.working_directory);
  from_json_required(j, "language", s.language);
  s.is_fallback = j.value("isFallback", false);
}

}  // namespace buildcore
