#include "buildcore/core/path_prefix_mapping.hpp"

#include "buildcore/core/json_utils.hpp"

namespace buildcore {

namespace {

auto MatchesPrefix(std::string_view path, std::string_view prefix) -> bool {
  if (prefix.empty() || !path.starts_with(prefix)) {
    return false;
  }
  // "/build/foo" must not match "/build/foobar"
  return path.size() == prefix.size() || prefix.back() == '/' ||
         path[prefix.size()] == '/';
}

}  // namespace

auto RemapPath(
    std::string_view path, const std::vector<PathPrefixMapping>& mappings)
    -> std::string {
  for (const auto& mapping : mappings) {
    if (MatchesPrefix(path, mapping.original)) {
      return mapping.replacement +
             std::string(path.substr(mapping.original.size()));
    }
  }
  return std::string(path);
}

void to_json(nlohmann::json& j, const PathPrefixMapping& m) {
  to_json_required(j, "original", m.original);
  to_json_required(j, "replacement", m.replacement);
}

void from_json(const nlohmann::json& j, PathPrefixMapping& m) {
  from_json_required(j, "original", m.original);
  from_json_required(j, "replacement", m.replacement);
}

}  // namespace buildcore
