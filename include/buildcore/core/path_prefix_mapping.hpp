#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace buildcore {

// Remaps index data recorded on another machine or in a container:
// paths starting with `original` are rewritten to start with `replacement`
struct PathPrefixMapping {
  std::string original;
  std::string replacement;

  auto operator==(const PathPrefixMapping&) const -> bool = default;
};

// Applies the first mapping whose `original` matches whole leading path
// components of `path`; returns `path` unchanged when none does
[[nodiscard]] auto RemapPath(
    std::string_view path, const std::vector<PathPrefixMapping>& mappings)
    -> std::string;

void to_json(nlohmann::json& j, const PathPrefixMapping& m);
void from_json(const nlohmann::json& j, PathPrefixMapping& m);

}  // namespace buildcore
