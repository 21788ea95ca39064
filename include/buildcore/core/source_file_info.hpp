#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace buildcore {

struct SourceFileInfo {
  std::string uri;

  // False for files that belong to a dependency of the project
  bool is_part_of_root_project = true;

  // Over-approximation: may be true for files without tests, must never be
  // false for a file that has tests. Kept as small as the backend can manage
  // since every flagged file gets scanned for tests.
  bool may_contain_tests = false;

  auto operator==(const SourceFileInfo&) const -> bool = default;
};

void to_json(nlohmann::json& j, const SourceFileInfo& s);
void from_json(const nlohmann::json& j, SourceFileInfo& s);

}  // namespace buildcore
