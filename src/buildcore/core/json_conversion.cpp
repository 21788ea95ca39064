#include <stdexcept>

#include "buildcore/core/configured_target.hpp"
#include "buildcore/core/file_event.hpp"
#include "buildcore/core/file_handling_capability.hpp"
#include "buildcore/core/json_utils.hpp"
#include "buildcore/core/source_file_info.hpp"

namespace buildcore {

// ConfiguredTarget
void to_json(nlohmann::json& j, const ConfiguredTarget& t) {
  to_json_required(j, "targetId", t.target_id);
  to_json_required(j, "runDestinationId", t.run_destination_id);
}

void from_json(const nlohmann::json& j, ConfiguredTarget& t) {
  from_json_required(j, "targetId", t.target_id);
  from_json_required(j, "runDestinationId", t.run_destination_id);
}

// SourceFileInfo
void to_json(nlohmann::json& j, const SourceFileInfo& s) {
  to_json_required(j, "uri", s.uri);
  to_json_required(j, "isPartOfRootProject", s.is_part_of_root_project);
  to_json_required(j, "mayContainTests", s.may_contain_tests);
}

void from_json(const nlohmann::json& j, SourceFileInfo& s) {
  from_json_required(j, "uri", s.uri);
  from_json_required(j, "isPartOfRootProject", s.is_part_of_root_project);
  from_json_required(j, "mayContainTests", s.may_contain_tests);
}

// FileHandlingCapability
auto ToString(FileHandlingCapability capability) -> std::string_view {
  switch (capability) {
    case FileHandlingCapability::kUnhandled:
      return "unhandled";
    case FileHandlingCapability::kFallback:
      return "fallback";
    case FileHandlingCapability::kHandled:
      return "handled";
  }
  return "unhandled";
}

void to_json(nlohmann::json& j, const FileHandlingCapability& c) {
  j = std::string(ToString(c));
}

void from_json(const nlohmann::json& j, FileHandlingCapability& c) {
  auto s = j.get<std::string>();
  if (s == "unhandled") {
    c = FileHandlingCapability::kUnhandled;
  } else if (s == "fallback") {
    c = FileHandlingCapability::kFallback;
  } else if (s == "handled") {
    c = FileHandlingCapability::kHandled;
  } else {
    throw std::runtime_error("Invalid file handling capability: " + s);
  }
}

// FileEvent
void to_json(nlohmann::json& j, const FileChangeType& t) {
  j = static_cast<int>(t);
}

void from_json(const nlohmann::json& j, FileChangeType& t) {
  auto value = j.get<int>();
  if (value < 1 || value > 3) {
    throw std::runtime_error("Invalid file change type");
  }
  t = static_cast<FileChangeType>(value);
}

void to_json(nlohmann::json& j, const FileEvent& e) {
  to_json_required(j, "uri", e.uri);
  to_json_required(j, "type", e.type);
}

void from_json(const nlohmann::json& j, FileEvent& e) {
  from_json_required(j, "uri", e.uri);
  from_json_required(j, "type", e.type);
}

}  // namespace buildcore
