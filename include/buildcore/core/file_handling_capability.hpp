#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace buildcore {

// How well a backend can serve a file. Ordered so callers can pick the best
// of several candidates with std::max.
enum class FileHandlingCapability {
  kUnhandled = 0,
  kFallback = 1,
  kHandled = 2,
};

[[nodiscard]] auto ToString(FileHandlingCapability capability)
    -> std::string_view;

void to_json(nlohmann::json& j, const FileHandlingCapability& c);
void from_json(const nlohmann::json& j, FileHandlingCapability& c);

}  // namespace buildcore
