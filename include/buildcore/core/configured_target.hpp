#pragma once

#include <compare>
#include <functional>
#include <string>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace buildcore {

// A buildable unit paired with a run destination, e.g. library `Core` built
// for a given platform/architecture. Both ids are opaque outside the backend
// that produced them.
struct ConfiguredTarget {
  std::string target_id;
  std::string run_destination_id;

  auto operator==(const ConfiguredTarget&) const -> bool = default;
  auto operator<=>(const ConfiguredTarget&) const = default;
};

void to_json(nlohmann::json& j, const ConfiguredTarget& t);
void from_json(const nlohmann::json& j, ConfiguredTarget& t);

}  // namespace buildcore

template <>
struct fmt::formatter<buildcore::ConfiguredTarget>
    : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const buildcore::ConfiguredTarget& t, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(
        fmt::format("{}-{}", t.target_id, t.run_destination_id), ctx);
  }
};

template <>
struct std::hash<buildcore::ConfiguredTarget> {
  auto operator()(const buildcore::ConfiguredTarget& target) const noexcept
      -> std::size_t {
    auto seed = std::hash<std::string>{}(target.target_id);
    seed ^= std::hash<std::string>{}(target.run_destination_id) +
            0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    return seed;
  }
};
