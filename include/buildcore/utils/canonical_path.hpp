#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace buildcore {

// Absolute, symlink-resolved path used as the identity of files and
// directories throughout the core (toolchain roots, project roots, index
// store locations)
class CanonicalPath {
 public:
  CanonicalPath() = default;

  explicit CanonicalPath(std::filesystem::path path);

  static auto FromUri(std::string_view uri) -> CanonicalPath;
  static auto CurrentPath() -> CanonicalPath;

  auto ToUri() const -> std::string;

  auto Path() const -> const std::filesystem::path&;
  auto String() const -> const std::string&;
  auto Filename() const -> std::string;
  auto Parent() const -> CanonicalPath;

  auto Empty() const -> bool;
  auto Exists() const -> bool;
  auto IsDirectory() const -> bool;

  // True if this path equals `ancestor` or lives below it
  auto IsSubPathOf(const CanonicalPath& ancestor) const -> bool;

  explicit operator std::string() const {
    return String();
  }

  friend auto operator==(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.String() == rhs.String();
  }

  friend auto operator<(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.String() < rhs.String();
  }

  auto operator/(std::filesystem::path rhs) const -> CanonicalPath;

 private:
  std::filesystem::path path_;
  mutable std::string cached_string_;
};

}  // namespace buildcore

template <>
struct fmt::formatter<buildcore::CanonicalPath> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const buildcore::CanonicalPath& p, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(p.String(), ctx);
  }
};

template <>
struct std::hash<buildcore::CanonicalPath> {
  auto operator()(const buildcore::CanonicalPath& path) const noexcept
      -> std::size_t {
    return std::hash<std::string>{}(path.String());
  }
};
