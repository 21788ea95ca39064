#include "buildcore/utils/canonical_path.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

#include "buildcore/utils/path_utils.hpp"

namespace buildcore {

CanonicalPath::CanonicalPath(std::filesystem::path path)
    : path_(NormalizePath(std::move(path))) {
}

auto CanonicalPath::FromUri(std::string_view uri) -> CanonicalPath {
  return CanonicalPath(UriToPath(uri));
}

auto CanonicalPath::CurrentPath() -> CanonicalPath {
  return CanonicalPath(std::filesystem::current_path());
}

auto CanonicalPath::ToUri() const -> std::string {
  return PathToUri(path_);
}

auto CanonicalPath::Path() const -> const std::filesystem::path& {
  return path_;
}

auto CanonicalPath::String() const -> const std::string& {
  if (cached_string_.empty()) {
    cached_string_ = path_.string();
  }
  return cached_string_;
}

auto CanonicalPath::Filename() const -> std::string {
  return path_.filename().string();
}

auto CanonicalPath::Parent() const -> CanonicalPath {
  return CanonicalPath(path_.parent_path());
}

auto CanonicalPath::Empty() const -> bool {
  return path_.empty();
}

auto CanonicalPath::Exists() const -> bool {
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}

auto CanonicalPath::IsDirectory() const -> bool {
  std::error_code ec;
  return std::filesystem::is_directory(path_, ec);
}

auto CanonicalPath::IsSubPathOf(const CanonicalPath& ancestor) const -> bool {
  auto ancestor_length =
      std::distance(ancestor.path_.begin(), ancestor.path_.end());
  auto own_length = std::distance(path_.begin(), path_.end());
  if (ancestor_length > own_length) {
    return false;
  }
  return std::equal(
      ancestor.path_.begin(), ancestor.path_.end(), path_.begin());
}

auto CanonicalPath::operator/(std::filesystem::path rhs) const
    -> CanonicalPath {
  return CanonicalPath(path_ / rhs);
}

}  // namespace buildcore
