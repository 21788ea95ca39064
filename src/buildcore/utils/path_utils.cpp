#include "buildcore/utils/path_utils.hpp"

#include <regex>
#include <system_error>

#include <fmt/format.h>

namespace buildcore {

auto IsConfigFile(std::filesystem::path path) -> bool {
  return path.filename() == ".buildcore";
}

auto IsExecutableFile(const std::filesystem::path& path) -> bool {
  std::error_code ec;
  auto status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::is_regular_file(status)) {
    return false;
  }
  using std::filesystem::perms;
  return (status.permissions() &
          (perms::owner_exec | perms::group_exec | perms::others_exec)) !=
         perms::none;
}

auto UriToPath(std::string_view uri) -> std::filesystem::path {
  if (!uri.starts_with("file://")) {
    return {uri};
  }

  std::string path(uri.substr(7));

  // file:///C:/path -> C:/path
  if (path.size() >= 3 && path[0] == '/' && path[2] == ':') {
    path = path.substr(1);
  }

  static const std::regex kEscapeRegex("%([0-9A-Fa-f]{2})");

  std::string result;
  std::regex_iterator<std::string::iterator> it(
      path.begin(), path.end(), kEscapeRegex);
  std::regex_iterator<std::string::iterator> end;

  std::size_t last_pos = 0;
  while (it != end) {
    result.append(path, last_pos, it->position() - last_pos);
    std::string hex = (*it)[1];
    result += static_cast<char>(std::stoi(hex, nullptr, 16));
    last_pos = it->position() + it->length();
    ++it;
  }

  result.append(path, last_pos, path.length() - last_pos);
  return result;
}

auto PathToUri(std::filesystem::path path) -> std::string {
  std::string result = "file://";
  const auto path_string = path.string();

  if (path_string.size() >= 2 && path_string[1] == ':') {
    result += '/';
  }

  for (char c : path_string) {
    if (c == ' ' || c == '%' || c == '#' || c == '?' ||
        static_cast<unsigned char>(c) > 127 ||
        static_cast<unsigned char>(c) < 32) {
      result += fmt::format("%{:02X}", static_cast<unsigned char>(c));
    } else {
      result += c;
    }
  }

  return result;
}

auto NormalizePath(std::filesystem::path path) -> std::filesystem::path {
  // Paths that do not exist (synthetic test documents, deleted files) are
  // kept lexically normalized only
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    auto canonical = std::filesystem::canonical(path, ec);
    if (!ec) {
      return canonical;
    }
  }
  return path.lexically_normal();
}

}  // namespace buildcore
