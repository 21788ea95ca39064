#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string_view>

#include "buildcore/utils/canonical_path.hpp"

namespace buildcore::test {

// Base fixture for tests that need a scratch directory
class FileTestFixture {
 public:
  FileTestFixture() : FileTestFixture("buildcore_test") {
  }

  explicit FileTestFixture(std::string_view prefix) {
    std::filesystem::path base_temp;
    if (const char* test_tmpdir = std::getenv("TEST_TMPDIR")) {
      base_temp = test_tmpdir;
    } else {
      base_temp = std::filesystem::temp_directory_path();
    }

    temp_dir_ = base_temp / prefix;
    std::filesystem::remove_all(temp_dir_);
    std::filesystem::create_directories(temp_dir_);
  }

  ~FileTestFixture() {
    std::error_code ec;
    std::filesystem::remove_all(temp_dir_, ec);
  }

  FileTestFixture(const FileTestFixture&) = delete;
  auto operator=(const FileTestFixture&) -> FileTestFixture& = delete;
  FileTestFixture(FileTestFixture&&) = delete;
  auto operator=(FileTestFixture&&) -> FileTestFixture& = delete;

  [[nodiscard]] auto GetTempDir() const -> CanonicalPath {
    return CanonicalPath(temp_dir_);
  }

  // Creates parent directories as needed
  auto CreateFile(std::string_view relative_path, std::string_view content)
      -> CanonicalPath {
    auto file_path = temp_dir_ / relative_path;
    std::filesystem::create_directories(file_path.parent_path());
    std::ofstream file(file_path);
    file << content;
    file.close();
    return CanonicalPath(file_path);
  }

  auto CreateExecutable(std::string_view relative_path) -> CanonicalPath {
    auto path = CreateFile(relative_path, "#!/bin/sh\n");
    std::filesystem::permissions(
        path.Path(),
        std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec |
            std::filesystem::perms::others_exec,
        std::filesystem::perm_options::add);
    return path;
  }

  auto CreateDirectory(std::string_view relative_path) -> CanonicalPath {
    auto path = temp_dir_ / relative_path;
    std::filesystem::create_directories(path);
    return CanonicalPath(path);
  }

 private:
  std::filesystem::path temp_dir_;
};

}  // namespace buildcore::test
