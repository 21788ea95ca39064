#include "buildcore/utils/canonical_path.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <unordered_set>

#include <catch2/catch_all.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "buildcore/utils/scoped_timer.hpp"
#include "test/buildcore/common/file_fixture.hpp"

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(spdlog::level::debug);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using buildcore::CanonicalPath;
using buildcore::test::FileTestFixture;

TEST_CASE("CanonicalPath normalizes missing paths lexically", "[path]") {
  CanonicalPath path("/mock/project/./Sources/../Package.swift");
  REQUIRE(path.String() == "/mock/project/Package.swift");
  REQUIRE(path.Filename() == "Package.swift");
  REQUIRE(path.Parent() == CanonicalPath("/mock/project"));
  REQUIRE_FALSE(path.Exists());
}

TEST_CASE("CanonicalPath resolves symlinks", "[path]") {
  FileTestFixture fixture("buildcore_canonical_path_test");
  auto target = fixture.CreateDirectory("real/toolchain");
  auto link = fixture.GetTempDir().Path() / "link";
  std::filesystem::create_directory_symlink(target.Path(), link);

  CanonicalPath through_link(link);
  REQUIRE(through_link == target);
  REQUIRE(through_link.IsDirectory());

  std::unordered_set<CanonicalPath> paths{target, through_link};
  REQUIRE(paths.size() == 1);
}

TEST_CASE("CanonicalPath IsSubPathOf compares components", "[path]") {
  CanonicalPath root("/workspace/project");

  REQUIRE(CanonicalPath("/workspace/project").IsSubPathOf(root));
  REQUIRE(CanonicalPath("/workspace/project/src/a.c").IsSubPathOf(root));
  REQUIRE_FALSE(CanonicalPath("/workspace/project2/a.c").IsSubPathOf(root));
  REQUIRE_FALSE(CanonicalPath("/workspace").IsSubPathOf(root));
}

TEST_CASE("CanonicalPath URI round trip keeps escapes", "[path]") {
  auto path = CanonicalPath::FromUri("file:///workspace/my%20project/a.c");
  REQUIRE(path.String() == "/workspace/my project/a.c");
  REQUIRE(path.ToUri() == "file:///workspace/my%20project/a.c");
  REQUIRE(fmt::format("{}", path) == "/workspace/my project/a.c");
}

TEST_CASE("ScopedTimer formats durations", "[timer]") {
  using buildcore::utils::ScopedTimer;
  using std::chrono::milliseconds;

  REQUIRE(ScopedTimer::FormatDuration(milliseconds(0)) == "0ms");
  REQUIRE(ScopedTimer::FormatDuration(milliseconds(999)) == "999ms");
  REQUIRE(ScopedTimer::FormatDuration(milliseconds(1000)) == "1.0s");
  REQUIRE(ScopedTimer::FormatDuration(milliseconds(12345)) == "12.3s");
}

TEST_CASE("ScopedTimer escalates slow operations", "[timer]") {
  using buildcore::utils::ScopedTimer;
  using std::chrono::hours;
  using std::chrono::milliseconds;

  std::ostringstream output;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output);
  auto logger = std::make_shared<spdlog::logger>("timer_test", sink);
  logger->set_pattern("%l %v");
  logger->set_level(spdlog::level::debug);

  SECTION("Fast operations log at debug") {
    { ScopedTimer timer("generate build graph", logger, hours(1)); }
    REQUIRE(output.str().starts_with("debug generate build graph completed"));
  }

  SECTION("Operations over the threshold log a warning") {
    { ScopedTimer timer("prepare Core", logger, milliseconds(0)); }
    REQUIRE(output.str().starts_with("warning prepare Core completed"));
  }
}
