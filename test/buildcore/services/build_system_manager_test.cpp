#include "buildcore/services/build_system_manager.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/buildcore/common/async_fixture.hpp"
#include "test/buildcore/common/file_fixture.hpp"
#include "test/buildcore/common/mock_build_system.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using buildcore::BuildCoreError;
using buildcore::BuildCoreErrorCode;
using buildcore::BuildSystemKind;
using buildcore::CanonicalPath;
using buildcore::ConfiguredTarget;
using buildcore::FileBuildSettings;
using buildcore::FileChangeType;
using buildcore::FileEvent;
using buildcore::IndexProcessResult;
using buildcore::Language;
using buildcore::ProcessExitKind;
using buildcore::services::BuildSystemManager;
using buildcore::services::ManagerOptions;
using buildcore::services::TaskScheduler;
using buildcore::services::ToolchainRegistry;
using buildcore::services::ToolchainSearchOptions;
using buildcore::test::MockBuildSystem;
using buildcore::test::RunAsyncTest;
using buildcore::test::Sleep;
using std::chrono::milliseconds;

namespace {

constexpr auto kDocument = "file:///mock/project/Sources/Core/main.cpp";
constexpr auto kOtherDocument = "file:///mock/project/Sources/Core/util.cpp";

// Comfortably longer than both debounce delays below
constexpr milliseconds kSettle{150};

auto TestOptions() -> ManagerOptions {
  return ManagerOptions{
      .settings_changed_delay = milliseconds(20),
      .source_files_changed_delay = milliseconds(40)};
}

auto MakeSettings(std::vector<std::string> arguments) -> FileBuildSettings {
  return FileBuildSettings{
      .compiler_arguments = std::move(arguments),
      .working_directory = "/mock/project",
      .language = Language::kCpp,
      .is_fallback = false};
}

struct Notification {
  std::string uri;
  std::optional<FileBuildSettings> settings;
};

// A manager over a MockBuildSystem with a settings handler that records
// every notification
class ManagerHarness {
 public:
  explicit ManagerHarness(
      asio::any_io_executor executor,
      std::shared_ptr<ToolchainRegistry> registry = nullptr,
      ManagerOptions options = TestOptions()) {
    auto mock = std::make_unique<MockBuildSystem>();
    mock_ = mock.get();
    scheduler_ = TaskScheduler::Create(executor, 2);
    manager_ = BuildSystemManager::Create(
        executor, std::move(mock), scheduler_, options, std::move(registry));
    manager_->AddSettingsChangedHandler(
        [this](
            const std::string& uri,
            const std::optional<FileBuildSettings>& settings) {
          notifications_.push_back(Notification{uri, settings});
        });
  }

  [[nodiscard]] auto Mock() const -> MockBuildSystem& {
    return *mock_;
  }

  [[nodiscard]] auto Manager() const -> const std::shared_ptr<BuildSystemManager>& {
    return manager_;
  }

  [[nodiscard]] auto Notifications() const
      -> const std::vector<Notification>& {
    return notifications_;
  }

 private:
  // Owned by the manager
  MockBuildSystem* mock_ = nullptr;
  std::shared_ptr<TaskScheduler> scheduler_;
  std::shared_ptr<BuildSystemManager> manager_;
  std::vector<Notification> notifications_;
};

}  // namespace

TEST_CASE(
    "BuildSystemManager returns nothing for unknown documents",
    "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);

    auto settings = co_await harness.Manager()->BuildSettingsForDocument(
        kDocument, Language::kCpp);
    REQUIRE_FALSE(settings.has_value());

    auto target = co_await harness.Manager()->CanonicalConfiguredTarget(
        kDocument);
    REQUIRE_FALSE(target.has_value());
  });
}

TEST_CASE(
    "BuildSystemManager delivers exactly one notification after registration",
    "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);
    harness.Mock().SetSettings(kDocument, MakeSettings({"-O"}));

    co_await harness.Manager()->RegisterForChangeNotifications(
        kDocument, Language::kCpp);
    // The backend knows nothing about this one, it still gets notified
    co_await harness.Manager()->RegisterForChangeNotifications(
        kOtherDocument, Language::kCpp);
    co_await Sleep(executor, kSettle);

    REQUIRE(harness.Notifications().size() == 2);
    REQUIRE(harness.Mock().Registered().size() == 2);

    for (const auto& notification : harness.Notifications()) {
      if (notification.uri == kDocument) {
        REQUIRE(notification.settings == MakeSettings({"-O"}));
      } else {
        REQUIRE(notification.uri == kOtherDocument);
        REQUIRE_FALSE(notification.settings.has_value());
      }
    }
  });
}

TEST_CASE(
    "BuildSystemManager shares one backend query between concurrent callers",
    "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);
    harness.Mock().SetSettings(kDocument, MakeSettings({"-O"}));
    harness.Mock().SetQueryDelay(milliseconds(30));

    std::vector<std::optional<FileBuildSettings>> results;
    for (int i = 0; i < 5; ++i) {
      asio::co_spawn(
          executor,
          harness.Manager()->BuildSettings(
              kDocument, MockBuildSystem::DefaultTarget(), Language::kCpp),
          [&results](
              std::exception_ptr error,
              std::optional<FileBuildSettings> settings) {
            if (!error) {
              results.push_back(std::move(settings));
            }
          });
    }
    co_await Sleep(executor, milliseconds(100));

    REQUIRE(results.size() == 5);
    for (const auto& result : results) {
      REQUIRE(result == MakeSettings({"-O"}));
    }
    REQUIRE(harness.Mock().SettingsQueryCount() == 1);

    // Served from the cache
    auto cached = co_await harness.Manager()->BuildSettings(
        kDocument, MockBuildSystem::DefaultTarget(), Language::kCpp);
    REQUIRE(cached == MakeSettings({"-O"}));
    REQUIRE(harness.Mock().SettingsQueryCount() == 1);

    // A different language is a different cache entry
    auto as_c = co_await harness.Manager()->BuildSettings(
        kDocument, MockBuildSystem::DefaultTarget(), Language::kC);
    REQUIRE(as_c.has_value());
    REQUIRE(as_c->language == Language::kC);
    REQUIRE(harness.Mock().SettingsQueryCount() == 2);
  });
}

TEST_CASE(
    "BuildSystemManager coalesces a burst of changes into one notification",
    "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);
    harness.Mock().SetSettings(kDocument, MakeSettings({"-O"}));

    co_await harness.Manager()->RegisterForChangeNotifications(
        kDocument, Language::kCpp);
    co_await Sleep(executor, kSettle);
    REQUIRE(harness.Notifications().size() == 1);
    REQUIRE(harness.Mock().SettingsQueryCount() == 1);

    harness.Mock().SetSettings(kDocument, MakeSettings({"-O0"}));
    harness.Mock().NotifySettingsChanged({kDocument});
    harness.Mock().NotifySettingsChanged({kDocument});
    harness.Mock().NotifySettingsChanged({kDocument});
    co_await Sleep(executor, kSettle);

    REQUIRE(harness.Notifications().size() == 2);
    REQUIRE(harness.Notifications().back().uri == kDocument);
    REQUIRE(harness.Notifications().back().settings == MakeSettings({"-O0"}));
    REQUIRE(harness.Mock().SettingsQueryCount() == 2);

    auto current = co_await harness.Manager()->BuildSettingsForDocument(
        kDocument, Language::kCpp);
    REQUIRE(current == MakeSettings({"-O0"}));
  });
}

TEST_CASE(
    "BuildSystemManager suppresses notifications for unchanged settings",
    "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);
    harness.Mock().SetSettings(kDocument, MakeSettings({"-O"}));

    co_await harness.Manager()->RegisterForChangeNotifications(
        kDocument, Language::kCpp);
    co_await Sleep(executor, kSettle);

    harness.Mock().NotifySettingsChanged({kDocument});
    co_await Sleep(executor, kSettle);

    // Queried again, but nothing new to say
    REQUIRE(harness.Mock().SettingsQueryCount() == 2);
    REQUIRE(harness.Notifications().size() == 1);

    // Registering again re-arms the first notification
    co_await harness.Manager()->RegisterForChangeNotifications(
        kDocument, Language::kCpp);
    co_await Sleep(executor, kSettle);
    REQUIRE(harness.Notifications().size() == 2);
  });
}

TEST_CASE(
    "BuildSystemManager keeps the last known settings when the backend fails",
    "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);
    harness.Mock().SetSettings(kDocument, MakeSettings({"-O"}));

    co_await harness.Manager()->RegisterForChangeNotifications(
        kDocument, Language::kCpp);
    co_await Sleep(executor, kSettle);

    harness.Mock().SetFailQueries(true);
    harness.Mock().NotifySettingsChanged({kDocument});
    co_await Sleep(executor, kSettle);

    REQUIRE(harness.Notifications().size() == 1);
    auto settings = co_await harness.Manager()->BuildSettingsForDocument(
        kDocument, Language::kCpp);
    REQUIRE(settings == MakeSettings({"-O"}));

    // Recovers once the backend answers again
    harness.Mock().SetFailQueries(false);
    harness.Mock().SetSettings(kDocument, MakeSettings({"-O2"}));
    harness.Mock().NotifySettingsChanged({kDocument});
    co_await Sleep(executor, kSettle);

    REQUIRE(harness.Notifications().size() == 2);
    REQUIRE(harness.Notifications().back().settings == MakeSettings({"-O2"}));
  });
}

TEST_CASE(
    "BuildSystemManager drops pending notifications on unregister",
    "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);
    harness.Mock().SetSettings(kDocument, MakeSettings({"-O"}));

    co_await harness.Manager()->RegisterForChangeNotifications(
        kDocument, Language::kCpp);
    co_await harness.Manager()->UnregisterForChangeNotifications(kDocument);
    co_await Sleep(executor, kSettle);

    REQUIRE(harness.Notifications().empty());
    REQUIRE(
        harness.Mock().Unregistered() == std::vector<std::string>{kDocument});

    // Changes to unregistered documents are not delivered
    harness.Mock().NotifySettingsChanged({kDocument});
    co_await Sleep(executor, kSettle);
    REQUIRE(harness.Notifications().empty());
  });
}

TEST_CASE("BuildSystemManager reacts to build target changes", "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);
    harness.Mock().SetSettings(kDocument, MakeSettings({"-O"}));

    co_await harness.Manager()->RegisterForChangeNotifications(
        kDocument, Language::kCpp);
    co_await Sleep(executor, kSettle);

    harness.Mock().SetSettings(kDocument, MakeSettings({"-DNEW_TARGET"}));
    harness.Mock().NotifyTargetsChanged();
    harness.Mock().NotifyTargetsChanged();
    co_await Sleep(executor, kSettle);

    REQUIRE(harness.Notifications().size() == 2);
    REQUIRE(
        harness.Notifications().back().settings ==
        MakeSettings({"-DNEW_TARGET"}));
  });
}

TEST_CASE("BuildSystemManager GenerateBuildGraph", "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);

    SECTION("Concurrent callers share one generation") {
      harness.Mock().SetGraphDelay(milliseconds(30));

      int succeeded = 0;
      for (int i = 0; i < 3; ++i) {
        asio::co_spawn(
            executor, harness.Manager()->GenerateBuildGraph(),
            [&succeeded](
                std::exception_ptr error,
                std::expected<void, BuildCoreError> result) {
              if (!error && result) {
                succeeded++;
              }
            });
      }
      co_await Sleep(executor, milliseconds(100));

      REQUIRE(succeeded == 3);
      REQUIRE(harness.Mock().GraphGenerationCount() == 1);

      // A later call starts a new generation
      auto again = co_await harness.Manager()->GenerateBuildGraph();
      REQUIRE(again.has_value());
      REQUIRE(harness.Mock().GraphGenerationCount() == 2);
    }

    SECTION("Backend failure is reported") {
      harness.Mock().SetGraphResult(BuildCoreError::Unexpected(
          BuildCoreErrorCode::UnknownError, "manifest is invalid"));

      auto result = co_await harness.Manager()->GenerateBuildGraph();
      REQUIRE_FALSE(result.has_value());
      REQUIRE(
          result.error().code() ==
          BuildCoreErrorCode::BuildGraphGenerationFailed);
      REQUIRE(
          result.error().message().find("manifest is invalid") !=
          std::string::npos);
    }

    SECTION("A throwing target query does not block later generations") {
      co_await harness.Manager()->RegisterForChangeNotifications(
          kDocument, Language::kCpp);
      co_await Sleep(executor, kSettle);
      harness.Mock().SetThrowOnTargets(true);

      auto first = co_await harness.Manager()->GenerateBuildGraph();
      REQUIRE(first.has_value());
      auto second = co_await harness.Manager()->GenerateBuildGraph();
      REQUIRE(second.has_value());
      REQUIRE(harness.Mock().GraphGenerationCount() == 2);

      auto targets = co_await harness.Manager()->ConfiguredTargets(kDocument);
      REQUIRE(targets.empty());

      // Nothing is left for a reconfiguration to wait on
      co_await harness.Manager()->Reconfigure(
          std::make_unique<MockBuildSystem>());
      co_await Sleep(executor, kSettle);
      auto kind = co_await harness.Manager()->Kind();
      REQUIRE(kind == BuildSystemKind::kCompilationDatabase);
    }

    SECTION("New targets after generation trigger a notification") {
      co_await harness.Manager()->RegisterForChangeNotifications(
          kDocument, Language::kCpp);
      co_await Sleep(executor, kSettle);
      REQUIRE(harness.Notifications().size() == 1);
      REQUIRE_FALSE(harness.Notifications().back().settings.has_value());

      harness.Mock().SetSettings(kDocument, MakeSettings({"-O"}));
      auto result = co_await harness.Manager()->GenerateBuildGraph();
      REQUIRE(result.has_value());
      co_await Sleep(executor, kSettle);

      REQUIRE(harness.Notifications().size() == 2);
      REQUIRE(harness.Notifications().back().settings == MakeSettings({"-O"}));
    }
  });
}

TEST_CASE("BuildSystemManager Prepare", "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);
    auto targets = std::vector<ConfiguredTarget>{MockBuildSystem::DefaultTarget()};

    SECTION("Unsupported backends reject preparation") {
      harness.Mock().SetSupportsPreparation(false);

      auto result = co_await harness.Manager()->Prepare(targets);
      REQUIRE_FALSE(result.has_value());
      REQUIRE(
          result.error().code() == BuildCoreErrorCode::PrepareNotSupported);
      REQUIRE(harness.Mock().PrepareCount() == 0);
    }

    SECTION("Backend capability errors reach the caller unchanged") {
      harness.Mock().SetPrepareError(BuildCoreError::Make(
          BuildCoreErrorCode::PrepareNotSupported, "no build server"));

      auto result = co_await harness.Manager()->Prepare(targets);
      REQUIRE_FALSE(result.has_value());
      REQUIRE(
          result.error().code() == BuildCoreErrorCode::PrepareNotSupported);
      REQUIRE(
          result.error().message() ==
          "Preparation not supported: no build server");
      REQUIRE(harness.Mock().PrepareCount() == 1);
    }

    SECTION("Process results reach the callback") {
      harness.Mock().SetPrepareProcesses({
          IndexProcessResult{
              .task_description = "compile Core",
              .command = {"clang", "-c", "main.cpp"},
              .exit_kind = ProcessExitKind::kExited,
              .exit_code = 0,
              .output = "",
              .error_output = "",
              .duration = milliseconds(12)},
          IndexProcessResult{
              .task_description = "link Core",
              .command = {"ld"},
              .exit_kind = ProcessExitKind::kExited,
              .exit_code = 0,
              .output = "",
              .error_output = "",
              .duration = milliseconds(3)},
      });

      std::vector<std::string> seen;
      auto result = co_await harness.Manager()->Prepare(
          targets, [&seen](const IndexProcessResult& process) {
            seen.push_back(process.task_description);
          });

      REQUIRE(result.has_value());
      REQUIRE(seen == std::vector<std::string>{"compile Core", "link Core"});
      REQUIRE(harness.Mock().PrepareCount() == 1);
    }

    SECTION("A failing process fails the preparation") {
      harness.Mock().SetPrepareProcesses({IndexProcessResult{
          .task_description = "compile Core",
          .command = {"clang", "-c", "broken.cpp"},
          .exit_kind = ProcessExitKind::kExited,
          .exit_code = 1,
          .output = "",
          .error_output = "broken.cpp:1:1: error: expected expression",
          .duration = milliseconds(5)}});

      auto result = co_await harness.Manager()->Prepare(targets);
      REQUIRE_FALSE(result.has_value());
      REQUIRE(result.error().code() == BuildCoreErrorCode::PrepareFailed);
    }
  });
}

TEST_CASE(
    "BuildSystemManager delivers the registration notification when target "
    "queries throw",
    "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);
    harness.Mock().SetSettings(kDocument, MakeSettings({"-O"}));
    harness.Mock().SetThrowOnTargets(true);

    co_await harness.Manager()->RegisterForChangeNotifications(
        kDocument, Language::kCpp);
    co_await Sleep(executor, kSettle);

    REQUIRE(harness.Notifications().size() == 1);
    REQUIRE_FALSE(harness.Notifications().back().settings.has_value());

    // Targets come back once the backend recovers
    harness.Mock().SetThrowOnTargets(false);
    auto result = co_await harness.Manager()->GenerateBuildGraph();
    REQUIRE(result.has_value());
    co_await Sleep(executor, kSettle);

    REQUIRE(harness.Notifications().size() == 2);
    REQUIRE(harness.Notifications().back().settings == MakeSettings({"-O"}));
  });
}

TEST_CASE(
    "BuildSystemManager bounds state for unregistered documents",
    "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto options = TestOptions();
    options.max_unregistered_documents = 1;
    ManagerHarness harness(executor, nullptr, options);
    harness.Mock().SetSettings(kDocument, MakeSettings({"-O"}));
    harness.Mock().SetSettings(kOtherDocument, MakeSettings({"-O1"}));
    auto target = MockBuildSystem::DefaultTarget();

    auto targets = co_await harness.Manager()->ConfiguredTargets(kDocument);
    REQUIRE(targets.size() == 1);
    REQUIRE(harness.Mock().TargetsQueryCount() == 1);

    // Graph generation only refreshes registered documents
    auto graph = co_await harness.Manager()->GenerateBuildGraph();
    REQUIRE(graph.has_value());
    REQUIRE(harness.Mock().TargetsQueryCount() == 1);

    // Only the newest unregistered document stays cached
    co_await harness.Manager()->BuildSettings(kDocument, target, Language::kCpp);
    co_await harness.Manager()->BuildSettings(
        kOtherDocument, target, Language::kCpp);
    REQUIRE(harness.Mock().SettingsQueryCount() == 2);

    co_await harness.Manager()->BuildSettings(
        kOtherDocument, target, Language::kCpp);
    REQUIRE(harness.Mock().SettingsQueryCount() == 2);

    auto evicted = co_await harness.Manager()->BuildSettings(
        kDocument, target, Language::kCpp);
    REQUIRE(evicted == MakeSettings({"-O"}));
    REQUIRE(harness.Mock().SettingsQueryCount() == 3);

    // Registered documents are refreshed after every generation
    co_await harness.Manager()->RegisterForChangeNotifications(
        kDocument, Language::kCpp);
    co_await Sleep(executor, kSettle);
    auto before = harness.Mock().TargetsQueryCount();

    graph = co_await harness.Manager()->GenerateBuildGraph();
    REQUIRE(graph.has_value());
    REQUIRE(harness.Mock().TargetsQueryCount() == before + 1);
  });
}

TEST_CASE("BuildSystemManager Reconfigure", "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);
    harness.Mock().SetSettings(kDocument, MakeSettings({"-O"}));

    int source_file_changes = 0;
    harness.Manager()->AddSourceFilesChangedHandler(
        [&source_file_changes]() { source_file_changes++; });

    co_await harness.Manager()->RegisterForChangeNotifications(
        kDocument, Language::kCpp);
    co_await Sleep(executor, kSettle);
    REQUIRE(harness.Notifications().size() == 1);

    auto replacement = std::make_unique<MockBuildSystem>(
        CanonicalPath("/mock/other"), BuildSystemKind::kPackage);
    replacement->SetSettings(kDocument, MakeSettings({"-DRECONFIGURED"}));
    auto* replacement_raw = replacement.get();

    co_await harness.Manager()->Reconfigure(std::move(replacement));
    co_await Sleep(executor, kSettle);

    REQUIRE(harness.Notifications().size() == 2);
    REQUIRE(
        harness.Notifications().back().settings ==
        MakeSettings({"-DRECONFIGURED"}));
    REQUIRE(
        replacement_raw->Registered() == std::vector<std::string>{kDocument});
    REQUIRE(source_file_changes == 1);

    auto kind = co_await harness.Manager()->Kind();
    REQUIRE(kind == BuildSystemKind::kPackage);
    auto root = co_await harness.Manager()->ProjectRoot();
    REQUIRE(root == CanonicalPath("/mock/other"));

    // Events from the new backend are delivered
    replacement_raw->SetSettings(kDocument, MakeSettings({"-DAFTER"}));
    replacement_raw->NotifySettingsChanged({kDocument});
    co_await Sleep(executor, kSettle);
    REQUIRE(harness.Notifications().size() == 3);
  });
}

TEST_CASE("BuildSystemManager handler management", "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);
    auto manager = harness.Manager();

    SECTION("Source file changes are debounced") {
      int calls = 0;
      manager->AddSourceFilesChangedHandler([&calls]() { calls++; });

      harness.Mock().NotifySourceFilesChanged();
      harness.Mock().NotifySourceFilesChanged();
      harness.Mock().NotifySourceFilesChanged();
      co_await Sleep(executor, kSettle);

      REQUIRE(calls == 1);
    }

    SECTION("Dependency updates are forwarded") {
      std::vector<std::string> updated;
      manager->AddDependenciesUpdatedHandler(
          [&updated](const std::vector<std::string>& uris) {
            updated.insert(updated.end(), uris.begin(), uris.end());
          });

      harness.Mock().NotifyDependenciesUpdated({kDocument, kOtherDocument});
      co_await Sleep(executor, milliseconds(10));

      REQUIRE(updated == std::vector<std::string>{kDocument, kOtherDocument});
    }

    SECTION("Removed handlers are not called") {
      int calls = 0;
      auto id = manager->AddSourceFilesChangedHandler([&calls]() { calls++; });
      manager->RemoveHandler(id);

      harness.Mock().NotifySourceFilesChanged();
      co_await Sleep(executor, kSettle);

      REQUIRE(calls == 0);
    }

    SECTION("A throwing handler does not stop the others") {
      manager->AddSettingsChangedHandler(
          [](const std::string&, const std::optional<FileBuildSettings>&) {
            throw std::runtime_error("handler failure");
          });

      co_await manager->RegisterForChangeNotifications(
          kDocument, Language::kCpp);
      co_await Sleep(executor, kSettle);

      REQUIRE(harness.Notifications().size() == 1);
    }
  });
}

TEST_CASE("BuildSystemManager forwards queries to the backend", "[manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ManagerHarness harness(executor);
    auto manager = harness.Manager();
    harness.Mock().SetSettings(kDocument, MakeSettings({"-O"}));
    harness.Mock().SetTargets(
        kOtherDocument,
        {ConfiguredTarget{.target_id = "Util", .run_destination_id = "host"},
         ConfiguredTarget{.target_id = "Core", .run_destination_id = "ios"}});

    co_await manager->FilesDidChange(
        {FileEvent{.uri = kDocument, .type = FileChangeType::Changed}});
    REQUIRE(harness.Mock().ReceivedEvents().size() == 1);
    REQUIRE(harness.Mock().ReceivedEvents()[0].uri == kDocument);

    auto canonical = co_await manager->CanonicalConfiguredTarget(kOtherDocument);
    REQUIRE(
        canonical ==
        ConfiguredTarget{.target_id = "Core", .run_destination_id = "ios"});

    auto language = co_await manager->DefaultLanguage(kDocument);
    REQUIRE(language == Language::kCpp);
    auto header_language = co_await manager->DefaultLanguage(
        "file:///mock/project/include/core.h");
    REQUIRE_FALSE(header_language.has_value());

    auto handled = co_await manager->FileHandlingCapability(kDocument);
    REQUIRE(handled == buildcore::FileHandlingCapability::kHandled);
    auto unhandled = co_await manager->FileHandlingCapability(kOtherDocument);
    REQUIRE(unhandled == buildcore::FileHandlingCapability::kUnhandled);

    auto files = co_await manager->SourceFiles();
    REQUIRE(files.size() == 1);
    REQUIRE(files[0].uri == kDocument);

    auto sorted = co_await manager->TopologicalSort(
        {ConfiguredTarget{.target_id = "B", .run_destination_id = "host"},
         ConfiguredTarget{.target_id = "A", .run_destination_id = "host"}});
    REQUIRE(sorted.has_value());
    REQUIRE(sorted->front().target_id == "A");

    harness.Mock().SetSupportsOrdering(false);
    auto dependents = co_await manager->TargetsDependingOn(
        {MockBuildSystem::DefaultTarget()});
    REQUIRE_FALSE(dependents.has_value());

    auto store = co_await manager->IndexStorePath();
    REQUIRE(store == CanonicalPath("/mock/index/store"));
    auto database = co_await manager->IndexDatabasePath();
    REQUIRE(database == CanonicalPath("/mock/index/db"));
    auto mappings = co_await manager->IndexPrefixMappings();
    REQUIRE(mappings.size() == 1);
    REQUIRE(mappings[0].original == "/build");
  });
}

TEST_CASE("BuildSystemManager ToolchainForDocument", "[manager][toolchain]") {
  buildcore::test::FileTestFixture fixture("buildcore_manager_toolchains");
  fixture.CreateExecutable("llvm-17.0.0/usr/bin/clang");
  fixture.CreateExecutable("swift-6.0/usr/bin/swift");

  auto registry = ToolchainRegistry::Create(ToolchainSearchOptions{
      .search_paths = {fixture.GetTempDir().Path()},
      .include_environment = false,
      .include_platform_defaults = false,
      .default_identifier = std::nullopt});
  registry->Scan();

  RunAsyncTest(
      [&fixture,
       &registry](asio::any_io_executor executor) -> asio::awaitable<void> {
        SECTION("Without a registry there is no toolchain") {
          ManagerHarness harness(executor);
          auto toolchain = co_await harness.Manager()->ToolchainForDocument(
              kDocument, Language::kCpp);
          REQUIRE_FALSE(toolchain.has_value());
          REQUIRE(
              toolchain.error().code() ==
              BuildCoreErrorCode::NoToolchainFound);
        }

        SECTION("Selection follows the document language") {
          ManagerHarness harness(executor, registry);

          auto cpp = co_await harness.Manager()->ToolchainForDocument(
              kDocument, Language::kCpp);
          REQUIRE(cpp.has_value());
          REQUIRE((*cpp)->DisplayName() == "llvm-17.0.0");

          auto swift = co_await harness.Manager()->ToolchainForDocument(
              "file:///mock/project/Sources/App/main.swift", Language::kSwift);
          REQUIRE(swift.has_value());
          REQUIRE((*swift)->DisplayName() == "swift-6.0");
        }

        SECTION("A removed toolchain is replaced on the next query") {
          ManagerHarness harness(executor, registry);
          // Only registered documents keep their toolchain
          co_await harness.Manager()->RegisterForChangeNotifications(
              kDocument, Language::kCpp);

          auto first = co_await harness.Manager()->ToolchainForDocument(
              kDocument, Language::kCpp);
          REQUIRE(first.has_value());

          fixture.CreateExecutable("llvm-18.0.0/usr/bin/clang");
          registry->Scan();

          // Still the remembered one while it exists
          auto remembered = co_await harness.Manager()->ToolchainForDocument(
              kDocument, Language::kCpp);
          REQUIRE(remembered.has_value());
          REQUIRE(remembered->get() == first->get());

          std::filesystem::remove_all(
              (fixture.GetTempDir() / "llvm-17.0.0").Path());
          registry->Scan();

          auto replaced = co_await harness.Manager()->ToolchainForDocument(
              kDocument, Language::kCpp);
          REQUIRE(replaced.has_value());
          REQUIRE((*replaced)->DisplayName() == "llvm-18.0.0");
        }
      });
}
