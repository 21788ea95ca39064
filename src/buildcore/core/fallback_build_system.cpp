#include "buildcore/core/fallback_build_system.hpp"

#include <utility>

#include <asio/post.hpp>

#include "buildcore/utils/path_utils.hpp"

namespace buildcore {

FallbackBuildSystem::FallbackBuildSystem(
    asio::any_io_executor executor, CanonicalPath project_root,
    FallbackBuildSystemOptions options, std::shared_ptr<spdlog::logger> logger)
    : BuildSystem(BuildSystemInfo{.project_root = std::move(project_root)}),
      executor_(std::move(executor)),
      options_(std::move(options)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto FallbackBuildSystem::Create(
    asio::any_io_executor executor, CanonicalPath project_root,
    FallbackBuildSystemOptions options, std::shared_ptr<spdlog::logger> logger)
    -> std::unique_ptr<FallbackBuildSystem> {
  return std::make_unique<FallbackBuildSystem>(
      std::move(executor), std::move(project_root), std::move(options),
      std::move(logger));
}

auto FallbackBuildSystem::ArgumentsFor(
    const std::filesystem::path& path, Language language) const
    -> std::vector<std::string> {
  std::vector<std::string> args = options_.arguments;

  auto append = [&args](const std::vector<std::string>& extra) {
    args.insert(args.end(), extra.begin(), extra.end());
  };

  switch (language) {
    case Language::kC:
    case Language::kObjectiveC:
      append(options_.c_arguments);
      break;
    case Language::kCpp:
    case Language::kObjectiveCpp:
      append(options_.cxx_arguments);
      break;
    case Language::kSwift:
      append(options_.swift_arguments);
      break;
  }

  if (options_.sdk_path) {
    if (language == Language::kSwift) {
      args.emplace_back("-sdk");
    } else {
      args.emplace_back("-isysroot");
    }
    args.push_back(*options_.sdk_path);
  }

  args.push_back(path.string());
  return args;
}

auto FallbackBuildSystem::BuildSettings(
    std::string uri, ConfiguredTarget target, Language language)
    -> asio::awaitable<
        std::expected<std::optional<FileBuildSettings>, BuildCoreError>> {
  if (target != Target()) {
    co_return std::optional<FileBuildSettings>{};
  }

  co_return FileBuildSettings{
      .compiler_arguments = ArgumentsFor(UriToPath(uri), language),
      .working_directory = ProjectRoot().String(),
      .language = language,
      .is_fallback = true,
  };
}

auto FallbackBuildSystem::ConfiguredTargets(std::string /*uri*/)
    -> asio::awaitable<std::vector<ConfiguredTarget>> {
  co_return std::vector<ConfiguredTarget>{Target()};
}

auto FallbackBuildSystem::GenerateBuildGraph()
    -> asio::awaitable<std::expected<void, BuildCoreError>> {
  co_return std::expected<void, BuildCoreError>{};
}

auto FallbackBuildSystem::TopologicalSort(
    std::vector<ConfiguredTarget> /*targets*/)
    -> asio::awaitable<std::optional<std::vector<ConfiguredTarget>>> {
  co_return std::nullopt;
}

auto FallbackBuildSystem::TargetsDependingOn(
    std::vector<ConfiguredTarget> /*targets*/)
    -> asio::awaitable<std::optional<std::vector<ConfiguredTarget>>> {
  co_return std::nullopt;
}

auto FallbackBuildSystem::Prepare(
    std::vector<ConfiguredTarget> /*targets*/,
    ProcessResultCallback /*on_process_result*/)
    -> asio::awaitable<std::expected<void, BuildCoreError>> {
  co_return BuildCoreError::Unexpected(
      BuildCoreErrorCode::PrepareNotSupported, "fallback build system");
}

auto FallbackBuildSystem::DefaultLanguage(std::string uri)
    -> asio::awaitable<std::optional<Language>> {
  co_return LanguageForPath(UriToPath(uri));
}

auto FallbackBuildSystem::RegisterForChangeNotifications(std::string uri)
    -> void {
  logger_->debug("FallbackBuildSystem registered: {}", uri);

  // Settings never change, but the registrant still expects one report
  asio::post(
      executor_, [weak = std::weak_ptr<BuildSystemDelegate>(Delegate()),
                  uri = std::move(uri)]() mutable {
        if (auto delegate = weak.lock()) {
          delegate->FileBuildSettingsChanged({std::move(uri)});
        }
      });
}

auto FallbackBuildSystem::UnregisterForChangeNotifications(std::string uri)
    -> void {
  logger_->debug("FallbackBuildSystem unregistered: {}", uri);
}

auto FallbackBuildSystem::FilesDidChange(std::vector<FileEvent> events)
    -> void {
  logger_->trace(
      "FallbackBuildSystem ignoring {} file event(s)", events.size());
}

auto FallbackBuildSystem::FileHandlingCapability(std::string uri)
    -> asio::awaitable<buildcore::FileHandlingCapability> {
  if (LanguageForPath(UriToPath(uri))) {
    co_return buildcore::FileHandlingCapability::kFallback;
  }
  co_return buildcore::FileHandlingCapability::kUnhandled;
}

auto FallbackBuildSystem::SourceFiles()
    -> asio::awaitable<std::vector<SourceFileInfo>> {
  co_return std::vector<SourceFileInfo>{};
}

}  // namespace buildcore
