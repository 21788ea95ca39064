#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "buildcore/services/build_system_manager.hpp"
#include "buildcore/services/workspace.hpp"
#include "buildcore/utils/path_utils.hpp"

using buildcore::CanonicalPath;
using buildcore::services::BuildSystemManager;
using buildcore::services::Workspace;

namespace {

auto DescribeFile(
    const std::shared_ptr<BuildSystemManager>& manager, const std::string& file)
    -> asio::awaitable<nlohmann::json> {
  auto uri = buildcore::PathToUri(std::filesystem::absolute(file));
  nlohmann::json entry;
  entry["uri"] = uri;
  entry["capability"] = co_await manager->FileHandlingCapability(uri);

  auto language = co_await manager->DefaultLanguage(uri);
  if (!language) {
    entry["settings"] = nullptr;
    co_return entry;
  }
  entry["language"] = *language;

  auto target = co_await manager->CanonicalConfiguredTarget(uri);
  if (target) {
    entry["target"] = *target;
  }

  auto settings = co_await manager->BuildSettingsForDocument(uri, *language);
  entry["settings"] =
      settings ? nlohmann::json(*settings) : nlohmann::json(nullptr);

  auto toolchain = co_await manager->ToolchainForDocument(uri, *language);
  if (toolchain) {
    entry["toolchain"] = (*toolchain)->Identifier();
  } else {
    entry["toolchainError"] = toolchain.error().message();
  }
  co_return entry;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  const std::vector<std::string> args(argv, argv + argc);
  auto options = app::ParseArguments(args);
  if (!options) {
    fmt::print(stderr, "{}\n{}\n", options.error(), app::Usage());
    return 1;
  }

  auto loggers = app::SetupLoggers();

  asio::io_context io_context;
  auto executor = io_context.get_executor();
  int exit_code = 0;

  asio::co_spawn(
      io_context,
      [&]() -> asio::awaitable<void> {
        CanonicalPath workspace(std::filesystem::absolute(options->workspace));
        if (!workspace.IsDirectory()) {
          loggers["buildcore"]->error(
              "Workspace {} is not a directory", workspace);
          exit_code = 1;
          co_return;
        }

        auto session = Workspace::Create(
            executor, workspace, loggers["buildcore"], loggers["scheduler"],
            loggers["toolchain"]);
        co_await session->Initialize();
        auto manager = session->GetManager();
        auto registry = session->GetToolchainRegistry();

        auto graph = co_await manager->GenerateBuildGraph();
        if (!graph) {
          loggers["buildcore"]->error("{}", graph.error().message());
          exit_code = 1;
        }

        nlohmann::json output;
        output["workspace"] = workspace.String();
        output["buildSystem"] =
            std::string(buildcore::ToString(co_await manager->Kind()));

        if (options->list_toolchains) {
          output["toolchains"] = nlohmann::json::array();
          for (const auto& toolchain : registry->Toolchains()) {
            output["toolchains"].push_back(*toolchain);
          }
        }

        output["files"] = nlohmann::json::array();
        for (const auto& file : options->files) {
          output["files"].push_back(co_await DescribeFile(manager, file));
        }

        fmt::print("{}\n", output.dump(2));
      },
      [&](std::exception_ptr error) {
        if (!error) {
          return;
        }
        try {
          std::rethrow_exception(error);
        } catch (const std::exception& e) {
          spdlog::error("buildcore failed: {}", e.what());
          exit_code = 1;
        }
      });

  io_context.run();
  return exit_code;
}
