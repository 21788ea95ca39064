#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace buildcore {

enum class ProcessExitKind { kExited, kSignalled, kCancelled };

// Outcome of one external preparation or indexing process
struct IndexProcessResult {
  std::string task_description;
  std::vector<std::string> command;
  ProcessExitKind exit_kind = ProcessExitKind::kExited;
  // Exit code for kExited, signal number for kSignalled
  int exit_code = 0;
  std::string output;
  std::string error_output;
  std::chrono::milliseconds duration{0};

  [[nodiscard]] auto Succeeded() const -> bool {
    return exit_kind == ProcessExitKind::kExited && exit_code == 0;
  }

  // One-line summary for logs, e.g. "prepare Core exited with code 1"
  [[nodiscard]] auto Summary() const -> std::string;
};

void to_json(nlohmann::json& j, const IndexProcessResult& r);
void from_json(const nlohmann::json& j, IndexProcessResult& r);

}  // namespace buildcore
