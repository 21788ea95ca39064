#include "buildcore/core/index_process_result.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "buildcore/core/json_utils.hpp"

namespace buildcore {

auto IndexProcessResult::Summary() const -> std::string {
  switch (exit_kind) {
    case ProcessExitKind::kExited:
      return fmt::format(
          "{} exited with code {} after {}ms", task_description, exit_code,
          duration.count());
    case ProcessExitKind::kSignalled:
      return fmt::format(
          "{} terminated by signal {} after {}ms", task_description,
          exit_code, duration.count());
    case ProcessExitKind::kCancelled:
      return fmt::format("{} was cancelled", task_description);
  }
  return task_description;
}

namespace {

auto ToString(ProcessExitKind kind) -> std::string {
  switch (kind) {
    case ProcessExitKind::kExited:
      return "exited";
    case ProcessExitKind::kSignalled:
      return "signalled";
    case ProcessExitKind::kCancelled:
      return "cancelled";
  }
  throw std::runtime_error("Invalid process exit kind");
}

auto ExitKindFromString(const std::string& s) -> ProcessExitKind {
  if (s == "exited") {
    return ProcessExitKind::kExited;
  }
  if (s == "signalled") {
    return ProcessExitKind::kSignalled;
  }
  if (s == "cancelled") {
    return ProcessExitKind::kCancelled;
  }
  throw std::runtime_error("Invalid process exit kind: " + s);
}

}  // namespace

void to_json(nlohmann::json& j, const IndexProcessResult& r) {
  to_json_required(j, "taskDescription", r.task_description);
  to_json_required(j, "command", r.command);
  to_json_required(j, "exitKind", ToString(r.exit_kind));
  to_json_required(j, "exitCode", r.exit_code);
  to_json_required(j, "output", r.output);
  to_json_required(j, "errorOutput", r.error_output);
  to_json_required(j, "durationMs", r.duration.count());
}

void from_json(const nlohmann::json& j, IndexProcessResult& r) {
  from_json_required(j, "taskDescription", r.task_description);
  from_json_required(j, "command", r.command);
  r.exit_kind = ExitKindFromString(j.at("exitKind").get<std::string>());
  from_json_required(j, "exitCode", r.exit_code);
  r.output = j.value("output", "");
  r.error_output = j.value("errorOutput", "");
  r.duration = std::chrono::milliseconds(j.value("durationMs", 0));
}

}  // namespace buildcore
