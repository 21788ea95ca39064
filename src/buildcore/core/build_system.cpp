#include "buildcore/core/build_system.hpp"

namespace buildcore {

auto ToString(BuildSystemKind kind) -> std::string_view {
  switch (kind) {
    case BuildSystemKind::kPackage:
      return "package";
    case BuildSystemKind::kCompilationDatabase:
      return "compilation-database";
    case BuildSystemKind::kBuildServer:
      return "build-server";
    case BuildSystemKind::kFallback:
      return "fallback";
  }
  return "unknown";
}

}  // namespace buildcore
