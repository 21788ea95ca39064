#pragma once

#include <expected>
#include <string>
#include <unordered_map>
#include <utility>

namespace buildcore {

/**
 * @brief Error codes reported by the build-system core
 */
enum class BuildCoreErrorCode {
  // No error
  Success = 0,

  // Backend errors
  BuildGraphGenerationFailed,
  BackendQueryFailed,
  PrepareNotSupported,
  PrepareFailed,

  // Toolchain errors
  NoToolchainFound,

  // Scheduling errors
  JobCancelled,

  // Configuration errors
  ConfigParseFailed,

  // Caller errors
  InvalidRequest,

  UnknownError
};

/**
 * @brief Error value carried by std::expected results
 */
class BuildCoreError {
 public:
  // Default constructor - no error
  BuildCoreError() : code_(BuildCoreErrorCode::Success) {}

  explicit BuildCoreError(BuildCoreErrorCode code) : code_(code) {
    message_ = GetDefaultMessage(code);
  }

  BuildCoreError(BuildCoreErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  bool ok() const { return code_ == BuildCoreErrorCode::Success; }

  BuildCoreErrorCode code() const { return code_; }

  const std::string& message() const { return message_; }

  // Allow if(error) checks
  explicit operator bool() const { return !ok(); }

  static std::string GetDefaultMessage(BuildCoreErrorCode code) {
    static const std::unordered_map<BuildCoreErrorCode, std::string> messages =
        {{BuildCoreErrorCode::Success, "Success"},
         {BuildCoreErrorCode::BuildGraphGenerationFailed,
          "Build graph generation failed"},
         {BuildCoreErrorCode::BackendQueryFailed, "Build system query failed"},
         {BuildCoreErrorCode::PrepareNotSupported, "Preparation not supported"},
         {BuildCoreErrorCode::PrepareFailed, "Preparation failed"},
         {BuildCoreErrorCode::NoToolchainFound, "No toolchain found"},
         {BuildCoreErrorCode::JobCancelled, "Job cancelled"},
         {BuildCoreErrorCode::ConfigParseFailed,
          "Failed to parse configuration"},
         {BuildCoreErrorCode::InvalidRequest, "Invalid request"},
         {BuildCoreErrorCode::UnknownError, "Unknown error"}};

    auto it = messages.find(code);
    if (it != messages.end()) {
      return it->second;
    }
    return "Unknown error";
  }

  // Default message, with ": <details>" appended when details are given
  static BuildCoreError Make(
      BuildCoreErrorCode code, const std::string& details = "") {
    if (details.empty()) {
      return BuildCoreError(code);
    }
    return BuildCoreError(code, GetDefaultMessage(code) + ": " + details);
  }

  static std::unexpected<BuildCoreError> Unexpected(
      BuildCoreErrorCode code, const std::string& details = "") {
    return std::unexpected<BuildCoreError>(Make(code, details));
  }

 private:
  BuildCoreErrorCode code_ = BuildCoreErrorCode::Success;
  std::string message_;
};

}  // namespace buildcore
