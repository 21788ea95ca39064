#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace buildcore {

enum class FileChangeType { Created = 1, Changed = 2, Deleted = 3 };

struct FileEvent {
  std::string uri;
  FileChangeType type = FileChangeType::Changed;
};

void to_json(nlohmann::json& j, const FileChangeType& t);
void from_json(const nlohmann::json& j, FileChangeType& t);

void to_json(nlohmann::json& j, const FileEvent& e);
void from_json(const nlohmann::json& j, FileEvent& e);

}  // namespace buildcore
