#include "mr/ai/preference_store.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <map>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace mr::ai {

std::optional<std::string>
InMemoryPreferenceStore::preferred_model(const std::string &user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = preferences_.find(user_id);
  if (it == preferences_.end())
    return std::nullopt;
  return it->second;
}

void InMemoryPreferenceStore::set_preferred_model(const std::string &user_id,
                                                  const std::string &model_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  preferences_[user_id] = model_id;
}

void InMemoryPreferenceStore::clear_preferred_model(const std::string &user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  preferences_.erase(user_id);
}

JsonPreferenceStore::JsonPreferenceStore(std::filesystem::path path)
    : path_(std::move(path)) {}

bool JsonPreferenceStore::reload(std::string *error_message) {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    std::lock_guard<std::mutex> lock(mutex_);
    preferences_.clear();
    return true;
  }

  std::ifstream file(path_);
  if (!file.is_open()) {
    if (error_message)
      *error_message = "Failed to open preferences file: " + path_.string();
    return false;
  }

  std::unordered_map<std::string, std::string> loaded;
  try {
    nlohmann::json document;
    file >> document;
    if (!document.is_object() || !document.contains("users") ||
        !document["users"].is_object()) {
      if (error_message)
        *error_message = "Preferences file has no \"users\" object: " +
                         path_.string();
      return false;
    }
    for (const auto &[user_id, entry] : document["users"].items()) {
      if (entry.is_object() && entry.contains("preferred_model") &&
          entry["preferred_model"].is_string())
        loaded[user_id] = entry["preferred_model"].get<std::string>();
    }
  } catch (const nlohmann::json::exception &e) {
    if (error_message)
      *error_message = "Failed to parse preferences file " + path_.string() +
                       ": " + e.what();
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  preferences_ = std::move(loaded);
  return true;
}

std::optional<std::string>
JsonPreferenceStore::preferred_model(const std::string &user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = preferences_.find(user_id);
  if (it == preferences_.end())
    return std::nullopt;
  return it->second;
}

void JsonPreferenceStore::set_preferred_model(const std::string &user_id,
                                              const std::string &model_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto previous = preferences_;
  preferences_[user_id] = model_id;
  try {
    save_locked();
  } catch (...) {
    preferences_ = std::move(previous);
    throw;
  }
}

void JsonPreferenceStore::clear_preferred_model(const std::string &user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = preferences_.find(user_id);
  if (it == preferences_.end())
    return;
  std::string previous = std::move(it->second);
  preferences_.erase(it);
  try {
    save_locked();
  } catch (...) {
    preferences_.emplace(user_id, std::move(previous));
    throw;
  }
}

void JsonPreferenceStore::save_locked() const {
  // Sorted so the file diffs cleanly.
  std::map<std::string, std::string> ordered(preferences_.begin(),
                                             preferences_.end());
  nlohmann::json users = nlohmann::json::object();
  for (const auto &[user_id, model_id] : ordered)
    users[user_id] = {{"preferred_model", model_id}};
  nlohmann::json document = {{"users", users}};

  std::error_code ec;
  if (path_.has_parent_path())
    std::filesystem::create_directories(path_.parent_path(), ec);

  std::ofstream file(path_, std::ios::trunc);
  if (!file.is_open())
    throw std::runtime_error("Failed to write preferences file: " +
                             path_.string());
  file << document.dump(2) << '\n';
  if (!file)
    throw std::runtime_error("Failed to write preferences file: " +
                             path_.string());
}

} // namespace mr::ai
