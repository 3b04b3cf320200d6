#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mr::ai {

// Source of each user's preferred_model. Implementations may throw on
// storage failures; callers in this library degrade rather than propagate.
class PreferenceStore {
public:
  virtual ~PreferenceStore() = default;

  virtual std::optional<std::string>
  preferred_model(const std::string &user_id) const = 0;
  virtual void set_preferred_model(const std::string &user_id,
                                   const std::string &model_id) = 0;
  virtual void clear_preferred_model(const std::string &user_id) = 0;
};

class InMemoryPreferenceStore : public PreferenceStore {
public:
  std::optional<std::string>
  preferred_model(const std::string &user_id) const override;
  void set_preferred_model(const std::string &user_id,
                           const std::string &model_id) override;
  void clear_preferred_model(const std::string &user_id) override;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> preferences_;
};

/**
 * @brief Preferences persisted as
 * {"users": {"<user_id>": {"preferred_model": "<model_id>"}}}.
 *
 * The file is read by reload() and rewritten on every change. Lookups are
 * served from memory.
 */
class JsonPreferenceStore : public PreferenceStore {
public:
  explicit JsonPreferenceStore(std::filesystem::path path);

  const std::filesystem::path &path() const noexcept { return path_; }

  // A missing file is an empty store. Returns false with a message when the
  // file cannot be read or parsed; the in-memory state is left unchanged.
  bool reload(std::string *error_message = nullptr);

  std::optional<std::string>
  preferred_model(const std::string &user_id) const override;
  // Both throw std::runtime_error when the file cannot be written and leave
  // the in-memory state as it was.
  void set_preferred_model(const std::string &user_id,
                           const std::string &model_id) override;
  void clear_preferred_model(const std::string &user_id) override;

private:
  void save_locked() const;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> preferences_;
};

} // namespace mr::ai
