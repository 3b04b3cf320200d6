#pragma once

#include "mr/ai/log.hpp"
#include "mr/ai/model_registry.hpp"
#include "mr/ai/preference_store.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace mr::ai {

enum class PreferenceSource {
  Stored,          // the user's stored preference is known and enabled
  DefaultFallback, // unset, stale or unreadable; the default stands in
  None             // nothing usable and the registry has no default
};

std::string_view to_string(PreferenceSource source) noexcept;

struct ResolvedPreference {
  std::optional<std::string> model_id;
  PreferenceSource source = PreferenceSource::None;
};

/**
 * @brief Maps a user to the model id the selector should try first.
 *
 * Never fails: unknown users, stale ids and store errors all degrade to the
 * registry default. Capability mismatches are left to the selector.
 */
class PreferenceResolver {
public:
  explicit PreferenceResolver(PreferenceStore &store);

  // Safe to call while other threads resolve.
  void set_log_sink(LogSink sink);

  ResolvedPreference resolve(const std::string &user_id,
                             const RegistrySnapshot &snapshot) const;

  // Stores model_id for the user if it names an enabled model in the
  // snapshot. Returns false with a message otherwise, or when the store
  // fails.
  bool update_preference(const std::string &user_id,
                         const std::string &model_id,
                         const RegistrySnapshot &snapshot,
                         std::string *error_message = nullptr);

private:
  ResolvedPreference fallback(const RegistrySnapshot &snapshot) const;
  void warn(const std::string &message) const;

  PreferenceStore &store_;
  mutable std::mutex sink_mutex_;
  LogSink log_sink_;
};

} // namespace mr::ai
