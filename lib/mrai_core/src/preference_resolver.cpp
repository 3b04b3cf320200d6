#include "mr/ai/preference_resolver.hpp"

#include <exception>
#include <utility>

namespace mr::ai {

std::string_view to_string(PreferenceSource source) noexcept {
  switch (source) {
  case PreferenceSource::Stored:
    return "stored";
  case PreferenceSource::DefaultFallback:
    return "default-fallback";
  case PreferenceSource::None:
    return "none";
  }
  return "none";
}

PreferenceResolver::PreferenceResolver(PreferenceStore &store)
    : store_(store), log_sink_(default_log_sink()) {}

void PreferenceResolver::set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  log_sink_ = std::move(sink);
}

ResolvedPreference
PreferenceResolver::resolve(const std::string &user_id,
                            const RegistrySnapshot &snapshot) const {
  std::optional<std::string> stored;
  try {
    stored = store_.preferred_model(user_id);
  } catch (const std::exception &e) {
    warn("preference lookup failed for user '" + user_id +
         "', using default model: " + e.what());
    return fallback(snapshot);
  }

  if (!stored || stored->empty())
    return fallback(snapshot);

  if (const ModelDescriptor *model = snapshot.find(*stored)) {
    if (model->is_enabled)
      return {model->model_id, PreferenceSource::Stored};
    warn("preferred model '" + *stored + "' of user '" + user_id +
         "' is disabled, using default model");
  } else {
    warn("preferred model '" + *stored + "' of user '" + user_id +
         "' is not in the registry, using default model");
  }
  return fallback(snapshot);
}

bool PreferenceResolver::update_preference(const std::string &user_id,
                                           const std::string &model_id,
                                           const RegistrySnapshot &snapshot,
                                           std::string *error_message) {
  if (user_id.empty()) {
    if (error_message)
      *error_message = "user id is required";
    return false;
  }

  const ModelDescriptor *model = snapshot.find(model_id);
  if (!model) {
    if (error_message)
      *error_message = "unknown model id: " + model_id;
    return false;
  }
  if (!model->is_enabled) {
    if (error_message)
      *error_message = "model is disabled: " + model_id;
    return false;
  }

  try {
    store_.set_preferred_model(user_id, model_id);
  } catch (const std::exception &e) {
    if (error_message)
      *error_message = "failed to store preference: " + std::string(e.what());
    return false;
  }
  return true;
}

ResolvedPreference
PreferenceResolver::fallback(const RegistrySnapshot &snapshot) const {
  if (const ModelDescriptor *model = snapshot.default_model())
    return {model->model_id, PreferenceSource::DefaultFallback};
  return {std::nullopt, PreferenceSource::None};
}

void PreferenceResolver::warn(const std::string &message) const {
  LogSink sink;
  {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink = log_sink_;
  }
  if (sink)
    sink(LogLevel::Warning, message);
}

} // namespace mr::ai
