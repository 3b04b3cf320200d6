#include "mr/ai/model_orchestrator.hpp"

#include <utility>

namespace mr::ai {

ModelOrchestrator::ModelOrchestrator(ModelRegistry &registry,
                                     PreferenceStore &store)
    : registry_(registry), resolver_(store), log_sink_(default_log_sink()) {}

void ModelOrchestrator::set_log_sink(LogSink sink) {
  resolver_.set_log_sink(sink);
  std::lock_guard<std::mutex> lock(sink_mutex_);
  log_sink_ = std::move(sink);
}

std::string
ModelOrchestrator::select_model(const std::string &user_id,
                                const CapabilityRequirement &requirement) const {
  return select(user_id, requirement).model.model_id;
}

Selection
ModelOrchestrator::select(const std::string &user_id,
                          const CapabilityRequirement &requirement) const {
  auto snapshot = registry_.snapshot();
  ResolvedPreference preference = resolver_.resolve(user_id, *snapshot);
  Selection selection =
      mr::ai::select_model(requirement, preference.model_id, *snapshot);

  if (selection.default_missing)
    log(LogLevel::Warning,
        "registry v" + std::to_string(snapshot->version()) +
            " has no default model; ranked '" + selection.model.model_id +
            "' for user '" + user_id + "'");
  return selection;
}

ResolvedPreference
ModelOrchestrator::resolve_preference(const std::string &user_id) const {
  auto snapshot = registry_.snapshot();
  return resolver_.resolve(user_id, *snapshot);
}

bool ModelOrchestrator::update_preference(const std::string &user_id,
                                          const std::string &model_id,
                                          std::string *error_message) {
  auto snapshot = registry_.snapshot();
  if (!resolver_.update_preference(user_id, model_id, *snapshot,
                                   error_message))
    return false;
  log(LogLevel::Info,
      "user '" + user_id + "' switched to model '" + model_id + "'");
  return true;
}

bool ModelOrchestrator::is_vision_capable(const std::string &model_id) const {
  return mr::ai::is_vision_capable(*registry_.snapshot(), model_id);
}

std::string ModelOrchestrator::provider_of(const std::string &model_id) const {
  return mr::ai::provider_of(*registry_.snapshot(), model_id);
}

void ModelOrchestrator::log(LogLevel level, const std::string &message) const {
  LogSink sink;
  {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink = log_sink_;
  }
  if (sink)
    sink(level, message);
}

} // namespace mr::ai
