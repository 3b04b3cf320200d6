#pragma once

#include "mr/ai/capability_requirement.hpp"
#include "mr/ai/log.hpp"
#include "mr/ai/model_registry.hpp"
#include "mr/ai/preference_resolver.hpp"
#include "mr/ai/preference_store.hpp"
#include "mr/ai/selector.hpp"

#include <mutex>
#include <string>

namespace mr::ai {

/**
 * @brief Entry point for callers that need a model for a request.
 *
 * Each call takes one registry snapshot and uses it for both preference
 * resolution and selection, so a concurrent reload never mixes two
 * versions in one decision.
 */
class ModelOrchestrator {
public:
  ModelOrchestrator(ModelRegistry &registry, PreferenceStore &store);

  // Also installs the sink on the preference resolver. Safe to call while
  // other threads select.
  void set_log_sink(LogSink sink);

  // Throws SelectionError (NoCompatibleModel, ValidationError).
  std::string select_model(const std::string &user_id,
                           const CapabilityRequirement &requirement) const;
  Selection select(const std::string &user_id,
                   const CapabilityRequirement &requirement) const;

  ResolvedPreference resolve_preference(const std::string &user_id) const;
  bool update_preference(const std::string &user_id,
                         const std::string &model_id,
                         std::string *error_message = nullptr);

  bool is_vision_capable(const std::string &model_id) const;
  std::string provider_of(const std::string &model_id) const;

private:
  void log(LogLevel level, const std::string &message) const;

  ModelRegistry &registry_;
  PreferenceResolver resolver_;
  mutable std::mutex sink_mutex_;
  LogSink log_sink_;
};

} // namespace mr::ai
