#include "mr/ai/model_registry.hpp"

#include "mr/ai/errors.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <utility>

namespace mr::ai {

namespace {
std::string join_ids(const std::vector<ModelDescriptor> &models,
                     const std::vector<std::size_t> &indices) {
  std::string out;
  for (std::size_t index : indices) {
    if (!out.empty())
      out += ", ";
    out += "'" + models[index].model_id + "'";
  }
  return out;
}
} // namespace

std::string_view to_string(DefaultConflictPolicy policy) noexcept {
  return policy == DefaultConflictPolicy::Reject ? "reject" : "repair";
}

std::optional<DefaultConflictPolicy>
parse_default_conflict_policy(std::string_view text) {
  std::string name;
  for (char ch : text)
    name.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  if (name == "repair")
    return DefaultConflictPolicy::Repair;
  if (name == "reject")
    return DefaultConflictPolicy::Reject;
  return std::nullopt;
}

std::vector<ModelDescriptor> RegistrySnapshot::enabled_models() const {
  std::vector<ModelDescriptor> enabled;
  for (const auto &model : models_) {
    if (model.is_enabled)
      enabled.push_back(model);
  }
  return enabled;
}

const ModelDescriptor *
RegistrySnapshot::find(std::string_view model_id) const noexcept {
  for (const auto &model : models_) {
    if (model.model_id == model_id)
      return &model;
  }
  return nullptr;
}

const ModelDescriptor *
RegistrySnapshot::find_enabled(std::string_view model_id) const noexcept {
  const ModelDescriptor *model = find(model_id);
  if (model && model->is_enabled)
    return model;
  return nullptr;
}

const ModelDescriptor *RegistrySnapshot::default_model() const noexcept {
  if (!default_index_)
    return nullptr;
  return &models_[*default_index_];
}

ModelRegistry::ModelRegistry(DefaultConflictPolicy policy)
    : current_(std::make_shared<const RegistrySnapshot>()), policy_(policy),
      log_sink_(default_log_sink()) {}

void ModelRegistry::set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lock(writer_mutex_);
  log_sink_ = std::move(sink);
}

void ModelRegistry::set_default_conflict_policy(DefaultConflictPolicy policy) {
  std::lock_guard<std::mutex> lock(writer_mutex_);
  policy_ = policy;
}

DefaultConflictPolicy ModelRegistry::default_conflict_policy() const {
  std::lock_guard<std::mutex> lock(writer_mutex_);
  return policy_;
}

std::shared_ptr<const RegistrySnapshot>
ModelRegistry::load(std::vector<ModelDescriptor> descriptors) {
  std::shared_ptr<const RegistrySnapshot> next;
  LogSink sink;
  {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    next = build_snapshot(std::move(descriptors),
                          current_.load()->version() + 1);
    current_.store(next);
    sink = log_sink_;
  }

  // Logged outside the lock; a sink may call back into the registry.
  if (sink) {
    for (const auto &warning : next->warnings())
      sink(LogLevel::Warning, warning);

    std::size_t enabled = 0;
    for (const auto &model : next->models())
      enabled += model.is_enabled ? 1 : 0;
    const ModelDescriptor *fallback = next->default_model();
    sink(LogLevel::Info,
         "published registry snapshot v" + std::to_string(next->version()) +
             " with " + std::to_string(next->models().size()) + " models (" +
             std::to_string(enabled) + " enabled), default " +
             (fallback ? "'" + fallback->model_id + "'"
                       : std::string("<none>")));
  }
  return next;
}

std::shared_ptr<RegistrySnapshot>
ModelRegistry::build_snapshot(std::vector<ModelDescriptor> descriptors,
                              std::uint64_t version) const {
  auto snapshot = std::make_shared<RegistrySnapshot>();
  snapshot->version_ = version;

  std::unordered_set<std::string> seen;
  for (const auto &model : descriptors) {
    validate_descriptor(model);
    if (!seen.insert(model.model_id).second)
      throw ValidationError("duplicate model id: '" + model.model_id + "'");
  }

  std::vector<std::size_t> flagged;
  for (std::size_t i = 0; i < descriptors.size(); ++i) {
    auto &model = descriptors[i];
    if (!model.is_default)
      continue;
    if (!model.is_enabled) {
      snapshot->warnings_.push_back("model '" + model.model_id +
                                    "' is flagged default but disabled; "
                                    "ignoring the flag");
      model.is_default = false;
      continue;
    }
    flagged.push_back(i);
  }

  if (flagged.size() > 1) {
    if (policy_ == DefaultConflictPolicy::Reject)
      throw ValidationError("multiple enabled models flagged default: " +
                            join_ids(descriptors, flagged));

    // Most recently updated wins; the earliest row wins a tie.
    std::size_t keep = flagged.front();
    for (std::size_t index : flagged) {
      if (descriptors[index].updated_at > descriptors[keep].updated_at)
        keep = index;
    }
    snapshot->warnings_.push_back(
        "inconsistent default: " + std::to_string(flagged.size()) +
        " enabled models flagged default (" + join_ids(descriptors, flagged) +
        "); keeping most recently updated '" + descriptors[keep].model_id +
        "'");
    for (std::size_t index : flagged) {
      if (index != keep)
        descriptors[index].is_default = false;
    }
    flagged.assign(1, keep);
  }

  if (!flagged.empty())
    snapshot->default_index_ = flagged.front();
  snapshot->models_ = std::move(descriptors);
  return snapshot;
}

std::shared_ptr<const RegistrySnapshot> ModelRegistry::snapshot() const {
  return current_.load();
}

std::uint64_t ModelRegistry::version() const {
  return current_.load()->version();
}

std::optional<ModelDescriptor>
ModelRegistry::find_model(const std::string &model_id) const {
  auto current = snapshot();
  if (const ModelDescriptor *model = current->find(model_id))
    return *model;
  return std::nullopt;
}

ModelDescriptor ModelRegistry::require_model(const std::string &model_id) const {
  auto model = find_model(model_id);
  if (!model)
    throw ModelNotFound(model_id);
  return *model;
}

ModelDescriptor ModelRegistry::default_model() const {
  auto current = snapshot();
  const ModelDescriptor *model = current->default_model();
  if (!model)
    throw NoDefaultAvailable();
  return *model;
}

std::vector<ModelDescriptor> ModelRegistry::enabled_models() const {
  return snapshot()->enabled_models();
}

bool is_vision_capable(const RegistrySnapshot &snapshot,
                       std::string_view model_id) noexcept {
  const ModelDescriptor *model = snapshot.find_enabled(model_id);
  if (!model)
    model = snapshot.default_model();
  return model && model->supports_vision;
}

std::string provider_of(const RegistrySnapshot &snapshot,
                        std::string_view model_id) {
  const ModelDescriptor *model = snapshot.find_enabled(model_id);
  if (!model)
    model = snapshot.default_model();
  return model ? model->provider : std::string();
}

} // namespace mr::ai
