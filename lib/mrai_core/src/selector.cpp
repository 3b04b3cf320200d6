#include "mr/ai/selector.hpp"

#include "mr/ai/errors.hpp"

#include <algorithm>

namespace mr::ai {

std::string_view to_string(SelectionReason reason) noexcept {
  switch (reason) {
  case SelectionReason::Preference:
    return "preference";
  case SelectionReason::Default:
    return "default";
  case SelectionReason::Ranked:
    return "ranked";
  }
  return "ranked";
}

std::vector<const ModelDescriptor *>
candidate_models(const CapabilityRequirement &requirement,
                 const RegistrySnapshot &snapshot) {
  std::vector<const ModelDescriptor *> candidates;
  for (const auto &model : snapshot.models()) {
    if (model.is_enabled && satisfies(model, requirement))
      candidates.push_back(&model);
  }
  return candidates;
}

bool ranks_before(const ModelDescriptor &a, const ModelDescriptor &b) noexcept {
  if (a.intelligence_tier != b.intelligence_tier)
    return static_cast<int>(a.intelligence_tier) >
           static_cast<int>(b.intelligence_tier);
  return static_cast<int>(a.speed_tier) > static_cast<int>(b.speed_tier);
}

std::vector<std::string>
diagnose_requirement(const CapabilityRequirement &requirement,
                     const RegistrySnapshot &snapshot) {
  std::vector<const ModelDescriptor *> enabled;
  for (const auto &model : snapshot.models()) {
    if (model.is_enabled)
      enabled.push_back(&model);
  }
  if (enabled.empty())
    return {"no enabled models in the registry"};

  auto none_match = [&](auto predicate) {
    return std::none_of(enabled.begin(), enabled.end(),
                        [&](const ModelDescriptor *model) {
                          return predicate(*model);
                        });
  };

  std::vector<std::string> unmet;
  if (requirement.needs_vision &&
      none_match([](const ModelDescriptor &m) { return m.supports_vision; }))
    unmet.emplace_back("requires vision, no enabled model supports it");
  if (requirement.needs_thinking &&
      none_match([](const ModelDescriptor &m) { return m.supports_thinking; }))
    unmet.emplace_back(
        "requires extended thinking, no enabled model supports it");
  if (none_match([&](const ModelDescriptor &m) {
        return m.context_window >= requirement.min_context;
      })) {
    std::int64_t widest = 0;
    for (const ModelDescriptor *model : enabled)
      widest = std::max(widest, model->context_window);
    unmet.push_back("requires a context window of at least " +
                    std::to_string(requirement.min_context) +
                    " tokens, largest enabled window is " +
                    std::to_string(widest));
  }
  if (requirement.max_cost_input &&
      none_match([&](const ModelDescriptor &m) {
        return m.cost_input <= *requirement.max_cost_input;
      }))
    unmet.push_back("requires input cost at most " +
                    format_cost_rate(*requirement.max_cost_input) +
                    ", no enabled model is that cheap");

  if (unmet.empty())
    unmet.push_back("no single enabled model satisfies the combination: " +
                    describe_requirement(requirement));
  return unmet;
}

Selection select_model(const CapabilityRequirement &requirement,
                       const std::optional<std::string> &preferred_model_id,
                       const RegistrySnapshot &snapshot) {
  validate_requirement(requirement);

  const auto candidates = candidate_models(requirement, snapshot);
  if (candidates.empty())
    throw NoCompatibleModel(requirement,
                            diagnose_requirement(requirement, snapshot));

  const ModelDescriptor *fallback = snapshot.default_model();
  auto in_candidates = [&](std::string_view model_id) {
    return std::find_if(candidates.begin(), candidates.end(),
                        [&](const ModelDescriptor *model) {
                          return model->model_id == model_id;
                        });
  };

  Selection selection;
  selection.snapshot_version = snapshot.version();
  selection.candidate_count = candidates.size();

  if (preferred_model_id && !preferred_model_id->empty()) {
    auto it = in_candidates(*preferred_model_id);
    if (it != candidates.end()) {
      selection.model = **it;
      // A preference that already equals the default is reported as such.
      selection.reason = (fallback && fallback->model_id == (*it)->model_id)
                             ? SelectionReason::Default
                             : SelectionReason::Preference;
      return selection;
    }
  }

  if (fallback) {
    auto it = in_candidates(fallback->model_id);
    if (it != candidates.end()) {
      selection.model = **it;
      selection.reason = SelectionReason::Default;
      return selection;
    }
  } else {
    selection.default_missing = true;
  }

  // Strictly-better comparison keeps the earliest registry row on ties.
  const ModelDescriptor *best = candidates.front();
  for (const ModelDescriptor *candidate : candidates) {
    if (ranks_before(*candidate, *best))
      best = candidate;
  }
  selection.model = *best;
  selection.reason = SelectionReason::Ranked;
  return selection;
}

} // namespace mr::ai
