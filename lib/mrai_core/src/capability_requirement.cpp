#include "mr/ai/capability_requirement.hpp"

#include "mr/ai/errors.hpp"

#include <vector>

namespace mr::ai {

void validate_requirement(const CapabilityRequirement &requirement) {
  if (requirement.min_context < 0)
    throw ValidationError("min_context must be non-negative, got " +
                          std::to_string(requirement.min_context));
  if (requirement.max_cost_input &&
      requirement.max_cost_input->micro_usd_per_million < 0)
    throw ValidationError("max_cost_input must be non-negative, got " +
                          format_cost_rate(*requirement.max_cost_input));
}

bool satisfies(const ModelDescriptor &model,
               const CapabilityRequirement &requirement) noexcept {
  if (requirement.needs_vision && !model.supports_vision)
    return false;
  if (requirement.needs_thinking && !model.supports_thinking)
    return false;
  if (model.context_window < requirement.min_context)
    return false;
  if (requirement.max_cost_input &&
      !(model.cost_input <= *requirement.max_cost_input))
    return false;
  return true;
}

std::string describe_requirement(const CapabilityRequirement &requirement) {
  std::vector<std::string> parts;
  if (requirement.needs_vision)
    parts.emplace_back("vision");
  if (requirement.needs_thinking)
    parts.emplace_back("thinking");
  if (requirement.min_context > 0)
    parts.push_back("min_context >= " +
                    std::to_string(requirement.min_context));
  if (requirement.max_cost_input)
    parts.push_back("cost_input <= " +
                    format_cost_rate(*requirement.max_cost_input));

  if (parts.empty())
    return "any model";

  std::string out;
  for (const auto &part : parts) {
    if (!out.empty())
      out += ", ";
    out += part;
  }
  return out;
}

} // namespace mr::ai
