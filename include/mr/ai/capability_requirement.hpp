#pragma once

#include "mr/ai/cost_rate.hpp"
#include "mr/ai/model_descriptor.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mr::ai {

struct CapabilityRequirement {
  bool needs_vision = false;
  bool needs_thinking = false;
  std::int64_t min_context = 0;
  std::optional<CostRate> max_cost_input;
};

// Throws ValidationError for a negative min_context or cost ceiling.
void validate_requirement(const CapabilityRequirement &requirement);

// Capability check only; enablement is the registry's concern.
bool satisfies(const ModelDescriptor &model,
               const CapabilityRequirement &requirement) noexcept;

// e.g. "vision, thinking, min_context >= 100000, cost_input <= $1.00/1M
// tokens"; "any model" when nothing is required.
std::string describe_requirement(const CapabilityRequirement &requirement);

} // namespace mr::ai
