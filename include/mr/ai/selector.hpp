#pragma once

#include "mr/ai/capability_requirement.hpp"
#include "mr/ai/model_descriptor.hpp"
#include "mr/ai/model_registry.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mr::ai {

enum class SelectionReason {
  Preference, // the caller's preferred model passed the capability filter
  Default,    // the registry default passed the capability filter
  Ranked      // best candidate by intelligence, then speed, then order
};

std::string_view to_string(SelectionReason reason) noexcept;

struct Selection {
  ModelDescriptor model;
  SelectionReason reason = SelectionReason::Ranked;
  std::uint64_t snapshot_version = 0;
  std::size_t candidate_count = 0;
  // Set when ranking ran because the snapshot had no default at all.
  bool default_missing = false;
};

// Enabled models meeting the requirement, in registry order.
std::vector<const ModelDescriptor *>
candidate_models(const CapabilityRequirement &requirement,
                 const RegistrySnapshot &snapshot);

// True when a outranks b on tiers alone. Equal tiers rank neither first.
bool ranks_before(const ModelDescriptor &a, const ModelDescriptor &b) noexcept;

// Explains, dimension by dimension, why no enabled model fits.
std::vector<std::string>
diagnose_requirement(const CapabilityRequirement &requirement,
                     const RegistrySnapshot &snapshot);

/**
 * @brief Chooses exactly one model for a requirement.
 *
 * Capability filtering is a hard constraint. Within it the preferred model
 * wins, then the registry default, then the top-ranked candidate. Pure
 * function of its arguments.
 *
 * @throws ValidationError for a malformed requirement.
 * @throws NoCompatibleModel when no enabled model meets the requirement.
 */
Selection select_model(const CapabilityRequirement &requirement,
                       const std::optional<std::string> &preferred_model_id,
                       const RegistrySnapshot &snapshot);

} // namespace mr::ai
