#pragma once

#include "mr/ai/cost_rate.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mr::ai {

// Ordered slowest to fastest; ranking compares the underlying values.
enum class SpeedTier { Slow = 0, Medium = 1, Fast = 2 };

// Ordered least to most capable.
enum class IntelligenceTier { High = 0, VeryHigh = 1, Frontier = 2 };

std::string_view to_string(SpeedTier tier) noexcept;
std::string_view to_string(IntelligenceTier tier) noexcept;
std::optional<SpeedTier> parse_speed_tier(std::string_view text);
std::optional<IntelligenceTier> parse_intelligence_tier(std::string_view text);

struct ModelDescriptor {
  std::string model_id;     // Registry key (e.g., "claude-haiku-4.5")
  std::string display_name; // e.g., "Claude Haiku 4.5"
  std::string provider;     // e.g., "anthropic", "openrouter"
  std::string slug;         // Provider-side model name, advisory
  std::string description;
  std::int64_t context_window = 0; // Input tokens
  std::int64_t max_output = 0;     // Output tokens
  CostRate cost_input;
  CostRate cost_output;
  bool supports_thinking = false;
  bool supports_vision = false;
  SpeedTier speed_tier = SpeedTier::Medium;
  IntelligenceTier intelligence_tier = IntelligenceTier::High;
  std::vector<std::string> recommended_for; // Display only
  bool is_enabled = true;
  bool is_default = false;
  std::int64_t updated_at = 0; // Seconds since the Unix epoch
};

// Lists every field-level problem with a descriptor; empty when valid.
std::vector<std::string> descriptor_problems(const ModelDescriptor &model);

// Throws ValidationError naming the model and its first problem.
void validate_descriptor(const ModelDescriptor &model);

} // namespace mr::ai
