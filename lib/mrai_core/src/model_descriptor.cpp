#include "mr/ai/model_descriptor.hpp"

#include "mr/ai/errors.hpp"

#include <cctype>
#include <string>

namespace mr::ai {

namespace {
std::string normalize_tier_name(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    text.remove_suffix(1);

  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    if (ch == '_' || ch == ' ')
      ch = '-';
    out.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return out;
}
} // namespace

std::string_view to_string(SpeedTier tier) noexcept {
  switch (tier) {
  case SpeedTier::Slow:
    return "slow";
  case SpeedTier::Medium:
    return "medium";
  case SpeedTier::Fast:
    return "fast";
  }
  return "medium";
}

std::string_view to_string(IntelligenceTier tier) noexcept {
  switch (tier) {
  case IntelligenceTier::High:
    return "high";
  case IntelligenceTier::VeryHigh:
    return "very-high";
  case IntelligenceTier::Frontier:
    return "frontier";
  }
  return "high";
}

std::optional<SpeedTier> parse_speed_tier(std::string_view text) {
  const std::string name = normalize_tier_name(text);
  if (name == "slow")
    return SpeedTier::Slow;
  if (name == "medium")
    return SpeedTier::Medium;
  if (name == "fast")
    return SpeedTier::Fast;
  return std::nullopt;
}

std::optional<IntelligenceTier> parse_intelligence_tier(std::string_view text) {
  const std::string name = normalize_tier_name(text);
  if (name == "high")
    return IntelligenceTier::High;
  if (name == "very-high")
    return IntelligenceTier::VeryHigh;
  if (name == "frontier")
    return IntelligenceTier::Frontier;
  return std::nullopt;
}

std::vector<std::string> descriptor_problems(const ModelDescriptor &model) {
  std::vector<std::string> problems;
  if (model.model_id.empty())
    problems.emplace_back("model_id is required");
  if (model.provider.empty())
    problems.emplace_back("provider is required");
  if (model.context_window < 0)
    problems.emplace_back("context_window must be non-negative");
  if (model.max_output < 0)
    problems.emplace_back("max_output must be non-negative");
  if (model.cost_input.micro_usd_per_million < 0)
    problems.emplace_back("cost_input must be non-negative");
  if (model.cost_output.micro_usd_per_million < 0)
    problems.emplace_back("cost_output must be non-negative");
  return problems;
}

void validate_descriptor(const ModelDescriptor &model) {
  auto problems = descriptor_problems(model);
  if (problems.empty())
    return;
  const std::string name = model.model_id.empty() ? "<unnamed>" : model.model_id;
  throw ValidationError("invalid model '" + name + "': " + problems.front());
}

} // namespace mr::ai
