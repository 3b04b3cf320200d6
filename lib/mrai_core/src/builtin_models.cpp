#include "mr/ai/model_catalog.hpp"

#include <utility>

namespace mr::ai {

namespace {
constexpr std::int64_t K = 1000;

ModelDescriptor make_model(std::string id, std::string name, std::string slug,
                           std::string provider, std::string description,
                           std::int64_t context_window, std::int64_t max_output,
                           double cost_input, double cost_output,
                           bool thinking, bool vision, SpeedTier speed,
                           IntelligenceTier intelligence,
                           std::vector<std::string> recommended_for) {
  ModelDescriptor model;
  model.model_id = std::move(id);
  model.display_name = std::move(name);
  model.slug = std::move(slug);
  model.provider = std::move(provider);
  model.description = std::move(description);
  model.context_window = context_window;
  model.max_output = max_output;
  model.cost_input = CostRate::from_usd(cost_input);
  model.cost_output = CostRate::from_usd(cost_output);
  model.supports_thinking = thinking;
  model.supports_vision = vision;
  model.speed_tier = speed;
  model.intelligence_tier = intelligence;
  model.recommended_for = std::move(recommended_for);
  return model;
}
} // namespace

std::vector<ModelDescriptor> builtin_models() {
  std::vector<ModelDescriptor> models = {
      // Anthropic (direct API)
      make_model("claude-haiku-4.5", "Claude Haiku 4.5",
                 "claude-haiku-4-5-20251001", "anthropic",
                 "Near-frontier performance at lightning speed", 200 * K,
                 64 * K, 1.00, 5.00, true, true, SpeedTier::Fast,
                 IntelligenceTier::VeryHigh,
                 {"Real-time chat", "Quick operations",
                  "Cost-effective orchestration"}),
      make_model("claude-sonnet-4.5", "Claude Sonnet 4.5",
                 "claude-sonnet-4-5-20250929", "anthropic",
                 "Highest intelligence, best for complex reasoning", 200 * K,
                 64 * K, 3.00, 15.00, true, true, SpeedTier::Medium,
                 IntelligenceTier::Frontier,
                 {"Complex workflows", "Critical operations",
                  "Maximum accuracy"}),

      // OpenRouter
      make_model("deepseek-v3.1", "DeepSeek V3.1 Terminus",
                 "deepseek/deepseek-v3.1-terminus", "openrouter",
                 "Open source, strong reasoning at low cost", 64 * K, 8 * K,
                 0.14, 0.14, true, false, SpeedTier::Medium,
                 IntelligenceTier::High,
                 {"Budget-friendly", "Open source preference",
                  "Experimentation"}),
      make_model("deepseek-v3.2", "DeepSeek V3.2", "deepseek/deepseek-v3.2",
                 "openrouter", "Open source, strong reasoning at low cost",
                 64 * K, 8 * K, 0.14, 0.14, true, false, SpeedTier::Medium,
                 IntelligenceTier::High,
                 {"Budget-friendly", "Open source preference",
                  "Experimentation"}),
      make_model("glm-4.6", "GLM 4.6", "z-ai/glm-4.6", "openrouter",
                 "Best value, 200K context", 200 * K, 16 * K, 0.50, 2.00,
                 false, false, SpeedTier::Fast, IntelligenceTier::High,
                 {"Long documents", "High volume", "Cost optimization"}),
      make_model("glm-5", "GLM 5", "z-ai/glm-5", "openrouter",
                 "Smart and cheap, 200K context, tool calling", 202'752,
                 16 * K, 0.80, 2.56, false, false, SpeedTier::Fast,
                 IntelligenceTier::VeryHigh,
                 {"Default orchestrator", "Tool calling", "Cost-effective"}),
      make_model("gpt-5.1", "GPT-5.1", "openai/gpt-5.1", "openrouter",
                 "Deep reasoning capabilities", 128 * K, 64 * K, 2.50, 10.00,
                 true, true, SpeedTier::Slow, IntelligenceTier::Frontier,
                 {"Complex analysis", "Deep reasoning", "Research tasks"}),
      make_model("grok-4.1-fast", "Grok 4.1 Fast", "x-ai/grok-4.1-fast",
                 "openrouter", "Ultra-fast with a 2M context window",
                 2'000 * K, 16 * K, 0.50, 2.00, true, false, SpeedTier::Fast,
                 IntelligenceTier::High,
                 {"Huge contexts", "Fast responses", "Memory extraction"}),
  };

  for (auto &model : models)
    model.is_default = (model.model_id == "glm-5");
  return models;
}

} // namespace mr::ai
