#pragma once

#include "mr/ai/model_descriptor.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mr::ai {

// Fields left unset keep their current value.
struct ModelUpdate {
  std::optional<std::string> display_name;
  std::optional<std::string> provider;
  std::optional<std::string> slug;
  std::optional<std::string> description;
  std::optional<std::int64_t> context_window;
  std::optional<std::int64_t> max_output;
  std::optional<CostRate> cost_input;
  std::optional<CostRate> cost_output;
  std::optional<bool> supports_thinking;
  std::optional<bool> supports_vision;
  std::optional<SpeedTier> speed_tier;
  std::optional<IntelligenceTier> intelligence_tier;
  std::optional<std::vector<std::string>> recommended_for;
  std::optional<bool> is_enabled;
  std::optional<bool> is_default;
};

// Orchestrator models shipped with the tool; "glm-5" is the default.
std::vector<ModelDescriptor> builtin_models();

/**
 * @brief Administrative, persisted list of model rows.
 *
 * The catalog is the configuration the registry is loaded from. Mutations
 * keep at most one row flagged default and stamp updated_at; nothing here
 * affects selection until the rows are loaded into a ModelRegistry.
 */
class ModelCatalog {
public:
  using Clock = std::function<std::int64_t()>;

  ModelCatalog();
  explicit ModelCatalog(std::vector<ModelDescriptor> rows);

  static ModelCatalog with_builtin_models();

  // Source of updated_at stamps; defaults to the system clock.
  void set_clock(Clock clock);

  const std::vector<ModelDescriptor> &rows() const noexcept { return rows_; }
  std::optional<ModelDescriptor> get_model_by_id(const std::string &id) const;

  bool add_model(ModelDescriptor model, std::string *error_message = nullptr);
  bool update_model(const std::string &model_id, const ModelUpdate &update,
                    std::string *error_message = nullptr);
  bool remove_model(const std::string &model_id,
                    std::string *error_message = nullptr);
  bool set_enabled(const std::string &model_id, bool enabled,
                   std::string *error_message = nullptr);
  bool set_default(const std::string &model_id,
                   std::string *error_message = nullptr);

  // Replaces the rows with the file's. Throws ValidationError for malformed
  // rows and std::runtime_error when the file cannot be read.
  void load(const std::filesystem::path &path);
  bool save(const std::filesystem::path &path,
            std::string *error_message = nullptr) const;

  // {"models": [...]} or a bare array of rows. Throws ValidationError.
  static std::vector<ModelDescriptor> parse(std::string_view json_text);
  std::string to_json() const;

private:
  ModelDescriptor *find_row(const std::string &model_id);
  void clear_default_except(const std::string &model_id);

  std::vector<ModelDescriptor> rows_;
  Clock clock_;
};

} // namespace mr::ai
