#include "mr/ai/model_catalog.hpp"

#include "mr/ai/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace mr::ai {

namespace {
using json = nlohmann::json;

std::int64_t system_clock_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

[[noreturn]] void row_error(std::size_t row, const std::string &model_id,
                            const std::string &message) {
  std::string where = "model row " + std::to_string(row);
  if (!model_id.empty())
    where += " ('" + model_id + "')";
  throw ValidationError(where + ": " + message);
}

std::string read_string(const json &row, const char *key, std::size_t index,
                        const std::string &model_id,
                        const std::string &fallback = std::string()) {
  auto it = row.find(key);
  if (it == row.end() || it->is_null())
    return fallback;
  if (!it->is_string())
    row_error(index, model_id, std::string(key) + " must be a string");
  return it->get<std::string>();
}

bool read_bool(const json &row, const char *key, std::size_t index,
               const std::string &model_id, bool fallback) {
  auto it = row.find(key);
  if (it == row.end() || it->is_null())
    return fallback;
  if (!it->is_boolean())
    row_error(index, model_id, std::string(key) + " must be a boolean");
  return it->get<bool>();
}

std::int64_t read_integer(const json &row, const char *key, std::size_t index,
                          const std::string &model_id, std::int64_t fallback) {
  auto it = row.find(key);
  if (it == row.end() || it->is_null())
    return fallback;
  if (!it->is_number_integer())
    row_error(index, model_id, std::string(key) + " must be an integer");
  return it->get<std::int64_t>();
}

CostRate read_cost(const json &row, const char *key, std::size_t index,
                   const std::string &model_id) {
  auto it = row.find(key);
  if (it == row.end() || it->is_null())
    return CostRate{};
  if (it->is_number()) {
    const double usd = it->get<double>();
    if (!std::isfinite(usd) || std::fabs(usd) > kMaxUsdPerMillion)
      row_error(index, model_id, std::string(key) + " is out of range");
    return CostRate::from_usd(usd);
  }
  if (it->is_string()) {
    const std::string text = it->get<std::string>();
    if (auto rate = parse_cost_rate(text))
      return *rate;
    row_error(index, model_id,
              std::string(key) + " is not a cost rate: \"" + text + "\"");
  }
  row_error(index, model_id,
            std::string(key) + " must be a number or a cost string");
}

ModelDescriptor descriptor_from_json(const json &row, std::size_t index) {
  if (!row.is_object())
    row_error(index, "", "expected an object");

  ModelDescriptor model;
  model.model_id = read_string(row, "model_id", index, "");
  if (model.model_id.empty())
    row_error(index, "", "model_id is required");
  const std::string &id = model.model_id;

  model.display_name = read_string(row, "name", index, id, id);
  model.provider = read_string(row, "provider", index, id);
  if (model.provider.empty())
    row_error(index, id, "provider is required");
  model.slug = read_string(row, "slug", index, id);
  model.description = read_string(row, "description", index, id);
  model.context_window = read_integer(row, "context_window", index, id, 0);
  model.max_output = read_integer(row, "max_output", index, id, 0);
  model.cost_input = read_cost(row, "cost_input", index, id);
  model.cost_output = read_cost(row, "cost_output", index, id);
  model.supports_thinking =
      read_bool(row, "supports_thinking", index, id, false);
  model.supports_vision = read_bool(row, "supports_vision", index, id, false);

  const std::string speed = read_string(row, "speed", index, id, "medium");
  if (auto tier = parse_speed_tier(speed))
    model.speed_tier = *tier;
  else
    row_error(index, id, "unknown speed tier \"" + speed + "\"");

  const std::string intelligence =
      read_string(row, "intelligence", index, id, "high");
  if (auto tier = parse_intelligence_tier(intelligence))
    model.intelligence_tier = *tier;
  else
    row_error(index, id, "unknown intelligence tier \"" + intelligence + "\"");

  if (auto it = row.find("recommended_for");
      it != row.end() && !it->is_null()) {
    if (!it->is_array())
      row_error(index, id, "recommended_for must be an array of strings");
    for (const auto &tag : *it) {
      if (!tag.is_string())
        row_error(index, id, "recommended_for must be an array of strings");
      model.recommended_for.push_back(tag.get<std::string>());
    }
  }

  model.is_enabled = read_bool(row, "is_enabled", index, id, true);
  model.is_default = read_bool(row, "is_default", index, id, false);
  model.updated_at = read_integer(row, "updated_at", index, id, 0);

  auto problems = descriptor_problems(model);
  if (!problems.empty())
    row_error(index, id, problems.front());
  return model;
}

json descriptor_to_json(const ModelDescriptor &model) {
  return json{
      {"model_id", model.model_id},
      {"name", model.display_name},
      {"provider", model.provider},
      {"slug", model.slug},
      {"description", model.description},
      {"context_window", model.context_window},
      {"max_output", model.max_output},
      {"cost_input", model.cost_input.usd_per_million()},
      {"cost_output", model.cost_output.usd_per_million()},
      {"supports_thinking", model.supports_thinking},
      {"supports_vision", model.supports_vision},
      {"speed", std::string(to_string(model.speed_tier))},
      {"intelligence", std::string(to_string(model.intelligence_tier))},
      {"recommended_for", model.recommended_for},
      {"is_enabled", model.is_enabled},
      {"is_default", model.is_default},
      {"updated_at", model.updated_at},
  };
}

bool fail(std::string *error_message, std::string message) {
  if (error_message)
    *error_message = std::move(message);
  return false;
}
} // namespace

ModelCatalog::ModelCatalog() : clock_(system_clock_seconds) {}

ModelCatalog::ModelCatalog(std::vector<ModelDescriptor> rows)
    : rows_(std::move(rows)), clock_(system_clock_seconds) {}

ModelCatalog ModelCatalog::with_builtin_models() {
  return ModelCatalog(builtin_models());
}

void ModelCatalog::set_clock(Clock clock) {
  clock_ = clock ? std::move(clock) : Clock(system_clock_seconds);
}

std::optional<ModelDescriptor>
ModelCatalog::get_model_by_id(const std::string &id) const {
  for (const auto &model : rows_) {
    if (model.model_id == id)
      return model;
  }
  return std::nullopt;
}

bool ModelCatalog::add_model(ModelDescriptor model,
                             std::string *error_message) {
  auto problems = descriptor_problems(model);
  if (!problems.empty())
    return fail(error_message, problems.front());
  if (find_row(model.model_id))
    return fail(error_message, "Model ID already exists: " + model.model_id);

  if (model.display_name.empty())
    model.display_name = model.model_id;
  model.updated_at = clock_();
  if (model.is_default)
    clear_default_except(model.model_id);
  rows_.push_back(std::move(model));
  return true;
}

bool ModelCatalog::update_model(const std::string &model_id,
                                const ModelUpdate &update,
                                std::string *error_message) {
  ModelDescriptor *row = find_row(model_id);
  if (!row)
    return fail(error_message, "Model not found: " + model_id);

  ModelDescriptor updated = *row;
  if (update.display_name)
    updated.display_name = *update.display_name;
  if (update.provider)
    updated.provider = *update.provider;
  if (update.slug)
    updated.slug = *update.slug;
  if (update.description)
    updated.description = *update.description;
  if (update.context_window)
    updated.context_window = *update.context_window;
  if (update.max_output)
    updated.max_output = *update.max_output;
  if (update.cost_input)
    updated.cost_input = *update.cost_input;
  if (update.cost_output)
    updated.cost_output = *update.cost_output;
  if (update.supports_thinking)
    updated.supports_thinking = *update.supports_thinking;
  if (update.supports_vision)
    updated.supports_vision = *update.supports_vision;
  if (update.speed_tier)
    updated.speed_tier = *update.speed_tier;
  if (update.intelligence_tier)
    updated.intelligence_tier = *update.intelligence_tier;
  if (update.recommended_for)
    updated.recommended_for = *update.recommended_for;
  if (update.is_enabled)
    updated.is_enabled = *update.is_enabled;
  if (update.is_default)
    updated.is_default = *update.is_default;

  auto problems = descriptor_problems(updated);
  if (!problems.empty())
    return fail(error_message, problems.front());

  updated.updated_at = clock_();
  *row = std::move(updated);
  if (row->is_default)
    clear_default_except(model_id);
  return true;
}

bool ModelCatalog::remove_model(const std::string &model_id,
                                std::string *error_message) {
  auto it = std::find_if(rows_.begin(), rows_.end(),
                         [&](const ModelDescriptor &model) {
                           return model.model_id == model_id;
                         });
  if (it == rows_.end())
    return fail(error_message, "Model not found: " + model_id);
  if (it->is_default)
    return fail(error_message, "Cannot delete the default model");
  rows_.erase(it);
  return true;
}

bool ModelCatalog::set_enabled(const std::string &model_id, bool enabled,
                               std::string *error_message) {
  ModelUpdate update;
  update.is_enabled = enabled;
  return update_model(model_id, update, error_message);
}

bool ModelCatalog::set_default(const std::string &model_id,
                               std::string *error_message) {
  ModelUpdate update;
  update.is_default = true;
  return update_model(model_id, update, error_message);
}

void ModelCatalog::load(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open())
    throw std::runtime_error("Failed to open model configuration: " +
                             path.string());
  std::ostringstream buffer;
  buffer << file.rdbuf();
  rows_ = parse(buffer.str());
}

bool ModelCatalog::save(const std::filesystem::path &path,
                        std::string *error_message) const {
  std::error_code ec;
  if (path.has_parent_path())
    std::filesystem::create_directories(path.parent_path(), ec);

  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open())
    return fail(error_message,
                "Failed to write model configuration: " + path.string());
  file << to_json() << '\n';
  if (!file)
    return fail(error_message,
                "Failed to write model configuration: " + path.string());
  return true;
}

std::vector<ModelDescriptor> ModelCatalog::parse(std::string_view json_text) {
  json document;
  try {
    document = json::parse(json_text.begin(), json_text.end());
  } catch (const json::parse_error &e) {
    throw ValidationError(std::string("model configuration is not valid "
                                      "JSON: ") +
                          e.what());
  }

  const json *rows = &document;
  if (document.is_object()) {
    auto it = document.find("models");
    if (it == document.end())
      throw ValidationError("model configuration has no \"models\" array");
    rows = &*it;
  }
  if (!rows->is_array())
    throw ValidationError("model configuration \"models\" must be an array");

  std::vector<ModelDescriptor> models;
  models.reserve(rows->size());
  for (std::size_t i = 0; i < rows->size(); ++i)
    models.push_back(descriptor_from_json((*rows)[i], i));
  return models;
}

std::string ModelCatalog::to_json() const {
  json rows = json::array();
  for (const auto &model : rows_)
    rows.push_back(descriptor_to_json(model));
  return json{{"models", rows}}.dump(2);
}

ModelDescriptor *ModelCatalog::find_row(const std::string &model_id) {
  for (auto &model : rows_) {
    if (model.model_id == model_id)
      return &model;
  }
  return nullptr;
}

void ModelCatalog::clear_default_except(const std::string &model_id) {
  for (auto &model : rows_) {
    if (model.model_id != model_id && model.is_default) {
      model.is_default = false;
      model.updated_at = clock_();
    }
  }
}

} // namespace mr::ai
