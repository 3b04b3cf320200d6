#include "mr/ai/errors.hpp"
#include "mr/ai/model_catalog.hpp"
#include "mr/ai/model_registry.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

namespace {

namespace fs = std::filesystem;
using mr::ai::ModelCatalog;
using mr::ai::ModelDescriptor;

ModelDescriptor make_model(const std::string &id, bool isDefault = false) {
  ModelDescriptor model;
  model.model_id = id;
  model.provider = "openrouter";
  model.context_window = 32000;
  model.max_output = 4000;
  model.is_default = isDefault;
  return model;
}

class ModelCatalogTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto unique = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    tempRoot_ = fs::temp_directory_path() / ("mrai_catalog_" + unique);
    fs::create_directories(tempRoot_);
    catalog_.set_clock([this] { return ++now_; });
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(tempRoot_, ec);
  }

  fs::path tempRoot_;
  ModelCatalog catalog_;
  std::int64_t now_ = 1000;
};

TEST_F(ModelCatalogTest, BuiltinCatalogHasOneDefault) {
  auto catalog = ModelCatalog::with_builtin_models();
  ASSERT_EQ(catalog.rows().size(), 8u);

  int defaults = 0;
  for (const auto &model : catalog.rows()) {
    defaults += model.is_default ? 1 : 0;
    EXPECT_TRUE(model.is_enabled) << model.model_id;
    EXPECT_TRUE(mr::ai::descriptor_problems(model).empty()) << model.model_id;
  }
  EXPECT_EQ(defaults, 1);

  auto glm = catalog.get_model_by_id("glm-5");
  ASSERT_TRUE(glm.has_value());
  EXPECT_TRUE(glm->is_default);
  EXPECT_EQ(glm->context_window, 202752);
  EXPECT_FALSE(glm->supports_vision);
}

TEST_F(ModelCatalogTest, AddRejectsDuplicatesAndInvalidRows) {
  std::string error;
  ASSERT_TRUE(catalog_.add_model(make_model("a"), &error)) << error;
  EXPECT_EQ(catalog_.rows().front().display_name, "a");
  EXPECT_EQ(catalog_.rows().front().updated_at, 1001);

  EXPECT_FALSE(catalog_.add_model(make_model("a"), &error));
  EXPECT_EQ(error, "Model ID already exists: a");

  auto negative = make_model("b");
  negative.max_output = -1;
  EXPECT_FALSE(catalog_.add_model(negative, &error));
  EXPECT_EQ(error, "max_output must be non-negative");
  EXPECT_EQ(catalog_.rows().size(), 1u);
}

TEST_F(ModelCatalogTest, NewDefaultClearsPreviousDefault) {
  ASSERT_TRUE(catalog_.add_model(make_model("a", true)));
  ASSERT_TRUE(catalog_.add_model(make_model("b", true)));

  EXPECT_FALSE(catalog_.get_model_by_id("a")->is_default);
  EXPECT_TRUE(catalog_.get_model_by_id("b")->is_default);

  ASSERT_TRUE(catalog_.set_default("a"));
  EXPECT_TRUE(catalog_.get_model_by_id("a")->is_default);
  EXPECT_FALSE(catalog_.get_model_by_id("b")->is_default);
}

TEST_F(ModelCatalogTest, UpdateIsPartial) {
  auto model = make_model("a");
  model.description = "keep me";
  ASSERT_TRUE(catalog_.add_model(model));

  mr::ai::ModelUpdate update;
  update.supports_vision = true;
  update.cost_input = mr::ai::CostRate::from_usd(0.5);
  std::string error;
  ASSERT_TRUE(catalog_.update_model("a", update, &error)) << error;

  auto updated = catalog_.get_model_by_id("a");
  ASSERT_TRUE(updated.has_value());
  EXPECT_TRUE(updated->supports_vision);
  EXPECT_EQ(updated->cost_input, mr::ai::CostRate{500000});
  EXPECT_EQ(updated->description, "keep me");
  EXPECT_EQ(updated->updated_at, 1002);

  EXPECT_FALSE(catalog_.update_model("missing", update, &error));
  EXPECT_EQ(error, "Model not found: missing");

  mr::ai::ModelUpdate invalid;
  invalid.context_window = -10;
  EXPECT_FALSE(catalog_.update_model("a", invalid, &error));
  EXPECT_EQ(catalog_.get_model_by_id("a")->context_window, 32000);
}

TEST_F(ModelCatalogTest, RemoveRefusesDefault) {
  ASSERT_TRUE(catalog_.add_model(make_model("a", true)));
  ASSERT_TRUE(catalog_.add_model(make_model("b")));

  std::string error;
  EXPECT_FALSE(catalog_.remove_model("a", &error));
  EXPECT_EQ(error, "Cannot delete the default model");
  EXPECT_TRUE(catalog_.remove_model("b", &error));
  EXPECT_FALSE(catalog_.remove_model("b", &error));
  EXPECT_EQ(catalog_.rows().size(), 1u);
}

TEST_F(ModelCatalogTest, SetEnabledTogglesRow) {
  ASSERT_TRUE(catalog_.add_model(make_model("a")));
  ASSERT_TRUE(catalog_.set_enabled("a", false));
  EXPECT_FALSE(catalog_.get_model_by_id("a")->is_enabled);
  ASSERT_TRUE(catalog_.set_enabled("a", true));
  EXPECT_TRUE(catalog_.get_model_by_id("a")->is_enabled);
}

TEST_F(ModelCatalogTest, ParsesRowsWithCostStrings) {
  const char *json = R"({
    "models": [
      {
        "model_id": "deepseek",
        "name": "DeepSeek",
        "provider": "openrouter",
        "context_window": 64000,
        "max_output": 8000,
        "cost_input": "$0.14/1M tokens",
        "cost_output": 0.28,
        "supports_thinking": true,
        "speed": "Medium",
        "intelligence": "very high",
        "recommended_for": ["Budget-friendly"]
      },
      {
        "model_id": "vision",
        "provider": "anthropic",
        "supports_vision": true,
        "is_enabled": false,
        "is_default": true
      }
    ]
  })";

  auto rows = ModelCatalog::parse(json);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].display_name, "DeepSeek");
  EXPECT_EQ(rows[0].cost_input, mr::ai::CostRate{140000});
  EXPECT_EQ(rows[0].cost_output, mr::ai::CostRate{280000});
  EXPECT_EQ(rows[0].intelligence_tier, mr::ai::IntelligenceTier::VeryHigh);
  EXPECT_EQ(rows[0].speed_tier, mr::ai::SpeedTier::Medium);
  EXPECT_TRUE(rows[0].is_enabled);
  ASSERT_EQ(rows[0].recommended_for.size(), 1u);

  EXPECT_EQ(rows[1].display_name, "vision");
  EXPECT_FALSE(rows[1].is_enabled);
  EXPECT_TRUE(rows[1].is_default);
  EXPECT_EQ(rows[1].intelligence_tier, mr::ai::IntelligenceTier::High);
}

TEST_F(ModelCatalogTest, AcceptsBareArray) {
  auto rows = ModelCatalog::parse(
      R"([{"model_id": "a", "provider": "p"}, {"model_id": "b", "provider": "p"}])");
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[1].model_id, "b");
}

TEST_F(ModelCatalogTest, ReportsMalformedRows) {
  EXPECT_THROW(ModelCatalog::parse("{not json"), mr::ai::ValidationError);
  EXPECT_THROW(ModelCatalog::parse(R"({"rows": []})"), mr::ai::ValidationError);
  EXPECT_THROW(ModelCatalog::parse(R"([{"provider": "p"}])"),
               mr::ai::ValidationError);
  EXPECT_THROW(ModelCatalog::parse(R"([{"model_id": "a"}])"),
               mr::ai::ValidationError);

  try {
    ModelCatalog::parse(
        R"([{"model_id": "a", "provider": "p"},
            {"model_id": "b", "provider": "p", "speed": "warp"}])");
    FAIL() << "expected ValidationError";
  } catch (const mr::ai::ValidationError &e) {
    EXPECT_EQ(std::string(e.what()),
              "model row 1 ('b'): unknown speed tier \"warp\"");
  }

  EXPECT_THROW(ModelCatalog::parse(
                   R"([{"model_id": "a", "provider": "p", "cost_input": "cheap"}])"),
               mr::ai::ValidationError);
  EXPECT_THROW(ModelCatalog::parse(
                   R"([{"model_id": "a", "provider": "p", "context_window": -1}])"),
               mr::ai::ValidationError);
  EXPECT_THROW(ModelCatalog::parse(
                   R"([{"model_id": "a", "provider": "p", "supports_vision": "yes"}])"),
               mr::ai::ValidationError);
}

TEST_F(ModelCatalogTest, HugeNumericCostIsOutOfRange) {
  try {
    ModelCatalog::parse(
        R"([{"model_id": "a", "provider": "p", "cost_input": 1e13}])");
    FAIL() << "expected ValidationError";
  } catch (const mr::ai::ValidationError &e) {
    EXPECT_EQ(std::string(e.what()),
              "model row 0 ('a'): cost_input is out of range");
  }

  EXPECT_THROW(ModelCatalog::parse(
                   R"([{"model_id": "a", "provider": "p", "cost_output": -1e300}])"),
               mr::ai::ValidationError);

  auto rows = ModelCatalog::parse(
      R"([{"model_id": "a", "provider": "p", "cost_input": 9000000000000}])");
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].cost_input.micro_usd_per_million,
            9'000'000'000'000'000'000LL);
}

TEST_F(ModelCatalogTest, SaveAndLoadPreservesRows) {
  auto catalog = ModelCatalog::with_builtin_models();
  const fs::path path = tempRoot_ / "nested" / "models.json";

  std::string error;
  ASSERT_TRUE(catalog.save(path, &error)) << error;
  ASSERT_TRUE(fs::exists(path));

  ModelCatalog loaded;
  loaded.load(path);
  ASSERT_EQ(loaded.rows().size(), catalog.rows().size());
  for (std::size_t i = 0; i < catalog.rows().size(); ++i) {
    const auto &expected = catalog.rows()[i];
    const auto &actual = loaded.rows()[i];
    EXPECT_EQ(actual.model_id, expected.model_id);
    EXPECT_EQ(actual.cost_input, expected.cost_input);
    EXPECT_EQ(actual.cost_output, expected.cost_output);
    EXPECT_EQ(actual.speed_tier, expected.speed_tier);
    EXPECT_EQ(actual.intelligence_tier, expected.intelligence_tier);
    EXPECT_EQ(actual.is_default, expected.is_default);
    EXPECT_EQ(actual.recommended_for, expected.recommended_for);
  }
}

TEST_F(ModelCatalogTest, LoadFailsForMissingFile) {
  ModelCatalog catalog;
  EXPECT_THROW(catalog.load(tempRoot_ / "missing.json"), std::runtime_error);
}

TEST_F(ModelCatalogTest, RowsFeedTheRegistry) {
  mr::ai::ModelRegistry registry;
  registry.set_log_sink(nullptr);
  auto snapshot = registry.load(ModelCatalog::with_builtin_models().rows());
  ASSERT_NE(snapshot->default_model(), nullptr);
  EXPECT_EQ(snapshot->default_model()->model_id, "glm-5");
  EXPECT_TRUE(snapshot->warnings().empty());
}

} // namespace
