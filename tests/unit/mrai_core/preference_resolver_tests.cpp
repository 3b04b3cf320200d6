#include "mr/ai/model_registry.hpp"
#include "mr/ai/preference_resolver.hpp"
#include "mr/ai/preference_store.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace {

namespace fs = std::filesystem;
using mr::ai::ModelDescriptor;
using mr::ai::PreferenceSource;

ModelDescriptor make_model(const std::string &id, bool isDefault = false,
                           bool enabled = true) {
  ModelDescriptor model;
  model.model_id = id;
  model.provider = "openrouter";
  model.context_window = 100000;
  model.is_default = isDefault;
  model.is_enabled = enabled;
  return model;
}

class ThrowingStore : public mr::ai::PreferenceStore {
public:
  std::optional<std::string>
  preferred_model(const std::string &) const override {
    throw std::runtime_error("database unavailable");
  }
  void set_preferred_model(const std::string &, const std::string &) override {
    throw std::runtime_error("database is read-only");
  }
  void clear_preferred_model(const std::string &) override {}
};

class PreferenceResolverTest : public ::testing::Test {
protected:
  void SetUp() override {
    registry_.set_log_sink(nullptr);
    snapshot_ = registry_.load({make_model("glm-5", true), make_model("gpt"),
                                make_model("retired", false, false)});
    resolver_.set_log_sink(
        [this](mr::ai::LogLevel, const std::string &message) {
          warnings_.push_back(message);
        });
  }

  mr::ai::ModelRegistry registry_;
  std::shared_ptr<const mr::ai::RegistrySnapshot> snapshot_;
  mr::ai::InMemoryPreferenceStore store_;
  mr::ai::PreferenceResolver resolver_{store_};
  std::vector<std::string> warnings_;
};

TEST_F(PreferenceResolverTest, ReturnsStoredEnabledPreference) {
  store_.set_preferred_model("alice", "gpt");
  auto resolved = resolver_.resolve("alice", *snapshot_);
  EXPECT_EQ(resolved.model_id, "gpt");
  EXPECT_EQ(resolved.source, PreferenceSource::Stored);
  EXPECT_TRUE(warnings_.empty());
}

TEST_F(PreferenceResolverTest, UnknownUserGetsDefault) {
  auto resolved = resolver_.resolve("nobody", *snapshot_);
  EXPECT_EQ(resolved.model_id, "glm-5");
  EXPECT_EQ(resolved.source, PreferenceSource::DefaultFallback);
  EXPECT_TRUE(warnings_.empty());
}

TEST_F(PreferenceResolverTest, StalePreferencesFallBackWithWarning) {
  store_.set_preferred_model("alice", "nonexistent-model");
  store_.set_preferred_model("bob", "retired");

  auto alice = resolver_.resolve("alice", *snapshot_);
  EXPECT_EQ(alice.model_id, "glm-5");
  EXPECT_EQ(alice.source, PreferenceSource::DefaultFallback);

  auto bob = resolver_.resolve("bob", *snapshot_);
  EXPECT_EQ(bob.model_id, "glm-5");
  EXPECT_EQ(warnings_.size(), 2u);
}

TEST_F(PreferenceResolverTest, EmptyPreferenceIsUnset) {
  store_.set_preferred_model("alice", "");
  auto resolved = resolver_.resolve("alice", *snapshot_);
  EXPECT_EQ(resolved.model_id, "glm-5");
  EXPECT_TRUE(warnings_.empty());
}

TEST_F(PreferenceResolverTest, NoDefaultResolvesToNothing) {
  auto snapshot = registry_.load({make_model("a"), make_model("b")});
  store_.set_preferred_model("alice", "missing");
  auto resolved = resolver_.resolve("alice", *snapshot);
  EXPECT_FALSE(resolved.model_id.has_value());
  EXPECT_EQ(resolved.source, PreferenceSource::None);
  EXPECT_EQ(mr::ai::to_string(resolved.source), "none");
}

TEST_F(PreferenceResolverTest, StoreFailureDegradesToDefault) {
  ThrowingStore failing;
  mr::ai::PreferenceResolver resolver(failing);
  std::vector<std::string> warnings;
  resolver.set_log_sink([&](mr::ai::LogLevel level, const std::string &message) {
    EXPECT_EQ(level, mr::ai::LogLevel::Warning);
    warnings.push_back(message);
  });

  auto resolved = resolver.resolve("alice", *snapshot_);
  EXPECT_EQ(resolved.model_id, "glm-5");
  EXPECT_EQ(resolved.source, PreferenceSource::DefaultFallback);
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings.front().find("database unavailable"), std::string::npos);

  std::string error;
  EXPECT_FALSE(resolver.update_preference("alice", "gpt", *snapshot_, &error));
  EXPECT_EQ(error, "failed to store preference: database is read-only");
}

TEST_F(PreferenceResolverTest, UpdateValidatesModel) {
  std::string error;
  EXPECT_TRUE(resolver_.update_preference("alice", "gpt", *snapshot_, &error));
  EXPECT_EQ(store_.preferred_model("alice"), "gpt");

  EXPECT_FALSE(resolver_.update_preference("alice", "missing", *snapshot_, &error));
  EXPECT_EQ(error, "unknown model id: missing");
  EXPECT_FALSE(resolver_.update_preference("alice", "retired", *snapshot_, &error));
  EXPECT_EQ(error, "model is disabled: retired");
  EXPECT_FALSE(resolver_.update_preference("", "gpt", *snapshot_, &error));
  EXPECT_EQ(error, "user id is required");

  EXPECT_EQ(store_.preferred_model("alice"), "gpt");
}

TEST_F(PreferenceResolverTest, SinkCanBeReplacedWhileResolving) {
  store_.set_preferred_model("alice", "retired");
  std::atomic<bool> done{false};
  std::atomic<int> calls{0};
  auto counting = [&calls](mr::ai::LogLevel, const std::string &) { ++calls; };

  std::thread resolver([&] {
    for (int i = 0; i < 500; ++i) {
      auto resolved = resolver_.resolve("alice", *snapshot_);
      EXPECT_EQ(resolved.model_id, "glm-5");
    }
    done = true;
  });
  while (!done.load()) {
    resolver_.set_log_sink(counting);
    resolver_.set_log_sink(nullptr);
  }
  resolver.join();

  resolver_.set_log_sink(counting);
  const int before = calls.load();
  resolver_.resolve("alice", *snapshot_);
  EXPECT_EQ(calls.load(), before + 1);
}

class JsonPreferenceStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto unique = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    tempRoot_ = fs::temp_directory_path() / ("mrai_preferences_" + unique);
    fs::create_directories(tempRoot_);
    path_ = tempRoot_ / "preferences.json";
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(tempRoot_, ec);
  }

  void write(const std::string &content) {
    std::ofstream out(path_);
    out << content;
  }

  fs::path tempRoot_;
  fs::path path_;
};

TEST_F(JsonPreferenceStoreTest, MissingFileIsEmpty) {
  mr::ai::JsonPreferenceStore store(path_);
  std::string error;
  EXPECT_TRUE(store.reload(&error)) << error;
  EXPECT_FALSE(store.preferred_model("alice").has_value());
}

TEST_F(JsonPreferenceStoreTest, PersistsAcrossInstances) {
  {
    mr::ai::JsonPreferenceStore store(path_);
    store.set_preferred_model("bob", "gpt");
    store.set_preferred_model("alice", "glm-5");
    store.set_preferred_model("carol", "gpt");
    store.clear_preferred_model("carol");
  }
  ASSERT_TRUE(fs::exists(path_));

  mr::ai::JsonPreferenceStore reloaded(path_);
  std::string error;
  ASSERT_TRUE(reloaded.reload(&error)) << error;
  EXPECT_EQ(reloaded.preferred_model("alice"), "glm-5");
  EXPECT_EQ(reloaded.preferred_model("bob"), "gpt");
  EXPECT_FALSE(reloaded.preferred_model("carol").has_value());
}

TEST_F(JsonPreferenceStoreTest, FailedWritesLeaveMemoryUnchanged) {
  mr::ai::JsonPreferenceStore store(path_);
  store.set_preferred_model("alice", "gpt");

  // A directory in place of the file makes every write fail.
  fs::remove(path_);
  fs::create_directories(path_);

  EXPECT_THROW(store.clear_preferred_model("alice"), std::runtime_error);
  EXPECT_EQ(store.preferred_model("alice"), "gpt");

  EXPECT_THROW(store.set_preferred_model("alice", "glm-5"), std::runtime_error);
  EXPECT_EQ(store.preferred_model("alice"), "gpt");

  // Clearing an unknown user does not touch the file.
  EXPECT_NO_THROW(store.clear_preferred_model("nobody"));
}

TEST_F(JsonPreferenceStoreTest, ReadsUsersObject) {
  write(R"({"users": {"alice": {"preferred_model": "gpt"},
                      "bob": {"preferred_model": 7},
                      "carol": {}}})");
  mr::ai::JsonPreferenceStore store(path_);
  ASSERT_TRUE(store.reload());
  EXPECT_EQ(store.preferred_model("alice"), "gpt");
  EXPECT_FALSE(store.preferred_model("bob").has_value());
  EXPECT_FALSE(store.preferred_model("carol").has_value());
}

TEST_F(JsonPreferenceStoreTest, MalformedFileKeepsPreviousState) {
  write(R"({"users": {"alice": {"preferred_model": "gpt"}}})");
  mr::ai::JsonPreferenceStore store(path_);
  ASSERT_TRUE(store.reload());

  write("{broken");
  std::string error;
  EXPECT_FALSE(store.reload(&error));
  EXPECT_NE(error.find("Failed to parse preferences file"), std::string::npos);
  EXPECT_EQ(store.preferred_model("alice"), "gpt");

  write(R"({"people": {}})");
  EXPECT_FALSE(store.reload(&error));
  EXPECT_NE(error.find("\"users\""), std::string::npos);
}

} // namespace
