#pragma once

#include "mr/ai/log.hpp"
#include "mr/ai/model_descriptor.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mr::ai {

// What load() does with a batch flagging several enabled models as default.
enum class DefaultConflictPolicy {
  Repair, // keep the most recently updated one and log a warning
  Reject  // throw ValidationError
};

std::string_view to_string(DefaultConflictPolicy policy) noexcept;
std::optional<DefaultConflictPolicy>
parse_default_conflict_policy(std::string_view text);

/**
 * @brief Immutable view of every model descriptor at one point in time.
 *
 * Models keep the order they were loaded in; that order is the final
 * tie-break during ranking. At most one model carries is_default, and only
 * when it is enabled.
 */
class RegistrySnapshot {
public:
  RegistrySnapshot() = default;

  std::uint64_t version() const noexcept { return version_; }
  const std::vector<ModelDescriptor> &models() const noexcept {
    return models_;
  }
  std::vector<ModelDescriptor> enabled_models() const;

  // Lookups return nullptr when the id is unknown.
  const ModelDescriptor *find(std::string_view model_id) const noexcept;
  const ModelDescriptor *find_enabled(std::string_view model_id) const noexcept;
  const ModelDescriptor *default_model() const noexcept;

  // Consistency warnings raised while the snapshot was built.
  const std::vector<std::string> &warnings() const noexcept {
    return warnings_;
  }

private:
  friend class ModelRegistry;

  std::uint64_t version_ = 0;
  std::vector<ModelDescriptor> models_;
  std::optional<std::size_t> default_index_;
  std::vector<std::string> warnings_;
};

/**
 * @brief Owner of the published registry snapshot.
 *
 * Readers take the current snapshot without locking and keep it alive for
 * as long as they hold the shared pointer. load() builds a replacement off
 * to the side and publishes it with one atomic store; concurrent loads are
 * serialized.
 */
class ModelRegistry {
public:
  explicit ModelRegistry(
      DefaultConflictPolicy policy = DefaultConflictPolicy::Repair);

  ModelRegistry(const ModelRegistry &) = delete;
  ModelRegistry &operator=(const ModelRegistry &) = delete;

  void set_log_sink(LogSink sink);
  void set_default_conflict_policy(DefaultConflictPolicy policy);
  DefaultConflictPolicy default_conflict_policy() const;

  // Replaces the snapshot. Throws ValidationError and leaves the previous
  // snapshot published when the batch breaks an invariant.
  std::shared_ptr<const RegistrySnapshot>
  load(std::vector<ModelDescriptor> descriptors);

  std::shared_ptr<const RegistrySnapshot> snapshot() const;
  std::uint64_t version() const;

  std::optional<ModelDescriptor> find_model(const std::string &model_id) const;
  ModelDescriptor require_model(const std::string &model_id) const;
  ModelDescriptor default_model() const;
  std::vector<ModelDescriptor> enabled_models() const;

private:
  std::shared_ptr<RegistrySnapshot>
  build_snapshot(std::vector<ModelDescriptor> descriptors,
                 std::uint64_t version) const;

  std::atomic<std::shared_ptr<const RegistrySnapshot>> current_;
  mutable std::mutex writer_mutex_;
  DefaultConflictPolicy policy_;
  LogSink log_sink_;
};

// Unknown or disabled ids answer for the default model. Without a default
// they return false / an empty string.
bool is_vision_capable(const RegistrySnapshot &snapshot,
                       std::string_view model_id) noexcept;
std::string provider_of(const RegistrySnapshot &snapshot,
                        std::string_view model_id);

} // namespace mr::ai
