#pragma once

#include "mr/ai/capability_requirement.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace mr::ai {

class SelectionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed registry data or a malformed requirement.
class ValidationError : public SelectionError {
public:
  using SelectionError::SelectionError;
};

// No enabled model meets the requirement. Retrying with the same inputs
// yields the same result.
class NoCompatibleModel : public SelectionError {
public:
  NoCompatibleModel(CapabilityRequirement requirement,
                    std::vector<std::string> unmet_dimensions);

  const CapabilityRequirement &requirement() const noexcept {
    return requirement_;
  }
  const std::vector<std::string> &unmet_dimensions() const noexcept {
    return unmet_dimensions_;
  }

private:
  CapabilityRequirement requirement_;
  std::vector<std::string> unmet_dimensions_;
};

class NoDefaultAvailable : public SelectionError {
public:
  NoDefaultAvailable();
};

class ModelNotFound : public SelectionError {
public:
  explicit ModelNotFound(std::string model_id);

  const std::string &model_id() const noexcept { return model_id_; }

private:
  std::string model_id_;
};

} // namespace mr::ai
