#include "mr/ai/errors.hpp"

#include <utility>

namespace mr::ai {

namespace {
std::string compatible_model_message(const std::vector<std::string> &unmet) {
  std::string message = "no compatible model";
  for (std::size_t i = 0; i < unmet.size(); ++i) {
    message += (i == 0) ? ": " : "; ";
    message += unmet[i];
  }
  return message;
}
} // namespace

NoCompatibleModel::NoCompatibleModel(CapabilityRequirement requirement,
                                     std::vector<std::string> unmet_dimensions)
    : SelectionError(compatible_model_message(unmet_dimensions)),
      requirement_(std::move(requirement)),
      unmet_dimensions_(std::move(unmet_dimensions)) {}

NoDefaultAvailable::NoDefaultAvailable()
    : SelectionError("no enabled model is flagged as default") {}

ModelNotFound::ModelNotFound(std::string model_id)
    : SelectionError("unknown model id: " + model_id),
      model_id_(std::move(model_id)) {}

} // namespace mr::ai
