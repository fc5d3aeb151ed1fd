#include "hypersens/details/config.hpp"

namespace hypersens::config {
  LinearSensitivityConfig LinearSensitivityConfig::CreateDefault() {
    return LinearSensitivityConfig {
      .validate_optimum = true,
      .factorize_hessian = true,
      .gradient_tolerance = 1e-8,
    };
  }

  TaylorExpansionConfig TaylorExpansionConfig::CreateDefault() {
    return TaylorExpansionConfig {.anchor_tolerance = 1e-8};
  }
}  // namespace hypersens::config
