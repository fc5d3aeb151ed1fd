#pragma once

namespace hypersens {
  // Forward-mode derivatives nest one dual number per direction, so the
  // deepest derivative must be fixed at compile time.
  inline constexpr int kMaxDerivativeDepth = 6;
  inline constexpr int kMaxTaylorOrder = kMaxDerivativeDepth - 1;
}  // namespace hypersens

namespace hypersens::config {
  struct LinearSensitivityConfig {
    bool validate_optimum;
    bool factorize_hessian;
    double gradient_tolerance;

    static LinearSensitivityConfig CreateDefault();
  };

  struct TaylorExpansionConfig {
    // Maximum absolute deviation from the anchor accepted by the anchored
    // derivative queries.
    double anchor_tolerance;

    static TaylorExpansionConfig CreateDefault();
  };
}  // namespace hypersens::config
