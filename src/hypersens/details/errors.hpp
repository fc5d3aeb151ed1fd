#pragma once

#include <stdexcept>
#include <string>

namespace hypersens {
  class SensitivityError: public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Malformed derivative term.
  class ConstructionError: public SensitivityError {
  public:
    using SensitivityError::SensitivityError;
  };

  // The gradient at the claimed optimum exceeds the tolerance.
  class OptimalityViolation: public SensitivityError {
  public:
    using SensitivityError::SensitivityError;
  };

  class DimensionMismatch: public SensitivityError {
  public:
    using SensitivityError::SensitivityError;
  };

  // Non-positive-definite Hessian or a singular system.
  class LinearAlgebraError: public SensitivityError {
  public:
    using SensitivityError::SensitivityError;
  };

  // Requested operation has no implementation in the configured mode.
  class UnsupportedConfiguration: public SensitivityError {
  public:
    using SensitivityError::SensitivityError;
  };

  class OrderRangeError: public SensitivityError {
  public:
    using SensitivityError::SensitivityError;
  };

  class AnchorMismatch: public SensitivityError {
  public:
    using SensitivityError::SensitivityError;
  };

  // The user objective reported an evaluation failure.
  class EvaluationFailure: public SensitivityError {
  public:
    using SensitivityError::SensitivityError;
  };

  class ParameterBoundsViolation: public SensitivityError {
  public:
    using SensitivityError::SensitivityError;
  };
}  // namespace hypersens
