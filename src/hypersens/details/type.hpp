#pragma once

#include <Eigen/Dense>

#include <functional>
#include <vector>

namespace hypersens {
  template <typename scalar_t>
  using VectorX = Eigen::Matrix<scalar_t, Eigen::Dynamic, 1>;

  using VectorRef = std::reference_wrapper<Eigen::VectorXd const>;

  // The point (eta0, eps0) at which grad_eta f vanishes.
  struct OptimumAnchor {
    Eigen::VectorXd eta;
    Eigen::VectorXd eps;
  };

  enum class Argument { eta, eps };

  struct Direction {
    Argument argument;
    VectorRef vector;
  };

  using DirectionList = std::vector<Direction>;
}  // namespace hypersens
