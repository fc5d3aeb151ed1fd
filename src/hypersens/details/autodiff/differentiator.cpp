#include "hypersens/details/autodiff/differentiator.hpp"
#include "hypersens/details/errors.hpp"
#include "hypersens/details/logging.hpp"

#include <spdlog/spdlog.h>

namespace hypersens {
  using Eigen::MatrixXd;
  using Eigen::VectorXd;

  static void checkDirections(
    std::vector<VectorRef> const& directions, int dimension, char const* tag) {
    for (auto const& direction : directions) {
      if (direction.get().size() == dimension)
        continue;

      __logger__->error(
        "{} direction size mismatch: {} vs {}", tag, direction.get().size(),
        dimension);
      throw DimensionMismatch("Direction size does not match the argument");
    }
  }

  void ObjectiveDifferentiator::checkArguments(
    VectorXd const& eta, VectorXd const& eps) const {
    if (eta.size() != etaDimension() || eps.size() != epsDimension()) {
      __logger__->error(
        "Objective argument size mismatch: <{}, {}> vs <{}, {}>", eta.size(),
        eps.size(), etaDimension(), epsDimension());
      throw DimensionMismatch("Objective argument size mismatch");
    }
  }

  VectorXd ObjectiveDifferentiator::gradientDirectionalDerivative(
    VectorXd const& eta, VectorXd const& eps,
    std::vector<VectorRef> const& eta_directions,
    std::vector<VectorRef> const& eps_directions) const {
    checkArguments(eta, eps);
    checkDirections(eta_directions, etaDimension(), "Eta");
    checkDirections(eps_directions, epsDimension(), "Epsilon");

    int n = etaDimension();
    VectorXd unit = VectorXd::Zero(n);

    DirectionList directions;
    directions.reserve(eta_directions.size() + eps_directions.size() + 1);
    for (auto const& v : eta_directions)
      directions.push_back(Direction {Argument::eta, v});
    for (auto const& w : eps_directions)
      directions.push_back(Direction {Argument::eps, w});

    // The gradient component k is one more derivative along e_k.
    directions.push_back(Direction {Argument::eta, std::cref(unit)});

    VectorXd result(n);
    for (int k = 0; k < n; k++) {
      unit(k) = 1;
      result(k) = directionalDerivative(eta, eps, directions);
      unit(k) = 0;
    }
    return result;
  }

  VectorXd ObjectiveDifferentiator::gradient(
    VectorXd const& eta, VectorXd const& eps) const {
    return gradientDirectionalDerivative(eta, eps, {}, {});
  }

  MatrixXd ObjectiveDifferentiator::hessian(
    VectorXd const& eta, VectorXd const& eps) const {
    checkArguments(eta, eps);

    int n = etaDimension();
    MatrixXd H(n, n);
    VectorXd unit = VectorXd::Zero(n);
    for (int j = 0; j < n; j++) {
      unit(j) = 1;
      H.col(j) = gradientDirectionalDerivative(eta, eps, {std::cref(unit)}, {});
      unit(j) = 0;
    }
    return H;
  }

  VectorXd ObjectiveDifferentiator::hessianVectorProduct(
    VectorXd const& eta, VectorXd const& eps, VectorXd const& v) const {
    return gradientDirectionalDerivative(eta, eps, {std::cref(v)}, {});
  }

  MatrixXd ObjectiveDifferentiator::crossJacobian(
    VectorXd const& eta, VectorXd const& eps) const {
    checkArguments(eta, eps);

    int n = etaDimension();
    int m = epsDimension();
    MatrixXd J(n, m);
    VectorXd unit = VectorXd::Zero(m);
    for (int j = 0; j < m; j++) {
      unit(j) = 1;
      J.col(j) = gradientDirectionalDerivative(eta, eps, {}, {std::cref(unit)});
      unit(j) = 0;
    }
    return J;
  }
}  // namespace hypersens
