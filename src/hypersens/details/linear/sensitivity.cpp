#include "hypersens/details/linear/sensitivity.hpp"

#include "hypersens/details/autodiff/differentiator.hpp"
#include "hypersens/details/linalg/factorization.hpp"
#include "hypersens/details/utils/debug.hpp"
#include "hypersens/details/errors.hpp"
#include "hypersens/details/logging.hpp"

#include <spdlog/spdlog.h>

namespace hypersens {
  using Eigen::MatrixXd;
  using Eigen::VectorXd;

  LinearSensitivitySolver::LinearSensitivitySolver(
    std::shared_ptr<ObjectiveDifferentiator const> objective,
    VectorXd const& eta0, VectorXd const& eps0,
    config::LinearSensitivityConfig config,
    std::optional<MatrixXd> const& hessian,
    std::shared_ptr<ObjectiveDifferentiator const> hyper_objective)
      : _objective(std::move(objective)),
        _hyper_objective(std::move(hyper_objective)),
        _config(config) {
    if (_objective == nullptr)
      throw UnsupportedConfiguration("Sensitivity requires an objective");
    if (_hyper_objective == nullptr)
      _hyper_objective = _objective;

    if (_hyper_objective->etaDimension() != _objective->etaDimension() ||
        _hyper_objective->epsDimension() != _objective->epsDimension()) {
      __logger__->error(
        "Hyperparameter objective dimension ({}, {}) differs from ({}, {})",
        _hyper_objective->etaDimension(), _hyper_objective->epsDimension(),
        _objective->etaDimension(), _objective->epsDimension());
      throw DimensionMismatch("Hyperparameter objective dimension mismatch");
    }

    setBaseValues(eta0, eps0, hessian);
  }

  void LinearSensitivitySolver::validateOptimum(
    VectorXd const& eta0, VectorXd const& eps0) const {
    auto gradient_norm = _objective->gradient(eta0, eps0).norm();
    __logger__->debug("Gradient norm at the optimum: {}", gradient_norm);

    if (gradient_norm > _config.gradient_tolerance) {
      __logger__->error(
        "Gradient norm {} exceeds tolerance {} at eta0 = {}", gradient_norm,
        _config.gradient_tolerance, vectorToString(eta0));
      throw OptimalityViolation("Gradient at eta0 is not zero");
    }
  }

  std::shared_ptr<HessianFactorization const>
  LinearSensitivitySolver::factorize(
    VectorXd const& eta0, VectorXd const& eps0,
    std::optional<MatrixXd> const& hessian) const {
    if (!_config.factorize_hessian) {
      if (hessian.has_value()) {
        __logger__->error("A Hessian was supplied with factorization disabled");
        throw UnsupportedConfiguration(
          "A supplied Hessian requires Hessian factorization");
      }
      return nullptr;
    }

    if (!hessian.has_value())
      return HessianFactorization::Create(_objective->hessian(eta0, eps0));

    auto n = _objective->etaDimension();
    if (hessian->rows() != n || hessian->cols() != n) {
      __logger__->error(
        "Supplied Hessian is {}x{}, expected {}x{}", hessian->rows(),
        hessian->cols(), n, n);
      throw DimensionMismatch("Supplied Hessian dimension mismatch");
    }
    return HessianFactorization::Create(*hessian);
  }

  void LinearSensitivitySolver::setBaseValues(
    VectorXd const& eta0, VectorXd const& eps0,
    std::optional<MatrixXd> const& hessian) {
    _objective->checkArguments(eta0, eps0);

    if (_config.validate_optimum)
      validateOptimum(eta0, eps0);

    auto factorization = factorize(eta0, eps0, hessian);
    MatrixXd cross_derivative = _hyper_objective->crossJacobian(eta0, eps0);

    std::optional<MatrixXd> sensitivity = std::nullopt;
    if (factorization != nullptr)
      sensitivity = MatrixXd(-factorization->solve(cross_derivative));

    _state = std::make_shared<SensitivityState const>(SensitivityState {
      .anchor = OptimumAnchor {eta0, eps0},
      .factorization = std::move(factorization),
      .cross_derivative = std::move(cross_derivative),
      .sensitivity = std::move(sensitivity),
    });
  }

  LinearSensitivitySolver::SensitivityState const&
  LinearSensitivitySolver::state() const {
    if (_state == nullptr)
      throw UnsupportedConfiguration("Sensitivity base values are not set");
    return *_state;
  }

  config::LinearSensitivityConfig const&
  LinearSensitivitySolver::config() const {
    return _config;
  }

  OptimumAnchor LinearSensitivitySolver::anchor() const {
    return state().anchor;
  }

  MatrixXd LinearSensitivitySolver::sensitivityMatrix() const {
    auto const& sensitivity = state().sensitivity;
    if (!sensitivity.has_value()) {
      __logger__->error("Sensitivity requested with factorization disabled");
      throw UnsupportedConfiguration(
        "Sensitivity requires Hessian factorization");
    }
    return *sensitivity;
  }

  std::optional<MatrixXd> LinearSensitivitySolver::hessian() const {
    auto const& factorization = state().factorization;
    if (factorization == nullptr)
      return std::nullopt;
    return factorization->hessian();
  }

  MatrixXd LinearSensitivitySolver::crossDerivative() const {
    return state().cross_derivative;
  }

  VectorXd LinearSensitivitySolver::predictFromHyperParameter(
    VectorXd const& eps) const {
    auto const& [eta0, eps0] = state().anchor;
    if (eps.size() != eps0.size()) {
      __logger__->error(
        "Hyperparameter size mismatch: {} vs {}", eps.size(), eps0.size());
      throw DimensionMismatch("Hyperparameter size mismatch");
    }
    return eta0 + sensitivityMatrix() * (eps - eps0);
  }
}  // namespace hypersens
