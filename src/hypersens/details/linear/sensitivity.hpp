#pragma once

#include "hypersens/details/config.hpp"
#include "hypersens/details/type.hpp"

#include <Eigen/Dense>

#include <memory>
#include <optional>

namespace hypersens {
  class ObjectiveDifferentiator;
  class HessianFactorization;

  /*
   * First-order sensitivity of eta(eps) = argmin_eta f(eta, eps) at a
   * verified optimum:
   *
   *   d eta / d eps = -H^{-1} d(grad_eta f) / d eps.
   *
   * The state for one anchor is built completely before it replaces the
   * previous one; a failed setBaseValues() leaves the solver untouched.
   */
  class LinearSensitivitySolver {
  private:
    struct SensitivityState {
      OptimumAnchor anchor;

      // Null when the Hessian factorization is disabled.
      std::shared_ptr<HessianFactorization const> factorization;
      Eigen::MatrixXd cross_derivative;
      std::optional<Eigen::MatrixXd> sensitivity;
    };

    std::shared_ptr<ObjectiveDifferentiator const> _objective;
    std::shared_ptr<ObjectiveDifferentiator const> _hyper_objective;
    config::LinearSensitivityConfig _config;

    std::shared_ptr<SensitivityState const> _state;

    void validateOptimum(
      Eigen::VectorXd const& eta0, Eigen::VectorXd const& eps0) const;
    std::shared_ptr<HessianFactorization const> factorize(
      Eigen::VectorXd const& eta0, Eigen::VectorXd const& eps0,
      std::optional<Eigen::MatrixXd> const& hessian) const;
    SensitivityState const& state() const;

  public:
    /*
     * `hyper_objective`, when given, must have the same eta-gradient
     * cross derivative as `objective`, typically the terms of f that depend
     * on eps. It is only used for d(grad_eta f) / d eps.
     */
    LinearSensitivitySolver(
      std::shared_ptr<ObjectiveDifferentiator const> objective,
      Eigen::VectorXd const& eta0, Eigen::VectorXd const& eps0,
      config::LinearSensitivityConfig config =
        config::LinearSensitivityConfig::CreateDefault(),
      std::optional<Eigen::MatrixXd> const& hessian = std::nullopt,
      std::shared_ptr<ObjectiveDifferentiator const> hyper_objective = nullptr);

    void setBaseValues(
      Eigen::VectorXd const& eta0, Eigen::VectorXd const& eps0,
      std::optional<Eigen::MatrixXd> const& hessian = std::nullopt);

    config::LinearSensitivityConfig const& config() const;
    // Returned by value; re-basing replaces the underlying state.
    OptimumAnchor anchor() const;

    Eigen::MatrixXd sensitivityMatrix() const;
    std::optional<Eigen::MatrixXd> hessian() const;
    Eigen::MatrixXd crossDerivative() const;

    // eta0 + (d eta / d eps) (eps - eps0), as a flat vector.
    Eigen::VectorXd predictFromHyperParameter(Eigen::VectorXd const& eps) const;
  };
}  // namespace hypersens
