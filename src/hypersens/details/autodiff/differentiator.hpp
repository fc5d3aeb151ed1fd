#pragma once

#include "hypersens/details/type.hpp"

#include <Eigen/Dense>

namespace hypersens {
  /*
   * Differentiation engine for a scalar objective f(eta, eps) of two flat
   * vectors. Implementations supply the mixed directional derivative
   * primitive; every first and second order quantity used by the solvers is
   * derived from it.
   */
  class ObjectiveDifferentiator {
  public:
    virtual ~ObjectiveDifferentiator() = default;

    virtual int etaDimension() const = 0;
    virtual int epsDimension() const = 0;

    virtual double value(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps) const = 0;

    /*
     * D^k f(eta, eps)[u_1, ..., u_k], where the k = directions.size()
     * directions are each tagged with the argument they perturb.
     */
    virtual double directionalDerivative(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps,
      DirectionList const& directions) const = 0;

    /*
     * D_eta^i D_eps^j (grad_eta f)(eta, eps)[v_1, ..., v_i, w_1, ..., w_j]
     * with i = eta_directions.size() and j = eps_directions.size().
     */
    Eigen::VectorXd gradientDirectionalDerivative(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps,
      std::vector<VectorRef> const& eta_directions,
      std::vector<VectorRef> const& eps_directions) const;

    Eigen::VectorXd gradient(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps) const;
    Eigen::MatrixXd hessian(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps) const;
    Eigen::VectorXd hessianVectorProduct(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps,
      Eigen::VectorXd const& v) const;

    // d(grad_eta f) / d eps, an etaDimension() x epsDimension() matrix.
    Eigen::MatrixXd crossJacobian(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps) const;

    void checkArguments(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps) const;
  };
}  // namespace hypersens
