#pragma once

#include <Eigen/Dense>

#include <memory>

namespace hypersens {
  /*
   * Cholesky factorization of the Hessian at an optimum. Computed once per
   * anchor and shared, read-only, by every linear solve at every order.
   */
  class HessianFactorization {
  private:
    Eigen::MatrixXd _hessian;
    Eigen::LLT<Eigen::MatrixXd> _llt;

    explicit HessianFactorization(Eigen::MatrixXd const& hessian);

  public:
    int dimension() const;
    Eigen::MatrixXd const& hessian() const;

    Eigen::VectorXd solve(Eigen::VectorXd const& rhs) const;
    Eigen::MatrixXd solve(Eigen::MatrixXd const& rhs) const;

    static std::shared_ptr<HessianFactorization const> Create(
      Eigen::MatrixXd const& hessian);
  };
}  // namespace hypersens
