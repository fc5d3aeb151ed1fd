#include "hypersens/details/linalg/factorization.hpp"
#include "hypersens/details/utils/debug.hpp"
#include "hypersens/details/errors.hpp"
#include "hypersens/details/logging.hpp"

#include <spdlog/spdlog.h>

namespace hypersens {
  using Eigen::MatrixXd;
  using Eigen::VectorXd;

  HessianFactorization::HessianFactorization(MatrixXd const& hessian)
      : _hessian(hessian), _llt(hessian) {
  }

  int HessianFactorization::dimension() const {
    return _hessian.rows();
  }

  MatrixXd const& HessianFactorization::hessian() const {
    return _hessian;
  }

  VectorXd HessianFactorization::solve(VectorXd const& rhs) const {
    if (rhs.size() != dimension()) {
      __logger__->error(
        "Cholesky solve size mismatch: {} vs {}", rhs.size(), dimension());
      throw DimensionMismatch("Right-hand side size mismatch");
    }
    return _llt.solve(rhs);
  }

  MatrixXd HessianFactorization::solve(MatrixXd const& rhs) const {
    if (rhs.rows() != dimension()) {
      __logger__->error(
        "Cholesky solve size mismatch: {} vs {}", rhs.rows(), dimension());
      throw DimensionMismatch("Right-hand side size mismatch");
    }
    return _llt.solve(rhs);
  }

  std::shared_ptr<HessianFactorization const> HessianFactorization::Create(
    MatrixXd const& hessian) {
    if (hessian.rows() != hessian.cols()) {
      __logger__->error(
        "Hessian is not square: <{}, {}>", hessian.rows(), hessian.cols());
      throw DimensionMismatch("Hessian is not a square matrix");
    }
    if (!hessian.isApprox(hessian.transpose())) {
      __logger__->error(
        "Hessian is not symmetric: max |H - H^T| = {}",
        (hessian - hessian.transpose()).cwiseAbs().maxCoeff());
      throw LinearAlgebraError("Hessian is not a symmetric matrix");
    }

    auto tic = ::hypersens::tic();
    auto factorization = std::shared_ptr<HessianFactorization const>(
      new HessianFactorization(hessian));
    if (factorization->_llt.info() != Eigen::Success) {
      __logger__->error("Cholesky decomposition failed.");
      throw LinearAlgebraError("Hessian is not positive definite");
    }

    __logger__->debug(
      "Factorized {}x{} Hessian in {}[s]", hessian.rows(), hessian.cols(),
      toc(tic));
    return factorization;
  }
}  // namespace hypersens
