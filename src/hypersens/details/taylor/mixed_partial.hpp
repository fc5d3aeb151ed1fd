#pragma once

#include "hypersens/details/type.hpp"

#include <Eigen/Dense>

#include <memory>
#include <vector>

namespace hypersens {
  class ObjectiveDifferentiator;

  /*
   * Handle evaluating D_eta^i D_eps^j (grad_eta f) contracted against i eta
   * directions followed by j eps directions. Handles are immutable; each
   * append composes one more forward-mode differentiation.
   */
  class GradientDerivativeEvaluator {
  private:
    std::shared_ptr<ObjectiveDifferentiator const> _objective;
    int _eta_order;
    int _eps_order;

    GradientDerivativeEvaluator(
      std::shared_ptr<ObjectiveDifferentiator const> objective, int eta_order,
      int eps_order);

  public:
    // The (0, 0) entry, the eta gradient itself.
    explicit GradientDerivativeEvaluator(
      std::shared_ptr<ObjectiveDifferentiator const> objective);

    int etaOrder() const;
    int epsOrder() const;

    GradientDerivativeEvaluator appendEtaDirection() const;
    GradientDerivativeEvaluator appendEpsDirection() const;

    Eigen::VectorXd operator()(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps,
      std::vector<VectorRef> const& directions) const;
  };

  // Fixed (max_order + 1) x (max_order + 1) table of evaluators.
  class MixedPartialTable {
  private:
    int _max_order;
    std::vector<GradientDerivativeEvaluator> _entries;

  public:
    MixedPartialTable(
      int max_order, std::vector<GradientDerivativeEvaluator> entries);

    int maxOrder() const;
    GradientDerivativeEvaluator const& at(int eta_order, int eps_order) const;
  };

  std::shared_ptr<MixedPartialTable const> buildMixedPartialTable(
    std::shared_ptr<ObjectiveDifferentiator const> objective, int max_order);
}  // namespace hypersens
