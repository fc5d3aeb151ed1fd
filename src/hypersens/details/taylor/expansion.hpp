#pragma once

#include "hypersens/details/taylor/derivative_term.hpp"
#include "hypersens/details/config.hpp"
#include "hypersens/details/type.hpp"

#include <Eigen/Dense>

#include <memory>
#include <optional>
#include <string>

namespace hypersens {
  class ObjectiveDifferentiator;
  class HessianFactorization;
  class MixedPartialTable;
  struct TermArena;

  /*
   * Taylor series of eta(eps) = argmin_eta f(eta, eps) around an anchor
   * (eta0, eps0), by repeated total differentiation of the stationarity
   * condition grad_eta f(eta(eps), eps) = 0.
   *
   * Lifecycle: uninitialized -> base values set -> order built. Changing the
   * anchor or the declared order rebuilds every term list from order 1.
   */
  class TaylorExpansionEngine {
  private:
    struct ExpansionBase {
      OptimumAnchor anchor;
      std::shared_ptr<HessianFactorization const> factorization;
    };

    struct ExpansionState {
      int order;
      std::shared_ptr<MixedPartialTable const> table;
      std::shared_ptr<TermArena const> arena;
    };

    std::shared_ptr<ObjectiveDifferentiator const> _objective;
    config::TaylorExpansionConfig _config;

    std::shared_ptr<ExpansionBase const> _base;
    std::shared_ptr<ExpansionState const> _state;

    std::shared_ptr<ExpansionBase const> makeBase(
      Eigen::VectorXd const& eta0, Eigen::VectorXd const& eps0,
      std::optional<Eigen::MatrixXd> const& hessian) const;
    std::shared_ptr<ExpansionState const> makeState(
      std::shared_ptr<ExpansionBase const> const& base, int order) const;

    ExpansionBase const& base() const;
    ExpansionState const& state() const;
    void checkOrder(int k, char const* tag) const;

  public:
    explicit TaylorExpansionEngine(
      std::shared_ptr<ObjectiveDifferentiator const> objective,
      config::TaylorExpansionConfig config =
        config::TaylorExpansionConfig::CreateDefault());

    void setBaseValues(
      Eigen::VectorXd const& eta0, Eigen::VectorXd const& eps0,
      std::optional<Eigen::MatrixXd> const& hessian = std::nullopt);
    void setOrder(int order);

    bool initialized() const;
    int order() const;
    // Returned by value; re-basing replaces the underlying state.
    OptimumAnchor anchor() const;
    Eigen::MatrixXd hessian() const;
    TermList termList(int k) const;

    Eigen::VectorXd evaluateOrderDerivative(
      Eigen::VectorXd const& deps, int k) const;

    // Same as above, after checking that (eta, eps) is the anchor.
    Eigen::VectorXd evaluateOrderDerivative(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps,
      Eigen::VectorXd const& deps, int k) const;

    Eigen::VectorXd evaluateTaylorSeries(
      Eigen::VectorXd const& deps, bool add_offset = true,
      std::optional<int> max_order = std::nullopt) const;

    std::string describeTerms(std::optional<int> k = std::nullopt) const;

    static std::unique_ptr<TaylorExpansionEngine> Create(
      std::shared_ptr<ObjectiveDifferentiator const> objective,
      Eigen::VectorXd const& eta0, Eigen::VectorXd const& eps0, int order,
      std::optional<Eigen::MatrixXd> const& hessian = std::nullopt,
      config::TaylorExpansionConfig config =
        config::TaylorExpansionConfig::CreateDefault());
  };
}  // namespace hypersens
