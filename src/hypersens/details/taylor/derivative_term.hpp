#pragma once

#include <Eigen/Dense>

#include <memory>
#include <string>
#include <vector>

namespace hypersens {
  class MixedPartialTable;
  struct TermArena;

  /*
   * One summand of d^k [grad_eta f(eta(eps), eps)] / d eps^k:
   *
   *   prefactor * D_eta^m D_eps^n (grad_eta f)
   *     [eta^(1), ..., eta^(1), eta^(2), ..., deps, ..., deps]
   *
   * where m = sum(eta_orders), n = eps_order, and eta^(p) = d^p eta / d eps^p
   * contracted against deps appears eta_orders[p - 1] times. The term order
   * k = eps_order + sum_p p * eta_orders[p - 1] must equal eta_orders.size().
   */
  class DerivativeTerm {
  private:
    int _eps_order;
    std::vector<int> _eta_orders;
    double _prefactor;
    std::shared_ptr<MixedPartialTable const> _table;

  public:
    DerivativeTerm(
      int eps_order, std::vector<int> eta_orders, double prefactor,
      std::shared_ptr<MixedPartialTable const> table);

    int epsOrder() const;
    std::vector<int> const& etaOrders() const;
    double prefactor() const;
    int order() const;
    int totalEtaOrder() const;

    // Whether the term multiplies the highest-order eta derivative.
    bool hasTopEtaOrder() const;

    Eigen::VectorXd evaluate(
      TermArena const& arena, Eigen::VectorXd const& eta0,
      Eigen::VectorXd const& eps0, Eigen::VectorXd const& deps) const;

    // Chain and product rule expansion of one more eps derivative.
    std::vector<DerivativeTerm> differentiate() const;

    bool checkSimilarity(DerivativeTerm const& other) const;
    DerivativeTerm combineWith(DerivativeTerm const& other) const;

    std::string toString() const;
  };

  using TermList = std::vector<DerivativeTerm>;
}  // namespace hypersens
