#pragma once

#include "hypersens/details/taylor/derivative_term.hpp"

#include <Eigen/Dense>

#include <memory>
#include <vector>

namespace hypersens {
  class HessianFactorization;

  /*
   * Everything needed to evaluate d^k eta / d eps^k at one anchor: the
   * Hessian factorization and the consolidated term list of every order,
   * term_lists[k - 1] holding the terms of order k.
   */
  struct TermArena {
    std::shared_ptr<HessianFactorization const> factorization;
    std::vector<TermList> term_lists;
  };

  // Sums the prefactors of similar terms. The result is ordered canonically
  // and does not depend on the input order.
  TermList consolidate(TermList const& terms);

  // With include_top_eta_order = false, terms multiplying the unknown
  // highest-order eta derivative are skipped.
  Eigen::VectorXd evaluateSum(
    TermList const& terms, TermArena const& arena, Eigen::VectorXd const& eta0,
    Eigen::VectorXd const& eps0, Eigen::VectorXd const& deps,
    bool include_top_eta_order = true);

  // The two order-1 terms: d/deps g + d/deta g * d eta / d eps.
  TermList baseTerms(std::shared_ptr<MixedPartialTable const> table);

  // Solves H x = -(sum of the known terms) for the top eta derivative.
  Eigen::VectorXd solveNextEtaDerivative(
    HessianFactorization const& factorization, TermList const& terms,
    TermArena const& arena, Eigen::VectorXd const& eta0,
    Eigen::VectorXd const& eps0, Eigen::VectorXd const& deps);

  TermList nextOrderTerms(TermList const& terms);

  // d^order eta / d eps^order contracted against deps.
  Eigen::VectorXd evaluateEtaDerivative(
    TermArena const& arena, int order, Eigen::VectorXd const& eta0,
    Eigen::VectorXd const& eps0, Eigen::VectorXd const& deps);
}  // namespace hypersens
