#include "hypersens/details/taylor/term_algebra.hpp"
#include "hypersens/details/linalg/factorization.hpp"
#include "hypersens/details/errors.hpp"
#include "hypersens/details/logging.hpp"

#include <spdlog/spdlog.h>

#include <range/v3/all.hpp>

#include <map>
#include <utility>

namespace hypersens {
  namespace views = ranges::views;

  using Eigen::VectorXd;

  TermList consolidate(TermList const& terms) {
    using Signature = std::pair<int, std::vector<int>>;

    std::map<Signature, DerivativeTerm> groups;
    for (auto const& term : terms) {
      auto signature = Signature(term.epsOrder(), term.etaOrders());
      auto i = groups.find(signature);
      if (i == groups.end())
        groups.emplace(std::move(signature), term);
      else
        i->second = i->second.combineWith(term);
    }
    return groups | views::values | ranges::to<TermList>;
  }

  VectorXd evaluateSum(
    TermList const& terms, TermArena const& arena, VectorXd const& eta0,
    VectorXd const& eps0, VectorXd const& deps, bool include_top_eta_order) {
    auto contributing =
      terms | views::filter([include_top_eta_order](auto const& term) {
        return include_top_eta_order || !term.hasTopEtaOrder();
      });

    VectorXd result = VectorXd::Zero(eta0.size());
    for (auto const& term : contributing)
      result += term.evaluate(arena, eta0, eps0, deps);
    return result;
  }

  TermList baseTerms(std::shared_ptr<MixedPartialTable const> table) {
    return TermList {
      DerivativeTerm(1, {0}, 1.0, table),
      DerivativeTerm(0, {1}, 1.0, table),
    };
  }

  VectorXd solveNextEtaDerivative(
    HessianFactorization const& factorization, TermList const& terms,
    TermArena const& arena, VectorXd const& eta0, VectorXd const& eps0,
    VectorXd const& deps) {
    VectorXd known = evaluateSum(terms, arena, eta0, eps0, deps, false);
    return -factorization.solve(known);
  }

  TermList nextOrderTerms(TermList const& terms) {
    TermList derivatives;
    for (auto const& term : terms) {
      auto next = term.differentiate();
      derivatives.insert(
        derivatives.end(), std::make_move_iterator(next.begin()),
        std::make_move_iterator(next.end()));
    }
    return consolidate(derivatives);
  }

  VectorXd evaluateEtaDerivative(
    TermArena const& arena, int order, VectorXd const& eta0,
    VectorXd const& eps0, VectorXd const& deps) {
    int declared_order = arena.term_lists.size();
    if (order < 1 || order > declared_order) {
      __logger__->error(
        "Eta derivative of order {} requested; available orders are 1..{}",
        order, declared_order);
      throw OrderRangeError("Eta derivative order out of range");
    }
    if (arena.factorization == nullptr)
      throw UnsupportedConfiguration("Term arena has no Hessian factorization");

    // Terms of order k reference eta derivatives of order < k only, so the
    // recursion through DerivativeTerm::evaluate terminates.
    return solveNextEtaDerivative(
      *arena.factorization, arena.term_lists[order - 1], arena, eta0, eps0,
      deps);
  }
}  // namespace hypersens
