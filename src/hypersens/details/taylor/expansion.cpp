#include "hypersens/details/taylor/expansion.hpp"
#include "hypersens/details/taylor/mixed_partial.hpp"
#include "hypersens/details/taylor/term_algebra.hpp"

#include "hypersens/details/autodiff/differentiator.hpp"
#include "hypersens/details/linalg/factorization.hpp"
#include "hypersens/details/utils/debug.hpp"
#include "hypersens/details/errors.hpp"
#include "hypersens/details/logging.hpp"

#include <spdlog/spdlog.h>

namespace hypersens {
  using Eigen::MatrixXd;
  using Eigen::VectorXd;

  TaylorExpansionEngine::TaylorExpansionEngine(
    std::shared_ptr<ObjectiveDifferentiator const> objective,
    config::TaylorExpansionConfig config)
      : _objective(std::move(objective)), _config(config) {
    if (_objective == nullptr)
      throw UnsupportedConfiguration("Taylor expansion requires an objective");
  }

  std::shared_ptr<TaylorExpansionEngine::ExpansionBase const>
  TaylorExpansionEngine::makeBase(
    VectorXd const& eta0, VectorXd const& eps0,
    std::optional<MatrixXd> const& hessian) const {
    _objective->checkArguments(eta0, eps0);

    auto factorization = hessian.has_value()
      ? HessianFactorization::Create(*hessian)
      : HessianFactorization::Create(_objective->hessian(eta0, eps0));
    if (factorization->dimension() != _objective->etaDimension())
      throw DimensionMismatch("Hessian does not match the eta dimension");

    return std::make_shared<ExpansionBase const>(
      ExpansionBase {OptimumAnchor {eta0, eps0}, std::move(factorization)});
  }

  std::shared_ptr<TaylorExpansionEngine::ExpansionState const>
  TaylorExpansionEngine::makeState(
    std::shared_ptr<ExpansionBase const> const& base, int order) const {
    auto tic = ::hypersens::tic();

    // The order k evaluator differentiates the gradient up to k times, and
    // each term list must fit the table one order beyond the last.
    auto table = buildMixedPartialTable(_objective, order + 1);

    std::vector<TermList> term_lists = {baseTerms(table)};
    for (int k = 2; k <= order; k++) {
      term_lists.push_back(nextOrderTerms(term_lists.back()));
      __logger__->debug(
        "Taylor expansion order {}: {} terms", k, term_lists.back().size());
    }

    auto arena = std::make_shared<TermArena const>(
      TermArena {base->factorization, std::move(term_lists)});
    __logger__->debug(
      "Built Taylor expansion of order {} in {}[s]", order, toc(tic));

    return std::make_shared<ExpansionState const>(
      ExpansionState {order, std::move(table), std::move(arena)});
  }

  TaylorExpansionEngine::ExpansionBase const&
  TaylorExpansionEngine::base() const {
    if (_base == nullptr)
      throw UnsupportedConfiguration(
        "Taylor expansion base values are not set");
    return *_base;
  }

  TaylorExpansionEngine::ExpansionState const&
  TaylorExpansionEngine::state() const {
    if (_state == nullptr)
      throw OrderRangeError("Taylor expansion order is not set");
    return *_state;
  }

  void TaylorExpansionEngine::checkOrder(int k, char const* tag) const {
    auto declared = _state == nullptr ? 0 : _state->order;
    if (k >= 1 && k <= declared)
      return;

    __logger__->error(
      "{} must lie in [1, {}], got {}", tag, declared, k);
    throw OrderRangeError("Order outside of the declared Taylor order");
  }

  void TaylorExpansionEngine::setBaseValues(
    VectorXd const& eta0, VectorXd const& eps0,
    std::optional<MatrixXd> const& hessian) {
    auto base = makeBase(eta0, eps0, hessian);
    auto state = _state == nullptr ? nullptr : makeState(base, _state->order);

    _base = std::move(base);
    _state = std::move(state);
  }

  void TaylorExpansionEngine::setOrder(int order) {
    if (order < 1 || order > kMaxTaylorOrder) {
      __logger__->error(
        "Taylor order must lie in [1, {}], got {}", kMaxTaylorOrder, order);
      throw OrderRangeError("Unsupported Taylor expansion order");
    }
    base();
    _state = makeState(_base, order);
  }

  bool TaylorExpansionEngine::initialized() const {
    return _base != nullptr;
  }

  int TaylorExpansionEngine::order() const {
    return _state == nullptr ? 0 : _state->order;
  }

  OptimumAnchor TaylorExpansionEngine::anchor() const {
    return base().anchor;
  }

  MatrixXd TaylorExpansionEngine::hessian() const {
    return base().factorization->hessian();
  }

  TermList TaylorExpansionEngine::termList(int k) const {
    checkOrder(k, "Term list order");
    return state().arena->term_lists[k - 1];
  }

  VectorXd TaylorExpansionEngine::evaluateOrderDerivative(
    VectorXd const& deps, int k) const {
    checkOrder(k, "Derivative order");

    auto const& [eta0, eps0] = base().anchor;
    if (deps.size() != eps0.size()) {
      __logger__->error(
        "Hyperparameter direction size mismatch: {} vs {}", deps.size(),
        eps0.size());
      throw DimensionMismatch("Hyperparameter direction size mismatch");
    }
    return evaluateEtaDerivative(*state().arena, k, eta0, eps0, deps);
  }

  static double maxDeviation(VectorXd const& x, VectorXd const& x0) {
    if (x.size() != x0.size())
      throw DimensionMismatch("Evaluation point size mismatch");
    return x.size() == 0 ? 0. : (x - x0).cwiseAbs().maxCoeff();
  }

  VectorXd TaylorExpansionEngine::evaluateOrderDerivative(
    VectorXd const& eta, VectorXd const& eps, VectorXd const& deps,
    int k) const {
    auto const& [eta0, eps0] = base().anchor;
    auto tolerance = _config.anchor_tolerance;

    auto eta_deviation = maxDeviation(eta, eta0);
    auto eps_deviation = maxDeviation(eps, eps0);
    if (eta_deviation > tolerance || eps_deviation > tolerance) {
      __logger__->error(
        "Derivative requested away from the anchor: |eta - eta0| = {}, "
        "|eps - eps0| = {}, tolerance = {}",
        eta_deviation, eps_deviation, tolerance);
      throw AnchorMismatch("Derivatives are only available at the anchor");
    }
    return evaluateOrderDerivative(deps, k);
  }

  VectorXd TaylorExpansionEngine::evaluateTaylorSeries(
    VectorXd const& deps, bool add_offset, std::optional<int> max_order) const {
    auto K = max_order.value_or(order());
    checkOrder(K, "Taylor series order");

    auto const& eta0 = base().anchor.eta;
    VectorXd result = VectorXd::Zero(eta0.size());

    double factorial = 1;
    for (int k = 1; k <= K; k++) {
      factorial *= k;
      result += evaluateOrderDerivative(deps, k) / factorial;
    }

    if (add_offset)
      result += eta0;
    return result;
  }

  std::string TaylorExpansionEngine::describeTerms(std::optional<int> k) const {
    if (k.has_value())
      checkOrder(*k, "Term list order");

    std::string result;
    for (int i = 1; i <= order(); i++) {
      if (k.has_value() && *k != i)
        continue;

      result += fmt::format("\nTerms for order {}:\n", i);
      for (auto const& term : termList(i))
        result += term.toString() + "\n";
    }
    __logger__->info("{}", result);
    return result;
  }

  std::unique_ptr<TaylorExpansionEngine> TaylorExpansionEngine::Create(
    std::shared_ptr<ObjectiveDifferentiator const> objective,
    VectorXd const& eta0, VectorXd const& eps0, int order,
    std::optional<MatrixXd> const& hessian,
    config::TaylorExpansionConfig config) {
    auto engine =
      std::make_unique<TaylorExpansionEngine>(std::move(objective), config);
    engine->setBaseValues(eta0, eps0, hessian);
    engine->setOrder(order);
    return engine;
  }
}  // namespace hypersens
