#include "hypersens/details/taylor/derivative_term.hpp"
#include "hypersens/details/taylor/mixed_partial.hpp"
#include "hypersens/details/taylor/term_algebra.hpp"

#include "hypersens/details/utils/debug.hpp"
#include "hypersens/details/errors.hpp"
#include "hypersens/details/logging.hpp"

#include <spdlog/spdlog.h>

#include <numeric>

namespace hypersens {
  using Eigen::VectorXd;

  static int weightedOrder(int eps_order, std::vector<int> const& eta_orders) {
    int order = eps_order;
    for (std::size_t i = 0; i < eta_orders.size(); i++)
      order += eta_orders[i] * static_cast<int>(i + 1);
    return order;
  }

  DerivativeTerm::DerivativeTerm(
    int eps_order, std::vector<int> eta_orders, double prefactor,
    std::shared_ptr<MixedPartialTable const> table)
      : _eps_order(eps_order),
        _eta_orders(std::move(eta_orders)),
        _prefactor(prefactor),
        _table(std::move(table)) {
    if (_eps_order < 0)
      throw ConstructionError("Epsilon order must be nonnegative");

    for (auto eta_order : _eta_orders) {
      if (eta_order < 0)
        throw ConstructionError("Eta orders must be nonnegative");
    }

    auto k = weightedOrder(_eps_order, _eta_orders);
    if (k != static_cast<int>(_eta_orders.size())) {
      __logger__->error(
        "Inconsistent derivative term: eps[{}] eta{} has order {} but {} "
        "eta slots",
        _eps_order, ordersToString(_eta_orders), k, _eta_orders.size());
      throw ConstructionError("Derivative term order does not match eta slots");
    }

    if (_table == nullptr)
      throw ConstructionError("Derivative term requires a mixed partial table");
    if (_table->maxOrder() < k) {
      __logger__->error(
        "Mixed partial table of order {} cannot hold a term of order {}",
        _table->maxOrder(), k);
      throw ConstructionError("Mixed partial table is too small");
    }
  }

  int DerivativeTerm::epsOrder() const {
    return _eps_order;
  }

  std::vector<int> const& DerivativeTerm::etaOrders() const {
    return _eta_orders;
  }

  double DerivativeTerm::prefactor() const {
    return _prefactor;
  }

  int DerivativeTerm::order() const {
    return _eta_orders.size();
  }

  int DerivativeTerm::totalEtaOrder() const {
    return std::accumulate(_eta_orders.begin(), _eta_orders.end(), 0);
  }

  bool DerivativeTerm::hasTopEtaOrder() const {
    return !_eta_orders.empty() && _eta_orders.back() != 0;
  }

  VectorXd DerivativeTerm::evaluate(
    TermArena const& arena, VectorXd const& eta0, VectorXd const& eps0,
    VectorXd const& deps) const {
    // Eta derivative arguments first, by increasing order, then the eps
    // directions.
    std::vector<VectorXd> eta_derivatives;
    std::vector<int> multiplicities;
    for (std::size_t i = 0; i < _eta_orders.size(); i++) {
      if (_eta_orders[i] == 0)
        continue;
      auto derivative_order = static_cast<int>(i + 1);
      eta_derivatives.push_back(
        evaluateEtaDerivative(arena, derivative_order, eta0, eps0, deps));
      multiplicities.push_back(_eta_orders[i]);
    }

    std::vector<VectorRef> arguments;
    arguments.reserve(_eta_orders.size());
    for (std::size_t i = 0; i < eta_derivatives.size(); i++) {
      for (int _ = 0; _ < multiplicities[i]; _++)
        arguments.push_back(std::cref(eta_derivatives[i]));
    }
    for (int _ = 0; _ < _eps_order; _++)
      arguments.push_back(std::cref(deps));

    auto const& g = _table->at(totalEtaOrder(), _eps_order);
    return _prefactor * g(eta0, eps0, arguments);
  }

  std::vector<DerivativeTerm> DerivativeTerm::differentiate() const {
    auto eta_orders = _eta_orders;
    eta_orders.push_back(0);

    std::vector<DerivativeTerm> result;

    // Partial derivative in eps.
    result.emplace_back(_eps_order + 1, eta_orders, _prefactor, _table);

    // Partial derivative in eta, multiplying d eta / d eps.
    auto direct_eta = eta_orders;
    direct_eta[0] += 1;
    result.emplace_back(_eps_order, std::move(direct_eta), _prefactor, _table);

    // d^p eta / d eps^p -> d^(p + 1) eta / d eps^(p + 1), once per factor.
    for (std::size_t i = 0; i < _eta_orders.size(); i++) {
      if (_eta_orders[i] == 0)
        continue;

      auto moved = eta_orders;
      moved[i] -= 1;
      moved[i + 1] += 1;
      result.emplace_back(
        _eps_order, std::move(moved), _prefactor * _eta_orders[i], _table);
    }
    return result;
  }

  bool DerivativeTerm::checkSimilarity(DerivativeTerm const& other) const {
    return _eps_order == other._eps_order && _eta_orders == other._eta_orders;
  }

  DerivativeTerm DerivativeTerm::combineWith(
    DerivativeTerm const& other) const {
    if (!checkSimilarity(other)) {
      __logger__->error(
        "Cannot combine {} with {}", toString(), other.toString());
      throw ConstructionError("Combined derivative terms are not similar");
    }
    return DerivativeTerm(
      _eps_order, _eta_orders, _prefactor + other._prefactor, _table);
  }

  std::string DerivativeTerm::toString() const {
    return fmt::format(
      "Order: {}\t{} * eta{} * eps[{}]", order(), _prefactor,
      ordersToString(_eta_orders), _eps_order);
  }
}  // namespace hypersens
