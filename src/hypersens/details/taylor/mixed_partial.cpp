#include "hypersens/details/taylor/mixed_partial.hpp"
#include "hypersens/details/autodiff/differentiator.hpp"
#include "hypersens/details/errors.hpp"
#include "hypersens/details/logging.hpp"

#include <spdlog/spdlog.h>

namespace hypersens {
  using Eigen::VectorXd;

  GradientDerivativeEvaluator::GradientDerivativeEvaluator(
    std::shared_ptr<ObjectiveDifferentiator const> objective, int eta_order,
    int eps_order)
      : _objective(std::move(objective)),
        _eta_order(eta_order),
        _eps_order(eps_order) {
  }

  GradientDerivativeEvaluator::GradientDerivativeEvaluator(
    std::shared_ptr<ObjectiveDifferentiator const> objective)
      : GradientDerivativeEvaluator(std::move(objective), 0, 0) {
  }

  int GradientDerivativeEvaluator::etaOrder() const {
    return _eta_order;
  }

  int GradientDerivativeEvaluator::epsOrder() const {
    return _eps_order;
  }

  GradientDerivativeEvaluator
  GradientDerivativeEvaluator::appendEtaDirection() const {
    return GradientDerivativeEvaluator(_objective, _eta_order + 1, _eps_order);
  }

  GradientDerivativeEvaluator
  GradientDerivativeEvaluator::appendEpsDirection() const {
    return GradientDerivativeEvaluator(_objective, _eta_order, _eps_order + 1);
  }

  VectorXd GradientDerivativeEvaluator::operator()(
    VectorXd const& eta, VectorXd const& eps,
    std::vector<VectorRef> const& directions) const {
    if (static_cast<int>(directions.size()) != _eta_order + _eps_order) {
      __logger__->error(
        "Mixed partial ({}, {}) received {} directions", _eta_order,
        _eps_order, directions.size());
      throw DimensionMismatch("Wrong number of directions for mixed partial");
    }

    auto split = directions.begin() + _eta_order;
    std::vector<VectorRef> eta_directions(directions.begin(), split);
    std::vector<VectorRef> eps_directions(split, directions.end());
    return _objective->gradientDirectionalDerivative(
      eta, eps, eta_directions, eps_directions);
  }

  MixedPartialTable::MixedPartialTable(
    int max_order, std::vector<GradientDerivativeEvaluator> entries)
      : _max_order(max_order), _entries(std::move(entries)) {
    auto width = static_cast<std::size_t>(max_order + 1);
    if (max_order < 0 || _entries.size() != width * width)
      throw ConstructionError("Mixed partial table is not square");
  }

  int MixedPartialTable::maxOrder() const {
    return _max_order;
  }

  GradientDerivativeEvaluator const& MixedPartialTable::at(
    int eta_order, int eps_order) const {
    if (eta_order < 0 || eta_order > _max_order || eps_order < 0 ||
        eps_order > _max_order) {
      __logger__->error(
        "Mixed partial ({}, {}) outside of table order {}", eta_order,
        eps_order, _max_order);
      throw OrderRangeError("Mixed partial index outside of the table");
    }
    return _entries[eta_order * (_max_order + 1) + eps_order];
  }

  std::shared_ptr<MixedPartialTable const> buildMixedPartialTable(
    std::shared_ptr<ObjectiveDifferentiator const> objective, int max_order) {
    if (max_order < 0)
      throw OrderRangeError("Mixed partial table order must be nonnegative");

    // Each row extends the first entry of the previous row by one eta
    // direction; each entry extends its left neighbour by one eps direction.
    std::vector<GradientDerivativeEvaluator> entries;
    entries.reserve((max_order + 1) * (max_order + 1));

    auto row_head = GradientDerivativeEvaluator(std::move(objective));
    for (int i = 0; i <= max_order; i++) {
      if (i > 0)
        row_head = row_head.appendEtaDirection();

      entries.push_back(row_head);
      for (int j = 1; j <= max_order; j++)
        entries.push_back(entries.back().appendEpsDirection());
    }
    return std::make_shared<MixedPartialTable const>(
      max_order, std::move(entries));
  }
}  // namespace hypersens
