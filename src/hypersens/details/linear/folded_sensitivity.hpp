#pragma once

#include "hypersens/details/autodiff/autodiff_objective.hpp"
#include "hypersens/details/linear/sensitivity.hpp"
#include "hypersens/details/pattern/flattened_objective.hpp"
#include "hypersens/details/config.hpp"

#include <Eigen/Dense>

#include <memory>
#include <optional>

namespace hypersens {
  template <
    typename objective_t, typename eta_pattern_t, typename eps_pattern_t>
  std::shared_ptr<ObjectiveDifferentiator const> makeFlattenedObjective(
    objective_t objective, eta_pattern_t eta_pattern, eps_pattern_t eps_pattern,
    bool eta_free, bool eps_free) {
    using flattened_t =
      FlattenedObjective<objective_t, eta_pattern_t, eps_pattern_t>;
    auto flattened = flattened_t {
      .objective = std::move(objective),
      .eta_pattern = std::move(eta_pattern),
      .eps_pattern = std::move(eps_pattern),
      .eta_free = eta_free,
      .eps_free = eps_free,
    };
    auto eta_dimension = flattened.etaDimension();
    auto eps_dimension = flattened.epsDimension();
    return makeAutoDiffObjective(
      std::move(flattened), eta_dimension, eps_dimension);
  }

  template <typename eta_pattern_t, typename eps_pattern_t>
  struct FoldedSensitivityArgument {
    eta_pattern_t eta_pattern;
    eps_pattern_t eps_pattern;
    bool eta_free = true;
    bool eps_free = true;

    config::LinearSensitivityConfig config =
      config::LinearSensitivityConfig::CreateDefault();
    std::optional<Eigen::MatrixXd> hessian = std::nullopt;
  };

  /*
   * Linear sensitivity of an objective defined on folded (structured,
   * possibly bounded) parameters. Anchors and predictions are folded values;
   * the flat solver works in the free or folded flat coordinates selected by
   * `eta_free` and `eps_free`.
   */
  template <typename eta_pattern_t, typename eps_pattern_t>
  class FoldedLinearSensitivity {
  public:
    using eta_folded_t = typename eta_pattern_t::template folded_t<double>;
    using eps_folded_t = typename eps_pattern_t::template folded_t<double>;
    using argument_t = FoldedSensitivityArgument<eta_pattern_t, eps_pattern_t>;

  private:
    eta_pattern_t _eta_pattern;
    eps_pattern_t _eps_pattern;
    bool _eta_free;
    bool _eps_free;

    std::unique_ptr<LinearSensitivitySolver> _solver;

    struct FlatObjectives {
      std::shared_ptr<ObjectiveDifferentiator const> objective;
      std::shared_ptr<ObjectiveDifferentiator const> hyper_objective;
    };

    FoldedLinearSensitivity(
      FlatObjectives objectives, eta_folded_t const& eta0,
      eps_folded_t const& eps0, argument_t args)
        : _eta_pattern(std::move(args.eta_pattern)),
          _eps_pattern(std::move(args.eps_pattern)),
          _eta_free(args.eta_free),
          _eps_free(args.eps_free) {
      _solver = std::make_unique<LinearSensitivitySolver>(
        std::move(objectives.objective), flattenEta(eta0), flattenEps(eps0),
        args.config, args.hessian, std::move(objectives.hyper_objective));
    }

    Eigen::VectorXd flattenEta(eta_folded_t const& eta) const {
      return _eta_pattern.flatten(eta, _eta_free);
    }

    Eigen::VectorXd flattenEps(eps_folded_t const& eps) const {
      return _eps_pattern.flatten(eps, _eps_free);
    }

  public:
    template <typename objective_t>
    FoldedLinearSensitivity(
      objective_t objective, eta_folded_t const& eta0,
      eps_folded_t const& eps0, argument_t args)
        : FoldedLinearSensitivity(
            FlatObjectives {
              makeFlattenedObjective(
                std::move(objective), args.eta_pattern, args.eps_pattern,
                args.eta_free, args.eps_free),
              nullptr},
            eta0, eps0, args) {
    }

    // `hyper_objective` holds the eps-dependent part of `objective`.
    template <typename objective_t, typename hyper_objective_t>
    FoldedLinearSensitivity(
      objective_t objective, hyper_objective_t hyper_objective,
      eta_folded_t const& eta0, eps_folded_t const& eps0, argument_t args)
        : FoldedLinearSensitivity(
            FlatObjectives {
              makeFlattenedObjective(
                std::move(objective), args.eta_pattern, args.eps_pattern,
                args.eta_free, args.eps_free),
              makeFlattenedObjective(
                std::move(hyper_objective), args.eta_pattern,
                args.eps_pattern, args.eta_free, args.eps_free)},
            eta0, eps0, args) {
    }

    void setBaseValues(
      eta_folded_t const& eta0, eps_folded_t const& eps0,
      std::optional<Eigen::MatrixXd> const& hessian = std::nullopt) {
      _solver->setBaseValues(flattenEta(eta0), flattenEps(eps0), hessian);
    }

    LinearSensitivitySolver const& solver() const {
      return *_solver;
    }

    Eigen::MatrixXd sensitivityMatrix() const {
      return _solver->sensitivityMatrix();
    }

    std::optional<Eigen::MatrixXd> hessian() const {
      return _solver->hessian();
    }

    Eigen::VectorXd predictFlatFromHyperParameter(
      eps_folded_t const& eps) const {
      return _solver->predictFromHyperParameter(flattenEps(eps));
    }

    eta_folded_t predictFromHyperParameter(eps_folded_t const& eps) const {
      return _eta_pattern.fold(predictFlatFromHyperParameter(eps), _eta_free);
    }
  };
}  // namespace hypersens
