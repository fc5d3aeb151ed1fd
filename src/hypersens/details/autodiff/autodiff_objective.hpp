#pragma once

#include "hypersens/details/autodiff/differentiator.hpp"
#include "hypersens/details/utils/jet.hpp"
#include "hypersens/details/config.hpp"
#include "hypersens/details/errors.hpp"
#include "hypersens/details/logging.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <memory>

namespace hypersens {
  /*
   * Forward-mode differentiation of a Ceres-style autodiff functor
   *
   *   template <typename scalar_t>
   *   bool operator()(
   *     scalar_t const* eta, scalar_t const* eps, scalar_t* value) const;
   *
   * Each direction of a mixed derivative adds one level of ceres::Jet<., 1>
   * nesting; the number of directions is dispatched at runtime onto the
   * matching compile-time depth.
   */
  template <typename functor_t>
  class AutoDiffObjective: public ObjectiveDifferentiator {
  private:
    functor_t _functor;
    int _eta_dimension;
    int _eps_dimension;

    template <int depth>
    VectorX<NestedJet<depth>> seedArgument(
      Eigen::VectorXd const& x, Argument argument,
      DirectionList const& directions) const {
      VectorX<NestedJet<depth>> result(x.size());
      std::array<double, depth + 1> slopes;
      for (int i = 0; i < x.size(); i++) {
        for (int k = 0; k < depth; k++) {
          auto const& direction = directions[k];
          slopes[k] =
            direction.argument == argument ? direction.vector.get()(i) : 0.;
        }
        result(i) = JetSeed<depth>::make(x(i), slopes.data());
      }
      return result;
    }

    template <int depth>
    double evaluateAtDepth(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps,
      DirectionList const& directions) const {
      using scalar_t = NestedJet<depth>;

      auto eta_jet = seedArgument<depth>(eta, Argument::eta, directions);
      auto eps_jet = seedArgument<depth>(eps, Argument::eps, directions);

      scalar_t value = constant<scalar_t>(0);
      if (!_functor(eta_jet.data(), eps_jet.data(), &value)) {
        __logger__->error(
          "Objective evaluation failed at derivative depth {}", depth);
        throw EvaluationFailure("Objective functor returned false");
      }
      return JetMixedPart<depth>::get(value);
    }

    template <int depth>
    double dispatch(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps,
      DirectionList const& directions) const {
      if constexpr (depth > kMaxDerivativeDepth) {
        __logger__->error(
          "Derivative of order {} exceeds the supported depth {}",
          directions.size(), kMaxDerivativeDepth);
        throw OrderRangeError("Derivative order exceeds the supported depth");
      } else {
        if (static_cast<int>(directions.size()) == depth)
          return evaluateAtDepth<depth>(eta, eps, directions);
        return dispatch<depth + 1>(eta, eps, directions);
      }
    }

  public:
    AutoDiffObjective(functor_t functor, int eta_dimension, int eps_dimension)
        : _functor(std::move(functor)),
          _eta_dimension(eta_dimension),
          _eps_dimension(eps_dimension) {
    }

    int etaDimension() const override {
      return _eta_dimension;
    }

    int epsDimension() const override {
      return _eps_dimension;
    }

    double value(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps) const override {
      checkArguments(eta, eps);
      return evaluateAtDepth<0>(eta, eps, {});
    }

    double directionalDerivative(
      Eigen::VectorXd const& eta, Eigen::VectorXd const& eps,
      DirectionList const& directions) const override {
      checkArguments(eta, eps);
      for (auto const& direction : directions) {
        auto expected = direction.argument == Argument::eta ? _eta_dimension
                                                            : _eps_dimension;
        if (direction.vector.get().size() != expected)
          throw DimensionMismatch("Direction size does not match the argument");
      }
      return dispatch<0>(eta, eps, directions);
    }
  };

  template <typename functor_t>
  std::shared_ptr<ObjectiveDifferentiator const> makeAutoDiffObjective(
    functor_t functor, int eta_dimension, int eps_dimension) {
    return std::make_shared<AutoDiffObjective<functor_t>>(
      std::move(functor), eta_dimension, eps_dimension);
  }
}  // namespace hypersens
