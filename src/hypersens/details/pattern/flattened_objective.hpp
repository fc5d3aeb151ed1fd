#pragma once

#include "hypersens/details/type.hpp"

#include <Eigen/Dense>

namespace hypersens {
  /*
   * Adapts an objective of folded values,
   *
   *   template <typename scalar_t>
   *   bool operator()(
   *     eta_folded<scalar_t> const& eta, eps_folded<scalar_t> const& eps,
   *     scalar_t* value) const;
   *
   * into a flat autodiff functor by folding both arguments through their
   * patterns.
   */
  template <
    typename objective_t, typename eta_pattern_t, typename eps_pattern_t>
  struct FlattenedObjective {
    objective_t objective;
    eta_pattern_t eta_pattern;
    eps_pattern_t eps_pattern;
    bool eta_free;
    bool eps_free;

    int etaDimension() const {
      return eta_pattern.flatLength(eta_free);
    }

    int epsDimension() const {
      return eps_pattern.flatLength(eps_free);
    }

    template <typename scalar_t>
    bool operator()(
      scalar_t const* const eta, scalar_t const* const eps,
      scalar_t* const value) const {
      using Vector = VectorX<scalar_t>;
      Vector const eta_flat = Eigen::Map<Vector const>(eta, etaDimension());
      Vector const eps_flat = Eigen::Map<Vector const>(eps, epsDimension());

      auto eta_folded =
        eta_pattern.template fold<scalar_t>(eta_flat, eta_free);
      auto eps_folded =
        eps_pattern.template fold<scalar_t>(eps_flat, eps_free);
      return objective(eta_folded, eps_folded, value);
    }
  };
}  // namespace hypersens
