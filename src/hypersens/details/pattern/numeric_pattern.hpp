#pragma once

#include "hypersens/details/type.hpp"
#include "hypersens/details/utils/jet.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <limits>
#include <optional>

namespace hypersens {
  /*
   * A vector of numbers with optional elementwise bounds lb <= x <= ub.
   *
   * The free (unconstrained) parameterization is
   *   x                          if unbounded,
   *   log(x - lb)                if only bounded below,
   *   -log(ub - x)               if only bounded above,
   *   log(x - lb) - log(ub - x)  if bounded on both sides.
   */
  class NumericVectorPattern {
  private:
    int _size;
    double _lb;
    double _ub;
    bool _default_validate;

  public:
    template <typename scalar_t>
    using folded_t = VectorX<scalar_t>;

    explicit NumericVectorPattern(
      int size, double lb = -std::numeric_limits<double>::infinity(),
      double ub = std::numeric_limits<double>::infinity(),
      bool default_validate = true);

    int size() const;
    double lowerBound() const;
    double upperBound() const;
    int flatLength(bool free) const;

    bool validateFolded(
      Eigen::VectorXd const& folded,
      std::optional<bool> validate_values = std::nullopt) const;

    Eigen::VectorXd flatten(
      Eigen::VectorXd const& folded, bool free,
      std::optional<bool> validate_values = std::nullopt) const;

    Eigen::VectorXd fold(
      Eigen::VectorXd const& flat, bool free,
      std::optional<bool> validate_values = std::nullopt) const;

    // Differentiable fold, used inside forward-mode evaluations. Performs no
    // bound validation.
    template <typename scalar_t>
    folded_t<scalar_t> fold(VectorX<scalar_t> const& flat, bool free) const {
      if (!free)
        return flat;

      using std::exp;
      bool has_lb = std::isfinite(_lb);
      bool has_ub = std::isfinite(_ub);

      folded_t<scalar_t> result(flat.size());
      for (int i = 0; i < flat.size(); i++) {
        auto const& u = flat(i);
        if (has_lb && has_ub) {
          auto e = exp(u);
          result(i) = constant<scalar_t>(_ub - _lb) * e /
              (constant<scalar_t>(1) + e) +
            constant<scalar_t>(_lb);
        } else if (has_lb) {
          result(i) = exp(u) + constant<scalar_t>(_lb);
        } else if (has_ub) {
          result(i) = constant<scalar_t>(_ub) - exp(-u);
        } else {
          result(i) = u;
        }
      }
      return result;
    }
  };
}  // namespace hypersens
