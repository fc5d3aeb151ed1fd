#pragma once

#include <ceres/jet.h>

namespace hypersens {
  /*
   * NestedJet<d> is a scalar carrying d independent first-order
   * infinitesimals e_1, ..., e_d, one per nesting level, with e_d owned by
   * the outermost level. Since every e_k squares to zero, the coefficient of
   * e_1 * ... * e_d of f(x + sum_k u_k e_k) is exactly the mixed directional
   * derivative D^d f(x)[u_1, ..., u_d].
   */
  template <int depth>
  struct NestedJetTrait {
    using type = ceres::Jet<typename NestedJetTrait<depth - 1>::type, 1>;
  };

  template <>
  struct NestedJetTrait<0> {
    using type = double;
  };

  template <int depth>
  using NestedJet = typename NestedJetTrait<depth>::type;

  template <typename scalar_t>
  struct ScalarLift {
    static scalar_t lift(double x) {
      return scalar_t(x);
    }
  };

  template <typename inner_t, int N>
  struct ScalarLift<ceres::Jet<inner_t, N>> {
    static ceres::Jet<inner_t, N> lift(double x) {
      return ceres::Jet<inner_t, N>(ScalarLift<inner_t>::lift(x));
    }
  };

  // Jet constructors are explicit and do not chain through nesting levels;
  // objectives write their constants as `constant<scalar_t>(0.5)`.
  template <typename scalar_t>
  static inline scalar_t constant(double x) {
    return ScalarLift<scalar_t>::lift(x);
  }

  template <int depth>
  struct JetSeed {
    // x + sum_k slopes[k] * e_{k + 1}.
    static NestedJet<depth> make(double x, double const* slopes) {
      NestedJet<depth> result;
      result.a = JetSeed<depth - 1>::make(x, slopes);
      result.v[0] = constant<NestedJet<depth - 1>>(slopes[depth - 1]);
      return result;
    }
  };

  template <>
  struct JetSeed<0> {
    static double make(double x, double const*) {
      return x;
    }
  };

  template <int depth>
  struct JetMixedPart {
    // Coefficient of e_1 * ... * e_depth.
    static double get(NestedJet<depth> const& x) {
      return JetMixedPart<depth - 1>::get(x.v[0]);
    }
  };

  template <>
  struct JetMixedPart<0> {
    static double get(double x) {
      return x;
    }
  };
}  // namespace hypersens
