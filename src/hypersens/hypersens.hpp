#pragma once

#include "hypersens/details/config.hpp"
#include "hypersens/details/errors.hpp"
#include "hypersens/details/logging.hpp"
#include "hypersens/details/type.hpp"

#include "hypersens/details/autodiff/autodiff_objective.hpp"
#include "hypersens/details/autodiff/differentiator.hpp"
#include "hypersens/details/linear/folded_sensitivity.hpp"
#include "hypersens/details/linear/sensitivity.hpp"
#include "hypersens/details/pattern/flattened_objective.hpp"
#include "hypersens/details/pattern/numeric_pattern.hpp"
#include "hypersens/details/taylor/expansion.hpp"

namespace hypersens {
  /*
   * Entry points:
   *
   *   - LinearSensitivitySolver: d eta / d eps at a verified optimum, and
   *     linear extrapolation of the optimum in eps.
   *   - FoldedLinearSensitivity: the same on patterned (bounded) parameters.
   *   - TaylorExpansionEngine: every derivative d^k eta / d eps^k up to
   *     kMaxTaylorOrder, and the truncated Taylor series of eta(eps).
   *
   * Objectives are Ceres-style autodiff functors wrapped by
   * makeAutoDiffObjective(), or by makeFlattenedObjective() when written on
   * folded values.
   */
}  // namespace hypersens
