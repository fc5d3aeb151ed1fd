#include "hypersens/details/pattern/numeric_pattern.hpp"
#include "hypersens/details/errors.hpp"
#include "hypersens/details/logging.hpp"

#include <spdlog/spdlog.h>

namespace hypersens {
  using Eigen::ArrayXd;
  using Eigen::VectorXd;

  NumericVectorPattern::NumericVectorPattern(
    int size, double lb, double ub, bool default_validate)
      : _size(size), _lb(lb), _ub(ub), _default_validate(default_validate) {
    if (size < 0)
      throw ConstructionError("Pattern size must be nonnegative");
    if (!(lb < ub)) {
      __logger__->error("Invalid pattern bounds: lb={}, ub={}", lb, ub);
      throw ConstructionError(
        "Upper bound must strictly exceed the lower bound");
    }
  }

  int NumericVectorPattern::size() const {
    return _size;
  }

  double NumericVectorPattern::lowerBound() const {
    return _lb;
  }

  double NumericVectorPattern::upperBound() const {
    return _ub;
  }

  int NumericVectorPattern::flatLength(bool) const {
    return _size;
  }

  static void checkLength(int actual, int expected) {
    if (actual == expected)
      return;
    __logger__->error(
      "Wrong size for numeric vector. Expected {}, got {}", expected, actual);
    throw DimensionMismatch("Wrong size for numeric vector");
  }

  bool NumericVectorPattern::validateFolded(
    VectorXd const& folded, std::optional<bool> validate_values) const {
    if (folded.size() != _size)
      return false;
    if (!validate_values.value_or(_default_validate))
      return true;
    return (folded.array() >= _lb).all() && (folded.array() <= _ub).all();
  }

  static void checkBounds(
    NumericVectorPattern const& pattern, VectorXd const& folded,
    std::optional<bool> validate_values) {
    if (pattern.validateFolded(folded, validate_values))
      return;
    __logger__->error(
      "Value outside of bounds [{}, {}]", pattern.lowerBound(),
      pattern.upperBound());
    throw ParameterBoundsViolation("Value outside of the pattern bounds");
  }

  VectorXd NumericVectorPattern::flatten(
    VectorXd const& folded, bool free,
    std::optional<bool> validate_values) const {
    checkLength(folded.size(), _size);
    if (!free) {
      checkBounds(*this, folded, validate_values);
      return folded;
    }

    // The free parameterization is undefined outside the bounds.
    checkBounds(*this, folded, true);

    bool has_lb = std::isfinite(_lb);
    bool has_ub = std::isfinite(_ub);
    ArrayXd x = folded.array();
    if (has_lb && has_ub)
      return ((x - _lb).log() - (_ub - x).log()).matrix();
    if (has_lb)
      return (x - _lb).log().matrix();
    if (has_ub)
      return (-(_ub - x).log()).matrix();
    return folded;
  }

  VectorXd NumericVectorPattern::fold(
    VectorXd const& flat, bool free,
    std::optional<bool> validate_values) const {
    checkLength(flat.size(), flatLength(free));
    if (free)
      return fold<double>(flat, true);

    checkBounds(*this, flat, validate_values);
    return flat;
  }
}  // namespace hypersens
