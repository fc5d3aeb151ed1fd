#include "hypersens/details/taylor/expansion.hpp"

#include "hypersens/details/autodiff/autodiff_objective.hpp"
#include "hypersens/details/errors.hpp"
#include "hypersens_tests/objectives.hpp"

#include <doctest/doctest.h>

#include <cmath>

namespace hypersens {
  using Eigen::MatrixXd;
  using Eigen::VectorXd;

  TEST_CASE("Taylor expansion of a scalar squared distance") {
    auto objective =
      makeAutoDiffObjective(SquaredDistanceObjective {1}, 1, 1);
    auto zero = VectorXd::Zero(1).eval();
    auto deps = VectorXd::Ones(1).eval();

    auto engine = TaylorExpansionEngine::Create(objective, zero, zero, 2);

    THEN("The Hessian is one and eta follows eps") {
      CHECK(engine->hessian()(0, 0) == doctest::Approx(1.0));
      auto eta_1 = engine->evaluateOrderDerivative(deps, 1);
      auto eta_2 = engine->evaluateOrderDerivative(deps, 2);
      CHECK(eta_1(0) == doctest::Approx(1.0));
      CHECK(eta_2(0) == doctest::Approx(0.0));
    }

    THEN("Orders outside of [1, K] are rejected") {
      CHECK_THROWS_AS(
        engine->evaluateOrderDerivative(deps, 0), OrderRangeError);
      CHECK_THROWS_AS(
        engine->evaluateOrderDerivative(deps, 3), OrderRangeError);
      CHECK_THROWS_AS(
        engine->evaluateTaylorSeries(deps, true, 3), OrderRangeError);
      CHECK_THROWS_AS(
        engine->evaluateTaylorSeries(deps, true, 0), OrderRangeError);
      CHECK_THROWS_AS(engine->termList(3), OrderRangeError);
    }

    THEN("A direction of the wrong size is rejected") {
      auto bad = VectorXd::Ones(2).eval();
      CHECK_THROWS_AS(
        engine->evaluateOrderDerivative(bad, 1), DimensionMismatch);
    }

    THEN("Anchored queries check the anchor") {
      auto moved = VectorXd::Constant(1, 0.1).eval();
      CHECK(
        engine->evaluateOrderDerivative(zero, zero, deps, 1)(0) ==
        doctest::Approx(1.0));
      CHECK_THROWS_AS(
        engine->evaluateOrderDerivative(moved, zero, deps, 1), AnchorMismatch);
      CHECK_THROWS_AS(
        engine->evaluateOrderDerivative(zero, moved, deps, 1), AnchorMismatch);
    }

    THEN("Term listings name every order") {
      auto description = engine->describeTerms();
      CHECK(description.find("Terms for order 1") != std::string::npos);
      CHECK(description.find("Terms for order 2") != std::string::npos);
      CHECK(
        engine->describeTerms(2).find("Terms for order 1") ==
        std::string::npos);
      CHECK_THROWS_AS(engine->describeTerms(5), OrderRangeError);
    }
  }

  TEST_CASE("Taylor expansion lifecycle") {
    auto objective =
      makeAutoDiffObjective(SquaredDistanceObjective {2}, 2, 2);
    auto engine = TaylorExpansionEngine(objective);

    auto x0 = VectorXd::Zero(2).eval();
    auto deps = VectorXd::Ones(2).eval();

    GIVEN("An engine without base values") {
      THEN("No order can be built") {
        CHECK_FALSE(engine.initialized());
        CHECK_THROWS_AS(engine.setOrder(1), UnsupportedConfiguration);
      }
    }

    GIVEN("An engine with base values but no order") {
      engine.setBaseValues(x0, x0);

      THEN("Derivatives are unavailable") {
        CHECK(engine.initialized());
        CHECK(engine.order() == 0);
        CHECK_THROWS_AS(
          engine.evaluateOrderDerivative(deps, 1), OrderRangeError);
      }

      THEN("Orders beyond the nesting depth are rejected") {
        CHECK_THROWS_AS(engine.setOrder(0), OrderRangeError);
        CHECK_THROWS_AS(engine.setOrder(kMaxTaylorOrder + 1), OrderRangeError);
      }

      WHEN("An order is declared and the anchor moves") {
        engine.setOrder(2);
        auto x1 = VectorXd::Constant(2, 0.5).eval();
        engine.setBaseValues(x1, x1);

        THEN("The expansion is rebuilt at the new anchor") {
          CHECK(engine.order() == 2);
          CHECK(engine.anchor().eta == x1);
          CHECK(engine.evaluateTaylorSeries(deps).isApprox(x1 + deps));
        }
      }

      WHEN("Results are held across a re-base") {
        engine.setOrder(2);
        auto const& anchor = engine.anchor();
        auto const& hessian = engine.hessian();
        auto const& terms = engine.termList(2);

        auto x1 = VectorXd::Constant(2, 0.5).eval();
        engine.setBaseValues(x1, x1, 3.0 * MatrixXd::Identity(2, 2));
        engine.setOrder(1);

        THEN("The held results keep their values") {
          CHECK(anchor.eta == x0);
          CHECK(hessian.isApprox(MatrixXd::Identity(2, 2)));
          CHECK(terms.size() == 4);
          CHECK(engine.hessian().isApprox(3.0 * MatrixXd::Identity(2, 2)));
        }
      }

      WHEN("Re-basing fails") {
        engine.setOrder(1);
        MatrixXd indefinite = -MatrixXd::Identity(2, 2);
        auto x1 = VectorXd::Constant(2, 0.5).eval();

        THEN("The previous expansion is kept") {
          CHECK_THROWS_AS(
            engine.setBaseValues(x1, x1, indefinite), LinearAlgebraError);
          CHECK(engine.anchor().eta == x0);
          CHECK(engine.evaluateTaylorSeries(deps).isApprox(deps));
        }
      }
    }
  }

  TEST_CASE("Taylor expansion of a quadratic objective") {
    MatrixXd A(3, 3);
    A << 3.0, 0.5, 0.0, 0.5, 2.0, -0.3, 0.0, -0.3, 1.0;
    MatrixXd B(3, 2);
    B << 1.0, 0.0, -0.5, 2.0, 0.0, 1.0;

    auto objective = makeAutoDiffObjective(QuadraticObjective {A, B}, 3, 2);
    auto eta0 = VectorXd::Zero(3).eval();
    auto eps0 = VectorXd::Zero(2).eval();
    auto engine = TaylorExpansionEngine::Create(objective, eta0, eps0, 3);

    auto deps = VectorXd::LinSpaced(2, 0.7, -1.2).eval();
    VectorXd expected = -A.llt().solve(B * deps);

    THEN("Orders above one vanish") {
      CHECK(engine->evaluateOrderDerivative(deps, 2).norm() < 1e-10);
      CHECK(engine->evaluateOrderDerivative(deps, 3).norm() < 1e-10);
    }

    THEN("The series reproduces the exact optimum") {
      CHECK(engine->evaluateTaylorSeries(deps).isApprox(expected));
      CHECK(engine->evaluateTaylorSeries(deps, true, 1).isApprox(expected));
    }

    WHEN("A precomputed Hessian is supplied") {
      auto supplied =
        TaylorExpansionEngine::Create(objective, eta0, eps0, 1, A);

      THEN("The same first derivative is obtained") {
        CHECK(supplied->hessian() == A);
        CHECK(supplied->evaluateOrderDerivative(deps, 1).isApprox(expected));
      }
    }

    WHEN("A precomputed Hessian of the wrong size is supplied") {
      MatrixXd bad = MatrixXd::Identity(2, 2);

      THEN("Construction is refused") {
        CHECK_THROWS_AS(
          TaylorExpansionEngine::Create(objective, eta0, eps0, 1, bad),
          DimensionMismatch);
      }
    }
  }

  TEST_CASE("Taylor expansion of the logarithm") {
    // exp(eta) = eps at the optimum, so eta(eps) = log(eps) with
    // eta^(k)(1) = (-1)^(k - 1) (k - 1)!.
    auto objective =
      makeAutoDiffObjective(CoupledExponentialObjective {1, 0.0}, 1, 1);
    auto eta0 = VectorXd::Zero(1).eval();
    auto eps0 = VectorXd::Ones(1).eval();
    auto deps = VectorXd::Ones(1).eval();

    auto engine =
      TaylorExpansionEngine::Create(objective, eta0, eps0, kMaxTaylorOrder);

    THEN("Every derivative matches the closed form") {
      double factorial = 1;
      for (int k = 1; k <= kMaxTaylorOrder; k++) {
        if (k > 1)
          factorial *= k - 1;
        double expected = (k % 2 == 1 ? 1. : -1.) * factorial;

        CAPTURE(k);
        CHECK(
          engine->evaluateOrderDerivative(deps, k)(0) ==
          doctest::Approx(expected));
      }
    }

    THEN("The series approximates log(1.1)") {
      auto step = VectorXd::Constant(1, 0.1).eval();
      auto eta = engine->evaluateTaylorSeries(step);
      CHECK(std::abs(eta(0) - std::log(1.1)) < 1e-6);

      auto shift = engine->evaluateTaylorSeries(step, false, 2);
      CHECK(shift(0) == doctest::Approx(0.1 - 0.005));
    }
  }
}  // namespace hypersens
