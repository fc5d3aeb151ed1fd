#include "hypersens/details/taylor/derivative_term.hpp"
#include "hypersens/details/taylor/mixed_partial.hpp"
#include "hypersens/details/taylor/term_algebra.hpp"

#include "hypersens/details/autodiff/autodiff_objective.hpp"
#include "hypersens/details/linalg/factorization.hpp"
#include "hypersens/details/errors.hpp"
#include "hypersens_tests/objectives.hpp"

#include <doctest/doctest.h>

#include <algorithm>

namespace hypersens {
  using Eigen::VectorXd;

  static auto findTerm(
    TermList const& terms, int eps_order, std::vector<int> const& eta_orders) {
    return std::find_if(terms.begin(), terms.end(), [&](auto const& term) {
      return term.epsOrder() == eps_order && term.etaOrders() == eta_orders;
    });
  }

  TEST_CASE("Derivative term construction") {
    auto objective =
      makeAutoDiffObjective(SquaredDistanceObjective {1}, 1, 1);
    auto table = buildMixedPartialTable(objective, 3);

    THEN("Consistent terms are accepted") {
      auto term = DerivativeTerm(0, {0, 1}, 2.0, table);
      CHECK(term.order() == 2);
      CHECK(term.totalEtaOrder() == 1);
      CHECK(term.hasTopEtaOrder());
      CHECK(term.toString() == "Order: 2\t2 * eta[0, 1] * eps[0]");
    }

    THEN("Inconsistent orders are rejected") {
      CHECK_THROWS_AS(DerivativeTerm(1, {1}, 1.0, table), ConstructionError);
      CHECK_THROWS_AS(DerivativeTerm(0, {1, 1}, 1.0, table), ConstructionError);
      CHECK_THROWS_AS(DerivativeTerm(2, {}, 1.0, table), ConstructionError);
    }

    THEN("Negative orders are rejected") {
      CHECK_THROWS_AS(DerivativeTerm(-1, {}, 1.0, table), ConstructionError);
      CHECK_THROWS_AS(
        DerivativeTerm(3, {-1, 0}, 1.0, table), ConstructionError);
    }

    THEN("A missing or undersized table is rejected") {
      CHECK_THROWS_AS(DerivativeTerm(1, {0}, 1.0, nullptr), ConstructionError);

      auto small_table = buildMixedPartialTable(objective, 1);
      CHECK_THROWS_AS(
        DerivativeTerm(2, {0, 0}, 1.0, small_table), ConstructionError);
    }
  }

  TEST_CASE("Derivative term differentiation") {
    auto objective =
      makeAutoDiffObjective(SquaredDistanceObjective {1}, 1, 1);
    auto table = buildMixedPartialTable(objective, 4);

    GIVEN("The order-1 term multiplying d eta / d eps") {
      auto term = DerivativeTerm(0, {1}, 3.0, table);
      auto derivatives = term.differentiate();

      THEN("Chain and product rules yield three terms of order 2") {
        REQUIRE(derivatives.size() == 3);
        for (auto const& derivative : derivatives)
          CHECK(derivative.order() == 2);

        auto direct_eps = findTerm(derivatives, 1, {1, 0});
        auto direct_eta = findTerm(derivatives, 0, {2, 0});
        auto moved = findTerm(derivatives, 0, {0, 1});
        REQUIRE(direct_eps != derivatives.end());
        REQUIRE(direct_eta != derivatives.end());
        REQUIRE(moved != derivatives.end());
        CHECK(direct_eps->prefactor() == 3.0);
        CHECK(direct_eta->prefactor() == 3.0);
        CHECK(moved->prefactor() == 3.0);
      }
    }

    GIVEN("A term with a repeated eta derivative factor") {
      auto term = DerivativeTerm(0, {2, 0}, 1.0, table);
      auto derivatives = term.differentiate();

      THEN("Moving one factor is weighted by its multiplicity") {
        auto moved = findTerm(derivatives, 0, {1, 1, 0});
        REQUIRE(moved != derivatives.end());
        CHECK(moved->prefactor() == 2.0);
      }
    }

    GIVEN("The order-1 term without eta factors") {
      auto term = DerivativeTerm(1, {0}, 1.0, table);
      auto derivatives = term.differentiate();

      THEN("Only the direct eps and eta terms appear") {
        CHECK(derivatives.size() == 2);
        CHECK(findTerm(derivatives, 2, {0, 0}) != derivatives.end());
        CHECK(findTerm(derivatives, 1, {1, 0}) != derivatives.end());
      }
    }
  }

  TEST_CASE("Derivative term combination") {
    auto objective =
      makeAutoDiffObjective(SquaredDistanceObjective {1}, 1, 1);
    auto table = buildMixedPartialTable(objective, 2);

    auto a = DerivativeTerm(1, {1, 0}, 1.5, table);
    auto b = DerivativeTerm(1, {1, 0}, 0.5, table);
    auto c = DerivativeTerm(0, {2, 0}, 1.0, table);

    THEN("Similar terms sum their prefactors") {
      CHECK(a.checkSimilarity(b));
      CHECK(a.combineWith(b).prefactor() == 2.0);
    }

    THEN("Dissimilar terms cannot be combined") {
      CHECK_FALSE(a.checkSimilarity(c));
      CHECK_THROWS_AS(a.combineWith(c), ConstructionError);
    }
  }

  TEST_CASE("Derivative term evaluation") {
    // grad_eta f = A eta + B eps, so d/deps grad = B deps and the eta term
    // is A eta' with eta' = -A^{-1} B deps.
    Eigen::MatrixXd A(2, 2);
    A << 2.0, 0.5, 0.5, 1.0;
    Eigen::MatrixXd B(2, 1);
    B << 1.0, -1.0;

    auto objective = makeAutoDiffObjective(QuadraticObjective {A, B}, 2, 1);
    auto table = buildMixedPartialTable(objective, 2);
    auto arena = TermArena {
      HessianFactorization::Create(A),
      {baseTerms(table)},
    };

    auto eta0 = VectorXd::Zero(2).eval();
    auto eps0 = VectorXd::Zero(1).eval();
    auto deps = VectorXd::Constant(1, 0.5).eval();

    THEN("The direct eps term is B deps") {
      auto term = DerivativeTerm(1, {0}, 2.0, table);
      VectorXd expected = 2.0 * B * deps;
      CHECK(term.evaluate(arena, eta0, eps0, deps).isApprox(expected));
    }

    THEN("The eta term is A eta'") {
      auto term = DerivativeTerm(0, {1}, 1.0, table);
      VectorXd eta_1 = -A.llt().solve(B * deps);
      VectorXd expected = A * eta_1;
      CHECK(term.evaluate(arena, eta0, eps0, deps).isApprox(expected));
    }
  }
}  // namespace hypersens
