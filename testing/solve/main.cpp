// solve_tests.cpp
// Engine facade: examples, determinism, input ordering and debug re-verification.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstddef>
#include <numeric>
#include <vector>

#include "engine/solve.hpp"
#include "../test_support.hpp"

using engine::Assignment;
using engine::ProblemKind;
using testutil::kind_of;
using testutil::R;
using testutil::weights;

TEST_CASE("examples") {
    const auto wr = engine::solve(weights({1L, 1L, 1L, 1L}), {R("1/3"), R("1/2")}, ProblemKind::WeightRestriction);
    CHECK(wr.total == 4);
    CHECK(wr.tickets == Assignment{1, 1, 1, 1});

    const auto wq = engine::solve(weights({"0.5", "0.3", "0.2"}), {R("1/3"), R("1/2")},
                                  ProblemKind::WeightQualification);
    CHECK(wq.total == 4);
    CHECK(wq.tickets == Assignment{2, 1, 1});
}

TEST_CASE("sum-only view") {
    CHECK(engine::solve_total(weights({10L, 5L, 3L, 1L, 1L}), {R("1/4"), R("1/3")},
                              ProblemKind::WeightRestriction) == 7);
}

TEST_CASE("repeated solves are identical") {
    const auto w = weights({"13.5", "7", "7", "2.25", "1", "0.5", "0.5"});
    const engine::Thresholds th{R("1/3"), R("3/8")};
    const auto first = engine::solve(w, th, ProblemKind::WeightRestriction);
    for (int i = 0; i < 5; ++i) {
        const auto again = engine::solve(w, th, ProblemKind::WeightRestriction);
        CHECK(again.total == first.total);
        CHECK(again.tickets == first.tickets);
    }
}

TEST_CASE("permuting the input permutes the assignment") {
    const auto w = weights({10L, 5L, 3L, 1L, 2L});
    const std::vector<std::size_t> perm{3, 0, 4, 2, 1};
    std::vector<core::Rational> shuffled;
    for (auto p : perm) shuffled.push_back(w[p]);

    const engine::Thresholds th{R("1/3"), R("1/2")};
    const auto a = engine::solve(w, th, ProblemKind::WeightRestriction);
    const auto b = engine::solve(shuffled, th, ProblemKind::WeightRestriction);
    CHECK(a.total == b.total);
    for (std::size_t i = 0; i < perm.size(); ++i) CHECK(b.tickets[i] == a.tickets[perm[i]]);
}

TEST_CASE("debug mode re-verifies without changing the result") {
    const auto w = weights({40L, 30L, 20L, 10L});
    const engine::Thresholds th{R("1/3"), R("1/2")};
    engine::SolveOptions debug;
    debug.debug = true;
    const auto plain = engine::solve(w, th, ProblemKind::WeightRestriction);
    const auto checked = engine::solve(w, th, ProblemKind::WeightRestriction, debug);
    CHECK(plain.total == checked.total);
    CHECK(plain.tickets == checked.tickets);
}

TEST_CASE("input errors surface as typed failures") {
    const engine::Thresholds th{R("1/3"), R("1/2")};
    CHECK(kind_of([&] { engine::solve({}, th, ProblemKind::WeightRestriction); }) == core::ErrorKind::EmptyInput);
    CHECK(kind_of([&] { engine::solve(weights({1L, 0L}), th, ProblemKind::WeightRestriction); }) ==
          core::ErrorKind::NonPositiveWeight);
    CHECK(kind_of([&] { engine::solve(weights({1L, 2L}), {R("1"), R("1/2")}, ProblemKind::WeightRestriction); }) ==
          core::ErrorKind::InfeasibleThresholds);
    CHECK(kind_of([&] { engine::solve(weights({1L, 2L}), {R("1/3"), R("0")}, ProblemKind::WeightQualification); }) ==
          core::ErrorKind::InfeasibleThresholds);
}

TEST_CASE("larger instance stays within its bound") {
    std::vector<core::Rational> w;
    for (long i = 1; i <= 40; ++i) w.emplace_back((i * i) % 97 + 1);
    const engine::Thresholds th{R("1/4"), R("1/3")};
    engine::SolveOptions debug;
    debug.debug = true;
    const auto s = engine::solve(w, th, ProblemKind::WeightRestriction, debug);
    CHECK(std::accumulate(s.tickets.begin(), s.tickets.end(), ticket_t{0}) == s.total);
    CHECK(s.total >= w.size());
}
