// Brute-force cross-check of the coalition oracle and the allocator.
// Every coalition of small random instances is enumerated (2^n subsets) and
// compared against the oracle's verdict, its witness, the linear certificate
// and the solver's output. Work is spread with a simple thread fan-out.

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <numeric>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "alloc/allocator.hpp"
#include "core/error.hpp"
#include "core/rational.hpp"
#include "engine/problem.hpp"
#include "model/weights.hpp"
#include "oracle/oracle.hpp"

using std::size_t;
using engine::Assignment;
using engine::ProblemKind;

namespace {

struct Instance {
    std::vector<core::Rational> weights;
    engine::Thresholds th;
    ProblemKind kind;
    Assignment tickets;  // arbitrary, possibly non-monotone
};

std::mutex report_mutex;

void report(const std::string& what, const Instance& in) {
    std::lock_guard<std::mutex> lock(report_mutex);
    std::cerr << what << ": " << engine::to_string(in.kind) << " tw=" << in.th.tw << " tn=" << in.th.tn << " w=[";
    for (size_t i = 0; i < in.weights.size(); ++i) std::cerr << (i ? " " : "") << in.weights[i];
    std::cerr << "] t=[";
    for (size_t i = 0; i < in.tickets.size(); ++i) std::cerr << (i ? " " : "") << in.tickets[i];
    std::cerr << "]\n";
}

// Fractions p/q with 2 <= q <= 8 strictly inside (0, 1).
core::Rational random_threshold(std::mt19937_64& rng) {
    std::uniform_int_distribution<long> qd(2, 8);
    const long q = qd(rng);
    std::uniform_int_distribution<long> pd(1, q - 1);
    return core::make_rational(pd(rng), q);
}

Instance random_instance(std::uint64_t seed, size_t max_parties) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<size_t> nd(1, max_parties);
    std::uniform_int_distribution<long> wd(1, 12);  // small range, so ties are common
    std::uniform_int_distribution<ticket_t> td(0, 5);

    Instance in;
    const size_t n = nd(rng);
    for (size_t i = 0; i < n; ++i) in.weights.emplace_back(wd(rng));
    in.kind = (rng() & 1) ? ProblemKind::WeightQualification : ProblemKind::WeightRestriction;
    in.th = {random_threshold(rng), random_threshold(rng)};
    for (size_t i = 0; i < n; ++i) in.tickets.push_back(td(rng));
    if (engine::total_of(in.tickets) == 0) in.tickets[0] = 1;
    return in;
}

// Does the coalition given by `mask` break the constraint?
bool violates(const Instance& in, const Assignment& t, std::uint32_t mask) {
    core::Rational w_total(0), w_in(0);
    ticket_t t_total = 0, t_in = 0;
    for (size_t i = 0; i < in.weights.size(); ++i) {
        w_total += in.weights[i];
        t_total += t[i];
        if (mask >> i & 1u) { w_in += in.weights[i]; t_in += t[i]; }
    }
    const core::Rational ws = w_in / w_total;
    const core::Rational ts = core::to_rational(t_in) / core::to_rational(t_total);
    if (in.kind == ProblemKind::WeightRestriction) return ws < in.th.tw && ts >= in.th.tn;
    return ws >= in.th.tw && ts < in.th.tn;
}

std::optional<std::uint32_t> brute_violation(const Instance& in, const Assignment& t) {
    const std::uint32_t space = 1u << in.weights.size();
    for (std::uint32_t mask = 1; mask < space; ++mask) {
        if (violates(in, t, mask)) return mask;
    }
    return std::nullopt;
}

std::uint32_t mask_of(const std::vector<size_t>& parties) {
    std::uint32_t mask = 0;
    for (size_t p : parties) mask |= 1u << p;
    return mask;
}

// First assignment with total in [1, limit) that keeps weight order (equal
// weights share a count), gives every party at least `floor` and survives
// enumeration.
std::optional<Assignment> ordered_assignment_below(const Instance& in, ticket_t floor, ticket_t limit) {
    const size_t n = in.weights.size();
    std::vector<size_t> idx(n);
    std::iota(idx.begin(), idx.end(), size_t{0});
    std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b) { return in.weights[a] > in.weights[b]; });
    std::vector<std::vector<size_t>> groups;
    for (size_t p : idx) {
        if (groups.empty() || in.weights[groups.back().front()] != in.weights[p]) groups.emplace_back();
        groups.back().push_back(p);
    }

    Assignment t(n, 0);
    std::optional<Assignment> hit;
    std::function<void(size_t, ticket_t, ticket_t)> place = [&](size_t g, ticket_t cap, ticket_t used) {
        if (g == groups.size()) {
            if (used > 0 && !brute_violation(in, t)) hit = t;
            return;
        }
        for (ticket_t x = floor; x <= cap; ++x) {
            const ticket_t next = used + x * static_cast<ticket_t>(groups[g].size());
            if (next >= limit) break;
            for (size_t p : groups[g]) t[p] = x;
            place(g + 1, x, next);
            if (hit) return;
        }
    };
    place(0, limit, 0);
    return hit;
}

// Oracle verdict, witness and linear certificate on arbitrary assignments.
bool test_oracle(size_t cases, size_t max_parties) {
    std::atomic<bool> ok{true};
    const size_t threads = std::max(1u, std::thread::hardware_concurrency());
    auto worker = [&](size_t tid) {
        for (size_t c = tid; c < cases; c += threads) {
            const Instance in = random_instance(0xC0A1u + c, max_parties);
            const model::WeightModel m(in.weights);
            const oracle::ConstraintOracle exact(m, in.th, in.kind);
            const oracle::ConstraintOracle linear(m, in.th, in.kind, oracle::Mode::Linear);

            const auto slow = brute_violation(in, in.tickets);
            const auto fast = exact.find_violation(in.tickets);
            if (slow.has_value() != fast.has_value()) {
                ok.store(false, std::memory_order_relaxed);
                report(slow ? "oracle missed a violation" : "oracle reported a false violation", in);
                return;
            }
            if (fast && !violates(in, in.tickets, mask_of(fast->coalition.parties))) {
                ok.store(false, std::memory_order_relaxed);
                report("oracle witness is not a violation", in);
                return;
            }
            if (slow && linear.certify_linear(in.tickets)) {
                ok.store(false, std::memory_order_relaxed);
                report("linear certificate accepted an invalid assignment", in);
                return;
            }
        }
    };
    std::vector<std::thread> pool;
    for (size_t t = 0; t < threads; ++t) pool.emplace_back(worker, t);
    for (auto& th : pool) th.join();
    return ok.load();
}

// Solver output: valid under enumeration, ordered by weight, and, on small
// instances, nothing ordered by weight is valid with fewer tickets.
bool test_solver(size_t cases, size_t max_parties) {
    constexpr size_t kExhaustiveParties = 6;
    constexpr ticket_t kExhaustiveTotal = 16;
    std::atomic<bool> ok{true};
    std::atomic<size_t> infeasible{0}, exhaustive{0};
    const size_t threads = std::max(1u, std::thread::hardware_concurrency());
    auto worker = [&](size_t tid) {
        for (size_t c = tid; c < cases; c += threads) {
            Instance in = random_instance(0x5017u + c, max_parties);
            engine::SolveOptions opts;
            opts.allow_zero_tickets = (c % 4 == 3);
            opts.max_scan_totals = 64;
            const ticket_t floor = opts.allow_zero_tickets ? 0 : 1;
            const model::WeightModel m(in.weights);
            const alloc::Allocator a(m, in.th, in.kind, opts);
            const bool small = in.weights.size() <= kExhaustiveParties;

            engine::Solution s;
            try {
                s = a.solve();
            } catch (const core::SolverError& e) {
                // Only thresholds without a closed-form bound may come up empty.
                if (e.kind() != core::ErrorKind::InfeasibleThresholds || engine::has_closed_form_bound(in.th, in.kind)) {
                    ok.store(false, std::memory_order_relaxed);
                    report(std::string("solver failed: ") + e.what(), in);
                    return;
                }
                // A partition argument must hold for every total.
                if (small && a.infeasibility() && ordered_assignment_below(in, floor, kExhaustiveTotal)) {
                    ok.store(false, std::memory_order_relaxed);
                    report("thresholds rejected although an assignment exists", in);
                    return;
                }
                infeasible.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            in.tickets = s.tickets;
            if (engine::total_of(s.tickets) != s.total || brute_violation(in, s.tickets)) {
                ok.store(false, std::memory_order_relaxed);
                report("solver returned an invalid assignment", in);
                return;
            }
            for (size_t i = 0; i < in.weights.size(); ++i) {
                for (size_t j = 0; j < in.weights.size(); ++j) {
                    if (in.weights[i] >= in.weights[j] && s.tickets[i] < s.tickets[j]) {
                        ok.store(false, std::memory_order_relaxed);
                        report("solver returned tickets out of weight order", in);
                        return;
                    }
                }
            }
            if (small && s.total <= kExhaustiveTotal) {
                if (!s.minimal) {
                    ok.store(false, std::memory_order_relaxed);
                    report("search budget ran out on a small instance", in);
                    return;
                }
                if (auto smaller = ordered_assignment_below(in, floor, s.total)) {
                    in.tickets = *smaller;
                    ok.store(false, std::memory_order_relaxed);
                    report("solver total is not minimal; valid with fewer tickets", in);
                    return;
                }
                exhaustive.fetch_add(1, std::memory_order_relaxed);
            }
        }
    };
    std::vector<std::thread> pool;
    for (size_t t = 0; t < threads; ++t) pool.emplace_back(worker, t);
    for (auto& th : pool) th.join();
    std::cout << "solver: " << infeasible.load() << " of " << cases << " instances without an assignment, "
              << exhaustive.load() << " checked minimal by enumeration\n";
    return ok.load();
}

} // namespace

int main() {
    bool ok = true;
    for (size_t n = 1; n <= 12; ++n) ok &= test_oracle(n <= 10 ? 400 : 120, n);
    ok &= test_solver(600, 8);
    std::cout << (ok ? "ALL TESTS PASSED\n" : "TESTS FAILED\n");
    return ok ? 0 : 1;
}
