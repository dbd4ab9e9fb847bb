// oracle.cpp — sorted-order scan, fractional certificate and class-suffix knapsack

#include "oracle/oracle.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <sstream>
#include <utility>

#include "core/error.hpp"
#include "core/log.hpp"

namespace oracle {

using engine::ProblemKind;

std::string Violation::describe() const {
    constexpr std::size_t kShown = 16;
    std::ostringstream oss;
    oss << (kind == ProblemKind::WeightRestriction ? "WR" : "WQ") << " violated by coalition {";
    for (std::size_t i = 0; i < coalition.parties.size() && i < kShown; ++i) {
        oss << (i ? ", " : "") << coalition.parties[i];
    }
    if (coalition.parties.size() > kShown) oss << ", ... (+" << coalition.parties.size() - kShown << " more)";
    oss << "}: weight share " << coalition.weight_share;
    if (kind == ProblemKind::WeightRestriction) {
        oss << " < tw=" << thresholds.tw << " but ticket share " << coalition.ticket_share << " >= tn=" << thresholds.tn;
    } else {
        oss << " >= tw=" << thresholds.tw << " but ticket share " << coalition.ticket_share << " < tn=" << thresholds.tn;
    }
    return oss.str();
}

ConstraintOracle::ConstraintOracle(const model::WeightModel& model, engine::Thresholds th,
                                   ProblemKind kind, Mode mode)
    : model_(model), th_(std::move(th)), kind_(kind), mode_(mode) {
    engine::validate_thresholds(th_);
    const core::Integer& W = model_.scaled_total();
    if (kind_ == ProblemKind::WeightRestriction) {
        // largest scaled weight strictly below tw*W
        capacity_ = core::ceil(core::Rational(th_.tw * W)) - 1;
    } else {
        // complements of WQ coalitions weigh at most (1-tw)*W
        capacity_ = core::floor(core::Rational((1 - th_.tw) * W));
    }
}

bool ConstraintOracle::constrains(const core::Rational& weight_share) const {
    return kind_ == ProblemKind::WeightRestriction ? weight_share < th_.tw : weight_share >= th_.tw;
}

ticket_t ConstraintOracle::ticket_bound(ticket_t total) const {
    const core::Integer need = core::ceil(core::Rational(th_.tn * core::to_integer(total)));
    const ticket_t q = core::to_ticket(need).value_or(total);
    return kind_ == ProblemKind::WeightRestriction ? q - 1 : q;
}

bool ConstraintOracle::satisfies(ticket_t tickets, ticket_t total) const {
    const ticket_t bound = ticket_bound(total);
    return kind_ == ProblemKind::WeightRestriction ? tickets <= bound : tickets >= bound;
}

// Smallest ticket count the knapsack side must reach for a violation, out of
// `held` tickets measured against `total`: WR the coalition itself
// (ceil(tn*N)), WQ its complement (held - ceil(tn*N) + 1).
ticket_t ConstraintOracle::knapsack_target(ticket_t held, ticket_t total) const {
    const ticket_t bound = ticket_bound(total);
    if (kind_ == ProblemKind::WeightRestriction) return bound + 1;
    return held >= bound ? held - bound + 1 : 0;
}

void ConstraintOracle::check_shape(const engine::Assignment& tickets) const {
    if (tickets.size() != model_.size()) {
        throw core::SolverError(core::ErrorKind::InvalidAssignment,
                                "assignment has " + std::to_string(tickets.size()) + " entries for " +
                                    std::to_string(model_.size()) + " parties");
    }
    if (engine::total_of(tickets) == 0) {
        throw core::SolverError(core::ErrorKind::InvalidAssignment, "assignment allocates no tickets");
    }
}

std::vector<std::size_t> ConstraintOracle::complement(const std::vector<std::size_t>& parties) const {
    std::vector<char> in(model_.size(), 0);
    for (auto p : parties) in[p] = 1;
    std::vector<std::size_t> out;
    out.reserve(model_.size() - parties.size());
    for (std::size_t p = 0; p < model_.size(); ++p) if (!in[p]) out.push_back(p);
    return out;
}

Coalition ConstraintOracle::make_coalition(std::vector<std::size_t> parties, const engine::Assignment& tickets) const {
    std::sort(parties.begin(), parties.end());
    Coalition c;
    core::Rational weight(0);
    for (auto p : parties) {
        weight += model_.weight(p);
        c.tickets += tickets[p];
    }
    c.weight_share = model_.share_of(weight);
    c.ticket_share = core::make_rational(core::to_integer(c.tickets), core::to_integer(engine::total_of(tickets)));
    c.parties = std::move(parties);
    return c;
}

Violation ConstraintOracle::make_violation(std::vector<std::size_t> parties, const engine::Assignment& tickets) const {
    return Violation{kind_, th_, make_coalition(std::move(parties), tickets)};
}

std::optional<Violation> ConstraintOracle::scan_critical(const engine::Assignment& tickets) const {
    check_shape(tickets);
    if (auto parties = scan_parties(tickets, engine::total_of(tickets))) {
        return make_violation(std::move(*parties), tickets);
    }
    return std::nullopt;
}

std::optional<std::vector<std::size_t>> ConstraintOracle::scan_parties(const engine::Assignment& tickets,
                                                                        ticket_t total) const {
    const std::size_t n = model_.size();

    ticket_t held = 0;
    if (kind_ == ProblemKind::WeightRestriction) {
        // Lightest parties first; shares only grow, so stop at the first
        // suffix that is no longer below tw.
        for (std::size_t k = 1; k <= n; ++k) {
            if (!constrains(model_.weight_share_of_bottom_k(k))) break;
            held += tickets[model_.party_at(n - k)];
            if (!satisfies(held, total)) {
                std::vector<std::size_t> parties;
                for (std::size_t pos = n - k; pos < n; ++pos) parties.push_back(model_.party_at(pos));
                return parties;
            }
        }
    } else {
        // Heaviest parties first; every prefix from the first one reaching tw is constrained.
        for (std::size_t k = 1; k <= n; ++k) {
            held += tickets[model_.party_at(k - 1)];
            if (!constrains(model_.weight_share_of_top_k(k))) continue;
            if (!satisfies(held, total)) {
                std::vector<std::size_t> parties;
                for (std::size_t pos = 0; pos < k; ++pos) parties.push_back(model_.party_at(pos));
                return parties;
            }
        }
    }
    return std::nullopt;
}

bool ConstraintOracle::certify_linear(const engine::Assignment& tickets) const {
    check_shape(tickets);
    return certify_at(tickets, engine::total_of(tickets));
}

bool ConstraintOracle::certify_at(const engine::Assignment& tickets, ticket_t total) const {
    const ticket_t target = knapsack_target(engine::total_of(tickets), total);

    std::vector<std::size_t> items;
    for (std::size_t pos = 0; pos < model_.size(); ++pos) {
        const std::size_t p = model_.party_at(pos);
        if (tickets[p] > 0) items.push_back(p);
    }
    // Descending tickets per unit of weight; stable keeps canonical order on ties.
    std::stable_sort(items.begin(), items.end(), [&](std::size_t a, std::size_t b) {
        return core::to_integer(tickets[a]) * model_.scaled_weight(b) >
               core::to_integer(tickets[b]) * model_.scaled_weight(a);
    });

    core::Integer room = capacity_;
    core::Rational profit(0);
    for (auto p : items) {
        const core::Integer& w = model_.scaled_weight(p);
        if (w <= room) {
            room -= w;
            profit += core::to_rational(tickets[p]);
        } else {
            if (sgn(room) > 0) profit += core::Rational(core::to_rational(tickets[p]) * core::make_rational(room, w));
            break;
        }
    }
    return profit < core::to_rational(target);
}

std::optional<std::vector<std::size_t>> ConstraintOracle::knapsack_witness(const engine::Assignment& tickets,
                                                                           ticket_t total) const {
    const ticket_t held = engine::total_of(tickets);
    const ticket_t target = knapsack_target(held, total);
    if (target > held) return std::nullopt;

    // Ticket classes; members kept in canonical order so the lightest are last.
    std::map<ticket_t, std::vector<std::size_t>> by_value;
    for (std::size_t pos = 0; pos < model_.size(); ++pos) {
        const std::size_t p = model_.party_at(pos);
        if (tickets[p] > 0) by_value[tickets[p]].push_back(p);
    }

    const core::Integer inf = model_.scaled_total() + 1;
    const std::size_t Q = static_cast<std::size_t>(target);

    // dp[q]: lightest scaled weight of a coalition holding >= q tickets.
    std::vector<core::Integer> dp(Q + 1, inf);
    dp[0] = 0;
    std::vector<std::pair<ticket_t, const std::vector<std::size_t>*>> classes;
    std::vector<std::vector<std::uint32_t>> choice;
    classes.reserve(by_value.size());
    choice.reserve(by_value.size());

    for (const auto& [value, members] : by_value) {
        const std::size_t m = members.size();
        // light[k]: weight of the k lightest members of the class
        std::vector<core::Integer> light(m + 1);
        light[0] = 0;
        for (std::size_t k = 1; k <= m; ++k) light[k] = light[k - 1] + model_.scaled_weight(members[m - k]);

        std::vector<core::Integer> next = dp;
        std::vector<std::uint32_t> pick(Q + 1, 0);
        core::Integer cand;
        for (std::size_t q = 1; q <= Q; ++q) {
            for (std::size_t k = 1; k <= m; ++k) {
                const ticket_t got = static_cast<ticket_t>(k) * value;
                const std::size_t prev = got >= q ? 0 : q - static_cast<std::size_t>(got);
                if (dp[prev] < inf) {
                    cand = dp[prev] + light[k];
                    if (cand < next[q]) { next[q] = cand; pick[q] = static_cast<std::uint32_t>(k); }
                }
                if (got >= q) break; // more members only add weight
            }
        }
        dp = std::move(next);
        classes.emplace_back(value, &members);
        choice.push_back(std::move(pick));
    }

    if (!(dp[Q] <= capacity_)) return std::nullopt;

    std::vector<std::size_t> chosen;
    std::size_t q = Q;
    for (std::size_t c = classes.size(); c-- > 0;) {
        const std::size_t k = choice[c][q];
        const auto& members = *classes[c].second;
        for (std::size_t i = 0; i < k; ++i) chosen.push_back(members[members.size() - 1 - i]);
        const ticket_t got = static_cast<ticket_t>(k) * classes[c].first;
        q = got >= q ? 0 : q - static_cast<std::size_t>(got);
    }
    CORE_ASSERT_H(q == 0, "knapsack reconstruction did not reach its ticket target");

    core::log::debug("knapsack witness: ", chosen.size(), " parties reach ", Q,
                     " tickets within scaled weight ", capacity_);
    return kind_ == ProblemKind::WeightRestriction ? chosen : complement(chosen);
}

std::optional<Violation> ConstraintOracle::find_violation(const engine::Assignment& tickets) const {
    if (auto v = scan_critical(tickets)) return v;
    const ticket_t total = engine::total_of(tickets);
    if (certify_at(tickets, total)) return std::nullopt;
    if (auto w = knapsack_witness(tickets, total)) return make_violation(std::move(*w), tickets);
    return std::nullopt;
}

bool ConstraintOracle::accepts(const engine::Assignment& tickets) const {
    if (scan_critical(tickets)) return false;
    const ticket_t total = engine::total_of(tickets);
    if (certify_at(tickets, total)) return true;
    return mode_ == Mode::Exact && !knapsack_witness(tickets, total);
}

bool ConstraintOracle::violated_at(const engine::Assignment& bound, ticket_t total) const {
    if (bound.size() != model_.size()) {
        throw core::SolverError(core::ErrorKind::InvalidAssignment,
                                "bound has " + std::to_string(bound.size()) + " entries for " +
                                    std::to_string(model_.size()) + " parties");
    }
    if (scan_parties(bound, total)) return true;
    if (certify_at(bound, total)) return false;
    return knapsack_witness(bound, total).has_value();
}

} // namespace oracle
