// problem.cpp

#include "engine/problem.hpp"

#include <cctype>
#include <numeric>
#include <string>

#include "core/error.hpp"

namespace engine {

const char* to_string(ProblemKind kind) noexcept {
    return kind == ProblemKind::WeightRestriction ? "WeightRestriction" : "WeightQualification";
}

std::optional<ProblemKind> parse_problem_kind(std::string_view text) noexcept {
    if (text.size() != 2) return std::nullopt;
    const char a = static_cast<char>(std::tolower(static_cast<unsigned char>(text[0])));
    const char b = static_cast<char>(std::tolower(static_cast<unsigned char>(text[1])));
    if (a != 'w') return std::nullopt;
    if (b == 'r') return ProblemKind::WeightRestriction;
    if (b == 'q') return ProblemKind::WeightQualification;
    return std::nullopt;
}

void validate_thresholds(const Thresholds& th) {
    if (!core::in_open_unit_interval(th.tw)) {
        throw core::SolverError(core::ErrorKind::InfeasibleThresholds,
                                "weighted threshold tw=" + core::to_string(th.tw) + " is outside (0, 1)");
    }
    if (!core::in_open_unit_interval(th.tn)) {
        throw core::SolverError(core::ErrorKind::InfeasibleThresholds,
                                "nominal threshold tn=" + core::to_string(th.tn) + " is outside (0, 1)");
    }
}

bool has_closed_form_bound(const Thresholds& th, ProblemKind kind) {
    return kind == ProblemKind::WeightRestriction ? th.tw < th.tn : th.tw > th.tn;
}

ticket_t total_of(const Assignment& tickets) noexcept {
    return std::accumulate(tickets.begin(), tickets.end(), ticket_t{0});
}

} // namespace engine
