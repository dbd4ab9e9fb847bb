// dataset.cpp

#include "io/dataset.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include "core/error.hpp"

namespace io {

std::vector<core::Rational> read_weights(std::istream& in) {
    using core::ErrorKind;
    using core::SolverError;

    std::vector<core::Rational> weights;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (auto hash = line.find('#'); hash != std::string::npos) line.erase(hash);
        std::istringstream tokens(line);
        std::string token;
        while (tokens >> token) {
            core::Rational w;
            try {
                w = core::parse_rational(token);
            } catch (const SolverError& e) {
                throw SolverError(e.kind(), "line " + std::to_string(line_no) + ": " + e.message());
            }
            if (sgn(w) <= 0) {
                throw SolverError(ErrorKind::NonPositiveWeight,
                                  "line " + std::to_string(line_no) + ": weight '" + token + "' is not positive");
            }
            weights.push_back(std::move(w));
        }
    }
    if (in.bad()) throw SolverError(ErrorKind::IoError, "read error after line " + std::to_string(line_no));
    if (weights.empty()) throw SolverError(ErrorKind::EmptyInput, "input contains no weights");
    return weights;
}

std::vector<core::Rational> load_weights(const std::string& path) {
    if (path.empty() || path == "-") return read_weights(std::cin);
    std::ifstream ifs(path);
    if (!ifs) throw core::SolverError(core::ErrorKind::IoError, "cannot open '" + path + "'");
    return read_weights(ifs);
}

void write_solution(std::ostream& out, const engine::Solution& solution, bool sum_only) {
    if (sum_only) {
        out << solution.total << "\n";
        return;
    }
    for (std::size_t i = 0; i < solution.tickets.size(); ++i) {
        out << (i ? " " : "") << solution.tickets[i];
    }
    out << "\n";
}

} // namespace io
