// cli.hpp — Command-line parsing interface (cxxopts)
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "engine/problem.hpp"

namespace cli {

enum class Command { Solve, Table };

// Parameter grid of the original batch tables.
inline constexpr const char* kDefaultTableParams = "1/4:1/3,1/3:3/8,1/3:1/2,2/3:3/4";

struct Options {
    Command command = Command::Solve;
    engine::ProblemKind problem = engine::ProblemKind::WeightRestriction;

    // Solve: at most one input file (absent or "-" => stdin). Table: one or more datasets.
    std::vector<std::string> inputs;
    // Absent => stdout
    std::string output_file;

    engine::Thresholds thresholds{core::Rational(0), core::Rational(0)};
    engine::SolveOptions solve;
    bool sum_only = false;

    // Repeat count of -v
    std::size_t verbosity = 0;

    // Table only
    std::string params = kDefaultTableParams;
    int threads = 0;        // 0 -> tbb default
    bool progress = false;
};

/**
 * @brief Malformed command line; the executable exits with status 2.
 */
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parse CLI arguments with cxxopts.
// On success, returns filled Options and sets want_help/help_text for --help.
// Throws UsageError on a malformed command line and SolverError(InvalidNumber)
// on an unparsable threshold.
Options parse_args(int argc, const char* const* argv, bool& want_help, std::string& help_text);

} // namespace cli
