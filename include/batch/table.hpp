// table.hpp — batch tables: every (dataset, tw, tn) job solved in parallel (oneTBB)
#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/rational.hpp"
#include "engine/problem.hpp"

namespace batch {

struct Dataset {
    std::string name;                      // file stem, e.g. "aptos"
    std::vector<core::Rational> weights;
};

// ---------- Config ----------
struct TableConfig {
    engine::ProblemKind kind{engine::ProblemKind::WeightRestriction};
    engine::SolveOptions options{};
    int  threads{0};        // 0 -> tbb default
    bool progress{false};   // progress bar on stderr
};

/**
 * @brief One table cell: the minimal total, or the message of the job's failure.
 */
struct Cell {
    std::optional<ticket_t> total;
    std::string error;
};

/**
 * @brief Results indexed as cells[param][dataset].
 */
struct Table {
    engine::ProblemKind kind{engine::ProblemKind::WeightRestriction};
    std::vector<engine::Thresholds> params;
    std::vector<std::string> datasets;
    std::vector<std::vector<Cell>> cells;
};

/**
 * @brief Parse "tw:tn,tw:tn,..." (each side p/q or decimal).
 * @throws SolverError(InvalidNumber) on a malformed or empty pair.
 */
std::vector<engine::Thresholds> parse_params(std::string_view text);

/**
 * @brief Load a dataset named after the file stem.
 * @throws SolverError as io::load_weights does.
 */
Dataset load_dataset(const std::string& path);

/**
 * @brief Solve every (param, dataset) job. Per-job failures land in their cell;
 *        the result does not depend on the thread count.
 */
Table run_table(const std::vector<Dataset>& datasets, const std::vector<engine::Thresholds>& params,
                const TableConfig& cfg);

/**
 * @brief Grouped by parameter pair:
 *          alpha_w = 1/4 alpha_n = 1/3
 *          aptos 121
 *          ...
 *        (beta_w / beta_n for WQ), groups separated by a blank line.
 */
void print_table(std::ostream& out, const Table& table);

} // namespace batch
