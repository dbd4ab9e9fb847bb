// table.cpp

#include "batch/table.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <ostream>

#include <indicators/cursor_control.hpp>
#include <indicators/progress_bar.hpp>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

#include "core/error.hpp"
#include "core/log.hpp"
#include "engine/solve.hpp"
#include "io/dataset.hpp"

namespace batch {

std::vector<engine::Thresholds> parse_params(std::string_view text) {
    std::vector<engine::Thresholds> params;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t comma = text.find(',', start);
        if (comma == std::string_view::npos) comma = text.size();
        const std::string_view pair = text.substr(start, comma - start);
        const std::size_t colon = pair.find(':');
        if (colon == std::string_view::npos) {
            throw core::SolverError(core::ErrorKind::InvalidNumber,
                                    "parameter pair '" + std::string(pair) + "' is not tw:tn");
        }
        params.push_back({core::parse_rational(pair.substr(0, colon)), core::parse_rational(pair.substr(colon + 1))});
        start = comma + 1;
    }
    return params;
}

Dataset load_dataset(const std::string& path) {
    return Dataset{std::filesystem::path(path).stem().string(), io::load_weights(path)};
}

Table run_table(const std::vector<Dataset>& datasets, const std::vector<engine::Thresholds>& params,
                const TableConfig& cfg) {
    Table table;
    table.kind = cfg.kind;
    table.params = params;
    for (const auto& d : datasets) table.datasets.push_back(d.name);
    table.cells.assign(params.size(), std::vector<Cell>(datasets.size()));

    const std::size_t D = datasets.size();
    const std::size_t J = params.size() * D;
    if (J == 0) return table;

    std::unique_ptr<tbb::global_control> limit;
    if (cfg.threads > 0) {
        limit = std::make_unique<tbb::global_control>(tbb::global_control::max_allowed_parallelism,
                                                      static_cast<std::size_t>(cfg.threads));
    }

    std::unique_ptr<indicators::ProgressBar> bar;
    if (cfg.progress) {
        indicators::show_console_cursor(false);
        bar = std::make_unique<indicators::ProgressBar>(
            indicators::option::BarWidth{50},
            indicators::option::Start{"["},
            indicators::option::Fill{"="},
            indicators::option::Lead{">"},
            indicators::option::Remainder{" "},
            indicators::option::End{"]"},
            indicators::option::ForegroundColor{indicators::Color::green},
            indicators::option::ShowElapsedTime{true},
            indicators::option::ShowPercentage{true},
            indicators::option::MaxProgress{J},
            indicators::option::Stream{std::cerr}
        );
    }

    // Each job writes only its own cell.
    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, J), [&](const tbb::blocked_range<std::size_t>& r) {
        for (std::size_t j = r.begin(); j != r.end(); ++j) {
            const std::size_t p = j / D;
            const std::size_t d = j % D;
            Cell& cell = table.cells[p][d];
            try {
                cell.total = engine::solve_total(datasets[d].weights, params[p], cfg.kind, cfg.options);
            } catch (const std::exception& e) {
                cell.error = e.what();
                core::log::warn(datasets[d].name, " tw=", params[p].tw, " tn=", params[p].tn, ": ", e.what());
            }
            if (bar) bar->tick();
        }
    });

    if (bar) {
        bar->mark_as_completed();
        indicators::show_console_cursor(true);
    }
    return table;
}

void print_table(std::ostream& out, const Table& table) {
    const char* w = table.kind == engine::ProblemKind::WeightRestriction ? "alpha_w" : "beta_w";
    const char* n = table.kind == engine::ProblemKind::WeightRestriction ? "alpha_n" : "beta_n";
    for (std::size_t p = 0; p < table.params.size(); ++p) {
        if (p) out << "\n";
        out << w << " = " << core::to_string(table.params[p].tw) << " " << n << " = "
            << core::to_string(table.params[p].tn) << "\n";
        for (std::size_t d = 0; d < table.datasets.size(); ++d) {
            const Cell& cell = table.cells[p][d];
            out << table.datasets[d] << " ";
            if (cell.total) out << *cell.total;
            else            out << "error: " << cell.error;
            out << "\n";
        }
    }
}

} // namespace batch
