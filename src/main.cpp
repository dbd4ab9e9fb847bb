// Main entry: minimal ticket allocation for one weight file, or a batch table over many
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "batch/table.hpp"
#include "cli/cli.hpp"
#include "core/error.hpp"
#include "core/log.hpp"
#include "engine/solve.hpp"
#include "io/dataset.hpp"

static int run_solve(const cli::Options& opt) {
    engine::validate_thresholds(opt.thresholds);
    const auto weights = io::load_weights(opt.inputs.empty() ? std::string("-") : opt.inputs.front());
    const engine::Solution solution = engine::solve(weights, opt.thresholds, opt.problem, opt.solve);

    if (opt.output_file.empty()) {
        io::write_solution(std::cout, solution, opt.sum_only);
        return 0;
    }
    std::ofstream out(opt.output_file);
    if (!out) throw core::SolverError(core::ErrorKind::IoError, "cannot open '" + opt.output_file + "' for writing");
    io::write_solution(out, solution, opt.sum_only);
    if (!out.flush()) throw core::SolverError(core::ErrorKind::IoError, "write to '" + opt.output_file + "' failed");
    return 0;
}

static int run_table(const cli::Options& opt) {
    const auto params = batch::parse_params(opt.params);
    std::vector<batch::Dataset> datasets;
    for (const auto& path : opt.inputs) datasets.push_back(batch::load_dataset(path));

    batch::TableConfig cfg{ .kind = opt.problem, .options = opt.solve, .threads = opt.threads, .progress = opt.progress };
    const batch::Table table = batch::run_table(datasets, params, cfg);

    if (opt.output_file.empty()) {
        batch::print_table(std::cout, table);
        return 0;
    }
    std::ofstream out(opt.output_file);
    if (!out) throw core::SolverError(core::ErrorKind::IoError, "cannot open '" + opt.output_file + "' for writing");
    batch::print_table(out, table);
    if (!out.flush()) throw core::SolverError(core::ErrorKind::IoError, "write to '" + opt.output_file + "' failed");
    return 0;
}

int main(int argc, char** argv) {
    // Parse CLI
    bool want_help = false; std::string help_text;
    cli::Options opt;
    try {
        opt = cli::parse_args(argc, argv, want_help, help_text);
    } catch (const cli::UsageError& e) {
        std::cerr << "error: " << e.what() << "\n" << help_text;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    if (want_help) { std::cout << help_text; return 0; }

    // Verbosity is program-wide and fixed from here on
    core::log::init_program_level(core::log::level_from_verbosity(opt.verbosity));

    try {
        return opt.command == cli::Command::Table ? run_table(opt) : run_solve(opt);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
