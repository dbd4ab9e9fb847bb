// cli.cpp — Command-line parsing implementation using cxxopts

#include "cli/cli.hpp"

#include <cxxopts.hpp>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include "core/rational.hpp"

namespace cli {

// First of the given aliases that was set on the command line; more than one is an error.
static std::optional<std::string> pick_alias(const cxxopts::ParseResult& result,
                                             std::initializer_list<const char*> names) {
    std::optional<std::string> picked;
    std::string picked_name;
    for (const char* name : names) {
        if (!result.count(name)) continue;
        if (picked) throw UsageError(std::string("--") + name + " repeats --" + picked_name);
        picked = result[name].as<std::string>();
        picked_name = name;
    }
    return picked;
}

Options parse_args(int argc, const char* const* argv, bool& want_help, std::string& help_text) {
    Options opt;
    want_help = false;

    std::string command;
    int threads = 0;
    std::size_t search_nodes = CORE_SEARCH_MAX_NODES;
    std::size_t scan_totals = CORE_FALLBACK_MAX_TICKETS;

    cxxopts::Options desc("swiper", "Ticket allocation for weight restriction (wr) and weight qualification (wq)");
    desc.add_options()
        ("h,help", "Show this help")
        ("command", "wr | wq | table", cxxopts::value<std::string>(command))
        ("inputs", "Weight file(s); one weight per line", cxxopts::value<std::vector<std::string>>(opt.inputs))
        ("tw", "Weight threshold as p/q or decimal", cxxopts::value<std::string>())
        ("tn", "Ticket threshold as p/q or decimal", cxxopts::value<std::string>())
        ("alpha_w", "Alias of --tw for wr", cxxopts::value<std::string>())
        ("alpha_n", "Alias of --tn for wr", cxxopts::value<std::string>())
        ("beta_w", "Alias of --tw for wq", cxxopts::value<std::string>())
        ("beta_n", "Alias of --tn for wq", cxxopts::value<std::string>())
        ("o,output-file", "Write the result here instead of stdout", cxxopts::value<std::string>(opt.output_file))
        ("sum-only", "Print only the total number of tickets", cxxopts::value<bool>(opt.sum_only))
        ("debug", "Verify the final assignment", cxxopts::value<bool>(opt.solve.debug))
        ("linear", "Certify with the fractional-knapsack bound during the search", cxxopts::value<bool>(opt.solve.linear))
        ("allow-zero", "Allow parties with zero tickets", cxxopts::value<bool>(opt.solve.allow_zero_tickets))
        ("search-nodes", "Oracle calls the exhaustive search for a smaller total may spend", cxxopts::value<std::size_t>(search_nodes)->default_value(std::to_string(CORE_SEARCH_MAX_NODES)))
        ("scan-totals", "Totals tried when the thresholds admit no closed-form bound", cxxopts::value<std::size_t>(scan_totals)->default_value(std::to_string(CORE_FALLBACK_MAX_TICKETS)))
        ("v,verbose", "More logging (-v info, -vv debug)")
        ("params", "table: comma-separated tw:tn pairs", cxxopts::value<std::string>(opt.params)->default_value(kDefaultTableParams))
        ("problem", "table: wr or wq", cxxopts::value<std::string>()->default_value("wr"))
        ("threads", "table: number of threads (default: tbb max)", cxxopts::value<int>(threads)->default_value("0"))
        ("progress", "table: show a progress bar", cxxopts::value<bool>(opt.progress))
    ;
    desc.parse_positional({"command", "inputs"});
    desc.positional_help("wr|wq [input] | table <datasets...>");
    help_text = desc.help();

    cxxopts::ParseResult result;
    try {
        result = desc.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        throw UsageError(e.what());
    }
    if (result.count("help")) { want_help = true; return opt; }

    opt.verbosity = result.count("verbose");
    opt.threads = threads;
    opt.solve.max_search_nodes = search_nodes;
    opt.solve.max_scan_totals = scan_totals;

    if (command.empty()) throw UsageError("missing command (wr, wq or table)");

    if (command == "table") {
        opt.command = Command::Table;
        auto kind = engine::parse_problem_kind(result["problem"].as<std::string>());
        if (!kind) throw UsageError("--problem must be wr or wq");
        opt.problem = *kind;
        if (opt.inputs.empty()) throw UsageError("table needs at least one dataset");
        return opt;
    }

    auto kind = engine::parse_problem_kind(command);
    if (!kind) throw UsageError("unknown command '" + command + "'");
    opt.command = Command::Solve;
    opt.problem = *kind;
    if (opt.inputs.size() > 1) throw UsageError("at most one input file");

    // tw/tn plus their historical names; WR called them alpha, WQ beta.
    auto tw = pick_alias(result, {"tw", "alpha_w", "beta_w"});
    auto tn = pick_alias(result, {"tn", "alpha_n", "beta_n"});
    if (!tw || !tn) throw UsageError("both --tw and --tn are required");
    opt.thresholds.tw = core::parse_rational(*tw);
    opt.thresholds.tn = core::parse_rational(*tn);
    return opt;
}

} // namespace cli
