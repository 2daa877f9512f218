#include <iostream>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "assumptions.hpp"
#include "config_parser.hpp"
#include "field_catalog.hpp"
#include "logger.hpp"
#include "valuation.hpp"
#include "io/json_writer.hpp"

namespace {

struct CLIArgs {
    // Single-symbol input
    std::string symbol;
    std::string balance_sheet_path;
    std::string income_statement_path;
    std::string cash_flow_path;
    std::string ratios_path;
    std::string frequency = "year";
    std::optional<double> price;
    std::optional<double> shares;
    std::string year_column;
    std::string quarter_column;
    // Batch input
    std::string config_path;
    // Assumptions and catalog
    std::string assumptions_path;
    std::string field_catalog_path;
    std::optional<double> short_term_growth;
    std::optional<double> terminal_growth;
    std::optional<double> cost_of_equity;
    std::optional<double> wacc;
    std::optional<double> tax_rate;
    std::optional<int> forecast_years;
    std::optional<double> target_roe;
    std::optional<double> payout_ratio;
    std::optional<fairvalue::ModelWeights> weights;
    std::optional<double> threshold_pct;
    // Output and logging
    std::string output_path;
    bool compact = false;
    std::string log_level;
    std::string log_file;
    bool log_text = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "FairValue Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Single symbol options:\n";
    std::cerr << "  --symbol <ticker>           Symbol to value\n";
    std::cerr << "  --balance-sheet <path>      Balance sheet (.csv, .json or .parquet)\n";
    std::cerr << "  --income-statement <path>   Income statement\n";
    std::cerr << "  --cash-flow <path>          Cash flow statement\n";
    std::cerr << "  --ratios <path>             Ratio table\n";
    std::cerr << "  --frequency <year|quarter>  Reporting frequency (default: year)\n";
    std::cerr << "  --price <value>             Current market price\n";
    std::cerr << "  --shares <count>            Shares outstanding\n";
    std::cerr << "  --year-column <label>       Order statement rows by this period column\n";
    std::cerr << "  --quarter-column <label>    Sub-period column used with --year-column\n\n";
    std::cerr << "Batch options:\n";
    std::cerr << "  --config <path>             JSON run configuration with many requests\n\n";
    std::cerr << "Assumption options:\n";
    std::cerr << "  --assumptions <path>        Assumptions file (.json or name,value .csv)\n";
    std::cerr << "  --field-catalog <path>      JSON overlay for the field catalog\n";
    std::cerr << "  --growth <rate>             Short-term growth (default: 0.05)\n";
    std::cerr << "  --terminal-growth <rate>    Terminal growth (default: 0.02)\n";
    std::cerr << "  --cost-of-equity <rate>     Cost of equity (default: 0.12)\n";
    std::cerr << "  --wacc <rate>               WACC (default: 0.10)\n";
    std::cerr << "  --tax-rate <rate>           Tax rate (default: 0.20)\n";
    std::cerr << "  --years <n>                 Forecast horizon (default: 5)\n";
    std::cerr << "  --target-roe <rate>         Target ROE (default: company ROE)\n";
    std::cerr << "  --payout <ratio>            Payout ratio (default: 0.40)\n";
    std::cerr << "  --weights <a,b,c,d>         Weights for fcfe,fcff,justified_pe,justified_pb\n";
    std::cerr << "  --threshold <pct>           BUY/SELL threshold in percent (default: 10)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --compact                   Single-line JSON\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log lines to this file\n";
    std::cerr << "  --log-text                  Plain-text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Value one symbol from quarterly CSV statements:\n";
    std::cerr << "     " << program_name << " --symbol VNM --frequency quarter \\\n";
    std::cerr << "         --balance-sheet data/balance.csv \\\n";
    std::cerr << "         --income-statement data/income.csv \\\n";
    std::cerr << "         --cash-flow data/cashflow.csv \\\n";
    std::cerr << "         --price 61500 --output vnm.json\n\n";
    std::cerr << "  2. Value a batch described by a run configuration:\n";
    std::cerr << "     " << program_name << " --config run.json --output results.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

fairvalue::ModelWeights parse_weights(const std::string& text) {
    std::vector<double> values;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        values.push_back(std::stod(item));
    }
    if (values.size() != 4) {
        throw std::invalid_argument("--weights expects four comma-separated values");
    }
    return fairvalue::ModelWeights(values[0], values[1], values[2], values[3]);
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--symbol" && i + 1 < argc) {
                args.symbol = argv[++i];
            } else if (arg == "--balance-sheet" && i + 1 < argc) {
                args.balance_sheet_path = argv[++i];
            } else if (arg == "--income-statement" && i + 1 < argc) {
                args.income_statement_path = argv[++i];
            } else if (arg == "--cash-flow" && i + 1 < argc) {
                args.cash_flow_path = argv[++i];
            } else if (arg == "--ratios" && i + 1 < argc) {
                args.ratios_path = argv[++i];
            } else if (arg == "--frequency" && i + 1 < argc) {
                args.frequency = argv[++i];
            } else if (arg == "--price" && i + 1 < argc) {
                args.price = std::stod(argv[++i]);
            } else if (arg == "--shares" && i + 1 < argc) {
                args.shares = std::stod(argv[++i]);
            } else if (arg == "--year-column" && i + 1 < argc) {
                args.year_column = argv[++i];
            } else if (arg == "--quarter-column" && i + 1 < argc) {
                args.quarter_column = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--assumptions" && i + 1 < argc) {
                args.assumptions_path = argv[++i];
            } else if (arg == "--field-catalog" && i + 1 < argc) {
                args.field_catalog_path = argv[++i];
            } else if (arg == "--growth" && i + 1 < argc) {
                args.short_term_growth = std::stod(argv[++i]);
            } else if (arg == "--terminal-growth" && i + 1 < argc) {
                args.terminal_growth = std::stod(argv[++i]);
            } else if (arg == "--cost-of-equity" && i + 1 < argc) {
                args.cost_of_equity = std::stod(argv[++i]);
            } else if (arg == "--wacc" && i + 1 < argc) {
                args.wacc = std::stod(argv[++i]);
            } else if (arg == "--tax-rate" && i + 1 < argc) {
                args.tax_rate = std::stod(argv[++i]);
            } else if (arg == "--years" && i + 1 < argc) {
                args.forecast_years = std::stoi(argv[++i]);
            } else if (arg == "--target-roe" && i + 1 < argc) {
                args.target_roe = std::stod(argv[++i]);
            } else if (arg == "--payout" && i + 1 < argc) {
                args.payout_ratio = std::stod(argv[++i]);
            } else if (arg == "--weights" && i + 1 < argc) {
                args.weights = parse_weights(argv[++i]);
            } else if (arg == "--threshold" && i + 1 < argc) {
                args.threshold_pct = std::stod(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--compact") {
                args.compact = true;
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                args.log_file = argv[++i];
            } else if (arg == "--log-text") {
                args.log_text = true;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid option value: " << e.what() << "\n\n";
        return false;
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;
    bool batch = !args.config_path.empty();

    if (batch) {
        if (!file_exists(args.config_path)) {
            std::cerr << "Error: Config file not found: " << args.config_path << "\n";
            valid = false;
        }
        if (!args.symbol.empty()) {
            std::cerr << "Error: --symbol cannot be combined with --config\n";
            valid = false;
        }
    } else {
        if (args.symbol.empty()) {
            std::cerr << "Error: --symbol is required (or use --config)\n";
            valid = false;
        }

        const std::pair<const char*, const std::string*> statements[] = {
            {"Balance sheet", &args.balance_sheet_path},
            {"Income statement", &args.income_statement_path},
            {"Cash flow", &args.cash_flow_path},
            {"Ratios", &args.ratios_path}
        };
        bool any_statement = false;
        for (const auto& [name, path] : statements) {
            if (path->empty()) continue;
            any_statement = true;
            if (!file_exists(*path)) {
                std::cerr << "Error: " << name << " file not found: " << *path << "\n";
                valid = false;
            }
        }
        if (!any_statement) {
            std::cerr << "Error: At least one statement file is required\n";
            valid = false;
        }

        if (args.frequency != "year" && args.frequency != "annual" &&
            args.frequency != "quarter" && args.frequency != "quarterly") {
            std::cerr << "Error: --frequency must be year or quarter\n";
            valid = false;
        }
    }

    if (!args.assumptions_path.empty() && !file_exists(args.assumptions_path)) {
        std::cerr << "Error: Assumptions file not found: " << args.assumptions_path << "\n";
        valid = false;
    }

    if (!args.field_catalog_path.empty() && !file_exists(args.field_catalog_path)) {
        std::cerr << "Error: Field catalog not found: " << args.field_catalog_path << "\n";
        valid = false;
    }

    if (args.price && *args.price <= 0) {
        std::cerr << "Error: --price must be positive\n";
        valid = false;
    }

    if (args.shares && *args.shares <= 0) {
        std::cerr << "Error: --shares must be positive\n";
        valid = false;
    }

    if (args.threshold_pct && *args.threshold_pct < 0) {
        std::cerr << "Error: --threshold must be non-negative\n";
        valid = false;
    }

    return valid;
}

// Command-line values win over file values
void apply_overrides(const CLIArgs& args, fairvalue::ValuationAssumptions& assumptions) {
    if (args.short_term_growth) assumptions.short_term_growth = *args.short_term_growth;
    if (args.terminal_growth) assumptions.terminal_growth = *args.terminal_growth;
    if (args.cost_of_equity) assumptions.cost_of_equity = *args.cost_of_equity;
    if (args.wacc) assumptions.wacc = *args.wacc;
    if (args.tax_rate) assumptions.tax_rate = *args.tax_rate;
    if (args.forecast_years) assumptions.forecast_years = *args.forecast_years;
    if (args.target_roe) assumptions.target_roe = *args.target_roe;
    if (args.payout_ratio) assumptions.payout_ratio = *args.payout_ratio;
    if (args.weights) assumptions.weights = *args.weights;
    assumptions.validate();
}

void apply_logging(const CLIArgs& args, fairvalue::LoggerConfig& logging) {
    if (!args.log_level.empty()) {
        logging.min_level = fairvalue::string_to_level(args.log_level);
    }
    if (!args.log_file.empty()) {
        logging.enable_file = true;
        logging.log_file_path = args.log_file;
    }
    if (args.log_text) {
        logging.enable_json = false;
    }
    fairvalue::Logger::get_instance().configure(logging);
}

int run_single(const CLIArgs& args) {
    fairvalue::LoggerConfig logging;
    apply_logging(args, logging);

    fairvalue::ValuationAssumptions assumptions;
    if (!args.assumptions_path.empty()) {
        std::cerr << "Loading assumptions from " << args.assumptions_path << "\n";
        assumptions = fairvalue::ValuationAssumptions::load(args.assumptions_path);
    }
    apply_overrides(args, assumptions);

    fairvalue::FieldCatalog catalog = args.field_catalog_path.empty()
        ? fairvalue::FieldCatalog::default_catalog()
        : fairvalue::FieldCatalog::load_from_json(args.field_catalog_path);

    fairvalue::RequestConfig request_config;
    request_config.symbol = args.symbol;
    request_config.frequency = fairvalue::frequency_from_string(args.frequency);
    request_config.current_price = args.price;
    request_config.shares_outstanding = args.shares;
    request_config.balance_sheet_path = args.balance_sheet_path;
    request_config.income_statement_path = args.income_statement_path;
    request_config.cash_flow_path = args.cash_flow_path;
    request_config.ratios_path = args.ratios_path;
    request_config.year_column = args.year_column;
    request_config.quarter_column = args.quarter_column;

    std::cerr << "Loading statements for " << args.symbol << "..." << std::flush;
    fairvalue::ValuationRequest request = fairvalue::load_request(request_config, assumptions);
    std::cerr << " done\n";

    fairvalue::ValuationConfig config;
    if (args.threshold_pct) config.recommendation_threshold_pct = *args.threshold_pct;

    fairvalue::ValuationReport report = fairvalue::run_valuation(request, catalog, config);

    // Report summary to stderr
    std::cerr << "\nResults for " << report.symbol << ":\n";
    for (const auto& outcome : report.result.outcomes) {
        std::cerr << "  " << fairvalue::model_name(outcome.model) << ": "
                  << outcome.value_per_share << " ("
                  << fairvalue::model_status_to_string(outcome.status) << ")\n";
    }
    std::cerr << "  Weighted average: " << report.result.weighted_average << "\n";
    if (report.market_comparison) {
        std::cerr << "  Upside/downside:  " << report.market_comparison->upside_downside_pct << "% ("
                  << fairvalue::recommendation_to_string(report.market_comparison->recommendation)
                  << ")\n";
    }
    std::cerr << "  Execution:        " << report.execution_time_ms << " ms\n";

    if (args.output_path.empty()) {
        fairvalue::io::write_valuation_report_json(std::cout, report, !args.compact);
    } else {
        fairvalue::io::write_valuation_report_json(args.output_path, report, !args.compact);
        std::cerr << "\nOutput written to: " << args.output_path << "\n";
    }
    return 0;
}

int run_batch(const CLIArgs& args) {
    std::cerr << "Loading run configuration: " << args.config_path << "\n";
    fairvalue::RunConfig run = fairvalue::parse_run_config_from_file(args.config_path);
    apply_logging(args, run.logging);

    if (!args.assumptions_path.empty()) {
        run.assumptions = fairvalue::ValuationAssumptions::load(args.assumptions_path);
    }
    apply_overrides(args, run.assumptions);

    std::string catalog_path = args.field_catalog_path.empty()
        ? run.field_catalog_path : args.field_catalog_path;
    fairvalue::FieldCatalog catalog = catalog_path.empty()
        ? fairvalue::FieldCatalog::default_catalog()
        : fairvalue::FieldCatalog::load_from_json(catalog_path);

    fairvalue::ValuationConfig config;
    config.recommendation_threshold_pct = args.threshold_pct.value_or(run.recommendation_threshold_pct);

    // A symbol whose files cannot be read is reported like one that cannot be valued
    std::vector<fairvalue::ValuationRequest> requests;
    std::vector<fairvalue::BatchEntry> load_failures;
    for (const auto& request_config : run.requests) {
        try {
            requests.push_back(fairvalue::load_request(request_config, run.assumptions));
        } catch (const std::exception& e) {
            fairvalue::BatchEntry failure;
            failure.symbol = request_config.symbol;
            failure.error = e.what();
            load_failures.push_back(failure);
        }
    }

    std::cerr << "Valuing " << requests.size() << " symbols...\n";
    std::vector<fairvalue::BatchEntry> entries =
        fairvalue::run_batch_valuation(requests, catalog, config);
    entries.insert(entries.end(), load_failures.begin(), load_failures.end());

    size_t failed = 0;
    for (const auto& entry : entries) {
        if (!entry.ok()) {
            std::cerr << "  " << entry.symbol << ": " << entry.error << "\n";
            ++failed;
        }
    }
    std::cerr << "Valued " << (entries.size() - failed) << " of " << entries.size() << " symbols\n";

    if (args.output_path.empty()) {
        fairvalue::io::write_batch_json(std::cout, entries, !args.compact);
    } else {
        fairvalue::io::write_batch_json(args.output_path, entries, !args.compact);
        std::cerr << "\nOutput written to: " << args.output_path << "\n";
    }

    return (!entries.empty() && failed == entries.size()) ? 1 : 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    try {
        if (!args.config_path.empty()) {
            return run_batch(args);
        }
        return run_single(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
