#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include "tax_ngin/core/config_loader.hpp"
#include "tax_ngin/core/decimal.hpp"
#include "tax_ngin/core/logger.hpp"
#include "tax_ngin/data/trade_loader.hpp"
#include "tax_ngin/replay/replay_engine.hpp"
#include "tax_ngin/report/monthly_summary.hpp"
#include "tax_ngin/report/run_summary.hpp"
#include "tax_ngin/report/tax_csv_exporter.hpp"

using namespace tax_ngin;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n"
              << "  -i, --input FILE             Trade ledger (.csv or .txt)\n"
              << "  -c, --config FILE            Configuration file (default: config.json)\n"
              << "  -x, --initial-capital AMOUNT Initial corpus\n"
              << "  -n, --max-stocks N           Maximum concurrently open positions\n"
              << "  -o, --output-dir DIR         Directory for generated reports\n"
              << "  -v, --verbose                Debug logging\n"
              << "  -h, --help                   Show this message\n"
              << "Example: " << program << " -i input/trades.csv -x 2000000 -n 20" << std::endl;
}

struct CommandLine {
    std::optional<std::string> input;
    std::string config_path{"config.json"};
    std::optional<std::string> initial_capital;
    std::optional<std::string> max_stocks;
    std::optional<std::string> output_dir;
    bool verbose{false};
    bool help{false};
};

}  // namespace

int main(int argc, char* argv[]) {
    try {
        CommandLine cli;
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                cli.help = true;
                continue;
            }
            if (arg == "-v" || arg == "--verbose") {
                cli.verbose = true;
                continue;
            }

            const bool takes_value = arg == "-i" || arg == "--input" || arg == "-c" ||
                                     arg == "--config" || arg == "-x" ||
                                     arg == "--initial-capital" || arg == "-n" ||
                                     arg == "--max-stocks" || arg == "-o" || arg == "--output-dir";
            if (!takes_value) {
                std::cerr << "Invalid argument: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }

            std::string value = argv[++i];
            if (arg == "-i" || arg == "--input")
                cli.input = value;
            else if (arg == "-c" || arg == "--config")
                cli.config_path = value;
            else if (arg == "-x" || arg == "--initial-capital")
                cli.initial_capital = value;
            else if (arg == "-n" || arg == "--max-stocks")
                cli.max_stocks = value;
            else
                cli.output_dir = value;
        }

        if (cli.help) {
            print_usage(argv[0]);
            return 0;
        }

        // Console logging until the configuration is known
        auto& logger = Logger::instance();
        LoggerConfig bootstrap_config;
        bootstrap_config.min_level = cli.verbose ? LogLevel::DEBUG : LogLevel::INFO;
        bootstrap_config.destination = LogDestination::CONSOLE;
        logger.initialize(bootstrap_config);
        Logger::register_component("tax_replay");

        auto config_result = ConfigLoader::load(cli.config_path);
        if (config_result.is_error()) {
            std::cerr << "Failed to load configuration: " << config_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        ReplayConfig config = config_result.take_value();

        if (cli.initial_capital) {
            auto capital = Decimal::from_string(*cli.initial_capital);
            if (capital.is_error()) {
                std::cerr << "Invalid --initial-capital: " << *cli.initial_capital << std::endl;
                return 1;
            }
            config.initial_capital = capital.value().round(2);
        }
        if (cli.max_stocks) {
            try {
                size_t consumed = 0;
                config.max_stocks = std::stoi(*cli.max_stocks, &consumed);
                if (consumed != cli.max_stocks->size()) {
                    throw std::invalid_argument("trailing characters");
                }
            } catch (const std::exception&) {
                std::cerr << "Invalid --max-stocks: " << *cli.max_stocks << std::endl;
                return 1;
            }
        }
        if (cli.output_dir) {
            config.output_dir = *cli.output_dir;
        }
        if (cli.verbose) {
            config.logging.min_level = LogLevel::DEBUG;
        }

        auto valid = ConfigLoader::validate(config);
        if (valid.is_error()) {
            std::cerr << "Invalid configuration: " << valid.error()->what() << std::endl;
            return 1;
        }

        logger.initialize(config.logging);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("tax_replay");

        std::filesystem::path input_file;
        if (cli.input) {
            input_file = *cli.input;
        } else {
            auto found = TradeLoader::find_input_file(config.input_dir);
            if (found.is_error()) {
                std::cerr << "No input file given and none found: " << found.error()->what()
                          << std::endl;
                return 1;
            }
            input_file = found.value();
            INFO("Using input file " << input_file.string());
        }

        auto loaded = TradeLoader::load_file(input_file);
        if (loaded.is_error()) {
            std::cerr << "Failed to load trades: " << loaded.error()->to_string() << std::endl;
            ERROR("Failed to load trades: " << loaded.error()->what());
            return 1;
        }
        LoadedLedger ledger = loaded.take_value();

        replay::ReplayEngine engine(config);
        auto replayed = engine.run(ledger.trades);
        if (replayed.is_error()) {
            std::cerr << "Replay aborted: " << replayed.error()->to_string() << std::endl;
            return 1;
        }
        const replay::ReplayResult result = replayed.take_value();

        report::TaxCSVExporter exporter(config.output_dir,
                                        report::tax_report_filename(input_file));
        auto initialized = exporter.initialize_file();
        if (initialized.is_error()) {
            std::cerr << initialized.error()->to_string() << std::endl;
            return 1;
        }
        auto written = exporter.write_trades(result.closed_trades);
        if (written.is_error()) {
            std::cerr << written.error()->to_string() << std::endl;
            return 1;
        }
        exporter.finalize();

        if (config.write_monthly_summary) {
            auto monthly = report::write_monthly_summary(report::build_monthly_summary(result),
                                                         config.output_dir, input_file);
            if (monthly.is_error()) {
                std::cerr << monthly.error()->to_string() << std::endl;
                return 1;
            }
        }

        if (config.write_json_summary) {
            auto summary = report::build_run_summary(config, input_file, ledger.trades.size(),
                                                     ledger.rejected, result);
            auto summary_written =
                report::write_run_summary(summary, config.output_dir, input_file);
            if (summary_written.is_error()) {
                std::cerr << summary_written.error()->to_string() << std::endl;
                return 1;
            }
        }

        std::cout << "\n=== Replay Complete ===" << std::endl;
        std::cout << "Trades loaded:    " << ledger.trades.size() << std::endl;
        std::cout << "Rows rejected:    " << ledger.rejected.size() + result.rejected.size()
                  << std::endl;
        std::cout << "Trades closed:    " << result.closed_trades.size() << std::endl;
        std::cout << "Open holdings:    " << result.open_positions.size() << " (principal "
                  << result.open_principal.to_string(2) << ")" << std::endl;
        std::cout << "Initial capital:  " << result.initial_capital.to_string(2) << std::endl;
        std::cout << "Final corpus:     " << result.final_corpus.to_string(2) << std::endl;
        if (!result.violations.empty()) {
            std::cout << "Limit violations: " << result.violations.size() << std::endl;
        }
        std::cout << "Output file:      " << exporter.output_path().string() << std::endl;
        std::cout << "=======================" << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        ERROR("Unexpected error: " + std::string(e.what()));
        return 1;
    }
}
