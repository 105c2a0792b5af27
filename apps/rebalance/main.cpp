#include <boost/program_options.hpp>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include "rebalance_ngin/config/allocation_config.hpp"
#include "rebalance_ngin/data/snapshot_loader.hpp"
#include "rebalance_ngin/portfolio/portfolio_builder.hpp"
#include "rebalance_ngin/rebalancing/rebalancer.hpp"
#include "rebalance_ngin/core/logger.hpp"

namespace po = boost::program_options;

using namespace rebalance_ngin;

namespace {

po::options_description create_options() {
    po::options_description desc("Rebalance options");
    desc.add_options()
        ("help,h", "Show this help")
        ("config,c", po::value<std::string>()->required(), "Allocation configuration (JSON)")
        ("holdings,s", po::value<std::string>()->required(),
         "Portfolio snapshot (CSV with symbol,quantity,price)")
        ("cash", po::value<std::string>()->default_value("0"), "Free cash available for buying")
        ("target-value", po::value<std::string>(),
         "Portfolio value to rebalance to, overrides holdings plus cash")
        ("min-trade-volume", po::value<std::string>(),
         "Smallest trade worth placing, overrides the configuration")
        ("output,o", po::value<std::string>(), "Write the result to a file instead of stdout")
        ("log-level", po::value<std::string>()->default_value("INFO"),
         "TRACE, DEBUG, INFO, WARNING, ERROR or FATAL");
    return desc;
}

Result<Decimal> option_decimal(const po::variables_map& options, const std::string& name) {
    auto value = parse_decimal(options[name].as<std::string>(), DecimalRestrictions::NON_NEGATIVE);
    if (value.is_error()) {
        return make_error<Decimal>(ErrorCode::INVALID_ARGUMENT,
                                   "--" + name + ": " + value.error()->what(), "rebalance");
    }
    return value;
}

int write_output(const po::variables_map& options, const nlohmann::json& output) {
    if (options.count("output") == 0) {
        std::cout << std::setw(4) << output << std::endl;
        return 0;
    }

    const std::string path = options["output"].as<std::string>();
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to open " << path << " for writing" << std::endl;
        return 1;
    }
    file << std::setw(4) << output << std::endl;
    INFO("Result written to " << path);
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    po::options_description desc = create_options();
    po::variables_map options;

    try {
        po::store(po::parse_command_line(argc, argv, desc), options);
        if (options.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        po::notify(options);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << desc << std::endl;
        return 1;
    }

    try {
        auto level = level_from_string(options["log-level"].as<std::string>());
        if (!level) {
            std::cerr << "Unknown log level: " << options["log-level"].as<std::string>()
                      << std::endl;
            return 1;
        }

        LoggerConfig logger_config;
        logger_config.min_level = *level;
        logger_config.destination = LogDestination::CONSOLE;
        logger_config.filename_prefix = "rebalance";
        Logger::instance().initialize(logger_config);
        Logger::register_component("rebalance");

        auto config_result = AllocationConfigLoader::load(options["config"].as<std::string>());
        if (config_result.is_error()) {
            std::cerr << config_result.error()->to_string() << std::endl;
            return 1;
        }
        const PortfolioConfig& portfolio = config_result.value();

        auto holdings_result = SnapshotLoader::load_csv(options["holdings"].as<std::string>());
        if (holdings_result.is_error()) {
            std::cerr << holdings_result.error()->to_string() << std::endl;
            return 1;
        }

        auto tree_result = PortfolioBuilder::build(portfolio, holdings_result.value());
        if (tree_result.is_error()) {
            std::cerr << tree_result.error()->to_string() << std::endl;
            return 1;
        }
        AssetTree tree = tree_result.value();

        RebalanceConfig rebalance_config;
        rebalance_config.min_trade_volume = portfolio.min_trade_volume;
        rebalance_config.min_cash_assets = portfolio.min_cash_assets;

        auto cash = option_decimal(options, "cash");
        if (cash.is_error()) {
            std::cerr << cash.error()->what() << std::endl;
            return 1;
        }
        rebalance_config.cash = cash.value();

        if (options.count("min-trade-volume")) {
            auto volume = option_decimal(options, "min-trade-volume");
            if (volume.is_error()) {
                std::cerr << volume.error()->what() << std::endl;
                return 1;
            }
            rebalance_config.min_trade_volume = volume.value();
        }

        if (options.count("target-value")) {
            auto target = option_decimal(options, "target-value");
            if (target.is_error()) {
                std::cerr << target.error()->what() << std::endl;
                return 1;
            }
            rebalance_config.target_value = target.value();
        }

        Rebalancer rebalancer(rebalance_config);
        auto report = rebalancer.rebalance(tree);

        nlohmann::json output;
        output["currency"] = portfolio.currency;
        output["parameters"] = rebalance_config.to_json();
        output["portfolio"] = tree.to_json();

        int exit_code = 0;
        if (report.is_ok()) {
            output["report"] = report.value().to_json();
        } else {
            const RebalanceError* error = report.error();
            if (error->code() != ErrorCode::RECONCILIATION_FAILURE) {
                std::cerr << error->to_string() << std::endl;
                return 1;
            }

            const auto* failure = dynamic_cast<const ReconciliationFailure*>(error);
            nlohmann::json failure_json;
            failure_json["message"] = error->what();
            if (failure != nullptr) {
                failure_json["unresolved_amount"] = failure->unresolved_amount();
                failure_json["subtree"] = failure->subtree();
            }
            output["reconciliation_failure"] = failure_json;
            exit_code = 2;
        }

        Logger::register_component("rebalance");
        int written = write_output(options, output);
        return written != 0 ? written : exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
