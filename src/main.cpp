#include "common/Logger.h"
#include "common/CliArgs.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "analytics/BuiltinIndicatorBackend.h"
#include "analytics/IVRankEngine.h"
#include "analytics/TechnicalSignalEngine.h"
#include "core/state/ModelStoreJson.h"
#include "data/DataHistory.h"
#include "ml/DTEOptimizer.h"
#include "risk/SpreadValidator.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace thetadesk;

namespace {

struct CliOptions {
    std::string symbol;
    std::string config_path = "config/config.json";
    std::optional<std::string> data_dir;
    std::optional<std::string> model_path;
    std::optional<std::string> quotes_path;
    std::optional<double> vix;
    std::optional<double> vix3m;
    std::optional<double> vix_ratio;
    std::optional<int> lookback_days;
};

void printUsage() {
    std::cout
        << "Usage: thetadesk --symbol SYMBOL [options]\n"
        << "  --config PATH       config file (default config/config.json)\n"
        << "  --data-dir DIR      directory with <SYMBOL>.csv price history\n"
        << "  --lookback DAYS     IV rank lookback in calendar days, 1-3650 (default 252)\n"
        << "  --vix V --vix3m V   VIX and VIX3M levels for term structure\n"
        << "  --vix-ratio R       VIX/VIX3M ratio (instead of --vix/--vix3m)\n"
        << "  --quotes PATH       option quotes JSON to validate\n"
        << "  --model PATH        DTE model artifact path\n";
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            std::exit(0);
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument("missing value for " + arg);
        }
        const std::string value = argv[++i];

        if (arg == "--symbol") opts.symbol = value;
        else if (arg == "--config") opts.config_path = value;
        else if (arg == "--data-dir") opts.data_dir = value;
        else if (arg == "--model") opts.model_path = value;
        else if (arg == "--quotes") opts.quotes_path = value;
        else if (arg == "--vix") opts.vix = cli::parseDouble(arg, value);
        else if (arg == "--vix3m") opts.vix3m = cli::parseDouble(arg, value);
        else if (arg == "--vix-ratio") opts.vix_ratio = cli::parseDouble(arg, value);
        else if (arg == "--lookback") opts.lookback_days = cli::parseLookbackDays(value);
        else throw std::invalid_argument("unknown option " + arg);
    }
    if (opts.symbol.empty()) {
        throw std::invalid_argument("--symbol is required");
    }
    if (opts.vix.has_value() != opts.vix3m.has_value()) {
        throw std::invalid_argument("--vix and --vix3m must be given together");
    }
    return opts;
}

ml::RegimeFeatures buildFeatures(const CliOptions& opts, double iv_rank) {
    if (opts.vix && opts.vix3m) {
        return ml::DTEOptimizer::makeFeatures(*opts.vix, *opts.vix3m, iv_rank);
    }
    ml::RegimeFeatures features;
    features.iv_rank = iv_rank;
    if (opts.vix_ratio) {
        features.vix_ratio = *opts.vix_ratio;
        features.structure = ml::DTEOptimizer::classifyStructure(*opts.vix_ratio);
    }
    return features;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage();
        return 2;
    }

    Config& config = Config::getInstance();
    config.load(opts.config_path);
    if (opts.data_dir) config.setDataDir(*opts.data_dir);
    if (opts.model_path) config.setModelPath(*opts.model_path);

    try {
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    const auto iv_config = config.getIVRankConfig();
    const int lookback = opts.lookback_days.value_or(iv_config.lookback_days);

    auto source = std::make_shared<data::CsvHistoricalDataSource>(
        utils::PathUtils::resolvePath(iv_config.data_dir));

    // 1. IV rank (HV percentile)
    analytics::IVRankEngine iv_engine(source, iv_config);
    const auto iv_details = iv_engine.getIVDetails(opts.symbol, lookback);

    // 2. Technical signal - orchestrator가 직접 price history 조회
    analytics::TechnicalSignalEngine signal_engine(
        std::make_shared<analytics::BuiltinIndicatorBackend>(), config.getIndicatorConfig());

    analytics::IndicatorSnapshot technical;
    try {
        const auto end = std::chrono::system_clock::now();
        const auto start = end - std::chrono::hours(24) * lookback;
        technical = signal_engine.analyze(source->getHistory(opts.symbol, start, end));
    } catch (const std::exception& e) {
        LOG_ERROR("Price history unavailable for {}: {}", opts.symbol, e.what());
        technical.error = e.what();
    }

    // 3. DTE window
    const double iv_rank = iv_details ? iv_details->iv_rank : 50.0;
    ml::DTEOptimizer optimizer(std::make_shared<core::ModelStoreJson>(),
                               utils::PathUtils::resolvePath(config.getDTEConfig().model_path));
    const auto features = buildFeatures(opts, iv_rank);
    const auto window = optimizer.predictOptimalDTE(features);

    // 4. Liquidity gate
    const auto spread_config = config.getSpreadConfig();
    risk::SpreadValidator validator(spread_config);
    std::optional<risk::ChainValidation> chain;
    if (opts.quotes_path) {
        const auto quotes = data::DataHistory::loadQuotesJSON(
            utils::PathUtils::resolvePath(*opts.quotes_path).string());
        chain = validator.validateOptionsChain(quotes, spread_config.required_valid);
    }

    nlohmann::json report;
    report["symbol"] = opts.symbol;
    report["iv"] = iv_details ? iv_details->toJson() : nlohmann::json(nullptr);
    report["technical"] = technical.toJson();
    report["dte"] = {
        {"mode", ml::toString(optimizer.mode())},
        {"vix_ratio", features.vix_ratio},
        {"structure", toString(features.structure)},
        {"iv_rank", features.iv_rank},
        {"window", window.toJson()}
    };
    report["spread"] = chain ? chain->toJson() : nlohmann::json(nullptr);

    std::cout << report.dump(2) << std::endl;

    Logger::getInstance().logDecision(
        opts.symbol,
        iv_rank,
        toString(technical.overall_signal),
        window.min_dte,
        window.max_dte,
        chain ? chain->valid : false);

    return 0;
}
