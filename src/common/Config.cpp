#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

namespace thetadesk {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

// 숫자 환경변수 - 파싱 실패 시 기존값 유지
void overrideFromEnv(const char* name, double& target) {
    const std::string raw = readEnvVar(name);
    if (raw.empty()) return;
    try {
        target = std::stod(raw);
    } catch (const std::exception&) {
        std::cerr << "Warning: ignoring non-numeric " << name << "=" << raw << std::endl;
    }
}

template<typename Parse, typename Reset>
void applySection(const nlohmann::json& root, const char* name, Parse parse, Reset reset) {
    auto it = root.find(name);
    if (it == root.end() || !it->is_object()) return;
    try {
        parse(*it);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Warning: invalid \"" << name << "\" section, using defaults: " << e.what() << std::endl;
        reset();
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    log_level_ = "info";
    log_dir_ = "logs";
    iv_rank_config_ = IVRankConfig{};
    indicator_config_ = IndicatorConfig{};
    dte_config_ = DTEConfig{};
    spread_config_ = SpreadConfig{};
}

void Config::load(const std::string& path) {
    try {
        const std::filesystem::path config_path = utils::PathUtils::resolvePath(path);

        std::cout << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
            applyEnvironment();
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: cannot open config file." << std::endl;
            applyEnvironment();
            return;
        }

        nlohmann::json j;
        file >> j;
        apply(j);

        std::cout << "Config Loaded: TTL=" << iv_rank_config_.cache_ttl_seconds
                  << "s, MaxSpread=" << spread_config_.max_spread_pct
                  << ", Model=" << dte_config_.model_path << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
    applyEnvironment();
}

void Config::apply(const nlohmann::json& j) {
    if (!j.is_object()) {
        std::cerr << "Warning: config root is not an object, keeping defaults" << std::endl;
        return;
    }

    // 섹션 단위 적용 - 타입 오류가 난 섹션만 기본값으로 되돌리고 나머지는 계속
    applySection(j, "logging", [this](const nlohmann::json& l) {
        std::string level = l.value("level", "info");
        std::string dir = l.value("dir", "logs");
        log_level_ = std::move(level);
        log_dir_ = std::move(dir);
    }, [this] {
        log_level_ = "info";
        log_dir_ = "logs";
    });

    applySection(j, "iv_rank", [this](const nlohmann::json& s) {
        IVRankConfig cfg;
        cfg.cache_ttl_seconds = s.value("cache_ttl_seconds", 3600);
        cfg.lookback_days = s.value("lookback_days", 252);
        cfg.data_dir = s.value("data_dir", "data");
        iv_rank_config_ = cfg;
    }, [this] { iv_rank_config_ = IVRankConfig{}; });

    applySection(j, "indicators", [this](const nlohmann::json& s) {
        IndicatorConfig cfg;
        cfg.rsi_period = s.value("rsi_period", 14);
        cfg.bb_period = s.value("bb_period", 20);
        cfg.bb_std_mult = s.value("bb_std_mult", 2.0);
        cfg.macd_fast = s.value("macd_fast", 12);
        cfg.macd_slow = s.value("macd_slow", 26);
        cfg.macd_signal = s.value("macd_signal", 9);
        cfg.atr_period = s.value("atr_period", 14);
        indicator_config_ = cfg;
    }, [this] { indicator_config_ = IndicatorConfig{}; });

    applySection(j, "dte", [this](const nlohmann::json& s) {
        DTEConfig cfg;
        cfg.model_path = s.value("model_path", "models/dte_optimizer_rf.json");
        dte_config_ = cfg;
    }, [this] { dte_config_ = DTEConfig{}; });

    applySection(j, "spread", [this](const nlohmann::json& s) {
        SpreadConfig cfg;
        cfg.max_spread_pct = s.value("max_spread_pct", 0.20);
        cfg.max_spread_dollars = s.value("max_spread_dollars", 0.50);
        cfg.min_bid = s.value("min_bid", 0.05);
        cfg.required_valid = s.value("required_valid", 2);
        spread_config_ = cfg;
    }, [this] { spread_config_ = SpreadConfig{}; });
}

void Config::applyEnvironment() {
    overrideFromEnv("THETADESK_MAX_SPREAD_PCT", spread_config_.max_spread_pct);
    overrideFromEnv("THETADESK_MAX_SPREAD_DOLLARS", spread_config_.max_spread_dollars);
    overrideFromEnv("THETADESK_MIN_BID", spread_config_.min_bid);

    const std::string level = readEnvVar("THETADESK_LOG_LEVEL");
    if (!level.empty()) {
        log_level_ = level;
    }
}

} // namespace thetadesk
