#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "common/PipelineConfig.h"

namespace thetadesk {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);
    // 파일 없이 JSON 객체로 직접 적용 (테스트, CLI override)
    void apply(const nlohmann::json& j);
    void applyEnvironment();
    void reset();

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    IVRankConfig getIVRankConfig() const { return iv_rank_config_; }
    IndicatorConfig getIndicatorConfig() const { return indicator_config_; }
    DTEConfig getDTEConfig() const { return dte_config_; }
    SpreadConfig getSpreadConfig() const { return spread_config_; }

    void setDataDir(const std::string& dir) { iv_rank_config_.data_dir = dir; }
    void setModelPath(const std::string& path) { dte_config_.model_path = path; }

private:
    Config() = default;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    IVRankConfig iv_rank_config_;
    IndicatorConfig indicator_config_;
    DTEConfig dte_config_;
    SpreadConfig spread_config_;
};

} // namespace thetadesk
