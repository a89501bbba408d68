#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "core/state/ModelStoreJson.h"
#include "ml/DTEOptimizer.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

// 준비된 학습 데이터 CSV: vix_ratio,iv_rank,optimal_dte (헤더 허용)
int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: thetadesk_train_dte <training.csv> [config.json]\n";
        return 1;
    }

    const std::string csv_path = argv[1];
    const std::string config_path = (argc >= 3) ? argv[2] : "config/config.json";

    try {
        auto& cfg = thetadesk::Config::getInstance();
        cfg.load(config_path);
        thetadesk::Logger::getInstance().initialize(cfg.getLogDir(), cfg.getLogLevel());

        std::ifstream in(thetadesk::utils::PathUtils::resolvePath(csv_path));
        if (!in.is_open()) {
            std::cerr << "Cannot open training file: " << csv_path << "\n";
            return 1;
        }

        std::vector<std::vector<double>> X;
        std::vector<double> y;
        std::string line;
        int line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.empty() || line[0] == '#') continue;

            std::stringstream ss(line);
            std::string cell;
            std::vector<std::string> row;
            while (std::getline(ss, cell, ',')) row.push_back(cell);
            if (row.size() < 3) continue;

            try {
                X.push_back({std::stod(row[0]), std::stod(row[1])});
                y.push_back(std::stod(row[2]));
            } catch (const std::exception&) {
                if (line_no > 1) {
                    std::cerr << "Skipping malformed line " << line_no << ": " << line << "\n";
                }
                if (X.size() > y.size()) X.pop_back();
            }
        }

        if (X.empty()) {
            std::cerr << "No training samples in " << csv_path << "\n";
            return 1;
        }

        const auto model_path = thetadesk::utils::PathUtils::resolvePath(cfg.getDTEConfig().model_path);
        thetadesk::ml::DTEOptimizer optimizer(std::make_shared<thetadesk::core::ModelStoreJson>(), model_path);

        if (!optimizer.train(X, y)) {
            std::cerr << "Training failed\n";
            return 1;
        }

        std::cout << "Trained on " << X.size() << " samples, saved to " << model_path << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Training failed: " << e.what() << "\n";
        return 1;
    }
}
