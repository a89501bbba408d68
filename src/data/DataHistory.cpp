#include "data/DataHistory.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace thetadesk {
namespace data {

PriceSeries DataHistory::loadCSV(const std::string& file_path) {
    PriceSeries series;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return series;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // Strip UTF-8 BOM if present at first cell.
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        // Accept quoted CSV cells.
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 2) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header or malformed row.
            continue;
        }

        try {
            const long long ts = std::stoll(row[0]);
            if (row.size() >= 6) {
                // timestamp, open, high, low, close, volume
                series.emplace_back(ts, std::stod(row[4]), std::stod(row[2]), std::stod(row[3]));
            } else if (row.size() >= 4) {
                // timestamp, close, high, low
                series.emplace_back(ts, std::stod(row[1]), std::stod(row[2]), std::stod(row[3]));
            } else {
                series.emplace_back(ts, std::stod(row[1]));
            }
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    normalize(series);
    LOG_INFO("Loaded {} bars from {}", series.size(), file_path);
    return series;
}

std::vector<OptionQuote> DataHistory::loadQuotesJSON(const std::string& file_path) {
    std::vector<OptionQuote> quotes;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return quotes;
    }

    nlohmann::json j;
    try {
        file >> j;
        const auto& items = j.contains("options") ? j["options"] : j;
        for (const auto& item : items) {
            OptionQuote q;
            q.symbol = item.value("symbol", "");
            q.strike = item.value("strike", 0.0);
            // bid/ask 누락 시 0 -> validator에서 SKIP 처리
            q.bid = item.value("bid", 0.0);
            q.ask = item.value("ask", 0.0);
            quotes.push_back(q);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
    }

    LOG_INFO("Loaded {} option quotes from {}", quotes.size(), file_path);
    return quotes;
}

PriceSeries DataHistory::filterByRange(const PriceSeries& series, long long start_ms, long long end_ms) {
    PriceSeries out;
    std::copy_if(series.begin(), series.end(), std::back_inserter(out),
                 [&](const PriceBar& b) { return b.timestamp >= start_ms && b.timestamp <= end_ms; });
    return out;
}

void DataHistory::normalize(PriceSeries& series) {
    std::stable_sort(series.begin(), series.end(), [](const PriceBar& a, const PriceBar& b) {
        return a.timestamp < b.timestamp;
    });

    PriceSeries unique;
    unique.reserve(series.size());
    for (const auto& bar : series) {
        if (!unique.empty() && unique.back().timestamp == bar.timestamp) {
            unique.back() = bar;
        } else {
            unique.push_back(bar);
        }
    }
    series.swap(unique);
}

CsvHistoricalDataSource::CsvHistoricalDataSource(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir))
{}

PriceSeries CsvHistoricalDataSource::getHistory(const std::string& symbol, Timestamp start, Timestamp end) {
    const auto path = data_dir_ / (symbol + ".csv");
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("no price history file: " + path.string());
    }

    auto series = DataHistory::loadCSV(path.string());
    return DataHistory::filterByRange(series, toEpochMs(start), toEpochMs(end));
}

} // namespace data
} // namespace thetadesk
