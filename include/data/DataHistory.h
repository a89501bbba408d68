#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IHistoricalDataSource.h"

namespace thetadesk {
namespace data {

class DataHistory {
public:
    // Load daily bars from a CSV file (timestamp = epoch ms)
    // Accepted formats:
    //   timestamp,close
    //   timestamp,close,high,low
    //   timestamp,open,high,low,close,volume
    static PriceSeries loadCSV(const std::string& file_path);

    // Load option quotes: [{"symbol":..., "strike":..., "bid":..., "ask":...}, ...]
    static std::vector<OptionQuote> loadQuotesJSON(const std::string& file_path);

    // [start_ms, end_ms] 범위만 남김
    static PriceSeries filterByRange(const PriceSeries& series, long long start_ms, long long end_ms);

    // 시간 오름차순 정렬, 중복 timestamp는 마지막 값 유지
    static void normalize(PriceSeries& series);
};

// <data_dir>/<SYMBOL>.csv 를 읽는 provider
class CsvHistoricalDataSource : public core::IHistoricalDataSource {
public:
    explicit CsvHistoricalDataSource(std::filesystem::path data_dir);

    // 파일이 없으면 std::runtime_error
    PriceSeries getHistory(const std::string& symbol, Timestamp start, Timestamp end) override;

private:
    std::filesystem::path data_dir_;
};

} // namespace data
} // namespace thetadesk
