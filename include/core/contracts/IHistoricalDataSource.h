#pragma once

#include <string>

#include "common/Types.h"

namespace thetadesk {
namespace core {

// 과거 가격 데이터 공급자 (시장 데이터 provider)
// 구현체는 실패 시 예외를 던질 수 있음 - 호출 측(IVRankEngine)이 흡수한다
class IHistoricalDataSource {
public:
    virtual ~IHistoricalDataSource() = default;

    virtual PriceSeries getHistory(
        const std::string& symbol,
        Timestamp start,
        Timestamp end
    ) = 0;
};

} // namespace core
} // namespace thetadesk
