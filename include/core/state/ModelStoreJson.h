#pragma once

#include <filesystem>
#include <optional>

#include "core/contracts/IModelStore.h"

namespace thetadesk {
namespace core {

// JSON 파일 기반 모델 저장소 (tmp 파일에 쓰고 rename)
class ModelStoreJson : public IModelStore {
public:
    std::optional<ml::RegressionForest> load(const std::filesystem::path& path) override;
    bool save(const ml::RegressionForest& model, const std::filesystem::path& path) override;
};

} // namespace core
} // namespace thetadesk
