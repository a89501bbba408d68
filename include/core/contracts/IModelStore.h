#pragma once

#include <filesystem>
#include <optional>

#include "ml/RegressionForest.h"

namespace thetadesk {
namespace core {

// 학습된 모델 artifact 저장소
class IModelStore {
public:
    virtual ~IModelStore() = default;

    virtual std::optional<ml::RegressionForest> load(const std::filesystem::path& path) = 0;
    virtual bool save(const ml::RegressionForest& model, const std::filesystem::path& path) = 0;
};

} // namespace core
} // namespace thetadesk
