#include "core/state/ModelStoreJson.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>

namespace thetadesk {
namespace core {

namespace {

// 실패한 저장의 잔여 .tmp 정리 (빈 디렉터리도 포함)
void discardTemp(const std::filesystem::path& tmp_path) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    if (ec) {
        LOG_WARN("Cannot remove temp model file {}: {}", tmp_path.string(), ec.message());
    }
}

} // namespace

std::optional<ml::RegressionForest> ModelStoreJson::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        LOG_WARN("Cannot open model artifact: {}", path.string());
        return std::nullopt;
    }

    try {
        nlohmann::json raw;
        in >> raw;
        return ml::RegressionForest::fromJson(raw);
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading model artifact {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

bool ModelStoreJson::save(const ml::RegressionForest& model, const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create model directory {}: {}", path.parent_path().string(), ec.message());
            return false;
        }
    }

    auto tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Cannot open temp model file: {}", tmp_path.string());
            discardTemp(tmp_path);
            return false;
        }
        out << model.toJson().dump();
        out.flush();
        if (!out) {
            LOG_ERROR("Error writing temp model file: {}", tmp_path.string());
            out.close();
            discardTemp(tmp_path);
            return false;
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (!ec) {
        return true;
    }

    // rename 실패 시 copy + remove 로 대체
    LOG_WARN("Rename {} -> {} failed ({}), copying instead", tmp_path.string(), path.string(), ec.message());
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        path,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        LOG_ERROR("Cannot save model artifact {}: {}", path.string(), ec.message());
        discardTemp(tmp_path);
        return false;
    }

    discardTemp(tmp_path);
    return true;
}

} // namespace core
} // namespace thetadesk
