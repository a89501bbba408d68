#include "common/PathUtils.h"
#include <system_error>

namespace thetadesk {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    std::filesystem::path exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        // procfs 없는 환경: 현재 작업 디렉토리 기준
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    return getExecutableDir() / relative_path;
}

std::filesystem::path PathUtils::resolvePath(const std::string& path) {
    std::filesystem::path p(path);
    if (p.is_absolute()) {
        return p;
    }
    std::error_code ec;
    if (std::filesystem::exists(p, ec)) {
        return std::filesystem::absolute(p, ec);
    }
    return resolveRelativePath(path);
}

} // namespace utils
} // namespace thetadesk
