#pragma once

#include <string>
#include <filesystem>

namespace thetadesk {
namespace utils {

class PathUtils {
public:
    // 실행 파일의 디렉토리 경로 반환
    static std::filesystem::path getExecutableDir();

    // 실행 파일 기준 상대 경로를 절대 경로로 변환
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    // 절대 경로는 그대로, 현재 디렉토리에 있으면 그것, 아니면 실행 파일 기준
    static std::filesystem::path resolvePath(const std::string& path);
};

} // namespace utils
} // namespace thetadesk
