#pragma once

#include <string>
#include <filesystem>

namespace trendpilot {
namespace utils {

class PathUtils {
public:
    // 실행 파일의 디렉토리 경로 반환
    static std::filesystem::path getExecutableDir();

    // 절대 경로는 그대로, 상대 경로는 실행 파일 기준으로 변환
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    static std::filesystem::path getConfigDir();
    static std::filesystem::path getLogsDir();
};

} // namespace utils
} // namespace trendpilot
