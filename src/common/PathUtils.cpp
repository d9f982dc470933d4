#include "common/PathUtils.h"

#include <system_error>

namespace trendpilot {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        // /proc 가 없는 환경에서는 작업 디렉토리 기준
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    std::filesystem::path p(relative_path);
    if (p.is_absolute()) {
        return p;
    }
    // 작업 디렉토리에 이미 있으면 우선 사용
    if (std::filesystem::exists(p)) {
        return std::filesystem::absolute(p);
    }
    return getExecutableDir() / p;
}

std::filesystem::path PathUtils::getConfigDir() {
    return getExecutableDir() / "config";
}

std::filesystem::path PathUtils::getLogsDir() {
    return getExecutableDir() / "logs";
}

} // namespace utils
} // namespace trendpilot
