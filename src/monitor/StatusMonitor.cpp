#include "monitor/StatusMonitor.h"
#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace trendpilot {
namespace monitor {

StatusMonitor::StatusMonitor(const MonitorConfig& config, std::shared_ptr<SnapshotPublisher> publisher)
    : config_(config)
    , publisher_(std::move(publisher))
{
}

StatusMonitor::~StatusMonitor() {
    stop();
}

bool StatusMonitor::start() {
    if (running_) {
        LOG_WARN("Status monitor already running");
        return false;
    }
    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&StatusMonitor::run, this);
    LOG_INFO("Status monitor started (status={}, overrides={}, every {}s)",
             config_.status_path, config_.overrides_path, config_.interval_seconds);
    return true;
}

void StatusMonitor::stop() {
    if (!running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_ = false;
    }
    wait_cv_.notify_all();
    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    // 마지막 상태 기록
    writeStatus();
}

void StatusMonitor::run() {
    while (running_) {
        try {
            writeStatus();
            pollOverrides();
        } catch (const std::exception& e) {
            LOG_ERROR("Status monitor error: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, std::chrono::seconds(std::max(1, config_.interval_seconds)),
                          [this]() { return !running_.load(); });
    }
}

bool StatusMonitor::writeStatus() {
    if (!publisher_) return false;

    namespace fs = std::filesystem;
    fs::path path = utils::PathUtils::resolveRelativePath(config_.status_path);
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }

    // 임시 파일에 쓰고 교체 (읽는 쪽이 반쯤 쓴 파일을 보지 않도록)
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            LOG_WARN("Cannot write status file {}", tmp.string());
            return false;
        }
        out << publisher_->latest().toJson().dump(2);
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        LOG_WARN("Status file rename failed: {}", ec.message());
        return false;
    }
    return true;
}

bool StatusMonitor::pollOverrides() {
    namespace fs = std::filesystem;
    fs::path path = utils::PathUtils::resolveRelativePath(config_.overrides_path);
    if (!fs::exists(path)) {
        return false;
    }

    nlohmann::json overrides;
    bool parsed = false;
    {
        std::ifstream in(path);
        if (!in.is_open()) {
            LOG_WARN("Cannot open overrides file {}", path.string());
            return false;
        }
        try {
            in >> overrides;
            parsed = true;
        } catch (const nlohmann::json::parse_error& e) {
            LOG_ERROR("Overrides file {} is malformed: {}", path.string(), e.what());
        }
    }

    fs::path done = path;
    done += parsed ? ".applied" : ".rejected";
    std::error_code ec;
    fs::rename(path, done, ec);
    if (ec) {
        LOG_WARN("Overrides file rename failed: {}", ec.message());
    }

    if (!parsed) {
        return false;
    }

    Config::getInstance().queueOverrides(overrides);
    LOG_INFO("Config overrides queued from {}", path.string());
    return true;
}

} // namespace monitor
} // namespace trendpilot
