#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "monitor/SnapshotPublisher.h"

namespace trendpilot {
namespace monitor {

struct MonitorConfig {
    bool enabled = true;
    std::string status_path = "logs/status.json";
    std::string overrides_path = "config/overrides.json";
    int interval_seconds = 5;
};

// 별도 스레드에서 status.json 기록 + 설정 오버라이드 파일 감시.
// 거래 상태는 읽기만 하고, 오버라이드는 Config 큐에 넣어 다음 사이클에 반영
class StatusMonitor {
public:
    StatusMonitor(const MonitorConfig& config, std::shared_ptr<SnapshotPublisher> publisher);
    ~StatusMonitor();

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // 한 번 수행 (테스트/종료 시 사용)
    bool writeStatus();
    bool pollOverrides();

private:
    void run();

    MonitorConfig config_;
    std::shared_ptr<SnapshotPublisher> publisher_;

    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> worker_thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace monitor
} // namespace trendpilot
