#pragma once

#include <cstdint>
#include <mutex>

#include "monitor/EngineSnapshot.h"

namespace trendpilot {
namespace monitor {

// 트레이딩 루프 -> 모니터 단방향 전달. 항상 복사본을 주고받는다
class SnapshotPublisher {
public:
    void publish(EngineSnapshot snapshot);
    EngineSnapshot latest() const;
    std::uint64_t version() const;

private:
    mutable std::mutex mutex_;
    EngineSnapshot snapshot_;
    std::uint64_t version_ = 0;
};

} // namespace monitor
} // namespace trendpilot
