#include "monitor/SnapshotPublisher.h"

namespace trendpilot {
namespace monitor {

void SnapshotPublisher::publish(EngineSnapshot snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = std::move(snapshot);
    ++version_;
}

EngineSnapshot SnapshotPublisher::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

std::uint64_t SnapshotPublisher::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

} // namespace monitor
} // namespace trendpilot
