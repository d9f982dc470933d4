#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace trendpilot {
namespace journal {

enum class JournalEventType {
    GROUP_OPENED,
    ORDER_PLACED,
    ORDER_REJECTED,
    STOP_MODIFIED,
    TAKE_PROFIT_MODIFIED,
    POSITION_CLOSED,
    TIME_EXIT,
    SCALP_EXIT,
    CONFIG_APPLIED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::ORDER_PLACED;
    std::string symbol;
    std::string entity_id;      // 티켓 또는 그룹 ID
    nlohmann::json payload = nlohmann::json::object();
};

class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    virtual bool append(const JournalEvent& event) = 0;
    virtual std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace journal
} // namespace trendpilot
