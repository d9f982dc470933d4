#include "journal/EventJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>

namespace trendpilot {
namespace journal {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    size_t malformed = 0;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = std::max(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception&) {
            ++malformed;
        }
    }
    if (malformed > 0) {
        LOG_WARN("Journal {}: skipped {} malformed line(s)", file_path_.string(), malformed);
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Journal open failed: {}", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["symbol"] = event.symbol;
    line["entity_id"] = event.entity_id;
    line["payload"] = event.payload;

    out << line.dump() << "\n";
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::parse_error& e) {
            LOG_WARN("Journal line skipped: {}", e.what());
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournalEvent event;
        event.seq = seq;
        event.ts_ms = line.value("ts_ms", 0LL);
        event.type = fromString(line.value("type", std::string("ORDER_PLACED")));
        event.symbol = line.value("symbol", std::string());
        event.entity_id = line.value("entity_id", std::string());
        event.payload = line.value("payload", nlohmann::json::object());
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::string EventJournalJsonl::toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::GROUP_OPENED: return "GROUP_OPENED";
        case JournalEventType::ORDER_PLACED: return "ORDER_PLACED";
        case JournalEventType::ORDER_REJECTED: return "ORDER_REJECTED";
        case JournalEventType::STOP_MODIFIED: return "STOP_MODIFIED";
        case JournalEventType::TAKE_PROFIT_MODIFIED: return "TAKE_PROFIT_MODIFIED";
        case JournalEventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case JournalEventType::TIME_EXIT: return "TIME_EXIT";
        case JournalEventType::SCALP_EXIT: return "SCALP_EXIT";
        case JournalEventType::CONFIG_APPLIED: return "CONFIG_APPLIED";
    }
    return "ORDER_PLACED";
}

JournalEventType EventJournalJsonl::fromString(const std::string& value) {
    if (value == "GROUP_OPENED") return JournalEventType::GROUP_OPENED;
    if (value == "ORDER_PLACED") return JournalEventType::ORDER_PLACED;
    if (value == "ORDER_REJECTED") return JournalEventType::ORDER_REJECTED;
    if (value == "STOP_MODIFIED") return JournalEventType::STOP_MODIFIED;
    if (value == "TAKE_PROFIT_MODIFIED") return JournalEventType::TAKE_PROFIT_MODIFIED;
    if (value == "POSITION_CLOSED") return JournalEventType::POSITION_CLOSED;
    if (value == "TIME_EXIT") return JournalEventType::TIME_EXIT;
    if (value == "SCALP_EXIT") return JournalEventType::SCALP_EXIT;
    if (value == "CONFIG_APPLIED") return JournalEventType::CONFIG_APPLIED;
    return JournalEventType::ORDER_PLACED;
}

} // namespace journal
} // namespace trendpilot
