#include "journal/EventJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>

using trendpilot::journal::EventJournalJsonl;
using trendpilot::journal::JournalEvent;
using trendpilot::journal::JournalEventType;

int main() {
    const auto path = std::filesystem::temp_directory_path() / "trendpilot_test" / "test_event_journal.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    {
        EventJournalJsonl journal(path);

        JournalEvent first;
        first.ts_ms = 1000;
        first.type = JournalEventType::ORDER_PLACED;
        first.symbol = "XAUUSD";
        first.entity_id = "101";
        first.payload["entry"] = 2000.5;

        JournalEvent second;
        second.ts_ms = 2000;
        second.type = JournalEventType::STOP_MODIFIED;
        second.symbol = "XAUUSD";
        second.entity_id = "101";
        second.payload["new"] = 1995.0;

        if (!journal.append(first)) {
            std::cerr << "[TEST] append(first) failed\n";
            return 1;
        }
        if (!journal.append(second)) {
            std::cerr << "[TEST] append(second) failed\n";
            return 1;
        }

        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        const auto rows = journal.readFrom(2);
        if (rows.size() != 1) {
            std::cerr << "[TEST] readFrom(2) should return 1 row, got " << rows.size() << "\n";
            return 1;
        }
        if (rows.front().type != JournalEventType::STOP_MODIFIED || rows.front().symbol != "XAUUSD") {
            std::cerr << "[TEST] unexpected row: " << rows.front().symbol << "\n";
            return 1;
        }
        if (rows.front().payload.value("new", 0.0) != 1995.0) {
            std::cerr << "[TEST] payload not preserved\n";
            return 1;
        }
    }

    // 깨진 줄이 있어도 재시작 후 seq 이어감
    {
        std::ofstream out(path, std::ios::app);
        out << "{not json\n";
    }

    EventJournalJsonl reopened(path);
    if (reopened.lastSeq() != 2) {
        std::cerr << "[TEST] reopened lastSeq should be 2, got " << reopened.lastSeq() << "\n";
        return 1;
    }

    JournalEvent third;
    third.ts_ms = 3000;
    third.type = JournalEventType::CONFIG_APPLIED;
    if (!reopened.append(third) || reopened.lastSeq() != 3) {
        std::cerr << "[TEST] append after reopen failed\n";
        return 1;
    }

    const auto all = reopened.readFrom(0);
    if (all.size() != 3 || all.back().type != JournalEventType::CONFIG_APPLIED) {
        std::cerr << "[TEST] readFrom(0) should return 3 rows, got " << all.size() << "\n";
        return 1;
    }

    for (auto type : {JournalEventType::GROUP_OPENED, JournalEventType::TIME_EXIT, JournalEventType::SCALP_EXIT,
                      JournalEventType::TAKE_PROFIT_MODIFIED, JournalEventType::POSITION_CLOSED}) {
        if (EventJournalJsonl::fromString(EventJournalJsonl::toString(type)) != type) {
            std::cerr << "[TEST] event type name mismatch\n";
            return 1;
        }
    }

    std::filesystem::remove(path, ec);
    std::cout << "[TEST] EventJournal PASSED\n";
    return 0;
}
