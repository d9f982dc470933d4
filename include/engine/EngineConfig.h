#pragma once

#include <string>
#include <vector>

namespace trendpilot {
namespace engine {

// 엔진 설정
struct EngineConfig {
    std::vector<std::string> symbols;
    std::string timeframe;
    int bar_count;

    // 사이클 설정
    int cycle_interval_seconds;
    int max_cycles;                 // 0 이면 무제한 (리플레이 실행 시 사용)

    std::string journal_path = "logs/journal.jsonl";

    EngineConfig()
        : symbols{"XAUUSD"}
        , timeframe("H1")
        , bar_count(300)
        , cycle_interval_seconds(60)
        , max_cycles(0)
    {}
};

} // namespace engine
} // namespace trendpilot
