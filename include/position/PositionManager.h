#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "analytics/AnalyticsConfig.h"
#include "analytics/MarketSnapshot.h"
#include "analytics/RegimeClassifier.h"
#include "broker/IBrokerGateway.h"
#include "journal/IEventJournal.h"
#include "position/DynamicStopLossManager.h"
#include "position/DynamicTakeProfitManager.h"
#include "position/PositionBook.h"
#include "position/PositionConfig.h"
#include "position/PositionTypes.h"
#include "position/ScalpingController.h"
#include "position/SplitOrderCoordinator.h"
#include "position/TrailingController.h"

namespace trendpilot {
namespace position {

struct EntryRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double stop_loss = 0.0;
    std::vector<double> tp_levels;
    std::vector<double> allocations;
    double trail_activation = 1.5;
    double trail_distance = 1.5;
    analytics::RegimeType regime = analytics::RegimeType::RANGING;
    double confidence = 0.0;
};

// 관리 사이클에서 심볼 단위로 공유되는 시장 정보
struct SymbolContext {
    analytics::MarketRegime regime;
    std::optional<analytics::MarketRegime> previous;
    SymbolSpec spec;
    Quote quote;
    double tp_cap = 0.0;
};

struct ManagerStats {
    long long orders_placed = 0;
    long long orders_rejected = 0;
    long long stop_modifications = 0;
    long long tp_modifications = 0;
    long long modify_failures = 0;
    long long closes = 0;
    long long time_exits = 0;
    long long scalp_exits = 0;
};

// 포지션 관리자
// - 진입: 분할 주문 그룹 생성
// - 관리: 손절 조이기 / 익절 확장 / 트레일링 / 본전 / 보유시간 청산
// - 단타 모드 (해당 타임프레임만): 동적 청산이 표준 트레일링보다 우선, pip 트레일링으로 대체
// 멤버당 사이클마다 수정 호출은 최대 1회
class PositionManager {
public:
    PositionManager(const PositionConfig& config,
                    const analytics::VolumeConfig& volume_config,
                    std::shared_ptr<broker::IBrokerGateway> broker,
                    std::shared_ptr<journal::IEventJournal> journal = nullptr);

    void updateConfig(const PositionConfig& config, const analytics::VolumeConfig& volume_config);

    // 하나도 체결되지 않으면 nullopt (그룹 미생성)
    std::optional<std::string> openGroup(const EntryRequest& request, const SymbolSpec& spec, long long now_ms);

    // 브로커 목록과 동기화. 닫힌 포지션 수 반환
    size_t reconcile(long long now_ms);

    void manageGroup(const std::string& group_id,
                     const analytics::MarketSnapshot& snapshot,
                     const SymbolContext& context,
                     long long now_ms);

    const PositionBook& book() const { return book_; }
    std::vector<AdjustmentLogEntry> recentAdjustments() const;
    const ManagerStats& stats() const { return stats_; }

private:
    bool closeMember(Ticket ticket, double price, const SymbolSpec& spec, long long now_ms,
                     AdjustmentKind kind, const std::string& reason);
    std::optional<StopCandidate> chooseGroupStop(const std::vector<Ticket>& members,
                                                 const analytics::MarketSnapshot& snapshot,
                                                 const SymbolContext& context,
                                                 OrderSide side, double price, double group_sl,
                                                 bool scalping);
    void markBreakevenIfReached(PositionBook::Entry& entry, const SymbolSpec& spec);

    void recordAdjustment(Ticket ticket, const std::string& symbol, AdjustmentKind kind,
                          double old_value, double new_value, const std::string& reason, long long now_ms);
    void journalEvent(journal::JournalEventType type, const std::string& symbol,
                      const std::string& entity_id, nlohmann::json payload, long long now_ms);

    PositionConfig config_;
    std::shared_ptr<broker::IBrokerGateway> broker_;
    std::shared_ptr<journal::IEventJournal> journal_;

    DynamicStopLossManager stop_loss_;
    DynamicTakeProfitManager take_profit_;
    TrailingController trailing_;
    ScalpingController scalping_;
    SplitOrderCoordinator splitter_;

    PositionBook book_;
    std::deque<AdjustmentLogEntry> adjustments_;
    ManagerStats stats_;
};

} // namespace position
} // namespace trendpilot
