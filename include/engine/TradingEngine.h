#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "common/Config.h"
#include "common/Types.h"
#include "analytics/MarketSnapshot.h"
#include "analytics/RegimeClassifier.h"
#include "analytics/VolumeAnalyzer.h"
#include "broker/ConnectionHealth.h"
#include "broker/IBrokerGateway.h"
#include "journal/IEventJournal.h"
#include "monitor/EngineSnapshot.h"
#include "monitor/SnapshotPublisher.h"
#include "position/PositionManager.h"
#include "risk/PositionSizer.h"
#include "risk/RiskManager.h"
#include "risk/RiskParameterAdapter.h"
#include "signals/SignalFusionEngine.h"
#include "signals/TechnicalSignalGenerator.h"

namespace trendpilot {
namespace engine {

// Trading Engine - 진입 신호 + 포지션 관리 루프
//
// 사이클마다:
//   1. 대기 중인 설정 오버라이드 반영
//   2. 계좌/일일 손익 갱신
//   3. 심볼별 레짐 -> 신호 결합 -> 리스크 -> 사이징 -> 분할 진입
//   4. 보유 그룹별 손절/익절/트레일링/본전/보유시간 관리
//   5. 모니터용 스냅샷 발행
// 중지 요청은 심볼 사이, 그룹 사이에서 확인한다
class TradingEngine {
public:
    TradingEngine(const TradingConfig& config,
                  std::shared_ptr<broker::IBrokerGateway> broker,
                  std::shared_ptr<broker::ConnectionHealth> health = nullptr,
                  std::shared_ptr<monitor::SnapshotPublisher> publisher = nullptr,
                  std::shared_ptr<journal::IEventJournal> journal = nullptr);

    ~TradingEngine();

    // ===== 엔진 제어 =====

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // ===== 메인 루프 =====

    void run();         // 블로킹. max_cycles 에 도달하거나 stop() 까지
    void runCycle();    // 한 사이클 (테스트용으로 공개)

    // ===== 상태 조회 =====

    long long cycleCount() const { return cycle_; }
    long long cycleErrors() const { return cycle_errors_; }
    const position::PositionManager& positions() const { return *position_manager_; }
    const risk::RiskManager& riskManager() const { return *risk_manager_; }
    const TradingConfig& config() const { return config_; }

private:
    // 사이클 동안만 유지되는 심볼별 계산 결과
    struct CycleData {
        std::map<std::string, analytics::MarketSnapshot> snapshots;
        std::map<std::string, analytics::MarketRegime> regimes;
        std::map<std::string, monitor::SymbolStatus> statuses;
    };

    void applyConfig(const TradingConfig& config);
    void rebuildComponents();
    bool stopRequested() const { return stop_requested_.load(); }

    bool refreshAccount(long long now_ms);
    void processSymbol(const std::string& symbol, CycleData& data, long long now_ms);
    void tryEnter(const std::string& symbol,
                  OrderSide side,
                  const signals::FusedDecision& decision,
                  const analytics::MarketSnapshot& snapshot,
                  const analytics::MarketRegime& regime,
                  long long now_ms);

    void manageOpenGroups(CycleData& data, long long now_ms);
    const analytics::MarketSnapshot& snapshotFor(const std::string& symbol, CycleData& data);

    void publishSnapshot(const CycleData& data, long long now_ms);
    void journalConfigApplied(size_t applied, long long now_ms);

    TradingConfig config_;
    std::shared_ptr<broker::IBrokerGateway> broker_;
    std::shared_ptr<broker::ConnectionHealth> health_;
    std::shared_ptr<monitor::SnapshotPublisher> publisher_;
    std::shared_ptr<journal::IEventJournal> journal_;

    // 설정이 바뀌면 다시 생성 (상태 없음)
    std::unique_ptr<analytics::RegimeClassifier> classifier_;
    std::unique_ptr<analytics::VolumeAnalyzer> volume_;
    std::unique_ptr<signals::TechnicalSignalGenerator> technical_;
    std::unique_ptr<signals::SignalFusionEngine> fusion_;
    std::unique_ptr<risk::RiskParameterAdapter> adapter_;
    signals::SignalSourceSet sources_;
    risk::PositionSizer sizer_;

    // 상태 보유 (설정 변경 시 updateConfig)
    std::unique_ptr<risk::RiskManager> risk_manager_;
    std::unique_ptr<position::PositionManager> position_manager_;

    // 다운그레이드 판정용 직전 사이클 레짐
    std::map<std::string, analytics::MarketRegime> last_regime_;
    AccountInfo account_;
    bool account_valid_ = false;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<long long> cycle_{0};
    std::atomic<long long> cycle_errors_{0};
    std::unique_ptr<std::thread> worker_thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace engine
} // namespace trendpilot
