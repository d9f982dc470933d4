#include "engine/TradingEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "signals/LinearModelSignalSource.h"
#include "signals/PatternSignalSource.h"
#include "signals/SentimentFeedSource.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace trendpilot {
namespace engine {

TradingEngine::TradingEngine(const TradingConfig& config,
                             std::shared_ptr<broker::IBrokerGateway> broker,
                             std::shared_ptr<broker::ConnectionHealth> health,
                             std::shared_ptr<monitor::SnapshotPublisher> publisher,
                             std::shared_ptr<journal::IEventJournal> journal)
    : config_(config)
    , broker_(std::move(broker))
    , health_(std::move(health))
    , publisher_(std::move(publisher))
    , journal_(std::move(journal))
{
    if (!broker_) {
        throw ConfigError("TradingEngine requires a broker gateway");
    }

    rebuildComponents();
    risk_manager_ = std::make_unique<risk::RiskManager>(config_.risk);
    position_manager_ = std::make_unique<position::PositionManager>(
        config_.position, config_.volume, broker_, journal_);

    LOG_INFO("TradingEngine initialized ({} symbol(s), timeframe {})",
             config_.engine.symbols.size(), config_.engine.timeframe);
}

TradingEngine::~TradingEngine() {
    stop();
}

// ===== 엔진 제어 =====

bool TradingEngine::start() {
    if (running_) {
        LOG_WARN("Engine already running");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("Trading engine starting");
    LOG_INFO("========================================");

    stop_requested_ = false;
    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&TradingEngine::run, this);
    return true;
}

void TradingEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = true;
    }
    wait_cv_.notify_all();

    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
        LOG_INFO("========================================");
        LOG_INFO("Trading engine stopped after {} cycle(s), {} error(s)",
                 cycle_.load(), cycle_errors_.load());
        LOG_INFO("========================================");
    }
    worker_thread_.reset();
    running_ = false;
}

// ===== 메인 루프 =====

void TradingEngine::run() {
    running_ = true;
    LOG_INFO("Main trading loop started (every {}s)", config_.engine.cycle_interval_seconds);

    while (!stopRequested()) {
        try {
            runCycle();
        } catch (const std::exception& e) {
            cycle_errors_++;
            LOG_ERROR("Cycle {} failed: {}", cycle_.load(), e.what());
        }

        const int max_cycles = config_.engine.max_cycles;
        if (max_cycles > 0 && cycle_ >= max_cycles) {
            LOG_INFO("Reached max cycles ({}), leaving loop", max_cycles);
            break;
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, std::chrono::seconds(std::max(1, config_.engine.cycle_interval_seconds)),
                          [this]() { return stop_requested_.load(); });
    }

    running_ = false;
    LOG_INFO("Main trading loop finished");
}

void TradingEngine::runCycle() {
    const long long cycle = ++cycle_;
    const long long now = nowMs();
    auto& config = Config::getInstance();

    // 1. 모니터가 넣어둔 오버라이드는 사이클 시작에만 반영
    if (config.hasPendingOverrides()) {
        size_t applied = config.applyPendingOverrides();
        if (applied > 0) {
            applyConfig(config.getTradingConfig());
            journalConfigApplied(applied, now);
        }
    }

    LOG_DEBUG("Cycle {} begin", cycle);
    broker_->beginCycle();

    CycleData data;

    // 2. 계좌 + 일일 손익
    const bool account_ok = refreshAccount(now);

    // 3. 진입
    for (const auto& symbol : config_.engine.symbols) {
        if (stopRequested()) {
            LOG_INFO("Stop requested, skipping remaining symbols");
            break;
        }
        if (!account_ok) {
            data.statuses[symbol].symbol = symbol;
            data.statuses[symbol].last_error = "account unavailable";
            continue;
        }
        processSymbol(symbol, data, now);
    }

    // 4. 관리
    if (!stopRequested()) {
        manageOpenGroups(data, now);
    }

    for (const auto& [symbol, regime] : data.regimes) {
        last_regime_[symbol] = regime;
    }

    // 5. 스냅샷
    publishSnapshot(data, now);
    LOG_DEBUG("Cycle {} end ({} open group(s))", cycle, position_manager_->book().groupCount());
}

// ===== 설정 =====

void TradingEngine::applyConfig(const TradingConfig& config) {
    config_ = config;
    rebuildComponents();
    risk_manager_->updateConfig(config_.risk);
    position_manager_->updateConfig(config_.position, config_.volume);
    LOG_INFO("Engine configuration refreshed");
}

void TradingEngine::rebuildComponents() {
    classifier_ = std::make_unique<analytics::RegimeClassifier>(config_.regime);
    volume_ = std::make_unique<analytics::VolumeAnalyzer>(config_.volume);
    technical_ = std::make_unique<signals::TechnicalSignalGenerator>(config_.technical, *volume_);
    fusion_ = std::make_unique<signals::SignalFusionEngine>(config_.fusion);
    adapter_ = std::make_unique<risk::RiskParameterAdapter>(config_.risk);

    const auto& src = config_.sources;
    sources_ = signals::SignalSourceSet{};
    if (src.ml_enabled) {
        sources_[signals::optionalIndex(signals::SignalSource::ML)] =
            std::make_shared<signals::LinearModelSignalSource>(src.ml_model_path);
    }
    if (src.pattern_enabled) {
        sources_[signals::optionalIndex(signals::SignalSource::PATTERN)] =
            std::make_shared<signals::PatternSignalSource>(config_.pattern);
    }
    if (src.sentiment_enabled) {
        sources_[signals::optionalIndex(signals::SignalSource::SENTIMENT)] =
            std::make_shared<signals::SentimentFeedSource>(src.sentiment_path, src.sentiment_neutral_band);
    }

    LOG_DEBUG("Signal sources: ml={}, pattern={}, sentiment={}",
              src.ml_enabled, src.pattern_enabled, src.sentiment_enabled);
}

void TradingEngine::journalConfigApplied(size_t applied, long long now_ms) {
    if (!journal_) return;

    journal::JournalEvent event;
    event.ts_ms = now_ms;
    event.type = journal::JournalEventType::CONFIG_APPLIED;
    event.entity_id = "config";
    event.payload = {{"cycle", cycle_.load()}, {"overrides", applied}};
    if (!journal_->append(event)) {
        LOG_WARN("Journal append failed for CONFIG_APPLIED");
    }
}

// ===== 계좌 =====

bool TradingEngine::refreshAccount(long long now_ms) {
    try {
        account_ = broker_->getAccountBalance();
        double realized = broker_->getRealizedPnlSince(risk::RiskManager::localMidnightMs(now_ms));
        risk_manager_->updateDailyPnl(realized, account_.equity, now_ms);
        account_valid_ = true;
    } catch (const BrokerError& e) {
        cycle_errors_++;
        account_valid_ = false;
        LOG_ERROR("Account refresh failed, entries skipped this cycle: {}", e.what());
    }
    return account_valid_;
}

// ===== 진입 =====

void TradingEngine::processSymbol(const std::string& symbol, CycleData& data, long long now_ms) {
    auto& status = data.statuses[symbol];
    status.symbol = symbol;
    status.updated_ms = now_ms;

    try {
        auto bars = broker_->getHistory(symbol, config_.engine.timeframe, config_.engine.bar_count);
        auto snapshot = analytics::MarketSnapshot::build(symbol, config_.engine.timeframe,
                                                         std::move(bars), config_.indicators);
        auto regime = classifier_->classify(snapshot);
        status.regime = regime;
        data.regimes[symbol] = regime;
        const auto& stored = data.snapshots[symbol] = std::move(snapshot);

        auto technical = technical_->evaluate(stored, regime);
        auto decision = fusion_->decide(technical.component, sources_, stored, regime);
        decision.symbol = symbol;
        status.decision = decision;

        LOG_DEBUG("{} regime={} decision={} conf={:.3f} ({})", symbol,
                  regime.description, toString(decision.direction), decision.confidence, decision.reason);

        if (!decision.accepted) {
            return;
        }
        auto side = toOrderSide(decision.direction);
        if (!side) {
            return;
        }
        tryEnter(symbol, *side, decision, stored, regime, now_ms);
    } catch (const DataUnavailable& e) {
        status.last_error = e.what();
        LOG_WARN("{} skipped this cycle: {}", symbol, e.what());
    } catch (const BrokerError& e) {
        status.last_error = e.what();
        cycle_errors_++;
        LOG_ERROR("{} broker error: {} [code {}]", symbol, e.what(), e.code());
    }
}

void TradingEngine::tryEnter(const std::string& symbol,
                             OrderSide side,
                             const signals::FusedDecision& decision,
                             const analytics::MarketSnapshot& snapshot,
                             const analytics::MarketRegime& regime,
                             long long now_ms) {
    auto check = risk_manager_->canEnterPosition(
        symbol, position_manager_->book().countGroupsForSymbol(symbol));
    if (!check.allowed) {
        LOG_INFO("{} {} signal not taken: {}", symbol, toString(side), check.reason);
        return;
    }

    const SymbolSpec spec = broker_->getSymbolSpec(symbol);
    const Quote quote = broker_->getQuote(symbol);
    double entry_price = side == OrderSide::BUY ? quote.ask : quote.bid;
    if (entry_price <= 0) {
        entry_price = snapshot.lastClose();
    }

    const auto profile = adapter_->adapt(regime, side);
    const double stop_loss = adapter_->initialStopLoss(snapshot, regime, side, entry_price, profile, spec);
    const double stop_distance = std::abs(entry_price - stop_loss);
    if (stop_loss <= 0 || stop_distance <= 0) {
        LOG_WARN("{} entry skipped: no valid stop (entry {:.5f}, stop {:.5f})", symbol, entry_price, stop_loss);
        return;
    }

    risk::SizingRequest sizing_request;
    sizing_request.balance = account_.balance;
    sizing_request.risk_percent = config_.risk.risk_percent;
    sizing_request.risk_multiplier = profile.risk_multiplier;
    sizing_request.stop_distance = stop_distance;
    sizing_request.confidence_multiplier = config_.risk.use_confidence_multiplier ? decision.size_multiplier : 1.0;
    sizing_request.spec = spec;

    auto sizing = sizer_.size(sizing_request);
    if (!sizing) {
        return;
    }

    position::EntryRequest request;
    request.symbol = symbol;
    request.side = side;
    request.quantity = sizing->quantity;
    request.stop_loss = stop_loss;
    request.tp_levels = risk::PositionSizer::takeProfitLadder(
        entry_price, side, stop_distance, profile.tp_ladder, config_.risk.tpCapFor(symbol));
    request.allocations = profile.allocations;
    request.trail_activation = profile.trail_activation;
    request.trail_distance = profile.trail_distance;
    request.regime = regime.type;
    request.confidence = decision.confidence;

    LOG_INFO("{} {} signal accepted: conf {:.2f}, regime {}, qty {:.2f}, risk {:.2f}, SL {:.5f}",
             symbol, toString(side), decision.confidence, analytics::toString(regime.type),
             sizing->quantity, sizing->risk_amount, stop_loss);

    auto group_id = position_manager_->openGroup(request, spec, now_ms);
    if (group_id) {
        LOG_INFO("{} group {} opened", symbol, *group_id);
    }
}

// ===== 관리 =====

const analytics::MarketSnapshot& TradingEngine::snapshotFor(const std::string& symbol, CycleData& data) {
    auto it = data.snapshots.find(symbol);
    if (it != data.snapshots.end()) {
        return it->second;
    }

    // 설정에서 빠진 심볼의 잔여 포지션
    auto bars = broker_->getHistory(symbol, config_.engine.timeframe, config_.engine.bar_count);
    auto snapshot = analytics::MarketSnapshot::build(symbol, config_.engine.timeframe,
                                                     std::move(bars), config_.indicators);
    data.regimes[symbol] = classifier_->classify(snapshot);
    return data.snapshots[symbol] = std::move(snapshot);
}

void TradingEngine::manageOpenGroups(CycleData& data, long long now_ms) {
    try {
        size_t closed = position_manager_->reconcile(now_ms);
        if (closed > 0) {
            LOG_INFO("{} position(s) closed by broker since last cycle", closed);
        }
    } catch (const BrokerError& e) {
        cycle_errors_++;
        LOG_ERROR("Position reconcile failed, management skipped: {}", e.what());
        return;
    }

    for (const auto& group_id : position_manager_->book().groupIds()) {
        if (stopRequested()) {
            LOG_INFO("Stop requested, skipping remaining groups");
            break;
        }

        const auto* group = position_manager_->book().group(group_id);
        if (!group) continue;
        const std::string symbol = group->symbol;

        try {
            const auto& snapshot = snapshotFor(symbol, data);

            position::SymbolContext context;
            context.regime = data.regimes[symbol];
            auto prev = last_regime_.find(symbol);
            if (prev != last_regime_.end()) {
                context.previous = prev->second;
            }
            context.spec = broker_->getSymbolSpec(symbol);
            context.quote = broker_->getQuote(symbol);
            context.tp_cap = config_.risk.tpCapFor(symbol);

            position_manager_->manageGroup(group_id, snapshot, context, now_ms);
        } catch (const DataUnavailable& e) {
            LOG_WARN("Group {} not managed this cycle: {}", group_id, e.what());
        } catch (const BrokerError& e) {
            cycle_errors_++;
            LOG_ERROR("Group {} management failed: {} [code {}]", group_id, e.what(), e.code());
        }
    }
}

// ===== 스냅샷 =====

void TradingEngine::publishSnapshot(const CycleData& data, long long now_ms) {
    if (!publisher_) return;

    monitor::EngineSnapshot snapshot;
    snapshot.ts_ms = now_ms;
    snapshot.cycle = cycle_;
    snapshot.cycle_errors = cycle_errors_;
    snapshot.running = !stopRequested();
    snapshot.trading_paused = risk_manager_->isTradingPaused();
    snapshot.daily_loss_percent = risk_manager_->dailyLossPercent();
    snapshot.account = account_;

    if (health_) {
        auto state = health_->state();
        snapshot.broker_status = broker::ConnectionHealth::toString(state.status);
        snapshot.broker_consecutive_failures = state.consecutive_failures;
        snapshot.broker_last_error = state.last_error_message;
    }

    for (const auto& symbol : config_.engine.symbols) {
        auto it = data.statuses.find(symbol);
        if (it != data.statuses.end()) {
            snapshot.symbols.push_back(it->second);
        }
    }

    snapshot.positions = position_manager_->book().records();
    snapshot.adjustments = position_manager_->recentAdjustments();
    snapshot.stats = position_manager_->stats();

    publisher_->publish(std::move(snapshot));
}

} // namespace engine
} // namespace trendpilot
