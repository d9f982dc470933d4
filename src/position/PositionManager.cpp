#include "position/PositionManager.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TickSizeHelper.h"

#include <cmath>

namespace trendpilot {
namespace position {

using journal::JournalEventType;

namespace {
bool isTighter(OrderSide side, double candidate, double current) {
    if (current <= 0) return candidate > 0;
    return (candidate - current) * sideSign(side) > 0;
}
}

PositionManager::PositionManager(const PositionConfig& config,
                                 const analytics::VolumeConfig& volume_config,
                                 std::shared_ptr<broker::IBrokerGateway> broker,
                                 std::shared_ptr<journal::IEventJournal> journal)
    : config_(config)
    , broker_(std::move(broker))
    , journal_(std::move(journal))
    , stop_loss_(config.stop_loss)
    , take_profit_(config.take_profit, analytics::VolumeAnalyzer(volume_config))
    , trailing_(config.trailing, config.breakeven, config.time_exit)
    , scalping_(config.scalping)
    , splitter_(config.split_orders)
{
    if (!broker_) {
        throw ConfigError("PositionManager requires a broker gateway");
    }
}

void PositionManager::updateConfig(const PositionConfig& config, const analytics::VolumeConfig& volume_config) {
    config_ = config;
    stop_loss_ = DynamicStopLossManager(config.stop_loss);
    take_profit_ = DynamicTakeProfitManager(config.take_profit, analytics::VolumeAnalyzer(volume_config));
    trailing_ = TrailingController(config.trailing, config.breakeven, config.time_exit);
    scalping_ = ScalpingController(config.scalping);
    splitter_ = SplitOrderCoordinator(config.split_orders);
}

std::optional<std::string> PositionManager::openGroup(const EntryRequest& request, const SymbolSpec& spec,
                                                      long long now_ms) {
    auto legs = splitter_.plan(request.quantity, request.tp_levels, request.allocations, spec);
    if (legs.empty()) {
        LOG_WARN("{} entry skipped: quantity {:.4f} cannot be split into valid orders",
                 request.symbol, request.quantity);
        return std::nullopt;
    }

    const double stop_loss = request.stop_loss > 0
        ? common::roundStopForSide(request.stop_loss, spec, request.side) : 0.0;

    std::string group_id;
    for (const auto& leg : legs) {
        double take_profit = 0.0;
        if (leg.take_profit > 0) {
            take_profit = request.side == OrderSide::BUY
                ? common::roundDownToTickSize(leg.take_profit, spec.tick_size)
                : common::roundUpToTickSize(leg.take_profit, spec.tick_size);
        }
        const std::string comment = "tp" + std::to_string(leg.rung_index + 1);

        PositionRecord record;
        try {
            record = broker_->placeOrder(request.symbol, request.side, leg.quantity,
                                         stop_loss, take_profit, comment);
        } catch (const OrderRejected& e) {
            LOG_WARN("Order rejected {} {} {:.2f} (rung {}): {} [code {}]",
                     request.symbol, toString(request.side), leg.quantity, leg.rung_index + 1,
                     e.what(), e.code());
            stats_.orders_rejected++;
            journalEvent(JournalEventType::ORDER_REJECTED, request.symbol, comment,
                         {{"reason", e.what()}, {"code", e.code()}, {"quantity", leg.quantity}}, now_ms);
            continue;
        } catch (const BrokerError& e) {
            LOG_ERROR("Order failed {} {} {:.2f} (rung {}): {}",
                      request.symbol, toString(request.side), leg.quantity, leg.rung_index + 1, e.what());
            stats_.orders_rejected++;
            journalEvent(JournalEventType::ORDER_REJECTED, request.symbol, comment,
                         {{"reason", e.what()}, {"code", e.code()}, {"quantity", leg.quantity}}, now_ms);
            continue;
        }

        if (group_id.empty()) {
            group_id = book_.createGroup(request.symbol, request.side, request.regime, now_ms);
        }

        ManagedState state;
        state.best_price = record.entry_price;
        state.rung_index = leg.rung_index;
        state.rung_scale = leg.rung_scale;
        state.trail_activation = request.trail_activation;
        state.trail_distance = request.trail_distance;
        book_.add(group_id, record, state);
        stats_.orders_placed++;

        journalEvent(JournalEventType::ORDER_PLACED, request.symbol, std::to_string(record.ticket),
                     {{"group", group_id}, {"side", toString(request.side)},
                      {"quantity", record.quantity}, {"entry", record.entry_price},
                      {"stop_loss", record.stop_loss}, {"take_profit", record.take_profit},
                      {"rung", leg.rung_index}}, now_ms);
        Logger::getInstance().logTrade(request.symbol, toString(request.side), record.entry_price,
                                       record.quantity, 0.0, "OPEN " + comment);
    }

    if (group_id.empty()) {
        LOG_WARN("{} entry failed: no order of {} accepted", request.symbol, legs.size());
        return std::nullopt;
    }

    const auto* group = book_.group(group_id);
    size_t placed = group ? group->members.size() : 0;
    LOG_INFO("Group {} opened: {} {} members={}/{} sl={:.5f} regime={} confidence={:.2f}",
             group_id, request.symbol, toString(request.side), placed, legs.size(), stop_loss,
             analytics::toString(request.regime), request.confidence);
    journalEvent(JournalEventType::GROUP_OPENED, request.symbol, group_id,
                 {{"side", toString(request.side)}, {"members", placed}, {"planned", legs.size()},
                  {"stop_loss", stop_loss}, {"regime", analytics::toString(request.regime)},
                  {"confidence", request.confidence}}, now_ms);
    return group_id;
}

size_t PositionManager::reconcile(long long now_ms) {
    auto open_positions = broker_->listOpenPositions();
    auto closed = book_.reconcile(open_positions, now_ms);

    for (const auto& record : closed) {
        stats_.closes++;
        LOG_INFO("Position {} {} {} closed at broker (sl={:.5f} tp={:.5f})",
                 record.ticket, record.symbol, toString(record.side), record.stop_loss, record.take_profit);
        recordAdjustment(record.ticket, record.symbol, AdjustmentKind::CLOSED, record.quantity, 0.0,
                         "closed at broker", now_ms);
        journalEvent(JournalEventType::POSITION_CLOSED, record.symbol, std::to_string(record.ticket),
                     {{"side", toString(record.side)}, {"quantity", record.quantity},
                      {"entry", record.entry_price}, {"stop_loss", record.stop_loss},
                      {"take_profit", record.take_profit}}, now_ms);
    }
    return closed.size();
}

bool PositionManager::closeMember(Ticket ticket, double price, const SymbolSpec& spec, long long now_ms,
                                  AdjustmentKind kind, const std::string& reason) {
    auto* entry = book_.find(ticket);
    if (!entry) return false;
    const PositionRecord record = entry->record;
    const char* tag = toString(kind);

    try {
        broker_->closePosition(ticket, std::nullopt);
    } catch (const BrokerError& e) {
        LOG_WARN("{} close failed for {} {}: {} [code {}]", tag, ticket, record.symbol, e.what(), e.code());
        return false;
    }

    book_.remove(ticket);
    if (kind == AdjustmentKind::SCALP_EXIT) {
        stats_.scalp_exits++;
    } else {
        stats_.time_exits++;
    }

    double pnl = 0.0;
    if (spec.tick_size > 0) {
        pnl = (price - record.entry_price) * sideSign(record.side) / spec.tick_size * spec.tick_value * record.quantity;
    }
    double age_min = static_cast<double>(now_ms - record.open_time) / 60000.0;
    LOG_INFO("{} {} {} held {:.0f} min, pnl~{:.2f} ({})", tag, ticket, record.symbol, age_min, pnl, reason);
    Logger::getInstance().logTrade(record.symbol, toString(record.side), price, record.quantity, pnl, tag);

    recordAdjustment(ticket, record.symbol, kind, record.entry_price, price, reason, now_ms);
    journalEvent(kind == AdjustmentKind::SCALP_EXIT ? JournalEventType::SCALP_EXIT : JournalEventType::TIME_EXIT,
                 record.symbol, std::to_string(ticket),
                 {{"price", price}, {"pnl", pnl}, {"age_minutes", age_min}, {"reason", reason}}, now_ms);
    return true;
}

std::optional<StopCandidate> PositionManager::chooseGroupStop(const std::vector<Ticket>& members,
                                                              const analytics::MarketSnapshot& snapshot,
                                                              const SymbolContext& context,
                                                              OrderSide side, double price, double group_sl,
                                                              bool scalping) {
    std::vector<StopCandidate> candidates;
    const double atr = snapshot.currentAtr();

    // 그룹 공통 동적 손절 (가장 조인 손절 기준)
    if (const auto* first = book_.find(members.front())) {
        PositionRecord representative = first->record;
        representative.stop_loss = group_sl;
        if (auto c = stop_loss_.evaluate(representative, snapshot, context.regime, context.previous, price)) {
            candidates.push_back(*c);
        }
    }

    for (Ticket ticket : members) {
        auto* entry = book_.find(ticket);
        if (!entry) continue;
        auto trail = scalping
            ? scalping_.trailingStop(entry->record, price, scalping_.pipSize(context.spec))
            : trailing_.trailingStop(entry->record, entry->state, price, atr);
        if (trail) {
            candidates.push_back(*trail);
        }
        if (auto c = trailing_.breakevenStop(entry->record, entry->state, price, atr, context.spec)) {
            candidates.push_back(*c);
        }
    }

    std::optional<StopCandidate> chosen;
    for (auto c : candidates) {
        c.price = common::roundStopForSide(c.price, context.spec, side);
        if (!DynamicStopLossManager::isImprovement(side, group_sl, c.price, price, 0.0)) {
            continue;
        }
        if (!chosen || isTighter(side, c.price, chosen->price)) {
            chosen = c;
        }
    }
    return chosen;
}

void PositionManager::markBreakevenIfReached(PositionBook::Entry& entry, const SymbolSpec& spec) {
    if (entry.state.breakeven_applied || entry.record.stop_loss <= 0) return;
    const double sign = sideSign(entry.record.side);
    double level = entry.record.entry_price + sign * spec.spread * config_.breakeven.spread_multiplier;
    if ((entry.record.stop_loss - level) * sign >= -common::kStepEpsilon) {
        entry.state.breakeven_applied = true;
    }
}

void PositionManager::manageGroup(const std::string& group_id,
                                  const analytics::MarketSnapshot& snapshot,
                                  const SymbolContext& context,
                                  long long now_ms) {
    const auto* group = book_.group(group_id);
    if (!group) return;

    const std::vector<Ticket> members = group->members;
    const std::string symbol = group->symbol;
    const OrderSide side = group->side;

    double price = side == OrderSide::BUY ? context.quote.bid : context.quote.ask;
    if (price <= 0) {
        price = snapshot.lastClose();
    }
    if (price <= 0) {
        LOG_WARN("Group {}: no price available, skipped", group_id);
        return;
    }

    // 1. 보유시간 청산이 최우선, 다음 단타 청산
    const bool scalping = scalping_.appliesTo(snapshot);
    const double pip = scalping_.pipSize(context.spec);
    std::vector<Ticket> remaining;
    for (Ticket ticket : members) {
        auto* entry = book_.find(ticket);
        if (!entry) continue;
        if (trailing_.shouldTimeExit(entry->record, now_ms)) {
            if (closeMember(ticket, price, context.spec, now_ms, AdjustmentKind::TIME_EXIT, "max hold time reached")) {
                continue;
            }
        }
        if (scalping) {
            if (auto exit = scalping_.shouldExit(entry->record, snapshot, price, pip, now_ms)) {
                LOG_INFO("Scalping exit for {} {}: {}", ticket, symbol, toString(exit->type));
                if (closeMember(ticket, price, context.spec, now_ms, AdjustmentKind::SCALP_EXIT, exit->reason)) {
                    continue;
                }
            }
        }
        remaining.push_back(ticket);
    }
    if (remaining.empty()) return;

    // 2. 그룹 손절: 멤버 중 가장 조인 값 기준으로 후보 선택
    double group_sl = 0.0;
    for (Ticket ticket : remaining) {
        const auto* entry = book_.find(ticket);
        if (entry && entry->record.stop_loss > 0 && isTighter(side, entry->record.stop_loss, group_sl)) {
            group_sl = entry->record.stop_loss;
        }
    }

    auto chosen = chooseGroupStop(remaining, snapshot, context, side, price, group_sl, scalping);
    const double target_sl = chosen ? chosen->price : group_sl;

    // 3. 멤버별 단일 수정 (손절 + 익절)
    for (Ticket ticket : remaining) {
        auto* entry = book_.find(ticket);
        if (!entry) continue;

        const double old_sl = entry->record.stop_loss;
        const double old_tp = entry->record.take_profit;

        std::optional<double> new_sl;
        if (target_sl > 0 && isTighter(side, target_sl, old_sl) && (price - target_sl) * sideSign(side) > 0) {
            new_sl = target_sl;
        }

        std::optional<double> new_tp;
        if (auto tp = take_profit_.evaluate(entry->record, snapshot, context.regime, price,
                                            context.tp_cap, entry->state.rung_scale)) {
            // 진입가 쪽으로 반올림해야 cap 을 넘지 않는다
            double rounded = side == OrderSide::BUY
                ? common::roundDownToTickSize(tp->price, context.spec.tick_size)
                : common::roundUpToTickSize(tp->price, context.spec.tick_size);
            if (DynamicTakeProfitManager::isExtension(side, entry->record.entry_price, old_tp, rounded, price, 0.0)) {
                new_tp = rounded;
                LOG_DEBUG("{} tp candidate {:.5f} ({})", ticket, rounded, tp->reason);
            }
        }

        if (!new_sl && !new_tp) {
            markBreakevenIfReached(*entry, context.spec);
            continue;
        }

        try {
            broker_->modifyPosition(ticket, new_sl, new_tp);
        } catch (const BrokerError& e) {
            stats_.modify_failures++;
            LOG_WARN("Modify rejected for {} {}: {} [code {}]", ticket, symbol, e.what(), e.code());
            continue;
        }

        book_.updateStops(ticket, new_sl.value_or(old_sl), new_tp.value_or(old_tp));

        if (new_sl) {
            stats_.stop_modifications++;
            AdjustmentKind kind = chosen && *new_sl == chosen->price ? chosen->kind : AdjustmentKind::STOP_LOSS;
            std::string reason = chosen && *new_sl == chosen->price ? chosen->reason : "group stop propagation";
            LOG_INFO("{} {} SL {:.5f} -> {:.5f} ({})", symbol, ticket, old_sl, *new_sl, reason);
            recordAdjustment(ticket, symbol, kind, old_sl, *new_sl, reason, now_ms);
            journalEvent(JournalEventType::STOP_MODIFIED, symbol, std::to_string(ticket),
                         {{"old", old_sl}, {"new", *new_sl}, {"kind", toString(kind)}, {"reason", reason}}, now_ms);
        }
        if (new_tp) {
            stats_.tp_modifications++;
            LOG_INFO("{} {} TP {:.5f} -> {:.5f}", symbol, ticket, old_tp, *new_tp);
            recordAdjustment(ticket, symbol, AdjustmentKind::TAKE_PROFIT, old_tp, *new_tp, "take profit extension", now_ms);
            journalEvent(JournalEventType::TAKE_PROFIT_MODIFIED, symbol, std::to_string(ticket),
                         {{"old", old_tp}, {"new", *new_tp}}, now_ms);
        }

        markBreakevenIfReached(*entry, context.spec);
    }
}

std::vector<AdjustmentLogEntry> PositionManager::recentAdjustments() const {
    return std::vector<AdjustmentLogEntry>(adjustments_.begin(), adjustments_.end());
}

void PositionManager::recordAdjustment(Ticket ticket, const std::string& symbol, AdjustmentKind kind,
                                       double old_value, double new_value, const std::string& reason,
                                       long long now_ms) {
    AdjustmentLogEntry entry;
    entry.ts_ms = now_ms;
    entry.ticket = ticket;
    entry.symbol = symbol;
    entry.kind = kind;
    entry.old_value = old_value;
    entry.new_value = new_value;
    entry.reason = reason;

    adjustments_.push_back(std::move(entry));
    while (adjustments_.size() > config_.adjustment_log_capacity && !adjustments_.empty()) {
        adjustments_.pop_front();
    }
}

void PositionManager::journalEvent(JournalEventType type, const std::string& symbol,
                                   const std::string& entity_id, nlohmann::json payload, long long now_ms) {
    if (!journal_) return;

    journal::JournalEvent event;
    event.ts_ms = now_ms;
    event.type = type;
    event.symbol = symbol;
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("Journal append failed for {} {}", symbol, entity_id);
    }
}

} // namespace position
} // namespace trendpilot
