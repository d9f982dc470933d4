#include "broker/PaperBroker.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "common/TickSizeHelper.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

namespace trendpilot {
namespace broker {

namespace {
// MT5 와 같은 거부 코드
constexpr int kRetcodeInvalidVolume = 10014;
constexpr int kRetcodeInvalidStops = 10016;
constexpr int kRetcodePositionNotFound = 10036;
}

PaperBroker::PaperBroker(const PaperBrokerConfig& config)
    : config_(config)
{
}

void PaperBroker::loadSymbolFile(const std::string& symbol) {
    std::filesystem::path path = utils::PathUtils::resolveRelativePath(config_.data_dir) / (symbol + ".json");
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DataUnavailable("no replay data for " + symbol + " at " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw DataUnavailable("malformed replay data for " + symbol + ": " + e.what());
    }

    SymbolSpec spec;
    spec.symbol = symbol;
    nlohmann::json bars_json = j;
    if (j.is_object()) {
        bars_json = j.value("bars", nlohmann::json::array());
        if (j.contains("spec")) {
            const auto& s = j["spec"];
            spec.digits = s.value("digits", spec.digits);
            spec.tick_size = s.value("tick_size", spec.tick_size);
            spec.tick_value = s.value("tick_value", spec.tick_value);
            spec.min_lot = s.value("min_lot", spec.min_lot);
            spec.max_lot = s.value("max_lot", spec.max_lot);
            spec.lot_step = s.value("lot_step", spec.lot_step);
            spec.spread = s.value("spread", spec.spread);
        }
    }

    loadSymbol(symbol, analytics::TechnicalIndicators::jsonToCandles(bars_json), spec);
}

void PaperBroker::loadSymbol(const std::string& symbol, std::vector<Candle> bars, const SymbolSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    SymbolFeed feed;
    feed.spec = spec;
    feed.spec.symbol = symbol;
    feed.bars = std::move(bars);
    feed.cursor = std::min(feed.bars.size(), static_cast<size_t>(std::max(1, config_.warmup_bars)));
    LOG_INFO("Paper feed {}: {} bars loaded, {} visible", symbol, feed.bars.size(), feed.cursor);
    feeds_[symbol] = std::move(feed);
}

const PaperBroker::SymbolFeed& PaperBroker::feedFor(const std::string& symbol) const {
    auto it = feeds_.find(symbol);
    if (it == feeds_.end() || it->second.bars.empty()) {
        throw DataUnavailable("unknown symbol " + symbol);
    }
    return it->second;
}

Quote PaperBroker::quoteLocked(const SymbolFeed& feed) const {
    const Candle& bar = feed.bars[feed.cursor - 1];
    Quote q;
    q.bid = bar.close - feed.spec.spread / 2.0;
    q.ask = bar.close + feed.spec.spread / 2.0;
    q.timestamp = bar.timestamp;
    return q;
}

double PaperBroker::pnlFor(const PositionRecord& position, double exit_price, double quantity) const {
    auto it = feeds_.find(position.symbol);
    double tick_size = it != feeds_.end() ? it->second.spec.tick_size : 0.01;
    double tick_value = it != feeds_.end() ? it->second.spec.tick_value : 1.0;
    if (tick_size <= 0) tick_size = 0.01;
    return (exit_price - position.entry_price) * sideSign(position.side) / tick_size * tick_value * quantity;
}

void PaperBroker::closeLocked(Ticket ticket, double exit_price, double quantity, const std::string& reason) {
    auto it = positions_.find(ticket);
    if (it == positions_.end()) return;

    double closed_qty = std::min(quantity, it->second.quantity);
    double pnl = pnlFor(it->second, exit_price, closed_qty);
    realized_total_ += pnl;
    closed_.push_back({nowMs(), pnl});

    LOG_INFO("[PAPER] {} {} {:.2f} @ {:.5f} closed ({}) pnl={:.2f}",
             it->second.symbol, ticket, closed_qty, exit_price, reason, pnl);

    it->second.quantity -= closed_qty;
    if (it->second.quantity <= common::kStepEpsilon) {
        positions_.erase(it);
    }
}

std::vector<Candle> PaperBroker::getHistory(const std::string& symbol,
                                            const std::string& /*timeframe*/,
                                            int bar_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& feed = feedFor(symbol);
    size_t count = static_cast<size_t>(std::max(0, bar_count));
    size_t begin = feed.cursor > count ? feed.cursor - count : 0;
    return std::vector<Candle>(feed.bars.begin() + begin, feed.bars.begin() + feed.cursor);
}

AccountInfo PaperBroker::getAccountBalance() {
    std::lock_guard<std::mutex> lock(mutex_);
    AccountInfo info;
    info.balance = config_.initial_balance + realized_total_;

    double unrealized = 0.0;
    for (const auto& [ticket, pos] : positions_) {
        auto it = feeds_.find(pos.symbol);
        if (it == feeds_.end()) continue;
        Quote q = quoteLocked(it->second);
        double exit = pos.side == OrderSide::BUY ? q.bid : q.ask;
        unrealized += pnlFor(pos, exit, pos.quantity);
    }
    info.equity = info.balance + unrealized;
    // 마진은 시뮬레이션하지 않음
    info.margin_level = 0.0;
    return info;
}

PositionRecord PaperBroker::placeOrder(const std::string& symbol,
                                       OrderSide side,
                                       double quantity,
                                       double stop_loss,
                                       double take_profit,
                                       const std::string& comment) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = feeds_.find(symbol);
    if (it == feeds_.end() || it->second.bars.empty()) {
        throw OrderRejected("unknown symbol " + symbol);
    }
    const auto& feed = it->second;
    const auto& spec = feed.spec;

    if (quantity < spec.min_lot - common::kStepEpsilon || quantity > spec.max_lot + common::kStepEpsilon ||
        !common::isLotStepMultiple(quantity, spec.lot_step)) {
        throw OrderRejected("invalid volume " + std::to_string(quantity), kRetcodeInvalidVolume);
    }

    Quote q = quoteLocked(feed);
    double entry = side == OrderSide::BUY ? q.ask : q.bid;
    double market = side == OrderSide::BUY ? q.bid : q.ask;
    double sign = sideSign(side);
    if ((stop_loss > 0 && (market - stop_loss) * sign <= 0) ||
        (take_profit > 0 && (take_profit - entry) * sign <= 0)) {
        throw OrderRejected("invalid stops", kRetcodeInvalidStops);
    }

    PositionRecord record;
    record.ticket = next_ticket_++;
    record.symbol = symbol;
    record.side = side;
    record.entry_price = entry;
    record.quantity = quantity;
    record.stop_loss = stop_loss;
    record.take_profit = take_profit;
    record.open_time = nowMs();
    record.comment = comment;
    positions_[record.ticket] = record;

    LOG_INFO("[PAPER] {} {} {:.2f} @ {:.5f} opened (ticket {})", symbol, toString(side), quantity, entry, record.ticket);
    return record;
}

void PaperBroker::modifyPosition(Ticket ticket,
                                 std::optional<double> stop_loss,
                                 std::optional<double> take_profit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(ticket);
    if (it == positions_.end()) {
        throw ModifyRejected("position " + std::to_string(ticket) + " not found", kRetcodePositionNotFound);
    }
    auto& pos = it->second;
    Quote q = quoteLocked(feedFor(pos.symbol));
    double market = pos.side == OrderSide::BUY ? q.bid : q.ask;
    double sign = sideSign(pos.side);

    if (stop_loss && *stop_loss > 0 && (market - *stop_loss) * sign <= 0) {
        throw ModifyRejected("invalid stop loss", kRetcodeInvalidStops);
    }
    if (take_profit && *take_profit > 0 && (*take_profit - market) * sign <= 0) {
        throw ModifyRejected("invalid take profit", kRetcodeInvalidStops);
    }

    if (stop_loss) pos.stop_loss = *stop_loss;
    if (take_profit) pos.take_profit = *take_profit;
}

void PaperBroker::closePosition(Ticket ticket, std::optional<double> quantity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(ticket);
    if (it == positions_.end()) {
        throw CloseRejected("position " + std::to_string(ticket) + " not found", kRetcodePositionNotFound);
    }
    Quote q = quoteLocked(feedFor(it->second.symbol));
    double exit = it->second.side == OrderSide::BUY ? q.bid : q.ask;
    closeLocked(ticket, exit, quantity.value_or(it->second.quantity), "market");
}

std::vector<PositionRecord> PaperBroker::listOpenPositions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PositionRecord> out;
    for (const auto& [ticket, pos] : positions_) {
        out.push_back(pos);
    }
    return out;
}

SymbolSpec PaperBroker::getSymbolSpec(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    return feedFor(symbol).spec;
}

Quote PaperBroker::getQuote(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    return quoteLocked(feedFor(symbol));
}

double PaperBroker::getRealizedPnlSince(long long since_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0.0;
    for (const auto& trade : closed_) {
        if (trade.closed_ms >= since_ms) total += trade.pnl;
    }
    return total;
}

void PaperBroker::beginCycle() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t step = static_cast<size_t>(std::max(1, config_.bars_per_cycle));

    for (auto& [symbol, feed] : feeds_) {
        size_t target = std::min(feed.bars.size(), feed.cursor + step);
        for (size_t i = feed.cursor; i < target; ++i) {
            const Candle& bar = feed.bars[i];

            std::vector<std::pair<Ticket, std::pair<double, std::string>>> hits;
            for (const auto& [ticket, pos] : positions_) {
                if (pos.symbol != symbol) continue;
                bool is_buy = pos.side == OrderSide::BUY;
                // 같은 봉에서 둘 다 닿으면 손절 우선
                if (pos.stop_loss > 0 && (is_buy ? bar.low <= pos.stop_loss : bar.high >= pos.stop_loss)) {
                    hits.push_back({ticket, {pos.stop_loss, "stop loss"}});
                } else if (pos.take_profit > 0 && (is_buy ? bar.high >= pos.take_profit : bar.low <= pos.take_profit)) {
                    hits.push_back({ticket, {pos.take_profit, "take profit"}});
                }
            }
            for (const auto& hit : hits) {
                auto pit = positions_.find(hit.first);
                if (pit != positions_.end()) {
                    closeLocked(hit.first, hit.second.first, pit->second.quantity, hit.second.second);
                }
            }
        }
        feed.cursor = target;
    }
}

bool PaperBroker::exhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [symbol, feed] : feeds_) {
        if (feed.cursor >= feed.bars.size()) return true;
    }
    return false;
}

} // namespace broker
} // namespace trendpilot
