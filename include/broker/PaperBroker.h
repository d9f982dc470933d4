#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "broker/IBrokerGateway.h"

namespace trendpilot {
namespace broker {

struct PaperBrokerConfig {
    std::string data_dir = "data";
    double initial_balance = 10000.0;
    int warmup_bars = 150;          // 시작 시 공개되는 봉 수
    int bars_per_cycle = 1;         // beginCycle 마다 진행하는 봉 수
};

// 파일에서 읽은 봉을 사이클마다 하나씩 공개하는 모의 브로커.
// 새 봉이 공개될 때 손절/익절 도달을 시뮬레이션하고 실현 손익을 기록한다
class PaperBroker : public IBrokerGateway {
public:
    explicit PaperBroker(const PaperBrokerConfig& config = PaperBrokerConfig());

    // <data_dir>/<symbol>.json 로드. 실패 시 DataUnavailable
    void loadSymbolFile(const std::string& symbol);
    void loadSymbol(const std::string& symbol, std::vector<Candle> bars, const SymbolSpec& spec);

    std::vector<Candle> getHistory(const std::string& symbol,
                                   const std::string& timeframe,
                                   int bar_count) override;
    AccountInfo getAccountBalance() override;
    PositionRecord placeOrder(const std::string& symbol,
                              OrderSide side,
                              double quantity,
                              double stop_loss,
                              double take_profit,
                              const std::string& comment) override;
    void modifyPosition(Ticket ticket,
                        std::optional<double> stop_loss,
                        std::optional<double> take_profit) override;
    void closePosition(Ticket ticket, std::optional<double> quantity) override;
    std::vector<PositionRecord> listOpenPositions() override;
    SymbolSpec getSymbolSpec(const std::string& symbol) override;
    Quote getQuote(const std::string& symbol) override;
    double getRealizedPnlSince(long long since_ms) override;
    void beginCycle() override;

    // 남은 봉이 없는 심볼이 하나라도 있으면 true
    bool exhausted() const;

private:
    struct SymbolFeed {
        SymbolSpec spec;
        std::vector<Candle> bars;
        size_t cursor = 0;          // 공개된 봉 수
    };

    struct ClosedTrade {
        long long closed_ms = 0;
        double pnl = 0.0;
    };

    const SymbolFeed& feedFor(const std::string& symbol) const;
    Quote quoteLocked(const SymbolFeed& feed) const;
    double pnlFor(const PositionRecord& position, double exit_price, double quantity) const;
    void closeLocked(Ticket ticket, double exit_price, double quantity, const std::string& reason);

    PaperBrokerConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, SymbolFeed> feeds_;
    std::map<Ticket, PositionRecord> positions_;
    std::vector<ClosedTrade> closed_;
    double realized_total_ = 0.0;
    Ticket next_ticket_ = 1000;
};

} // namespace broker
} // namespace trendpilot
