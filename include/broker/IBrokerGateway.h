#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "common/Errors.h"

namespace trendpilot {
namespace broker {

// 브로커 연결 계약
// 거부는 BrokerError 파생 예외 (OrderRejected / ModifyRejected / CloseRejected),
// 연결 실패는 BrokerUnavailable / BrokerTimeout
class IBrokerGateway {
public:
    virtual ~IBrokerGateway() = default;

    // 장 마감/잘못된 심볼이면 DataUnavailable. 이력 초반에는 요청보다 적게 반환될 수 있음
    virtual std::vector<Candle> getHistory(const std::string& symbol,
                                           const std::string& timeframe,
                                           int bar_count) = 0;

    virtual AccountInfo getAccountBalance() = 0;

    virtual PositionRecord placeOrder(const std::string& symbol,
                                      OrderSide side,
                                      double quantity,
                                      double stop_loss,
                                      double take_profit,
                                      const std::string& comment) = 0;

    virtual void modifyPosition(Ticket ticket,
                                std::optional<double> stop_loss,
                                std::optional<double> take_profit) = 0;

    // quantity 가 없으면 전량 청산
    virtual void closePosition(Ticket ticket, std::optional<double> quantity) = 0;

    virtual std::vector<PositionRecord> listOpenPositions() = 0;

    virtual SymbolSpec getSymbolSpec(const std::string& symbol) = 0;

    virtual Quote getQuote(const std::string& symbol) = 0;

    virtual double getRealizedPnlSince(long long since_ms) = 0;

    // 사이클 시작 알림 (재생형 브로커가 시계를 진행)
    virtual void beginCycle() {}
};

} // namespace broker
} // namespace trendpilot
