#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "position/PositionTypes.h"

namespace trendpilot {
namespace position {

// 브로커 티켓 기준 포지션 테이블 + 분할 주문 그룹
// 트레이딩 루프만 수정한다. 모니터는 records() 복사본만 받는다
class PositionBook {
public:
    struct Entry {
        PositionRecord record;
        ManagedState state;
        std::string group_id;
    };

    std::string createGroup(const std::string& symbol, OrderSide side,
                            analytics::RegimeType regime, long long now_ms);

    // 그룹에 멤버 추가. 그룹이 없으면 false
    bool add(const std::string& group_id, const PositionRecord& record, const ManagedState& state);

    bool contains(Ticket ticket) const;
    Entry* find(Ticket ticket);
    const Entry* find(Ticket ticket) const;

    void updateStops(Ticket ticket, double stop_loss, double take_profit);

    // 멤버 제거. 그룹이 비면 그룹도 제거
    std::optional<PositionRecord> remove(Ticket ticket);

    // 브로커 목록과 동기화
    //   - 목록에 없는 티켓은 제거해서 반환 (청산됨)
    //   - 모르는 티켓은 단독 그룹으로 편입
    std::vector<PositionRecord> reconcile(const std::vector<PositionRecord>& open_positions, long long now_ms);

    const PositionGroup* group(const std::string& group_id) const;
    std::vector<std::string> groupIds() const;
    int countGroupsForSymbol(const std::string& symbol) const;

    std::vector<PositionRecord> records() const;
    size_t size() const { return entries_.size(); }
    size_t groupCount() const { return groups_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::map<Ticket, Entry> entries_;
    std::map<std::string, PositionGroup> groups_;
    long long next_group_seq_ = 1;
};

} // namespace position
} // namespace trendpilot
