#include "position/PositionBook.h"
#include "common/Logger.h"

#include <algorithm>
#include <set>

namespace trendpilot {
namespace position {

std::string PositionBook::createGroup(const std::string& symbol, OrderSide side,
                                      analytics::RegimeType regime, long long now_ms) {
    PositionGroup group;
    group.id = symbol + "-" + std::to_string(next_group_seq_++);
    group.symbol = symbol;
    group.side = side;
    group.regime = regime;
    group.created_ms = now_ms;

    std::string id = group.id;
    groups_[id] = std::move(group);
    return id;
}

bool PositionBook::add(const std::string& group_id, const PositionRecord& record, const ManagedState& state) {
    auto it = groups_.find(group_id);
    if (it == groups_.end()) {
        return false;
    }

    Entry entry;
    entry.record = record;
    entry.state = state;
    entry.group_id = group_id;
    if (entry.state.best_price <= 0) {
        entry.state.best_price = record.entry_price;
    }

    entries_[record.ticket] = std::move(entry);
    it->second.members.push_back(record.ticket);
    return true;
}

bool PositionBook::contains(Ticket ticket) const {
    return entries_.count(ticket) > 0;
}

PositionBook::Entry* PositionBook::find(Ticket ticket) {
    auto it = entries_.find(ticket);
    return it == entries_.end() ? nullptr : &it->second;
}

const PositionBook::Entry* PositionBook::find(Ticket ticket) const {
    auto it = entries_.find(ticket);
    return it == entries_.end() ? nullptr : &it->second;
}

void PositionBook::updateStops(Ticket ticket, double stop_loss, double take_profit) {
    auto* entry = find(ticket);
    if (!entry) return;
    entry->record.stop_loss = stop_loss;
    entry->record.take_profit = take_profit;
}

std::optional<PositionRecord> PositionBook::remove(Ticket ticket) {
    auto it = entries_.find(ticket);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    PositionRecord record = it->second.record;
    std::string group_id = it->second.group_id;
    entries_.erase(it);

    auto git = groups_.find(group_id);
    if (git != groups_.end()) {
        auto& members = git->second.members;
        members.erase(std::remove(members.begin(), members.end(), ticket), members.end());
        if (members.empty()) {
            LOG_INFO("Position group {} closed (last member {})", group_id, ticket);
            groups_.erase(git);
        }
    }
    return record;
}

std::vector<PositionRecord> PositionBook::reconcile(const std::vector<PositionRecord>& open_positions,
                                                   long long now_ms) {
    std::set<Ticket> open_tickets;
    for (const auto& pos : open_positions) {
        open_tickets.insert(pos.ticket);
    }

    std::vector<Ticket> closed;
    for (const auto& [ticket, entry] : entries_) {
        if (open_tickets.count(ticket) == 0) {
            closed.push_back(ticket);
        }
    }

    std::vector<PositionRecord> removed;
    for (Ticket ticket : closed) {
        auto record = remove(ticket);
        if (record) {
            removed.push_back(*record);
        }
    }

    for (const auto& pos : open_positions) {
        auto* entry = find(pos.ticket);
        if (entry) {
            // 브로커 값이 기준 (부분 청산, 외부 수정)
            entry->record.quantity = pos.quantity;
            entry->record.stop_loss = pos.stop_loss;
            entry->record.take_profit = pos.take_profit;
            continue;
        }

        LOG_WARN("Adopting untracked position {} {} {}", pos.ticket, pos.symbol, toString(pos.side));
        std::string gid = createGroup(pos.symbol, pos.side, analytics::RegimeType::RANGING, now_ms);
        add(gid, pos, ManagedState());
    }

    return removed;
}

const PositionGroup* PositionBook::group(const std::string& group_id) const {
    auto it = groups_.find(group_id);
    return it == groups_.end() ? nullptr : &it->second;
}

std::vector<std::string> PositionBook::groupIds() const {
    std::vector<std::string> ids;
    ids.reserve(groups_.size());
    for (const auto& [id, group] : groups_) {
        ids.push_back(id);
    }
    return ids;
}

int PositionBook::countGroupsForSymbol(const std::string& symbol) const {
    int count = 0;
    for (const auto& [id, group] : groups_) {
        if (group.symbol == symbol) ++count;
    }
    return count;
}

std::vector<PositionRecord> PositionBook::records() const {
    std::vector<PositionRecord> out;
    out.reserve(entries_.size());
    for (const auto& [ticket, entry] : entries_) {
        out.push_back(entry.record);
    }
    return out;
}

} // namespace position
} // namespace trendpilot
