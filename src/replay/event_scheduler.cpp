#include "tax_ngin/replay/event_scheduler.hpp"
#include <algorithm>
#include <map>
#include <unordered_set>
#include "tax_ngin/core/logger.hpp"

namespace tax_ngin {
namespace replay {

namespace {

bool stable_order(const TradeRecord& a, const TradeRecord& b) {
    if (a.stock_name != b.stock_name)
        return a.stock_name < b.stock_name;
    return a.id < b.id;
}

}  // namespace

Schedule EventScheduler::build(const std::vector<TradeRecord>& trades) {
    Schedule schedule;
    std::map<Date, DateWorkUnit> by_date;
    std::unordered_set<uint64_t> seen_ids;

    for (const auto& trade : trades) {
        auto valid = validate_trade_record(trade);
        if (valid.is_error()) {
            WARN("Rejected row " << trade.source_row << " (" << trade.stock_name
                                 << "): " << valid.error()->what());
            schedule.rejected.push_back({trade.source_row, trade.stock_name, valid.error()->what()});
            continue;
        }
        if (!seen_ids.insert(trade.id).second) {
            WARN("Rejected row " << trade.source_row << " (" << trade.stock_name
                                 << "): duplicate trade id " << trade.id);
            schedule.rejected.push_back(
                {trade.source_row, trade.stock_name, "Duplicate trade id " + std::to_string(trade.id)});
            continue;
        }

        auto& entry_unit = by_date[trade.entry_date];
        entry_unit.date = trade.entry_date;
        entry_unit.entries.push_back(trade);

        if (trade.exit_date) {
            auto& exit_unit = by_date[*trade.exit_date];
            exit_unit.date = *trade.exit_date;
            exit_unit.exits.push_back(trade);
        }
    }

    schedule.units.reserve(by_date.size());
    for (auto& [date, unit] : by_date) {
        std::sort(unit.exits.begin(), unit.exits.end(), stable_order);
        std::sort(unit.entries.begin(), unit.entries.end(), stable_order);
        schedule.units.push_back(std::move(unit));
    }

    DEBUG("Scheduled " << schedule.units.size() << " dates, rejected "
                       << schedule.rejected.size() << " records");
    return schedule;
}

}  // namespace replay
}  // namespace tax_ngin
