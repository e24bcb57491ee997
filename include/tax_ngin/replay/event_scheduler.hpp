#pragma once

#include <vector>
#include "tax_ngin/core/date.hpp"
#include "tax_ngin/ledger/trade_record.hpp"

namespace tax_ngin {
namespace replay {

/**
 * @brief All events that fire on one calendar date
 *
 * Exits are settled before any entry is sized. Within each list records
 * are ordered by stock name, then by id.
 */
struct DateWorkUnit {
    Date date;
    std::vector<TradeRecord> exits;
    std::vector<TradeRecord> entries;
};

/**
 * @brief Ordered work units plus the records that could not be scheduled
 */
struct Schedule {
    std::vector<DateWorkUnit> units;
    std::vector<DataError> rejected;
};

/**
 * @brief Turns an unordered set of trade records into per-date work units
 *
 * Every valid record contributes an entry event on its entry date and, if
 * closed, an exit event on its exit date. Invalid records and duplicate ids
 * are reported in Schedule::rejected and take no part in the replay.
 */
class EventScheduler {
public:
    static Schedule build(const std::vector<TradeRecord>& trades);
};

}  // namespace replay
}  // namespace tax_ngin
