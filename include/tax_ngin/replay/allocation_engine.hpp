#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <vector>
#include "tax_ngin/core/config_loader.hpp"
#include "tax_ngin/core/date.hpp"
#include "tax_ngin/core/decimal.hpp"
#include "tax_ngin/core/error.hpp"
#include "tax_ngin/ledger/corpus_ledger.hpp"
#include "tax_ngin/ledger/trade_record.hpp"

namespace tax_ngin {
namespace replay {

/**
 * @brief More positions open after a date's entries than max_stocks allows
 */
struct PositionLimitViolation {
    Date date;
    size_t open_positions{0};  // Open after the date's entries were processed
    size_t requested_positions{0};  // Open if every entry of the date had been taken
    int max_stocks{0};
    size_t skipped_entries{0};

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["date"] = date.to_iso_string();
        j["open_positions"] = open_positions;
        j["requested_positions"] = requested_positions;
        j["max_stocks"] = max_stocks;
        j["skipped_entries"] = skipped_entries;
        return j;
    }
};

/**
 * @brief Outcome of sizing one date's entries
 */
struct AllocationResult {
    Decimal per_stock_allocation;
    std::vector<OpenPosition> opened;  // In the order the entries were given
    std::vector<TradeRecord> skipped;  // Entries dropped under the CAP policy
    std::optional<PositionLimitViolation> violation;
};

/**
 * @brief Sizes new positions from the corpus left after a date's exits
 *
 * The per-stock allocation is round_half_up(available / max_stocks, 2),
 * computed once per date and used for every entry of that date. Each entry
 * is debited separately. When an allocation exceeds what is still
 * available, the entry is sized from the remaining balance instead.
 */
class AllocationEngine {
public:
    AllocationEngine(int max_stocks, PositionLimitPolicy policy)
        : max_stocks_(max_stocks), policy_(policy) {}

    /**
     * @brief Open the given entries against the ledger
     *
     * @param date Date of the entries
     * @param entries Entry events of this date, in stable order
     * @param open_before Number of positions open once exits settled
     * @param ledger Ledger to debit
     * @return AllocationResult; POSITION_LIMIT_EXCEEDED under the ABORT
     *         policy, INSUFFICIENT_FUNDS if a debit would overdraw the
     *         ledger. The ledger is left untouched on error.
     */
    Result<AllocationResult> allocate(const Date& date, const std::vector<TradeRecord>& entries,
                                      size_t open_before, CorpusLedger& ledger) const;

    /**
     * @brief round_half_up(available / max_stocks, 2)
     */
    Decimal per_stock_allocation(const Decimal& available) const;

    int max_stocks() const {
        return max_stocks_;
    }

    PositionLimitPolicy policy() const {
        return policy_;
    }

private:
    int max_stocks_;
    PositionLimitPolicy policy_;
};

}  // namespace replay
}  // namespace tax_ngin
