#include "tax_ngin/replay/allocation_engine.hpp"
#include "tax_ngin/core/logger.hpp"

namespace tax_ngin {
namespace replay {

Decimal AllocationEngine::per_stock_allocation(const Decimal& available) const {
    if (max_stocks_ <= 0 || available.is_negative()) {
        return Decimal();
    }
    return (available / Decimal::from_int(max_stocks_)).round(2);
}

Result<AllocationResult> AllocationEngine::allocate(const Date& date,
                                                    const std::vector<TradeRecord>& entries,
                                                    size_t open_before,
                                                    CorpusLedger& ledger) const {
    if (max_stocks_ <= 0) {
        return make_error<AllocationResult>(ErrorCode::INVALID_ARGUMENT,
                                            "max_stocks must be positive, got " +
                                                std::to_string(max_stocks_),
                                            "AllocationEngine");
    }

    AllocationResult result;
    const size_t limit = static_cast<size_t>(max_stocks_);
    const size_t requested = open_before + entries.size();

    if (!entries.empty() && requested > limit && policy_ == PositionLimitPolicy::ABORT) {
        return make_error<AllocationResult>(
            ErrorCode::POSITION_LIMIT_EXCEEDED,
            "Position limit exceeded on " + date.to_iso_string() + ": " +
                std::to_string(requested) + " open positions, max_stocks=" +
                std::to_string(max_stocks_),
            "AllocationEngine");
    }

    CorpusLedger updated = ledger;
    result.per_stock_allocation = per_stock_allocation(updated.available());
    size_t open_count = open_before;

    for (const auto& record : entries) {
        if (policy_ == PositionLimitPolicy::CAP && open_count >= limit) {
            result.skipped.push_back(record);
            continue;
        }

        Decimal allocation = result.per_stock_allocation;
        if (allocation > updated.available()) {
            WARN("Allocation " << allocation << " for " << record.stock_name << " on " << date
                               << " exceeds available corpus " << updated.available()
                               << ", sizing from the remaining balance");
            allocation = updated.available();
        }

        auto fill = compute_entry(allocation, record.entry_price);
        if (fill.is_error()) {
            return make_error<AllocationResult>(fill.error()->code(),
                                                "Entry of " + record.stock_name + " on " +
                                                    date.to_iso_string() + ": " +
                                                    fill.error()->what(),
                                                "AllocationEngine");
        }

        auto debited = updated.debit(fill.value().entry_amount);
        if (debited.is_error()) {
            return make_error<AllocationResult>(debited.error()->code(),
                                                "Entry of " + record.stock_name + " on " +
                                                    date.to_iso_string() + ": " +
                                                    debited.error()->what(),
                                                "AllocationEngine");
        }

        if (fill.value().quantity == 0) {
            WARN("Entry of " << record.stock_name << " on " << date << " at price "
                             << record.entry_price << " buys zero shares with allocation "
                             << allocation);
        }
        DEBUG("Opened " << record.stock_name << " on " << date
                        << " qty=" << fill.value().quantity
                        << " amount=" << fill.value().entry_amount);

        result.opened.push_back({record, fill.value()});
        ++open_count;
    }

    if (!entries.empty() && requested > limit) {
        PositionLimitViolation violation;
        violation.date = date;
        violation.open_positions = open_count;
        violation.requested_positions = requested;
        violation.max_stocks = max_stocks_;
        violation.skipped_entries = result.skipped.size();
        WARN("Position limit exceeded on " << date << ": " << requested
                                           << " positions requested, max_stocks=" << max_stocks_
                                           << ", policy="
                                           << position_limit_policy_to_string(policy_)
                                           << ", skipped=" << violation.skipped_entries);
        result.violation = violation;
    }

    ledger = updated;
    return result;
}

}  // namespace replay
}  // namespace tax_ngin
