// include/tax_ngin/ledger/trade_record.hpp

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "tax_ngin/core/date.hpp"
#include "tax_ngin/core/decimal.hpp"
#include "tax_ngin/core/error.hpp"

namespace tax_ngin {

/**
 * @brief Holding-period classification of a closed trade
 */
enum class HoldingTerm {
    SHORT_TERM,  // Held less than one calendar year
    LONG_TERM    // Held one calendar year or more
};

inline std::string holding_term_label(HoldingTerm term) {
    return term == HoldingTerm::LONG_TERM ? "LT" : "ST";
}

/**
 * @brief One ledger row as read from the input
 *
 * A record without an exit date is an open position. Exit price and exit
 * date are either both present or both absent.
 */
struct TradeRecord {
    uint64_t id{0};      // Stable identity, assigned in input order
    size_t source_row{0};  // 1-based data row in the input file, 0 if synthetic
    std::string stock_name;
    Decimal entry_price;
    Date entry_date;
    std::optional<Decimal> exit_price;
    std::optional<Date> exit_date;

    bool is_closed() const {
        return exit_date.has_value();
    }
};

/**
 * @brief A record rejected before scheduling
 */
struct DataError {
    size_t row{0};  // Source row, 0 when unknown
    std::string stock_name;
    std::string reason;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["row"] = row;
        j["stock_name"] = stock_name;
        j["reason"] = reason;
        return j;
    }
};

/**
 * @brief Fields frozen when the entry event fires
 */
struct EntryFill {
    int64_t quantity{0};
    Decimal entry_amount;
    Decimal allocation;
};

/**
 * @brief Fields frozen when the exit event fires
 */
struct ExitFill {
    Decimal exit_amount;
    Decimal pnl;
    HoldingTerm term{HoldingTerm::SHORT_TERM};
};

/**
 * @brief Size an entry from the per-stock allocation
 *
 * quantity = floor(allocation / entry_price), entry_amount = quantity *
 * entry_price rounded to 2 places. The entry amount never exceeds the
 * allocation.
 *
 * @return EntryFill, or INVALID_ARGUMENT for a non-positive price or a
 *         negative allocation
 */
Result<EntryFill> compute_entry(const Decimal& allocation, const Decimal& entry_price);

/**
 * @brief Long-term iff exit_date >= entry_date + 1 calendar year
 */
bool is_long_term(const Date& entry_date, const Date& exit_date);

/**
 * @brief Realize an exit for a position of the given quantity
 * @return ExitFill, or INVALID_ARGUMENT for a negative quantity or a
 *         non-positive exit price
 */
Result<ExitFill> compute_exit(int64_t quantity, const Decimal& entry_amount,
                              const Decimal& exit_price, const Date& entry_date,
                              const Date& exit_date);

/**
 * @brief Check a record before it is scheduled
 *
 * Rejects empty stock names, non-positive prices, an exit price without an
 * exit date (or the reverse), and exits on or before the entry date.
 */
Result<void> validate_trade_record(const TradeRecord& record);

/**
 * @brief A position opened by the allocation engine and not yet closed
 */
struct OpenPosition {
    TradeRecord record;
    EntryFill entry;
};

/**
 * @brief Finalized, output-ready view of a closed trade
 */
struct TradeOutput {
    uint64_t trade_id{0};
    std::string stock_name;
    Date entry_date;
    Decimal entry_price;
    Decimal entry_amount;
    int64_t quantity{0};
    Date exit_date;
    Decimal exit_price;
    Decimal exit_amount;
    Decimal pnl;
    HoldingTerm term{HoldingTerm::SHORT_TERM};
    Decimal tax;
    Decimal corpus_available;  // Balance right after the exit date settled

    nlohmann::json to_json() const;
};

}  // namespace tax_ngin
