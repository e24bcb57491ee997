// src/ledger/trade_record.cpp

#include "tax_ngin/ledger/trade_record.hpp"

namespace tax_ngin {

Result<EntryFill> compute_entry(const Decimal& allocation, const Decimal& entry_price) {
    if (!entry_price.is_positive()) {
        return make_error<EntryFill>(ErrorCode::INVALID_ARGUMENT,
                                     "Entry price must be positive, got " +
                                         entry_price.to_string(5),
                                     "TradeRecord");
    }
    if (allocation.is_negative()) {
        return make_error<EntryFill>(ErrorCode::INVALID_ARGUMENT,
                                     "Allocation must not be negative, got " +
                                         allocation.to_string(2),
                                     "TradeRecord");
    }

    EntryFill fill;
    fill.allocation = allocation;
    fill.quantity = allocation.truncated_quotient(entry_price);
    fill.entry_amount = (entry_price * fill.quantity).round(2);

    // A 5-digit price can round up past the allocation; give back one share
    while (fill.quantity > 0 && fill.entry_amount > allocation) {
        --fill.quantity;
        fill.entry_amount = (entry_price * fill.quantity).round(2);
    }
    return fill;
}

bool is_long_term(const Date& entry_date, const Date& exit_date) {
    return exit_date >= entry_date.add_years(1);
}

Result<ExitFill> compute_exit(int64_t quantity, const Decimal& entry_amount,
                              const Decimal& exit_price, const Date& entry_date,
                              const Date& exit_date) {
    if (quantity < 0) {
        return make_error<ExitFill>(ErrorCode::INVALID_ARGUMENT,
                                    "Quantity must not be negative, got " +
                                        std::to_string(quantity),
                                    "TradeRecord");
    }
    if (!exit_price.is_positive()) {
        return make_error<ExitFill>(ErrorCode::INVALID_ARGUMENT,
                                    "Exit price must be positive, got " + exit_price.to_string(5),
                                    "TradeRecord");
    }

    ExitFill fill;
    fill.exit_amount = (exit_price * quantity).round(2);
    fill.pnl = (fill.exit_amount - entry_amount).round(2);
    fill.term = is_long_term(entry_date, exit_date) ? HoldingTerm::LONG_TERM
                                                    : HoldingTerm::SHORT_TERM;
    return fill;
}

Result<void> validate_trade_record(const TradeRecord& record) {
    if (record.stock_name.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Missing stock name", "TradeRecord");
    }
    if (!record.entry_date.is_valid()) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Invalid entry date " + record.entry_date.to_iso_string(),
                                "TradeRecord");
    }
    if (!record.entry_price.is_positive()) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Entry price must be positive, got " +
                                    record.entry_price.to_string(2),
                                "TradeRecord");
    }
    if (record.exit_price.has_value() != record.exit_date.has_value()) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                record.exit_date ? "Exit date without exit price"
                                                 : "Exit price without exit date",
                                "TradeRecord");
    }
    if (record.exit_date) {
        if (!record.exit_date->is_valid()) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Invalid exit date " + record.exit_date->to_iso_string(),
                                    "TradeRecord");
        }
        if (!record.exit_price->is_positive()) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Exit price must be positive, got " +
                                        record.exit_price->to_string(2),
                                    "TradeRecord");
        }
        if (*record.exit_date == record.entry_date) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Intraday trade: exit date equals entry date " +
                                        record.entry_date.to_iso_string(),
                                    "TradeRecord");
        }
        if (*record.exit_date < record.entry_date) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Exit date " + record.exit_date->to_iso_string() +
                                        " precedes entry date " +
                                        record.entry_date.to_iso_string(),
                                    "TradeRecord");
        }
    }
    return Result<void>();
}

nlohmann::json TradeOutput::to_json() const {
    nlohmann::json j;
    j["trade_id"] = trade_id;
    j["stock_name"] = stock_name;
    j["entry_date"] = entry_date.to_iso_string();
    j["entry_price"] = entry_price.to_string(2);
    j["entry_amount"] = entry_amount.to_string(2);
    j["quantity"] = quantity;
    j["exit_date"] = exit_date.to_iso_string();
    j["exit_price"] = exit_price.to_string(2);
    j["exit_amount"] = exit_amount.to_string(2);
    j["pnl"] = pnl.to_string(2);
    j["term"] = holding_term_label(term);
    j["tax"] = tax.to_string(2);
    j["corpus_available"] = corpus_available.to_string(2);
    return j;
}

}  // namespace tax_ngin
