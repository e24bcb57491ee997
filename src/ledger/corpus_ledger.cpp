// src/ledger/corpus_ledger.cpp

#include "tax_ngin/ledger/corpus_ledger.hpp"

namespace tax_ngin {

Result<void> CorpusLedger::debit(const Decimal& amount) {
    const Decimal rounded = amount.round(2);
    if (rounded.is_negative()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Debit amount must not be negative, got " + rounded.to_string(2),
                                "CorpusLedger");
    }
    if (rounded > balance_) {
        return make_error<void>(ErrorCode::INSUFFICIENT_FUNDS,
                                "Over-allocation: debit of " + rounded.to_string(2) +
                                    " exceeds available corpus " + balance_.to_string(2),
                                "CorpusLedger");
    }
    balance_ -= rounded;
    return Result<void>();
}

Result<void> CorpusLedger::credit(const Decimal& amount) {
    const Decimal rounded = amount.round(2);
    if (rounded.is_negative()) {
        return make_error<void>(ErrorCode::INVARIANT_VIOLATION,
                                "Settlement credit must not be negative, got " +
                                    rounded.to_string(2),
                                "CorpusLedger");
    }
    balance_ += rounded;
    return Result<void>();
}

}  // namespace tax_ngin
