// include/tax_ngin/ledger/corpus_ledger.hpp

#pragma once

#include "tax_ngin/core/decimal.hpp"
#include "tax_ngin/core/error.hpp"

namespace tax_ngin {

/**
 * @brief Capital not yet committed to an open position
 *
 * The balance is held at two decimal places. It is a plain value type:
 * the replay copies it into each per-date step and takes the updated copy
 * back, so no balance survives between runs.
 */
class CorpusLedger {
public:
    CorpusLedger() = default;

    explicit CorpusLedger(const Decimal& initial_capital)
        : balance_(initial_capital.round(2)) {}

    const Decimal& available() const {
        return balance_;
    }

    /**
     * @brief Commit capital to a new position
     * @return INSUFFICIENT_FUNDS when amount exceeds available(),
     *         INVALID_ARGUMENT for a negative amount
     */
    Result<void> debit(const Decimal& amount);

    /**
     * @brief Return settled capital to the pool
     * @return INVARIANT_VIOLATION for a negative amount
     */
    Result<void> credit(const Decimal& amount);

private:
    Decimal balance_;
};

}  // namespace tax_ngin
