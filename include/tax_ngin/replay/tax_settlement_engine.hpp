#pragma once

#include <string>
#include <vector>
#include "tax_ngin/core/date.hpp"
#include "tax_ngin/core/decimal.hpp"
#include "tax_ngin/core/error.hpp"
#include "tax_ngin/ledger/corpus_ledger.hpp"
#include "tax_ngin/ledger/trade_record.hpp"

namespace tax_ngin {
namespace replay {

/**
 * @brief Capital-gains tax rates applied per exit date
 */
struct TaxRates {
    Decimal short_term{Decimal::from_raw(20000)};  // 0.20
    Decimal long_term{Decimal::from_raw(10000)};   // 0.10
};

/**
 * @brief Loss / short-term profit / long-term profit totals for one date
 *
 * total_loss holds the magnitude of the negative PNLs. A zero PNL goes to
 * the profit bucket of its term and adds nothing.
 */
struct ExitAggregate {
    Decimal total_loss;
    Decimal short_term_profit;
    Decimal long_term_profit;

    void add(const ExitFill& fill);

    Decimal net_short_term() const {
        return short_term_profit - total_loss;
    }

    // Sum of the PNLs that were added
    Decimal total_pnl() const {
        return short_term_profit + long_term_profit - total_loss;
    }
};

/**
 * @brief Which branch of the settlement formula applied
 */
enum class SettlementCase {
    NET_SHORT_TERM_GAIN,     // net_st > 0
    NET_SHORT_TERM_FLAT,     // net_st == 0
    LOSS_ABSORBED_BY_LT,     // net_st < 0, long-term profit covers the rest
    NET_LOSS                 // losses exceed all profits, no tax
};

std::string settlement_case_to_string(SettlementCase settlement_case);

/**
 * @brief Piecewise after-tax result for one date, rounded to 2 places
 *
 *   net_st > 0:  net_st * (1 - st_rate) + lt * (1 - lt_rate)
 *   net_st == 0: lt * (1 - lt_rate)
 *   net_st < 0 and loss <= st + lt: (lt - (loss - st)) * (1 - lt_rate)
 *   net_st < 0 and loss > st + lt:  st + lt - loss  (negative, untaxed)
 */
Decimal compute_net_post_tax_pnl(const ExitAggregate& aggregate, const TaxRates& rates,
                                 SettlementCase* settlement_case = nullptr);

/**
 * @brief Everything produced by settling one date's exits
 */
struct DateSettlement {
    Date date;
    ExitAggregate aggregate;
    SettlementCase settlement_case{SettlementCase::NET_SHORT_TERM_FLAT};
    Decimal net_post_tax_pnl;
    Decimal capital_returned;
    Decimal short_term_tax;
    Decimal long_term_tax;
    Decimal corpus_after;
    std::vector<TradeOutput> outputs;  // Same order as the exits passed in
};

/**
 * @brief Settles all exits of one date against the corpus in a single credit
 *
 * Per-trade tax: the short-term tax round(net_st * st_rate) (when net_st > 0)
 * and the long-term remainder sum(PNL) - net_post_tax_pnl - st_tax are each
 * prorated over the bucket's positive-PNL trades by PNL share. Shares are
 * floored to the cent and the leftover cents go to the largest remainders,
 * earliest on ties, so no profitable trade carries negative tax. Losses carry
 * zero tax, so sum(PNL) - sum(tax) == net_post_tax_pnl for every date.
 *
 * LOGGING: lines are tagged "[TAX_SETTLEMENT]":
 *   - AGGREGATE: bucket totals and net_st
 *   - NET: branch taken and net_post_tax_pnl
 *   - CREDIT: capital returned and corpus after
 *   - TRADE: per-trade PNL, term and tax (DEBUG)
 */
class TaxSettlementEngine {
public:
    explicit TaxSettlementEngine(const TaxRates& rates) : rates_(rates) {}

    /**
     * @brief Settle the exits of one date and credit the ledger once
     *
     * @param date Exit date being settled
     * @param exits Positions closing on this date, each with exit fields set
     * @param ledger Ledger to credit with capital_returned + net_post_tax_pnl
     * @return DateSettlement, or an error naming the date. The ledger is
     *         left untouched on error.
     */
    Result<DateSettlement> settle(const Date& date, const std::vector<OpenPosition>& exits,
                                  CorpusLedger& ledger) const;

    const TaxRates& rates() const {
        return rates_;
    }

private:
    // Spread bucket_tax over the eligible trades, writing into taxes
    static void prorate(const Decimal& bucket_tax, const std::vector<size_t>& eligible,
                        const std::vector<ExitFill>& fills, std::vector<Decimal>& taxes);

    TaxRates rates_;
};

}  // namespace replay
}  // namespace tax_ngin
