#include "tax_ngin/replay/tax_settlement_engine.hpp"
#include <algorithm>
#include "tax_ngin/core/logger.hpp"

namespace tax_ngin {
namespace replay {

void ExitAggregate::add(const ExitFill& fill) {
    if (fill.pnl.is_negative()) {
        total_loss += fill.pnl.abs();
    } else if (fill.term == HoldingTerm::LONG_TERM) {
        long_term_profit += fill.pnl;
    } else {
        short_term_profit += fill.pnl;
    }
}

std::string settlement_case_to_string(SettlementCase settlement_case) {
    switch (settlement_case) {
        case SettlementCase::NET_SHORT_TERM_GAIN:
            return "NET_SHORT_TERM_GAIN";
        case SettlementCase::NET_SHORT_TERM_FLAT:
            return "NET_SHORT_TERM_FLAT";
        case SettlementCase::LOSS_ABSORBED_BY_LT:
            return "LOSS_ABSORBED_BY_LT";
        case SettlementCase::NET_LOSS:
            return "NET_LOSS";
        default:
            return "UNKNOWN";
    }
}

Decimal compute_net_post_tax_pnl(const ExitAggregate& aggregate, const TaxRates& rates,
                                 SettlementCase* settlement_case) {
    const Decimal one = Decimal::from_int(1);
    const Decimal keep_st = one - rates.short_term;
    const Decimal keep_lt = one - rates.long_term;

    const Decimal& loss = aggregate.total_loss;
    const Decimal& st = aggregate.short_term_profit;
    const Decimal& lt = aggregate.long_term_profit;
    const Decimal net_st = aggregate.net_short_term();

    SettlementCase branch;
    Decimal net;
    if (net_st.is_positive()) {
        branch = SettlementCase::NET_SHORT_TERM_GAIN;
        net = net_st * keep_st + lt * keep_lt;
    } else if (net_st.is_zero()) {
        branch = SettlementCase::NET_SHORT_TERM_FLAT;
        net = lt * keep_lt;
    } else if (loss > st + lt) {
        branch = SettlementCase::NET_LOSS;
        net = st + lt - loss;
    } else {
        branch = SettlementCase::LOSS_ABSORBED_BY_LT;
        net = (lt - (loss - st)) * keep_lt;
    }

    if (settlement_case != nullptr) {
        *settlement_case = branch;
    }
    return net.round(2);
}

void TaxSettlementEngine::prorate(const Decimal& bucket_tax, const std::vector<size_t>& eligible,
                                  const std::vector<ExitFill>& fills,
                                  std::vector<Decimal>& taxes) {
    if (bucket_tax.is_zero() || eligible.empty()) {
        return;
    }

    using wide_t = __int128;
    constexpr int64_t kRawPerCent = Decimal::SCALE / 100;

    // Largest-remainder split in whole cents: floor every share, then hand the
    // leftover cents to the largest remainders, earliest on ties
    const Decimal magnitude = bucket_tax.abs().round(2);
    const wide_t tax_cents = magnitude.raw() / kRawPerCent;

    wide_t bucket_sum = 0;
    for (size_t idx : eligible) {
        bucket_sum += fills[idx].pnl.raw();
    }

    std::vector<wide_t> cents(eligible.size());
    std::vector<wide_t> remainders(eligible.size());
    wide_t leftover = tax_cents;
    for (size_t i = 0; i < eligible.size(); ++i) {
        const wide_t numerator = tax_cents * fills[eligible[i]].pnl.raw();
        cents[i] = numerator / bucket_sum;
        remainders[i] = numerator % bucket_sum;
        leftover -= cents[i];
    }

    std::vector<size_t> order(eligible.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return remainders[a] > remainders[b]; });
    for (size_t i = 0; i < order.size() && leftover > 0; ++i, --leftover) {
        cents[order[i]] += 1;
    }

    for (size_t i = 0; i < eligible.size(); ++i) {
        Decimal share = Decimal::from_raw(static_cast<int64_t>(cents[i] * kRawPerCent));
        taxes[eligible[i]] += bucket_tax.is_negative() ? -share : share;
    }
}

Result<DateSettlement> TaxSettlementEngine::settle(const Date& date,
                                                   const std::vector<OpenPosition>& exits,
                                                   CorpusLedger& ledger) const {
    DateSettlement settlement;
    settlement.date = date;

    std::vector<ExitFill> fills;
    fills.reserve(exits.size());

    try {
        for (const auto& position : exits) {
            const TradeRecord& record = position.record;
            if (!record.exit_date || !record.exit_price || *record.exit_date != date) {
                return make_error<DateSettlement>(
                    ErrorCode::INVARIANT_VIOLATION,
                    "Trade " + std::to_string(record.id) + " (" + record.stock_name +
                        ") is not scheduled to exit on " + date.to_iso_string(),
                    "TaxSettlementEngine");
            }

            auto fill = compute_exit(position.entry.quantity, position.entry.entry_amount,
                                     *record.exit_price, record.entry_date, *record.exit_date);
            if (fill.is_error()) {
                return make_error<DateSettlement>(
                    fill.error()->code(),
                    "Exit of " + record.stock_name + " on " + date.to_iso_string() + ": " +
                        fill.error()->what(),
                    "TaxSettlementEngine");
            }

            settlement.aggregate.add(fill.value());
            settlement.capital_returned += position.entry.entry_amount;
            fills.push_back(fill.value());
        }

        const ExitAggregate& agg = settlement.aggregate;
        const Decimal net_st = agg.net_short_term();
        INFO("[TAX_SETTLEMENT] AGGREGATE: date=" << date << " exits=" << exits.size()
                                                 << " loss=" << agg.total_loss
                                                 << " st_profit=" << agg.short_term_profit
                                                 << " lt_profit=" << agg.long_term_profit
                                                 << " net_st=" << net_st);

        settlement.net_post_tax_pnl =
            compute_net_post_tax_pnl(agg, rates_, &settlement.settlement_case);
        INFO("[TAX_SETTLEMENT] NET: date=" << date << " case="
                                           << settlement_case_to_string(settlement.settlement_case)
                                           << " net_post_tax_pnl=" << settlement.net_post_tax_pnl);

        // Split the date's tax into the two buckets
        const Decimal total_tax = agg.total_pnl() - settlement.net_post_tax_pnl;
        Decimal st_tax;
        if (net_st.is_positive()) {
            st_tax = (net_st * rates_.short_term).round(2);
            if (st_tax > total_tax) {
                st_tax = total_tax;
            }
            if (st_tax.is_negative()) {
                st_tax = Decimal();
            }
        }
        settlement.short_term_tax = st_tax;
        settlement.long_term_tax = total_tax - st_tax;

        std::vector<size_t> st_eligible;
        std::vector<size_t> lt_eligible;
        for (size_t i = 0; i < fills.size(); ++i) {
            if (!fills[i].pnl.is_positive()) {
                continue;
            }
            if (fills[i].term == HoldingTerm::LONG_TERM) {
                lt_eligible.push_back(i);
            } else {
                st_eligible.push_back(i);
            }
        }

        std::vector<Decimal> taxes(fills.size());
        if (!fills.empty()) {
            if (st_eligible.empty() && !settlement.short_term_tax.is_zero()) {
                taxes.front() += settlement.short_term_tax;
            } else {
                prorate(settlement.short_term_tax, st_eligible, fills, taxes);
            }
            if (lt_eligible.empty() && !settlement.long_term_tax.is_zero()) {
                taxes.front() += settlement.long_term_tax;
            } else {
                prorate(settlement.long_term_tax, lt_eligible, fills, taxes);
            }
        }

        const Decimal credit_amount = settlement.capital_returned + settlement.net_post_tax_pnl;
        CorpusLedger updated = ledger;
        auto credited = updated.credit(credit_amount);
        if (credited.is_error()) {
            return make_error<DateSettlement>(
                credited.error()->code(),
                "Settlement on " + date.to_iso_string() + " violates the corpus ledger: " +
                    credited.error()->what(),
                "TaxSettlementEngine");
        }
        settlement.corpus_after = updated.available();

        INFO("[TAX_SETTLEMENT] CREDIT: date=" << date
                                              << " capital_returned=" << settlement.capital_returned
                                              << " credit=" << credit_amount
                                              << " corpus_after=" << settlement.corpus_after);

        settlement.outputs.reserve(exits.size());
        for (size_t i = 0; i < exits.size(); ++i) {
            const OpenPosition& position = exits[i];
            TradeOutput output;
            output.trade_id = position.record.id;
            output.stock_name = position.record.stock_name;
            output.entry_date = position.record.entry_date;
            output.entry_price = position.record.entry_price;
            output.entry_amount = position.entry.entry_amount;
            output.quantity = position.entry.quantity;
            output.exit_date = *position.record.exit_date;
            output.exit_price = *position.record.exit_price;
            output.exit_amount = fills[i].exit_amount;
            output.pnl = fills[i].pnl;
            output.term = fills[i].term;
            output.tax = taxes[i];
            output.corpus_available = settlement.corpus_after;

            DEBUG("[TAX_SETTLEMENT] TRADE: " << output.stock_name << " qty=" << output.quantity
                                             << " pnl=" << output.pnl << " term="
                                             << holding_term_label(output.term)
                                             << " tax=" << output.tax);
            settlement.outputs.push_back(std::move(output));
        }

        ledger = updated;
    } catch (const std::exception& e) {
        return make_error<DateSettlement>(ErrorCode::INVARIANT_VIOLATION,
                                          "Settlement on " + date.to_iso_string() +
                                              " failed: " + e.what(),
                                          "TaxSettlementEngine");
    }

    return settlement;
}

}  // namespace replay
}  // namespace tax_ngin
