#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "replay_test_utils.hpp"
#include "tax_ngin/replay/tax_settlement_engine.hpp"

using namespace tax_ngin;
using namespace tax_ngin::replay;
using namespace tax_ngin::testing;

class TaxSettlementEngineTest : public TestBase {
protected:
    ExitAggregate aggregate(const std::string& st, const std::string& loss,
                            const std::string& lt) {
        ExitAggregate agg;
        agg.short_term_profit = dec(st);
        agg.total_loss = dec(loss);
        agg.long_term_profit = dec(lt);
        return agg;
    }

    // Identity that must hold for every settled date
    void expect_tax_identity(const DateSettlement& settlement) {
        Decimal pnl_sum;
        Decimal tax_sum;
        for (const auto& output : settlement.outputs) {
            pnl_sum += output.pnl;
            tax_sum += output.tax;
            EXPECT_FALSE(output.tax.is_negative()) << output.stock_name;
        }
        EXPECT_EQ(pnl_sum, settlement.aggregate.total_pnl());
        EXPECT_EQ(tax_sum, settlement.short_term_tax + settlement.long_term_tax);
        EXPECT_EQ(pnl_sum - tax_sum, settlement.net_post_tax_pnl);
    }

    const Date exit_day{2020, 6, 1};
    const Date short_entry{2020, 1, 1};
    const Date long_entry{2019, 1, 1};
    TaxRates rates;
};

TEST_F(TaxSettlementEngineTest, NetShortTermGain) {
    SettlementCase branch;
    Decimal net = compute_net_post_tax_pnl(aggregate("1000", "200", "0"), rates, &branch);
    EXPECT_EQ(net, dec("640.00"));
    EXPECT_EQ(branch, SettlementCase::NET_SHORT_TERM_GAIN);
}

TEST_F(TaxSettlementEngineTest, LossAbsorbedByLongTerm) {
    SettlementCase branch;
    Decimal net = compute_net_post_tax_pnl(aggregate("0", "500", "1000"), rates, &branch);
    EXPECT_EQ(net, dec("450.00"));
    EXPECT_EQ(branch, SettlementCase::LOSS_ABSORBED_BY_LT);
}

TEST_F(TaxSettlementEngineTest, NetLossIsUntaxed) {
    SettlementCase branch;
    Decimal net = compute_net_post_tax_pnl(aggregate("0", "1500", "1000"), rates, &branch);
    EXPECT_EQ(net, dec("-500.00"));
    EXPECT_EQ(branch, SettlementCase::NET_LOSS);
}

TEST_F(TaxSettlementEngineTest, FlatShortTermTaxesLongTermOnly) {
    SettlementCase branch;
    Decimal net = compute_net_post_tax_pnl(aggregate("300", "300", "1000"), rates, &branch);
    EXPECT_EQ(net, dec("900.00"));
    EXPECT_EQ(branch, SettlementCase::NET_SHORT_TERM_FLAT);
    EXPECT_EQ(settlement_case_to_string(branch), "NET_SHORT_TERM_FLAT");
}

TEST_F(TaxSettlementEngineTest, ShortAndLongGainsTaxedSeparately) {
    Decimal net = compute_net_post_tax_pnl(aggregate("1000", "0", "1000"), rates);
    EXPECT_EQ(net, dec("1700.00"));
}

TEST_F(TaxSettlementEngineTest, NetIsRoundedHalfUp) {
    // 0.06 * 0.8 = 0.048
    EXPECT_EQ(compute_net_post_tax_pnl(aggregate("0.07", "0.01", "0"), rates), dec("0.05"));
}

TEST_F(TaxSettlementEngineTest, AggregateBucketsByTermAndSign) {
    ExitAggregate agg;
    agg.add({dec("0"), dec("100"), HoldingTerm::SHORT_TERM});
    agg.add({dec("0"), dec("50"), HoldingTerm::LONG_TERM});
    agg.add({dec("0"), dec("-30"), HoldingTerm::LONG_TERM});
    agg.add({dec("0"), dec("-20"), HoldingTerm::SHORT_TERM});
    agg.add({dec("0"), dec("0"), HoldingTerm::SHORT_TERM});

    EXPECT_EQ(agg.short_term_profit, dec("100"));
    EXPECT_EQ(agg.long_term_profit, dec("50"));
    EXPECT_EQ(agg.total_loss, dec("50"));
    EXPECT_EQ(agg.net_short_term(), dec("50"));
    EXPECT_EQ(agg.total_pnl(), dec("100"));
}

TEST_F(TaxSettlementEngineTest, SettleShortTermGainDate) {
    TaxSettlementEngine engine(rates);
    std::vector<OpenPosition> exits = {
        make_position(1, "WINNER", 10, "100", short_entry, "200", exit_day),  // +1000
        make_position(2, "LOSER", 10, "100", short_entry, "80", exit_day),    // -200
    };
    CorpusLedger ledger(dec("10000"));

    auto result = engine.settle(exit_day, exits, ledger);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const DateSettlement& settlement = result.value();

    EXPECT_EQ(settlement.net_post_tax_pnl, dec("640.00"));
    EXPECT_EQ(settlement.capital_returned, dec("2000.00"));
    EXPECT_EQ(settlement.short_term_tax, dec("160.00"));
    EXPECT_TRUE(settlement.long_term_tax.is_zero());
    EXPECT_EQ(settlement.corpus_after, dec("12640.00"));
    EXPECT_EQ(ledger.available(), dec("12640.00"));

    ASSERT_EQ(settlement.outputs.size(), 2u);
    EXPECT_EQ(settlement.outputs[0].stock_name, "WINNER");
    EXPECT_EQ(settlement.outputs[0].exit_amount, dec("2000.00"));
    EXPECT_EQ(settlement.outputs[0].pnl, dec("1000.00"));
    EXPECT_EQ(settlement.outputs[0].tax, dec("160.00"));
    EXPECT_EQ(settlement.outputs[1].pnl, dec("-200.00"));
    EXPECT_TRUE(settlement.outputs[1].tax.is_zero());
    for (const auto& output : settlement.outputs) {
        EXPECT_EQ(output.corpus_available, dec("12640.00"));
        EXPECT_EQ(output.term, HoldingTerm::SHORT_TERM);
    }
    expect_tax_identity(settlement);
}

TEST_F(TaxSettlementEngineTest, SettleLossAbsorbedByLongTermDate) {
    TaxSettlementEngine engine(rates);
    std::vector<OpenPosition> exits = {
        make_position(1, "HELD", 10, "100", long_entry, "200", exit_day),  // +1000 LT
        make_position(2, "DROP", 10, "100", short_entry, "50", exit_day),  // -500 ST
    };
    CorpusLedger ledger;

    auto result = engine.settle(exit_day, exits, ledger);
    ASSERT_TRUE(result.is_ok());
    const DateSettlement& settlement = result.value();

    EXPECT_EQ(settlement.settlement_case, SettlementCase::LOSS_ABSORBED_BY_LT);
    EXPECT_EQ(settlement.net_post_tax_pnl, dec("450.00"));
    EXPECT_TRUE(settlement.short_term_tax.is_zero());
    EXPECT_EQ(settlement.long_term_tax, dec("50.00"));
    EXPECT_EQ(settlement.outputs[0].term, HoldingTerm::LONG_TERM);
    EXPECT_EQ(settlement.outputs[0].tax, dec("50.00"));
    EXPECT_EQ(ledger.available(), dec("2450.00"));
    expect_tax_identity(settlement);
}

TEST_F(TaxSettlementEngineTest, SettleNetLossDate) {
    TaxSettlementEngine engine(rates);
    std::vector<OpenPosition> exits = {
        make_position(1, "HELD", 10, "100", long_entry, "200", exit_day),  // +1000 LT
        make_position(2, "CRASH", 20, "100", short_entry, "25", exit_day), // -1500 ST
    };
    CorpusLedger ledger;

    auto result = engine.settle(exit_day, exits, ledger);
    ASSERT_TRUE(result.is_ok());
    const DateSettlement& settlement = result.value();

    EXPECT_EQ(settlement.settlement_case, SettlementCase::NET_LOSS);
    EXPECT_EQ(settlement.net_post_tax_pnl, dec("-500.00"));
    EXPECT_TRUE(settlement.short_term_tax.is_zero());
    EXPECT_TRUE(settlement.long_term_tax.is_zero());
    EXPECT_EQ(settlement.capital_returned, dec("3000.00"));
    EXPECT_EQ(ledger.available(), dec("2500.00"));
    expect_tax_identity(settlement);
}

TEST_F(TaxSettlementEngineTest, TaxProratedByProfitShare) {
    TaxSettlementEngine engine(rates);
    std::vector<OpenPosition> exits = {
        make_position(1, "A", 1, "100", short_entry, "200", exit_day),  // +100
        make_position(2, "B", 1, "100", short_entry, "300", exit_day),  // +200
    };
    CorpusLedger ledger;

    auto result = engine.settle(exit_day, exits, ledger);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().outputs[0].tax, dec("20.00"));
    EXPECT_EQ(result.value().outputs[1].tax, dec("40.00"));
    expect_tax_identity(result.value());
}

TEST_F(TaxSettlementEngineTest, LeftoverCentGoesToFirstTie) {
    TaxSettlementEngine engine(rates);
    std::vector<OpenPosition> exits = {
        make_position(1, "A", 1, "1", short_entry, "1.01", exit_day),
        make_position(2, "B", 1, "1", short_entry, "1.01", exit_day),
        make_position(3, "C", 1, "1", short_entry, "1.01", exit_day),
    };
    CorpusLedger ledger;

    auto result = engine.settle(exit_day, exits, ledger);
    ASSERT_TRUE(result.is_ok());
    const DateSettlement& settlement = result.value();

    // 0.03 of profit keeps 0.02, the single cent of tax lands on the first tie
    EXPECT_EQ(settlement.net_post_tax_pnl, dec("0.02"));
    EXPECT_EQ(settlement.outputs[0].tax, dec("0.01"));
    EXPECT_TRUE(settlement.outputs[1].tax.is_zero());
    EXPECT_TRUE(settlement.outputs[2].tax.is_zero());
    expect_tax_identity(settlement);
}

TEST_F(TaxSettlementEngineTest, LeftoverCentGoesToLargestRemainder) {
    TaxSettlementEngine engine(rates);
    std::vector<OpenPosition> exits = {
        make_position(1, "A", 1, "1", short_entry, "1.01", exit_day),  // +0.01
        make_position(2, "B", 1, "1", short_entry, "1.02", exit_day),  // +0.02
    };
    CorpusLedger ledger;

    auto result = engine.settle(exit_day, exits, ledger);
    ASSERT_TRUE(result.is_ok());
    const DateSettlement& settlement = result.value();

    EXPECT_EQ(settlement.short_term_tax, dec("0.01"));
    EXPECT_TRUE(settlement.outputs[0].tax.is_zero());
    EXPECT_EQ(settlement.outputs[1].tax, dec("0.01"));
    expect_tax_identity(settlement);
}

TEST_F(TaxSettlementEngineTest, HalfCentSharesNeverGoNegative) {
    TaxSettlementEngine engine(rates);
    std::vector<OpenPosition> exits = {
        make_position(1, "A", 1, "100", short_entry, "110", exit_day),    // +10.00
        make_position(2, "B", 1, "100", short_entry, "110", exit_day),    // +10.00
        make_position(3, "C", 1, "100", short_entry, "110", exit_day),    // +10.00
        make_position(4, "D", 1, "100", short_entry, "110", exit_day),    // +10.00
        make_position(5, "E", 1, "100", short_entry, "60.10", exit_day),  // -39.90
    };
    CorpusLedger ledger;

    auto result = engine.settle(exit_day, exits, ledger);
    ASSERT_TRUE(result.is_ok());
    const DateSettlement& settlement = result.value();

    // net_st 0.10 keeps 0.08, so 0.02 of tax over four equal 0.005 shares
    EXPECT_EQ(settlement.net_post_tax_pnl, dec("0.08"));
    EXPECT_EQ(settlement.short_term_tax, dec("0.02"));
    EXPECT_EQ(settlement.outputs[0].tax, dec("0.01"));
    EXPECT_EQ(settlement.outputs[1].tax, dec("0.01"));
    EXPECT_TRUE(settlement.outputs[2].tax.is_zero());
    EXPECT_TRUE(settlement.outputs[3].tax.is_zero());
    EXPECT_TRUE(settlement.outputs[4].tax.is_zero());
    expect_tax_identity(settlement);
}

TEST_F(TaxSettlementEngineTest, MixedTermsShareTheirOwnBuckets) {
    TaxSettlementEngine engine(rates);
    std::vector<OpenPosition> exits = {
        make_position(1, "LONG", 10, "100", long_entry, "150", exit_day),   // +500 LT
        make_position(2, "SHORT", 10, "100", short_entry, "130", exit_day), // +300 ST
        make_position(3, "LOSS", 10, "100", short_entry, "90", exit_day),   // -100
    };
    CorpusLedger ledger;

    auto result = engine.settle(exit_day, exits, ledger);
    ASSERT_TRUE(result.is_ok());
    const DateSettlement& settlement = result.value();

    // net_st 200 -> 160 kept, LT 500 -> 450 kept
    EXPECT_EQ(settlement.net_post_tax_pnl, dec("610.00"));
    EXPECT_EQ(settlement.short_term_tax, dec("40.00"));
    EXPECT_EQ(settlement.long_term_tax, dec("50.00"));
    EXPECT_EQ(settlement.outputs[0].tax, dec("50.00"));
    EXPECT_EQ(settlement.outputs[1].tax, dec("40.00"));
    EXPECT_TRUE(settlement.outputs[2].tax.is_zero());
    expect_tax_identity(settlement);
}

TEST_F(TaxSettlementEngineTest, ExitOnWrongDateLeavesLedgerUntouched) {
    TaxSettlementEngine engine(rates);
    std::vector<OpenPosition> exits = {
        make_position(1, "A", 1, "100", short_entry, "110", Date(2020, 7, 1)),
    };
    CorpusLedger ledger(dec("500"));

    auto result = engine.settle(exit_day, exits, ledger);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVARIANT_VIOLATION);
    EXPECT_EQ(ledger.available(), dec("500"));
}

TEST_F(TaxSettlementEngineTest, CustomRates) {
    TaxRates custom;
    custom.short_term = dec("0.15");
    custom.long_term = dec("0");
    EXPECT_EQ(compute_net_post_tax_pnl(aggregate("1000", "0", "1000"), custom), dec("1850.00"));
}
