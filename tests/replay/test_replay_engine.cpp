#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "replay_test_utils.hpp"
#include "tax_ngin/replay/replay_engine.hpp"

using namespace tax_ngin;
using namespace tax_ngin::replay;
using namespace tax_ngin::testing;

class ReplayEngineTest : public TestBase {
protected:
    ReplayConfig make_config(const std::string& capital, int max_stocks,
                             PositionLimitPolicy policy = PositionLimitPolicy::WARN) {
        ReplayConfig config;
        config.initial_capital = dec(capital);
        config.max_stocks = max_stocks;
        config.position_limit_policy = policy;
        return config;
    }

    void expect_conserved(const ReplayResult& result) {
        EXPECT_EQ(result.final_corpus + result.open_principal,
                  result.initial_capital + result.total_net_post_tax_pnl);
    }
};

TEST_F(ReplayEngineTest, ExitsSettleBeforeSameDateEntries) {
    std::vector<TradeRecord> trades = {
        make_trade(1, "FIRST", "100", Date(2020, 1, 1), "110", Date(2020, 2, 1)),
        make_trade(2, "SECOND", "50", Date(2020, 2, 1)),
    };
    ReplayEngine engine(make_config("1000", 1));

    auto result = engine.run(trades);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const ReplayResult& replay = result.value();

    // FIRST returns 1000 + 80 after tax, which funds SECOND on the same day
    ASSERT_EQ(replay.closed_trades.size(), 1u);
    EXPECT_EQ(replay.closed_trades[0].pnl, dec("100.00"));
    EXPECT_EQ(replay.closed_trades[0].tax, dec("20.00"));
    EXPECT_EQ(replay.closed_trades[0].corpus_available, dec("1080.00"));

    ASSERT_EQ(replay.open_positions.size(), 1u);
    EXPECT_EQ(replay.open_positions[0].record.stock_name, "SECOND");
    EXPECT_EQ(replay.open_positions[0].entry.quantity, 21);
    EXPECT_EQ(replay.open_principal, dec("1050.00"));
    EXPECT_EQ(replay.final_corpus, dec("30.00"));
    EXPECT_EQ(replay.total_net_post_tax_pnl, dec("80.00"));
    EXPECT_TRUE(replay.violations.empty());
    expect_conserved(replay);
}

TEST_F(ReplayEngineTest, CorpusHistoryRecordsSettlementAndEndOfDate) {
    std::vector<TradeRecord> trades = {
        make_trade(1, "FIRST", "100", Date(2020, 1, 1), "110", Date(2020, 2, 1)),
        make_trade(2, "SECOND", "50", Date(2020, 2, 1)),
    };
    ReplayEngine engine(make_config("1000", 1));

    auto result = engine.run(trades);
    ASSERT_TRUE(result.is_ok());
    const auto& history = result.value().corpus_history;

    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].date, Date(2020, 1, 1));
    EXPECT_EQ(history[0].stage, CorpusSnapshot::Stage::END_OF_DATE);
    EXPECT_TRUE(history[0].corpus.is_zero());
    EXPECT_EQ(history[1].stage, CorpusSnapshot::Stage::AFTER_SETTLEMENT);
    EXPECT_EQ(history[1].corpus, dec("1080.00"));
    EXPECT_EQ(history[2].stage, CorpusSnapshot::Stage::END_OF_DATE);
    EXPECT_EQ(history[2].corpus, dec("30.00"));
}

TEST_F(ReplayEngineTest, ExactlyOneYearIsLongTerm) {
    ReplayEngine engine(make_config("1000", 1));

    auto long_term = engine.run(
        {make_trade(1, "HOLD", "100", Date(2020, 1, 15), "110", Date(2021, 1, 15))});
    ASSERT_TRUE(long_term.is_ok());
    ASSERT_EQ(long_term.value().closed_trades.size(), 1u);
    EXPECT_EQ(long_term.value().closed_trades[0].term, HoldingTerm::LONG_TERM);
    EXPECT_EQ(long_term.value().closed_trades[0].tax, dec("10.00"));
    EXPECT_EQ(long_term.value().final_corpus, dec("1090.00"));

    auto short_term = engine.run(
        {make_trade(1, "HOLD", "100", Date(2020, 1, 15), "110", Date(2021, 1, 14))});
    ASSERT_TRUE(short_term.is_ok());
    EXPECT_EQ(short_term.value().closed_trades[0].term, HoldingTerm::SHORT_TERM);
    EXPECT_EQ(short_term.value().closed_trades[0].tax, dec("20.00"));
    EXPECT_EQ(short_term.value().final_corpus, dec("1080.00"));
}

TEST_F(ReplayEngineTest, ReplayIsIdempotent) {
    std::vector<TradeRecord> trades = {
        make_trade(1, "AAA", "123.45", Date(2020, 1, 1), "150.10", Date(2020, 3, 1)),
        make_trade(2, "BBB", "77.7", Date(2020, 1, 1), "60.25", Date(2020, 3, 1)),
        make_trade(3, "CCC", "10.01", Date(2020, 2, 1), "12.5", Date(2021, 3, 1)),
        make_trade(4, "DDD", "999.99", Date(2020, 3, 1)),
    };
    ReplayEngine engine(make_config("2000000", 3));

    auto first = engine.run(trades);
    auto second = engine.run(trades);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    ASSERT_EQ(first.value().closed_trades.size(), second.value().closed_trades.size());
    for (size_t i = 0; i < first.value().closed_trades.size(); ++i) {
        EXPECT_EQ(first.value().closed_trades[i].to_json(),
                  second.value().closed_trades[i].to_json());
    }
    ASSERT_EQ(first.value().corpus_history.size(), second.value().corpus_history.size());
    for (size_t i = 0; i < first.value().corpus_history.size(); ++i) {
        EXPECT_EQ(first.value().corpus_history[i].corpus,
                  second.value().corpus_history[i].corpus);
    }
    EXPECT_EQ(first.value().final_corpus, second.value().final_corpus);
    expect_conserved(first.value());
}

TEST_F(ReplayEngineTest, ConservationAcrossManyDates) {
    std::vector<TradeRecord> trades;
    uint64_t id = 1;
    for (int month = 1; month <= 12; ++month) {
        const std::string entry_price = std::to_string(10 + month) + ".37";
        const std::string exit_price = std::to_string(month % 3 == 0 ? 8 : 12 + month) + ".91";
        trades.push_back(make_trade(id++, "S" + std::to_string(month), entry_price,
                                    Date(2020, month, 1), exit_price, Date(2021, month, 10)));
        trades.push_back(make_trade(id++, "T" + std::to_string(month), entry_price,
                                    Date(2020, month, 15)));
    }
    ReplayEngine engine(make_config("2000000", 30));

    auto result = engine.run(trades);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    EXPECT_EQ(result.value().closed_trades.size(), 12u);
    EXPECT_EQ(result.value().open_positions.size(), 12u);
    expect_conserved(result.value());
    EXPECT_TRUE(ReplayEngine::check_conservation(result.value()).is_ok());
}

TEST_F(ReplayEngineTest, OpenTradesExcludedFromSettlement) {
    ReplayEngine engine(make_config("1000", 2));

    auto result = engine.run({make_trade(1, "OPEN", "100", Date(2020, 1, 1))});
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().closed_trades.empty());
    EXPECT_TRUE(result.value().settlements.empty());
    ASSERT_EQ(result.value().open_positions.size(), 1u);
    EXPECT_EQ(result.value().open_principal, dec("500.00"));
    EXPECT_EQ(result.value().final_corpus, dec("500.00"));
}

TEST_F(ReplayEngineTest, CappedEntryMakesItsExitAnOrphan) {
    std::vector<TradeRecord> trades = {
        make_trade(1, "AAA", "10", Date(2020, 1, 1), "11", Date(2020, 2, 1)),
        make_trade(2, "BBB", "10", Date(2020, 1, 1), "20", Date(2020, 3, 1)),
    };
    ReplayEngine engine(make_config("1000", 1, PositionLimitPolicy::CAP));

    auto result = engine.run(trades);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const ReplayResult& replay = result.value();

    ASSERT_EQ(replay.skipped_entries.size(), 1u);
    EXPECT_EQ(replay.skipped_entries[0].stock_name, "BBB");
    ASSERT_EQ(replay.orphan_exits.size(), 1u);
    EXPECT_EQ(replay.orphan_exits[0].stock_name, "BBB");
    ASSERT_EQ(replay.violations.size(), 1u);
    ASSERT_EQ(replay.closed_trades.size(), 1u);
    EXPECT_EQ(replay.closed_trades[0].stock_name, "AAA");
    expect_conserved(replay);
}

TEST_F(ReplayEngineTest, WarnPolicyKeepsEveryPosition) {
    std::vector<TradeRecord> trades = {
        make_trade(1, "AAA", "10", Date(2020, 1, 1)),
        make_trade(2, "BBB", "10", Date(2020, 1, 1)),
        make_trade(3, "CCC", "10", Date(2020, 1, 1)),
    };
    ReplayEngine engine(make_config("1000", 2));

    auto result = engine.run(trades);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().open_positions.size(), 3u);
    ASSERT_EQ(result.value().violations.size(), 1u);
    EXPECT_EQ(result.value().violations[0].open_positions, 3u);
    expect_conserved(result.value());
}

TEST_F(ReplayEngineTest, AbortPolicyStopsTheRun) {
    std::vector<TradeRecord> trades = {
        make_trade(1, "AAA", "10", Date(2020, 1, 1)),
        make_trade(2, "BBB", "10", Date(2020, 1, 1)),
    };
    ReplayEngine engine(make_config("1000", 1, PositionLimitPolicy::ABORT));

    auto result = engine.run(trades);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::POSITION_LIMIT_EXCEEDED);
}

TEST_F(ReplayEngineTest, InvalidRecordsReportedAndSkipped) {
    std::vector<TradeRecord> trades = {
        make_trade(1, "GOOD", "10", Date(2020, 1, 1), "11", Date(2020, 2, 1)),
        make_trade(2, "SAMEDAY", "10", Date(2020, 1, 1), "11", Date(2020, 1, 1)),
    };
    ReplayEngine engine(make_config("1000", 2));

    auto result = engine.run(trades);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().rejected.size(), 1u);
    EXPECT_EQ(result.value().rejected[0].stock_name, "SAMEDAY");
    EXPECT_EQ(result.value().closed_trades.size(), 1u);
}

TEST_F(ReplayEngineTest, EmptyTradeListKeepsCapital) {
    ReplayEngine engine(make_config("2000000", 20));

    auto result = engine.run({});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().final_corpus, dec("2000000.00"));
    EXPECT_TRUE(result.value().corpus_history.empty());
}

TEST_F(ReplayEngineTest, ProcessDateDoesNotTouchInputState) {
    ReplayEngine engine(make_config("1000", 1));
    ReplayState state;
    state.ledger = CorpusLedger(dec("1000"));

    DateWorkUnit unit;
    unit.date = Date(2020, 1, 1);
    unit.entries.push_back(make_trade(1, "AAA", "10", unit.date));

    auto outcome = engine.process_date(state, unit);
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().corpus_before, dec("1000"));
    EXPECT_TRUE(outcome.value().state.ledger.available().is_zero());
    EXPECT_EQ(outcome.value().state.open_positions.size(), 1u);

    EXPECT_EQ(state.ledger.available(), dec("1000"));
    EXPECT_TRUE(state.open_positions.empty());
}

TEST_F(ReplayEngineTest, ConservationCheckReportsMismatch) {
    ReplayResult tampered;
    tampered.initial_capital = dec("1000");
    tampered.final_corpus = dec("1000.01");
    tampered.corpus_history.push_back(
        {Date(2020, 5, 1), CorpusSnapshot::Stage::END_OF_DATE, dec("1000.01")});

    auto checked = ReplayEngine::check_conservation(tampered);
    ASSERT_TRUE(checked.is_error());
    EXPECT_EQ(checked.error()->code(), ErrorCode::INVARIANT_VIOLATION);
    EXPECT_NE(std::string(checked.error()->what()).find("2020-05-01"), std::string::npos);
}
