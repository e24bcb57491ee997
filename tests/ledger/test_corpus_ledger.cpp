#include <gtest/gtest.h>
#include "tax_ngin/ledger/corpus_ledger.hpp"

using namespace tax_ngin;

namespace {

Decimal dec(const std::string& text) {
    return Decimal::from_string(text).value();
}

}  // namespace

class CorpusLedgerTest : public ::testing::Test {};

TEST_F(CorpusLedgerTest, StartsAtInitialCapital) {
    CorpusLedger ledger(dec("2000000.004"));
    EXPECT_EQ(ledger.available(), dec("2000000.00"));
    EXPECT_TRUE(CorpusLedger().available().is_zero());
}

TEST_F(CorpusLedgerTest, DebitAndCredit) {
    CorpusLedger ledger(dec("1000"));
    ASSERT_TRUE(ledger.debit(dec("400.25")).is_ok());
    EXPECT_EQ(ledger.available(), dec("599.75"));

    ASSERT_TRUE(ledger.credit(dec("450.10")).is_ok());
    EXPECT_EQ(ledger.available(), dec("1049.85"));
}

TEST_F(CorpusLedgerTest, DebitOfEntireBalanceAllowed) {
    CorpusLedger ledger(dec("1000"));
    ASSERT_TRUE(ledger.debit(dec("1000")).is_ok());
    EXPECT_TRUE(ledger.available().is_zero());
}

TEST_F(CorpusLedgerTest, OverdraftRejectedAndBalanceUnchanged) {
    CorpusLedger ledger(dec("1000"));
    auto result = ledger.debit(dec("1000.01"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_EQ(ledger.available(), dec("1000"));
}

TEST_F(CorpusLedgerTest, NegativeAmountsRejected) {
    CorpusLedger ledger(dec("1000"));
    EXPECT_EQ(ledger.debit(dec("-1")).error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(ledger.credit(dec("-1")).error()->code(), ErrorCode::INVARIANT_VIOLATION);
    EXPECT_EQ(ledger.available(), dec("1000"));
}

TEST_F(CorpusLedgerTest, CopiesAreIndependent) {
    CorpusLedger original(dec("500"));
    CorpusLedger copy = original;
    ASSERT_TRUE(copy.debit(dec("100")).is_ok());
    EXPECT_EQ(original.available(), dec("500"));
    EXPECT_EQ(copy.available(), dec("400"));
}
