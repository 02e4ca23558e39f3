/**
 * @file balance_test.cpp
 * @brief Point balances and per-day running balances
 */

#include <gtest/gtest.h>
#include <tallybook/core/logger.hpp>
#include <tallybook/ledger/balance.hpp>
#include <tallybook/ledger/store.hpp>

using namespace tallybook;

class BalanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::ERROR);
        ASSERT_TRUE(store_.open(":memory:").ok());

        add(Date(2024, 12, 20), 50000, "Opening");
        add(Date(2025, 1, 1), 250000, "Salary");
        add(Date(2025, 1, 1), -120000, "Rent");
        add(Date(2025, 1, 15), -4000, "Groceries");
        add(Date(2025, 2, 1), 250000, "Salary");
    }

    void add(const Date& date, MinorUnits amount, const std::string& note) {
        ASSERT_TRUE(store_.entries().insert(date, amount, note).ok());
    }

    LedgerStore store_;
    BalanceCalculator balances_{store_};
};

TEST_F(BalanceTest, BalanceThrough_IncludesWholeDay) {
    EXPECT_EQ(balances_.balance_through(Date(2024, 12, 19)).value, 0);
    EXPECT_EQ(balances_.balance_through(Date(2024, 12, 20)).value, 50000);
    EXPECT_EQ(balances_.balance_through(Date(2025, 1, 1)).value, 180000);
    EXPECT_EQ(balances_.balance_through(Date(2025, 1, 31)).value, 176000);
    EXPECT_EQ(balances_.balance_through(Date(2025, 2, 1)).value, 426000);
}

TEST_F(BalanceTest, BalanceThrough_InvalidDate) {
    EXPECT_EQ(balances_.balance_through(Date(2025, 2, 29)).error(), LedgerError::INVALID_DATE);
}

TEST_F(BalanceTest, RunningBalances_OneRowPerDaySeededFromHistory) {
    auto days = balances_.running_balances(Date(2024, 12, 31), Date(2025, 1, 2));
    ASSERT_TRUE(days.ok());
    ASSERT_EQ(days.value.size(), 3u);

    EXPECT_EQ(days.value[0].date, Date(2024, 12, 31));
    EXPECT_EQ(days.value[0].day_total, 0);
    EXPECT_EQ(days.value[0].closing_balance, 50000);

    EXPECT_EQ(days.value[1].date, Date(2025, 1, 1));
    EXPECT_EQ(days.value[1].day_total, 130000);
    EXPECT_EQ(days.value[1].closing_balance, 180000);

    EXPECT_EQ(days.value[2].day_total, 0);
    EXPECT_EQ(days.value[2].closing_balance, 180000);
}

TEST_F(BalanceTest, RunningBalances_AgreeWithPointBalances) {
    auto days = balances_.running_balances(Date(2024, 12, 1), Date(2025, 2, 28));
    ASSERT_TRUE(days.ok());
    ASSERT_EQ(days.value.size(), 31u + 31u + 28u);
    for (const auto& day : days.value) {
        EXPECT_EQ(day.closing_balance, balances_.balance_through(day.date).value) << day.date.to_string();
    }
}

TEST_F(BalanceTest, RunningBalances_SingleDay) {
    auto days = balances_.running_balances(Date(2025, 1, 15), Date(2025, 1, 15));
    ASSERT_TRUE(days.ok());
    ASSERT_EQ(days.value.size(), 1u);
    EXPECT_EQ(days.value[0].closing_balance, 176000);
}

TEST_F(BalanceTest, RunningBalances_ReversedRange_InvalidDate) {
    auto days = balances_.running_balances(Date(2025, 2, 1), Date(2025, 1, 1));
    EXPECT_EQ(days.error(), LedgerError::INVALID_DATE);
}

TEST_F(BalanceTest, MonthBalances_CoversWholeMonth) {
    auto days = balances_.month_balances(2024, 2);
    ASSERT_TRUE(days.ok());
    EXPECT_EQ(days.value.size(), 29u);

    days = balances_.month_balances(2025, 1);
    ASSERT_TRUE(days.ok());
    ASSERT_EQ(days.value.size(), 31u);
    EXPECT_EQ(days.value.front().closing_balance, 180000);
    EXPECT_EQ(days.value.back().closing_balance, 176000);
}

TEST_F(BalanceTest, MonthBalances_InvalidMonth) {
    EXPECT_EQ(balances_.month_balances(2025, 13).error(), LedgerError::INVALID_DATE);
}

TEST_F(BalanceTest, IncomeOnly_BalanceNeverDecreases) {
    LedgerStore store;
    ASSERT_TRUE(store.open(":memory:").ok());
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(store.entries().insert(Date(2025, 3, 1).add_days(i * 3), 1000 + i, "income").ok());
    }
    BalanceCalculator calc(store);
    auto days = calc.month_balances(2025, 3);
    ASSERT_TRUE(days.ok());
    for (size_t i = 1; i < days.value.size(); ++i) {
        EXPECT_GE(days.value[i].closing_balance, days.value[i - 1].closing_balance);
    }
}
