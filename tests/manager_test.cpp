/**
 * @file manager_test.cpp
 * @brief LedgerManager validation, workflows and horizon cache
 */

#include <gtest/gtest.h>
#include <tallybook/core/config.hpp>
#include <tallybook/core/logger.hpp>
#include <tallybook/ledger/manager.hpp>

using namespace tallybook;

class LedgerManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::ERROR);
        ASSERT_TRUE(ledger_.init(":memory:", 12).ok());
    }

    int64_t countForRule(RuleId rule) {
        auto rows = ledger_.store().entries().list_by_rule(rule);
        EXPECT_TRUE(rows.ok());
        return static_cast<int64_t>(rows.value.size());
    }

    void execSql(const std::string& sql) {
        char* err = nullptr;
        int rc = sqlite3_exec(ledger_.store().handle(), sql.c_str(), nullptr, nullptr, &err);
        std::string msg = err ? err : "";
        sqlite3_free(err);
        ASSERT_EQ(rc, SQLITE_OK) << msg;
    }

    LedgerManager ledger_;
};

// ============================================================================
// RULE VALIDATION
// ============================================================================

TEST_F(LedgerManagerTest, CreateRule_UnknownUnit_InvalidUnit) {
    auto r = ledger_.create_rule(Date(2025, 1, 1), -100, "x", 1, "fortnight");
    EXPECT_EQ(r.error(), LedgerError::INVALID_UNIT);
    EXPECT_TRUE(ledger_.list_rules().value.empty());
}

TEST_F(LedgerManagerTest, CreateRule_UnitIsCaseSensitive) {
    EXPECT_EQ(ledger_.create_rule(Date(2025, 1, 1), -100, "x", 1, "Month").error(), LedgerError::INVALID_UNIT);
}

TEST_F(LedgerManagerTest, CreateRule_ZeroOrNegativeInterval_Rejected) {
    EXPECT_EQ(ledger_.create_rule(Date(2025, 1, 1), -100, "x", 0, "week").error(),
              LedgerError::NON_POSITIVE_INTERVAL);
    EXPECT_EQ(ledger_.create_rule(Date(2025, 1, 1), -100, "x", -2, "day").error(),
              LedgerError::NON_POSITIVE_INTERVAL);
    EXPECT_TRUE(ledger_.list_rules().value.empty());
}

TEST_F(LedgerManagerTest, CreateRule_InvalidStartDate) {
    EXPECT_EQ(ledger_.create_rule(Date(2025, 4, 31), -100, "x", 1, "month").error(),
              LedgerError::INVALID_DATE);
}

TEST_F(LedgerManagerTest, CreateRule_StoresFields) {
    auto id = ledger_.create_rule(Date(2025, 1, 15), -4999, "Gym", 2, "week");
    ASSERT_TRUE(id.ok());

    auto rule = ledger_.get_rule(id.value);
    ASSERT_TRUE(rule.ok());
    ASSERT_TRUE(rule.value.has_value());
    EXPECT_EQ(rule.value->start_date, Date(2025, 1, 15));
    EXPECT_EQ(rule.value->amount_minor_units, -4999);
    EXPECT_EQ(rule.value->note, "Gym");
    EXPECT_EQ(rule.value->every_n, 2);
    EXPECT_EQ(rule.value->unit, RecurrenceUnit::WEEK);
    EXPECT_FALSE(rule.value->last_generated_date.has_value());
}

// ============================================================================
// DELETE RULE
// ============================================================================

TEST_F(LedgerManagerTest, DeleteRule_RemovesOnlyItsEntries) {
    auto rent = ledger_.create_rule(Date(2025, 1, 1), -120000, "Rent", 1, "month");
    auto pay = ledger_.create_rule(Date(2025, 1, 1), 250000, "Salary", 1, "month");
    ASSERT_TRUE(rent.ok());
    ASSERT_TRUE(pay.ok());
    ASSERT_TRUE(ledger_.generate_until(rent.value, Date(2025, 6, 30)).ok());
    ASSERT_TRUE(ledger_.generate_until(pay.value, Date(2025, 6, 30)).ok());
    auto manual = ledger_.insert(Date(2025, 1, 1), -120000, "Rent");
    ASSERT_TRUE(manual.ok());

    auto removed = ledger_.delete_rule_and_entries(rent.value);
    ASSERT_TRUE(removed.ok());
    EXPECT_EQ(removed.value, 6);

    EXPECT_FALSE(ledger_.get_rule(rent.value).value.has_value());
    EXPECT_EQ(countForRule(rent.value), 0);
    EXPECT_EQ(countForRule(pay.value), 6);
    EXPECT_TRUE(ledger_.get(manual.value).value.has_value());
}

TEST_F(LedgerManagerTest, DeleteRule_Missing_RemovesNothing) {
    auto removed = ledger_.delete_rule_and_entries(31337);
    ASSERT_TRUE(removed.ok());
    EXPECT_EQ(removed.value, 0);
}

// ============================================================================
// CREATE RECURRING WORKFLOW
// ============================================================================

TEST_F(LedgerManagerTest, CreateRecurring_FoldsManualStartAndExpands) {
    auto manual = ledger_.insert(Date(2025, 1, 1), -120000, "Rent");
    ASSERT_TRUE(manual.ok());

    auto rule = ledger_.create_recurring(Date(2025, 1, 1), -120000, "Rent", 1, "month", Date(2025, 4, 30));
    ASSERT_TRUE(rule.ok()) << rule.status.message;

    auto day = ledger_.list_by_date(Date(2025, 1, 1));
    ASSERT_TRUE(day.ok());
    ASSERT_EQ(day.value.size(), 1u);
    EXPECT_EQ(day.value[0].id, manual.value);
    EXPECT_TRUE(day.value[0].is_generated());

    EXPECT_EQ(countForRule(rule.value), 4);
    EXPECT_EQ(ledger_.get_rule(rule.value).value->last_generated_date, Date(2025, 4, 1));
}

TEST_F(LedgerManagerTest, CreateRecurring_InvalidUnit_LeavesNoRule) {
    auto rule = ledger_.create_recurring(Date(2025, 1, 1), -100, "x", 1, "year", Date(2025, 4, 30));
    EXPECT_EQ(rule.error(), LedgerError::INVALID_UNIT);
    EXPECT_TRUE(ledger_.list_rules().value.empty());
    EXPECT_EQ(ledger_.store().entries().count().value, 0);
}

// ============================================================================
// HORIZON CACHE
// ============================================================================

TEST_F(LedgerManagerTest, DefaultHorizon_EndOfMonthAhead) {
    EXPECT_EQ(ledger_.default_horizon(2025, 1), Date(2026, 1, 31));
    EXPECT_EQ(ledger_.default_horizon(2023, 2), Date(2024, 2, 29));
}

TEST_F(LedgerManagerTest, ExtendAll_CachesCoveredHorizon) {
    auto rule = ledger_.create_rule(Date(2025, 1, 1), -100, "x", 1, "month");
    ASSERT_TRUE(rule.ok());

    auto first = ledger_.extend_all_rules(Date(2025, 3, 31));
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value, 3);
    EXPECT_EQ(ledger_.generated_until(), Date(2025, 3, 31));

    // A rule written behind the manager's back is not seen while cached
    ASSERT_TRUE(ledger_.store().rules().create(Date(2025, 1, 1), -200, "y", 1, RecurrenceUnit::MONTH).ok());
    EXPECT_EQ(ledger_.extend_all_rules(Date(2025, 2, 28)).value, 0);
    EXPECT_EQ(ledger_.extend_all_rules(Date(2025, 3, 31)).value, 0);

    // A later horizon does the work for every rule
    auto later = ledger_.extend_all_rules(Date(2025, 4, 30));
    ASSERT_TRUE(later.ok());
    EXPECT_EQ(later.value, 1 + 4);
}

TEST_F(LedgerManagerTest, CreateRule_InvalidatesHorizonCache) {
    ASSERT_TRUE(ledger_.create_rule(Date(2025, 1, 1), -100, "x", 1, "month").ok());
    ASSERT_TRUE(ledger_.extend_all_rules(Date(2025, 3, 31)).ok());
    ASSERT_TRUE(ledger_.generated_until().has_value());

    auto second = ledger_.create_rule(Date(2025, 2, 1), -200, "y", 1, "month");
    ASSERT_TRUE(second.ok());
    EXPECT_FALSE(ledger_.generated_until().has_value());

    auto produced = ledger_.extend_all_rules(Date(2025, 3, 31));
    ASSERT_TRUE(produced.ok());
    EXPECT_EQ(produced.value, 2);
    EXPECT_EQ(countForRule(second.value), 2);
}

TEST_F(LedgerManagerTest, DeleteRule_InvalidatesHorizonCache) {
    auto rule = ledger_.create_rule(Date(2025, 1, 1), -100, "x", 1, "month");
    ASSERT_TRUE(rule.ok());
    ASSERT_TRUE(ledger_.extend_all_rules(Date(2025, 3, 31)).ok());

    ASSERT_TRUE(ledger_.delete_rule_and_entries(rule.value).ok());
    EXPECT_FALSE(ledger_.generated_until().has_value());
}

TEST_F(LedgerManagerTest, ExtendAll_InvalidHorizon) {
    EXPECT_EQ(ledger_.extend_all_rules(Date(2025, 2, 29)).error(), LedgerError::INVALID_DATE);
}

// ============================================================================
// ATOMICITY
// ============================================================================

TEST_F(LedgerManagerTest, DeleteRule_FailedRuleDelete_RestoresEntries) {
    auto rule = ledger_.create_rule(Date(2025, 1, 1), -120000, "Rent", 1, "month");
    ASSERT_TRUE(rule.ok());
    ASSERT_EQ(ledger_.generate_until(rule.value, Date(2025, 3, 1)).value, 3);
    execSql("CREATE TRIGGER block_rule_delete BEFORE DELETE ON rules "
            "BEGIN SELECT RAISE(ABORT, 'blocked'); END");

    auto removed = ledger_.delete_rule_and_entries(rule.value);
    EXPECT_EQ(removed.error(), LedgerError::STORAGE);

    EXPECT_TRUE(ledger_.get_rule(rule.value).value.has_value());
    EXPECT_EQ(countForRule(rule.value), 3);
    EXPECT_EQ(ledger_.running_balance_through(Date(2025, 3, 31)).value, -360000);
    EXPECT_EQ(ledger_.get_rule(rule.value).value->last_generated_date, Date(2025, 3, 1));
}

TEST_F(LedgerManagerTest, CreateRecurring_FailedExpansion_LeavesNoTrace) {
    auto manual = ledger_.insert(Date(2025, 1, 1), -120000, "Rent");
    ASSERT_TRUE(manual.ok());
    execSql("CREATE TRIGGER block_march BEFORE INSERT ON entries "
            "WHEN NEW.date = '2025-03-01' BEGIN SELECT RAISE(ABORT, 'blocked'); END");

    auto rule = ledger_.create_recurring(Date(2025, 1, 1), -120000, "Rent", 1, "month", Date(2025, 4, 30));
    EXPECT_EQ(rule.error(), LedgerError::STORAGE);

    // No rule, and the manual entry was not re-parented
    EXPECT_TRUE(ledger_.list_rules().value.empty());
    EXPECT_EQ(ledger_.store().entries().count().value, 1);
    auto got = ledger_.get(manual.value);
    ASSERT_TRUE(got.value.has_value());
    EXPECT_FALSE(got.value->is_generated());
    EXPECT_EQ(ledger_.running_balance_through(Date(2025, 12, 31)).value, -120000);
}

TEST_F(LedgerManagerTest, ExtendAll_FailedRule_LeavesCacheUnset) {
    auto rule = ledger_.create_rule(Date(2025, 1, 1), -100, "x", 1, "month");
    ASSERT_TRUE(rule.ok());
    execSql("CREATE TRIGGER block_feb BEFORE INSERT ON entries "
            "WHEN NEW.date = '2025-02-01' BEGIN SELECT RAISE(ABORT, 'blocked'); END");

    EXPECT_FALSE(ledger_.extend_all_rules(Date(2025, 3, 31)).ok());
    EXPECT_FALSE(ledger_.generated_until().has_value());

    execSql("DROP TRIGGER block_feb");
    auto produced = ledger_.extend_all_rules(Date(2025, 3, 31));
    ASSERT_TRUE(produced.ok());
    EXPECT_EQ(produced.value, 3);
}

// ============================================================================
// LIFECYCLE
// ============================================================================

TEST(LedgerManagerLifecycleTest, NotInitialized_StorageError) {
    Logger::instance().set_level(LogLevel::ERROR);
    LedgerManager ledger;
    EXPECT_FALSE(ledger.is_initialized());
    EXPECT_EQ(ledger.insert(Date(2025, 1, 1), 1, "x").error(), LedgerError::STORAGE);
    EXPECT_EQ(ledger.running_balance_through(Date(2025, 1, 1)).error(), LedgerError::STORAGE);
    EXPECT_EQ(ledger.create_recurring(Date(2025, 1, 1), 1, "x", 1, "day", Date(2025, 1, 2)).error(),
              LedgerError::STORAGE);
}

TEST(LedgerManagerLifecycleTest, InitFromConfig) {
    Logger::instance().set_level(LogLevel::ERROR);
    Config config;
    ASSERT_TRUE(config.load_string(R"({"ledger": {"db_path": ":memory:", "horizon_months": 3}})"));

    LedgerManager ledger;
    ASSERT_TRUE(ledger.init(config).ok());
    EXPECT_TRUE(ledger.is_initialized());
    EXPECT_EQ(ledger.horizon_months(), 3);
    EXPECT_EQ(ledger.default_horizon(2025, 1), Date(2025, 4, 30));

    ledger.shutdown();
    EXPECT_FALSE(ledger.is_initialized());
}

TEST(LedgerManagerLifecycleTest, NegativeHorizonMonths_ClampedToZero) {
    Logger::instance().set_level(LogLevel::ERROR);
    Config config;
    ASSERT_TRUE(config.load_string(R"({"ledger": {"db_path": ":memory:", "horizon_months": -4}})"));

    LedgerManager ledger;
    ASSERT_TRUE(ledger.init(config).ok());
    EXPECT_EQ(ledger.horizon_months(), 0);
    EXPECT_EQ(ledger.default_horizon(2025, 2), Date(2025, 2, 28));
}
