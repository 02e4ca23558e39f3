/**
 * @file reconcile_test.cpp
 * @brief Folding a hand-entered start-date entry into a new rule
 */

#include <gtest/gtest.h>
#include <tallybook/core/logger.hpp>
#include <tallybook/ledger/reconcile.hpp>
#include <tallybook/ledger/recurrence.hpp>
#include <tallybook/ledger/store.hpp>

using namespace tallybook;

class ReconcileTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::ERROR);
        ASSERT_TRUE(store_.open(":memory:").ok());
    }

    RuleId makeRule(const Date& start, MinorUnits amount, const std::string& note) {
        LedgerResult<RuleId> r = store_.rules().create(start, amount, note, 1, RecurrenceUnit::MONTH);
        EXPECT_TRUE(r.ok()) << r.status.message;
        return r.value;
    }

    void execSql(const std::string& sql) {
        char* err = nullptr;
        int rc = sqlite3_exec(store_.handle(), sql.c_str(), nullptr, nullptr, &err);
        std::string msg = err ? err : "";
        sqlite3_free(err);
        ASSERT_EQ(rc, SQLITE_OK) << msg;
    }

    LedgerStore store_;
    Reconciler reconciler_{store_};
    RecurrenceEngine engine_{store_};
};

TEST_F(ReconcileTest, ManualOnly_IsReparented) {
    auto manual = store_.entries().insert(Date(2025, 1, 1), -120000, "Rent");
    ASSERT_TRUE(manual.ok());
    RuleId rule = makeRule(Date(2025, 1, 1), -120000, "Rent");

    auto outcome = reconciler_.coalesce_manual_start(rule);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.value, ReconcileOutcome::MANUAL_REPARENTED);

    auto got = store_.entries().get(manual.value);
    ASSERT_TRUE(got.value.has_value());
    ASSERT_TRUE(got.value->rule_id.has_value());
    EXPECT_EQ(*got.value->rule_id, rule);
    EXPECT_EQ(store_.entries().count().value, 1);
}

TEST_F(ReconcileTest, Reparented_ThenExpansionDoesNotDuplicateStart) {
    auto manual = store_.entries().insert(Date(2025, 1, 1), -120000, "Rent");
    ASSERT_TRUE(manual.ok());
    RuleId rule = makeRule(Date(2025, 1, 1), -120000, "Rent");

    ASSERT_TRUE(reconciler_.coalesce_manual_start(rule).ok());
    ASSERT_TRUE(engine_.generate_until(rule, Date(2025, 3, 1)).ok());

    auto day = store_.entries().list_by_date(Date(2025, 1, 1));
    ASSERT_TRUE(day.ok());
    ASSERT_EQ(day.value.size(), 1u);
    EXPECT_EQ(day.value[0].id, manual.value);
    EXPECT_EQ(store_.entries().count().value, 3);
}

TEST_F(ReconcileTest, BothExist_ManualRemoved) {
    auto manual = store_.entries().insert(Date(2025, 1, 1), -120000, "Rent");
    ASSERT_TRUE(manual.ok());
    RuleId rule = makeRule(Date(2025, 1, 1), -120000, "Rent");
    auto generated = store_.entries().insert(Date(2025, 1, 1), -120000, "Rent", rule);
    ASSERT_TRUE(generated.ok());

    auto outcome = reconciler_.coalesce_manual_start(rule);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.value, ReconcileOutcome::MANUAL_REMOVED);

    EXPECT_FALSE(store_.entries().get(manual.value).value.has_value());
    EXPECT_TRUE(store_.entries().get(generated.value).value.has_value());
    EXPECT_EQ(store_.entries().count().value, 1);
}

TEST_F(ReconcileTest, NoManualEntry_NothingToMerge) {
    RuleId rule = makeRule(Date(2025, 1, 1), -120000, "Rent");
    store_.entries().insert(Date(2025, 1, 1), -120000, "Rent (old)");

    auto outcome = reconciler_.coalesce_manual_start(rule);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.value, ReconcileOutcome::NOTHING_TO_MERGE);
    EXPECT_EQ(store_.entries().count().value, 1);
}

TEST_F(ReconcileTest, DifferentAmount_NotMerged) {
    store_.entries().insert(Date(2025, 1, 1), -110000, "Rent");
    RuleId rule = makeRule(Date(2025, 1, 1), -120000, "Rent");

    auto outcome = reconciler_.coalesce_manual_start(rule);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.value, ReconcileOutcome::NOTHING_TO_MERGE);
}

TEST_F(ReconcileTest, MissingRule_Reported) {
    auto outcome = reconciler_.coalesce_manual_start(777);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.value, ReconcileOutcome::RULE_NOT_FOUND);
}

TEST_F(ReconcileTest, SecondRun_IsNoOp) {
    store_.entries().insert(Date(2025, 1, 1), -120000, "Rent");
    RuleId rule = makeRule(Date(2025, 1, 1), -120000, "Rent");

    ASSERT_EQ(reconciler_.coalesce_manual_start(rule).value, ReconcileOutcome::MANUAL_REPARENTED);
    ASSERT_EQ(reconciler_.coalesce_manual_start(rule).value, ReconcileOutcome::NOTHING_TO_MERGE);
    EXPECT_EQ(store_.entries().count().value, 1);
}

// ============================================================================
// ATOMICITY
// ============================================================================

TEST_F(ReconcileTest, FailedReparent_LeavesManualEntryUntouched) {
    auto manual = store_.entries().insert(Date(2025, 1, 1), -120000, "Rent");
    ASSERT_TRUE(manual.ok());
    RuleId rule = makeRule(Date(2025, 1, 1), -120000, "Rent");
    execSql("CREATE TRIGGER block_link BEFORE UPDATE OF rule_id ON entries "
            "BEGIN SELECT RAISE(ABORT, 'blocked'); END");

    auto outcome = reconciler_.coalesce_manual_start(rule);
    EXPECT_EQ(outcome.error(), LedgerError::STORAGE);

    auto got = store_.entries().get(manual.value);
    ASSERT_TRUE(got.value.has_value());
    EXPECT_FALSE(got.value->is_generated());
    EXPECT_EQ(store_.entries().count().value, 1);
}

TEST_F(ReconcileTest, FailedRemoval_KeepsBothEntriesAndTotals) {
    auto manual = store_.entries().insert(Date(2025, 1, 1), -120000, "Rent");
    ASSERT_TRUE(manual.ok());
    RuleId rule = makeRule(Date(2025, 1, 1), -120000, "Rent");
    ASSERT_TRUE(store_.entries().insert(Date(2025, 1, 1), -120000, "Rent", rule).ok());
    execSql("CREATE TRIGGER block_delete BEFORE DELETE ON entries "
            "BEGIN SELECT RAISE(ABORT, 'blocked'); END");

    EXPECT_EQ(reconciler_.coalesce_manual_start(rule).error(), LedgerError::STORAGE);

    EXPECT_TRUE(store_.entries().get(manual.value).value.has_value());
    EXPECT_EQ(store_.entries().count().value, 2);
    EXPECT_EQ(store_.entries().running_balance_through(Date(2025, 1, 1)).value, -240000);
}
