/*
 * tallybook - Ledger Manager
 *
 * Session-level entry point. Owns the store handle and the engine
 * components built on it, validates caller input, and runs the
 * multi-step workflows:
 *
 *   create_recurring  - create rule, fold a matching manual entry into it,
 *                       expand to the requested horizon
 *   extend_all_rules  - expand every rule to a horizon, skipping the work
 *                       when a previous call already covered it
 *
 * The "generated until" horizon cache is dropped whenever a rule is
 * created or deleted; a stale value must never hide a needed expansion.
 */
#ifndef TALLYBOOK_LEDGER_MANAGER_HPP
#define TALLYBOOK_LEDGER_MANAGER_HPP

#include <tallybook/ledger/balance.hpp>
#include <tallybook/ledger/reconcile.hpp>
#include <tallybook/ledger/recurrence.hpp>
#include <tallybook/ledger/store.hpp>
#include <tallybook/ledger/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tallybook {

class Config;

class LedgerManager {
public:
    static const int DEFAULT_HORIZON_MONTHS = 12;
    
    LedgerManager();
    ~LedgerManager();
    
    LedgerStatus init(const Config& config);
    LedgerStatus init(const std::string& db_path, int horizon_months = DEFAULT_HORIZON_MONTHS);
    void shutdown();
    bool is_initialized() const { return store_.is_open(); }
    
    // ========================================================================
    // Entries
    // ========================================================================
    
    // Returns the id already stored when the identical entry exists
    LedgerResult<EntryId> insert(const Date& date, MinorUnits amount, const std::string& note,
                                 std::optional<RuleId> rule_id = std::nullopt);
    LedgerStatus update(EntryId id, const Date& date, MinorUnits amount, const std::string& note);
    
    // Succeeds when the entry is already gone
    LedgerStatus remove(EntryId id);
    
    LedgerResult<std::optional<Entry>> get(EntryId id);
    LedgerResult<std::vector<Entry>> list_by_date(const Date& date);
    
    // ========================================================================
    // Balances
    // ========================================================================
    
    LedgerResult<MinorUnits> running_balance_through(const Date& date);
    LedgerResult<std::vector<DailyBalance>> running_balances(const Date& first, const Date& last);
    LedgerResult<std::vector<DailyBalance>> month_balances(int year, int month);
    
    // ========================================================================
    // Rules
    // ========================================================================
    
    // unit must be "day", "week" or "month"; every_n at least 1
    LedgerResult<RuleId> create_rule(const Date& start_date, MinorUnits amount, const std::string& note,
                                     int every_n, const std::string& unit);
    LedgerResult<int64_t> generate_until(RuleId rule_id, const Date& horizon);
    LedgerResult<ReconcileOutcome> coalesce_manual_start(RuleId rule_id);
    LedgerResult<int64_t> delete_rule_and_entries(RuleId rule_id);
    LedgerResult<std::vector<Rule>> list_rules();
    LedgerResult<std::optional<Rule>> get_rule(RuleId rule_id);
    
    // ========================================================================
    // Workflows
    // ========================================================================
    
    LedgerResult<RuleId> create_recurring(const Date& start_date, MinorUnits amount, const std::string& note,
                                          int every_n, const std::string& unit, const Date& horizon);
    
    // Last day of the month `horizon_months` after (year, month)
    Date default_horizon(int year, int month) const;
    
    // Returns the number of occurrences produced across all rules
    LedgerResult<int64_t> extend_all_rules(const Date& horizon);
    
    std::optional<Date> generated_until() const { return generated_until_; }
    void invalidate_horizon_cache() { generated_until_.reset(); }
    
    // ========================================================================
    // Access
    // ========================================================================
    
    LedgerStore& store() { return store_; }
    int horizon_months() const { return horizon_months_; }

private:
    LedgerManager(const LedgerManager&);
    LedgerManager& operator=(const LedgerManager&);
    
    LedgerStore store_;
    RecurrenceEngine recurrence_;
    Reconciler reconciler_;
    BalanceCalculator balances_;
    int horizon_months_;
    std::optional<Date> generated_until_;
    
    LedgerStatus require_open() const;
};

} // namespace tallybook

#endif // TALLYBOOK_LEDGER_MANAGER_HPP
