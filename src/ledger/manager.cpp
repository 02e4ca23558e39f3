/*
 * tallybook - Ledger Manager Implementation
 */
#include <tallybook/ledger/manager.hpp>
#include <tallybook/core/config.hpp>
#include <tallybook/core/logger.hpp>
#include <tallybook/core/utils.hpp>

namespace tallybook {

LedgerManager::LedgerManager()
    : recurrence_(store_)
    , reconciler_(store_)
    , balances_(store_)
    , horizon_months_(DEFAULT_HORIZON_MONTHS)
{}

LedgerManager::~LedgerManager() {
    shutdown();
}

LedgerStatus LedgerManager::init(const Config& config) {
    std::string path = expand_home(config.get_string("ledger.db_path", "~/.tallybook/ledger.db"));
    int64_t months = config.get_int("ledger.horizon_months", DEFAULT_HORIZON_MONTHS);
    if (months < 0) {
        LOG_WARN("[LedgerManager] ledger.horizon_months=%lld is negative, using 0",
                 static_cast<long long>(months));
        months = 0;
    }
    return init(path, static_cast<int>(months));
}

LedgerStatus LedgerManager::init(const std::string& db_path, int horizon_months) {
    horizon_months_ = horizon_months < 0 ? 0 : horizon_months;
    generated_until_.reset();
    
    LedgerStatus st = store_.open(db_path);
    if (!st.ok()) {
        return st;
    }
    LOG_DEBUG("[LedgerManager] Ready (horizon %d months)", horizon_months_);
    return st;
}

void LedgerManager::shutdown() {
    if (store_.is_open()) {
        store_.close();
        LOG_DEBUG("[LedgerManager] Store closed");
    }
    generated_until_.reset();
}

LedgerStatus LedgerManager::require_open() const {
    if (!store_.is_open()) {
        return LedgerStatus::fail(LedgerError::STORAGE, "ledger is not open");
    }
    return LedgerStatus::success();
}

// ============================================================================
// Entries
// ============================================================================

LedgerResult<EntryId> LedgerManager::insert(const Date& date, MinorUnits amount, const std::string& note,
                                            std::optional<RuleId> rule_id) {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<EntryId>::fail(st);
    return store_.entries().insert(date, amount, note, rule_id);
}

LedgerStatus LedgerManager::update(EntryId id, const Date& date, MinorUnits amount, const std::string& note) {
    LedgerStatus st = require_open();
    if (!st.ok()) return st;
    return store_.entries().update(id, date, amount, note);
}

LedgerStatus LedgerManager::remove(EntryId id) {
    LedgerStatus st = require_open();
    if (!st.ok()) return st;
    return store_.entries().remove(id);
}

LedgerResult<std::optional<Entry>> LedgerManager::get(EntryId id) {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<std::optional<Entry>>::fail(st);
    return store_.entries().get(id);
}

LedgerResult<std::vector<Entry>> LedgerManager::list_by_date(const Date& date) {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<std::vector<Entry>>::fail(st);
    if (!date.valid()) {
        return LedgerResult<std::vector<Entry>>::fail(LedgerError::INVALID_DATE, "invalid date");
    }
    return store_.entries().list_by_date(date);
}

// ============================================================================
// Balances
// ============================================================================

LedgerResult<MinorUnits> LedgerManager::running_balance_through(const Date& date) {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<MinorUnits>::fail(st);
    return balances_.balance_through(date);
}

LedgerResult<std::vector<DailyBalance>> LedgerManager::running_balances(const Date& first, const Date& last) {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<std::vector<DailyBalance>>::fail(st);
    return balances_.running_balances(first, last);
}

LedgerResult<std::vector<DailyBalance>> LedgerManager::month_balances(int year, int month) {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<std::vector<DailyBalance>>::fail(st);
    return balances_.month_balances(year, month);
}

// ============================================================================
// Rules
// ============================================================================

LedgerResult<RuleId> LedgerManager::create_rule(const Date& start_date, MinorUnits amount,
                                                const std::string& note, int every_n,
                                                const std::string& unit) {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<RuleId>::fail(st);
    
    RecurrenceUnit parsed;
    if (!parse_unit(unit, parsed)) {
        return LedgerResult<RuleId>::fail(LedgerError::INVALID_UNIT,
            "unit must be day, week or month, got '" + unit + "'");
    }
    
    LedgerResult<RuleId> created = store_.rules().create(start_date, amount, note, every_n, parsed);
    if (created.ok()) {
        invalidate_horizon_cache();
    }
    return created;
}

LedgerResult<int64_t> LedgerManager::generate_until(RuleId rule_id, const Date& horizon) {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<int64_t>::fail(st);
    return recurrence_.generate_until(rule_id, horizon);
}

LedgerResult<ReconcileOutcome> LedgerManager::coalesce_manual_start(RuleId rule_id) {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<ReconcileOutcome>::fail(st);
    return reconciler_.coalesce_manual_start(rule_id);
}

LedgerResult<int64_t> LedgerManager::delete_rule_and_entries(RuleId rule_id) {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<int64_t>::fail(st);
    
    LedgerResult<int64_t> removed = store_.delete_rule_and_entries(rule_id);
    if (removed.ok()) {
        invalidate_horizon_cache();
    }
    return removed;
}

LedgerResult<std::vector<Rule>> LedgerManager::list_rules() {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<std::vector<Rule>>::fail(st);
    return store_.rules().list();
}

LedgerResult<std::optional<Rule>> LedgerManager::get_rule(RuleId rule_id) {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<std::optional<Rule>>::fail(st);
    return store_.rules().get(rule_id);
}

// ============================================================================
// Workflows
// ============================================================================

LedgerResult<RuleId> LedgerManager::create_recurring(const Date& start_date, MinorUnits amount,
                                                     const std::string& note, int every_n,
                                                     const std::string& unit, const Date& horizon) {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<RuleId>::fail(st);
    if (!horizon.valid()) {
        return LedgerResult<RuleId>::fail(LedgerError::INVALID_DATE, "invalid horizon date");
    }
    
    // The rule, the merge and the first expansion land together
    Savepoint sp(store_.handle(), "create_recurring");
    if (!sp.active()) {
        return LedgerResult<RuleId>::fail(LedgerError::STORAGE, "cannot start rule creation");
    }
    
    LedgerResult<RuleId> created = create_rule(start_date, amount, note, every_n, unit);
    if (!created.ok()) {
        return created;
    }
    
    LedgerResult<ReconcileOutcome> merged = reconciler_.coalesce_manual_start(created.value);
    if (!merged.ok()) {
        return LedgerResult<RuleId>::fail(merged.status);
    }
    
    LedgerResult<int64_t> produced = recurrence_.generate_until(created.value, horizon);
    if (!produced.ok()) {
        return LedgerResult<RuleId>::fail(produced.status);
    }
    
    if (!sp.release()) {
        return LedgerResult<RuleId>::fail(LedgerError::STORAGE, "cannot commit rule creation");
    }
    
    LOG_INFO("[LedgerManager] Recurring rule %lld: %s, %lld occurrence(s) through %s",
             static_cast<long long>(created.value), outcome_to_string(merged.value),
             static_cast<long long>(produced.value), horizon.to_string().c_str());
    return created;
}

Date LedgerManager::default_horizon(int year, int month) const {
    Date target = Date(year, month, 1).add_months(horizon_months_);
    return end_of_month(target.year, target.month);
}

LedgerResult<int64_t> LedgerManager::extend_all_rules(const Date& horizon) {
    LedgerStatus st = require_open();
    if (!st.ok()) return LedgerResult<int64_t>::fail(st);
    if (!horizon.valid()) {
        return LedgerResult<int64_t>::fail(LedgerError::INVALID_DATE, "invalid horizon date");
    }
    
    if (generated_until_ && horizon <= *generated_until_) {
        LOG_DEBUG("[LedgerManager] Rules already expanded through %s",
                  generated_until_->to_string().c_str());
        return LedgerResult<int64_t>::success(0);
    }
    
    LedgerResult<std::vector<Rule>> rules = store_.rules().list();
    if (!rules.ok()) {
        return LedgerResult<int64_t>::fail(rules.status);
    }
    
    int64_t total = 0;
    for (size_t i = 0; i < rules.value.size(); ++i) {
        LedgerResult<int64_t> produced = recurrence_.generate_until(rules.value[i].id, horizon);
        if (!produced.ok()) {
            // Rules before this one are expanded; the cache stays unset so
            // the next call retries the rest
            return produced;
        }
        total += produced.value;
    }
    
    generated_until_ = horizon;
    LOG_INFO("[LedgerManager] Expanded %zu rule(s) through %s (%lld new)",
             rules.value.size(), horizon.to_string().c_str(), static_cast<long long>(total));
    return LedgerResult<int64_t>::success(total);
}

} // namespace tallybook
