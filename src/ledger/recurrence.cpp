#include <tallybook/ledger/recurrence.hpp>
#include <tallybook/core/logger.hpp>

namespace tallybook {

Date advance(const Date& date, int every_n, RecurrenceUnit unit) {
    switch (unit) {
        case RecurrenceUnit::DAY:
            return date.add_days(every_n);
        case RecurrenceUnit::WEEK:
            return date.add_days(static_cast<int64_t>(every_n) * 7);
        case RecurrenceUnit::MONTH:
            return date.add_months(every_n);
    }
    return date.add_months(every_n);
}

Date next_pending_occurrence(const Rule& rule) {
    if (rule.last_generated_date) {
        return advance(*rule.last_generated_date, rule.every_n, rule.unit);
    }
    return rule.start_date;
}

RecurrenceEngine::RecurrenceEngine(LedgerStore& store) : store_(store) {}

LedgerResult<int64_t> RecurrenceEngine::generate_until(RuleId rule_id, const Date& horizon) {
    if (!horizon.valid()) {
        return LedgerResult<int64_t>::fail(LedgerError::INVALID_DATE, "invalid horizon date");
    }
    
    LedgerResult<std::optional<Rule>> found = store_.rules().get(rule_id);
    if (!found.ok()) {
        return LedgerResult<int64_t>::fail(found.status);
    }
    if (!found.value) {
        LOG_DEBUG("[Recurrence] Rule %lld not found, nothing to generate", static_cast<long long>(rule_id));
        return LedgerResult<int64_t>::success(0);
    }
    const Rule& rule = *found.value;
    if (rule.every_n < 1) {
        return LedgerResult<int64_t>::fail(LedgerError::NON_POSITIVE_INTERVAL,
            "rule " + std::to_string(rule_id) + " has a non-positive interval");
    }
    
    Date current = next_pending_occurrence(rule);
    if (horizon < current) {
        return LedgerResult<int64_t>::success(0);
    }
    
    // Occurrences and the cursor move together or not at all
    Savepoint sp(store_.handle(), "generate");
    if (!sp.active()) {
        return LedgerResult<int64_t>::fail(LedgerError::STORAGE, "cannot start expansion");
    }
    
    int64_t produced = 0;
    Date last_created = current;
    while (current <= horizon) {
        LedgerResult<EntryId> ins = store_.entries().insert(current, rule.amount_minor_units, rule.note, rule.id);
        if (!ins.ok()) {
            LOG_ERROR("[Recurrence] Rule %lld: insert on %s failed: %s",
                      static_cast<long long>(rule_id), current.to_string().c_str(), ins.status.message.c_str());
            return LedgerResult<int64_t>::fail(ins.status);
        }
        last_created = current;
        ++produced;
        current = advance(current, rule.every_n, rule.unit);
    }
    
    LedgerStatus st = store_.rules().advance_cursor(rule.id, last_created);
    if (!st.ok()) {
        return LedgerResult<int64_t>::fail(st);
    }
    if (!sp.release()) {
        return LedgerResult<int64_t>::fail(LedgerError::STORAGE, "cannot commit expansion");
    }
    
    LOG_DEBUG("[Recurrence] Rule %lld: %lld occurrence(s) through %s",
              static_cast<long long>(rule_id), static_cast<long long>(produced),
              last_created.to_string().c_str());
    return LedgerResult<int64_t>::success(produced);
}

} // namespace tallybook
