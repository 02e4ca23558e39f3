#include <tallybook/ledger/reconcile.hpp>
#include <tallybook/core/logger.hpp>

namespace tallybook {

const char* outcome_to_string(ReconcileOutcome outcome) {
    switch (outcome) {
        case ReconcileOutcome::RULE_NOT_FOUND: return "rule not found";
        case ReconcileOutcome::NOTHING_TO_MERGE: return "nothing to merge";
        case ReconcileOutcome::MANUAL_REPARENTED: return "manual entry attached to rule";
        case ReconcileOutcome::MANUAL_REMOVED: return "manual duplicate removed";
    }
    return "unknown";
}

Reconciler::Reconciler(LedgerStore& store) : store_(store) {}

LedgerResult<ReconcileOutcome> Reconciler::coalesce_manual_start(RuleId rule_id) {
    typedef LedgerResult<ReconcileOutcome> Result;
    
    LedgerResult<std::optional<Rule>> found = store_.rules().get(rule_id);
    if (!found.ok()) {
        return Result::fail(found.status);
    }
    if (!found.value) {
        return Result::success(ReconcileOutcome::RULE_NOT_FOUND);
    }
    const Rule& rule = *found.value;
    
    Savepoint sp(store_.handle(), "reconcile");
    if (!sp.active()) {
        return Result::fail(LedgerError::STORAGE, "cannot start reconciliation");
    }
    
    EntryStore& entries = store_.entries();
    LedgerResult<std::optional<EntryId>> manual =
        entries.find(rule.start_date, rule.amount_minor_units, rule.note, std::nullopt);
    if (!manual.ok()) {
        return Result::fail(manual.status);
    }
    if (!manual.value) {
        return Result::success(ReconcileOutcome::NOTHING_TO_MERGE);
    }
    
    LedgerResult<std::optional<EntryId>> generated =
        entries.find(rule.start_date, rule.amount_minor_units, rule.note, rule.id);
    if (!generated.ok()) {
        return Result::fail(generated.status);
    }
    
    ReconcileOutcome outcome;
    if (generated.value) {
        LedgerStatus st = entries.remove(*manual.value);
        if (!st.ok()) {
            return Result::fail(st);
        }
        outcome = ReconcileOutcome::MANUAL_REMOVED;
    } else {
        // Re-parent in place so the entry keeps its id
        LedgerStatus st = entries.attach_to_rule(*manual.value, rule.id);
        if (!st.ok()) {
            return Result::fail(st);
        }
        outcome = ReconcileOutcome::MANUAL_REPARENTED;
    }
    
    if (!sp.release()) {
        return Result::fail(LedgerError::STORAGE, "cannot commit reconciliation");
    }
    
    LOG_INFO("[Reconciler] Rule %lld, entry %lld: %s",
             static_cast<long long>(rule_id), static_cast<long long>(*manual.value),
             outcome_to_string(outcome));
    return Result::success(outcome);
}

} // namespace tallybook
