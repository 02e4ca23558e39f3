/*
 * tallybook - Reconciliation
 *
 * A user may record an entry by hand and later turn it into a recurring
 * rule starting that same day. Run once right after the rule is created
 * (before its first expansion) so exactly one entry survives for the
 * start date, and it carries the rule link.
 */
#ifndef TALLYBOOK_LEDGER_RECONCILE_HPP
#define TALLYBOOK_LEDGER_RECONCILE_HPP

#include <tallybook/ledger/store.hpp>
#include <tallybook/ledger/types.hpp>

namespace tallybook {

enum class ReconcileOutcome {
    RULE_NOT_FOUND,
    NOTHING_TO_MERGE,
    MANUAL_REPARENTED,   // the manual entry now belongs to the rule
    MANUAL_REMOVED       // the rule already had its own start entry
};

const char* outcome_to_string(ReconcileOutcome outcome);

class Reconciler {
public:
    explicit Reconciler(LedgerStore& store);
    
    LedgerResult<ReconcileOutcome> coalesce_manual_start(RuleId rule_id);

private:
    LedgerStore& store_;
};

} // namespace tallybook

#endif // TALLYBOOK_LEDGER_RECONCILE_HPP
