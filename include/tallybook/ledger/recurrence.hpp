/*
 * tallybook - Recurrence engine
 *
 * Expands a rule into dated entries up to a horizon. Expansion resumes one
 * step after the rule's cursor, writes through EntryStore::insert (the
 * single de-duplication point) and leaves the cursor on the last
 * occurrence it produced, so repeated calls with a growing horizon never
 * duplicate or skip an occurrence and only pay for new ones.
 */
#ifndef TALLYBOOK_LEDGER_RECURRENCE_HPP
#define TALLYBOOK_LEDGER_RECURRENCE_HPP

#include <tallybook/ledger/store.hpp>
#include <tallybook/ledger/types.hpp>

namespace tallybook {

// Next occurrence after `date`
Date advance(const Date& date, int every_n, RecurrenceUnit unit);

// First occurrence not yet materialized for `rule`
Date next_pending_occurrence(const Rule& rule);

class RecurrenceEngine {
public:
    explicit RecurrenceEngine(LedgerStore& store);
    
    // Materializes every occurrence of `rule_id` up to and including
    // `horizon`. Returns how many occurrences were produced; a missing rule
    // or a horizon before the next pending occurrence yields 0.
    LedgerResult<int64_t> generate_until(RuleId rule_id, const Date& horizon);

private:
    LedgerStore& store_;
};

} // namespace tallybook

#endif // TALLYBOOK_LEDGER_RECURRENCE_HPP
