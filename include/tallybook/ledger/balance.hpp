/*
 * tallybook - Balance calculator
 *
 * Point balances come straight from the per-day aggregate. A range of
 * running balances is seeded once with the balance through the day before
 * the range and then accumulated from the per-day sums inside it, so N
 * visible days cost one seed query plus one range scan.
 */
#ifndef TALLYBOOK_LEDGER_BALANCE_HPP
#define TALLYBOOK_LEDGER_BALANCE_HPP

#include <tallybook/ledger/store.hpp>
#include <tallybook/ledger/types.hpp>
#include <vector>

namespace tallybook {

class BalanceCalculator {
public:
    explicit BalanceCalculator(LedgerStore& store);
    
    LedgerResult<MinorUnits> balance_through(const Date& date);
    
    // One DailyBalance per calendar day in [first, last], days without
    // entries included
    LedgerResult<std::vector<DailyBalance>> running_balances(const Date& first, const Date& last);
    
    LedgerResult<std::vector<DailyBalance>> month_balances(int year, int month);

private:
    LedgerStore& store_;
};

} // namespace tallybook

#endif // TALLYBOOK_LEDGER_BALANCE_HPP
