#include <tallybook/ledger/balance.hpp>
#include <tallybook/core/logger.hpp>

namespace tallybook {

BalanceCalculator::BalanceCalculator(LedgerStore& store) : store_(store) {}

LedgerResult<MinorUnits> BalanceCalculator::balance_through(const Date& date) {
    if (!date.valid()) {
        return LedgerResult<MinorUnits>::fail(LedgerError::INVALID_DATE, "invalid balance date");
    }
    return store_.entries().running_balance_through(date);
}

LedgerResult<std::vector<DailyBalance>> BalanceCalculator::running_balances(const Date& first, const Date& last) {
    typedef LedgerResult<std::vector<DailyBalance>> Result;
    
    if (!first.valid() || !last.valid()) {
        return Result::fail(LedgerError::INVALID_DATE, "invalid range bound");
    }
    if (last < first) {
        return Result::fail(LedgerError::INVALID_DATE,
            "range end " + last.to_string() + " precedes start " + first.to_string());
    }
    
    LedgerResult<MinorUnits> seed = store_.entries().running_balance_through(first.add_days(-1));
    if (!seed.ok()) {
        return Result::fail(seed.status);
    }
    LedgerResult<std::vector<DayTotal>> totals = store_.entries().daily_totals(first, last);
    if (!totals.ok()) {
        return Result::fail(totals.status);
    }
    
    std::vector<DailyBalance> days;
    days.reserve(static_cast<size_t>(last.to_days() - first.to_days() + 1));
    
    MinorUnits running = seed.value;
    size_t next_total = 0;
    for (int64_t d = first.to_days(); d <= last.to_days(); ++d) {
        DailyBalance day;
        day.date = Date::from_days(d);
        if (next_total < totals.value.size() && totals.value[next_total].date == day.date) {
            day.day_total = totals.value[next_total].total_minor_units;
            ++next_total;
        }
        running += day.day_total;
        day.closing_balance = running;
        days.push_back(day);
    }
    
    LOG_DEBUG("[Balance] %zu day(s) %s..%s, opening %lld",
              days.size(), first.to_string().c_str(), last.to_string().c_str(),
              static_cast<long long>(seed.value));
    return Result::success(days);
}

LedgerResult<std::vector<DailyBalance>> BalanceCalculator::month_balances(int year, int month) {
    Date first(year, month, 1);
    if (!first.valid()) {
        return LedgerResult<std::vector<DailyBalance>>::fail(LedgerError::INVALID_DATE,
            "invalid month " + std::to_string(year) + "-" + std::to_string(month));
    }
    return running_balances(first, end_of_month(year, month));
}

} // namespace tallybook
