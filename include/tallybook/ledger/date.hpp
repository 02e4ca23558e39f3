/*
 * tallybook - Calendar dates
 *
 * Date is a plain calendar day (no time, no zone) in the proleptic
 * Gregorian calendar. Its ISO form (YYYY-MM-DD) is also the storage
 * form, so lexical order of the stored text matches date order.
 */
#ifndef TALLYBOOK_LEDGER_DATE_HPP
#define TALLYBOOK_LEDGER_DATE_HPP

#include <string>
#include <cstdint>

namespace tallybook {

bool is_leap_year(int year);

// 28..31; 0 for a month outside 1..12
int days_in_month(int year, int month);

struct Date {
    int year;
    int month;
    int day;
    
    Date() : year(1970), month(1), day(1) {}
    Date(int y, int m, int d) : year(y), month(m), day(d) {}
    
    // Strict "YYYY-MM-DD"; rejects impossible days such as 2025-02-30
    static bool parse(const std::string& iso, Date& out);
    
    // Days since 1970-01-01 and back
    static Date from_days(int64_t days);
    int64_t to_days() const;
    
    bool valid() const;
    std::string to_string() const;
    
    Date add_days(int64_t n) const;
    
    // Adds n calendar months, clamping the day to the end of the target month.
    // A result beyond 9999-12 comes back as year 10000 (before 0001-01 as
    // year 0); neither is valid().
    Date add_months(int n) const;
    
    bool operator==(const Date& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const {
        if (year != o.year) return year < o.year;
        if (month != o.month) return month < o.month;
        return day < o.day;
    }
    bool operator<=(const Date& o) const { return !(o < *this); }
    bool operator>(const Date& o) const { return o < *this; }
    bool operator>=(const Date& o) const { return !(*this < o); }
};

Date end_of_month(int year, int month);

// Today in local time
Date today();

} // namespace tallybook

#endif // TALLYBOOK_LEDGER_DATE_HPP
