#include <tallybook/ledger/date.hpp>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace tallybook {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return days[month - 1];
}

bool Date::parse(const std::string& iso, Date& out) {
    if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') {
        return false;
    }
    for (size_t i = 0; i < iso.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(iso[i]))) return false;
    }
    
    Date d(std::stoi(iso.substr(0, 4)), std::stoi(iso.substr(5, 2)), std::stoi(iso.substr(8, 2)));
    if (!d.valid()) {
        return false;
    }
    out = d;
    return true;
}

bool Date::valid() const {
    return year >= 1 && year <= 9999 &&
           month >= 1 && month <= 12 &&
           day >= 1 && day <= days_in_month(year, month);
}

std::string Date::to_string() const {
    char buf[16];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return std::string(buf);
}

// Civil-from-days / days-from-civil over 400-year eras
int64_t Date::to_days() const {
    int64_t y = year - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t mp = (month + 9) % 12;
    int64_t doy = (153 * mp + 2) / 5 + day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::from_days(int64_t days) {
    int64_t z = days + 719468;
    int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    int y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
    return Date(y, m, d);
}

Date Date::add_days(int64_t n) const {
    return from_days(to_days() + n);
}

Date Date::add_months(int n) const {
    int64_t index = static_cast<int64_t>(year) * 12 + (month - 1) + n;
    int64_t y = index >= 0 ? index / 12 : (index - 11) / 12;
    int m = static_cast<int>(index - y * 12) + 1;
    
    // Past either end of the supported range: saturate to a year that
    // fails valid() but still orders correctly against valid dates
    if (y < 0) y = 0;
    if (y > 10000) y = 10000;
    
    int last = days_in_month(static_cast<int>(y), m);
    return Date(static_cast<int>(y), m, day < last ? day : last);
}

Date end_of_month(int year, int month) {
    return Date(year, month, days_in_month(year, month));
}

Date today() {
    time_t now = time(NULL);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    return Date(tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday);
}

} // namespace tallybook
