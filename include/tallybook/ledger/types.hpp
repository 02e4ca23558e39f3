/*
 * tallybook - Ledger value types
 *
 * Entry and Rule are filled once at the storage boundary. Every engine
 * operation reports through LedgerStatus / LedgerResult<T> instead of
 * throwing; the caller decides how to present a failure.
 */
#ifndef TALLYBOOK_LEDGER_TYPES_HPP
#define TALLYBOOK_LEDGER_TYPES_HPP

#include <tallybook/ledger/date.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace tallybook {

typedef int64_t EntryId;
typedef int64_t RuleId;
typedef int64_t MinorUnits;

// ============================================================================
// Recurrence unit
// ============================================================================

enum class RecurrenceUnit {
    DAY,
    WEEK,
    MONTH
};

const char* unit_to_string(RecurrenceUnit unit);

// Accepts exactly "day", "week" or "month"
bool parse_unit(const std::string& text, RecurrenceUnit& out);

// ============================================================================
// Records
// ============================================================================

// A single ledger line. rule_id is empty for manually entered lines.
struct Entry {
    EntryId id;
    Date date;
    MinorUnits amount_minor_units;
    std::string note;
    std::optional<RuleId> rule_id;
    
    Entry() : id(0), amount_minor_units(0) {}
    
    bool is_generated() const { return rule_id.has_value(); }
};

// Recurrence template. last_generated_date is the expansion cursor.
struct Rule {
    RuleId id;
    Date start_date;
    MinorUnits amount_minor_units;
    std::string note;
    int every_n;
    RecurrenceUnit unit;
    std::optional<Date> last_generated_date;
    
    Rule() : id(0), amount_minor_units(0), every_n(1), unit(RecurrenceUnit::MONTH) {}
};

// Aggregate of one calendar day as kept in daily_totals
struct DayTotal {
    Date date;
    MinorUnits total_minor_units;
    int64_t entry_count;
    
    DayTotal() : total_minor_units(0), entry_count(0) {}
};

struct DailyBalance {
    Date date;
    MinorUnits day_total;
    MinorUnits closing_balance;
    
    DailyBalance() : day_total(0), closing_balance(0) {}
};

// ============================================================================
// Errors
// ============================================================================

enum class LedgerError {
    NONE = 0,
    INVALID_UNIT,
    INVALID_DATE,
    NON_POSITIVE_INTERVAL,
    NOT_FOUND,
    CONFLICT,
    STORAGE
};

const char* error_to_string(LedgerError error);

struct LedgerStatus {
    LedgerError error;
    std::string message;
    
    LedgerStatus() : error(LedgerError::NONE) {}
    
    bool ok() const { return error == LedgerError::NONE; }
    
    static LedgerStatus success() { return LedgerStatus(); }
    static LedgerStatus fail(LedgerError err, const std::string& msg) {
        LedgerStatus s;
        s.error = err;
        s.message = msg;
        return s;
    }
};

template<typename T>
struct LedgerResult {
    T value;
    LedgerStatus status;
    
    LedgerResult() : value() {}
    
    bool ok() const { return status.ok(); }
    LedgerError error() const { return status.error; }
    
    static LedgerResult success(T v) {
        LedgerResult r;
        r.value = std::move(v);
        return r;
    }
    static LedgerResult fail(LedgerError err, const std::string& msg) {
        LedgerResult r;
        r.status = LedgerStatus::fail(err, msg);
        return r;
    }
    static LedgerResult fail(const LedgerStatus& s) {
        LedgerResult r;
        r.status = s;
        return r;
    }
};

} // namespace tallybook

#endif // TALLYBOOK_LEDGER_TYPES_HPP
