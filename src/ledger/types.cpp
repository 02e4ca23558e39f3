#include <tallybook/ledger/types.hpp>

namespace tallybook {

const char* unit_to_string(RecurrenceUnit unit) {
    switch (unit) {
        case RecurrenceUnit::DAY: return "day";
        case RecurrenceUnit::WEEK: return "week";
        case RecurrenceUnit::MONTH: return "month";
    }
    return "month";
}

bool parse_unit(const std::string& text, RecurrenceUnit& out) {
    if (text == "day") { out = RecurrenceUnit::DAY; return true; }
    if (text == "week") { out = RecurrenceUnit::WEEK; return true; }
    if (text == "month") { out = RecurrenceUnit::MONTH; return true; }
    return false;
}

const char* error_to_string(LedgerError error) {
    switch (error) {
        case LedgerError::NONE: return "ok";
        case LedgerError::INVALID_UNIT: return "invalid unit";
        case LedgerError::INVALID_DATE: return "invalid date";
        case LedgerError::NON_POSITIVE_INTERVAL: return "non-positive interval";
        case LedgerError::NOT_FOUND: return "not found";
        case LedgerError::CONFLICT: return "conflict";
        case LedgerError::STORAGE: return "storage failure";
    }
    return "unknown";
}

} // namespace tallybook
