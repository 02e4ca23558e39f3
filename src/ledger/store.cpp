/*
 * tallybook - Ledger Store Implementation
 *
 * SQLite storage backend for entries and recurrence rules.
 */
#include <tallybook/ledger/store.hpp>
#include <tallybook/ledger/schema.hpp>
#include <tallybook/core/logger.hpp>
#include <tallybook/core/utils.hpp>
#include <sqlite3.h>

namespace tallybook {

// ============================================================================
// Helpers
// ============================================================================

namespace {

std::string column_string(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

void bind_date(sqlite3_stmt* stmt, int index, const Date& date) {
    std::string iso = date.to_string();
    sqlite3_bind_text(stmt, index, iso.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_rule(sqlite3_stmt* stmt, int index, const std::optional<RuleId>& rule_id) {
    if (rule_id) {
        sqlite3_bind_int64(stmt, index, *rule_id);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

// Column order: id, date, amount_minor_units, note, rule_id
bool read_entry(sqlite3_stmt* stmt, Entry& out) {
    out.id = sqlite3_column_int64(stmt, 0);
    if (!Date::parse(column_string(stmt, 1), out.date)) {
        return false;
    }
    out.amount_minor_units = sqlite3_column_int64(stmt, 2);
    out.note = column_string(stmt, 3);
    if (sqlite3_column_type(stmt, 4) == SQLITE_NULL) {
        out.rule_id.reset();
    } else {
        out.rule_id = sqlite3_column_int64(stmt, 4);
    }
    return true;
}

// Column order: id, start_date, amount_minor_units, note, every_n, unit, last_generated_date
bool read_rule(sqlite3_stmt* stmt, Rule& out) {
    out.id = sqlite3_column_int64(stmt, 0);
    if (!Date::parse(column_string(stmt, 1), out.start_date)) {
        return false;
    }
    out.amount_minor_units = sqlite3_column_int64(stmt, 2);
    out.note = column_string(stmt, 3);
    out.every_n = sqlite3_column_int(stmt, 4);
    if (!parse_unit(column_string(stmt, 5), out.unit)) {
        return false;
    }
    if (sqlite3_column_type(stmt, 6) == SQLITE_NULL) {
        out.last_generated_date.reset();
    } else {
        Date cursor;
        if (!Date::parse(column_string(stmt, 6), cursor)) {
            return false;
        }
        out.last_generated_date = cursor;
    }
    return true;
}

// Steps a statement that yields no rows, then finalizes it. The extended
// error code and message are captured first; finalize may clear them.
int finish(sqlite3* db, sqlite3_stmt* stmt, int& ext_code, std::string& error) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        ext_code = sqlite3_extended_errcode(db);
        error = sqlite3_errmsg(db);
    }
    sqlite3_finalize(stmt);
    return rc;
}

const char* ENTRY_COLUMNS = "id, date, amount_minor_units, note, rule_id";
const char* RULE_COLUMNS = "id, start_date, amount_minor_units, note, every_n, unit, last_generated_date";

} // namespace

// ============================================================================
// Savepoint Implementation
// ============================================================================

Savepoint::Savepoint(sqlite3* db, const std::string& name)
    : db_(db), name_(name), active_(false)
{
    if (!db_) return;
    std::string sql = "SAVEPOINT " + name_;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[Savepoint] Failed to open '%s': %s", name_.c_str(), sqlite3_errmsg(db_));
        return;
    }
    active_ = true;
}

Savepoint::~Savepoint() {
    if (active_) {
        rollback();
    }
}

bool Savepoint::release() {
    if (!active_) return false;
    std::string sql = "RELEASE " + name_;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[Savepoint] Failed to release '%s': %s", name_.c_str(), sqlite3_errmsg(db_));
        rollback();
        return false;
    }
    active_ = false;
    return true;
}

void Savepoint::rollback() {
    if (!active_) return;
    std::string sql = "ROLLBACK TO " + name_ + "; RELEASE " + name_;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[Savepoint] Failed to roll back '%s': %s", name_.c_str(), sqlite3_errmsg(db_));
    } else {
        LOG_DEBUG("[Savepoint] Rolled back '%s'", name_.c_str());
    }
    active_ = false;
}

// ============================================================================
// EntryStore Implementation
// ============================================================================

EntryStore::EntryStore(sqlite3*& db) : db_(db) {}

bool EntryStore::prepare(const char* sql, sqlite3_stmt** stmt) {
    if (!db_) {
        last_error_ = "database is not open";
        return false;
    }
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        LOG_ERROR("[EntryStore] prepare failed: %s\n  Query: %s", last_error_.c_str(), sql);
        return false;
    }
    return true;
}

LedgerStatus EntryStore::storage_failure(const char* what) {
    if (db_ && last_error_.empty()) {
        last_error_ = sqlite3_errmsg(db_);
    }
    LOG_ERROR("[EntryStore] %s failed: %s", what, last_error_.c_str());
    return LedgerStatus::fail(LedgerError::STORAGE, std::string(what) + ": " + last_error_);
}

LedgerResult<std::vector<Entry>> EntryStore::collect(sqlite3_stmt* stmt, const char* what) {
    std::vector<Entry> rows;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Entry entry;
        if (!read_entry(stmt, entry)) {
            sqlite3_finalize(stmt);
            last_error_ = "malformed date in entries row";
            return LedgerResult<std::vector<Entry>>::fail(storage_failure(what));
        }
        rows.push_back(entry);
    }
    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return LedgerResult<std::vector<Entry>>::fail(storage_failure(what));
    }
    sqlite3_finalize(stmt);
    return LedgerResult<std::vector<Entry>>::success(rows);
}

LedgerResult<EntryId> EntryStore::insert(const Date& date, MinorUnits amount, const std::string& note,
                                         std::optional<RuleId> rule_id) {
    last_error_.clear();
    if (!date.valid()) {
        return LedgerResult<EntryId>::fail(LedgerError::INVALID_DATE, "invalid entry date");
    }
    if (rule_id && *rule_id <= 0) {
        return LedgerResult<EntryId>::fail(LedgerError::NOT_FOUND,
            "rule " + std::to_string(*rule_id) + " does not exist");
    }
    
    // Insert-or-lookup is one atomic unit
    Savepoint sp(db_, "entry_insert");
    if (!sp.active()) {
        return LedgerResult<EntryId>::fail(storage_failure("insert"));
    }
    
    const char* insert_sql =
        "INSERT INTO entries (date, amount_minor_units, note, rule_id) VALUES (?, ?, ?, ?) "
        "ON CONFLICT DO NOTHING";
    
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(insert_sql, &stmt)) {
        return LedgerResult<EntryId>::fail(storage_failure("insert"));
    }
    bind_date(stmt, 1, date);
    sqlite3_bind_int64(stmt, 2, amount);
    sqlite3_bind_text(stmt, 3, note.c_str(), -1, SQLITE_TRANSIENT);
    bind_rule(stmt, 4, rule_id);
    
    int ext = 0;
    int rc = finish(db_, stmt, ext, last_error_);
    
    if (rc != SQLITE_DONE) {
        if (ext == SQLITE_CONSTRAINT_FOREIGNKEY) {
            return LedgerResult<EntryId>::fail(LedgerError::NOT_FOUND,
                "rule " + std::to_string(rule_id ? *rule_id : 0) + " does not exist");
        }
        return LedgerResult<EntryId>::fail(storage_failure("insert"));
    }
    
    EntryId id = 0;
    if (sqlite3_changes(db_) > 0) {
        id = sqlite3_last_insert_rowid(db_);
        LOG_DEBUG("[EntryStore] Inserted entry id=%lld date=%s amount=%lld",
                  static_cast<long long>(id), date.to_string().c_str(), static_cast<long long>(amount));
    } else {
        LedgerResult<std::optional<EntryId>> existing = find(date, amount, note, rule_id);
        if (!existing.ok()) {
            return LedgerResult<EntryId>::fail(existing.status);
        }
        if (!existing.value) {
            last_error_ = "identity conflict without a matching row";
            return LedgerResult<EntryId>::fail(storage_failure("insert"));
        }
        id = *existing.value;
        LOG_DEBUG("[EntryStore] Entry already present id=%lld date=%s",
                  static_cast<long long>(id), date.to_string().c_str());
    }
    
    if (!sp.release()) {
        return LedgerResult<EntryId>::fail(storage_failure("insert"));
    }
    return LedgerResult<EntryId>::success(id);
}

LedgerStatus EntryStore::update(EntryId id, const Date& date, MinorUnits amount, const std::string& note) {
    last_error_.clear();
    if (!date.valid()) {
        return LedgerStatus::fail(LedgerError::INVALID_DATE, "invalid entry date");
    }
    
    const char* sql =
        "UPDATE entries SET date = ?, amount_minor_units = ?, note = ? WHERE id = ?";
    
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) {
        return storage_failure("update");
    }
    bind_date(stmt, 1, date);
    sqlite3_bind_int64(stmt, 2, amount);
    sqlite3_bind_text(stmt, 3, note.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, id);
    
    int ext = 0;
    int rc = finish(db_, stmt, ext, last_error_);
    
    if (rc != SQLITE_DONE) {
        if (ext == SQLITE_CONSTRAINT_UNIQUE) {
            LOG_WARN("[EntryStore] update of id=%lld collides with an existing entry",
                     static_cast<long long>(id));
            return LedgerStatus::fail(LedgerError::CONFLICT,
                "an identical entry already exists on " + date.to_string());
        }
        return storage_failure("update");
    }
    if (sqlite3_changes(db_) == 0) {
        return LedgerStatus::fail(LedgerError::NOT_FOUND, "entry " + std::to_string(id) + " not found");
    }
    
    LOG_DEBUG("[EntryStore] Updated entry id=%lld", static_cast<long long>(id));
    return LedgerStatus::success();
}

LedgerStatus EntryStore::remove(EntryId id) {
    last_error_.clear();
    sqlite3_stmt* stmt = nullptr;
    if (!prepare("DELETE FROM entries WHERE id = ?", &stmt)) {
        return storage_failure("remove");
    }
    sqlite3_bind_int64(stmt, 1, id);
    
    int ext = 0;
    int rc = finish(db_, stmt, ext, last_error_);
    if (rc != SQLITE_DONE) {
        return storage_failure("remove");
    }
    
    LOG_DEBUG("[EntryStore] Removed entry id=%lld (rows=%d)", static_cast<long long>(id), sqlite3_changes(db_));
    return LedgerStatus::success();
}

LedgerResult<std::optional<Entry>> EntryStore::get(EntryId id) {
    last_error_.clear();
    std::string sql = std::string("SELECT ") + ENTRY_COLUMNS + " FROM entries WHERE id = ?";
    
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql.c_str(), &stmt)) {
        return LedgerResult<std::optional<Entry>>::fail(storage_failure("get"));
    }
    sqlite3_bind_int64(stmt, 1, id);
    
    LedgerResult<std::vector<Entry>> rows = collect(stmt, "get");
    if (!rows.ok()) {
        return LedgerResult<std::optional<Entry>>::fail(rows.status);
    }
    std::optional<Entry> found;
    if (!rows.value.empty()) {
        found = rows.value.front();
    }
    return LedgerResult<std::optional<Entry>>::success(found);
}

LedgerResult<std::vector<Entry>> EntryStore::list_by_date(const Date& date) {
    last_error_.clear();
    std::string sql = std::string("SELECT ") + ENTRY_COLUMNS +
                      " FROM entries WHERE date = ? ORDER BY id DESC";
    
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql.c_str(), &stmt)) {
        return LedgerResult<std::vector<Entry>>::fail(storage_failure("list_by_date"));
    }
    bind_date(stmt, 1, date);
    return collect(stmt, "list_by_date");
}

LedgerResult<std::vector<Entry>> EntryStore::list_by_rule(RuleId rule_id) {
    last_error_.clear();
    std::string sql = std::string("SELECT ") + ENTRY_COLUMNS +
                      " FROM entries WHERE rule_id = ? ORDER BY date, id";
    
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql.c_str(), &stmt)) {
        return LedgerResult<std::vector<Entry>>::fail(storage_failure("list_by_rule"));
    }
    sqlite3_bind_int64(stmt, 1, rule_id);
    return collect(stmt, "list_by_rule");
}

LedgerResult<std::optional<EntryId>> EntryStore::find(const Date& date, MinorUnits amount,
                                                      const std::string& note,
                                                      std::optional<RuleId> rule_id) {
    // "rule_id IS ?" matches NULL against a NULL binding
    const char* sql =
        "SELECT id FROM entries "
        "WHERE date = ? AND amount_minor_units = ? AND note = ? AND rule_id IS ? "
        "ORDER BY id LIMIT 1";
    
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) {
        return LedgerResult<std::optional<EntryId>>::fail(storage_failure("find"));
    }
    bind_date(stmt, 1, date);
    sqlite3_bind_int64(stmt, 2, amount);
    sqlite3_bind_text(stmt, 3, note.c_str(), -1, SQLITE_TRANSIENT);
    bind_rule(stmt, 4, rule_id);
    
    std::optional<EntryId> found;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        found = sqlite3_column_int64(stmt, 0);
    } else if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return LedgerResult<std::optional<EntryId>>::fail(storage_failure("find"));
    }
    sqlite3_finalize(stmt);
    return LedgerResult<std::optional<EntryId>>::success(found);
}

LedgerResult<int64_t> EntryStore::count() {
    last_error_.clear();
    sqlite3_stmt* stmt = nullptr;
    if (!prepare("SELECT COUNT(*) FROM entries", &stmt)) {
        return LedgerResult<int64_t>::fail(storage_failure("count"));
    }
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        last_error_ = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return LedgerResult<int64_t>::fail(storage_failure("count"));
    }
    int64_t n = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return LedgerResult<int64_t>::success(n);
}

LedgerStatus EntryStore::attach_to_rule(EntryId id, RuleId rule_id) {
    last_error_.clear();
    if (rule_id <= 0) {
        return LedgerStatus::fail(LedgerError::NOT_FOUND, "rule " + std::to_string(rule_id) + " not found");
    }
    sqlite3_stmt* stmt = nullptr;
    if (!prepare("UPDATE entries SET rule_id = ? WHERE id = ? AND rule_id IS NULL", &stmt)) {
        return storage_failure("attach_to_rule");
    }
    sqlite3_bind_int64(stmt, 1, rule_id);
    sqlite3_bind_int64(stmt, 2, id);
    
    int ext = 0;
    int rc = finish(db_, stmt, ext, last_error_);
    if (rc != SQLITE_DONE) {
        if (ext == SQLITE_CONSTRAINT_UNIQUE) {
            return LedgerStatus::fail(LedgerError::CONFLICT, "rule already owns an identical entry");
        }
        if (ext == SQLITE_CONSTRAINT_FOREIGNKEY) {
            return LedgerStatus::fail(LedgerError::NOT_FOUND, "rule " + std::to_string(rule_id) + " not found");
        }
        return storage_failure("attach_to_rule");
    }
    if (sqlite3_changes(db_) == 0) {
        return LedgerStatus::fail(LedgerError::NOT_FOUND,
            "no manual entry with id " + std::to_string(id));
    }
    
    LOG_DEBUG("[EntryStore] Entry id=%lld attached to rule %lld",
              static_cast<long long>(id), static_cast<long long>(rule_id));
    return LedgerStatus::success();
}

LedgerResult<int64_t> EntryStore::remove_by_rule(RuleId rule_id) {
    last_error_.clear();
    sqlite3_stmt* stmt = nullptr;
    if (!prepare("DELETE FROM entries WHERE rule_id = ?", &stmt)) {
        return LedgerResult<int64_t>::fail(storage_failure("remove_by_rule"));
    }
    sqlite3_bind_int64(stmt, 1, rule_id);
    
    int ext = 0;
    int rc = finish(db_, stmt, ext, last_error_);
    if (rc != SQLITE_DONE) {
        return LedgerResult<int64_t>::fail(storage_failure("remove_by_rule"));
    }
    return LedgerResult<int64_t>::success(sqlite3_changes(db_));
}

LedgerResult<MinorUnits> EntryStore::running_balance_through(const Date& date) {
    last_error_.clear();
    sqlite3_stmt* stmt = nullptr;
    if (!prepare("SELECT COALESCE(SUM(total_minor_units), 0) FROM daily_totals WHERE date <= ?", &stmt)) {
        return LedgerResult<MinorUnits>::fail(storage_failure("running_balance_through"));
    }
    bind_date(stmt, 1, date);
    
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        last_error_ = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return LedgerResult<MinorUnits>::fail(storage_failure("running_balance_through"));
    }
    MinorUnits balance = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return LedgerResult<MinorUnits>::success(balance);
}

LedgerResult<std::vector<DayTotal>> EntryStore::daily_totals(const Date& first, const Date& last) {
    last_error_.clear();
    const char* sql =
        "SELECT date, total_minor_units, entry_count FROM daily_totals "
        "WHERE date BETWEEN ? AND ? ORDER BY date";
    
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) {
        return LedgerResult<std::vector<DayTotal>>::fail(storage_failure("daily_totals"));
    }
    bind_date(stmt, 1, first);
    bind_date(stmt, 2, last);
    
    std::vector<DayTotal> totals;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        DayTotal day;
        if (!Date::parse(column_string(stmt, 0), day.date)) {
            LOG_WARN("[EntryStore] Skipping daily total with malformed date '%s'",
                     column_string(stmt, 0).c_str());
            continue;
        }
        day.total_minor_units = sqlite3_column_int64(stmt, 1);
        day.entry_count = sqlite3_column_int64(stmt, 2);
        totals.push_back(day);
    }
    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return LedgerResult<std::vector<DayTotal>>::fail(storage_failure("daily_totals"));
    }
    sqlite3_finalize(stmt);
    return LedgerResult<std::vector<DayTotal>>::success(totals);
}

// ============================================================================
// RuleStore Implementation
// ============================================================================

RuleStore::RuleStore(sqlite3*& db) : db_(db) {}

bool RuleStore::prepare(const char* sql, sqlite3_stmt** stmt) {
    if (!db_) {
        last_error_ = "database is not open";
        return false;
    }
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        LOG_ERROR("[RuleStore] prepare failed: %s\n  Query: %s", last_error_.c_str(), sql);
        return false;
    }
    return true;
}

LedgerStatus RuleStore::storage_failure(const char* what) {
    if (db_ && last_error_.empty()) {
        last_error_ = sqlite3_errmsg(db_);
    }
    LOG_ERROR("[RuleStore] %s failed: %s", what, last_error_.c_str());
    return LedgerStatus::fail(LedgerError::STORAGE, std::string(what) + ": " + last_error_);
}

LedgerResult<RuleId> RuleStore::create(const Date& start_date, MinorUnits amount, const std::string& note,
                                       int every_n, RecurrenceUnit unit) {
    last_error_.clear();
    if (!start_date.valid()) {
        return LedgerResult<RuleId>::fail(LedgerError::INVALID_DATE, "invalid rule start date");
    }
    if (every_n < 1) {
        return LedgerResult<RuleId>::fail(LedgerError::NON_POSITIVE_INTERVAL,
            "interval must be at least 1, got " + std::to_string(every_n));
    }
    
    const char* sql =
        "INSERT INTO rules (start_date, amount_minor_units, note, every_n, unit, last_generated_date) "
        "VALUES (?, ?, ?, ?, ?, NULL)";
    
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) {
        return LedgerResult<RuleId>::fail(storage_failure("create"));
    }
    bind_date(stmt, 1, start_date);
    sqlite3_bind_int64(stmt, 2, amount);
    sqlite3_bind_text(stmt, 3, note.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, every_n);
    sqlite3_bind_text(stmt, 5, unit_to_string(unit), -1, SQLITE_STATIC);
    
    int ext = 0;
    int rc = finish(db_, stmt, ext, last_error_);
    if (rc != SQLITE_DONE) {
        return LedgerResult<RuleId>::fail(storage_failure("create"));
    }
    
    RuleId id = sqlite3_last_insert_rowid(db_);
    LOG_INFO("[RuleStore] Created rule id=%lld start=%s every %d %s",
             static_cast<long long>(id), start_date.to_string().c_str(), every_n, unit_to_string(unit));
    return LedgerResult<RuleId>::success(id);
}

LedgerResult<std::optional<Rule>> RuleStore::get(RuleId id) {
    last_error_.clear();
    std::string sql = std::string("SELECT ") + RULE_COLUMNS + " FROM rules WHERE id = ?";
    
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql.c_str(), &stmt)) {
        return LedgerResult<std::optional<Rule>>::fail(storage_failure("get"));
    }
    sqlite3_bind_int64(stmt, 1, id);
    
    std::optional<Rule> found;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        Rule rule;
        if (!read_rule(stmt, rule)) {
            sqlite3_finalize(stmt);
            last_error_ = "malformed rules row " + std::to_string(id);
            return LedgerResult<std::optional<Rule>>::fail(storage_failure("get"));
        }
        found = rule;
    } else if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return LedgerResult<std::optional<Rule>>::fail(storage_failure("get"));
    }
    sqlite3_finalize(stmt);
    return LedgerResult<std::optional<Rule>>::success(found);
}

LedgerResult<std::vector<Rule>> RuleStore::list() {
    last_error_.clear();
    std::string sql = std::string("SELECT ") + RULE_COLUMNS + " FROM rules ORDER BY id";
    
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql.c_str(), &stmt)) {
        return LedgerResult<std::vector<Rule>>::fail(storage_failure("list"));
    }
    
    std::vector<Rule> rules;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Rule rule;
        if (!read_rule(stmt, rule)) {
            sqlite3_finalize(stmt);
            last_error_ = "malformed rules row";
            return LedgerResult<std::vector<Rule>>::fail(storage_failure("list"));
        }
        rules.push_back(rule);
    }
    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return LedgerResult<std::vector<Rule>>::fail(storage_failure("list"));
    }
    sqlite3_finalize(stmt);
    return LedgerResult<std::vector<Rule>>::success(rules);
}

LedgerStatus RuleStore::remove(RuleId id) {
    last_error_.clear();
    sqlite3_stmt* stmt = nullptr;
    if (!prepare("DELETE FROM rules WHERE id = ?", &stmt)) {
        return storage_failure("remove");
    }
    sqlite3_bind_int64(stmt, 1, id);
    
    int ext = 0;
    int rc = finish(db_, stmt, ext, last_error_);
    if (rc != SQLITE_DONE) {
        return storage_failure("remove");
    }
    return LedgerStatus::success();
}

LedgerStatus RuleStore::advance_cursor(RuleId id, const Date& date) {
    last_error_.clear();
    const char* sql =
        "UPDATE rules SET last_generated_date = ? "
        "WHERE id = ? AND (last_generated_date IS NULL OR last_generated_date <= ?)";
    
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) {
        return storage_failure("advance_cursor");
    }
    bind_date(stmt, 1, date);
    sqlite3_bind_int64(stmt, 2, id);
    bind_date(stmt, 3, date);
    
    int ext = 0;
    int rc = finish(db_, stmt, ext, last_error_);
    if (rc != SQLITE_DONE) {
        return storage_failure("advance_cursor");
    }
    if (sqlite3_changes(db_) == 0) {
        LOG_DEBUG("[RuleStore] Cursor of rule %lld not moved to %s",
                  static_cast<long long>(id), date.to_string().c_str());
    }
    return LedgerStatus::success();
}

// ============================================================================
// LedgerStore Implementation
// ============================================================================

LedgerStore::LedgerStore() : db_(nullptr), entries_(db_), rules_(db_) {}

LedgerStore::~LedgerStore() {
    close();
}

LedgerStatus LedgerStore::open(const std::string& db_path) {
    if (db_) {
        close();
    }
    
    if (db_path != ":memory:" && !create_parent_directory(db_path)) {
        LOG_ERROR("[LedgerStore] Failed to create parent directory for '%s'", db_path.c_str());
        return LedgerStatus::fail(LedgerError::STORAGE, "cannot create directory for " + db_path);
    }
    
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        LOG_ERROR("[LedgerStore] Failed to open database '%s': %s", db_path.c_str(), err.c_str());
        sqlite3_close(db_);
        db_ = nullptr;
        return LedgerStatus::fail(LedgerError::STORAGE, "cannot open " + db_path + ": " + err);
    }
    path_ = db_path;
    
    // Cascading rule deletes depend on foreign keys being enforced
    if (!exec("PRAGMA foreign_keys = ON")) {
        close();
        return LedgerStatus::fail(LedgerError::STORAGE, "cannot enable foreign keys");
    }
    exec("PRAGMA journal_mode = WAL");
    exec("PRAGMA synchronous = NORMAL");
    exec("PRAGMA temp_store = MEMORY");
    exec("PRAGMA busy_timeout = 3000");
    
    SchemaMigrator migrator(db_);
    if (!migrator.migrate()) {
        std::string err = migrator.last_error();
        LOG_ERROR("[LedgerStore] Failed to migrate '%s': %s", db_path.c_str(), err.c_str());
        close();
        return LedgerStatus::fail(LedgerError::STORAGE, "schema migration failed: " + err);
    }
    
    LOG_INFO("[LedgerStore] Database opened: %s (schema v%d)", db_path.c_str(), schema_version());
    return LedgerStatus::success();
}

void LedgerStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_DEBUG("[LedgerStore] Database closed: %s", path_.c_str());
    }
}

bool LedgerStore::exec(const std::string& sql) {
    if (!db_) return false;
    
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    
    if (rc != SQLITE_OK) {
        LOG_ERROR("[LedgerStore] SQL error: %s\n  Query: %s",
                  err_msg ? err_msg : "unknown", sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    
    return true;
}

LedgerResult<int64_t> LedgerStore::delete_rule_and_entries(RuleId rule_id) {
    if (!db_) {
        return LedgerResult<int64_t>::fail(LedgerError::STORAGE, "database is not open");
    }
    
    Savepoint sp(db_, "rule_delete");
    if (!sp.active()) {
        return LedgerResult<int64_t>::fail(LedgerError::STORAGE, sqlite3_errmsg(db_));
    }
    
    // Entries first, so the count reflects what the rule generated; the
    // foreign key cascade would catch any left behind
    LedgerResult<int64_t> removed = entries_.remove_by_rule(rule_id);
    if (!removed.ok()) {
        return removed;
    }
    LedgerStatus st = rules_.remove(rule_id);
    if (!st.ok()) {
        return LedgerResult<int64_t>::fail(st);
    }
    if (!sp.release()) {
        return LedgerResult<int64_t>::fail(LedgerError::STORAGE, sqlite3_errmsg(db_));
    }
    
    LOG_INFO("[LedgerStore] Deleted rule %lld and %lld entries",
             static_cast<long long>(rule_id), static_cast<long long>(removed.value));
    return removed;
}

int LedgerStore::schema_version() {
    if (!db_) return 0;
    SchemaMigrator migrator(db_);
    return migrator.current_version();
}

} // namespace tallybook
