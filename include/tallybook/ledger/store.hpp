/*
 * tallybook - Ledger SQLite Store
 *
 * SQLite-based storage, one class per table family:
 *   EntryStore  - ledger entries, identity de-duplication, balance queries
 *   RuleStore   - recurrence rules and their expansion cursor
 *   LedgerStore - owns the sqlite3 handle, runs migrations, composes the above
 *
 * Every multi-statement mutation runs inside a Savepoint so a failure in
 * the middle leaves the tables as they were.
 */
#ifndef TALLYBOOK_LEDGER_STORE_HPP
#define TALLYBOOK_LEDGER_STORE_HPP

#include <tallybook/ledger/types.hpp>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace tallybook {

// ============================================================================
// Savepoint - scoped atomic unit
//
// Opens "SAVEPOINT <name>" on construction. release() makes the work
// durable (or folds it into an enclosing savepoint); destruction without
// release() rolls everything back. Savepoints nest, so a component that
// is atomic on its own can also run inside a caller's larger unit.
// ============================================================================
class Savepoint {
public:
    Savepoint(sqlite3* db, const std::string& name);
    ~Savepoint();
    
    bool active() const { return active_; }
    bool release();
    void rollback();

private:
    Savepoint(const Savepoint&);
    Savepoint& operator=(const Savepoint&);
    
    sqlite3* db_;
    std::string name_;
    bool active_;
};

// ============================================================================
// EntryStore - Ledger entries
//
// Manages the 'entries' table. The (date, amount, note, rule) identity is
// enforced by a unique index; insert() resolves a collision by returning
// the id already stored under that identity.
// ============================================================================
class EntryStore {
public:
    explicit EntryStore(sqlite3*& db);
    
    // CRUD
    LedgerResult<EntryId> insert(const Date& date, MinorUnits amount, const std::string& note,
                                 std::optional<RuleId> rule_id = std::nullopt);
    LedgerStatus update(EntryId id, const Date& date, MinorUnits amount, const std::string& note);
    LedgerStatus remove(EntryId id);
    LedgerResult<std::optional<Entry>> get(EntryId id);
    
    // Queries
    LedgerResult<std::vector<Entry>> list_by_date(const Date& date);
    LedgerResult<std::vector<Entry>> list_by_rule(RuleId rule_id);
    LedgerResult<std::optional<EntryId>> find(const Date& date, MinorUnits amount, const std::string& note,
                                              std::optional<RuleId> rule_id);
    LedgerResult<int64_t> count();
    
    // Links a manual entry to a rule; fails with NOT_FOUND if the entry is
    // missing or already belongs to a rule
    LedgerStatus attach_to_rule(EntryId id, RuleId rule_id);
    LedgerResult<int64_t> remove_by_rule(RuleId rule_id);
    
    // Balances (served from the daily_totals aggregate)
    LedgerResult<MinorUnits> running_balance_through(const Date& date);
    LedgerResult<std::vector<DayTotal>> daily_totals(const Date& first, const Date& last);


private:
    sqlite3*& db_;
    std::string last_error_;
    
    bool prepare(const char* sql, sqlite3_stmt** stmt);
    LedgerStatus storage_failure(const char* what);
    LedgerResult<std::vector<Entry>> collect(sqlite3_stmt* stmt, const char* what);
};

// ============================================================================
// RuleStore - Recurrence rules
//
// Manages the 'rules' table. Rules are immutable apart from the
// last_generated_date cursor, which only moves forward.
// ============================================================================
class RuleStore {
public:
    explicit RuleStore(sqlite3*& db);
    
    LedgerResult<RuleId> create(const Date& start_date, MinorUnits amount, const std::string& note,
                                int every_n, RecurrenceUnit unit);
    LedgerResult<std::optional<Rule>> get(RuleId id);
    LedgerResult<std::vector<Rule>> list();
    LedgerStatus remove(RuleId id);
    
    // Moves the cursor to `date`; a date behind the stored cursor is ignored
    LedgerStatus advance_cursor(RuleId id, const Date& date);


private:
    sqlite3*& db_;
    std::string last_error_;
    
    bool prepare(const char* sql, sqlite3_stmt** stmt);
    LedgerStatus storage_failure(const char* what);
};

// ============================================================================
// LedgerStore - Top-level store, owns the sqlite3 handle
//
// One instance per session. Opening runs the schema migrations; the
// sub-stores share the handle by reference.
// ============================================================================
class LedgerStore {
public:
    LedgerStore();
    ~LedgerStore();
    
    // Database lifecycle (":memory:" opens a private in-memory database)
    LedgerStatus open(const std::string& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }
    
    EntryStore& entries() { return entries_; }
    RuleStore& rules() { return rules_; }
    
    // Removes the rule and every entry it generated as one atomic unit.
    // Returns the number of entries removed.
    LedgerResult<int64_t> delete_rule_and_entries(RuleId rule_id);
    
    int schema_version();
    
    sqlite3* handle() { return db_; }

private:
    LedgerStore(const LedgerStore&);
    LedgerStore& operator=(const LedgerStore&);
    
    sqlite3* db_;
    std::string path_;
    
    EntryStore entries_;
    RuleStore rules_;
    
    bool exec(const std::string& sql);
};

} // namespace tallybook

#endif // TALLYBOOK_LEDGER_STORE_HPP
