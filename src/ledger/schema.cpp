/*
 * tallybook - Schema and migrations
 */
#include <tallybook/ledger/schema.hpp>
#include <tallybook/ledger/store.hpp>
#include <tallybook/core/logger.hpp>
#include <cstdlib>

namespace tallybook {

const int SchemaMigrator::LATEST_VERSION;

SchemaMigrator::SchemaMigrator(sqlite3* db) : db_(db) {}

bool SchemaMigrator::exec(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : sqlite3_errmsg(db_);
        LOG_ERROR("[Schema] SQL error: %s\n  Query: %s", last_error_.c_str(), sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool SchemaMigrator::has_table(const std::string& table) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_text(stmt, 1, table.c_str(), -1, SQLITE_TRANSIENT);
    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

bool SchemaMigrator::has_column(const std::string& table, const std::string& column) {
    std::string sql = "PRAGMA table_info('" + table + "')";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bool found = false;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        if (name && column == name) {
            found = true;
            break;
        }
    }
    sqlite3_finalize(stmt);
    return found;
}

int SchemaMigrator::current_version() {
    if (!has_table("meta")) return 0;
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT value FROM meta WHERE key = 'schema_version'",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        version = text ? std::atoi(text) : 0;
    }
    sqlite3_finalize(stmt);
    return version;
}

bool SchemaMigrator::set_version(int version) {
    return exec("INSERT INTO meta(key, value) VALUES ('schema_version', '" + std::to_string(version) + "') "
                "ON CONFLICT(key) DO UPDATE SET value = excluded.value");
}

bool SchemaMigrator::migrate() {
    if (!exec("CREATE TABLE IF NOT EXISTS meta ("
              "  key TEXT PRIMARY KEY,"
              "  value TEXT NOT NULL"
              ")")) {
        return false;
    }
    
    int version = current_version();
    if (version > LATEST_VERSION) {
        last_error_ = "database schema version " + std::to_string(version) +
                      " is newer than this build supports";
        LOG_ERROR("[Schema] %s", last_error_.c_str());
        return false;
    }
    
    typedef bool (SchemaMigrator::*Step)();
    static const Step steps[LATEST_VERSION] = {
        &SchemaMigrator::step_base_tables,
        &SchemaMigrator::step_identity_index,
        &SchemaMigrator::step_daily_totals
    };
    
    for (int v = version; v < LATEST_VERSION; ++v) {
        Savepoint sp(db_, "migrate");
        if (!sp.active()) {
            last_error_ = sqlite3_errmsg(db_);
            return false;
        }
        if (!(this->*steps[v])() || !set_version(v + 1) || !sp.release()) {
            LOG_ERROR("[Schema] Migration to version %d failed", v + 1);
            return false;
        }
        LOG_INFO("[Schema] Migrated to version %d", v + 1);
    }
    
    return true;
}

bool SchemaMigrator::step_base_tables() {
    bool ok = exec(
        "CREATE TABLE IF NOT EXISTS rules ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  start_date TEXT NOT NULL,"
        "  amount_minor_units INTEGER NOT NULL,"
        "  note TEXT NOT NULL DEFAULT '',"
        "  every_n INTEGER NOT NULL CHECK (every_n >= 1),"
        "  unit TEXT NOT NULL CHECK (unit IN ('day', 'week', 'month')),"
        "  last_generated_date TEXT"
        ")"
    );
    if (!ok) return false;
    
    ok = exec(
        "CREATE TABLE IF NOT EXISTS entries ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  date TEXT NOT NULL,"
        "  amount_minor_units INTEGER NOT NULL,"
        "  note TEXT NOT NULL DEFAULT '',"
        "  rule_id INTEGER REFERENCES rules(id) ON DELETE CASCADE"
        "    CHECK (rule_id IS NULL OR rule_id > 0)"
        ")"
    );
    if (!ok) return false;
    
    // Databases written before recurring rules existed lack the back-reference
    if (!has_column("entries", "rule_id")) {
        LOG_INFO("[Schema] Adding entries.rule_id");
        if (!exec("ALTER TABLE entries ADD COLUMN rule_id INTEGER REFERENCES rules(id) ON DELETE CASCADE")) {
            return false;
        }
    }
    
    return exec("CREATE INDEX IF NOT EXISTS idx_entries_date ON entries(date)") &&
           exec("CREATE INDEX IF NOT EXISTS idx_entries_rule ON entries(rule_id)");
}

bool SchemaMigrator::step_identity_index() {
    // Generated entries whose rule no longer exists
    if (!exec("DELETE FROM entries WHERE rule_id IS NOT NULL "
              "AND rule_id NOT IN (SELECT id FROM rules)")) {
        return false;
    }
    
    // Keep the oldest row of each identity
    if (!exec("DELETE FROM entries WHERE id NOT IN ("
              "  SELECT MIN(id) FROM entries"
              "  GROUP BY date, amount_minor_units, note, IFNULL(rule_id, 0)"
              ")")) {
        return false;
    }
    
    // Rule ids start at 1, so 0 stands for "no rule" and manual entries
    // de-duplicate against each other instead of being NULL-distinct
    return exec("CREATE UNIQUE INDEX IF NOT EXISTS ux_entries_identity "
                "ON entries(date, amount_minor_units, note, IFNULL(rule_id, 0))");
}

bool SchemaMigrator::step_daily_totals() {
    bool ok = exec(
        "CREATE TABLE IF NOT EXISTS daily_totals ("
        "  date TEXT PRIMARY KEY,"
        "  total_minor_units INTEGER NOT NULL,"
        "  entry_count INTEGER NOT NULL"
        ") WITHOUT ROWID"
    );
    if (!ok) return false;
    
    ok = exec(
        "CREATE TRIGGER IF NOT EXISTS entries_daily_ai AFTER INSERT ON entries BEGIN "
        "  INSERT INTO daily_totals(date, total_minor_units, entry_count) "
        "    SELECT NEW.date, 0, 0 WHERE NOT EXISTS (SELECT 1 FROM daily_totals WHERE date = NEW.date);"
        "  UPDATE daily_totals SET total_minor_units = total_minor_units + NEW.amount_minor_units,"
        "    entry_count = entry_count + 1 WHERE date = NEW.date;"
        "END"
    );
    if (!ok) return false;
    
    ok = exec(
        "CREATE TRIGGER IF NOT EXISTS entries_daily_ad AFTER DELETE ON entries BEGIN "
        "  UPDATE daily_totals SET total_minor_units = total_minor_units - OLD.amount_minor_units,"
        "    entry_count = entry_count - 1 WHERE date = OLD.date;"
        "  DELETE FROM daily_totals WHERE date = OLD.date AND entry_count <= 0;"
        "END"
    );
    if (!ok) return false;
    
    ok = exec(
        "CREATE TRIGGER IF NOT EXISTS entries_daily_au AFTER UPDATE OF date, amount_minor_units ON entries BEGIN "
        "  UPDATE daily_totals SET total_minor_units = total_minor_units - OLD.amount_minor_units,"
        "    entry_count = entry_count - 1 WHERE date = OLD.date;"
        "  DELETE FROM daily_totals WHERE date = OLD.date AND entry_count <= 0;"
        "  INSERT INTO daily_totals(date, total_minor_units, entry_count) "
        "    SELECT NEW.date, 0, 0 WHERE NOT EXISTS (SELECT 1 FROM daily_totals WHERE date = NEW.date);"
        "  UPDATE daily_totals SET total_minor_units = total_minor_units + NEW.amount_minor_units,"
        "    entry_count = entry_count + 1 WHERE date = NEW.date;"
        "END"
    );
    if (!ok) return false;
    
    // Backfill from whatever the earlier versions stored
    return exec("DELETE FROM daily_totals") &&
           exec("INSERT INTO daily_totals(date, total_minor_units, entry_count) "
                "SELECT date, SUM(amount_minor_units), COUNT(*) FROM entries GROUP BY date");
}

} // namespace tallybook
