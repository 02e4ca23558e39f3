/*
 * tallybook - Schema and migrations
 *
 * Versions (meta.schema_version):
 *   1 - entries, rules, date index; adds entries.rule_id to databases
 *       created before recurrence existed
 *   2 - drops orphaned generated entries, collapses duplicate identities,
 *       then creates the unique identity index
 *   3 - daily_totals aggregate, its triggers and a backfill from entries
 *
 * Each step runs in its own savepoint and bumps the version on success,
 * so an interrupted upgrade resumes at the failed step.
 */
#ifndef TALLYBOOK_LEDGER_SCHEMA_HPP
#define TALLYBOOK_LEDGER_SCHEMA_HPP

#include <string>
#include <sqlite3.h>

namespace tallybook {

class SchemaMigrator {
public:
    static const int LATEST_VERSION = 3;
    
    explicit SchemaMigrator(sqlite3* db);
    
    // Brings the database to LATEST_VERSION; false on the first failing step
    bool migrate();
    
    // 0 for a database that has never been migrated
    int current_version();
    
    std::string last_error() const { return last_error_; }

private:
    sqlite3* db_;
    std::string last_error_;
    
    bool exec(const std::string& sql);
    bool has_table(const std::string& table);
    bool has_column(const std::string& table, const std::string& column);
    bool set_version(int version);
    
    bool step_base_tables();
    bool step_identity_index();
    bool step_daily_totals();
};

} // namespace tallybook

#endif // TALLYBOOK_LEDGER_SCHEMA_HPP
