/*
 * tallybook - Configuration
 *
 * JSON configuration file with dotted-key lookup:
 *   config.get_string("ledger.db_path", "~/.tallybook/ledger.db")
 *
 * Keys used by the application:
 *   log_level               - debug | info | warn | error (default: info)
 *   log_color               - force colored log output on or off
 *   ledger.db_path          - SQLite database file
 *   ledger.horizon_months   - months ahead to expand recurring rules (default: 12)
 */
#ifndef TALLYBOOK_CORE_CONFIG_HPP
#define TALLYBOOK_CORE_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace tallybook {

typedef nlohmann::json Json;

class Config {
public:
    Config();
    
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);
    
    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;
    bool has(const std::string& key) const;
    
    void set_string(const std::string& key, const std::string& value);
    
    std::string last_error() const { return last_error_; }

private:
    Json data_;
    std::string last_error_;
    
    // Walk a dotted key; returns nullptr when any segment is missing
    const Json* find(const std::string& key) const;
    Json& find_or_create(const std::string& key);
};

} // namespace tallybook

#endif // TALLYBOOK_CORE_CONFIG_HPP
