/*
 * tallybook - Application
 *
 * Process-wide singleton that owns the configuration, the ledger
 * session and the command registry for one CLI invocation:
 *
 *   init()      - parse argv, load config, set up logging, open the ledger
 *   run()       - dispatch the requested command, print its output
 *   shutdown()  - close the ledger
 */
#ifndef TALLYBOOK_CORE_APPLICATION_HPP
#define TALLYBOOK_CORE_APPLICATION_HPP

#include <tallybook/core/commands.hpp>
#include <tallybook/core/config.hpp>
#include <tallybook/ledger/manager.hpp>
#include <string>
#include <vector>

namespace tallybook {

struct AppInfo {
    static constexpr const char* NAME = "tallybook";
    static constexpr const char* VERSION = "0.3.0";
    static constexpr const char* DEFAULT_CONFIG = "~/.tallybook/config.json";
};

void print_usage(const char* prog, const CommandRegistry& registry);
void print_version();

class Application {
public:
    static Application& instance();
    
    // Returns false when there is nothing left to run (help, version or a
    // startup failure); exit_code() tells which
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();
    
    int exit_code() const { return exit_code_; }
    
    Config& config() { return config_; }
    LedgerManager& ledger() { return ledger_; }
    CommandRegistry& registry() { return registry_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);
    
    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    bool setup_ledger();
    
    Config config_;
    LedgerManager ledger_;
    CommandRegistry registry_;
    
    std::string config_file_;
    bool config_file_explicit_;
    std::string db_override_;
    std::string command_;
    CommandArgs command_args_;
    int exit_code_;
};

} // namespace tallybook

#endif // TALLYBOOK_CORE_APPLICATION_HPP
