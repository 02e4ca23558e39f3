/*
 * tallybook - Application Implementation
 */
#include <tallybook/core/application.hpp>
#include <tallybook/core/logger.hpp>
#include <tallybook/core/utils.hpp>

#include <iostream>
#include <cstring>
#include <sys/stat.h>

namespace tallybook {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog, const CommandRegistry& registry) {
    std::cout << AppInfo::NAME << " - Personal ledger with recurring entries\n\n"
              << "Usage: " << prog << " [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  -h, --help         Show this help message\n"
              << "  -v, --version      Show version\n"
              << "  --config FILE      Config file (default: " << AppInfo::DEFAULT_CONFIG << ")\n"
              << "  --db FILE          Ledger database, overrides ledger.db_path\n\n"
              << registry.help_text()
              << "\nExample:\n"
              << "  " << prog << " rule-add 2025-01-01 -1200 1 month Rent\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : config_file_(AppInfo::DEFAULT_CONFIG)
    , config_file_explicit_(false)
    , exit_code_(0)
{
    register_core_commands(registry_);
}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (!command_.empty()) {
            command_args_.push_back(argv[i]);
            continue;
        }
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0 ||
            strcmp(argv[i], "help") == 0) {
            print_usage(argv[0], registry_);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0 ||
            strcmp(argv[i], "version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--db") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "usage: " << argv[0] << " --db FILE <command> [args...]\n";
                exit_code_ = 2;
                return false;
            }
            db_override_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "usage: " << argv[0] << " --config FILE <command> [args...]\n";
                exit_code_ = 2;
                return false;
            }
            config_file_ = std::string(argv[++i]);
            config_file_explicit_ = true;
            continue;
        }
        if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "unknown option: " << argv[i] << "\n";
            exit_code_ = 2;
            return false;
        }
        command_ = argv[i];
    }
    
    if (command_.empty()) {
        print_usage(argv[0], registry_);
        exit_code_ = 2;
        return false;
    }
    if (registry_.find(command_) == nullptr) {
        std::cerr << "unknown command: " << command_ << " (try --help)\n";
        exit_code_ = 2;
        return false;
    }
    return true;
}

bool Application::load_config() {
    std::string path = expand_home(config_file_);
    
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (config_file_explicit_) {
            LOG_ERROR("Config file %s not found", path.c_str());
            return false;
        }
        LOG_DEBUG("No config at %s, using defaults", path.c_str());
        return true;
    }
    
    if (!config_.load_file(path)) {
        LOG_ERROR("Failed to load config from %s: %s", path.c_str(), config_.last_error().c_str());
        return false;
    }
    LOG_DEBUG("Loaded config from %s", path.c_str());
    return true;
}

void Application::setup_logging() {
    std::string name = config_.get_string("log_level", "info");
    
    LogLevel level = LogLevel::INFO;
    if (!parse_log_level(name, level)) {
        LOG_WARN("Unknown log_level '%s', using info", name.c_str());
    }
    Logger::instance().set_level(level);
    
    // Colors default to on for a terminal; log_color forces either way
    if (config_.has("log_color")) {
        Logger::instance().set_color(config_.get_bool("log_color", true));
    }
}

bool Application::setup_ledger() {
    if (!db_override_.empty()) {
        config_.set_string("ledger.db_path", db_override_);
        LOG_DEBUG("ledger.db_path -> %s", db_override_.c_str());
    }
    
    LedgerStatus st = ledger_.init(config_);
    if (!st.ok()) {
        std::cerr << CommandOutput::failure(st).text << "\n";
        return false;
    }
    return true;
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }
    
    if (!load_config()) {
        exit_code_ = 1;
        return false;
    }
    setup_logging();
    
    LOG_DEBUG("%s v%s running '%s'", AppInfo::NAME, AppInfo::VERSION, command_.c_str());
    
    if (!setup_ledger()) {
        exit_code_ = 1;
        return false;
    }
    return true;
}

int Application::run() {
    const CommandDef* cmd = registry_.find(command_);
    if (cmd == nullptr || cmd->handler == nullptr) {
        std::cerr << "unknown command: " << command_ << "\n";
        exit_code_ = 2;
        return exit_code_;
    }
    
    CommandOutput out = cmd->handler(ledger_, command_args_);
    if (out.exit_code == 0) {
        if (!out.text.empty()) std::cout << out.text << "\n";
    } else {
        std::cerr << out.text << "\n";
    }
    
    exit_code_ = out.exit_code;
    return exit_code_;
}

void Application::shutdown() {
    ledger_.shutdown();
    LOG_DEBUG("Ledger closed");
}

} // namespace tallybook
