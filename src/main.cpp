/*
 * tallybook - Personal ledger with recurring entries
 *
 * Usage:
 *   ./tallybook [--config config.json] <command> [args...]
 *
 * Configuration is read from ~/.tallybook/config.json when present.
 */
#include <tallybook/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = tallybook::Application::instance();
    
    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.exit_code();
    }
    
    int result = app.run();
    app.shutdown();
    
    return result;
}
