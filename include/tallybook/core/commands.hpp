#ifndef TALLYBOOK_CORE_COMMANDS_HPP
#define TALLYBOOK_CORE_COMMANDS_HPP

#include <tallybook/ledger/manager.hpp>
#include <map>
#include <string>
#include <vector>

namespace tallybook {

typedef std::vector<std::string> CommandArgs;

struct CommandOutput {
    int exit_code;       // 0 ok, 1 ledger error, 2 usage error
    std::string text;
    
    CommandOutput() : exit_code(0) {}
    
    static CommandOutput ok(const std::string& text);
    static CommandOutput usage(const std::string& text);
    static CommandOutput failure(const LedgerStatus& status);
};

typedef CommandOutput (*CommandHandler)(LedgerManager& ledger, const CommandArgs& args);

struct CommandDef {
    std::string name;
    std::string usage;
    std::string description;
    CommandHandler handler;
    
    CommandDef() : handler(nullptr) {}
    CommandDef(const std::string& n, const std::string& u, const std::string& d, CommandHandler h)
        : name(n), usage(u), description(d), handler(h) {}
};

class CommandRegistry {
public:
    void register_commands(const std::vector<CommandDef>& cmds);
    const CommandDef* find(const std::string& name) const;
    const std::map<std::string, CommandDef>& commands() const { return commands_; }
    
    std::string help_text() const;

private:
    std::map<std::string, CommandDef> commands_;
};

namespace commands {
    CommandOutput cmd_add(LedgerManager& ledger, const CommandArgs& args);
    CommandOutput cmd_edit(LedgerManager& ledger, const CommandArgs& args);
    CommandOutput cmd_rm(LedgerManager& ledger, const CommandArgs& args);
    CommandOutput cmd_show(LedgerManager& ledger, const CommandArgs& args);
    CommandOutput cmd_day(LedgerManager& ledger, const CommandArgs& args);
    CommandOutput cmd_balance(LedgerManager& ledger, const CommandArgs& args);
    CommandOutput cmd_month(LedgerManager& ledger, const CommandArgs& args);
    CommandOutput cmd_rule_add(LedgerManager& ledger, const CommandArgs& args);
    CommandOutput cmd_rule_rm(LedgerManager& ledger, const CommandArgs& args);
    CommandOutput cmd_rules(LedgerManager& ledger, const CommandArgs& args);
    CommandOutput cmd_extend(LedgerManager& ledger, const CommandArgs& args);
}

// Register the ledger commands (add, edit, rm, show, day, balance, month,
// rule-add, rule-rm, rules, extend)
void register_core_commands(CommandRegistry& registry);

} // namespace tallybook

#endif // TALLYBOOK_CORE_COMMANDS_HPP
