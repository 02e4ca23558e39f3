/*
 * tallybook - Ledger Commands Implementation
 */
#include <tallybook/core/commands.hpp>
#include <tallybook/core/logger.hpp>
#include <tallybook/core/utils.hpp>
#include <cstddef>
#include <sstream>

namespace tallybook {

// ============================================================================
// CommandOutput / CommandRegistry
// ============================================================================

CommandOutput CommandOutput::ok(const std::string& text) {
    CommandOutput out;
    out.text = text;
    return out;
}

CommandOutput CommandOutput::usage(const std::string& text) {
    CommandOutput out;
    out.exit_code = 2;
    out.text = "usage: tallybook " + text;
    return out;
}

CommandOutput CommandOutput::failure(const LedgerStatus& status) {
    CommandOutput out;
    out.exit_code = 1;
    out.text = std::string("error: ") + error_to_string(status.error);
    if (!status.message.empty()) {
        out.text += ": " + status.message;
    }
    return out;
}

void CommandRegistry::register_commands(const std::vector<CommandDef>& cmds) {
    for (size_t i = 0; i < cmds.size(); ++i) {
        commands_[cmds[i].name] = cmds[i];
    }
}

const CommandDef* CommandRegistry::find(const std::string& name) const {
    std::map<std::string, CommandDef>::const_iterator it = commands_.find(name);
    return it == commands_.end() ? nullptr : &it->second;
}

std::string CommandRegistry::help_text() const {
    std::ostringstream oss;
    oss << "Commands:\n";
    for (std::map<std::string, CommandDef>::const_iterator it = commands_.begin();
         it != commands_.end(); ++it) {
        oss << "  " << it->second.usage << "\n"
            << "      " << it->second.description << "\n";
    }
    return oss.str();
}

void register_core_commands(CommandRegistry& registry) {
    std::vector<CommandDef> cmds;
    cmds.push_back(CommandDef("add", "add DATE AMOUNT [NOTE...]", "Record a one-off entry", commands::cmd_add));
    cmds.push_back(CommandDef("edit", "edit ID DATE AMOUNT [NOTE...]", "Change date, amount and note of an entry", commands::cmd_edit));
    cmds.push_back(CommandDef("rm", "rm ID", "Delete a single entry", commands::cmd_rm));
    cmds.push_back(CommandDef("show", "show ID", "Show one entry", commands::cmd_show));
    cmds.push_back(CommandDef("day", "day DATE", "List a day's entries and its closing balance", commands::cmd_day));
    cmds.push_back(CommandDef("balance", "balance DATE", "Balance through the end of DATE", commands::cmd_balance));
    cmds.push_back(CommandDef("month", "month YYYY-MM", "Running balance for every day of a month", commands::cmd_month));
    cmds.push_back(CommandDef("rule-add", "rule-add DATE AMOUNT EVERY day|week|month [NOTE...]", "Create a recurring entry", commands::cmd_rule_add));
    cmds.push_back(CommandDef("rule-rm", "rule-rm ID", "Delete a rule and every entry it generated", commands::cmd_rule_rm));
    cmds.push_back(CommandDef("rules", "rules", "List recurring rules", commands::cmd_rules));
    cmds.push_back(CommandDef("extend", "extend [DATE]", "Expand all rules through DATE (default: configured horizon)", commands::cmd_extend));
    
    registry.register_commands(cmds);
    LOG_DEBUG("Core commands registered: %zu", cmds.size());
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

std::string note_from(const CommandArgs& args, size_t first) {
    if (args.size() <= first) return "";
    std::vector<std::string> words(args.begin() + static_cast<std::ptrdiff_t>(first), args.end());
    return trim(join(words, " "));
}

bool parse_id(const std::string& text, int64_t& id) {
    return parse_int64(text, id) && id > 0;
}

std::string describe_entry(const Entry& e) {
    std::ostringstream oss;
    oss << "#" << e.id << "  " << e.date.to_string() << "  "
        << (e.is_generated() ? "⟲ " : "  ")
        << format_money(e.amount_minor_units);
    if (!e.note.empty()) {
        oss << "  " << e.note;
    }
    if (e.rule_id) {
        oss << "  (rule " << *e.rule_id << ")";
    }
    return oss.str();
}

// Recurring entries must exist before balances around `focus` are read
LedgerStatus ensure_expanded(LedgerManager& ledger, const Date& focus) {
    Date now = today();
    Date horizon = ledger.default_horizon(focus.year, focus.month);
    Date from_today = ledger.default_horizon(now.year, now.month);
    if (horizon < from_today) horizon = from_today;
    
    LedgerResult<int64_t> produced = ledger.extend_all_rules(horizon);
    return produced.status;
}

} // namespace

// ============================================================================
// Command Implementations
// ============================================================================

namespace commands {

CommandOutput cmd_add(LedgerManager& ledger, const CommandArgs& args) {
    if (args.size() < 2) return CommandOutput::usage("add DATE AMOUNT [NOTE...]");
    
    Date date;
    if (!Date::parse(args[0], date)) {
        return CommandOutput::failure(LedgerStatus::fail(LedgerError::INVALID_DATE, "'" + args[0] + "'"));
    }
    int64_t amount = 0;
    if (!parse_money(args[1], amount)) {
        return CommandOutput::usage("add DATE AMOUNT [NOTE...]  (AMOUNT like 12.34 or -5)");
    }
    
    LedgerResult<EntryId> id = ledger.insert(date, amount, note_from(args, 2));
    if (!id.ok()) return CommandOutput::failure(id.status);
    return CommandOutput::ok("entry " + std::to_string(id.value));
}

CommandOutput cmd_edit(LedgerManager& ledger, const CommandArgs& args) {
    if (args.size() < 3) return CommandOutput::usage("edit ID DATE AMOUNT [NOTE...]");
    
    int64_t id = 0;
    if (!parse_id(args[0], id)) return CommandOutput::usage("edit ID DATE AMOUNT [NOTE...]");
    Date date;
    if (!Date::parse(args[1], date)) {
        return CommandOutput::failure(LedgerStatus::fail(LedgerError::INVALID_DATE, "'" + args[1] + "'"));
    }
    int64_t amount = 0;
    if (!parse_money(args[2], amount)) return CommandOutput::usage("edit ID DATE AMOUNT [NOTE...]");
    
    LedgerStatus st = ledger.update(id, date, amount, note_from(args, 3));
    if (!st.ok()) return CommandOutput::failure(st);
    return CommandOutput::ok("updated entry " + std::to_string(id));
}

CommandOutput cmd_rm(LedgerManager& ledger, const CommandArgs& args) {
    int64_t id = 0;
    if (args.size() != 1 || !parse_id(args[0], id)) return CommandOutput::usage("rm ID");
    
    LedgerStatus st = ledger.remove(id);
    if (!st.ok()) return CommandOutput::failure(st);
    return CommandOutput::ok("deleted entry " + std::to_string(id));
}

CommandOutput cmd_show(LedgerManager& ledger, const CommandArgs& args) {
    int64_t id = 0;
    if (args.size() != 1 || !parse_id(args[0], id)) return CommandOutput::usage("show ID");
    
    LedgerResult<std::optional<Entry>> entry = ledger.get(id);
    if (!entry.ok()) return CommandOutput::failure(entry.status);
    if (!entry.value) {
        return CommandOutput::failure(LedgerStatus::fail(LedgerError::NOT_FOUND, "entry " + args[0]));
    }
    return CommandOutput::ok(describe_entry(*entry.value));
}

CommandOutput cmd_day(LedgerManager& ledger, const CommandArgs& args) {
    Date date;
    if (args.size() != 1 || !Date::parse(args[0], date)) return CommandOutput::usage("day DATE");
    
    LedgerStatus st = ensure_expanded(ledger, date);
    if (!st.ok()) return CommandOutput::failure(st);
    
    LedgerResult<std::vector<Entry>> rows = ledger.list_by_date(date);
    if (!rows.ok()) return CommandOutput::failure(rows.status);
    LedgerResult<MinorUnits> balance = ledger.running_balance_through(date);
    if (!balance.ok()) return CommandOutput::failure(balance.status);
    
    std::ostringstream oss;
    oss << "Balance on " << date.to_string() << ": " << format_money(balance.value) << "\n";
    if (rows.value.empty()) {
        oss << "(no entries)";
    }
    for (size_t i = 0; i < rows.value.size(); ++i) {
        if (i > 0) oss << "\n";
        oss << describe_entry(rows.value[i]);
    }
    return CommandOutput::ok(oss.str());
}

CommandOutput cmd_balance(LedgerManager& ledger, const CommandArgs& args) {
    Date date;
    if (args.size() != 1 || !Date::parse(args[0], date)) return CommandOutput::usage("balance DATE");
    
    LedgerStatus st = ensure_expanded(ledger, date);
    if (!st.ok()) return CommandOutput::failure(st);
    
    LedgerResult<MinorUnits> balance = ledger.running_balance_through(date);
    if (!balance.ok()) return CommandOutput::failure(balance.status);
    return CommandOutput::ok(format_money(balance.value));
}

CommandOutput cmd_month(LedgerManager& ledger, const CommandArgs& args) {
    Date first;
    if (args.size() != 1 || !Date::parse(args[0] + "-01", first)) return CommandOutput::usage("month YYYY-MM");
    
    LedgerStatus st = ensure_expanded(ledger, first);
    if (!st.ok()) return CommandOutput::failure(st);
    
    LedgerResult<std::vector<DailyBalance>> days = ledger.month_balances(first.year, first.month);
    if (!days.ok()) return CommandOutput::failure(days.status);
    
    std::ostringstream oss;
    for (size_t i = 0; i < days.value.size(); ++i) {
        const DailyBalance& d = days.value[i];
        if (i > 0) oss << "\n";
        oss << d.date.to_string() << "  " << format_money(d.closing_balance);
        if (d.day_total != 0) {
            oss << "  (" << (d.day_total > 0 ? "+" : "") << format_money(d.day_total) << ")";
        }
    }
    return CommandOutput::ok(oss.str());
}

CommandOutput cmd_rule_add(LedgerManager& ledger, const CommandArgs& args) {
    const char* usage = "rule-add DATE AMOUNT EVERY day|week|month [NOTE...]";
    if (args.size() < 4) return CommandOutput::usage(usage);
    
    Date start;
    if (!Date::parse(args[0], start)) {
        return CommandOutput::failure(LedgerStatus::fail(LedgerError::INVALID_DATE, "'" + args[0] + "'"));
    }
    int64_t amount = 0;
    if (!parse_money(args[1], amount)) return CommandOutput::usage(usage);
    int64_t every_n = 0;
    if (!parse_int64(args[2], every_n) || every_n > 100000 || every_n < -100000) {
        return CommandOutput::usage(usage);
    }
    
    Date now = today();
    Date horizon = ledger.default_horizon(now.year, now.month);
    Date from_start = ledger.default_horizon(start.year, start.month);
    if (horizon < from_start) horizon = from_start;
    
    LedgerResult<RuleId> rule = ledger.create_recurring(start, amount, note_from(args, 4),
                                                        static_cast<int>(every_n), args[3], horizon);
    if (!rule.ok()) return CommandOutput::failure(rule.status);
    return CommandOutput::ok("rule " + std::to_string(rule.value) + " (expanded through " + horizon.to_string() + ")");
}

CommandOutput cmd_rule_rm(LedgerManager& ledger, const CommandArgs& args) {
    int64_t id = 0;
    if (args.size() != 1 || !parse_id(args[0], id)) return CommandOutput::usage("rule-rm ID");
    
    LedgerResult<int64_t> removed = ledger.delete_rule_and_entries(id);
    if (!removed.ok()) return CommandOutput::failure(removed.status);
    return CommandOutput::ok("deleted rule " + std::to_string(id) + " and " +
                             std::to_string(removed.value) + " entries");
}

CommandOutput cmd_rules(LedgerManager& ledger, const CommandArgs& args) {
    if (!args.empty()) return CommandOutput::usage("rules");
    
    LedgerResult<std::vector<Rule>> rules = ledger.list_rules();
    if (!rules.ok()) return CommandOutput::failure(rules.status);
    
    if (rules.value.empty()) return CommandOutput::ok("(no rules)");
    
    std::ostringstream oss;
    for (size_t i = 0; i < rules.value.size(); ++i) {
        const Rule& r = rules.value[i];
        if (i > 0) oss << "\n";
        oss << "rule " << r.id << "  from " << r.start_date.to_string()
            << "  every " << r.every_n << " " << unit_to_string(r.unit)
            << "  " << format_money(r.amount_minor_units);
        if (!r.note.empty()) oss << "  " << r.note;
        oss << "  [through " << (r.last_generated_date ? r.last_generated_date->to_string() : "-") << "]";
    }
    return CommandOutput::ok(oss.str());
}

CommandOutput cmd_extend(LedgerManager& ledger, const CommandArgs& args) {
    if (args.size() > 1) return CommandOutput::usage("extend [DATE]");
    
    Date horizon;
    if (args.empty()) {
        Date now = today();
        horizon = ledger.default_horizon(now.year, now.month);
    } else if (!Date::parse(args[0], horizon)) {
        return CommandOutput::failure(LedgerStatus::fail(LedgerError::INVALID_DATE, "'" + args[0] + "'"));
    }
    
    LedgerResult<int64_t> produced = ledger.extend_all_rules(horizon);
    if (!produced.ok()) return CommandOutput::failure(produced.status);
    return CommandOutput::ok(std::to_string(produced.value) + " new entries through " + horizon.to_string());
}

} // namespace commands

} // namespace tallybook
