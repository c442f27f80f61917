#include "cli_commands.hpp"

#include <iomanip>
#include <iostream>
#include <map>
#include <memory>

#include "agent_status.hpp"
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "dependency_graph.hpp"
#include "parse_utils.hpp"
#include "recovery.hpp"
#include "scheduler.hpp"
#include "state_machine.hpp"
#include "time_utils.hpp"
#include "version.hpp"
#include "work_control.hpp"

namespace fs = std::filesystem;
using namespace specflow;

namespace cli {

bool parse_cli(int argc, char* argv[], CliRequest& req, std::string& error) {
    static const std::map<std::string, bool> known{
        {"--root", true},      {"--config", true},  {"--log-file", true},
        {"--log-level", true}, {"--parallel", true}, {"--force", false},
        {"--help", false},     {"--version", false}};
    ArgParser parser(argc, argv, known, {{'h', "--help"}, {'V', "--version"}});
    if (!parser.unknown_flags().empty()) {
        error = "Unknown option " + parser.unknown_flags().front();
        return false;
    }
    if (!parser.missing_values().empty()) {
        error = "Missing value for " + parser.missing_values().front();
        return false;
    }
    req.show_help = parser.has_flag("--help");
    req.show_version = parser.has_flag("--version");
    req.force = parser.has_flag("--force");
    req.config_path = parser.get_option("--config");
    req.log_file = parser.get_option("--log-file");
    std::error_code ec;
    req.root = parser.has_flag("--root") ? fs::path(parser.get_option("--root"))
                                         : fs::current_path(ec);
    if (parser.has_flag("--log-level")) {
        LogLevel level;
        if (!parse_log_level(parser.get_option("--log-level"), level)) {
            error = "Invalid log level '" + parser.get_option("--log-level") + "'";
            return false;
        }
        req.log_level = level;
    }
    if (parser.has_flag("--parallel")) {
        bool ok = false;
        req.parallel = parse_size_t(parser, "--parallel", 1, 1024, ok);
        if (!ok) {
            error = "--parallel expects a number between 1 and 1024";
            return false;
        }
    }
    const auto& pos = parser.positional();
    if (!pos.empty()) {
        req.command = pos.front();
        req.args.assign(pos.begin() + 1, pos.end());
    }
    return true;
}

bool load_options(const CliRequest& req, Options& opts, std::string& error) {
    std::string path = req.config_path;
    if (path.empty()) {
        std::error_code ec;
        for (const char* name : {"config.yaml", "config.yml", "config.json"}) {
            fs::path candidate = state_dir(req.root) / name;
            if (fs::exists(candidate, ec)) {
                path = candidate.string();
                break;
            }
        }
    }
    if (!path.empty() && !load_config_file(path, opts, error))
        return false;
    if (!req.log_file.empty())
        opts.logging.log_file = req.log_file;
    if (req.log_level)
        opts.logging.log_level = *req.log_level;
    if (req.parallel > 0)
        opts.parallel.max_parallel = req.parallel;
    return true;
}

void print_help(std::ostream& os, const char* prog) {
    os << "Usage: " << prog << " <command> [args] [options]\n\n"
       << "Commands:\n"
       << "  list                          List specs with their status\n"
       << "  ready                         List specs that can run now\n"
       << "  status <id>                   Show a spec and what blocks it\n"
       << "  transition <id> <status>      Change a spec's status (--force skips checks)\n"
       << "  work [ids...]                 Run ready specs in parallel\n"
       << "  run <id>                      Run a single spec\n"
       << "  recover                       Repair state left by an interrupted run\n"
       << "  pause <id>                    Pause a running spec\n"
       << "  stop <id>                     Stop a running spec\n"
       << "  worktrees                     List spec worktrees\n"
       << "  version                       Print the version\n\n"
       << "Options:\n"
       << "  --root <dir>        Repository root (default: current directory)\n"
       << "  --config <file>     Configuration file (YAML or JSON)\n"
       << "  --log-file <file>   Log file path\n"
       << "  --log-level <lvl>   DEBUG, INFO, WARNING or ERROR\n"
       << "  --parallel <n>      Maximum concurrent agents for work\n"
       << "  --force             Skip transition checks\n"
       << "  -h, --help          Show this help\n"
       << "  -V, --version       Print the version\n";
}

static int cmd_list(const Project& project, std::ostream& out, std::ostream& err) {
    std::vector<std::string> errors;
    auto all = project.store().load_all(&errors);
    for (const auto& e : errors)
        err << "warning: " << e << "\n";
    for (const auto& s : all) {
        std::string status = to_string(s.status);
        if (is_ready(s, all))
            status = "ready";
        else if (is_blocked(s, all))
            status = "blocked";
        out << std::left << std::setw(32) << s.id << " " << std::setw(16) << status << " "
            << s.title.value_or("") << "\n";
    }
    return 0;
}

static int cmd_ready(const Project& project, std::ostream& out) {
    auto all = project.store().load_all();
    for (const auto& id : ready_specs(all)) {
        const Spec* s = find_spec(all, id);
        out << id << "  " << (s ? s->title.value_or("") : "") << "\n";
    }
    return 0;
}

static int cmd_status(const Project& project, const std::string& raw, std::ostream& out,
                      std::ostream& err) {
    std::string error;
    auto id = project.store().resolve_id(raw, &error);
    if (!id) {
        err << error << "\n";
        return 1;
    }
    auto all = project.store().load_all();
    const Spec* spec = find_spec(all, *id);
    if (!spec) {
        err << "Failed to load " << *id << "\n";
        return 1;
    }
    out << "id:       " << spec->id << "\n"
        << "title:    " << spec->title.value_or("") << "\n"
        << "type:     " << to_string(spec->type) << "\n"
        << "status:   " << to_string(spec->status) << "\n"
        << "branch:   " << project.branch_for(*spec) << "\n";
    if (spec->completed_at)
        out << "completed: " << *spec->completed_at << "\n";
    if (requires_approval(*spec))
        out << "approval: required\n";
    auto blockers = get_blocking_dependencies(*spec, all);
    if (!blockers.empty()) {
        out << "blocked by:\n";
        for (const auto& b : blockers)
            out << "  - " << b.spec_id << " " << (b.is_sibling ? "[sibling] " : "")
                << (b.found ? to_string(b.status) : "not found") << "  " << b.title << "\n";
    }
    if (size_t unchecked = count_unchecked_checkboxes(spec->body))
        out << "unchecked criteria: " << unchecked << "\n";
    fs::path worktree = project.worktrees().path_for(spec->id);
    AgentStatus status;
    if (read_agent_status(status_file_path(worktree), status) == StatusRead::Ok)
        out << "agent:    " << to_string(status.status) << " (" << status.updated_at << ")\n";
    return 0;
}

static int cmd_transition(const Project& project, const CliRequest& req, std::ostream& out,
                          std::ostream& err) {
    if (req.args.size() < 2) {
        err << "usage: transition <id> <status> [--force]\n";
        return 2;
    }
    std::string error;
    auto id = project.store().resolve_id(req.args[0], &error);
    if (!id) {
        err << error << "\n";
        return 1;
    }
    auto target = parse_status(req.args[1]);
    if (!target) {
        err << "Unknown status '" << req.args[1] << "'\n";
        return 2;
    }
    auto spec = project.store().load(*id, &error);
    if (!spec) {
        err << error << "\n";
        return 1;
    }
    SpecStatus from = spec->status;
    TransitionBuilder builder(*spec);
    if (req.force) {
        builder.force();
    } else if (*target == SpecStatus::InProgress) {
        builder.require_approval().require_dependencies(project.store());
    } else if (*target == SpecStatus::Completed) {
        builder.require_criteria().require_commits(project.root()).require_members(
            project.store());
    }
    TransitionError terr;
    if (!builder.to(*target, &terr)) {
        err << terr.message() << "\n";
        return 1;
    }
    if (*target == SpecStatus::Completed && !spec->completed_at)
        spec->completed_at = rfc3339_now();
    if (!project.store().save(*spec, error)) {
        err << error << "\n";
        return 1;
    }
    out << spec->id << ": " << to_string(from) << " -> " << to_string(*target) << "\n";
    return 0;
}

static void print_summary(const BatchSummary& summary, std::ostream& out) {
    for (const auto& r : summary.results) {
        out << std::left << std::setw(32) << r.spec_id << " " << std::setw(10)
            << to_string(r.outcome);
        if (!r.agent.empty())
            out << " [" << r.agent << "]";
        if (!r.reason.empty())
            out << " " << r.reason;
        out << "\n";
    }
    out << summary.count(Outcome::Completed) << " completed, " << summary.count(Outcome::Failed)
        << " failed, " << summary.count(Outcome::Skipped) << " skipped, "
        << summary.count(Outcome::Paused) << " paused\n";
}

static void print_recovery(const RecoveryReport& report, std::ostream& out) {
    for (const auto& e : report.entries) {
        out << e.spec_id << ": " << to_string(e.action);
        if (!e.detail.empty())
            out << " (" << e.detail << ")";
        out << "\n";
    }
    for (const auto& id : report.removed_locks)
        out << id << ": stale lock removed\n";
    for (const auto& id : report.removed_pids)
        out << id << ": stale pid file removed\n";
}

static int cmd_worktrees(const Project& project, std::ostream& out) {
    for (const auto& w : project.worktrees().list()) {
        out << std::left << std::setw(40) << w.name << " " << std::setw(10)
            << (std::to_string(w.size_bytes / 1024) + "K") << " "
            << format_duration_short(std::chrono::seconds(w.age_seconds))
            << (w.is_valid ? "" : "  (invalid)") << "\n";
    }
    return 0;
}

int run_command(const CliRequest& req, Project& project, std::ostream& out, std::ostream& err) {
    const std::string& cmd = req.command;
    auto need_id = [&](const char* usage) {
        if (req.args.empty()) {
            err << "usage: " << usage << "\n";
            return false;
        }
        return true;
    };

    if (cmd == "version") {
        out << SPECFLOW_VERSION << "\n";
        return 0;
    }
    if (cmd == "list")
        return cmd_list(project, out, err);
    if (cmd == "ready")
        return cmd_ready(project, out);
    if (cmd == "status")
        return need_id("status <id>") ? cmd_status(project, req.args[0], out, err) : 2;
    if (cmd == "transition")
        return cmd_transition(project, req, out, err);
    if (cmd == "worktrees")
        return cmd_worktrees(project, out);
    if (cmd == "recover") {
        print_recovery(reconcile(project), out);
        return 0;
    }
    if (cmd == "work" || cmd == "run") {
        if (cmd == "run" && !need_id("run <id>"))
            return 2;
        print_recovery(reconcile(project), out);
        Scheduler scheduler(project, std::make_shared<ProcessAgentRunner>());
        if (cmd == "run") {
            SpecOutcome outcome = scheduler.run_single(req.args[0]);
            BatchSummary summary;
            summary.results.push_back(outcome);
            print_summary(summary, out);
            return outcome.outcome == Outcome::Completed ? 0 : 1;
        }
        BatchSummary summary = scheduler.run(req.args);
        print_summary(summary, out);
        return summary.count(Outcome::Failed) == 0 ? 0 : 1;
    }
    if (cmd == "pause" || cmd == "stop") {
        if (!need_id(cmd == "pause" ? "pause <id>" : "stop <id>"))
            return 2;
        std::string error;
        auto id = project.store().resolve_id(req.args[0], &error);
        bool ok = id && (cmd == "pause" ? pause_spec(project, *id, error)
                                        : stop_spec(project, *id, error));
        if (!ok) {
            err << error << "\n";
            return 1;
        }
        out << *id << ": " << (cmd == "pause" ? "paused" : "stopped") << "\n";
        return 0;
    }
    err << "Unknown command '" << cmd << "'\n";
    return 2;
}

} // namespace cli
