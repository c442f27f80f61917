#include "recovery.hpp"
#include <unistd.h>
#include <algorithm>
#include "agent_status.hpp"
#include "finalize.hpp"
#include "git_utils.hpp"
#include "lock_utils.hpp"
#include "logger.hpp"

namespace specflow {

const char* to_string(RecoveryAction action) {
    switch (action) {
    case RecoveryAction::Merged:
        return "merged";
    case RecoveryAction::MergeFailed:
        return "merge-failed";
    case RecoveryAction::Finalized:
        return "finalized";
    case RecoveryAction::MarkedFailed:
        return "marked-failed";
    case RecoveryAction::KeptFailed:
        return "kept-failed";
    case RecoveryAction::LeftRunning:
        return "left-running";
    case RecoveryAction::Removed:
        return "removed";
    case RecoveryAction::Corrupt:
        return "corrupt";
    case RecoveryAction::Locked:
        return "locked";
    }
    return "removed";
}

size_t RecoveryReport::count(RecoveryAction action) const {
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
                                             [&](const RecoveryEntry& e) {
                                                 return e.action == action;
                                             }));
}

bool RecoveryReport::no_changes() const {
    if (!removed_locks.empty() || !removed_pids.empty())
        return false;
    return std::all_of(entries.begin(), entries.end(), [](const RecoveryEntry& e) {
        return e.action == RecoveryAction::LeftRunning || e.action == RecoveryAction::Locked ||
               (e.action == RecoveryAction::KeptFailed && e.detail.empty());
    });
}

static bool locked_by_other(const Project& project, const std::string& id, unsigned long& pid) {
    return procutil::read_lock_pid(lock_path(project.root(), id), pid) &&
           pid != static_cast<unsigned long>(getpid()) && procutil::process_running(pid);
}

/** Handle a worktree whose agent reported Done. */
static RecoveryEntry recover_done(Project& project, const WorktreeInfo& info,
                                  const std::string& id, const AgentStatus& status) {
    RecoveryEntry entry{info.path.string(), id, RecoveryAction::Merged, ""};
    const Options& opts = project.options();
    auto spec = project.store().load(id);
    std::string branch = spec ? project.branch_for(*spec) : opts.branch_prefix + id;
    if (auto current = git::get_current_branch(info.path))
        branch = *current;

    std::vector<std::string> commits = status.commits;
    auto merged = git::is_branch_merged(project.root(), branch, opts.main_branch);
    std::string err;
    if (merged && *merged) {
        entry.action = RecoveryAction::Finalized;
        if (spec && spec->status != SpecStatus::Completed &&
            !finalize_spec(project, *spec, commits, spec->model.value_or(""), err))
            entry.detail = err;
        if (!project.worktrees().remove(info.path, &err))
            entry.detail = err;
        auto del = git::run_git(project.root(), {"branch", "-d", branch});
        if (!del.ok())
            log_debug("Branch not deleted", LogFields{{"branch", branch}, {"error", del.message()}});
        return entry;
    }

    if (commits.empty()) {
        if (auto found = git::commits_between(project.root(), opts.main_branch, branch))
            commits = *found;
    }
    MergeResult result =
        project.worktrees().merge_and_cleanup(branch, opts.main_branch, opts.worktree.rebase);
    if (!result.success) {
        entry.action = RecoveryAction::MergeFailed;
        entry.detail = result.error;
        fail_spec(project, id, "Recovery merge failed: " + result.error);
        // Record the failure so the next scan leaves this worktree alone.
        if (!write_agent_status(status_file_path(info.path),
                                make_agent_status(id, AgentState::Failed, result.error, commits),
                                err))
            log_warning("Failed to write status", LogFields{{"spec", id}, {"error", err}});
        return entry;
    }
    if (spec && !finalize_spec(project, *spec, commits, spec->model.value_or(""), err))
        entry.detail = err;
    return entry;
}

RecoveryReport reconcile(Project& project, std::chrono::system_clock::time_point now) {
    RecoveryReport report;
    const Options& opts = project.options();
    WorktreeManager& worktrees = project.worktrees();

    for (const auto& info : worktrees.list()) {
        auto id = worktrees.spec_id_for(info.path);
        if (!id)
            continue;
        RecoveryEntry entry{info.path.string(), *id, RecoveryAction::Removed, ""};
        std::string err;

        unsigned long holder = 0;
        if (locked_by_other(project, *id, holder)) {
            entry.action = RecoveryAction::Locked;
            entry.detail = "held by process " + std::to_string(holder);
            report.entries.push_back(entry);
            continue;
        }

        if (!info.is_valid) {
            log_error("Worktree is not a git checkout",
                      LogFields{{"spec", *id}, {"worktree", info.path.string()}});
            entry.detail = "not a git checkout";
            worktrees.remove(info.path, &err);
            report.entries.push_back(entry);
            continue;
        }

        AgentStatus status;
        StatusRead read = read_agent_status(status_file_path(info.path), status, &err);
        if (read == StatusRead::Missing) {
            entry.detail = "no status file";
            worktrees.remove(info.path, &err);
        } else if (read == StatusRead::Corrupt) {
            log_error("Corrupt status file",
                      LogFields{{"spec", *id}, {"worktree", info.path.string()}, {"error", err}});
            entry.action = RecoveryAction::Corrupt;
            entry.detail = err;
            worktrees.remove(info.path, &err);
        } else if (status.status == AgentState::Done) {
            entry = recover_done(project, info, *id, status);
        } else if (status.status == AgentState::Working) {
            if (is_stale(status, opts.recovery.stale_after, now)) {
                entry.action = RecoveryAction::MarkedFailed;
                entry.detail = "stale since " + status.updated_at;
                fail_spec(project, *id, "Agent stopped reporting (last update " +
                                            status.updated_at + ")");
                worktrees.remove(info.path, &err);
            } else {
                entry.action = RecoveryAction::LeftRunning;
            }
        } else {
            entry.action = RecoveryAction::KeptFailed;
            auto spec = project.store().load(*id);
            if (spec && spec->status != SpecStatus::Failed &&
                spec->status != SpecStatus::Paused) {
                entry.detail = "spec marked failed";
                fail_spec(project, *id, status.error.value_or("Agent reported failure"));
            }
        }
        log_info("Recovered worktree", LogFields{{"spec", *id},
                                                 {"worktree", info.path.string()},
                                                 {"action", to_string(entry.action)}});
        report.entries.push_back(entry);
    }

    report.removed_locks = procutil::remove_stale_pid_files(locks_dir(project.root()), ".lock");
    report.removed_pids = procutil::remove_stale_pid_files(pids_dir(project.root()), ".pid");
    for (const auto& id : report.removed_locks)
        log_info("Removed stale lock", LogFields{{"spec", id}});
    for (const auto& id : report.removed_pids)
        log_info("Removed stale pid file", LogFields{{"spec", id}});
    return report;
}

} // namespace specflow
