#ifndef SPECFLOW_RECOVERY_HPP
#define SPECFLOW_RECOVERY_HPP

#include <chrono>
#include <string>
#include <vector>
#include "project.hpp"

namespace specflow {

enum class RecoveryAction {
    Merged,      ///< Done and unmerged: merged and completed.
    MergeFailed, ///< Done but the merge failed: spec marked Failed.
    Finalized,   ///< Done and already merged: spec completed, worktree removed.
    MarkedFailed,///< Stale Working status: spec failed, worktree removed.
    KeptFailed,  ///< Failed status: spec failed, worktree kept.
    LeftRunning, ///< Fresh Working status.
    Removed,     ///< No status or not a checkout: worktree removed.
    Corrupt,     ///< Unparseable status: worktree removed, spec untouched.
    Locked       ///< Another live process owns the spec.
};

const char* to_string(RecoveryAction action);

struct RecoveryEntry {
    std::string worktree;
    std::string spec_id;
    RecoveryAction action = RecoveryAction::Removed;
    std::string detail;
};

struct RecoveryReport {
    std::vector<RecoveryEntry> entries;
    std::vector<std::string> removed_locks; ///< Spec ids whose stale lock was removed.
    std::vector<std::string> removed_pids;  ///< Spec ids whose stale pid file was removed.

    size_t count(RecoveryAction action) const;
    /** @return `true` if nothing on disk was changed. */
    bool no_changes() const;
};

/**
 * @brief Repair what an interrupted run left behind.
 *
 * Every worktree of the repository is classified by its status file and
 * merged, failed, kept or removed. Stale lock and pid files are deleted.
 * Running it again right away changes nothing.
 *
 * @param project Repository to inspect.
 * @param now     Reference time for the staleness check.
 */
RecoveryReport reconcile(Project& project,
                         std::chrono::system_clock::time_point now =
                             std::chrono::system_clock::now());

} // namespace specflow

#endif // SPECFLOW_RECOVERY_HPP
