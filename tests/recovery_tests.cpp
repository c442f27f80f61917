#include "test_common.hpp"
#include "agent_status.hpp"
#include "finalize.hpp"
#include "recovery.hpp"
#include "work_control.hpp"
#include <signal.h>
#include <sys/wait.h>

using namespace specflow;
using specflow::test_support::commit_file;
using specflow::test_support::init_git_repo;
using specflow::test_support::make_temp_dir;
using specflow::test_support::test_options;
using specflow::test_support::write_spec;

namespace {

struct RecoveryFixture {
    fs::path base = make_temp_dir("recovery_fixture");
    fs::path repo = base / "repo";
    Options opts = test_options(base / "worktrees");
    std::unique_ptr<Project> project;

    RecoveryFixture() {
        init_git_repo(repo);
        project = std::make_unique<Project>(repo, opts);
    }
    ~RecoveryFixture() {
        std::error_code ec;
        fs::remove_all(base, ec);
    }

    /** An InProgress spec with a worktree and a status file in @p state. */
    fs::path start(const std::string& id, AgentState state, bool commit = true) {
        write_spec(project->store(), id, "status: in_progress\n", "# " + id + "\n");
        std::string err;
        auto wt = project->worktrees().create(id, "specflow/" + id, err, "main");
        REQUIRE(wt);
        if (commit)
            commit_file(*wt, id + ".txt", id + "\n", commit_tag(id) + " work");
        REQUIRE(write_agent_status(status_file_path(*wt), make_agent_status(id, state), err));
        return *wt;
    }

    void set_updated_at(const fs::path& wt, std::chrono::system_clock::time_point when) {
        AgentStatus status;
        REQUIRE(read_agent_status(status_file_path(wt), status) == StatusRead::Ok);
        status.updated_at = format_rfc3339(when);
        std::string err;
        REQUIRE(write_agent_status(status_file_path(wt), status, err));
    }

    SpecStatus status_of(const std::string& id) {
        auto spec = project->store().load(id);
        REQUIRE(spec);
        return spec->status;
    }
};

unsigned long dead_pid() {
    pid_t child = fork();
    if (child == 0)
        _exit(0);
    int status = 0;
    waitpid(child, &status, 0);
    return static_cast<unsigned long>(child);
}

} // namespace

TEST_CASE("Recovery merges finished work") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    RecoveryFixture fx;
    fs::path wt = fx.start("done1", AgentState::Done);

    RecoveryReport report = reconcile(*fx.project);
    REQUIRE(report.count(RecoveryAction::Merged) == 1);
    REQUIRE(fx.status_of("done1") == SpecStatus::Completed);
    auto spec = fx.project->store().load("done1");
    REQUIRE(spec->commits.size() == 1);
    REQUIRE(fs::exists(fx.repo / "done1.txt"));
    REQUIRE_FALSE(fs::exists(wt));

    RecoveryReport again = reconcile(*fx.project);
    REQUIRE(again.entries.empty());
    REQUIRE(again.no_changes());
}

TEST_CASE("Recovery finalizes work merged before the crash") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    RecoveryFixture fx;
    fs::path wt = fx.start("merged1", AgentState::Done);
    REQUIRE(specflow::test_support::git_cmd(fx.repo, "merge --ff-only specflow/merged1") == 0);

    RecoveryReport report = reconcile(*fx.project);
    REQUIRE(report.count(RecoveryAction::Finalized) == 1);
    REQUIRE(fx.status_of("merged1") == SpecStatus::Completed);
    REQUIRE_FALSE(fs::exists(wt));
    REQUIRE_FALSE(git::branch_exists(fx.repo, "specflow/merged1"));
}

TEST_CASE("Recovery fails stale agents and leaves fresh ones") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    RecoveryFixture fx;
    auto now = std::chrono::system_clock::now();
    fs::path stale = fx.start("stale1", AgentState::Working);
    fx.set_updated_at(stale, now - std::chrono::hours(2));
    fs::path fresh = fx.start("fresh1", AgentState::Working);

    RecoveryReport report = reconcile(*fx.project, now);
    REQUIRE(report.count(RecoveryAction::MarkedFailed) == 1);
    REQUIRE(report.count(RecoveryAction::LeftRunning) == 1);
    REQUIRE(fx.status_of("stale1") == SpecStatus::Failed);
    REQUIRE(fx.status_of("fresh1") == SpecStatus::InProgress);
    REQUIRE_FALSE(fs::exists(stale));
    REQUIRE(fs::exists(fresh));

    RecoveryReport again = reconcile(*fx.project, now);
    REQUIRE(again.no_changes());
}

TEST_CASE("Recovery keeps failed worktrees") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    RecoveryFixture fx;
    fs::path wt = fx.start("failed1", AgentState::Failed);

    RecoveryReport report = reconcile(*fx.project);
    REQUIRE(report.count(RecoveryAction::KeptFailed) == 1);
    REQUIRE_FALSE(report.no_changes());
    REQUIRE(fx.status_of("failed1") == SpecStatus::Failed);
    REQUIRE(fs::exists(wt));

    REQUIRE(reconcile(*fx.project).no_changes());
}

TEST_CASE("Failing an already failed spec records a single attempt") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    RecoveryFixture fx;
    write_spec(fx.project->store(), "twice1", "status: in_progress\n", "# twice1\n");

    fail_spec(*fx.project, "twice1", "Agent exited with code 1");
    auto spec = fx.project->store().load("twice1");
    REQUIRE(spec);
    REQUIRE(spec->status == SpecStatus::Failed);
    REQUIRE(spec->retry_state);
    REQUIRE(spec->retry_state->attempts == 1);

    fail_spec(*fx.project, "twice1", "Merge conflict");
    spec = fx.project->store().load("twice1");
    REQUIRE(spec);
    REQUIRE(spec->status == SpecStatus::Failed);
    REQUIRE(spec->retry_state->attempts == 1);
}

TEST_CASE("Recovery removes orphaned and corrupt worktrees") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    RecoveryFixture fx;
    fs::path orphan = fx.start("orphan1", AgentState::Working);
    fs::remove(status_file_path(orphan));
    fs::path corrupt = fx.start("corrupt1", AgentState::Working);
    std::ofstream(status_file_path(corrupt), std::ios::trunc) << "{{{";
    fs::path not_git = fx.project->worktrees().path_for("loose1");
    fs::create_directories(not_git);

    RecoveryReport report = reconcile(*fx.project);
    REQUIRE(report.count(RecoveryAction::Removed) == 2);
    REQUIRE(report.count(RecoveryAction::Corrupt) == 1);
    REQUIRE_FALSE(fs::exists(orphan));
    REQUIRE_FALSE(fs::exists(corrupt));
    REQUIRE_FALSE(fs::exists(not_git));
    REQUIRE(fx.status_of("corrupt1") == SpecStatus::InProgress);
    REQUIRE(reconcile(*fx.project).no_changes());
}

TEST_CASE("Recovery skips specs locked by a live process") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    RecoveryFixture fx;
    fs::path wt = fx.start("busy1", AgentState::Done);
    fs::create_directories(locks_dir(fx.repo));
    std::ofstream(lock_path(fx.repo, "busy1")) << getppid() << "\n";

    RecoveryReport report = reconcile(*fx.project);
    REQUIRE(report.count(RecoveryAction::Locked) == 1);
    REQUIRE(report.no_changes());
    REQUIRE(fs::exists(wt));
    REQUIRE(fx.status_of("busy1") == SpecStatus::InProgress);
}

TEST_CASE("Recovery sweeps stale lock and pid files") {
    git::GitInitGuard guard;
    fs::path base = make_temp_dir("recovery_sweep");
    std::string err;
    REQUIRE(ensure_layout(base, err));
    std::ofstream(lock_path(base, "gone")) << dead_pid() << "\n";
    std::ofstream(pid_path(base, "gone")) << dead_pid() << "\n";
    Project project(base, test_options(base / "worktrees"));

    RecoveryReport report = reconcile(project);
    REQUIRE(report.removed_locks == std::vector<std::string>{"gone"});
    REQUIRE(report.removed_pids == std::vector<std::string>{"gone"});
    REQUIRE_FALSE(report.no_changes());
    REQUIRE_FALSE(fs::exists(lock_path(base, "gone")));
    REQUIRE(reconcile(project).no_changes());
    FS_REMOVE_ALL(base);
}

TEST_CASE("Pause and stop") {
    fs::path base = make_temp_dir("work_control");
    std::string err;
    REQUIRE(ensure_layout(base, err));
    Project project(base, test_options(base / "worktrees"));
    write_spec(project.store(), "p1", "status: in_progress\n", "# P1\n");
    write_spec(project.store(), "p2", "status: pending\n", "# P2\n");

    REQUIRE(pause_spec(project, "p1", err));
    REQUIRE(project.store().load("p1")->status == SpecStatus::Paused);
    REQUIRE_FALSE(pause_spec(project, "p2", err));
    REQUIRE(err.find("Invalid transition") != std::string::npos);

    REQUIRE_FALSE(stop_spec(project, "p2", err));
    REQUIRE(err == "No running agent for p2");

    pid_t child = fork();
    if (child == 0) {
        pause();
        _exit(0);
    }
    REQUIRE(procutil::write_pid_file(pid_path(base, "p2"), static_cast<unsigned long>(child)));
    REQUIRE(stop_spec(project, "p2", err));
    int status = 0;
    REQUIRE(waitpid(child, &status, 0) == child);
    REQUIRE(WIFSIGNALED(status));
    REQUIRE(WTERMSIG(status) == SIGTERM);
    REQUIRE_FALSE(fs::exists(pid_path(base, "p2")));
    FS_REMOVE_ALL(base);
}
