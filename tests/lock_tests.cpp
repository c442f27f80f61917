#include "test_common.hpp"
#include <sys/wait.h>
#include <algorithm>

using specflow::test_support::make_temp_dir;

/** Pid of a process that has already exited and been reaped. */
static unsigned long dead_pid() {
    pid_t child = fork();
    if (child == 0)
        _exit(0);
    int status = 0;
    waitpid(child, &status, 0);
    return static_cast<unsigned long>(child);
}

TEST_CASE("Lock file is exclusive and records the holder") {
    fs::path dir = make_temp_dir("lock_exclusive");
    fs::path lock = dir / "locks" / "s1.lock";
    {
        procutil::LockFileGuard first(lock);
        REQUIRE(first.locked);
        unsigned long pid = 0;
        REQUIRE(procutil::read_lock_pid(lock, pid));
        REQUIRE(pid == static_cast<unsigned long>(getpid()));

        procutil::LockFileGuard second(lock);
        REQUIRE_FALSE(second.locked);
        REQUIRE(second.holder == static_cast<unsigned long>(getpid()));
    }
    REQUIRE_FALSE(fs::exists(lock));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Lock held by a dead process is taken over") {
    fs::path dir = make_temp_dir("lock_takeover");
    fs::path lock = dir / "s1.lock";
    std::ofstream(lock) << dead_pid() << "\n";
    procutil::LockFileGuard guard(lock);
    REQUIRE(guard.locked);
    unsigned long pid = 0;
    REQUIRE(procutil::read_lock_pid(lock, pid));
    REQUIRE(pid == static_cast<unsigned long>(getpid()));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Pid file guard removes what it wrote") {
    fs::path dir = make_temp_dir("pid_guard");
    fs::path pid_file = dir / "pids" / "s1.pid";
    {
        procutil::PidFileGuard guard(pid_file);
        REQUIRE_FALSE(fs::exists(pid_file));
        REQUIRE(guard.record(4242));
        unsigned long pid = 0;
        REQUIRE(procutil::read_lock_pid(pid_file, pid));
        REQUIRE(pid == 4242);
    }
    REQUIRE_FALSE(fs::exists(pid_file));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Stale pid files are swept") {
    fs::path dir = make_temp_dir("pid_sweep");
    std::ofstream(dir / "dead.pid") << dead_pid() << "\n";
    std::ofstream(dir / "alive.pid") << getpid() << "\n";
    std::ofstream(dir / "garbage.pid") << "not a pid\n";
    std::ofstream(dir / "other.lock") << dead_pid() << "\n";

    auto removed = procutil::remove_stale_pid_files(dir, ".pid");
    std::sort(removed.begin(), removed.end());
    REQUIRE(removed == std::vector<std::string>{"dead", "garbage"});
    REQUIRE(fs::exists(dir / "alive.pid"));
    REQUIRE(fs::exists(dir / "other.lock"));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("process_running distinguishes live and dead pids") {
    REQUIRE(procutil::process_running(static_cast<unsigned long>(getpid())));
    REQUIRE_FALSE(procutil::process_running(dead_pid()));
    REQUIRE_FALSE(procutil::process_running(0));
}
