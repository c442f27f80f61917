#include "lock_utils.hpp"
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cstdio>
#include <fstream>
#include <system_error>
#include "system_utils.hpp"

namespace fs = std::filesystem;

namespace procutil {

bool acquire_lock_file(const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path())
        fs::create_directories(path.parent_path(), ec);
    UniqueFd fd(open(path.c_str(), O_RDWR | O_CREAT | O_EXCL, 0644));
    if (!fd)
        return false;
    char buf[32];
    int len = snprintf(buf, sizeof(buf), "%ld\n", static_cast<long>(getpid()));
    if (write(fd.get(), buf, static_cast<size_t>(len)) != len) {
        fd.reset();
        fs::remove(path, ec);
        return false;
    }
    return true;
}

void release_lock_file(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    (void)ec;
}

bool write_pid_file(const fs::path& path, unsigned long pid) {
    std::error_code ec;
    if (path.has_parent_path())
        fs::create_directories(path.parent_path(), ec);
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs)
            return false;
        ofs << pid << '\n';
        if (!ofs)
            return false;
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

bool read_lock_pid(const fs::path& path, unsigned long& pid) {
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    unsigned long value = 0;
    if (!(f >> value) || value == 0)
        return false;
    pid = value;
    return true;
}

bool process_running(unsigned long pid) {
    if (pid == 0)
        return false;
    if (kill(static_cast<pid_t>(pid), 0) == 0)
        return true;
    return errno != ESRCH;
}

bool terminate_process(unsigned long pid) {
    if (pid == 0)
        return false;
    return kill(static_cast<pid_t>(pid), SIGTERM) == 0;
}

std::vector<std::string> remove_stale_pid_files(const fs::path& dir,
                                                const std::string& extension) {
    std::vector<std::string> removed;
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return removed;
    for (const auto& entry :
         fs::directory_iterator(dir, fs::directory_options::skip_permission_denied, ec)) {
        if (entry.path().extension() != extension)
            continue;
        unsigned long pid = 0;
        bool alive = read_lock_pid(entry.path(), pid) && process_running(pid);
        if (alive)
            continue;
        std::error_code rm_ec;
        if (fs::remove(entry.path(), rm_ec))
            removed.push_back(entry.path().stem().string());
    }
    return removed;
}

LockFileGuard::LockFileGuard(const fs::path& p) : path(p) {
    locked = acquire_lock_file(path);
    if (locked)
        return;
    unsigned long pid = 0;
    if (read_lock_pid(path, pid) && process_running(pid)) {
        holder = pid;
        return;
    }
    // Owner is gone (or the file is unreadable); take the lock over.
    release_lock_file(path);
    locked = acquire_lock_file(path);
}

LockFileGuard::~LockFileGuard() {
    if (locked)
        release_lock_file(path);
}

bool PidFileGuard::record(unsigned long pid) {
    written_ = write_pid_file(path_, pid);
    return written_;
}

PidFileGuard::~PidFileGuard() {
    if (written_)
        release_lock_file(path_);
}

} // namespace procutil
