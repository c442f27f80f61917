#ifndef LOCK_UTILS_HPP
#define LOCK_UTILS_HPP
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace procutil {

/**
 * @brief Attempt to acquire an exclusive lock by creating a lock file.
 *
 * The current process ID is written into the file so other processes can
 * determine who holds the lock. Missing parent directories are created.
 *
 * @param path Filesystem location of the lock file.
 * @return true if the lock file was successfully created.
 */
bool acquire_lock_file(const std::filesystem::path& path);

/**
 * @brief Release a previously acquired lock file.
 *
 * @param path Filesystem location of the lock file.
 */
void release_lock_file(const std::filesystem::path& path);

/**
 * @brief Write @p pid as plain text to @p path, replacing any previous file.
 *
 * The file is written to a temporary sibling and renamed into place.
 *
 * @return true on success.
 */
bool write_pid_file(const std::filesystem::path& path, unsigned long pid);

/**
 * @brief Read the PID stored in a lock or pid file.
 *
 * @param path Path to the file.
 * @param pid  Output variable receiving the parsed process ID.
 * @return true if a PID was successfully parsed.
 */
bool read_lock_pid(const std::filesystem::path& path, unsigned long& pid);

/**
 * @brief Check whether a process with the given PID is currently running.
 */
bool process_running(unsigned long pid);

/**
 * @brief Send SIGTERM to @a pid.
 *
 * @return true if the signal was delivered.
 */
bool terminate_process(unsigned long pid);

/**
 * @brief Remove every `*.lock`/`*.pid` file in @p dir whose owner is gone.
 *
 * @return Names (file stems) of the removed entries.
 */
std::vector<std::string> remove_stale_pid_files(const std::filesystem::path& dir,
                                                const std::string& extension);

/**
 * @brief RAII guard that holds a lock file for its lifetime.
 *
 * A lock left behind by a dead process is taken over. The destructor removes
 * the file only if this guard created it.
 */
struct LockFileGuard {
    std::filesystem::path path; ///< Location of the lock file.
    bool locked = false;        ///< Whether the lock was successfully acquired.
    unsigned long holder = 0;   ///< PID of the live holder when `locked` is false.
    explicit LockFileGuard(const std::filesystem::path& p); ///< Acquire lock.
    ~LockFileGuard();                                       ///< Release lock.
    LockFileGuard(const LockFileGuard&) = delete;
    LockFileGuard& operator=(const LockFileGuard&) = delete;
};

/**
 * @brief RAII guard for a pid file naming a child process.
 *
 * The pid is recorded with @ref record once the child is spawned and the file
 * is removed on destruction.
 */
class PidFileGuard {
  public:
    explicit PidFileGuard(std::filesystem::path p) : path_(std::move(p)) {}
    ~PidFileGuard();
    PidFileGuard(const PidFileGuard&) = delete;
    PidFileGuard& operator=(const PidFileGuard&) = delete;

    bool record(unsigned long pid);
    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
    bool written_ = false;
};

} // namespace procutil

#endif // LOCK_UTILS_HPP
