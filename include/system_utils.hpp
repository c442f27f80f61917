#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <unistd.h>

namespace procutil {

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Use to manage
 * ownership of file descriptors returned by open, pipe and similar calls.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

/** Outcome of a child process run by @ref run_process. */
struct ProcessResult {
    int exit_code = -1;     ///< Exit status, or 128+N when killed by signal N.
    bool spawned = false;   ///< False when fork/exec failed.
    std::string out;        ///< Captured standard output.
    std::string err;        ///< Captured standard error.
};

/** Optional hooks and settings for @ref run_process. */
struct ProcessOptions {
    std::filesystem::path cwd;                        ///< Working directory (empty = inherit).
    std::map<std::string, std::string> env;           ///< Variables added to the environment.
    std::function<void(long)> on_spawn;               ///< Called with the child pid.
    std::function<void(const std::string&)> on_output; ///< Called with each stdout/stderr chunk.
};

/**
 * @brief Run a program and wait for it, capturing its output.
 *
 * The child is started with fork/execvp; stdout and stderr are read through
 * separate pipes until both close, then the child is reaped with waitpid.
 *
 * @param argv Program and arguments; `argv[0]` is looked up on `PATH`.
 * @param opts Working directory, extra environment and callbacks.
 * @return Exit status and captured streams.
 */
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& opts = {});

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
