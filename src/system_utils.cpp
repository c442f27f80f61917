#include "system_utils.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>

extern char** environ;

namespace procutil {

/**
 * @brief Build the child's `envp`, overriding inherited variables with @p extra.
 *
 * Done before fork because setenv is not safe between fork and exec in a
 * multi-threaded process.
 */
static std::vector<std::string> build_environment(const std::map<std::string, std::string>& extra) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        if (!extra.count(key))
            env.push_back(std::move(entry));
    }
    for (const auto& [k, v] : extra)
        env.push_back(k + "=" + v);
    return env;
}

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& opts) {
    ProcessResult result;
    if (argv.empty()) {
        result.err = "empty command";
        return result;
    }

    std::vector<std::string> env_store = build_environment(opts.env);
    std::vector<char*> envp;
    envp.reserve(env_store.size() + 1);
    for (auto& e : env_store)
        envp.push_back(e.data());
    envp.push_back(nullptr);

    std::vector<std::string> args_store(argv);
    std::vector<char*> args;
    args.reserve(args_store.size() + 1);
    for (auto& a : args_store)
        args.push_back(a.data());
    args.push_back(nullptr);
    std::string cwd = opts.cwd.string();

    // Close-on-exec keeps concurrently spawned children from holding our pipe
    // ends open, which would delay EOF.
    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.err = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    UniqueFd out_r(out_pipe[0]);
    UniqueFd out_w(out_pipe[1]);
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.err = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    UniqueFd err_r(err_pipe[0]);
    UniqueFd err_w(err_pipe[1]);
    UniqueFd dev_null(open("/dev/null", O_RDONLY | O_CLOEXEC));

    pid_t pid = fork();
    if (pid < 0) {
        result.err = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }
    if (pid == 0) {
        if (dev_null)
            dup2(dev_null.get(), STDIN_FILENO);
        dup2(out_w.get(), STDOUT_FILENO);
        dup2(err_w.get(), STDERR_FILENO);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0)
            _exit(126);
        execvpe(args[0], args.data(), envp.data());
        _exit(127);
    }

    result.spawned = true;
    out_w.reset();
    err_w.reset();
    if (opts.on_spawn)
        opts.on_spawn(static_cast<long>(pid));

    pollfd fds[2] = {{out_r.get(), POLLIN, 0}, {err_r.get(), POLLIN, 0}};
    int open_fds = 2;
    char buf[4096];
    while (open_fds > 0) {
        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0)
                continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                std::string chunk(buf, static_cast<size_t>(n));
                (i == 0 ? result.out : result.err) += chunk;
                if (opts.on_output)
                    opts.on_output(chunk);
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.exit_code = -1;
            return result;
        }
    }
    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exit_code = 128 + WTERMSIG(status);
    return result;
}

} // namespace procutil
