#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "logger.hpp"

namespace specflow {

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file; ///< Empty means `<state_dir>/logs/specflow.log`.
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
    int syslog_facility = 0;
};

/** One agent backend and its share of the worker pool. */
struct AgentConfig {
    std::string name = "main";
    std::string command = "claude";
    size_t max_concurrent = 2;
    unsigned int weight = 1;
};

enum class RotationStrategy { None, Random, RoundRobin };

struct ParallelOptions {
    std::vector<AgentConfig> agents{AgentConfig{}};
    std::chrono::milliseconds stagger_delay{1000};
    std::chrono::milliseconds stagger_jitter{200};
    size_t max_parallel = 0; ///< Caps the summed capacity when non-zero.
    bool allow_no_commits = false;

    /** Sum of agent `max_concurrent`, capped by `max_parallel`. */
    size_t total_capacity() const {
        size_t total = 0;
        for (const auto& a : agents)
            total += a.max_concurrent;
        return max_parallel > 0 && max_parallel < total ? max_parallel : total;
    }
};

struct WorktreeOptions {
    std::filesystem::path root; ///< Empty means the system temporary directory.
    std::string prefix = "specflow-";
    bool rebase = false;
};

struct RecoveryOptions {
    std::chrono::seconds stale_after{3600};
};

struct RetryOptions {
    size_t max_retries = 3;
    std::chrono::milliseconds retry_delay{60000};
    double backoff_multiplier = 2.0;
};

/** Complete runtime configuration. */
struct Options {
    std::string main_branch = "main";
    std::string branch_prefix = "specflow/";
    RotationStrategy rotation = RotationStrategy::None;
    ParallelOptions parallel;
    WorktreeOptions worktree;
    RecoveryOptions recovery;
    RetryOptions retry;
    LoggingOptions logging;
};

} // namespace specflow

#endif // OPTIONS_HPP
