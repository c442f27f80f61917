#ifndef SPECFLOW_AGENT_RUNNER_HPP
#define SPECFLOW_AGENT_RUNNER_HPP

#include <filesystem>
#include <functional>
#include <string>
#include "options.hpp"
#include "spec.hpp"

namespace specflow {

/** Everything an agent needs to work on one spec. */
struct AgentInvocation {
    std::string spec_id;
    std::string prompt;
    std::filesystem::path worktree;
    AgentConfig agent;
    std::filesystem::path log_path;    ///< Per-spec transcript log.
    std::filesystem::path status_file; ///< Where the agent may report progress.
    std::function<void(long)> on_spawn; ///< Receives the agent process id.
};

struct AgentResult {
    int exit_code = -1;
    std::string output; ///< Combined stdout and stderr.
    std::string error;  ///< Set when the agent could not be started.
    bool success() const { return exit_code == 0; }
};

/**
 * @brief Executes an agent against a worktree.
 *
 * A non-zero exit code is a failure. Implementations must be safe to call
 * from several worker threads at once.
 */
class AgentRunner {
  public:
    virtual ~AgentRunner() = default;
    virtual AgentResult run(const AgentInvocation& invocation) = 0;
};

/**
 * @brief Runs the configured command through `/bin/sh` inside the worktree.
 *
 * The prompt is passed as the last argument and in `SPECFLOW_PROMPT`;
 * `SPECFLOW_SPEC_ID` and `SPECFLOW_STATUS_FILE` are also exported. Output is
 * appended to the invocation's log file as it arrives.
 */
class ProcessAgentRunner : public AgentRunner {
  public:
    AgentResult run(const AgentInvocation& invocation) override;
};

/** Plain prompt assembled from the spec header and body. */
std::string build_prompt(const Spec& spec);

} // namespace specflow

#endif // SPECFLOW_AGENT_RUNNER_HPP
