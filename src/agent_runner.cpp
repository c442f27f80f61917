#include "agent_runner.hpp"
#include <fstream>
#include <system_error>
#include "layout.hpp"
#include "logger.hpp"
#include "system_utils.hpp"
#include "time_utils.hpp"

namespace specflow {

AgentResult ProcessAgentRunner::run(const AgentInvocation& inv) {
    AgentResult result;
    std::error_code ec;
    std::filesystem::create_directories(inv.log_path.parent_path(), ec);
    std::ofstream log(inv.log_path, std::ios::app);
    log << "=== " << timestamp() << " " << inv.spec_id << " (" << inv.agent.name << ": "
        << inv.agent.command << ") ===\n";

    procutil::ProcessOptions opts;
    opts.cwd = inv.worktree;
    opts.env["SPECFLOW_SPEC_ID"] = inv.spec_id;
    opts.env["SPECFLOW_STATUS_FILE"] = inv.status_file.string();
    opts.env["SPECFLOW_PROMPT"] = inv.prompt;
    opts.on_spawn = inv.on_spawn;
    opts.on_output = [&](const std::string& chunk) {
        result.output += chunk;
        log << chunk;
        log.flush();
    };

    log_debug("Starting agent", LogFields{{"spec", inv.spec_id},
                                          {"agent", inv.agent.name},
                                          {"worktree", inv.worktree.string()}});
    auto pr = procutil::run_process(
        {"/bin/sh", "-c", inv.agent.command + " \"$SPECFLOW_PROMPT\""}, opts);
    if (!pr.spawned) {
        result.error = "Failed to start agent '" + inv.agent.name + "': " + pr.err;
        log << result.error << '\n';
        return result;
    }
    result.exit_code = pr.exit_code;
    log << "=== exit " << pr.exit_code << " ===\n";
    return result;
}

std::string build_prompt(const Spec& spec) {
    std::string prompt = "You are working on spec " + spec.id;
    if (spec.title)
        prompt += ": " + *spec.title;
    prompt += "\n\n";
    prompt += spec.body;
    if (!spec.body.empty() && spec.body.back() != '\n')
        prompt += '\n';
    prompt += "\nCommit your changes with messages starting with '" + commit_tag(spec.id) +
              " '.\n";
    prompt += "Check off acceptance criteria in " + std::string(STATE_DIR_NAME) + "/specs/" +
              spec.id + ".md as you complete them.\n";
    return prompt;
}

} // namespace specflow
