#include "work_control.hpp"
#include "lock_utils.hpp"
#include "logger.hpp"
#include "state_machine.hpp"

namespace specflow {

static bool running_agent(const Project& project, const std::string& id, unsigned long& pid) {
    return procutil::read_lock_pid(pid_path(project.root(), id), pid) &&
           procutil::process_running(pid);
}

bool pause_spec(const Project& project, const std::string& spec_id, std::string& error) {
    auto spec = project.store().load(spec_id, &error);
    if (!spec)
        return false;
    TransitionError terr;
    if (!transition_to_paused(*spec, &terr)) {
        error = terr.message();
        return false;
    }
    if (!project.store().save(*spec, error))
        return false;
    unsigned long pid = 0;
    if (running_agent(project, spec_id, pid)) {
        if (!procutil::terminate_process(pid))
            log_warning("Failed to signal agent",
                        LogFields{{"spec", spec_id}, {"pid", std::to_string(pid)}});
    }
    log_info("Spec paused", LogFields{{"spec", spec_id}, {"pid", std::to_string(pid)}});
    return true;
}

bool stop_spec(const Project& project, const std::string& spec_id, std::string& error) {
    unsigned long pid = 0;
    if (!running_agent(project, spec_id, pid)) {
        error = "No running agent for " + spec_id;
        return false;
    }
    if (!procutil::terminate_process(pid)) {
        error = "Failed to signal process " + std::to_string(pid);
        return false;
    }
    procutil::release_lock_file(pid_path(project.root(), spec_id));
    log_info("Agent stopped", LogFields{{"spec", spec_id}, {"pid", std::to_string(pid)}});
    return true;
}

} // namespace specflow
