#ifndef SPECFLOW_WORK_CONTROL_HPP
#define SPECFLOW_WORK_CONTROL_HPP

#include <string>
#include "project.hpp"

namespace specflow {

/**
 * @brief Pause a running spec.
 *
 * The spec is set to Paused first and its agent then receives SIGTERM. The
 * worktree is kept so the spec can be resumed with a single run.
 */
bool pause_spec(const Project& project, const std::string& spec_id, std::string& error);

/**
 * @brief Stop a running agent.
 *
 * Sends SIGTERM and removes the pid file; the worker that owns the spec marks
 * it Failed.
 */
bool stop_spec(const Project& project, const std::string& spec_id, std::string& error);

} // namespace specflow

#endif // SPECFLOW_WORK_CONTROL_HPP
