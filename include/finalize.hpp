#ifndef SPECFLOW_FINALIZE_HPP
#define SPECFLOW_FINALIZE_HPP

#include <string>
#include <vector>
#include "project.hpp"
#include "state_machine.hpp"

namespace specflow {

/**
 * @brief Mark a merged spec Completed and persist it.
 *
 * Records @p commits, `completed_at` and @p model, then completes the owning
 * driver if this was its last outstanding member. A spec that is no longer
 * InProgress (for example after a crash) is completed with a forced
 * transition since its work is already merged.
 *
 * @return `false` with @p error set if the transition or the save failed.
 */
bool finalize_spec(const Project& project, Spec& spec, const std::vector<std::string>& commits,
                   const std::string& model, std::string& error);

/**
 * @brief Force a spec to Failed, record a retry attempt and persist it.
 *
 * The spec is re-loaded from the store so concurrent changes are not lost.
 * A spec that is Paused stays Paused. A spec that is already Failed keeps its
 * retry state unchanged.
 */
void fail_spec(const Project& project, const std::string& spec_id, const std::string& reason);

/** Move the driver of @p member_id from Pending to InProgress. */
void mark_driver_in_progress(const Project& project, const std::string& member_id);

/**
 * @brief Complete the driver of @p member_id once all its members are done.
 *
 * @return `true` if the driver was completed.
 */
bool auto_complete_driver(const Project& project, const std::string& member_id);

} // namespace specflow

#endif // SPECFLOW_FINALIZE_HPP
