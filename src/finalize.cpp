#include "finalize.hpp"
#include <algorithm>
#include "dependency_graph.hpp"
#include "logger.hpp"
#include "time_utils.hpp"

namespace specflow {

bool finalize_spec(const Project& project, Spec& spec, const std::vector<std::string>& commits,
                   const std::string& model, std::string& error) {
    for (const auto& c : commits) {
        if (std::find(spec.commits.begin(), spec.commits.end(), c) == spec.commits.end())
            spec.commits.push_back(c);
    }
    TransitionError terr;
    bool moved = TransitionBuilder(spec)
                     .require_members(project.store())
                     .to(SpecStatus::Completed, &terr);
    if (!moved && terr.kind() == TransitionError::Kind::InvalidTransition) {
        log_warning("Completing spec outside InProgress",
                    LogFields{{"spec", spec.id}, {"status", to_string(spec.status)}});
        moved = TransitionBuilder(spec).force().to(SpecStatus::Completed, &terr);
    }
    if (!moved) {
        error = terr.message();
        return false;
    }
    spec.completed_at = rfc3339_now();
    if (!model.empty())
        spec.model = model;
    if (!project.store().save(spec, error))
        return false;
    log_info("Spec completed", LogFields{{"spec", spec.id},
                                         {"agent", model},
                                         {"commits", std::to_string(spec.commits.size())}});
    auto_complete_driver(project, spec.id);
    return true;
}

void fail_spec(const Project& project, const std::string& spec_id, const std::string& reason) {
    std::string err;
    auto spec = project.store().load(spec_id, &err);
    if (!spec) {
        log_error("Cannot mark spec failed", LogFields{{"spec", spec_id}, {"error", err}});
        return;
    }
    if (spec->status == SpecStatus::Paused) {
        log_info("Spec paused by operator", LogFields{{"spec", spec_id}});
        return;
    }
    log_error("Spec failed", LogFields{{"spec", spec_id}, {"error", reason}});
    // One attempt per failed run; a spec already Failed was counted then.
    if (spec->status == SpecStatus::Failed)
        return;
    transition_to_failed(*spec);
    const auto& retry = project.options().retry;
    RetryState state = spec->retry_state.value_or(RetryState{});
    state.record_attempt(calculate_backoff_delay(
        static_cast<size_t>(state.attempts), static_cast<std::uint64_t>(retry.retry_delay.count()),
        retry.backoff_multiplier));
    spec->retry_state = state;
    if (!project.store().save(*spec, err))
        log_error("Failed to save spec", LogFields{{"spec", spec_id}, {"error", err}});
}

void mark_driver_in_progress(const Project& project, const std::string& member_id) {
    auto all = project.store().load_all();
    const Spec* member = find_spec(all, member_id);
    const Spec* found = member ? driver_of(*member, all) : nullptr;
    if (!found || found->status != SpecStatus::Pending)
        return;
    Spec driver = *found;
    if (!TransitionBuilder(driver).to(SpecStatus::InProgress))
        return;
    std::string err;
    if (!project.store().save(driver, err))
        log_warning("Failed to save driver", LogFields{{"spec", driver.id}, {"error", err}});
}

bool auto_complete_driver(const Project& project, const std::string& member_id) {
    auto all = project.store().load_all();
    const Spec* member = find_spec(all, member_id);
    const Spec* found = member ? driver_of(*member, all) : nullptr;
    if (!found || found->status == SpecStatus::Completed)
        return false;
    Spec driver = *found;
    if (!driver.members.empty() && !incomplete_members(driver, all).empty())
        return false;
    if (driver.members.empty()) {
        // Members named by the DRIVER.N convention only.
        for (const auto& s : all) {
            const Spec* d = driver_of(s, all);
            if (d && d->id == driver.id && s.status != SpecStatus::Completed)
                return false;
        }
    }
    if (driver.status == SpecStatus::Pending &&
        !TransitionBuilder(driver).to(SpecStatus::InProgress))
        return false;
    TransitionError terr;
    if (!TransitionBuilder(driver).require_members(project.store()).to(SpecStatus::Completed,
                                                                      &terr)) {
        log_debug("Driver not completed", LogFields{{"spec", driver.id}, {"reason", terr.message()}});
        return false;
    }
    driver.completed_at = rfc3339_now();
    driver.model = "auto-completed";
    std::string err;
    if (!project.store().save(driver, err)) {
        log_warning("Failed to save driver", LogFields{{"spec", driver.id}, {"error", err}});
        return false;
    }
    log_info("Driver completed", LogFields{{"spec", driver.id}});
    auto_complete_driver(project, driver.id);
    return true;
}

} // namespace specflow
