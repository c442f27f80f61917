#include "state_machine.hpp"
#include "dependency_graph.hpp"
#include "git_utils.hpp"
#include "layout.hpp"
#include "logger.hpp"
#include "spec_store.hpp"

namespace specflow {

static std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty())
            out += ", ";
        out += s;
    }
    return out;
}

std::string TransitionError::message() const {
    switch (kind_) {
    case Kind::InvalidTransition:
        return "Invalid transition " + detail_;
    case Kind::ApprovalRequired:
        return "Spec requires approval";
    case Kind::UnmetDependencies:
        return "Dependencies not met: " + detail_;
    case Kind::IncompleteCriteria:
        return "All acceptance criteria must be checked";
    case Kind::NoCommits:
        return "No commits found for spec";
    case Kind::IncompleteMembers:
        return "Incomplete driver members: " + detail_;
    case Kind::DirtyWorktree:
        return "Worktree is not clean: " + detail_;
    case Kind::Other:
        break;
    }
    return detail_;
}

bool is_valid_transition(SpecStatus from, SpecStatus to) {
    using S = SpecStatus;
    if (to == S::Ready)
        return false;
    if (from == to)
        return true;
    switch (from) {
    case S::Pending:
        return to == S::InProgress || to == S::Blocked || to == S::Cancelled;
    case S::Blocked:
        return to == S::Pending || to == S::InProgress || to == S::Cancelled;
    case S::InProgress:
        return to == S::Completed || to == S::Failed || to == S::NeedsAttention ||
               to == S::Paused || to == S::Cancelled;
    case S::Failed:
    case S::NeedsAttention:
        return to == S::Pending || to == S::InProgress;
    case S::Paused:
        return to == S::InProgress || to == S::Cancelled;
    case S::Completed:
    case S::Cancelled:
        return to == S::Pending;
    case S::Ready:
        break;
    }
    return false;
}

TransitionBuilder& TransitionBuilder::require_approval() {
    approval_ = true;
    return *this;
}

TransitionBuilder& TransitionBuilder::require_dependencies(const SpecStore& store) {
    dependency_store_ = &store;
    return *this;
}

TransitionBuilder& TransitionBuilder::require_criteria() {
    criteria_ = true;
    return *this;
}

TransitionBuilder& TransitionBuilder::require_commits(const std::filesystem::path& repo) {
    commits_repo_ = repo;
    return *this;
}

TransitionBuilder& TransitionBuilder::require_members(const SpecStore& store) {
    member_store_ = &store;
    return *this;
}

TransitionBuilder& TransitionBuilder::require_clean(const std::filesystem::path& worktree) {
    clean_path_ = worktree;
    return *this;
}

TransitionBuilder& TransitionBuilder::force() {
    force_ = true;
    return *this;
}

bool TransitionBuilder::check(SpecStatus target, TransitionError& error) const {
    using Kind = TransitionError::Kind;
    if (!is_valid_transition(spec_.status, target)) {
        error = TransitionError(Kind::InvalidTransition, std::string("from ") +
                                                             to_string(spec_.status) + " to " +
                                                             to_string(target));
        return false;
    }
    if (approval_ && requires_approval(spec_)) {
        error = TransitionError(Kind::ApprovalRequired, spec_.id);
        return false;
    }
    if (dependency_store_) {
        auto all = dependency_store_->load_all();
        std::vector<std::string> unmet;
        for (const auto& b : get_blocking_dependencies(spec_, all)) {
            unmet.push_back(b.spec_id + " (" +
                            (b.found ? std::string(to_string(b.status)) : "not found") + ")");
        }
        if (!unmet.empty()) {
            error = TransitionError(Kind::UnmetDependencies, join(unmet));
            return false;
        }
    }
    if (criteria_ && count_unchecked_checkboxes(spec_.body) > 0) {
        error = TransitionError(Kind::IncompleteCriteria,
                                std::to_string(count_unchecked_checkboxes(spec_.body)));
        return false;
    }
    if (commits_repo_ && spec_.commits.empty() &&
        git::find_commits_with_tag(*commits_repo_, commit_tag(spec_.id)).empty()) {
        error = TransitionError(Kind::NoCommits, spec_.id);
        return false;
    }
    if (member_store_ && spec_.is_driver()) {
        auto missing = incomplete_members(spec_, member_store_->load_all());
        if (!missing.empty()) {
            error = TransitionError(Kind::IncompleteMembers, join(missing));
            return false;
        }
    }
    if (clean_path_ && git::has_uncommitted_changes(*clean_path_)) {
        error = TransitionError(Kind::DirtyWorktree, clean_path_->string());
        return false;
    }
    return true;
}

bool TransitionBuilder::to(SpecStatus target, TransitionError* error) {
    if (target == SpecStatus::Ready) {
        if (error)
            *error = TransitionError(TransitionError::Kind::InvalidTransition,
                                     std::string("from ") + to_string(spec_.status) +
                                         " to ready");
        return false;
    }
    if (spec_.status == target)
        return true;
    if (!force_) {
        TransitionError err;
        if (!check(target, err)) {
            log_debug("Transition refused",
                      LogFields{{"spec", spec_.id}, {"reason", err.message()}});
            if (error)
                *error = err;
            return false;
        }
    }
    log_debug("Transition", LogFields{{"spec", spec_.id},
                                      {"from", to_string(spec_.status)},
                                      {"to", to_string(target)},
                                      {"forced", force_ ? "true" : "false"}});
    spec_.status = target;
    return true;
}

bool transition_to_in_progress(Spec& spec, const SpecStore& store, TransitionError* error) {
    return TransitionBuilder(spec).require_dependencies(store).to(SpecStatus::InProgress, error);
}

void transition_to_failed(Spec& spec) {
    TransitionBuilder(spec).force().to(SpecStatus::Failed);
}

bool transition_to_paused(Spec& spec, TransitionError* error) {
    return TransitionBuilder(spec).to(SpecStatus::Paused, error);
}

bool transition_to_blocked(Spec& spec, TransitionError* error) {
    return TransitionBuilder(spec).to(SpecStatus::Blocked, error);
}

} // namespace specflow
