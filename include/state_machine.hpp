#ifndef SPECFLOW_STATE_MACHINE_HPP
#define SPECFLOW_STATE_MACHINE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include "spec.hpp"

namespace specflow {

class SpecStore;

/**
 * @brief Reason a status transition was refused.
 */
class TransitionError {
  public:
    enum class Kind {
        InvalidTransition,
        ApprovalRequired,
        UnmetDependencies,
        IncompleteCriteria,
        NoCommits,
        IncompleteMembers,
        DirtyWorktree,
        Other
    };

    TransitionError() = default;
    TransitionError(Kind kind, std::string detail) : kind_(kind), detail_(std::move(detail)) {}

    Kind kind() const { return kind_; }
    /** Variant payload: the offending ids, path or free text. */
    const std::string& detail() const { return detail_; }
    /** Human readable description. */
    std::string message() const;

  private:
    Kind kind_ = Kind::Other;
    std::string detail_;
};

/** @return `true` if the transition table allows @p from to @p to. */
bool is_valid_transition(SpecStatus from, SpecStatus to);

/**
 * @brief Validates and applies one status change.
 *
 * Checks are opt-in and run in a fixed order: approval, dependencies,
 * criteria, commits, members, clean worktree. The spec is only modified when
 * every enabled check passes.
 *
 * @code
 * TransitionError err;
 * if (!TransitionBuilder(spec).require_dependencies(store).to(SpecStatus::InProgress, &err))
 *     log_warning(err.message());
 * @endcode
 */
class TransitionBuilder {
  public:
    explicit TransitionBuilder(Spec& spec) : spec_(spec) {}

    TransitionBuilder& require_approval();
    /** Dependencies are checked against specs freshly loaded from @p store. */
    TransitionBuilder& require_dependencies(const SpecStore& store);
    TransitionBuilder& require_criteria();
    /** Recorded commits or commits tagged `specflow(<id>):` in @p repo. */
    TransitionBuilder& require_commits(const std::filesystem::path& repo);
    TransitionBuilder& require_members(const SpecStore& store);
    TransitionBuilder& require_clean(const std::filesystem::path& worktree);
    /** Skip the transition table and every precondition. */
    TransitionBuilder& force();

    /**
     * @brief Attempt the transition.
     *
     * @param target Desired status; `Ready` is always refused.
     * @param error  Optional output receiving the refusal reason.
     * @return `true` if the spec now has status @p target.
     */
    bool to(SpecStatus target, TransitionError* error = nullptr);

  private:
    bool check(SpecStatus target, TransitionError& error) const;

    Spec& spec_;
    bool approval_ = false;
    const SpecStore* dependency_store_ = nullptr;
    bool criteria_ = false;
    std::optional<std::filesystem::path> commits_repo_;
    const SpecStore* member_store_ = nullptr;
    std::optional<std::filesystem::path> clean_path_;
    bool force_ = false;
};

/** Pending/Failed/Blocked to InProgress, dependencies required. */
bool transition_to_in_progress(Spec& spec, const SpecStore& store,
                               TransitionError* error = nullptr);
/** Forced; used when unwinding a failure. */
void transition_to_failed(Spec& spec);
bool transition_to_paused(Spec& spec, TransitionError* error = nullptr);
bool transition_to_blocked(Spec& spec, TransitionError* error = nullptr);

} // namespace specflow

#endif // SPECFLOW_STATE_MACHINE_HPP
