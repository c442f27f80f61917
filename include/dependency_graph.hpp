#ifndef SPECFLOW_DEPENDENCY_GRAPH_HPP
#define SPECFLOW_DEPENDENCY_GRAPH_HPP

#include <optional>
#include <string>
#include <vector>
#include "spec.hpp"

namespace specflow {

/**
 * @brief An unmet prerequisite of a spec, derived for diagnostics.
 */
struct BlockingDependency {
    std::string spec_id;
    std::string title; ///< Spec title, the id when untitled, or "not found".
    SpecStatus status = SpecStatus::Pending;
    std::optional<std::string> completed_at;
    bool is_sibling = false; ///< Earlier member of the same driver.
    bool found = true;       ///< False when no spec carries @ref spec_id.
};

const Spec* find_spec(const std::vector<Spec>& all, const std::string& id);

/**
 * @brief Find the driver a spec belongs to.
 *
 * A driver lists the spec in its `members`. Without one, the `DRIVER.N` id
 * convention names the driver when a spec with id `DRIVER` exists.
 */
const Spec* driver_of(const Spec& spec, const std::vector<Spec>& all);

/**
 * @brief List everything that keeps @p spec from running.
 *
 * Order: the spec's own `depends_on`, then its driver's `depends_on`, then
 * earlier siblings (sequential group execution). Each id appears once.
 */
std::vector<BlockingDependency> get_blocking_dependencies(const Spec& spec,
                                                          const std::vector<Spec>& all);

/**
 * @brief Whether @p spec may be dispatched now.
 *
 * Requires status Pending or Failed, no blockers and no outstanding approval.
 * A driver with acceptance criteria additionally needs all members Completed.
 */
bool is_ready(const Spec& spec, const std::vector<Spec>& all);

/** Pending or Blocked specs that have blockers or await approval. */
bool is_blocked(const Spec& spec, const std::vector<Spec>& all);

/** Members of @p driver that are missing or not Completed, in member order. */
std::vector<std::string> incomplete_members(const Spec& driver, const std::vector<Spec>& all);

/** Ids of every ready spec, in the order of @p all. */
std::vector<std::string> ready_specs(const std::vector<Spec>& all);

/**
 * @brief Find dependency cycles.
 *
 * Each cycle is returned as a path that starts and ends with the same id,
 * e.g. `{a, b, a}`. Unknown dependency ids are ignored.
 */
std::vector<std::vector<std::string>> detect_cycles(const std::vector<Spec>& all);

/**
 * @brief Order specs so that dependencies come first.
 *
 * Ties are broken by id. Fails with a description of a cycle when one exists.
 */
std::optional<std::vector<std::string>> topological_order(const std::vector<Spec>& all,
                                                          std::string* error = nullptr);

/** Ids of specs whose `depends_on` names @p id. */
std::vector<std::string> find_dependents(const std::string& id, const std::vector<Spec>& all);

/** Render a cycle path as `a -> b -> a`. */
std::string format_cycle(const std::vector<std::string>& cycle);

} // namespace specflow

#endif // SPECFLOW_DEPENDENCY_GRAPH_HPP
