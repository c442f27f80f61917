#ifndef SPECFLOW_SCHEDULER_HPP
#define SPECFLOW_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>
#include "agent_runner.hpp"
#include "project.hpp"

namespace specflow {

enum class Outcome { Completed, Failed, Skipped, Paused };

const char* to_string(Outcome outcome);

struct SpecOutcome {
    std::string spec_id;
    Outcome outcome = Outcome::Skipped;
    std::string reason; ///< Cause for anything but Completed.
    std::string agent;
};

/** Per-spec results of one batch, in completion order. */
struct BatchSummary {
    std::vector<SpecOutcome> results;

    size_t count(Outcome outcome) const;
    const SpecOutcome* find(const std::string& spec_id) const;
};

/** What to do with unchecked acceptance criteria after a successful run. */
enum class CriteriaPolicy {
    AutoCheck, ///< Tick them and warn (single runs).
    Fail       ///< Fail the spec (batches).
};

/** Extra pre-dispatch check. Return `false` and set the reason to skip a spec. */
using QualityGate = std::function<bool(const Spec& spec, std::string& reason)>;

/**
 * @brief Lint a spec before dispatch.
 *
 * Requires a title, known dependency ids and no dependency cycle through the
 * spec.
 */
bool lint_spec(const Spec& spec, const std::vector<Spec>& all, std::string& reason);

/**
 * @brief Dispatches ready specs to agents in isolated worktrees.
 *
 * Worker threads are bounded by the configured agent capacity. Readiness is
 * recomputed from the store before every dispatch decision and merges into
 * the main branch are serialized.
 */
class Scheduler {
  public:
    Scheduler(Project& project, std::shared_ptr<AgentRunner> runner);

    void set_quality_gate(QualityGate gate) { gate_ = std::move(gate); }

    /**
     * @brief Run a batch.
     *
     * @param ids Specs to run. Drivers expand to their members. When empty,
     *            every Pending spec is a candidate. Failed specs only run when
     *            listed explicitly.
     * @return Outcome of every candidate once all have finished or been
     *         skipped.
     */
    BatchSummary run(const std::vector<std::string>& ids = {});

    /**
     * @brief Run one spec through the same pipeline.
     *
     * The agent is chosen by the configured rotation strategy and unchecked
     * criteria are ticked automatically.
     */
    SpecOutcome run_single(const std::string& id);

  private:
    bool validate(const Spec& spec, const std::vector<Spec>& all, std::string& reason) const;
    std::optional<size_t> pick_agent() const;
    std::chrono::milliseconds next_stagger();
    SpecOutcome execute(const std::string& id, size_t agent_index, CriteriaPolicy policy);
    SpecOutcome execute_guarded(const std::string& id, size_t agent_index,
                                CriteriaPolicy policy);

    Project& project_;
    std::shared_ptr<AgentRunner> runner_;
    QualityGate gate_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<size_t> active_per_agent_;
    size_t active_total_ = 0;
    std::vector<SpecOutcome> finished_; ///< Results not yet collected by run().

    std::mutex merge_mtx_;
    std::mt19937 rng_;
};

} // namespace specflow

#endif // SPECFLOW_SCHEDULER_HPP
