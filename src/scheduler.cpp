#include "scheduler.hpp"
#include <algorithm>
#include <filesystem>
#include <set>
#include <thread>
#include "agent_rotation.hpp"
#include "agent_status.hpp"
#include "dependency_graph.hpp"
#include "finalize.hpp"
#include "git_utils.hpp"
#include "lock_utils.hpp"
#include "logger.hpp"

namespace specflow {

const char* to_string(Outcome outcome) {
    switch (outcome) {
    case Outcome::Completed:
        return "completed";
    case Outcome::Failed:
        return "failed";
    case Outcome::Skipped:
        return "skipped";
    case Outcome::Paused:
        return "paused";
    }
    return "skipped";
}

size_t BatchSummary::count(Outcome outcome) const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                             [&](const SpecOutcome& o) {
                                                 return o.outcome == outcome;
                                             }));
}

const SpecOutcome* BatchSummary::find(const std::string& spec_id) const {
    for (const auto& r : results) {
        if (r.spec_id == spec_id)
            return &r;
    }
    return nullptr;
}

bool lint_spec(const Spec& spec, const std::vector<Spec>& all, std::string& reason) {
    if (!spec.title || spec.title->empty()) {
        reason = "Spec has no title";
        return false;
    }
    for (const auto& dep : spec.depends_on) {
        if (!find_spec(all, dep)) {
            reason = "Unknown dependency: " + dep;
            return false;
        }
    }
    for (const auto& cycle : detect_cycles(all)) {
        if (std::find(cycle.begin(), cycle.end(), spec.id) != cycle.end()) {
            reason = "Dependency cycle: " + format_cycle(cycle);
            return false;
        }
    }
    return true;
}

/** Members listed by @p driver, or named after it by the `DRIVER.N` convention. */
static std::vector<std::string> members_of(const Spec& driver, const std::vector<Spec>& all) {
    if (!driver.members.empty())
        return driver.members;
    std::vector<std::string> out;
    for (const auto& s : all) {
        const Spec* d = driver_of(s, all);
        if (d && d->id == driver.id)
            out.push_back(s.id);
    }
    return out;
}

static bool is_group_spec(const Spec& spec) {
    return spec.is_driver() || spec.type == SpecType::Driver || spec.type == SpecType::Group;
}

Scheduler::Scheduler(Project& project, std::shared_ptr<AgentRunner> runner)
    : project_(project), runner_(std::move(runner)),
      active_per_agent_(project.options().parallel.agents.size(), 0),
      rng_(std::random_device{}()) {}

bool Scheduler::validate(const Spec& spec, const std::vector<Spec>& all,
                         std::string& reason) const {
    if (!lint_spec(spec, all, reason))
        return false;
    if (requires_approval(spec)) {
        reason = "Spec requires approval";
        return false;
    }
    if (gate_ && !gate_(spec, reason)) {
        if (reason.empty())
            reason = "Quality gate failed";
        return false;
    }
    return true;
}

std::optional<size_t> Scheduler::pick_agent() const {
    const auto& parallel = project_.options().parallel;
    if (active_total_ >= parallel.total_capacity())
        return std::nullopt;
    std::optional<size_t> best;
    size_t best_free = 0;
    for (size_t i = 0; i < parallel.agents.size(); ++i) {
        size_t limit = parallel.agents[i].max_concurrent;
        size_t free = limit > active_per_agent_[i] ? limit - active_per_agent_[i] : 0;
        if (free > best_free) {
            best = i;
            best_free = free;
        }
    }
    return best;
}

std::chrono::milliseconds Scheduler::next_stagger() {
    const auto& parallel = project_.options().parallel;
    long long delay = parallel.stagger_delay.count();
    long long jitter = parallel.stagger_jitter.count();
    if (jitter > 0) {
        std::uniform_int_distribution<long long> dist(-jitter, jitter);
        delay += dist(rng_);
    }
    return std::chrono::milliseconds(std::max(delay, 0LL));
}

BatchSummary Scheduler::run(const std::vector<std::string>& ids) {
    BatchSummary summary;
    const SpecStore& store = project_.store();
    std::vector<std::string> load_errors;
    auto all = store.load_all(&load_errors);
    for (const auto& e : load_errors)
        log_warning("Ignoring unreadable spec", e);

    std::vector<std::string> pending;
    std::set<std::string> queued;
    auto enqueue = [&](const std::string& id) {
        if (queued.insert(id).second)
            pending.push_back(id);
    };
    auto skip = [&](const std::string& id, const std::string& reason) {
        log_warning("Skipping spec", LogFields{{"spec", id}, {"reason", reason}});
        summary.results.push_back({id, Outcome::Skipped, reason, ""});
    };

    if (ids.empty()) {
        for (const auto& s : all) {
            if (s.status == SpecStatus::Pending && !is_group_spec(s))
                enqueue(s.id);
        }
    } else {
        for (const auto& raw : ids) {
            std::string err;
            auto id = store.resolve_id(raw, &err);
            if (!id) {
                skip(raw, err);
                continue;
            }
            const Spec* s = find_spec(all, *id);
            if (s && is_group_spec(*s)) {
                for (const auto& m : members_of(*s, all)) {
                    const Spec* member = find_spec(all, m);
                    if (member && member->status != SpecStatus::Completed)
                        enqueue(m);
                }
            } else {
                enqueue(*id);
            }
        }
    }

    log_info("Starting batch",
             LogFields{{"specs", std::to_string(pending.size())},
                       {"capacity", std::to_string(project_.options().parallel.total_capacity())}});

    std::set<std::string> in_flight;
    std::set<std::string> validated;
    std::vector<std::thread> workers;
    bool first_dispatch = true;

    while (true) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            for (auto& o : finished_) {
                in_flight.erase(o.spec_id);
                summary.results.push_back(std::move(o));
            }
            finished_.clear();
        }

        all = store.load_all();
        std::set<std::string> waiting(pending.begin(), pending.end());
        std::vector<std::string> still_pending;
        std::optional<std::string> next;
        for (const auto& id : pending) {
            const Spec* s = find_spec(all, id);
            if (!s) {
                skip(id, "Spec not found");
                continue;
            }
            if (s->status != SpecStatus::Pending && s->status != SpecStatus::Failed) {
                skip(id, std::string("Spec is ") + to_string(s->status));
                continue;
            }
            if (!validated.count(id)) {
                std::string reason;
                if (!validate(*s, all, reason)) {
                    skip(id, reason);
                    continue;
                }
                validated.insert(id);
            }
            auto blockers = get_blocking_dependencies(*s, all);
            std::string hopeless;
            for (const auto& b : blockers) {
                if (!waiting.count(b.spec_id) && !in_flight.count(b.spec_id))
                    hopeless += (hopeless.empty() ? "" : ", ") + b.spec_id + " (" +
                                (b.found ? to_string(b.status) : "not found") + ")";
            }
            if (!hopeless.empty()) {
                skip(id, "Blocked by: " + hopeless);
                continue;
            }
            still_pending.push_back(id);
            if (!next && is_ready(*s, all))
                next = id;
        }
        pending = std::move(still_pending);

        if (pending.empty() && in_flight.empty())
            break;

        std::unique_lock<std::mutex> lk(mtx_);
        if (next) {
            auto agent = pick_agent();
            if (agent) {
                ++active_per_agent_[*agent];
                ++active_total_;
                lk.unlock();
                if (!first_dispatch) {
                    auto delay = next_stagger();
                    if (delay.count() > 0)
                        std::this_thread::sleep_for(delay);
                }
                first_dispatch = false;
                std::string id = *next;
                size_t index = *agent;
                in_flight.insert(id);
                pending.erase(std::find(pending.begin(), pending.end(), id));
                log_info("Dispatching spec",
                         LogFields{{"spec", id},
                                   {"agent", project_.options().parallel.agents[index].name}});
                workers.emplace_back([this, id, index] {
                    SpecOutcome outcome = execute_guarded(id, index, CriteriaPolicy::Fail);
                    {
                        std::lock_guard<std::mutex> guard(mtx_);
                        --active_per_agent_[index];
                        --active_total_;
                        finished_.push_back(std::move(outcome));
                    }
                    cv_.notify_all();
                });
                continue;
            }
        }
        if (in_flight.empty()) {
            lk.unlock();
            for (const auto& id : pending)
                skip(id, next ? "No agent capacity" : "Not ready");
            pending.clear();
            break;
        }
        cv_.wait(lk, [this] { return !finished_.empty(); });
    }

    for (auto& w : workers)
        w.join();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto& o : finished_)
            summary.results.push_back(std::move(o));
        finished_.clear();
    }
    log_info("Batch finished", LogFields{{"completed",
                                          std::to_string(summary.count(Outcome::Completed))},
                                         {"failed", std::to_string(summary.count(Outcome::Failed))},
                                         {"skipped",
                                          std::to_string(summary.count(Outcome::Skipped))},
                                         {"paused", std::to_string(summary.count(Outcome::Paused))}});
    return summary;
}

SpecOutcome Scheduler::run_single(const std::string& raw_id) {
    std::string err;
    auto id = project_.store().resolve_id(raw_id, &err);
    if (!id)
        return {raw_id, Outcome::Skipped, err, ""};
    auto all = project_.store().load_all();
    const Spec* spec = find_spec(all, *id);
    if (!spec)
        return {*id, Outcome::Skipped, "Spec not found", ""};
    if (is_group_spec(*spec))
        return {*id, Outcome::Skipped, "Drivers complete through their members", ""};
    std::string reason;
    if (!validate(*spec, all, reason))
        return {*id, Outcome::Skipped, reason, ""};
    const auto& opts = project_.options();
    auto index = select_agent(opts.parallel.agents, opts.rotation,
                              rotation_state_path(project_.root()));
    if (!index)
        return {*id, Outcome::Skipped, "No agents configured", ""};
    return execute_guarded(*id, *index, CriteriaPolicy::AutoCheck);
}

SpecOutcome Scheduler::execute_guarded(const std::string& id, size_t agent_index,
                                       CriteriaPolicy policy) {
    const std::string& agent = project_.options().parallel.agents[agent_index].name;
    try {
        return execute(id, agent_index, policy);
    } catch (const std::exception& e) {
        log_error("Worker error", LogFields{{"spec", id}, {"error", e.what()}});
        fail_spec(project_, id, e.what());
        std::error_code ec;
        auto worktree = project_.worktrees().path_for(id);
        if (std::filesystem::is_directory(worktree, ec)) {
            std::string err;
            if (!write_agent_status(status_file_path(worktree),
                                    make_agent_status(id, AgentState::Failed, e.what()), err))
                log_warning("Failed to write status", LogFields{{"spec", id}, {"error", err}});
        }
        return {id, Outcome::Failed, e.what(), agent};
    }
}

SpecOutcome Scheduler::execute(const std::string& id, size_t agent_index,
                               CriteriaPolicy policy) {
    const Options& opts = project_.options();
    const AgentConfig agent = opts.parallel.agents[agent_index];
    const SpecStore& store = project_.store();
    WorktreeManager& worktrees = project_.worktrees();
    // Set once the worktree exists; every later failure leaves a Failed record there.
    std::filesystem::path status_path;
    std::vector<std::string> branch_commits;
    auto failed = [&](const std::string& reason) {
        fail_spec(project_, id, reason);
        if (!status_path.empty()) {
            std::string err;
            if (!write_agent_status(status_path,
                                    make_agent_status(id, AgentState::Failed, reason,
                                                      branch_commits),
                                    err))
                log_warning("Failed to write status", LogFields{{"spec", id}, {"error", err}});
        }
        return SpecOutcome{id, Outcome::Failed, reason, agent.name};
    };

    procutil::LockFileGuard lock(lock_path(project_.root(), id));
    if (!lock.locked)
        return {id, Outcome::Skipped, "Locked by process " + std::to_string(lock.holder),
                agent.name};

    std::string err;
    auto spec = store.load(id, &err);
    if (!spec)
        return {id, Outcome::Skipped, err, agent.name};
    TransitionError terr;
    if (!transition_to_in_progress(*spec, store, &terr))
        return {id, Outcome::Skipped, terr.message(), agent.name};
    if (!store.save(*spec, err))
        return failed(err);
    mark_driver_in_progress(project_, id);

    const std::string branch = project_.branch_for(*spec);
    std::filesystem::path worktree;
    if (auto existing = worktrees.find_worktree_for_branch(branch)) {
        worktree = *existing;
        log_info("Reusing worktree",
                 LogFields{{"spec", id}, {"branch", branch}, {"worktree", worktree.string()}});
    } else {
        auto created = worktrees.create(id, branch, err, opts.main_branch);
        if (!created)
            return failed(err);
        worktree = *created;
    }
    status_path = status_file_path(worktree);
    if (!worktrees.copy_spec_into(worktree, *spec, err))
        return failed(err);

    if (!write_agent_status(status_path, make_agent_status(id, AgentState::Working), err))
        log_warning("Failed to write status", LogFields{{"spec", id}, {"error", err}});

    AgentResult result;
    {
        procutil::PidFileGuard pid_file(pid_path(project_.root(), id));
        AgentInvocation inv;
        inv.spec_id = id;
        inv.prompt = build_prompt(*spec);
        inv.worktree = worktree;
        inv.agent = agent;
        inv.log_path = agent_log_path(project_.root(), id);
        inv.status_file = status_path;
        inv.on_spawn = [&pid_file](long pid) {
            pid_file.record(static_cast<unsigned long>(pid));
        };
        result = runner_->run(inv);
    }

    if (!result.success()) {
        std::string reason = !result.error.empty()
                                 ? result.error
                                 : "Agent exited with code " + std::to_string(result.exit_code);
        auto current = store.load(id);
        if (current && current->status == SpecStatus::Paused) {
            if (!write_agent_status(status_path,
                                    make_agent_status(id, AgentState::Failed, reason), err))
                log_warning("Failed to write status", LogFields{{"spec", id}, {"error", err}});
            log_info("Agent stopped for pause", LogFields{{"spec", id}, {"agent", agent.name}});
            return {id, Outcome::Paused, "Paused by operator", agent.name};
        }
        return failed(reason);
    }

    auto commits = git::commits_between(project_.root(), opts.main_branch, branch, &err);
    if (!commits) {
        log_warning("Could not list branch commits", LogFields{{"spec", id}, {"error", err}});
        commits.emplace();
    }
    branch_commits = *commits;
    bool needs_commits = !opts.parallel.allow_no_commits &&
                         spec->type != SpecType::Documentation &&
                         spec->type != SpecType::Research;
    if (needs_commits && commits->empty())
        return failed("No commits found for spec");

    // The agent ticks criteria in its private copy of the spec.
    SpecStore worktree_store(specs_dir(worktree));
    if (auto copy = worktree_store.load(id))
        spec->body = copy->body;
    if (size_t unchecked = count_unchecked_checkboxes(spec->body)) {
        if (policy == CriteriaPolicy::Fail)
            return failed(std::to_string(unchecked) + " acceptance criteria unchecked");
        auto_check_acceptance_criteria(spec->body);
        log_warning("Auto-checked acceptance criteria",
                    LogFields{{"spec", id}, {"count", std::to_string(unchecked)}});
    }

    if (!write_agent_status(status_path, make_agent_status(id, AgentState::Done, std::nullopt,
                                                           *commits),
                            err))
        log_warning("Failed to write status", LogFields{{"spec", id}, {"error", err}});
    append_agent_output(*spec, result.output);
    if (!store.save(*spec, err))
        return failed(err);

    MergeResult merged;
    {
        std::lock_guard<std::mutex> merge_lock(merge_mtx_);
        merged = worktrees.merge_and_cleanup(branch, opts.main_branch, opts.worktree.rebase);
    }
    if (!merged.success) {
        std::string reason = merged.error;
        if (!merged.conflict_files.empty()) {
            reason += " (conflicts:";
            for (const auto& f : merged.conflict_files)
                reason += " " + f;
            reason += ")";
        }
        return failed(reason);
    }

    if (!finalize_spec(project_, *spec, *commits, agent.name, err))
        return failed(err);
    return {id, Outcome::Completed, "", agent.name};
}

} // namespace specflow
