#include "dependency_graph.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <map>
#include <set>

namespace specflow {

const Spec* find_spec(const std::vector<Spec>& all, const std::string& id) {
    for (const auto& s : all) {
        if (s.id == id)
            return &s;
    }
    return nullptr;
}

/**
 * @brief Split `DRIVER.N` into its driver id and numeric index.
 *
 * A suffix too large for `unsigned long` is not a member index.
 */
static bool split_member_id(const std::string& id, std::string& driver, unsigned long& index) {
    auto dot = id.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= id.size())
        return false;
    for (std::size_t i = dot + 1; i < id.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(id[i])))
            return false;
    }
    errno = 0;
    unsigned long n = std::strtoul(id.c_str() + dot + 1, nullptr, 10);
    if (errno == ERANGE)
        return false;
    driver = id.substr(0, dot);
    index = n;
    return true;
}

const Spec* driver_of(const Spec& spec, const std::vector<Spec>& all) {
    for (const auto& s : all) {
        if (s.id != spec.id &&
            std::find(s.members.begin(), s.members.end(), spec.id) != s.members.end())
            return &s;
    }
    std::string driver;
    unsigned long index = 0;
    if (split_member_id(spec.id, driver, index))
        return find_spec(all, driver);
    return nullptr;
}

/** Members of @p driver that come before @p spec. */
static std::vector<std::string> preceding_siblings(const Spec& spec, const Spec& driver,
                                                   const std::vector<Spec>& all) {
    std::vector<std::string> out;
    auto pos = std::find(driver.members.begin(), driver.members.end(), spec.id);
    if (pos != driver.members.end()) {
        out.assign(driver.members.begin(), pos);
        return out;
    }
    std::string driver_id;
    unsigned long index = 0;
    if (!split_member_id(spec.id, driver_id, index) || driver_id != driver.id)
        return out;
    std::vector<std::pair<unsigned long, std::string>> earlier;
    for (const auto& s : all) {
        std::string other_driver;
        unsigned long other_index = 0;
        if (split_member_id(s.id, other_driver, other_index) && other_driver == driver_id &&
            other_index < index)
            earlier.emplace_back(other_index, s.id);
    }
    std::sort(earlier.begin(), earlier.end());
    for (auto& e : earlier)
        out.push_back(e.second);
    return out;
}

static BlockingDependency make_blocker(const std::string& id, const Spec* dep, bool sibling) {
    BlockingDependency b;
    b.spec_id = id;
    b.is_sibling = sibling;
    if (!dep) {
        b.found = false;
        b.title = "not found";
        return b;
    }
    b.title = dep->title ? *dep->title : dep->id;
    b.status = dep->status;
    b.completed_at = dep->completed_at;
    return b;
}

std::vector<BlockingDependency> get_blocking_dependencies(const Spec& spec,
                                                          const std::vector<Spec>& all) {
    std::vector<BlockingDependency> out;
    std::set<std::string> seen;
    auto consider = [&](const std::string& id, bool sibling) {
        if (id == spec.id || !seen.insert(id).second)
            return;
        const Spec* dep = find_spec(all, id);
        if (dep && dep->status == SpecStatus::Completed)
            return;
        out.push_back(make_blocker(id, dep, sibling));
    };

    for (const auto& id : spec.depends_on)
        consider(id, false);
    if (const Spec* driver = driver_of(spec, all)) {
        for (const auto& id : driver->depends_on)
            consider(id, false);
        for (const auto& id : preceding_siblings(spec, *driver, all))
            consider(id, true);
    }
    return out;
}

std::vector<std::string> incomplete_members(const Spec& driver, const std::vector<Spec>& all) {
    std::vector<std::string> out;
    for (const auto& id : driver.members) {
        const Spec* m = find_spec(all, id);
        if (!m || m->status != SpecStatus::Completed)
            out.push_back(id);
    }
    return out;
}

bool is_ready(const Spec& spec, const std::vector<Spec>& all) {
    if (spec.status != SpecStatus::Pending && spec.status != SpecStatus::Failed)
        return false;
    if (requires_approval(spec))
        return false;
    if (!get_blocking_dependencies(spec, all).empty())
        return false;
    if (spec.is_driver() && has_acceptance_criteria(spec.body) &&
        !incomplete_members(spec, all).empty())
        return false;
    return true;
}

bool is_blocked(const Spec& spec, const std::vector<Spec>& all) {
    if (spec.status != SpecStatus::Pending && spec.status != SpecStatus::Blocked)
        return false;
    return requires_approval(spec) || !get_blocking_dependencies(spec, all).empty();
}

std::vector<std::string> ready_specs(const std::vector<Spec>& all) {
    std::vector<std::string> out;
    for (const auto& s : all) {
        if (is_ready(s, all))
            out.push_back(s.id);
    }
    return out;
}

namespace {

enum class Mark { White, Grey, Black };

struct CycleSearch {
    const std::vector<Spec>& all;
    std::map<std::string, Mark> marks;
    std::vector<std::string> stack;
    std::vector<std::vector<std::string>> cycles;
    std::set<std::vector<std::string>> canonical;

    void visit(const Spec& s) {
        marks[s.id] = Mark::Grey;
        stack.push_back(s.id);
        for (const auto& dep_id : s.depends_on) {
            const Spec* dep = find_spec(all, dep_id);
            if (!dep)
                continue;
            Mark m = marks[dep_id];
            if (m == Mark::Grey)
                record(dep_id);
            else if (m == Mark::White)
                visit(*dep);
        }
        stack.pop_back();
        marks[s.id] = Mark::Black;
    }

    void record(const std::string& start) {
        auto it = std::find(stack.begin(), stack.end(), start);
        std::vector<std::string> ring(it, stack.end());
        // Rotate so the smallest id leads; this identifies each ring once.
        auto smallest = std::min_element(ring.begin(), ring.end());
        std::vector<std::string> key(smallest, ring.end());
        key.insert(key.end(), ring.begin(), smallest);
        if (!canonical.insert(key).second)
            return;
        ring.push_back(start);
        cycles.push_back(std::move(ring));
    }
};

} // namespace

std::vector<std::vector<std::string>> detect_cycles(const std::vector<Spec>& all) {
    CycleSearch search{all, {}, {}, {}, {}};
    for (const auto& s : all)
        search.marks[s.id] = Mark::White;
    for (const auto& s : all) {
        if (search.marks[s.id] == Mark::White)
            search.visit(s);
    }
    return search.cycles;
}

std::string format_cycle(const std::vector<std::string>& cycle) {
    std::string out;
    for (const auto& id : cycle) {
        if (!out.empty())
            out += " -> ";
        out += id;
    }
    return out;
}

std::optional<std::vector<std::string>> topological_order(const std::vector<Spec>& all,
                                                          std::string* error) {
    std::map<std::string, std::size_t> indegree;
    std::map<std::string, std::vector<std::string>> dependents;
    for (const auto& s : all)
        indegree.emplace(s.id, 0);
    for (const auto& s : all) {
        std::set<std::string> unique(s.depends_on.begin(), s.depends_on.end());
        for (const auto& dep : unique) {
            if (!indegree.count(dep) || dep == s.id)
                continue;
            ++indegree[s.id];
            dependents[dep].push_back(s.id);
        }
    }
    std::set<std::string> queue;
    for (const auto& [id, deg] : indegree) {
        if (deg == 0)
            queue.insert(id);
    }
    std::vector<std::string> order;
    while (!queue.empty()) {
        std::string id = *queue.begin();
        queue.erase(queue.begin());
        order.push_back(id);
        for (const auto& d : dependents[id]) {
            if (--indegree[d] == 0)
                queue.insert(d);
        }
    }
    if (order.size() != indegree.size()) {
        if (error) {
            auto cycles = detect_cycles(all);
            *error = "Dependency cycle detected";
            if (!cycles.empty())
                *error += ": " + format_cycle(cycles.front());
        }
        return std::nullopt;
    }
    return order;
}

std::vector<std::string> find_dependents(const std::string& id, const std::vector<Spec>& all) {
    std::vector<std::string> out;
    for (const auto& s : all) {
        if (std::find(s.depends_on.begin(), s.depends_on.end(), id) != s.depends_on.end())
            out.push_back(s.id);
    }
    return out;
}

} // namespace specflow
