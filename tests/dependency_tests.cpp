#include "test_common.hpp"
#include "dependency_graph.hpp"

using namespace specflow;

static Spec make_spec(const std::string& id, SpecStatus status,
                      std::vector<std::string> deps = {}) {
    Spec s;
    s.id = id;
    s.status = status;
    s.depends_on = std::move(deps);
    s.title = "Title " + id;
    return s;
}

TEST_CASE("Pending dependency blocks until completed") {
    std::vector<Spec> all{make_spec("S1", SpecStatus::Pending, {"S2"}),
                          make_spec("S2", SpecStatus::Pending)};
    REQUIRE_FALSE(is_ready(all[0], all));
    REQUIRE(is_blocked(all[0], all));
    auto blockers = get_blocking_dependencies(all[0], all);
    REQUIRE(blockers.size() == 1);
    REQUIRE(blockers[0].spec_id == "S2");
    REQUIRE(blockers[0].title == "Title S2");
    REQUIRE(blockers[0].status == SpecStatus::Pending);
    REQUIRE(ready_specs(all) == std::vector<std::string>{"S2"});

    all[1].status = SpecStatus::Completed;
    REQUIRE(is_ready(all[0], all));
    REQUIRE_FALSE(is_blocked(all[0], all));
}

TEST_CASE("Missing dependency is reported as not found") {
    std::vector<Spec> all{make_spec("A", SpecStatus::Pending, {"ghost"})};
    auto blockers = get_blocking_dependencies(all[0], all);
    REQUIRE(blockers.size() == 1);
    REQUIRE_FALSE(blockers[0].found);
    REQUIRE(blockers[0].title == "not found");
    REQUIRE_FALSE(is_ready(all[0], all));
}

TEST_CASE("Readiness requires pending or failed status and approval") {
    std::vector<Spec> all{make_spec("A", SpecStatus::Failed),
                          make_spec("B", SpecStatus::InProgress),
                          make_spec("C", SpecStatus::Pending)};
    all[2].approval = Approval{true, ApprovalStatus::Pending, "", ""};
    REQUIRE(is_ready(all[0], all));
    REQUIRE_FALSE(is_ready(all[1], all));
    REQUIRE_FALSE(is_ready(all[2], all));
    REQUIRE(is_blocked(all[2], all));
    all[2].approval->status = ApprovalStatus::Approved;
    REQUIRE(is_ready(all[2], all));
}

TEST_CASE("Driver members wait for preceding siblings and driver dependencies") {
    Spec driver = make_spec("D", SpecStatus::Pending, {"base"});
    driver.members = {"M1", "M2"};
    std::vector<Spec> all{driver, make_spec("M1", SpecStatus::Pending),
                          make_spec("M2", SpecStatus::Pending),
                          make_spec("base", SpecStatus::Completed)};

    REQUIRE(driver_of(all[2], all)->id == "D");
    REQUIRE(is_ready(all[1], all));
    auto blockers = get_blocking_dependencies(all[2], all);
    REQUIRE(blockers.size() == 1);
    REQUIRE(blockers[0].spec_id == "M1");
    REQUIRE(blockers[0].is_sibling);

    all[3].status = SpecStatus::Pending;
    blockers = get_blocking_dependencies(all[1], all);
    REQUIRE(blockers.size() == 1);
    REQUIRE(blockers[0].spec_id == "base");
    REQUIRE_FALSE(blockers[0].is_sibling);
}

TEST_CASE("Numeric suffix members follow their index") {
    Spec driver = make_spec("feature", SpecStatus::Pending);
    std::vector<Spec> all{driver, make_spec("feature.1", SpecStatus::Completed),
                          make_spec("feature.2", SpecStatus::Pending),
                          make_spec("feature.10", SpecStatus::Pending)};
    REQUIRE(driver_of(all[3], all)->id == "feature");
    auto blockers = get_blocking_dependencies(all[3], all);
    REQUIRE(blockers.size() == 1);
    REQUIRE(blockers[0].spec_id == "feature.2");
    REQUIRE(is_ready(all[2], all));
}

TEST_CASE("Oversized numeric suffix is not a member index") {
    std::vector<Spec> all{make_spec("grp", SpecStatus::Pending),
                          make_spec("grp.1", SpecStatus::Pending),
                          make_spec("grp.123456789012345678901234", SpecStatus::Pending)};
    REQUIRE_NOTHROW(driver_of(all[2], all));
    REQUIRE(driver_of(all[2], all) == nullptr);
    REQUIRE(get_blocking_dependencies(all[2], all).empty());
    REQUIRE(is_ready(all[2], all));
    REQUIRE(is_ready(all[1], all));
    REQUIRE(ready_specs(all) ==
            std::vector<std::string>{"grp", "grp.1", "grp.123456789012345678901234"});
}

TEST_CASE("Driver with criteria waits for its members") {
    Spec driver = make_spec("D", SpecStatus::Pending);
    driver.members = {"M1"};
    driver.body = "# D\n## Acceptance Criteria\n- [ ] all members done\n";
    std::vector<Spec> all{driver, make_spec("M1", SpecStatus::Pending)};
    REQUIRE(incomplete_members(all[0], all) == std::vector<std::string>{"M1"});
    REQUIRE_FALSE(is_ready(all[0], all));
    all[1].status = SpecStatus::Completed;
    REQUIRE(is_ready(all[0], all));
}

TEST_CASE("Cycles are detected once each") {
    std::vector<Spec> all{make_spec("a", SpecStatus::Pending, {"b"}),
                          make_spec("b", SpecStatus::Pending, {"a"}),
                          make_spec("c", SpecStatus::Pending, {"c"}),
                          make_spec("d", SpecStatus::Pending, {"a"})};
    auto cycles = detect_cycles(all);
    REQUIRE(cycles.size() == 2);
    REQUIRE(cycles[0] == std::vector<std::string>{"a", "b", "a"});
    REQUIRE(cycles[1] == std::vector<std::string>{"c", "c"});
    REQUIRE(format_cycle(cycles[0]) == "a -> b -> a");

    std::string err;
    REQUIRE_FALSE(topological_order(all, &err));
    REQUIRE(err == "Dependency cycle detected: a -> b -> a");
}

TEST_CASE("Topological order puts dependencies first") {
    std::vector<Spec> all{make_spec("app", SpecStatus::Pending, {"lib", "util"}),
                          make_spec("lib", SpecStatus::Pending, {"util"}),
                          make_spec("util", SpecStatus::Pending),
                          make_spec("zeta", SpecStatus::Pending, {"missing"})};
    auto order = topological_order(all);
    REQUIRE(order);
    REQUIRE(*order == std::vector<std::string>{"util", "lib", "app", "zeta"});
    REQUIRE(find_dependents("util", all) == std::vector<std::string>{"app", "lib"});
}
