#include "test_common.hpp"

using namespace specflow;
using specflow::test_support::make_temp_dir;
using specflow::test_support::write_spec;

TEST_CASE("SpecStore saves and loads specs") {
    fs::path dir = make_temp_dir("store_roundtrip");
    SpecStore store(dir / "specs");
    Spec spec;
    spec.id = "2026-02-01-001-aaa";
    spec.status = SpecStatus::Failed;
    spec.depends_on = {"other"};
    spec.body = "# Saved\n";
    std::string err;
    REQUIRE(store.save(spec, err));
    REQUIRE(store.exists(spec.id));

    auto loaded = store.load(spec.id, &err);
    REQUIRE(loaded);
    REQUIRE(loaded->status == SpecStatus::Failed);
    REQUIRE(loaded->depends_on == std::vector<std::string>{"other"});
    REQUIRE(loaded->title.value_or("") == "Saved");

    for (const auto& entry : fs::directory_iterator(store.dir()))
        REQUIRE(entry.path().filename().string().find(".tmp.") == std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("SpecStore load_all sorts and reports bad files") {
    fs::path dir = make_temp_dir("store_all");
    SpecStore store(dir);
    write_spec(store, "b", "status: pending\n", "# B\n");
    write_spec(store, "a", "status: completed\n", "# A\n");
    write_spec(store, "broken", "status: nope\n", "# Broken\n");
    std::ofstream(dir / "notes.txt") << "ignored";

    std::vector<std::string> errors;
    auto all = store.load_all(&errors);
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].id == "a");
    REQUIRE(all[1].id == "b");
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].find("broken") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("SpecStore load of a missing spec") {
    fs::path dir = make_temp_dir("store_missing");
    SpecStore store(dir);
    std::string err;
    REQUIRE_FALSE(store.load("ghost", &err));
    REQUIRE(err == "Spec not found: ghost");
    FS_REMOVE_ALL(dir);
}

TEST_CASE("SpecStore resolves partial ids") {
    fs::path dir = make_temp_dir("store_resolve");
    SpecStore store(dir);
    write_spec(store, "2026-01-01-001-abc", "status: pending\n", "# 1\n");
    write_spec(store, "2026-01-01-002-abd", "status: pending\n", "# 2\n");

    write_spec(store, "2026-01-02-001-xyz", "status: pending\n", "# 3\n");

    std::string err;
    REQUIRE(store.resolve_id("2026-01-01-001", &err).value_or("") == "2026-01-01-001-abc");
    REQUIRE(store.resolve_id("2026-01-02", &err).value_or("") == "2026-01-02-001-xyz");
    REQUIRE_FALSE(store.resolve_id("2026-01-01", &err));
    REQUIRE(err.find("Ambiguous") != std::string::npos);
    REQUIRE(store.resolve_id("001-abc", &err).value_or("") == "2026-01-01-001-abc");
    REQUIRE(store.resolve_id("xyz", &err).value_or("") == "2026-01-02-001-xyz");
    REQUIRE(store.resolve_id("2026-01-01-002-abd").value_or("") == "2026-01-01-002-abd");
    REQUIRE_FALSE(store.resolve_id("ab", &err));
    REQUIRE(err.find("Ambiguous") != std::string::npos);
    REQUIRE_FALSE(store.resolve_id("zzz", &err));
    REQUIRE(err.find("not found") != std::string::npos);
    FS_REMOVE_ALL(dir);
}
