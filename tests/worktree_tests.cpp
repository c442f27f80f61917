#include "test_common.hpp"
#include "worktree.hpp"

using namespace specflow;
using specflow::test_support::commit_file;
using specflow::test_support::git_cmd;
using specflow::test_support::init_git_repo;
using specflow::test_support::make_temp_dir;

namespace {
struct RepoFixture {
    fs::path base = make_temp_dir("worktree_fixture");
    fs::path repo = base / "repo";
    fs::path wt_root = base / "worktrees";
    WorktreeManager manager{repo, WorktreeOptions{wt_root, "specflow-", false}};

    RepoFixture() { init_git_repo(repo); }
    ~RepoFixture() {
        std::error_code ec;
        fs::remove_all(base, ec);
    }
};

/** Resolver that keeps the branch side of every conflicted file. */
struct TakeTheirs : ConflictResolver {
    int calls = 0;
    bool resolve(const std::string&, const std::string&, const std::vector<std::string>& files,
                 const fs::path& worktree, std::string& error) override {
        ++calls;
        for (const auto& f : files) {
            if (git_cmd(worktree, "checkout --theirs \"" + f + "\"") != 0 ||
                git_cmd(worktree, "add \"" + f + "\"") != 0) {
                error = "could not resolve " + f;
                return false;
            }
        }
        return true;
    }
};
} // namespace

TEST_CASE("classify_conflict") {
    REQUIRE(classify_conflict({}, "CONFLICT (modify/delete): a.txt deleted in HEAD") ==
            ConflictType::Tree);
    REQUIRE(classify_conflict({"a.txt"}, "CONFLICT (content): Merge conflict in a.txt") ==
            ConflictType::Content);
    REQUIRE(classify_conflict({}, "fatal: Not possible to fast-forward, aborting.") ==
            ConflictType::FastForward);
    REQUIRE(classify_conflict({}, "something else") == ConflictType::Unknown);
}

TEST_CASE("Worktree paths carry the prefix") {
    WorktreeManager manager("/repo", WorktreeOptions{"/wt", "specflow-", false});
    REQUIRE(manager.path_for("s1") == fs::path("/wt/specflow-s1"));
    REQUIRE(manager.spec_id_for("/wt/specflow-s1").value_or("") == "s1");
    REQUIRE_FALSE(manager.spec_id_for("/wt/other-s1"));
    REQUIRE_FALSE(manager.spec_id_for("/wt/specflow-"));
}

TEST_CASE("Worktree create, merge and cleanup") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    RepoFixture fx;
    std::string err;
    auto wt = fx.manager.create("s1", "specflow/s1", err, "main");
    REQUIRE(wt);
    REQUIRE(fs::exists(*wt / ".git"));
    REQUIRE(fs::exists(*wt / ".specflow" / ".gitignore"));
    REQUIRE(git::branch_exists(fx.repo, "specflow/s1"));
    REQUIRE_FALSE(fx.manager.create("s1", "specflow/s1", err, "main"));

    auto listed = fx.manager.list();
    REQUIRE(listed.size() == 1);
    REQUIRE(listed[0].name == "specflow-s1");
    REQUIRE(listed[0].is_valid);
    REQUIRE(fx.manager.find_worktree_for_branch("specflow/s1"));

    commit_file(*wt, "feature.txt", "feature\n", "specflow(s1): add feature");
    auto commits = git::commits_between(fx.repo, "main", "specflow/s1");
    REQUIRE(commits);
    REQUIRE(commits->size() == 1);

    MergeResult result = fx.manager.merge_and_cleanup("specflow/s1", "main", false);
    INFO(result.error);
    REQUIRE(result.success);
    REQUIRE(fs::exists(fx.repo / "feature.txt"));
    REQUIRE_FALSE(fs::exists(*wt));
    REQUIRE_FALSE(git::branch_exists(fx.repo, "specflow/s1"));
    REQUIRE(fx.manager.list().empty());
    REQUIRE(git::find_commits_with_tag(fx.repo, commit_tag("s1")).size() == 1);
}

TEST_CASE("Diverged branches merge without fast-forward") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    RepoFixture fx;
    std::string err;
    auto wt = fx.manager.create("s1", "specflow/s1", err, "main");
    REQUIRE(wt);
    commit_file(*wt, "a.txt", "a\n", "specflow(s1): a");
    commit_file(fx.repo, "b.txt", "b\n", "unrelated change on main");

    MergeResult result = fx.manager.merge_and_cleanup("specflow/s1", "main", false);
    INFO(result.error);
    REQUIRE(result.success);
    REQUIRE(fs::exists(fx.repo / "a.txt"));
    REQUIRE(fs::exists(fx.repo / "b.txt"));
}

TEST_CASE("Conflicting merge is aborted and reported") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    RepoFixture fx;
    std::string err;
    auto wt = fx.manager.create("s1", "specflow/s1", err, "main");
    REQUIRE(wt);
    commit_file(*wt, "README.md", "branch side\n", "specflow(s1): edit readme");
    commit_file(fx.repo, "README.md", "main side\n", "edit readme on main");

    MergeResult result = fx.manager.merge_and_cleanup("specflow/s1", "main", false);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.conflict_type == ConflictType::Content);
    REQUIRE(result.conflict_files == std::vector<std::string>{"README.md"});
    REQUIRE_FALSE(git::has_uncommitted_changes(fx.repo));
    REQUIRE(specflow::test_support::read_file(fx.repo / "README.md") == "main side\n");
    REQUIRE(fs::exists(*wt));
    REQUIRE(git::branch_exists(fx.repo, "specflow/s1"));
}

TEST_CASE("Rebase conflicts go through the resolver") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    RepoFixture fx;
    auto resolver = std::make_shared<TakeTheirs>();
    fx.manager.set_conflict_resolver(resolver);
    std::string err;
    auto wt = fx.manager.create("s1", "specflow/s1", err, "main");
    REQUIRE(wt);
    commit_file(*wt, "README.md", "branch side\n", "specflow(s1): edit readme");
    commit_file(fx.repo, "README.md", "main side\n", "edit readme on main");

    MergeResult result = fx.manager.merge_and_cleanup("specflow/s1", "main", true);
    INFO(result.error);
    REQUIRE(result.success);
    REQUIRE(resolver->calls >= 1);
    REQUIRE(specflow::test_support::read_file(fx.repo / "README.md") == "branch side\n");
}

TEST_CASE("Removing an unregistered directory") {
    fs::path base = make_temp_dir("worktree_remove");
    WorktreeManager manager(base / "no-repo", WorktreeOptions{base, "specflow-", false});
    fs::create_directories(base / "specflow-x" / "sub");
    std::string err;
    REQUIRE(manager.remove(base / "specflow-x", &err));
    REQUIRE_FALSE(fs::exists(base / "specflow-x"));
    FS_REMOVE_ALL(base);
}
