#include "git_utils.hpp"
#include <algorithm>
#include <cctype>
#include "system_utils.hpp"

using namespace std;

namespace git {

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

/**
 * @brief Convert a libgit2 object ID to a hexadecimal string.
 */
static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

static git_repository* open_repo(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error);
        return nullptr;
    }
    return raw;
}

/**
 * @brief Resolve a revision string (branch, hash, `HEAD`) to a commit id.
 */
static bool resolve_commit(git_repository* repo, const string& spec, git_oid& out,
                           string* error) {
    git_object* raw = nullptr;
    if (git_revparse_single(&raw, repo, spec.c_str()) != 0) {
        set_error(error);
        return false;
    }
    object_ptr obj(raw);
    git_object* peeled_raw = nullptr;
    if (git_object_peel(&peeled_raw, obj.get(), GIT_OBJECT_COMMIT) != 0) {
        set_error(error);
        return false;
    }
    object_ptr peeled(peeled_raw);
    git_oid_cpy(&out, git_object_id(peeled.get()));
    return true;
}

optional<string> get_current_branch(const fs::path& repo, string* error) {
    GitInitGuard guard;
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_reference* head = nullptr;
    if (git_repository_head(&head, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr ref(head);
    const char* name = git_reference_shorthand(ref.get());
    string branch = name ? name : "";
    if (branch.empty() || branch == "HEAD") {
        if (error)
            *error = "HEAD is detached";
        return nullopt;
    }
    return branch;
}

optional<string> get_branch_hash(const fs::path& repo, const string& branch, string* error) {
    GitInitGuard guard;
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_oid oid;
    string refname = "refs/heads/" + branch;
    if (git_reference_name_to_id(&oid, r.get(), refname.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

bool branch_exists(const fs::path& repo, const string& branch) {
    return get_branch_hash(repo, branch).has_value();
}

optional<bool> is_branch_merged(const fs::path& repo, const string& branch, const string& target,
                                string* error) {
    GitInitGuard guard;
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_oid branch_oid;
    git_oid target_oid;
    if (git_reference_name_to_id(&branch_oid, r.get(), ("refs/heads/" + branch).c_str()) != 0 ||
        git_reference_name_to_id(&target_oid, r.get(), ("refs/heads/" + target).c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    if (git_oid_equal(&branch_oid, &target_oid))
        return true;
    int rc = git_graph_descendant_of(r.get(), &target_oid, &branch_oid);
    if (rc < 0) {
        set_error(error);
        return nullopt;
    }
    return rc == 1;
}

optional<vector<string>> commits_between(const fs::path& repo, const string& base,
                                         const string& tip, string* error) {
    GitInitGuard guard;
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_oid tip_oid;
    git_oid base_oid;
    if (!resolve_commit(r.get(), tip, tip_oid, error) ||
        !resolve_commit(r.get(), base, base_oid, error))
        return nullopt;
    git_revwalk* raw_walk = nullptr;
    if (git_revwalk_new(&raw_walk, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    revwalk_ptr walk(raw_walk);
    git_revwalk_sorting(walk.get(), GIT_SORT_TOPOLOGICAL | GIT_SORT_REVERSE);
    if (git_revwalk_push(walk.get(), &tip_oid) != 0 ||
        git_revwalk_hide(walk.get(), &base_oid) != 0) {
        set_error(error);
        return nullopt;
    }
    vector<string> out;
    git_oid oid;
    while (git_revwalk_next(&oid, walk.get()) == 0)
        out.push_back(oid_to_hex(oid));
    return out;
}

vector<string> find_commits_with_tag(const fs::path& repo, const string& tag) {
    GitInitGuard guard;
    vector<string> out;
    repo_ptr r(open_repo(repo, nullptr));
    if (!r.get())
        return out;
    git_revwalk* raw_walk = nullptr;
    if (git_revwalk_new(&raw_walk, r.get()) != 0)
        return out;
    revwalk_ptr walk(raw_walk);
    git_revwalk_sorting(walk.get(), GIT_SORT_TIME);
    bool pushed = git_revwalk_push_glob(walk.get(), "refs/heads/*") == 0;
    pushed = git_revwalk_push_head(walk.get()) == 0 || pushed;
    if (!pushed)
        return out;
    git_oid oid;
    while (git_revwalk_next(&oid, walk.get()) == 0) {
        git_commit* raw_commit = nullptr;
        if (git_commit_lookup(&raw_commit, r.get(), &oid) != 0)
            continue;
        commit_ptr commit(raw_commit);
        const char* msg = git_commit_message(commit.get());
        if (msg && string(msg).find(tag) != string::npos)
            out.push_back(oid_to_hex(oid));
    }
    return out;
}

bool has_uncommitted_changes(const fs::path& repo) {
    GitInitGuard guard;
    repo_ptr r(open_repo(repo, nullptr));
    if (!r.get())
        return false;
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX;
    git_status_list* raw_list = nullptr;
    if (git_status_list_new(&raw_list, r.get(), &opts) != 0)
        return false;
    status_list_ptr list(raw_list);
    return git_status_list_entrycount(list.get()) > 0;
}

static string trim(const string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

string GitResult::message() const {
    string e = trim(err);
    return e.empty() ? trim(out) : e;
}

GitResult run_git(const fs::path& cwd, const vector<string>& args,
                  const map<string, string>& env) {
    vector<string> argv{"git", "-C", cwd.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    procutil::ProcessOptions opts;
    opts.env = env;
    opts.env.emplace("GIT_TERMINAL_PROMPT", "0");
    opts.env.emplace("GIT_EDITOR", "true");
    procutil::ProcessResult pr = procutil::run_process(argv, opts);
    GitResult res;
    res.exit_code = pr.spawned ? pr.exit_code : -1;
    res.out = std::move(pr.out);
    res.err = std::move(pr.err);
    return res;
}

} // namespace git
