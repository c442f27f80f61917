#include "worktree.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>
#include "git_utils.hpp"
#include "layout.hpp"
#include "logger.hpp"
#include "spec_store.hpp"

namespace specflow {

const char* to_string(ConflictType type) {
    switch (type) {
    case ConflictType::None:
        return "none";
    case ConflictType::Content:
        return "content";
    case ConflictType::Tree:
        return "tree";
    case ConflictType::FastForward:
        return "fast-forward";
    case ConflictType::Unknown:
        return "unknown";
    }
    return "unknown";
}

ConflictType classify_conflict(const std::vector<std::string>& files, const std::string& output) {
    if (output.find("CONFLICT (modify/delete)") != std::string::npos ||
        output.find("CONFLICT (rename") != std::string::npos ||
        output.find("CONFLICT (file/directory)") != std::string::npos ||
        output.find("CONFLICT (directory/file)") != std::string::npos)
        return ConflictType::Tree;
    if (!files.empty() || output.find("CONFLICT (content)") != std::string::npos)
        return ConflictType::Content;
    if (output.find("ot possible to fast-forward") != std::string::npos)
        return ConflictType::FastForward;
    return ConflictType::Unknown;
}

static std::string combined(const git::GitResult& r) { return r.out + "\n" + r.err; }

WorktreeManager::WorktreeManager(fs::path repo_root, WorktreeOptions opts)
    : repo_root_(std::move(repo_root)), opts_(std::move(opts)) {}

fs::path WorktreeManager::worktree_root() const {
    if (!opts_.root.empty())
        return opts_.root;
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : tmp;
}

fs::path WorktreeManager::path_for(const std::string& spec_id) const {
    return worktree_root() / (opts_.prefix + spec_id);
}

std::optional<std::string> WorktreeManager::spec_id_for(const fs::path& worktree) const {
    std::string name = worktree.filename().string();
    if (name.size() <= opts_.prefix.size() || name.rfind(opts_.prefix, 0) != 0)
        return std::nullopt;
    return name.substr(opts_.prefix.size());
}

std::optional<fs::path> WorktreeManager::create(const std::string& spec_id,
                                                const std::string& branch, std::string& error,
                                                const std::string& base) const {
    fs::path path = path_for(spec_id);
    std::error_code ec;
    if (git::branch_exists(repo_root_, branch)) {
        error = "Branch " + branch + " already exists";
        return std::nullopt;
    }
    if (fs::exists(path, ec)) {
        error = "Worktree directory " + path.string() + " already exists";
        return std::nullopt;
    }
    fs::create_directories(worktree_root(), ec);
    std::unique_lock<std::mutex> admin(admin_mtx_);
    auto res = git::run_git(repo_root_, {"worktree", "add", "-b", branch, path.string(), base});
    if (!res.ok()) {
        error = "git worktree add failed: " + res.message();
        return std::nullopt;
    }
    admin.unlock();
    fs::path state = path / STATE_DIR_NAME;
    fs::create_directories(state, ec);
    std::ofstream ignore(state / ".gitignore");
    ignore << "*\n";
    if (!ignore) {
        error = "Failed to write " + (state / ".gitignore").string();
        return std::nullopt;
    }
    log_info("Created worktree", LogFields{{"spec", spec_id},
                                           {"branch", branch},
                                           {"worktree", path.string()}});
    return path;
}

bool WorktreeManager::copy_spec_into(const fs::path& worktree, const Spec& spec,
                                     std::string& error) const {
    Spec copy = spec;
    copy.status = SpecStatus::InProgress;
    SpecStore store(specs_dir(worktree));
    return store.save(copy, error);
}

std::vector<std::string> WorktreeManager::unmerged_files(const fs::path& checkout) const {
    static const std::set<std::string> codes{"UU", "AA", "DD", "AU", "UD", "UA", "DU"};
    std::vector<std::string> files;
    auto res = git::run_git(checkout, {"status", "--porcelain"});
    if (!res.ok())
        return files;
    std::istringstream lines(res.out);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.size() > 3 && codes.count(line.substr(0, 2)))
            files.push_back(line.substr(3));
    }
    return files;
}

bool WorktreeManager::rebase_onto(const fs::path& worktree, const std::string& branch,
                                  const std::string& target, MergeResult& result) const {
    auto res = git::run_git(worktree, {"rebase", target});
    // A rebase with several commits can stop once per conflicting commit.
    for (int round = 0; !res.ok(); ++round) {
        auto files = unmerged_files(worktree);
        std::string output = combined(res);
        std::string resolve_error;
        bool resolved = !files.empty() && resolver_ && round < 100 &&
                        resolver_->resolve(branch, target, files, worktree, resolve_error) &&
                        unmerged_files(worktree).empty();
        if (!resolved) {
            auto abort = git::run_git(worktree, {"rebase", "--abort"});
            if (!abort.ok())
                log_warning("git rebase --abort failed",
                            LogFields{{"worktree", worktree.string()}, {"error", abort.message()}});
            result.conflict_files = files;
            result.conflict_type = classify_conflict(files, output);
            result.error = !resolve_error.empty() ? resolve_error
                                                  : "Rebase of " + branch + " onto " + target +
                                                        " failed: " + res.message();
            return false;
        }
        res = git::run_git(worktree, {"rebase", "--continue"});
    }
    return true;
}

MergeResult WorktreeManager::merge_and_cleanup(const std::string& branch,
                                               const std::string& target, bool rebase) const {
    MergeResult result;
    auto worktree = find_worktree_for_branch(branch);

    if (rebase && worktree && !rebase_onto(*worktree, branch, target, result)) {
        log_warning("Rebase failed", LogFields{{"branch", branch},
                                               {"target", target},
                                               {"conflict", to_string(result.conflict_type)}});
        return result;
    }

    auto checkout = git::run_git(repo_root_, {"checkout", target});
    if (!checkout.ok()) {
        result.conflict_type = ConflictType::Unknown;
        result.error = "Failed to check out " + target + ": " + checkout.message();
        return result;
    }

    auto merge = git::run_git(repo_root_, {"merge", "--ff-only", branch});
    if (!merge.ok() && rebase) {
        result.conflict_type = ConflictType::FastForward;
        result.error = "Fast-forward of " + target + " to " + branch + " failed: " +
                       merge.message();
        return result;
    }
    if (!merge.ok()) {
        merge = git::run_git(repo_root_, {"merge", "--no-ff", "-m", "Merge " + branch, branch});
        if (!merge.ok()) {
            result.conflict_files = unmerged_files(repo_root_);
            result.conflict_type = classify_conflict(result.conflict_files, combined(merge));
            result.error = "Merge of " + branch + " into " + target + " failed: " +
                           merge.message();
            auto abort = git::run_git(repo_root_, {"merge", "--abort"});
            if (!abort.ok())
                log_warning("git merge --abort failed", abort.message());
            log_warning("Merge conflict", LogFields{{"branch", branch},
                                                    {"target", target},
                                                    {"files",
                                                     std::to_string(
                                                         result.conflict_files.size())}});
            return result;
        }
    }

    result.success = true;
    if (worktree) {
        std::string err;
        if (!remove(*worktree, &err))
            log_warning("Failed to remove merged worktree", err);
    }
    auto del = git::run_git(repo_root_, {"branch", "-d", branch});
    if (!del.ok())
        log_warning("Failed to delete merged branch",
                    LogFields{{"branch", branch}, {"error", del.message()}});
    log_info("Merged branch", LogFields{{"branch", branch}, {"target", target}});
    return result;
}

bool WorktreeManager::remove(const fs::path& path, std::string* error) const {
    std::lock_guard<std::mutex> admin(admin_mtx_);
    auto res = git::run_git(repo_root_, {"worktree", "remove", "--force", path.string()});
    if (!res.ok())
        log_debug("git worktree remove failed", res.message());
    std::error_code ec;
    fs::remove_all(path, ec);
    auto prune = git::run_git(repo_root_, {"worktree", "prune"});
    if (!prune.ok())
        log_warning("git worktree prune failed", prune.message());
    std::error_code exists_ec;
    if (fs::exists(path, exists_ec)) {
        if (error)
            *error = "Failed to remove " + path.string() + ": " + ec.message();
        return false;
    }
    log_info("Removed worktree", LogFields{{"worktree", path.string()}});
    return true;
}

bool WorktreeManager::belongs_to_repo(const fs::path& worktree) const {
    std::error_code ec;
    fs::path marker = worktree / ".git";
    if (!fs::is_regular_file(marker, ec))
        return true;
    std::ifstream ifs(marker);
    std::string line;
    std::getline(ifs, line);
    const std::string key = "gitdir: ";
    if (line.rfind(key, 0) != 0)
        return true;
    fs::path gitdir = fs::weakly_canonical(fs::path(line.substr(key.size())), ec);
    fs::path common = fs::weakly_canonical(repo_root_ / ".git", ec);
    auto rel = gitdir.lexically_relative(common);
    return !rel.empty() && rel.begin()->string() != "..";
}

std::vector<WorktreeInfo> WorktreeManager::list() const {
    std::vector<WorktreeInfo> out;
    std::error_code ec;
    fs::path root = worktree_root();
    if (!fs::is_directory(root, ec))
        return out;
    auto now = fs::file_time_type::clock::now();
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec) || !spec_id_for(entry.path()))
            continue;
        if (!belongs_to_repo(entry.path()))
            continue;
        WorktreeInfo info;
        info.name = entry.path().filename().string();
        info.path = entry.path();
        info.is_valid = fs::exists(entry.path() / ".git", entry_ec);
        auto mtime = fs::last_write_time(entry.path(), entry_ec);
        if (!entry_ec && now > mtime)
            info.age_seconds = static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::seconds>(now - mtime).count());
        for (auto it = fs::recursive_directory_iterator(
                 entry.path(), fs::directory_options::skip_permission_denied, entry_ec);
             !entry_ec && it != fs::recursive_directory_iterator(); it.increment(entry_ec)) {
            std::error_code size_ec;
            if (it->is_regular_file(size_ec))
                info.size_bytes += it->file_size(size_ec);
        }
        out.push_back(std::move(info));
    }
    std::sort(out.begin(), out.end(),
              [](const WorktreeInfo& a, const WorktreeInfo& b) { return a.name < b.name; });
    return out;
}

std::optional<fs::path> WorktreeManager::find_worktree_for_branch(const std::string& branch) const {
    auto res = git::run_git(repo_root_, {"worktree", "list", "--porcelain"});
    if (!res.ok())
        return std::nullopt;
    std::istringstream lines(res.out);
    std::string line;
    fs::path current;
    const std::string wanted = "branch refs/heads/" + branch;
    while (std::getline(lines, line)) {
        if (line.rfind("worktree ", 0) == 0)
            current = line.substr(9);
        else if (line == wanted && !current.empty())
            return current;
    }
    return std::nullopt;
}

} // namespace specflow
