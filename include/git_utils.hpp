#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing libgit2 initialization.
 *
 * libgit2 reference-counts initialization, so guards may be nested freely.
 * Every query below holds one for its own duration.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;
using revwalk_ptr = GitHandle<git_revwalk, git_revwalk_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;

/**
 * @brief Retrieve the currently checked out branch name.
 *
 * @param repo  Path to a Git repository or worktree.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Branch name or `std::nullopt` if it cannot be determined.
 */
std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Resolve a local branch to its tip commit hash.
 */
std::optional<std::string> get_branch_hash(const fs::path& repo, const std::string& branch,
                                           std::string* error = nullptr);

/** @return `true` if `refs/heads/<branch>` exists in @p repo. */
bool branch_exists(const fs::path& repo, const std::string& branch);

/**
 * @brief Check whether every commit on @p branch is already contained in
 * @p target.
 *
 * @return `true`/`false`, or `std::nullopt` when either branch is missing.
 */
std::optional<bool> is_branch_merged(const fs::path& repo, const std::string& branch,
                                     const std::string& target, std::string* error = nullptr);

/**
 * @brief List commits reachable from @p tip but not from @p base.
 *
 * @param repo  Repository path.
 * @param base  Branch or revision excluded from the walk.
 * @param tip   Branch or revision whose history is walked.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Hashes ordered oldest first, or `std::nullopt` on error.
 */
std::optional<std::vector<std::string>> commits_between(const fs::path& repo,
                                                        const std::string& base,
                                                        const std::string& tip,
                                                        std::string* error = nullptr);

/**
 * @brief Find commits on any local branch whose message contains @p tag.
 *
 * @return Matching hashes, newest first. Empty on error.
 */
std::vector<std::string> find_commits_with_tag(const fs::path& repo, const std::string& tag);

/**
 * @brief Check if there are uncommitted changes in the checkout.
 *
 * Untracked files count; ignored files do not.
 */
bool has_uncommitted_changes(const fs::path& repo);

/** Result of a `git` command line invocation. */
struct GitResult {
    int exit_code = -1;
    std::string out;
    std::string err;
    bool ok() const { return exit_code == 0; }
    /** @return stderr if present, otherwise stdout, trimmed. */
    std::string message() const;
};

/**
 * @brief Run the `git` executable inside @p cwd.
 *
 * Used for worktree, merge and rebase plumbing that libgit2 does not cover.
 * Interactive prompts are disabled and `GIT_EDITOR` is set to `true`.
 *
 * @param cwd  Directory passed to `git -C`.
 * @param args Arguments following `git -C <cwd>`.
 * @param env  Extra environment variables for the child.
 */
GitResult run_git(const fs::path& cwd, const std::vector<std::string>& args,
                  const std::map<std::string, std::string>& env = {});

} // namespace git

#endif // GIT_UTILS_HPP
