#ifndef SPECFLOW_WORKTREE_HPP
#define SPECFLOW_WORKTREE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "options.hpp"
#include "spec.hpp"

namespace specflow {
namespace fs = std::filesystem;

enum class ConflictType {
    None,
    Content,     ///< Conflicting hunks in one or more files.
    Tree,        ///< modify/delete, rename or file/directory conflicts.
    FastForward, ///< Branches diverged and a fast-forward was required.
    Unknown
};

const char* to_string(ConflictType type);

struct MergeResult {
    bool success = false;
    std::vector<std::string> conflict_files;
    ConflictType conflict_type = ConflictType::None;
    std::string error;
};

/** Snapshot of one worktree directory. */
struct WorktreeInfo {
    std::string name;
    fs::path path;
    std::uintmax_t size_bytes = 0;
    std::uint64_t age_seconds = 0;
    bool is_valid = false; ///< A `.git` marker is present.
};

/**
 * @brief Resolves rebase conflicts inside a worktree.
 *
 * Implementations edit the files and stage them. Paths that are still
 * unmerged afterwards make the merge fail.
 */
class ConflictResolver {
  public:
    virtual ~ConflictResolver() = default;
    virtual bool resolve(const std::string& branch, const std::string& target,
                         const std::vector<std::string>& files, const fs::path& worktree,
                         std::string& error) = 0;
};

/**
 * @brief Classify a failed merge or rebase from its output and unmerged paths.
 */
ConflictType classify_conflict(const std::vector<std::string>& files, const std::string& output);

/**
 * @brief Owns the per-spec git worktrees of one repository.
 */
class WorktreeManager {
  public:
    WorktreeManager(fs::path repo_root, WorktreeOptions opts);

    const fs::path& repo_root() const { return repo_root_; }
    /** Configured root, or the system temporary directory. */
    fs::path worktree_root() const;
    fs::path path_for(const std::string& spec_id) const;
    /** Spec id encoded in a worktree directory name, if it carries the prefix. */
    std::optional<std::string> spec_id_for(const fs::path& worktree) const;

    /**
     * @brief Create a worktree on a new branch.
     *
     * Fails when the branch or the directory already exists.
     *
     * @param spec_id Spec the worktree is for.
     * @param branch  New branch name.
     * @param error   Receives the reason on failure.
     * @param base    Revision the branch starts from.
     * @return Path of the new worktree.
     */
    std::optional<fs::path> create(const std::string& spec_id, const std::string& branch,
                                   std::string& error, const std::string& base = "HEAD") const;

    /** Write @p spec, as InProgress, to `<worktree>/.specflow/specs/<id>.md`. */
    bool copy_spec_into(const fs::path& worktree, const Spec& spec, std::string& error) const;

    /**
     * @brief Merge @p branch into @p target in the main checkout.
     *
     * With @p rebase the branch is first rebased inside its worktree. Conflicts
     * abort the operation and leave branch and worktree untouched. On success
     * the worktree is removed and the branch deleted.
     */
    MergeResult merge_and_cleanup(const std::string& branch, const std::string& target,
                                  bool rebase) const;

    /**
     * @brief Remove a worktree and its directory, then prune.
     *
     * @return `true` if the directory no longer exists.
     */
    bool remove(const fs::path& path, std::string* error = nullptr) const;

    /** Worktrees of this repository under the root carrying the prefix. */
    std::vector<WorktreeInfo> list() const;

    std::optional<fs::path> find_worktree_for_branch(const std::string& branch) const;

    void set_conflict_resolver(std::shared_ptr<ConflictResolver> resolver) {
        resolver_ = std::move(resolver);
    }

  private:
    std::vector<std::string> unmerged_files(const fs::path& checkout) const;
    bool rebase_onto(const fs::path& worktree, const std::string& branch,
                     const std::string& target, MergeResult& result) const;
    bool belongs_to_repo(const fs::path& worktree) const;

    fs::path repo_root_;
    WorktreeOptions opts_;
    std::shared_ptr<ConflictResolver> resolver_;
    mutable std::mutex admin_mtx_; ///< Serializes `git worktree add/remove/prune`.
};

} // namespace specflow

#endif // SPECFLOW_WORKTREE_HPP
