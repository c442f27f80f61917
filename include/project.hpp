#ifndef SPECFLOW_PROJECT_HPP
#define SPECFLOW_PROJECT_HPP

#include <filesystem>
#include <string>
#include "layout.hpp"
#include "options.hpp"
#include "spec_store.hpp"
#include "worktree.hpp"

namespace specflow {

/**
 * @brief A repository root together with its configuration, spec store and
 * worktree manager.
 */
class Project {
  public:
    Project(std::filesystem::path root, Options opts)
        : root_(std::move(root)), opts_(std::move(opts)), store_(specs_dir(root_)),
          worktrees_(root_, opts_.worktree) {}

    const std::filesystem::path& root() const { return root_; }
    const Options& options() const { return opts_; }
    const SpecStore& store() const { return store_; }
    WorktreeManager& worktrees() { return worktrees_; }
    const WorktreeManager& worktrees() const { return worktrees_; }

    /** The spec's branch override, or `<branch_prefix><id>`. */
    std::string branch_for(const Spec& spec) const {
        return spec.branch ? *spec.branch : opts_.branch_prefix + spec.id;
    }

  private:
    std::filesystem::path root_;
    Options opts_;
    SpecStore store_;
    WorktreeManager worktrees_;
};

} // namespace specflow

#endif // SPECFLOW_PROJECT_HPP
