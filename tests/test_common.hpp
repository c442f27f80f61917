#pragma once
#include <catch2/catch_test_macros.hpp>
#include "arg_parser.hpp"
#include "git_utils.hpp"
#include "layout.hpp"
#include "logger.hpp"
#include "lock_utils.hpp"
#include "options.hpp"
#include "project.hpp"
#include "spec.hpp"
#include "spec_store.hpp"
#include "time_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <cstdlib>
#include <map>
#include <set>
#include <mutex>
#include <atomic>
#include <thread>
#include <chrono>
#include <string>
#include <vector>
#include <unistd.h>

#if !defined(REDIR)
#define REDIR " > /dev/null 2>&1"
#endif

static inline bool have_git() { return std::system("git --version " REDIR) == 0; }

namespace fs = std::filesystem;

namespace specflow::test_support {
namespace detail {
inline bool remove_once(const fs::path& target, bool recursive, std::error_code& ec) {
    ec.clear();
    if (recursive)
        fs::remove_all(target, ec);
    else
        fs::remove(target, ec);
    return !ec || ec == std::errc::no_such_file_or_directory;
}

inline void remove_with_retry(const fs::path& target, bool recursive) {
    std::error_code ec;
    if (remove_once(target, recursive, ec))
        return;
    INFO("Failed to remove '" << target.string() << "': " << ec.message());
    REQUIRE(false);
}
} // namespace detail

inline void remove_path(const fs::path& target) { detail::remove_with_retry(target, false); }

inline void remove_all(const fs::path& target) { detail::remove_with_retry(target, true); }

/** Fresh directory under the system temp dir, unique per process. */
inline fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / (name + "_" + std::to_string(getpid()));
    remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline int git_cmd(const fs::path& repo, const std::string& args) {
    std::string cmd = "git -C \"" + repo.string() + "\" " + args + REDIR;
    return std::system(cmd.c_str());
}

/**
 * Initialise a repository on branch `main` with one commit and the
 * `.specflow` state directory.
 */
inline void init_git_repo(const fs::path& repo) {
    fs::create_directories(repo);
    REQUIRE(git_cmd(repo, "init") == 0);
    REQUIRE(git_cmd(repo, "symbolic-ref HEAD refs/heads/main") == 0);
    REQUIRE(git_cmd(repo, "config user.email you@example.com") == 0);
    REQUIRE(git_cmd(repo, "config user.name tester") == 0);
    std::ofstream(repo / "README.md") << "hello\n";
    REQUIRE(git_cmd(repo, "add README.md") == 0);
    REQUIRE(git_cmd(repo, "commit -m init") == 0);
    std::string err;
    REQUIRE(specflow::ensure_layout(repo, err));
}

/** Commit @p content to @p file in @p checkout with @p message. */
inline void commit_file(const fs::path& checkout, const std::string& file,
                        const std::string& content, const std::string& message) {
    std::ofstream(checkout / file) << content;
    REQUIRE(git_cmd(checkout, "add \"" + file + "\"") == 0);
    REQUIRE(git_cmd(checkout, "commit -m \"" + message + "\"") == 0);
}

/** Write a spec file directly into @p store. */
inline void write_spec(const specflow::SpecStore& store, const std::string& id,
                       const std::string& frontmatter, const std::string& body) {
    fs::create_directories(store.dir());
    std::ofstream(store.path_for(id)) << "---\n" << frontmatter << "---\n" << body;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream ifs(path);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

/** Options isolated to @p worktree_root with no stagger. */
inline specflow::Options test_options(const fs::path& worktree_root) {
    specflow::Options opts;
    opts.worktree.root = worktree_root;
    opts.parallel.stagger_delay = std::chrono::milliseconds(0);
    opts.parallel.stagger_jitter = std::chrono::milliseconds(0);
    return opts;
}
} // namespace specflow::test_support

#ifndef FS_REMOVE
#define FS_REMOVE(path) ::specflow::test_support::remove_path((path))
#endif
#ifndef FS_REMOVE_ALL
#define FS_REMOVE_ALL(path) ::specflow::test_support::remove_all((path))
#endif
