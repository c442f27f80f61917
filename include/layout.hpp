#ifndef SPECFLOW_LAYOUT_HPP
#define SPECFLOW_LAYOUT_HPP

#include <filesystem>
#include <string>

namespace specflow {

/** State directory created inside the repository root and every worktree. */
constexpr const char* STATE_DIR_NAME = ".specflow";

/** Prefix of commit subjects attributed to a spec: `specflow(<id>): ...`. */
inline std::string commit_tag(const std::string& spec_id) { return "specflow(" + spec_id + "):"; }

inline std::filesystem::path state_dir(const std::filesystem::path& root) {
    return root / STATE_DIR_NAME;
}
inline std::filesystem::path specs_dir(const std::filesystem::path& root) {
    return state_dir(root) / "specs";
}
inline std::filesystem::path locks_dir(const std::filesystem::path& root) {
    return state_dir(root) / "locks";
}
inline std::filesystem::path pids_dir(const std::filesystem::path& root) {
    return state_dir(root) / "pids";
}
inline std::filesystem::path logs_dir(const std::filesystem::path& root) {
    return state_dir(root) / "logs";
}
inline std::filesystem::path store_dir(const std::filesystem::path& root) {
    return state_dir(root) / "store";
}
inline std::filesystem::path lock_path(const std::filesystem::path& root, const std::string& id) {
    return locks_dir(root) / (id + ".lock");
}
inline std::filesystem::path pid_path(const std::filesystem::path& root, const std::string& id) {
    return pids_dir(root) / (id + ".pid");
}
inline std::filesystem::path agent_log_path(const std::filesystem::path& root,
                                            const std::string& id) {
    return logs_dir(root) / (id + ".log");
}

/**
 * @brief Create the state directory tree under @p root.
 *
 * A `.gitignore` containing `*` keeps state files out of commits.
 *
 * @return `false` with @p error set if a directory could not be created.
 */
bool ensure_layout(const std::filesystem::path& root, std::string& error);

} // namespace specflow

#endif // SPECFLOW_LAYOUT_HPP
