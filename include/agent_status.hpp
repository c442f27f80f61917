#ifndef SPECFLOW_AGENT_STATUS_HPP
#define SPECFLOW_AGENT_STATUS_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace specflow {

enum class AgentState { Working, Done, Failed };

/**
 * @brief Progress record an agent writes to `<worktree>/.specflow/status.json`.
 */
struct AgentStatus {
    std::string spec_id;
    AgentState status = AgentState::Working;
    std::string updated_at; ///< RFC3339 UTC.
    std::optional<std::string> error;
    std::vector<std::string> commits;
};

enum class StatusRead {
    Ok,      ///< Record parsed.
    Missing, ///< No status yet.
    Corrupt  ///< File exists but cannot be parsed.
};

const char* to_string(AgentState state);
std::optional<AgentState> parse_agent_state(const std::string& text);

/** Location of the status file inside @p worktree. */
std::filesystem::path status_file_path(const std::filesystem::path& worktree);

/** Build a record stamped with the current time. */
AgentStatus make_agent_status(const std::string& spec_id, AgentState state,
                              std::optional<std::string> error = std::nullopt,
                              std::vector<std::string> commits = {});

/**
 * @brief Read a status file.
 *
 * @param path  Status file location.
 * @param out   Receives the record when the result is `Ok`.
 * @param error Optional output; for `Corrupt` it mentions the parse failure.
 */
StatusRead read_agent_status(const std::filesystem::path& path, AgentStatus& out,
                             std::string* error = nullptr);

/**
 * @brief Replace the status file atomically (`<path>.tmp` then rename).
 */
bool write_agent_status(const std::filesystem::path& path, const AgentStatus& status,
                        std::string& error);

/**
 * @brief Whether @p status was last updated more than @p threshold before
 * @p now. Records with an unreadable timestamp count as stale.
 */
bool is_stale(const AgentStatus& status, std::chrono::seconds threshold,
              std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

} // namespace specflow

#endif // SPECFLOW_AGENT_STATUS_HPP
