#ifndef SPECFLOW_SPEC_HPP
#define SPECFLOW_SPEC_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace specflow {

/**
 * @brief Lifecycle state of a spec.
 *
 * `Ready` is a computed label produced by the dependency graph. It is never
 * stored: a file carrying `status: ready` loads as `Pending`, and `Ready` is
 * neither a valid source nor a valid target of a transition.
 */
enum class SpecStatus {
    Pending,        ///< Waiting to be worked on.
    InProgress,     ///< An agent is (or was) working on it.
    Completed,      ///< Merged and finalized.
    Failed,         ///< Execution, validation or merge failed.
    NeedsAttention, ///< Requires a human decision.
    Blocked,        ///< Explicitly parked on unmet dependencies.
    Paused,         ///< Agent stopped by an operator; worktree kept.
    Cancelled,      ///< Abandoned.
    Ready           ///< Computed label only.
};

enum class SpecType { Code, Task, Driver, Group, Documentation, Research };

enum class ApprovalStatus { Pending, Approved, Rejected };

/** Optional approval gate recorded in the header. */
struct Approval {
    bool required = false;
    ApprovalStatus status = ApprovalStatus::Pending;
    std::string by;
    std::string at;
};

/** Bookkeeping for automatic retries; times are milliseconds since the epoch. */
struct RetryState {
    std::uint64_t attempts = 0;
    std::uint64_t last_retry_time = 0;
    std::uint64_t next_retry_time = 0;

    /** Record a failed attempt; the next retry is due @p next_delay_ms from now. */
    void record_attempt(std::uint64_t next_delay_ms);
};

/** Upper bound applied by @ref calculate_backoff_delay. */
constexpr std::uint64_t MAX_RETRY_DELAY_MS = 60ULL * 60ULL * 1000ULL;

/**
 * @brief Exponential backoff: `base_delay_ms * multiplier^attempt`, capped at
 * one hour.
 */
std::uint64_t calculate_backoff_delay(std::size_t attempt, std::uint64_t base_delay_ms,
                                      double multiplier);

/**
 * @brief One unit of schedulable work.
 *
 * Known header fields are mirrored into typed members. `header` keeps the
 * parsed YAML map so that fields this program does not understand survive a
 * load/save cycle in their original order.
 */
struct Spec {
    std::string id;
    SpecType type = SpecType::Code;
    SpecStatus status = SpecStatus::Pending;
    std::vector<std::string> depends_on;
    std::vector<std::string> members;
    std::vector<std::string> labels;
    std::vector<std::string> commits;
    std::optional<std::string> branch;
    std::optional<std::string> completed_at;
    std::optional<std::string> model;
    std::optional<Approval> approval;
    std::optional<RetryState> retry_state;
    std::optional<std::string> title; ///< First `# ` heading of the body.
    std::string body;
    YAML::Node header;

    /** @return `true` if the spec lists member specs. */
    bool is_driver() const { return !members.empty(); }
};

const char* to_string(SpecStatus status);
const char* to_string(SpecType type);
const char* to_string(ApprovalStatus status);

/**
 * @brief Parse a status string such as `in_progress` (hyphens are accepted).
 */
std::optional<SpecStatus> parse_status(const std::string& text);
std::optional<SpecType> parse_type(const std::string& text);

/**
 * @brief Parse a spec file's content.
 *
 * Content without a `---` header is treated as body only and gets default
 * header values.
 *
 * @param id      Identifier of the spec (the file stem).
 * @param content Full file text.
 * @param error   Optional output receiving a parse error.
 * @return Parsed spec or `std::nullopt` on malformed YAML or field values.
 */
std::optional<Spec> parse_spec(const std::string& id, const std::string& content,
                               std::string* error = nullptr);

/**
 * @brief Render a spec back to file text: `---\n<yaml>\n---\n<body>`.
 *
 * Unknown header fields keep their position; the body is emitted verbatim.
 */
std::string serialize_spec(const Spec& spec);

/** @return Text of the first `# ` heading outside code fences. */
std::optional<std::string> extract_title(const std::string& body);

/** @return `true` if the body has a `## Acceptance Criteria` section. */
bool has_acceptance_criteria(const std::string& body);

/**
 * @brief Count `- [ ]` items in the last `## Acceptance Criteria` section.
 *
 * Lines inside fenced code blocks are ignored; the section ends at the next
 * `## ` heading.
 */
std::size_t count_unchecked_checkboxes(const std::string& body);

/**
 * @brief Tick every unchecked item of the acceptance criteria section.
 *
 * @return Number of boxes that were changed.
 */
std::size_t auto_check_acceptance_criteria(std::string& body);

/** @return `true` when approval is required and not yet granted. */
bool requires_approval(const Spec& spec);

/**
 * @brief Append the agent transcript to the body under `## Agent Output`.
 *
 * Output longer than @p max_bytes is truncated from the front.
 */
void append_agent_output(Spec& spec, const std::string& output, std::size_t max_bytes = 16384);

} // namespace specflow

#endif // SPECFLOW_SPEC_HPP
