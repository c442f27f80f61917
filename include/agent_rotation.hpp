#ifndef SPECFLOW_AGENT_ROTATION_HPP
#define SPECFLOW_AGENT_ROTATION_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "options.hpp"

namespace specflow {

/** Accepts `none`, `random` and `round-robin` (also `round_robin`). */
std::optional<RotationStrategy> parse_rotation_strategy(const std::string& text);
const char* to_string(RotationStrategy strategy);

/**
 * @brief Expand agents by weight.
 *
 * Each agent index appears `max(weight, 1)` times, in configuration order.
 */
std::vector<size_t> weighted_agent_list(const std::vector<AgentConfig>& agents);

/** `<state_dir>/store/rotation.json` below @p root. */
std::filesystem::path rotation_state_path(const std::filesystem::path& root);

/**
 * @brief Read the persisted round-robin position.
 *
 * @return The stored `last_index`, or `std::nullopt` if absent or unreadable.
 */
std::optional<size_t> load_rotation_state(const std::filesystem::path& path,
                                          std::string* error = nullptr);

/** Persist `{ "last_index": N }` with an atomic rename. */
bool save_rotation_state(const std::filesystem::path& path, size_t last_index,
                         std::string& error);

/**
 * @brief Choose an agent for a single invocation.
 *
 * `None` always picks the first agent, `Random` draws from the weighted list
 * and `RoundRobin` advances the persisted position in @p state_path. A failure
 * to persist the position is logged and does not affect the choice.
 *
 * @return Index into @p agents, or `std::nullopt` when the list is empty.
 */
std::optional<size_t> select_agent(const std::vector<AgentConfig>& agents,
                                   RotationStrategy strategy,
                                   const std::filesystem::path& state_path);

} // namespace specflow

#endif // SPECFLOW_AGENT_ROTATION_HPP
