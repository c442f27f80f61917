#include "agent_rotation.hpp"
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <random>
#include <system_error>
#include <nlohmann/json.hpp>
#include "layout.hpp"
#include "logger.hpp"

namespace specflow {

std::optional<RotationStrategy> parse_rotation_strategy(const std::string& text) {
    std::string key = text;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == '_' ? '-' : static_cast<char>(std::tolower(c));
    });
    if (key == "none")
        return RotationStrategy::None;
    if (key == "random")
        return RotationStrategy::Random;
    if (key == "round-robin" || key == "roundrobin")
        return RotationStrategy::RoundRobin;
    return std::nullopt;
}

const char* to_string(RotationStrategy strategy) {
    switch (strategy) {
    case RotationStrategy::None:
        return "none";
    case RotationStrategy::Random:
        return "random";
    case RotationStrategy::RoundRobin:
        return "round-robin";
    }
    return "none";
}

std::vector<size_t> weighted_agent_list(const std::vector<AgentConfig>& agents) {
    std::vector<size_t> out;
    for (size_t i = 0; i < agents.size(); ++i) {
        unsigned int weight = std::max(agents[i].weight, 1u);
        out.insert(out.end(), weight, i);
    }
    return out;
}

std::filesystem::path rotation_state_path(const std::filesystem::path& root) {
    return store_dir(root) / "rotation.json";
}

std::optional<size_t> load_rotation_state(const std::filesystem::path& path,
                                          std::string* error) {
    std::ifstream ifs(path);
    if (!ifs)
        return std::nullopt;
    try {
        nlohmann::json j = nlohmann::json::parse(ifs);
        return j.at("last_index").get<size_t>();
    } catch (const std::exception& e) {
        if (error)
            *error = "Failed to parse rotation state: " + std::string(e.what());
        return std::nullopt;
    }
}

bool save_rotation_state(const std::filesystem::path& path, size_t last_index,
                         std::string& error) {
    static std::atomic<unsigned long> counter{0};
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::filesystem::path tmp = path;
    tmp += ".tmp." + std::to_string(getpid()) + "." + std::to_string(counter++);
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        ofs << nlohmann::json{{"last_index", last_index}}.dump() << '\n';
        if (!ofs) {
            error = "Failed to write " + tmp.string();
            ofs.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        error = "Failed to replace " + path.string() + ": " + ec.message();
        std::error_code rm_ec;
        std::filesystem::remove(tmp, rm_ec);
        return false;
    }
    return true;
}

std::optional<size_t> select_agent(const std::vector<AgentConfig>& agents,
                                   RotationStrategy strategy,
                                   const std::filesystem::path& state_path) {
    if (agents.empty())
        return std::nullopt;
    auto weighted = weighted_agent_list(agents);
    switch (strategy) {
    case RotationStrategy::None:
        break;
    case RotationStrategy::Random: {
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<size_t> dist(0, weighted.size() - 1);
        return weighted[dist(rng)];
    }
    case RotationStrategy::RoundRobin: {
        std::string err;
        auto last = load_rotation_state(state_path, &err);
        if (!err.empty())
            log_warning(err);
        size_t next = last ? (*last + 1) % weighted.size() : 0;
        if (!save_rotation_state(state_path, next, err))
            log_warning("Could not persist agent rotation", err);
        return weighted[next];
    }
    }
    return 0;
}

} // namespace specflow
