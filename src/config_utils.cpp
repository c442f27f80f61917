#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>
#include "agent_rotation.hpp"
#include "parse_utils.hpp"

namespace specflow {

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    // Scalars keep their source text; validation happens in apply_config.
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

bool load_yaml_config(const std::string& path, ConfigValues& out, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string section = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (!node.IsMap()) {
                std::string s;
                if (to_string_value(node, s))
                    out.values[section] = s;
                continue;
            }
            for (auto it2 = node.begin(); it2 != node.end(); ++it2) {
                if (!it2->first.IsScalar())
                    continue;
                const std::string key = it2->first.as<std::string>();
                const YAML::Node& val = it2->second;
                if (section == "parallel" && key == "agents") {
                    if (!val.IsSequence()) {
                        error = "parallel.agents must be a list";
                        return false;
                    }
                    for (const auto& agent : val) {
                        if (!agent.IsMap()) {
                            error = "Each agent must be a map";
                            return false;
                        }
                        std::map<std::string, std::string> fields;
                        for (auto a = agent.begin(); a != agent.end(); ++a) {
                            std::string s;
                            if (a->first.IsScalar() && to_string_value(a->second, s))
                                fields[a->first.as<std::string>()] = s;
                        }
                        out.agents.push_back(std::move(fields));
                    }
                    continue;
                }
                std::string s;
                if (to_string_value(val, s))
                    out.values[section + "." + key] = s;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, ConfigValues& out, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const std::string section = it.key();
            const auto& node = it.value();
            if (!node.is_object()) {
                std::string s;
                if (to_string_value(node, s))
                    out.values[section] = s;
                continue;
            }
            for (auto sub = node.begin(); sub != node.end(); ++sub) {
                const auto& val = sub.value();
                if (section == "parallel" && sub.key() == "agents") {
                    if (!val.is_array()) {
                        error = "parallel.agents must be a list";
                        return false;
                    }
                    for (const auto& agent : val) {
                        if (!agent.is_object()) {
                            error = "Each agent must be an object";
                            return false;
                        }
                        std::map<std::string, std::string> fields;
                        for (auto a = agent.begin(); a != agent.end(); ++a) {
                            std::string s;
                            if (to_string_value(a.value(), s))
                                fields[a.key()] = s;
                        }
                        out.agents.push_back(std::move(fields));
                    }
                    continue;
                }
                std::string s;
                if (to_string_value(val, s))
                    out.values[section + "." + sub.key()] = s;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

namespace {

/** Reads typed values out of a ConfigValues map, remembering the first error. */
struct ValueReader {
    const std::map<std::string, std::string>& values;
    std::string& error;

    const std::string* find(const std::string& key) const {
        auto it = values.find(key);
        return it == values.end() ? nullptr : &it->second;
    }

    bool fail(const std::string& key, const std::string& value) {
        error = "Invalid value for " + key + ": '" + value + "'";
        return false;
    }

    bool read(const std::string& key, std::string& out) {
        if (const auto* v = find(key))
            out = *v;
        return true;
    }

    bool read(const std::string& key, size_t& out, size_t min = 0,
              size_t max = std::numeric_limits<size_t>::max()) {
        const auto* v = find(key);
        if (!v)
            return true;
        bool ok = false;
        size_t n = parse_size_t(*v, min, max, ok);
        if (!ok)
            return fail(key, *v);
        out = n;
        return true;
    }

    bool read(const std::string& key, bool& out) {
        const auto* v = find(key);
        if (!v)
            return true;
        bool ok = false;
        bool b = parse_bool(*v, ok);
        if (!ok)
            return fail(key, *v);
        out = b;
        return true;
    }

    bool read(const std::string& key, std::chrono::milliseconds& out) {
        size_t ms = static_cast<size_t>(out.count());
        if (!read(key, ms))
            return false;
        out = std::chrono::milliseconds(ms);
        return true;
    }
};

bool apply_agent(const std::map<std::string, std::string>& fields, AgentConfig& agent,
                 std::string& error) {
    ValueReader r{fields, error};
    size_t weight = agent.weight;
    if (!r.read("name", agent.name) || !r.read("command", agent.command) ||
        !r.read("max_concurrent", agent.max_concurrent, 1) ||
        !r.read("weight", weight, 0, std::numeric_limits<unsigned int>::max()))
        return false;
    agent.weight = static_cast<unsigned int>(weight);
    if (agent.name.empty() || agent.command.empty()) {
        error = "Agents need a name and a command";
        return false;
    }
    return true;
}

} // namespace

bool apply_config(const ConfigValues& cfg, Options& opts, std::string& error) {
    ValueReader r{cfg.values, error};

    if (!r.read("defaults.main_branch", opts.main_branch) ||
        !r.read("defaults.branch_prefix", opts.branch_prefix))
        return false;
    if (const auto* v = r.find("defaults.rotation_strategy")) {
        auto strategy = parse_rotation_strategy(*v);
        if (!strategy)
            return r.fail("defaults.rotation_strategy", *v);
        opts.rotation = *strategy;
    }

    if (!r.read("parallel.stagger_delay_ms", opts.parallel.stagger_delay) ||
        !r.read("parallel.stagger_jitter_ms", opts.parallel.stagger_jitter) ||
        !r.read("parallel.max_parallel", opts.parallel.max_parallel) ||
        !r.read("parallel.allow_no_commits", opts.parallel.allow_no_commits))
        return false;
    if (!cfg.agents.empty()) {
        std::vector<AgentConfig> agents;
        for (const auto& fields : cfg.agents) {
            AgentConfig agent;
            if (!apply_agent(fields, agent, error))
                return false;
            agents.push_back(agent);
        }
        opts.parallel.agents = std::move(agents);
    }

    std::string worktree_root;
    if (!r.read("worktree.root", worktree_root) || !r.read("worktree.prefix", opts.worktree.prefix) ||
        !r.read("worktree.rebase", opts.worktree.rebase))
        return false;
    if (!worktree_root.empty())
        opts.worktree.root = worktree_root;
    if (opts.worktree.prefix.empty()) {
        error = "worktree.prefix must not be empty";
        return false;
    }

    if (const auto* v = r.find("recovery.stale_after_seconds")) {
        bool ok = false;
        auto secs = parse_duration(*v, ok);
        if (!ok)
            return r.fail("recovery.stale_after_seconds", *v);
        opts.recovery.stale_after = secs;
    }

    if (!r.read("retry.max_retries", opts.retry.max_retries) ||
        !r.read("retry.retry_delay_ms", opts.retry.retry_delay))
        return false;
    if (const auto* v = r.find("retry.backoff_multiplier")) {
        bool ok = false;
        double m = parse_double(*v, 1.0, 100.0, ok);
        if (!ok)
            return r.fail("retry.backoff_multiplier", *v);
        opts.retry.backoff_multiplier = m;
    }

    if (const auto* v = r.find("logging.level")) {
        if (!parse_log_level(*v, opts.logging.log_level))
            return r.fail("logging.level", *v);
    }
    if (const auto* v = r.find("logging.max_size")) {
        bool ok = false;
        size_t bytes = parse_bytes(*v, ok);
        if (!ok)
            return r.fail("logging.max_size", *v);
        opts.logging.max_log_size = bytes;
    }
    if (!r.read("logging.path", opts.logging.log_file) ||
        !r.read("logging.max_files", opts.logging.max_log_files, 1) ||
        !r.read("logging.json", opts.logging.json_log) ||
        !r.read("logging.compress", opts.logging.compress_logs) ||
        !r.read("logging.syslog", opts.logging.use_syslog))
        return false;
    return true;
}

bool load_config_file(const std::string& path, Options& opts, std::string& error) {
    std::string ext;
    auto pos = path.find_last_of('.');
    if (pos != std::string::npos)
        ext = path.substr(pos + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    ConfigValues values;
    bool ok = ext == "json" ? load_json_config(path, values, error)
                            : load_yaml_config(path, values, error);
    if (!ok) {
        error = path + ": " + error;
        return false;
    }
    return apply_config(values, opts, error);
}

} // namespace specflow
