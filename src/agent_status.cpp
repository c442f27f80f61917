#include "agent_status.hpp"
#include <fstream>
#include <system_error>
#include <nlohmann/json.hpp>
#include "layout.hpp"
#include "time_utils.hpp"

namespace specflow {

using json = nlohmann::json;

const char* to_string(AgentState state) {
    switch (state) {
    case AgentState::Working:
        return "working";
    case AgentState::Done:
        return "done";
    case AgentState::Failed:
        return "failed";
    }
    return "working";
}

std::optional<AgentState> parse_agent_state(const std::string& text) {
    if (text == "working")
        return AgentState::Working;
    if (text == "done")
        return AgentState::Done;
    if (text == "failed")
        return AgentState::Failed;
    return std::nullopt;
}

std::filesystem::path status_file_path(const std::filesystem::path& worktree) {
    return worktree / STATE_DIR_NAME / "status.json";
}

AgentStatus make_agent_status(const std::string& spec_id, AgentState state,
                              std::optional<std::string> error,
                              std::vector<std::string> commits) {
    AgentStatus s;
    s.spec_id = spec_id;
    s.status = state;
    s.updated_at = rfc3339_now();
    s.error = std::move(error);
    s.commits = std::move(commits);
    return s;
}

StatusRead read_agent_status(const std::filesystem::path& path, AgentStatus& out,
                             std::string* error) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return StatusRead::Missing;
    std::ifstream ifs(path);
    if (!ifs) {
        if (error)
            *error = "Failed to open " + path.string();
        return StatusRead::Corrupt;
    }
    try {
        json j = json::parse(ifs);
        AgentStatus s;
        s.spec_id = j.at("spec_id").get<std::string>();
        std::string state = j.at("status").get<std::string>();
        auto parsed = parse_agent_state(state);
        if (!parsed) {
            if (error)
                *error = "Failed to parse status file " + path.string() + ": unknown status '" +
                         state + "'";
            return StatusRead::Corrupt;
        }
        s.status = *parsed;
        s.updated_at = j.at("updated_at").get<std::string>();
        if (j.contains("error") && !j["error"].is_null())
            s.error = j["error"].get<std::string>();
        if (j.contains("commits"))
            s.commits = j["commits"].get<std::vector<std::string>>();
        out = std::move(s);
        return StatusRead::Ok;
    } catch (const std::exception& e) {
        if (error)
            *error = "Failed to parse status file " + path.string() + ": " + e.what();
        return StatusRead::Corrupt;
    }
}

bool write_agent_status(const std::filesystem::path& path, const AgentStatus& status,
                        std::string& error) {
    json j;
    j["spec_id"] = status.spec_id;
    j["status"] = to_string(status.status);
    j["updated_at"] = status.updated_at;
    if (status.error)
        j["error"] = *status.error;
    if (!status.commits.empty())
        j["commits"] = status.commits;

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            error = "Failed to open " + tmp.string();
            return false;
        }
        ofs << j.dump(2) << '\n';
        if (!ofs) {
            error = "Failed to write " + tmp.string();
            return false;
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        error = "Failed to replace " + path.string() + ": " + ec.message();
        return false;
    }
    return true;
}

bool is_stale(const AgentStatus& status, std::chrono::seconds threshold,
              std::chrono::system_clock::time_point now) {
    auto updated = parse_rfc3339(status.updated_at);
    if (!updated)
        return true;
    return now - *updated > threshold;
}

} // namespace specflow
