#include "spec.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include "time_utils.hpp"

namespace specflow {

void RetryState::record_attempt(std::uint64_t next_delay_ms) {
    std::uint64_t now = epoch_millis();
    ++attempts;
    last_retry_time = now;
    next_retry_time = now + next_delay_ms;
}

std::uint64_t calculate_backoff_delay(std::size_t attempt, std::uint64_t base_delay_ms,
                                      double multiplier) {
    double delay = static_cast<double>(base_delay_ms) *
                   std::pow(std::max(multiplier, 1.0), static_cast<double>(attempt));
    if (!std::isfinite(delay) || delay > static_cast<double>(MAX_RETRY_DELAY_MS))
        return MAX_RETRY_DELAY_MS;
    return static_cast<std::uint64_t>(delay);
}

const char* to_string(SpecStatus status) {
    switch (status) {
    case SpecStatus::Pending:
        return "pending";
    case SpecStatus::InProgress:
        return "in_progress";
    case SpecStatus::Completed:
        return "completed";
    case SpecStatus::Failed:
        return "failed";
    case SpecStatus::NeedsAttention:
        return "needs_attention";
    case SpecStatus::Blocked:
        return "blocked";
    case SpecStatus::Paused:
        return "paused";
    case SpecStatus::Cancelled:
        return "cancelled";
    case SpecStatus::Ready:
        return "ready";
    }
    return "pending";
}

const char* to_string(SpecType type) {
    switch (type) {
    case SpecType::Code:
        return "code";
    case SpecType::Task:
        return "task";
    case SpecType::Driver:
        return "driver";
    case SpecType::Group:
        return "group";
    case SpecType::Documentation:
        return "documentation";
    case SpecType::Research:
        return "research";
    }
    return "code";
}

const char* to_string(ApprovalStatus status) {
    switch (status) {
    case ApprovalStatus::Pending:
        return "pending";
    case ApprovalStatus::Approved:
        return "approved";
    case ApprovalStatus::Rejected:
        return "rejected";
    }
    return "pending";
}

static std::string normalize_key(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '-')
            out += '_';
        else
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::optional<SpecStatus> parse_status(const std::string& text) {
    static const SpecStatus all[] = {SpecStatus::Pending,        SpecStatus::InProgress,
                                     SpecStatus::Completed,      SpecStatus::Failed,
                                     SpecStatus::NeedsAttention, SpecStatus::Blocked,
                                     SpecStatus::Paused,         SpecStatus::Cancelled,
                                     SpecStatus::Ready};
    std::string key = normalize_key(text);
    for (SpecStatus s : all) {
        if (key == to_string(s))
            return s;
    }
    return std::nullopt;
}

std::optional<SpecType> parse_type(const std::string& text) {
    static const SpecType all[] = {SpecType::Code,  SpecType::Task,          SpecType::Driver,
                                   SpecType::Group, SpecType::Documentation, SpecType::Research};
    std::string key = normalize_key(text);
    for (SpecType t : all) {
        if (key == to_string(t))
            return t;
    }
    return std::nullopt;
}

static std::optional<ApprovalStatus> parse_approval_status(const std::string& text) {
    std::string key = normalize_key(text);
    if (key == "pending")
        return ApprovalStatus::Pending;
    if (key == "approved")
        return ApprovalStatus::Approved;
    if (key == "rejected")
        return ApprovalStatus::Rejected;
    return std::nullopt;
}

static std::vector<std::string> as_string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node || node.IsNull())
        return out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return out;
    }
    if (node.IsSequence()) {
        for (const auto& item : node)
            out.push_back(item.as<std::string>());
    }
    return out;
}

static std::optional<std::string> as_optional_string(const YAML::Node& node) {
    if (!node || node.IsNull())
        return std::nullopt;
    return node.as<std::string>();
}

// Line helpers used by the checkbox and title scanners.

struct LineRef {
    std::size_t begin;
    std::size_t end; ///< Exclusive, before the newline.
};

static std::vector<LineRef> split_lines(const std::string& text) {
    std::vector<LineRef> lines;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t nl = text.find('\n', pos);
        if (nl == std::string::npos) {
            if (pos < text.size())
                lines.push_back({pos, text.size()});
            break;
        }
        lines.push_back({pos, nl});
        pos = nl + 1;
    }
    return lines;
}

static std::string trimmed(const std::string& text, const LineRef& line) {
    std::size_t b = line.begin;
    std::size_t e = line.end;
    while (b < e && std::isspace(static_cast<unsigned char>(text[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1])))
        --e;
    return text.substr(b, e - b);
}

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

static bool is_fence(const std::string& t) { return starts_with(t, "```"); }

/**
 * @brief Locate the last acceptance criteria section.
 *
 * @return Half-open line range of the section content.
 */
static std::optional<std::pair<std::size_t, std::size_t>>
criteria_section(const std::string& body, const std::vector<LineRef>& lines) {
    bool in_fence = false;
    std::optional<std::size_t> heading;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::string t = trimmed(body, lines[i]);
        if (is_fence(t)) {
            in_fence = !in_fence;
            continue;
        }
        if (!in_fence && starts_with(t, "## Acceptance Criteria"))
            heading = i;
    }
    if (!heading)
        return std::nullopt;
    std::size_t start = *heading + 1;
    std::size_t end = lines.size();
    in_fence = false;
    for (std::size_t i = start; i < lines.size(); ++i) {
        std::string t = trimmed(body, lines[i]);
        if (is_fence(t)) {
            in_fence = !in_fence;
            continue;
        }
        if (!in_fence && starts_with(t, "## ")) {
            end = i;
            break;
        }
    }
    return std::make_pair(start, end);
}

/**
 * @brief Visit every unchecked box of the criteria section.
 *
 * @p fn receives the offset of the `[` character.
 */
template <typename Fn> static std::size_t for_each_unchecked(const std::string& body, Fn fn) {
    auto lines = split_lines(body);
    auto section = criteria_section(body, lines);
    if (!section)
        return 0;
    std::size_t count = 0;
    bool in_fence = false;
    for (std::size_t i = section->first; i < section->second; ++i) {
        std::string t = trimmed(body, lines[i]);
        if (is_fence(t)) {
            in_fence = !in_fence;
            continue;
        }
        if (in_fence || !starts_with(t, "- [ ]"))
            continue;
        std::size_t pos = body.find("- [ ]", lines[i].begin);
        fn(pos + 2);
        ++count;
    }
    return count;
}

bool has_acceptance_criteria(const std::string& body) {
    return criteria_section(body, split_lines(body)).has_value();
}

std::size_t count_unchecked_checkboxes(const std::string& body) {
    return for_each_unchecked(body, [](std::size_t) {});
}

std::size_t auto_check_acceptance_criteria(std::string& body) {
    std::vector<std::size_t> positions;
    std::size_t n = for_each_unchecked(body, [&](std::size_t p) { positions.push_back(p); });
    for (std::size_t p : positions)
        body[p + 1] = 'x';
    return n;
}

std::optional<std::string> extract_title(const std::string& body) {
    bool in_fence = false;
    for (const auto& line : split_lines(body)) {
        std::string t = trimmed(body, line);
        if (is_fence(t)) {
            in_fence = !in_fence;
            continue;
        }
        if (!in_fence && starts_with(t, "# ")) {
            std::string title = t.substr(2);
            std::size_t b = title.find_first_not_of(' ');
            return b == std::string::npos ? std::string() : title.substr(b);
        }
    }
    return std::nullopt;
}

bool requires_approval(const Spec& spec) {
    return spec.approval && spec.approval->required &&
           spec.approval->status != ApprovalStatus::Approved;
}

void append_agent_output(Spec& spec, const std::string& output, std::size_t max_bytes) {
    std::string text = output;
    if (text.size() > max_bytes)
        text = "... (output truncated)\n" + text.substr(text.size() - max_bytes);
    if (!text.empty() && text.back() != '\n')
        text += '\n';
    std::string& body = spec.body;
    if (!body.empty() && body.back() != '\n')
        body += '\n';
    body += "\n## Agent Output\n\n" + rfc3339_now() + "\n\n```text\n" + text + "```\n";
}

std::optional<Spec> parse_spec(const std::string& id, const std::string& content,
                               std::string* error) {
    Spec spec;
    spec.id = id;

    std::string header_text;
    bool has_header = starts_with(content, "---\n") || starts_with(content, "---\r\n");
    if (has_header) {
        std::size_t start = content.find('\n') + 1;
        std::size_t pos = start;
        std::size_t close = std::string::npos;
        std::size_t body_start = content.size();
        while (pos <= content.size()) {
            std::size_t nl = content.find('\n', pos);
            std::size_t line_end = nl == std::string::npos ? content.size() : nl;
            std::string line = content.substr(pos, line_end - pos);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line == "---") {
                close = pos;
                body_start = nl == std::string::npos ? content.size() : nl + 1;
                break;
            }
            if (nl == std::string::npos)
                break;
            pos = nl + 1;
        }
        if (close == std::string::npos) {
            if (error)
                *error = "Unterminated frontmatter in spec " + id;
            return std::nullopt;
        }
        header_text = content.substr(start, close - start);
        spec.body = content.substr(body_start);
    } else {
        spec.body = content;
    }

    try {
        YAML::Node root = header_text.empty() ? YAML::Node() : YAML::Load(header_text);
        if (!root || root.IsNull())
            root = YAML::Node(YAML::NodeType::Map);
        if (!root.IsMap()) {
            if (error)
                *error = "Frontmatter of spec " + id + " is not a map";
            return std::nullopt;
        }
        spec.header = root;

        if (auto v = as_optional_string(root["status"])) {
            auto s = parse_status(*v);
            if (!s) {
                if (error)
                    *error = "Unknown status '" + *v + "' in spec " + id;
                return std::nullopt;
            }
            // `ready` is computed, never stored; a hand-edited file carrying it is Pending.
            spec.status = *s == SpecStatus::Ready ? SpecStatus::Pending : *s;
        }
        if (auto v = as_optional_string(root["type"])) {
            auto t = parse_type(*v);
            if (!t) {
                if (error)
                    *error = "Unknown type '" + *v + "' in spec " + id;
                return std::nullopt;
            }
            spec.type = *t;
        }
        spec.depends_on = as_string_list(root["depends_on"]);
        spec.members = as_string_list(root["members"]);
        spec.labels = as_string_list(root["labels"]);
        spec.commits = as_string_list(root["commits"]);
        spec.branch = as_optional_string(root["branch"]);
        spec.completed_at = as_optional_string(root["completed_at"]);
        spec.model = as_optional_string(root["model"]);

        const YAML::Node approval = root["approval"];
        if (approval && approval.IsMap()) {
            Approval a;
            if (approval["required"])
                a.required = approval["required"].as<bool>();
            if (auto st = as_optional_string(approval["status"])) {
                auto parsed = parse_approval_status(*st);
                if (!parsed) {
                    if (error)
                        *error = "Unknown approval status '" + *st + "' in spec " + id;
                    return std::nullopt;
                }
                a.status = *parsed;
            }
            a.by = as_optional_string(approval["by"]).value_or("");
            a.at = as_optional_string(approval["at"]).value_or("");
            spec.approval = a;
        }

        const YAML::Node retry = root["retry_state"];
        if (retry && retry.IsMap()) {
            RetryState r;
            if (retry["attempts"])
                r.attempts = retry["attempts"].as<std::uint64_t>();
            if (retry["last_retry_time"])
                r.last_retry_time = retry["last_retry_time"].as<std::uint64_t>();
            if (retry["next_retry_time"])
                r.next_retry_time = retry["next_retry_time"].as<std::uint64_t>();
            spec.retry_state = r;
        }
    } catch (const std::exception& e) {
        if (error)
            *error = "Failed to parse frontmatter of spec " + id + ": " + e.what();
        return std::nullopt;
    }

    spec.title = extract_title(spec.body);
    return spec;
}

static void set_list(YAML::Node& n, const char* key, const std::vector<std::string>& values) {
    if (values.empty())
        n.remove(key);
    else
        n[key] = values;
}

static void set_optional(YAML::Node& n, const char* key, const std::optional<std::string>& v) {
    if (v)
        n[key] = *v;
    else
        n.remove(key);
}

std::string serialize_spec(const Spec& spec) {
    YAML::Node n = spec.header && spec.header.IsMap() ? YAML::Clone(spec.header)
                                                      : YAML::Node(YAML::NodeType::Map);
    if (n["type"] || spec.type != SpecType::Code)
        n["type"] = to_string(spec.type);
    n["status"] = to_string(spec.status);
    set_list(n, "depends_on", spec.depends_on);
    set_list(n, "members", spec.members);
    set_list(n, "labels", spec.labels);
    set_optional(n, "branch", spec.branch);

    if (spec.approval) {
        YAML::Node a = n["approval"] && n["approval"].IsMap() ? YAML::Node(n["approval"])
                                                              : YAML::Node(YAML::NodeType::Map);
        a["required"] = spec.approval->required;
        a["status"] = to_string(spec.approval->status);
        if (spec.approval->by.empty())
            a.remove("by");
        else
            a["by"] = spec.approval->by;
        if (spec.approval->at.empty())
            a.remove("at");
        else
            a["at"] = spec.approval->at;
        n["approval"] = a;
    } else {
        n.remove("approval");
    }

    set_list(n, "commits", spec.commits);
    set_optional(n, "completed_at", spec.completed_at);
    set_optional(n, "model", spec.model);

    if (spec.retry_state) {
        YAML::Node r(YAML::NodeType::Map);
        r["attempts"] = spec.retry_state->attempts;
        r["last_retry_time"] = spec.retry_state->last_retry_time;
        r["next_retry_time"] = spec.retry_state->next_retry_time;
        n["retry_state"] = r;
    } else {
        n.remove("retry_state");
    }

    YAML::Emitter out;
    out << n;
    return std::string("---\n") + out.c_str() + "\n---\n" + spec.body;
}

} // namespace specflow
