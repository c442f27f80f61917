#include "test_common.hpp"
#include "dependency_graph.hpp"

using namespace specflow;

TEST_CASE("parse_spec reads frontmatter and body") {
    const std::string text = "---\n"
                             "status: in-progress\n"
                             "type: task\n"
                             "depends_on: [a, b]\n"
                             "labels: backend\n"
                             "model: main\n"
                             "---\n"
                             "# Add parser\n\nSome text\n";
    std::string err;
    auto spec = parse_spec("2026-01-01-001-abc", text, &err);
    REQUIRE(spec);
    REQUIRE(spec->id == "2026-01-01-001-abc");
    REQUIRE(spec->status == SpecStatus::InProgress);
    REQUIRE(spec->type == SpecType::Task);
    REQUIRE(spec->depends_on == std::vector<std::string>{"a", "b"});
    REQUIRE(spec->labels == std::vector<std::string>{"backend"});
    REQUIRE(spec->model.value_or("") == "main");
    REQUIRE(spec->title.value_or("") == "Add parser");
    REQUIRE(spec->body == "# Add parser\n\nSome text\n");
}

TEST_CASE("parse_spec without frontmatter defaults to pending code") {
    auto spec = parse_spec("x", "# Title only\n");
    REQUIRE(spec);
    REQUIRE(spec->status == SpecStatus::Pending);
    REQUIRE(spec->type == SpecType::Code);
    REQUIRE(spec->title.value_or("") == "Title only");
}

TEST_CASE("parse_spec handles CRLF frontmatter") {
    auto spec = parse_spec("x", "---\r\nstatus: completed\r\n---\r\n# T\r\n");
    REQUIRE(spec);
    REQUIRE(spec->status == SpecStatus::Completed);
}

TEST_CASE("A stored ready status loads and saves as pending") {
    auto spec = parse_spec("x1", "---\nstatus: ready\n---\n# X\n");
    REQUIRE(spec);
    REQUIRE(spec->status == SpecStatus::Pending);
    REQUIRE(is_ready(*spec, {*spec}));
    std::string out = serialize_spec(*spec);
    REQUIRE(out.find("status: pending") != std::string::npos);
    REQUIRE(out.find("status: ready") == std::string::npos);
}

TEST_CASE("parse_spec reports errors") {
    std::string err;
    REQUIRE_FALSE(parse_spec("x", "---\nstatus: pending\n# no close\n", &err));
    REQUIRE(err.find("Unterminated frontmatter") != std::string::npos);

    err.clear();
    REQUIRE_FALSE(parse_spec("x", "---\nstatus: sleeping\n---\n", &err));
    REQUIRE(err.find("Unknown status") != std::string::npos);

    err.clear();
    REQUIRE_FALSE(parse_spec("x", "---\nstatus: [unclosed\n---\n", &err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("serialize_spec keeps unknown fields and round trips") {
    const std::string text = "---\n"
                             "status: pending\n"
                             "owner: alice\n"
                             "approval:\n"
                             "  required: true\n"
                             "  status: pending\n"
                             "---\n"
                             "# Keep me\n";
    auto spec = parse_spec("keep", text);
    REQUIRE(spec);
    REQUIRE(requires_approval(*spec));
    spec->status = SpecStatus::Completed;
    spec->completed_at = "2026-01-02T03:04:05Z";
    spec->commits = {"abc123"};

    std::string out = serialize_spec(*spec);
    REQUIRE(out.rfind("---\n", 0) == 0);
    REQUIRE(out.find("owner: alice") != std::string::npos);
    REQUIRE(out.find("type:") == std::string::npos);

    auto again = parse_spec("keep", out);
    REQUIRE(again);
    REQUIRE(again->status == SpecStatus::Completed);
    REQUIRE(again->completed_at.value_or("") == "2026-01-02T03:04:05Z");
    REQUIRE(again->commits == std::vector<std::string>{"abc123"});
    REQUIRE(again->header["owner"].as<std::string>() == "alice");
    REQUIRE(again->body == "# Keep me\n");
}

TEST_CASE("serialize_spec drops cleared optional fields") {
    auto spec = parse_spec("x", "---\nstatus: failed\nbranch: custom\nmodel: m\n---\n# X\n");
    REQUIRE(spec);
    spec->branch.reset();
    spec->model.reset();
    std::string out = serialize_spec(*spec);
    REQUIRE(out.find("branch") == std::string::npos);
    REQUIRE(out.find("model") == std::string::npos);
}

TEST_CASE("Acceptance criteria checkboxes") {
    std::string body = "# T\n\n"
                       "- [ ] outside the section\n"
                       "## Acceptance Criteria\n\n"
                       "- [ ] first\n"
                       "- [x] done\n"
                       "```\n"
                       "- [ ] inside fence\n"
                       "```\n"
                       "- [ ] second\n"
                       "## Notes\n"
                       "- [ ] not a criterion\n";
    REQUIRE(has_acceptance_criteria(body));
    REQUIRE(count_unchecked_checkboxes(body) == 2);
    REQUIRE(auto_check_acceptance_criteria(body) == 2);
    REQUIRE(count_unchecked_checkboxes(body) == 0);
    REQUIRE(body.find("- [x] first") != std::string::npos);
    REQUIRE(body.find("- [x] second") != std::string::npos);
    REQUIRE(body.find("- [ ] outside the section") != std::string::npos);
    REQUIRE(body.find("- [ ] inside fence") != std::string::npos);
    REQUIRE(body.find("- [ ] not a criterion") != std::string::npos);
}

TEST_CASE("Body without criteria section has nothing to check") {
    std::string body = "# T\n- [ ] loose\n";
    REQUIRE_FALSE(has_acceptance_criteria(body));
    REQUIRE(count_unchecked_checkboxes(body) == 0);
}

TEST_CASE("extract_title skips fenced headings") {
    REQUIRE(extract_title("```\n# not this\n```\n# Real\n").value_or("") == "Real");
    REQUIRE_FALSE(extract_title("no heading\n"));
}

TEST_CASE("append_agent_output truncates from the front") {
    Spec spec;
    spec.body = "# T";
    append_agent_output(spec, std::string(100, 'a') + "TAIL", 10);
    REQUIRE(spec.body.find("## Agent Output") != std::string::npos);
    REQUIRE(spec.body.find("... (output truncated)") != std::string::npos);
    REQUIRE(spec.body.find("aaaaaaTAIL\n```") != std::string::npos);
}

TEST_CASE("Status and type names parse loosely") {
    REQUIRE(parse_status("In-Progress") == SpecStatus::InProgress);
    REQUIRE(parse_status("NEEDS_ATTENTION") == SpecStatus::NeedsAttention);
    REQUIRE_FALSE(parse_status("nope"));
    REQUIRE(parse_type("Documentation") == SpecType::Documentation);
    REQUIRE(std::string(to_string(SpecStatus::InProgress)) == "in_progress");
}

TEST_CASE("Retry backoff grows and is capped") {
    REQUIRE(calculate_backoff_delay(0, 1000, 2.0) == 1000);
    REQUIRE(calculate_backoff_delay(3, 1000, 2.0) == 8000);
    REQUIRE(calculate_backoff_delay(100, 1000, 2.0) == MAX_RETRY_DELAY_MS);

    RetryState state;
    state.record_attempt(5000);
    REQUIRE(state.attempts == 1);
    REQUIRE(state.next_retry_time == state.last_retry_time + 5000);
}
