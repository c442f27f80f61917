#include "test_common.hpp"
#include "cli_commands.hpp"
#include "version.hpp"

using namespace specflow;
using specflow::test_support::make_temp_dir;
using specflow::test_support::write_spec;

namespace {
struct Argv {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;
    explicit Argv(std::initializer_list<std::string> args) : storage(args) {
        for (auto& s : storage)
            ptrs.push_back(s.data());
    }
    int argc() { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }
};

struct CliFixture {
    fs::path root = make_temp_dir("cli_fixture");
    std::unique_ptr<Project> project;

    CliFixture() {
        std::string err;
        REQUIRE(ensure_layout(root, err));
        Options opts = specflow::test_support::test_options(root / "worktrees");
        project = std::make_unique<Project>(root, opts);
        write_spec(project->store(), "2026-01-01-001-base", "status: completed\n", "# Base\n");
        write_spec(project->store(), "2026-01-01-002-next",
                   "status: pending\ndepends_on: [2026-01-01-001-base]\n", "# Next\n");
        write_spec(project->store(), "2026-01-01-003-last",
                   "status: pending\ndepends_on: [2026-01-01-002-next]\n", "# Last\n");
    }
    ~CliFixture() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    int run(cli::CliRequest req, std::string& out, std::string& err) {
        std::ostringstream o;
        std::ostringstream e;
        int rc = cli::run_command(req, *project, o, e);
        out = o.str();
        err = e.str();
        return rc;
    }
};

cli::CliRequest request(const std::string& command, std::vector<std::string> args = {}) {
    cli::CliRequest req;
    req.command = command;
    req.args = std::move(args);
    return req;
}
} // namespace

TEST_CASE("parse_cli reads command, arguments and options") {
    Argv a{"specflow", "work", "s1", "s2", "--parallel", "4", "--root", "/tmp/proj",
           "--log-level", "debug"};
    cli::CliRequest req;
    std::string err;
    REQUIRE(cli::parse_cli(a.argc(), a.argv(), req, err));
    REQUIRE(req.command == "work");
    REQUIRE(req.args == std::vector<std::string>{"s1", "s2"});
    REQUIRE(req.parallel == 4);
    REQUIRE(req.root == fs::path("/tmp/proj"));
    REQUIRE(req.log_level == LogLevel::DEBUG);
}

TEST_CASE("parse_cli rejects bad input") {
    std::string err;
    {
        Argv a{"specflow", "list", "--frobnicate"};
        cli::CliRequest req;
        REQUIRE_FALSE(cli::parse_cli(a.argc(), a.argv(), req, err));
        REQUIRE(err == "Unknown option --frobnicate");
    }
    {
        Argv a{"specflow", "work", "--parallel", "zero"};
        cli::CliRequest req;
        REQUIRE_FALSE(cli::parse_cli(a.argc(), a.argv(), req, err));
    }
    {
        Argv a{"specflow", "list", "--log-level", "chatty"};
        cli::CliRequest req;
        REQUIRE_FALSE(cli::parse_cli(a.argc(), a.argv(), req, err));
    }
}

TEST_CASE("load_options applies overrides on top of the config file") {
    fs::path root = make_temp_dir("cli_options");
    fs::create_directories(state_dir(root));
    std::ofstream(state_dir(root) / "config.yaml") << "defaults:\n  main_branch: trunk\n"
                                                      "parallel:\n  max_parallel: 8\n";
    cli::CliRequest req;
    req.root = root;
    req.parallel = 1;
    Options opts;
    std::string err;
    REQUIRE(cli::load_options(req, opts, err));
    REQUIRE(opts.main_branch == "trunk");
    REQUIRE(opts.parallel.max_parallel == 1);

    req.config_path = (root / "missing.yaml").string();
    REQUIRE_FALSE(cli::load_options(req, opts, err));
    FS_REMOVE_ALL(root);
}

TEST_CASE("list and ready show computed readiness") {
    CliFixture fx;
    std::string out;
    std::string err;
    REQUIRE(fx.run(request("list"), out, err) == 0);
    REQUIRE(out.find("2026-01-01-002-next") != std::string::npos);
    REQUIRE(out.find("ready") != std::string::npos);
    REQUIRE(out.find("blocked") != std::string::npos);

    REQUIRE(fx.run(request("ready"), out, err) == 0);
    REQUIRE(out == "2026-01-01-002-next  Next\n");
}

TEST_CASE("status shows blockers for a partial id") {
    CliFixture fx;
    std::string out;
    std::string err;
    REQUIRE(fx.run(request("status", {"003"}), out, err) == 0);
    REQUIRE(out.find("id:       2026-01-01-003-last") != std::string::npos);
    REQUIRE(out.find("blocked by:") != std::string::npos);
    REQUIRE(out.find("2026-01-01-002-next") != std::string::npos);

    REQUIRE(fx.run(request("status", {"2026"}), out, err) == 1);
    REQUIRE(err.find("Ambiguous") != std::string::npos);
}

TEST_CASE("transition checks and forces") {
    CliFixture fx;
    std::string out;
    std::string err;
    REQUIRE(fx.run(request("transition", {"003", "in_progress"}), out, err) == 1);
    REQUIRE(err.find("Dependencies not met") != std::string::npos);

    REQUIRE(fx.run(request("transition", {"002", "completed"}), out, err) == 1);
    REQUIRE(err.find("Invalid transition") != std::string::npos);

    auto forced = request("transition", {"002", "completed"});
    forced.force = true;
    REQUIRE(fx.run(forced, out, err) == 0);
    REQUIRE(out == "2026-01-01-002-next: pending -> completed\n");
    auto spec = fx.project->store().load("2026-01-01-002-next");
    REQUIRE(spec->status == SpecStatus::Completed);
    REQUIRE(spec->completed_at);

    REQUIRE(fx.run(request("transition", {"003", "ready"}), out, err) == 1);
    REQUIRE(fx.run(request("transition", {"003", "sideways"}), out, err) == 2);
}

TEST_CASE("Unknown command and missing arguments") {
    CliFixture fx;
    std::string out;
    std::string err;
    REQUIRE(fx.run(request("dance"), out, err) == 2);
    REQUIRE(err == "Unknown command 'dance'\n");
    REQUIRE(fx.run(request("pause"), out, err) == 2);
    REQUIRE(fx.run(request("version"), out, err) == 0);
    REQUIRE(out == std::string(SPECFLOW_VERSION) + "\n");
}
