#include <catch2/catch_test_macros.hpp>

#include <querygraph/cli/command_executor.hpp>

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace querygraph;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));
    return test_root + "/testdata/" + filename;
}

struct CliRun {
    int exit_code = 0;
    std::string out;
    std::string err;
};

// Registers every command with a colorless config and dispatches `words`
// as if they followed the program name.
CliRun RunCli(const std::vector<std::string>& words, AppConfig config = {}) {
    if (!config.color.has_value()) {
        config.color = false;
    }
    std::ostringstream out;
    std::ostringstream err;
    CommandRouter router;
    RegisterAllCommands(router, config, out, err);

    std::vector<const char*> argv = {"querygraph"};
    for (const auto& w : words) {
        argv.push_back(w.c_str());
    }
    CliRun run;
    run.exit_code = router.Dispatch(static_cast<int>(argv.size()), argv.data(), out, err);
    run.out = out.str();
    run.err = err.str();
    return run;
}

} // anonymous namespace

// ===========================================================================
// sql generate
// ===========================================================================

TEST_CASE("sql generate: prints SQL and validation", "[cli][executor]") {
    auto run = RunCli({"sql", "generate", TestDataPath("select_join.yaml")});
    CHECK(run.exit_code == 0);
    CHECK(run.out ==
          "SELECT A.id, A.name\nFROM A\nINNER JOIN B ON A.id=B.aid\n\n[valid] Syntax OK\n");
    CHECK(run.err.empty());
}

TEST_CASE("sql generate: --mode overrides the document", "[cli][executor]") {
    auto run = RunCli({"sql", "generate", TestDataPath("update_mapping.yaml"), "--mode=delete"});
    CHECK(run.exit_code == 0);
    CHECK(run.out.rfind("DELETE FROM T\nWHERE id IN (", 0) == 0);
}

TEST_CASE("sql generate: JSON output", "[cli][executor]") {
    auto run = RunCli({"sql", "generate", TestDataPath("update_mapping.yaml"), "--json"});
    REQUIRE(run.exit_code == 0);
    auto j = nlohmann::json::parse(run.out);
    CHECK(j.at("diagnostic") == false);
    CHECK(j.at("sql").get<std::string>().find("SET val=src.v") != std::string::npos);
    CHECK(j.at("validation").at("status") == "valid");
}

TEST_CASE("sql generate: default mode comes from the config", "[cli][executor]") {
    AppConfig config;
    config.default_mode = OperationMode::Insert;
    auto run = RunCli({"sql", "generate", TestDataPath("select_join.yaml")}, config);
    // The document names its own mode, which wins over the default.
    CHECK(run.out.rfind("SELECT", 0) == 0);
}

TEST_CASE("sql generate: document linked servers replace the config map", "[cli][executor]") {
    AppConfig config;
    config.linked_servers = {{"Y", "LS2"}};
    auto run = RunCli({"sql", "generate", TestDataPath("linked_servers.yaml")}, config);
    REQUIRE(run.exit_code == 0);
    CHECK(run.out.find("FROM [LS1].[db1].dbo.[tbl1]") != std::string::npos);
    CHECK(run.out.find("LEFT JOIN Y.db2.tbl2") != std::string::npos);
}

TEST_CASE("sql generate: config linked servers apply when the document has none",
          "[cli][executor]") {
    AppConfig config;
    config.linked_servers = {{"A", "LS9"}};
    auto run = RunCli({"sql", "generate", TestDataPath("select_join.yaml")}, config);
    REQUIRE(run.exit_code == 0);
    // Two-part names are never rewritten.
    CHECK(run.out.find("FROM A\n") != std::string::npos);
}

TEST_CASE("sql generate: errors carry the category exit code", "[cli][executor]") {
    SECTION("missing argument") {
        auto run = RunCli({"sql", "generate"});
        CHECK(run.exit_code == 4);
        CHECK(run.err.find("Missing session file") != std::string::npos);
    }
    SECTION("missing file") {
        auto run = RunCli({"sql", "generate", TestDataPath("nope.yaml")});
        CHECK(run.exit_code == 7);
        CHECK(run.err.find("category: io") != std::string::npos);
    }
    SECTION("structural error") {
        auto run = RunCli({"sql", "generate", TestDataPath("invalid_join.yaml")});
        CHECK(run.exit_code == 2);
    }
    SECTION("bad mode override") {
        auto run = RunCli({"sql", "generate", TestDataPath("select_join.yaml"), "--mode=merge"});
        CHECK(run.exit_code == 4);
    }
    SECTION("JSON error") {
        auto run = RunCli({"sql", "generate", TestDataPath("bad_mode.yaml"), "--json"});
        CHECK(run.exit_code == 5);
        auto j = nlohmann::json::parse(run.err);
        CHECK(j.at("error").at("category") == "parse");
    }
}

// ===========================================================================
// sql validate
// ===========================================================================

TEST_CASE("sql validate: text flag", "[cli][executor]") {
    auto ok = RunCli({"sql", "validate", "--text=SELECT a FROM t"});
    CHECK(ok.exit_code == 0);
    CHECK(ok.out == "\n[valid] Syntax OK\n");

    auto bad = RunCli({"sql", "validate", "--text=SELECT FROM t"});
    CHECK(bad.exit_code == 1);
    CHECK(bad.out.find("[invalid] missing SELECT columns") != std::string::npos);
}

TEST_CASE("sql validate: file argument", "[cli][executor]") {
    auto run = RunCli({"sql", "validate", TestDataPath("invalid_select.sql")});
    CHECK(run.exit_code == 1);

    auto good = RunCli({"sql", "validate", TestDataPath("import_with.sql")});
    CHECK(good.exit_code == 0);
}

TEST_CASE("sql validate: nothing to validate", "[cli][executor]") {
    auto run = RunCli({"sql", "validate"});
    CHECK(run.exit_code == 4);
    CHECK(run.err.find("Missing SQL") != std::string::npos);
}

// ===========================================================================
// sql import
// ===========================================================================

TEST_CASE("sql import: JSON lists CTEs and body", "[cli][executor]") {
    auto run = RunCli({"sql", "import", TestDataPath("import_with.sql"), "--json"});
    REQUIRE(run.exit_code == 0);
    auto j = nlohmann::json::parse(run.out);
    REQUIRE(j.at("ctes").size() == 2);
    CHECK(j.at("ctes")[0].at("name") == "recent");
    CHECK(j.at("ctes")[1].at("body") == "SELECT id FROM recent WHERE total > 100");
    CHECK(j.at("body") == "SELECT * FROM big");
}

TEST_CASE("sql import: human output", "[cli][executor]") {
    auto run = RunCli({"sql", "import", TestDataPath("import_with.sql")});
    REQUIRE(run.exit_code == 0);
    CHECK(run.out.find("CTE") != std::string::npos);
    CHECK(run.out.find("recent") != std::string::npos);
    CHECK(run.out.find("SELECT * FROM big\n") != std::string::npos);
}

TEST_CASE("sql import: missing file", "[cli][executor]") {
    auto run = RunCli({"sql", "import", TestDataPath("missing.sql")});
    CHECK(run.exit_code == 7);
}

// ===========================================================================
// sql run
// ===========================================================================

TEST_CASE("sql run: echo executor", "[cli][executor]") {
    auto run = RunCli({"sql", "run", TestDataPath("select_join.yaml")});
    CHECK(run.exit_code == 0);
    CHECK(run.out ==
          "Executing:\n\nSELECT A.id, A.name\nFROM A\nINNER JOIN B ON A.id=B.aid\n");
}

TEST_CASE("sql run: diagnostic is not executed", "[cli][executor]") {
    auto run = RunCli({"sql", "run", TestDataPath("select_join.yaml"), "--mode=update"});
    CHECK(run.exit_code == 8);
    CHECK(run.err.find("EmptyTarget") != std::string::npos);
}

TEST_CASE("EchoExecutor: prefixes the text", "[cli][executor]") {
    EchoExecutor exec;
    auto r = exec.Execute("SELECT 1");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "Executing:\n\nSELECT 1");
}

// ===========================================================================
// graph show
// ===========================================================================

TEST_CASE("graph show: tables and summary", "[cli][executor]") {
    auto run = RunCli({"graph", "show", TestDataPath("update_mapping.yaml")});
    REQUIRE(run.exit_code == 0);
    CHECK(run.out.find("Node") != std::string::npos);
    CHECK(run.out.find("Mapping") != std::string::npos);
    CHECK(run.out.find("S.v") != std::string::npos);
    CHECK(run.out.find("mode: UPDATE") != std::string::npos);
    CHECK(run.out.find("validation: valid") != std::string::npos);
}

TEST_CASE("graph show: JSON snapshot", "[cli][executor]") {
    auto run = RunCli({"graph", "show", TestDataPath("linked_servers.yaml"), "--json"});
    REQUIRE(run.exit_code == 0);
    auto j = nlohmann::json::parse(run.out);
    CHECK(j.at("linked_servers").at("X") == "LS1");
    CHECK(j.at("graph").at("joins")[0].at("type") == "LEFT");
}

// ===========================================================================
// Config helpers
// ===========================================================================

TEST_CASE("SessionOptionsFromConfig: copies session settings", "[cli][executor]") {
    AppConfig config;
    config.auto_generate = false;
    config.debounce_ms = 650;
    config.default_mode = OperationMode::Delete;
    config.linked_servers = {{"X", "LS1"}};

    auto options = SessionOptionsFromConfig(config);
    CHECK_FALSE(options.auto_generate);
    CHECK(options.debounce == std::chrono::milliseconds(650));
    CHECK(options.mode == OperationMode::Delete);
    CHECK(options.linked_servers.at("X") == "LS1");
}

TEST_CASE("ResolveColor: JSON and explicit settings", "[cli][executor]") {
    AppConfig config;
    config.json_output = true;
    config.color = true;
    CHECK_FALSE(ResolveColor(config));

    config.json_output = false;
    config.color = false;
    CHECK_FALSE(ResolveColor(config));
}

TEST_CASE("RegisterAllCommands: every command has help", "[cli][executor]") {
    CommandRouter router;
    std::ostringstream out, err;
    RegisterAllCommands(router, AppConfig{}, out, err);

    CHECK(router.Groups() == std::vector<std::string>{"graph", "sql"});
    for (const auto& group : router.Groups()) {
        for (const auto& cmd : router.CommandsForGroup(group)) {
            INFO(group << " " << cmd.action);
            REQUIRE(cmd.help.has_value());
            CHECK_FALSE(cmd.help->usage.empty());
            CHECK_FALSE(cmd.help->examples.empty());
        }
    }
    CHECK(router.CommandsForGroup("sql").size() == 4);
}
