#include <catch2/catch.hpp>
#include <uaver/cli.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace uaver;

struct CliRun {
    int status;
    std::string out;
    std::string err;
};

static CliRun run_cli(const std::vector<std::string>& argv) {
    std::ostringstream out, err;
    int status = cli::run_main(argv, out, err);
    return CliRun{status, out.str(), err.str()};
}

// Same as run_cli() but never reads ~/.uaver/config.toml
static CliRun run_isolated(std::vector<std::string> argv) {
    argv.insert(argv.begin(), "--no-global-config");
    return run_cli(argv);
}

static std::string write_temp(const std::string& name, const std::string& text) {
    auto path = (fs::temp_directory_path() / name).string();
    std::ofstream out(path);
    out << text;
    return path;
}

// ===== Argument parsing =====

TEST_CASE("parse_args splits options, command and arguments", "[cli]") {
    auto r = cli::parse_args({"--config", "x.toml", "-vv", "--no-global-config",
                              "compare", "1", "2", "--ordinal"});
    REQUIRE(r.is_ok());
    const auto& o = r.value();
    REQUIRE(o.config_path == "x.toml");
    REQUIRE(o.verbosity == 2);
    REQUIRE_FALSE(o.use_global_config);
    REQUIRE(o.command == "compare");
    REQUIRE(o.args == std::vector<std::string>{"1", "2", "--ordinal"});
}

TEST_CASE("parse_args errors", "[cli]") {
    REQUIRE(cli::parse_args({}).error().code == UaverError::InvalidArg);
    REQUIRE(cli::parse_args({"-v"}).is_err());
    REQUIRE(cli::parse_args({"major", "--config"}).is_err());
}

TEST_CASE("only configurable commands need a config", "[cli]") {
    for (const char* cmd : {"semver", "compare", "check", "rule", "map"}) {
        CAPTURE(cmd);
        REQUIRE(cli::needs_config(cmd));
    }
    for (const char* cmd : {"sanitize", "canonicalize", "major", "help"}) {
        CAPTURE(cmd);
        REQUIRE_FALSE(cli::needs_config(cmd));
    }
}

// ===== Engine commands =====

TEST_CASE("cli engine commands print results", "[cli]") {
    REQUIRE(run_isolated({"sanitize", "12.0$1"}).out == "12.0\n");
    REQUIRE(run_isolated({"canonicalize", "1.02.03alpha"}).out == "1.2.3.alpha\n");
    REQUIRE(run_isolated({"major", "-1.2.3"}).out == "0\n");
    REQUIRE(run_isolated({"semver", "15"}).out == "15.0.0\n");
    REQUIRE(run_isolated({"semver", "1.2.3.4", "4"}).out == "1.2.3-4\n");

    auto r = run_isolated({"compare", "1.0.0", "1.0.0.4"});
    REQUIRE(r.status == 0);
    REQUIRE(r.out == "lt\n");
    REQUIRE(r.err.empty());
}

TEST_CASE("cli compare strategy flags", "[cli]") {
    REQUIRE(run_isolated({"compare", "1.0.0.10", "1.0.0.9"}).out == "gt\n");
    REQUIRE(run_isolated({"compare", "1.0.0.10", "1.0.0.9", "--canonical"}).out == "gt\n");
    REQUIRE(run_isolated({"compare", "1.0.0.10", "1.0.0.9", "--ordinal"}).out == "lt\n");

    REQUIRE(run_isolated({"compare", "1", "2", "--fuzzy"}).status == 2);
    REQUIRE(run_isolated({"compare", "1", "2", "3"}).status == 2);
}

TEST_CASE("cli semver rejects bad part counts", "[cli]") {
    for (const char* parts : {"0", "5", "x", "04", "-1"}) {
        CAPTURE(parts);
        auto r = run_isolated({"semver", "1.2.3.4", parts});
        REQUIRE(r.status == 2);
        REQUIRE(r.out.empty());
        REQUIRE(r.err.find("invalid part count") != std::string::npos);
    }
}

TEST_CASE("cli semver uses the configured part count", "[cli]") {
    auto path = write_temp("uaver_cli_parts.toml", "[engine]\nsemver-parts = 4\n");
    auto r = run_isolated({"--config", path, "semver", "1.2.3.4"});
    fs::remove(path);
    REQUIRE(r.out == "1.2.3-4\n");
}

// ===== Exit status =====

TEST_CASE("cli check exit status follows the result", "[cli]") {
    auto yes = run_isolated({"check", ">=7.0", "7.0.4"});
    REQUIRE(yes.status == 0);
    REQUIRE(yes.out == "true\n");

    auto no = run_isolated({"check", "<7", "7.0.4"});
    REQUIRE(no.status == 1);
    REQUIRE(no.out == "false\n");

    auto bad = run_isolated({"check", ">=", "7.0.4"});
    REQUIRE(bad.status == 2);
    REQUIRE(bad.err.find("error[Constraint]") != std::string::npos);
}

TEST_CASE("cli usage errors exit with 2", "[cli]") {
    REQUIRE(run_cli({}).status == 2);
    REQUIRE(run_isolated({"frobnicate"}).status == 2);
    REQUIRE(run_isolated({"major"}).status == 2);
    REQUIRE(run_isolated({"major", "1", "2"}).status == 2);
    auto missing = run_isolated({"--config", "/nonexistent/uaver.toml", "compare", "1", "2"});
    REQUIRE(missing.status == 2);
    REQUIRE(missing.err.find("error[IO]") != std::string::npos);
}

TEST_CASE("cli help", "[cli]") {
    auto r = run_isolated({"--help"});
    REQUIRE(r.status == 0);
    REQUIRE(r.out.find("usage: uaver") != std::string::npos);
}

// ===== Config-backed commands =====

TEST_CASE("cli rule and map read the config file", "[cli]") {
    auto path = write_temp("uaver_cli_rules.toml", R"(
[constraints]
android-min = ">=7.0"

[version-maps.lineage-os]
"17.0" = "10"
)");

    auto rule_ok = run_isolated({"--config", path, "rule", "android-min", "7.0.4"});
    auto rule_no = run_isolated({"--config", path, "rule", "android-min", "6.0"});
    auto rule_missing = run_isolated({"--config", path, "rule", "ios-min", "7.0"});
    auto mapped = run_isolated({"--config", path, "map", "lineage-os", "17_0"});
    auto unmapped = run_isolated({"--config", path, "map", "lineage-os", "19.0"});
    auto no_map = run_isolated({"--config", path, "map", "other", "17.0"});
    fs::remove(path);

    REQUIRE(rule_ok.status == 0);
    REQUIRE(rule_ok.out == "true\n");
    REQUIRE(rule_no.status == 1);
    REQUIRE(rule_missing.status == 2);
    REQUIRE(rule_missing.err.find("error[NotFound]") != std::string::npos);
    REQUIRE(mapped.status == 0);
    REQUIRE(mapped.out == "10\n");
    REQUIRE(unmapped.status == 2);
    REQUIRE(no_map.status == 2);
}

TEST_CASE("a broken global config only affects commands that read config", "[cli]") {
    auto home = fs::temp_directory_path() / "uaver_cli_home";
    fs::create_directories(home / ".uaver");
    {
        std::ofstream out(home / ".uaver" / "config.toml");
        out << "not valid [toml";
    }

    const char* saved = std::getenv("HOME");
    std::string saved_home = saved ? saved : "";
    setenv("HOME", home.string().c_str(), 1);

    auto canonical = run_cli({"canonicalize", "01.02"});
    auto major = run_cli({"major", "5.2"});
    auto compared = run_cli({"compare", "1", "2"});
    auto skipped = run_cli({"--no-global-config", "compare", "1", "2"});

    if (saved) {
        setenv("HOME", saved_home.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
    fs::remove_all(home);

    REQUIRE(canonical.status == 0);
    REQUIRE(canonical.out == "1.2\n");
    REQUIRE(major.status == 0);
    REQUIRE(major.out == "5\n");
    REQUIRE(compared.status == 2);
    REQUIRE(compared.err.find("error[Parse]") != std::string::npos);
    REQUIRE(skipped.status == 0);
    REQUIRE(skipped.out == "lt\n");
}
