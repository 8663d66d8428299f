#pragma once

#include <uaver/config.hpp>
#include <uaver/result.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace uaver::cli {

struct Options {
    std::string config_path;        // --config FILE
    bool use_global_config = true;  // cleared by --no-global-config
    int verbosity = 0;              // -v = 1, -vv = 2
    std::string command;
    std::vector<std::string> args;
};

// `argv` excludes the program name
Result<Options> parse_args(const std::vector<std::string>& argv);

// Whether `command` reads configuration (default strategy, semver parts,
// named constraints or version maps). Pure commands never load a config
// file, so a broken one cannot make them fail.
bool needs_config(const std::string& command);

// Global config (if present and enabled) overlaid with --config (must exist)
Result<Config> load_config(const Options& opts);

// Runs one command, printing its result to `out`. Returns the exit status
// for successful commands: 0, or 1 for an unsatisfied check/rule.
Result<int> run(const Options& opts, std::ostream& out);

// Whole front end: parse, configure logging, run. Errors are formatted to
// `err` and yield exit status 2.
int run_main(const std::vector<std::string>& argv, std::ostream& out,
             std::ostream& err);

} // namespace uaver::cli
