#include <uaver/cli.hpp>
#include <uaver/constraint.hpp>
#include <uaver/log.hpp>
#include <uaver/version.hpp>
#include <filesystem>

namespace fs = std::filesystem;

namespace uaver::cli {

static const char* kUsage =
    "usage: uaver [--config FILE] [--no-global-config] [-v|-vv] <command> [args]\n"
    "\n"
    "commands:\n"
    "  sanitize V                 strip template leftovers from V\n"
    "  canonicalize V             print the canonical form of V\n"
    "  semver V [PARTS]           project V onto major.minor.patch[-pre]\n"
    "  major V                    print the leading numeric component\n"
    "  compare A B [--ordinal|--canonical]\n"
    "                             print lt, eq or gt\n"
    "  check REQ V                test V against a requirement like '>=7.0, <8'\n"
    "  rule NAME V                test V against a named [constraints] entry\n"
    "  map NAME V                 look V up in [version-maps.NAME]\n";

Result<Options> parse_args(const std::vector<std::string>& argv) {
    Options opts;
    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argv.size()) {
                return UaverError{UaverError::InvalidArg,
                    "--config needs a file argument"};
            }
            opts.config_path = argv[++i];
        } else if (arg == "--no-global-config") {
            opts.use_global_config = false;
        } else if (arg == "-v") {
            if (opts.verbosity < 1) opts.verbosity = 1;
        } else if (arg == "-vv") {
            opts.verbosity = 2;
        } else if (arg == "-h" || arg == "--help") {
            opts.command = "help";
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }
    if (opts.command.empty()) {
        return UaverError{UaverError::InvalidArg, "no command given",
            "run 'uaver --help' for the command list"};
    }
    return Result<Options>::ok(std::move(opts));
}

bool needs_config(const std::string& command) {
    return command == "semver" || command == "compare" || command == "check" ||
           command == "rule" || command == "map";
}

Result<Config> load_config(const Options& opts) {
    std::optional<Config> global;
    std::string global_path = opts.use_global_config ? global_config_path() : "";
    if (!global_path.empty() && fs::exists(global_path)) {
        auto g = Config::load(global_path);
        UAVER_TRY(g);
        log::debug("loaded global config %s", global_path.c_str());
        global = std::move(g).value();
    }

    std::optional<Config> local;
    if (!opts.config_path.empty()) {
        auto l = Config::load(opts.config_path);
        UAVER_TRY(l);
        log::debug("loaded config %s", opts.config_path.c_str());
        local = std::move(l).value();
    }

    return Result<Config>::ok(Config::effective(global, local));
}

static Status expect_args(const Options& opts, size_t min, size_t max) {
    if (opts.args.size() < min || opts.args.size() > max) {
        return UaverError{UaverError::InvalidArg,
            "wrong number of arguments for '" + opts.command + "'",
            "run 'uaver --help' for the command list"};
    }
    return ok_status();
}

static Result<Strategy> strategy_flag(const Options& opts, Strategy fallback) {
    if (opts.args.size() < 3) return Result<Strategy>::ok(fallback);
    const std::string& flag = opts.args[2];
    if (flag.rfind("--", 0) != 0) {
        return UaverError{UaverError::InvalidArg,
            "unexpected argument '" + flag + "'",
            "expected --ordinal or --canonical"};
    }
    return parse_strategy(flag.substr(2));
}

static Result<int> check(const VersionReq& req, const std::string& candidate,
                         Strategy strategy, std::ostream& out) {
    std::string v = sanitize(candidate);
    for (const auto& c : req.constraints) {
        log::trace("'%s' %s '%s' (%s), wants %s", v.c_str(),
                   ordering_name(compare_with(strategy, v, c.version)),
                   c.version.c_str(), strategy_name(strategy),
                   c.to_string().c_str());
    }

    bool ok = req.matches(candidate, strategy);
    log::info("'%s' %s %s", candidate.c_str(),
              ok ? "satisfies" : "does not satisfy", req.to_string().c_str());
    out << (ok ? "true" : "false") << "\n";
    return Result<int>::ok(ok ? 0 : 1);
}

Result<int> run(const Options& opts, std::ostream& out) {
    const auto& cmd = opts.command;
    const auto& args = opts.args;

    Config cfg;
    if (needs_config(cmd)) {
        auto loaded = load_config(opts);
        UAVER_TRY(loaded);
        cfg = std::move(loaded).value();
        // Command-line verbosity wins over the config file
        if (opts.verbosity == 0 && cfg.log_level_set) log::set_level(cfg.logging.level);
        if (cfg.log_color_set) log::set_color_enabled(cfg.logging.color);
    }

    if (cmd == "help") {
        out << kUsage;
        return Result<int>::ok(0);
    }
    if (cmd == "sanitize") {
        UAVER_TRY(expect_args(opts, 1, 1));
        out << sanitize(args[0]) << "\n";
        return Result<int>::ok(0);
    }
    if (cmd == "canonicalize") {
        UAVER_TRY(expect_args(opts, 1, 1));
        out << canonicalize(args[0]) << "\n";
        return Result<int>::ok(0);
    }
    if (cmd == "semver") {
        UAVER_TRY(expect_args(opts, 1, 2));
        int parts = cfg.engine.semver_parts;
        if (args.size() == 2) {
            auto n = parse_leading_uint(args[1]);
            if (!n || *n < 1 || *n > 4 || std::to_string(*n) != args[1]) {
                return UaverError{UaverError::InvalidArg,
                    "invalid part count '" + args[1] + "'",
                    "expected a number from 1 to 4"};
            }
            parts = static_cast<int>(*n);
        }
        out << to_semver(args[0], parts) << "\n";
        return Result<int>::ok(0);
    }
    if (cmd == "major") {
        UAVER_TRY(expect_args(opts, 1, 1));
        out << major(args[0]) << "\n";
        return Result<int>::ok(0);
    }
    if (cmd == "compare") {
        UAVER_TRY(expect_args(opts, 2, 3));
        auto strategy = strategy_flag(opts, cfg.engine.strategy);
        UAVER_TRY(strategy);
        log::debug("comparing with the %s strategy", strategy_name(strategy.value()));
        out << ordering_name(compare_with(strategy.value(), args[0], args[1])) << "\n";
        return Result<int>::ok(0);
    }
    if (cmd == "check" || cmd == "rule") {
        UAVER_TRY(expect_args(opts, 2, 2));
        auto req = cmd == "check" ? VersionReq::parse(args[0])
                                  : cfg.constraint(args[0]);
        UAVER_TRY(req);
        return check(req.value(), args[1], cfg.engine.strategy, out);
    }
    if (cmd == "map") {
        UAVER_TRY(expect_args(opts, 2, 2));
        auto map = cfg.version_map(args[0]);
        UAVER_TRY(map);
        auto mapped = map.value().lookup(args[1]);
        if (!mapped) {
            return UaverError{UaverError::NotFound,
                "no mapping for '" + args[1] + "' in '" + args[0] + "'"};
        }
        out << *mapped << "\n";
        return Result<int>::ok(0);
    }

    return UaverError{UaverError::InvalidArg,
        "unknown command '" + cmd + "'",
        "run 'uaver --help' for the command list"};
}

int run_main(const std::vector<std::string>& argv, std::ostream& out,
             std::ostream& err) {
    auto opts = parse_args(argv);
    if (opts.is_err()) {
        err << opts.error().format() << "\n";
        return 2;
    }

    if (opts.value().verbosity == 1) log::set_level(log::Debug);
    if (opts.value().verbosity >= 2) log::set_level(log::Trace);

    auto status = run(opts.value(), out);
    if (status.is_err()) {
        log::error("%s failed", opts.value().command.c_str());
        err << status.error().format() << "\n";
        return 2;
    }
    return status.value();
}

} // namespace uaver::cli
