// uaver: command-line front end for the version engine.
//
//     uaver canonicalize 1.02-03alpha      # -> 1.2.3.alpha
//     uaver compare 1.0.0 1.0.0.4          # -> lt
//     uaver --config rules.toml rule android-min 7.0.4
//
// Exit status: 0 on success (or a satisfied check), 1 on an unsatisfied
// check, 2 on usage or configuration errors.

#include <uaver/cli.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return uaver::cli::run_main(args, std::cout, std::cerr);
}
