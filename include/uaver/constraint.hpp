#pragma once

#include <uaver/result.hpp>
#include <uaver/compare.hpp>
#include <string>
#include <vector>

namespace uaver {

// Which ordering a constraint is evaluated with
enum class Strategy {
    Ordinal,    // compare()
    Canonical,  // compare_canonicalized()
};

const char* strategy_name(Strategy s);
Result<Strategy> parse_strategy(const std::string& name);

// Orders two versions with the chosen strategy
Ordering compare_with(Strategy s, const std::string& a, const std::string& b);

enum class ConstraintOp {
    Exact,       // =7.0 or ==7.0
    NotEqual,    // !=7.0
    GreaterEq,   // >=7.0, or a bare 7.0
    Greater,     // >7.0
    LessEq,      // <=7.0
    Less,        // <7.0
};

struct VersionConstraint {
    ConstraintOp op = ConstraintOp::GreaterEq;
    std::string version;  // kept as written in the rule

    // `candidate` is sanitized first; an empty candidate never matches
    bool matches(const std::string& candidate,
                 Strategy strategy = Strategy::Canonical) const;
    std::string to_string() const;
};

// Conjunction of constraints: ">=7.0, <8"
struct VersionReq {
    std::vector<VersionConstraint> constraints;

    static Result<VersionReq> parse(const std::string& s);
    bool matches(const std::string& candidate,
                 Strategy strategy = Strategy::Canonical) const;
    std::string to_string() const;
};

} // namespace uaver
