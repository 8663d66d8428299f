#include <uaver/constraint.hpp>
#include <uaver/sanitize.hpp>
#include <algorithm>
#include <sstream>

namespace uaver {

const char* strategy_name(Strategy s) {
    switch (s) {
        case Strategy::Ordinal:   return "ordinal";
        case Strategy::Canonical: return "canonical";
    }
    return "canonical";
}

Result<Strategy> parse_strategy(const std::string& name) {
    if (name == "ordinal") return Result<Strategy>::ok(Strategy::Ordinal);
    if (name == "canonical") return Result<Strategy>::ok(Strategy::Canonical);
    return UaverError{UaverError::InvalidArg,
        "unknown comparison strategy '" + name + "'",
        "expected 'ordinal' or 'canonical'"};
}

Ordering compare_with(Strategy s, const std::string& a, const std::string& b) {
    switch (s) {
        case Strategy::Ordinal:   return compare(a, b);
        case Strategy::Canonical: return compare_canonicalized(a, b);
    }
    return compare_canonicalized(a, b);
}

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------

bool VersionConstraint::matches(const std::string& candidate,
                                Strategy strategy) const {
    std::string v = sanitize(candidate);
    if (v.empty()) return false;

    Ordering o = compare_with(strategy, v, version);

    switch (op) {
    case ConstraintOp::Exact:     return o == Ordering::Equal;
    case ConstraintOp::NotEqual:  return o != Ordering::Equal;
    case ConstraintOp::GreaterEq: return o != Ordering::Less;
    case ConstraintOp::Greater:   return o == Ordering::Greater;
    case ConstraintOp::LessEq:    return o != Ordering::Greater;
    case ConstraintOp::Less:      return o == Ordering::Less;
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    std::string prefix;
    switch (op) {
    case ConstraintOp::Exact:     prefix = "="; break;
    case ConstraintOp::NotEqual:  prefix = "!="; break;
    case ConstraintOp::GreaterEq: prefix = ">="; break;
    case ConstraintOp::Greater:   prefix = ">"; break;
    case ConstraintOp::LessEq:    prefix = "<="; break;
    case ConstraintOp::Less:      prefix = "<"; break;
    }
    return prefix + version;
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

static bool is_blank(char c) { return c == ' ' || c == '\t'; }

static Result<VersionConstraint> parse_single_constraint(const std::string& s) {
    size_t pos = 0;
    while (pos < s.size() && is_blank(s[pos])) ++pos;

    auto next_is = [&](const char* op) {
        return s.compare(pos, std::char_traits<char>::length(op), op) == 0;
    };

    // Bare version = "at least"
    ConstraintOp op = ConstraintOp::GreaterEq;
    if (next_is(">=")) {
        op = ConstraintOp::GreaterEq;
        pos += 2;
    } else if (next_is("<=")) {
        op = ConstraintOp::LessEq;
        pos += 2;
    } else if (next_is("!=")) {
        op = ConstraintOp::NotEqual;
        pos += 2;
    } else if (next_is("==")) {
        op = ConstraintOp::Exact;
        pos += 2;
    } else if (next_is(">")) {
        op = ConstraintOp::Greater;
        ++pos;
    } else if (next_is("<")) {
        op = ConstraintOp::Less;
        ++pos;
    } else if (next_is("=")) {
        op = ConstraintOp::Exact;
        ++pos;
    }

    while (pos < s.size() && is_blank(s[pos])) ++pos;

    std::string ver_str = s.substr(pos);
    while (!ver_str.empty() && is_blank(ver_str.back())) ver_str.pop_back();

    if (ver_str.empty()) {
        return UaverError{UaverError::Constraint,
            "missing version in constraint '" + s + "'",
            "expected e.g. '>=7.0'"};
    }

    VersionConstraint vc;
    vc.op = op;
    vc.version = std::move(ver_str);
    return Result<VersionConstraint>::ok(std::move(vc));
}

Result<VersionReq> VersionReq::parse(const std::string& s) {
    if (std::all_of(s.begin(), s.end(), is_blank)) {
        return UaverError{UaverError::Constraint, "empty version requirement"};
    }

    VersionReq req;
    std::istringstream stream(s);
    std::string token;

    while (std::getline(stream, token, ',')) {
        if (std::all_of(token.begin(), token.end(), is_blank)) {
            return UaverError{UaverError::Constraint,
                "empty constraint in version requirement '" + s + "'",
                "remove the stray ','"};
        }
        auto c = parse_single_constraint(token);
        if (c.is_err()) return std::move(c).error();
        req.constraints.push_back(std::move(c).value());
    }

    // getline drops a trailing empty field
    if (s.back() == ',') {
        return UaverError{UaverError::Constraint,
            "empty constraint in version requirement '" + s + "'",
            "remove the stray ','"};
    }

    return Result<VersionReq>::ok(std::move(req));
}

bool VersionReq::matches(const std::string& candidate, Strategy strategy) const {
    return std::all_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) { return c.matches(candidate, strategy); });
}

std::string VersionReq::to_string() const {
    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += ", ";
        s += constraints[i].to_string();
    }
    return s;
}

} // namespace uaver
