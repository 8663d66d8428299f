#include <uaver/compare.hpp>
#include <uaver/canonical.hpp>
#include <uaver/semver.hpp>
#include <vector>

namespace uaver {

static bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

static bool starts_with_digit(const std::string& s) {
    return !s.empty() && s[0] >= '0' && s[0] <= '9';
}

Priority priority_of(const std::string& token) {
    if (starts_with(token, "dev")) return Priority::Dev;
    if (starts_with(token, "a")) return Priority::Alpha;
    if (starts_with(token, "b")) return Priority::Beta;
    if (starts_with(token, "rc")) return Priority::Rc;
    if (starts_with_digit(token)) return Priority::Numeric;
    if (starts_with(token, "p")) return Priority::Patch;
    return Priority::Other;
}

const char* priority_name(Priority p) {
    switch (p) {
        case Priority::Other:   return "other";
        case Priority::Dev:     return "dev";
        case Priority::Alpha:   return "alpha";
        case Priority::Beta:    return "beta";
        case Priority::Rc:      return "rc";
        case Priority::Numeric: return "numeric";
        case Priority::Patch:   return "patch";
    }
    return "other";
}

int to_int(Ordering o) { return static_cast<int>(o); }

const char* ordering_name(Ordering o) {
    switch (o) {
        case Ordering::Less:    return "lt";
        case Ordering::Equal:   return "eq";
        case Ordering::Greater: return "gt";
    }
    return "eq";
}

Ordering reverse(Ordering o) {
    return static_cast<Ordering>(-to_int(o));
}

template<typename T>
static Ordering order_of(const T& a, const T& b) {
    if (a < b) return Ordering::Less;
    if (b < a) return Ordering::Greater;
    return Ordering::Equal;
}

// ---------------------------------------------------------------------------
// Ordinal
// ---------------------------------------------------------------------------

Ordering compare(const std::string& a, const std::string& b) {
    auto va = parse_semver_with_pre(a);
    auto vb = parse_semver_with_pre(b);

    if (!va || !vb) {
        if (va) return Ordering::Greater;
        if (vb) return Ordering::Less;
        return Ordering::Equal;
    }

    if (va->major != vb->major) return order_of(va->major, vb->major);
    if (va->minor != vb->minor) return order_of(va->minor, vb->minor);
    if (va->patch != vb->patch) return order_of(va->patch, vb->patch);
    return order_of(*va->pre, *vb->pre);
}

// ---------------------------------------------------------------------------
// Canonicalized
// ---------------------------------------------------------------------------

// Numeric comparison of two digit-led tokens of any length
static Ordering compare_numeric(const std::string& a, const std::string& b) {
    auto digits = [](const std::string& s) {
        size_t begin = 0;
        while (begin + 1 < s.size() && s[begin] == '0' &&
               s[begin + 1] >= '0' && s[begin + 1] <= '9') {
            ++begin;
        }
        size_t end = begin;
        while (end < s.size() && s[end] >= '0' && s[end] <= '9') ++end;
        return s.substr(begin, end - begin);
    };

    std::string da = digits(a);
    std::string db = digits(b);
    if (da.size() != db.size()) return order_of(da.size(), db.size());
    return order_of(da, db);
}

// Ordering of a version that still has `token` left against one that ran out
static Ordering compare_leftover(const std::string& token) {
    return priority_of(token) >= Priority::Numeric ? Ordering::Greater
                                                   : Ordering::Less;
}

Ordering compare_canonicalized(const std::string& a, const std::string& b) {
    auto ta = split_canonical(canonicalize(a));
    auto tb = split_canonical(canonicalize(b));

    size_t i = 0;
    for (;; ++i) {
        bool a_done = i >= ta.size();
        bool b_done = i >= tb.size();
        if (a_done && b_done) return Ordering::Equal;
        if (a_done) return reverse(compare_leftover(tb[i]));
        if (b_done) return compare_leftover(ta[i]);

        const auto& x = ta[i];
        const auto& y = tb[i];
        Ordering o;
        if (starts_with_digit(x) && starts_with_digit(y)) {
            o = compare_numeric(x, y);
        } else {
            o = order_of(priority_of(x), priority_of(y));
        }
        if (o != Ordering::Equal) return o;
    }
}

} // namespace uaver
