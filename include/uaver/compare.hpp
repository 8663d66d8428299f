#pragma once

#include <string>

namespace uaver {

enum class Ordering {
    Less = -1,
    Equal = 0,
    Greater = 1,
};

// Priority classes of canonical tokens, in ascending order. Matches the
// special-form table of PHP's version_compare(); anything unrecognized ranks
// below "dev".
enum class Priority {
    Other = -1,
    Dev = 0,
    Alpha = 1,    // "a..."
    Beta = 2,     // "b..."
    Rc = 3,       // "rc..."
    Numeric = 4,  // leading digit
    Patch = 5,    // "p..."
};

Priority priority_of(const std::string& token);
const char* priority_name(Priority p);

int to_int(Ordering o);
// "lt", "eq" or "gt"
const char* ordering_name(Ordering o);
Ordering reverse(Ordering o);

// Ordinal comparison: both versions go through parse_semver_with_pre(), then
// major/minor/patch compare numerically and the tags compare bytewise.
// An empty version sorts before any non-empty one.
//   compare("1.0.0", "1.0.0.4") == Ordering::Less   ("0" < "4")
Ordering compare(const std::string& a, const std::string& b);

// version_compare()-style comparison over the canonical token sequences.
// Missing trailing components count as numeric zero, so "1" < "1.0" and
// "1" < "1patch" but "1" > "1beta".
Ordering compare_canonicalized(const std::string& a, const std::string& b);

} // namespace uaver
