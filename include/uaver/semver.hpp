#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace uaver {

// Best-effort major.minor.patch[-pre] projection of a raw version.
struct Semver {
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;
    std::optional<std::string> pre;  // verbatim 4th field, may be empty

    std::string to_string() const;

    bool operator==(const Semver& o) const;
    bool operator!=(const Semver& o) const;
};

// Leading-integer parse: optional '+'/'-', then at least one ASCII digit;
// anything after the digits is ignored ("3help" -> 3). Returns nullopt when
// there is no digit or the value is negative. Saturates at UINT64_MAX.
std::optional<std::uint64_t> parse_leading_uint(const std::string& s);

// Splits the raw version on '.' into at most `parts` fields (the last one
// keeps any remaining dots) and maps them onto a Semver:
//   - fields 1..3 are major, minor, patch; missing ones are 0
//   - the first field that fails to parse or is negative is 0, and so is
//     every numeric field after it
//   - a 4th field (only with parts >= 4) is kept as `pre`
// Empty input means "no version" and yields nullopt.
std::optional<Semver> parse_semver(const std::string& version, int parts = 3);

// String form of parse_semver(); "" for empty input.
//   to_semver("15")          == "15.0.0"
//   to_semver("1.-2.3.4")    == "1.0.0"
//   to_semver("1.2.3.4", 4)  == "1.2.3-4"
std::string to_semver(const std::string& version, int parts = 3);

// Four-field projection with a synthetic "0" tag when none was present,
// so every non-empty result carries a pre-release component.
std::optional<Semver> parse_semver_with_pre(const std::string& version);
std::string to_semver_with_pre(const std::string& version);

} // namespace uaver
