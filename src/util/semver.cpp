#include <uaver/semver.hpp>
#include <limits>
#include <vector>

namespace uaver {

std::string Semver::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    if (pre.has_value()) {
        s += "-" + *pre;
    }
    return s;
}

bool Semver::operator==(const Semver& o) const {
    return major == o.major && minor == o.minor &&
           patch == o.patch && pre == o.pre;
}

bool Semver::operator!=(const Semver& o) const { return !(*this == o); }

std::optional<std::uint64_t> parse_leading_uint(const std::string& s) {
    size_t pos = 0;
    bool negative = false;
    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        negative = s[pos] == '-';
        ++pos;
    }

    constexpr auto max = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;
    size_t digits = 0;
    for (; pos < s.size() && s[pos] >= '0' && s[pos] <= '9'; ++pos, ++digits) {
        auto d = static_cast<std::uint64_t>(s[pos] - '0');
        value = (value > (max - d) / 10) ? max : value * 10 + d;
    }

    if (digits == 0) return std::nullopt;
    // "-0" is zero, not negative
    if (negative && value != 0) return std::nullopt;
    return value;
}

static std::vector<std::string> split_limited(const std::string& s, int parts) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (static_cast<int>(fields.size()) + 1 < parts) {
        size_t dot = s.find('.', start);
        if (dot == std::string::npos) break;
        fields.push_back(s.substr(start, dot - start));
        start = dot + 1;
    }
    fields.push_back(s.substr(start));
    return fields;
}

std::optional<Semver> parse_semver(const std::string& version, int parts) {
    if (version.empty()) return std::nullopt;
    if (parts < 1) parts = 1;

    auto fields = split_limited(version, parts);

    Semver v;
    std::uint64_t* numeric[] = {&v.major, &v.minor, &v.patch};
    for (size_t i = 0; i < 3 && i < fields.size(); ++i) {
        auto n = parse_leading_uint(fields[i]);
        if (!n) break;
        *numeric[i] = *n;
    }
    if (fields.size() > 3) {
        v.pre = fields[3];
    }
    return v;
}

std::string to_semver(const std::string& version, int parts) {
    auto v = parse_semver(version, parts);
    if (!v) return "";
    return v->to_string();
}

std::optional<Semver> parse_semver_with_pre(const std::string& version) {
    auto v = parse_semver(version, 4);
    if (v && !v->pre) v->pre = "0";
    return v;
}

std::string to_semver_with_pre(const std::string& version) {
    auto v = parse_semver_with_pre(version);
    if (!v) return "";
    return v->to_string();
}

} // namespace uaver
