#include <uaver/canonical.hpp>

namespace uaver {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_alnum(char c) { return is_digit(c) || is_alpha(c); }

// Character class of the first capture in the alpha/digit passes
bool is_neither_digit_nor_dot(char c) { return !is_digit(c) && c != '.'; }

// Copies `s`, inserting a '.' between s[i] and s[i+1] wherever
// `boundary(s[i], s[i+1])` holds. The second character of every boundary
// class used here can never start another match, so a single scan
// reproduces the non-overlapping substitution.
template<typename Pred>
std::string insert_dots(const std::string& s, Pred boundary) {
    std::string out;
    out.reserve(s.size() + s.size() / 2);
    for (size_t i = 0; i < s.size(); ++i) {
        out += s[i];
        if (i + 1 < s.size() && boundary(s[i], s[i + 1])) {
            out += '.';
        }
    }
    return out;
}

// Position of the '0' that an anchored match at `i` would start with, or
// npos when neither "^0" nor "\.0" begins at `i`.
size_t anchored_zero(const std::string& s, size_t i) {
    if (i == 0 && !s.empty() && s[0] == '0') return 0;
    if (s[i] == '.' && i + 1 < s.size() && s[i + 1] == '0') return i + 1;
    return std::string::npos;
}

} // namespace

namespace passes {

std::string separators_to_dots(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        if (c == '-' || c == '_' || c == '+') c = '.';
    }
    return out;
}

std::string split_alpha_digit(const std::string& s) {
    return insert_dots(s, [](char a, char b) {
        return is_neither_digit_nor_dot(a) && is_digit(b);
    });
}

std::string split_digit_alpha(const std::string& s) {
    return insert_dots(s, [](char a, char b) {
        return is_digit(a) && is_neither_digit_nor_dot(b);
    });
}

std::string split_alnum_punct(const std::string& s) {
    return insert_dots(s, [](char a, char b) {
        return is_alnum(a) && !is_alnum(b);
    });
}

std::string split_punct_alnum(const std::string& s) {
    return insert_dots(s, [](char a, char b) {
        return !is_alnum(a) && is_alnum(b);
    });
}

std::string collapse_zero_runs(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        size_t zero = anchored_zero(s, i);
        if (zero == std::string::npos) {
            out += s[i++];
            continue;
        }
        size_t end = zero;
        while (end < s.size() && s[end] == '0') ++end;
        out += '0';
        i = end;
    }
    return out;
}

std::string strip_leading_zero(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        size_t zero = anchored_zero(s, i);
        // "^0" without a digit behind it falls back to the "\.0" branch
        if (zero == 0 && !(1 < s.size() && is_digit(s[1]))) {
            zero = std::string::npos;
        }
        if (zero == std::string::npos ||
            zero + 1 >= s.size() || !is_digit(s[zero + 1])) {
            out += s[i++];
            continue;
        }
        size_t end = zero + 1;
        while (end < s.size() && is_digit(s[end])) ++end;
        out.append(s, zero + 1, end - zero - 1);
        i = end;
    }
    return out;
}

std::string collapse_dots(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '.' && i > 0 && s[i - 1] == '.') continue;
        out += s[i];
    }
    return out;
}

} // namespace passes

std::string canonicalize(const std::string& version) {
    std::string s = passes::separators_to_dots(version);
    s = passes::split_alpha_digit(s);
    s = passes::split_digit_alpha(s);
    s = passes::split_alnum_punct(s);
    s = passes::split_punct_alnum(s);
    s = passes::collapse_zero_runs(s);
    s = passes::strip_leading_zero(s);
    return passes::collapse_dots(s);
}

std::vector<std::string> split_canonical(const std::string& canonical) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (true) {
        size_t dot = canonical.find('.', start);
        if (dot == std::string::npos) {
            tokens.push_back(canonical.substr(start));
            break;
        }
        tokens.push_back(canonical.substr(start, dot - start));
        start = dot + 1;
    }
    return tokens;
}

} // namespace uaver
