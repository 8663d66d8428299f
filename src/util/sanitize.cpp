#include <uaver/sanitize.hpp>
#include <algorithm>
#include <cctype>

namespace uaver {

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string sanitize(const std::string& version) {
    if (version.empty()) return "";

    std::string out;
    out.reserve(version.size());
    for (size_t i = 0; i < version.size(); ++i) {
        if (version[i] == '$' && i + 1 < version.size() &&
            std::isdigit(static_cast<unsigned char>(version[i + 1]))) {
            ++i;
            continue;
        }
        out += version[i];
    }

    // A trailing dot also counts when only a final newline follows it
    if (!out.empty() && out.back() == '.') {
        out.pop_back();
    } else if (out.size() >= 2 && out.back() == '\n' &&
               out[out.size() - 2] == '.') {
        out.erase(out.size() - 2, 1);
    }

    std::replace(out.begin(), out.end(), '_', '.');

    auto first = std::find_if_not(out.begin(), out.end(), is_space);
    auto last = std::find_if_not(out.rbegin(), out.rend(), is_space).base();
    if (first >= last) return "";
    return std::string(first, last);
}

} // namespace uaver
