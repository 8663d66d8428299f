#include <uaver/version.hpp>

namespace uaver {

std::uint64_t major(const std::string& version) {
    std::string canonical = canonicalize(version);
    std::string head = canonical.substr(0, canonical.find('.'));
    return parse_leading_uint(head).value_or(0);
}

} // namespace uaver
