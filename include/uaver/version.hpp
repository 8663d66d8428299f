#pragma once

#include <uaver/canonical.hpp>
#include <uaver/compare.hpp>
#include <uaver/sanitize.hpp>
#include <uaver/semver.hpp>
#include <cstdint>
#include <string>

namespace uaver {

// Leading component of the canonical form when it is a positive integer,
// otherwise 0: major("5.2") == 5, major("-1.2.3") == 0, major("beta") == 0
std::uint64_t major(const std::string& version);

} // namespace uaver
