#pragma once

#include <string>

namespace uaver {

// Cleans up a version produced by a rule template:
//   - "$1".."$9" capture placeholders left unsubstituted are dropped
//   - a single trailing '.' is removed
//   - '_' separators become '.'
//   - surrounding whitespace is trimmed
std::string sanitize(const std::string& version);

} // namespace uaver
