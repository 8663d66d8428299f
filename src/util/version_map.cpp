#include <uaver/version_map.hpp>
#include <uaver/canonical.hpp>
#include <uaver/sanitize.hpp>
#include <algorithm>

namespace uaver {

VersionMap::VersionMap(std::string name) : name_(std::move(name)) {}

const std::string& VersionMap::name() const { return name_; }
size_t VersionMap::size() const { return entries_.size(); }
bool VersionMap::empty() const { return entries_.empty(); }

const std::vector<std::pair<std::string, std::string>>& VersionMap::entries() const {
    return entries_;
}

void VersionMap::insert(const std::string& from, const std::string& to) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&](const auto& e) { return e.first == from; });
    if (it != entries_.end()) {
        it->second = to;
        return;
    }
    entries_.emplace_back(from, to);
}

std::optional<std::string> VersionMap::lookup(const std::string& version) const {
    std::string key = sanitize(version);
    if (key.empty()) return std::nullopt;

    for (const auto& [from, to] : entries_) {
        if (from == key) return to;
    }

    std::string canonical = canonicalize(key);
    for (const auto& [from, to] : entries_) {
        if (canonicalize(from) == canonical) return to;
    }
    return std::nullopt;
}

} // namespace uaver
