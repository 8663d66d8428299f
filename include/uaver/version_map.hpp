#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace uaver {

// Short-code version mapping, e.g. LineageOS release -> Android release.
// Keys are kept as authored; lookups go through sanitize() and fall back to
// comparing canonical forms, so "17.00" finds the "17.0" entry.
class VersionMap {
public:
    VersionMap() = default;
    explicit VersionMap(std::string name);

    const std::string& name() const;
    size_t size() const;
    bool empty() const;

    // Later inserts of an existing key replace its value
    void insert(const std::string& from, const std::string& to);

    std::optional<std::string> lookup(const std::string& version) const;

    const std::vector<std::pair<std::string, std::string>>& entries() const;

private:
    std::string name_;
    std::vector<std::pair<std::string, std::string>> entries_;
};

} // namespace uaver
