#pragma once

#include <pkgindex/result.hpp>
#include <string>
#include <vector>

namespace pkgindex {

// Dotted numeric version as published in the index: "1", "0.2", "1.0.0.4".
// Ordering is lexicographic over components; a strict prefix sorts first,
// so 1.0 < 1.0.0.
struct Version {
    std::vector<int> components;

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

} // namespace pkgindex
