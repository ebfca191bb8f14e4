#include <pkgindex/version.hpp>
#include <algorithm>
#include <cctype>
#include <climits>

namespace pkgindex {

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return IndexError{IndexError::Version, "empty version string"};
    }

    Version v;
    size_t pos = 0;

    while (true) {
        size_t dot = s.find('.', pos);
        std::string part = s.substr(pos, dot == std::string::npos
                                             ? std::string::npos
                                             : dot - pos);
        if (part.empty()) {
            return IndexError{IndexError::Version,
                "invalid version '" + s + "'",
                "expected dot-separated numbers, e.g. 1.0.2"};
        }

        long long n = 0;
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return IndexError{IndexError::Version,
                    "invalid character '" + std::string(1, c) +
                    "' in version '" + s + "'"};
            }
            n = n * 10 + (c - '0');
            if (n > INT_MAX) {
                return IndexError{IndexError::Version,
                    "version component out of range in '" + s + "'"};
            }
        }
        v.components.push_back(static_cast<int>(n));

        if (dot == std::string::npos) break;
        pos = dot + 1;
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s;
    for (size_t i = 0; i < components.size(); ++i) {
        if (i > 0) s += ".";
        s += std::to_string(components[i]);
    }
    return s;
}

bool Version::operator==(const Version& o) const {
    return components == o.components;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    return std::lexicographical_compare(components.begin(), components.end(),
                                        o.components.begin(), o.components.end());
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

} // namespace pkgindex
