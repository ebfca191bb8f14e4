#pragma once

#include <pkgindex/result.hpp>
#include <string>

namespace pkgindex {

// Package name: hyphen-separated words of [a-zA-Z0-9], each word holding
// at least one letter ("text", "aeson-pretty", "base64-bytestring").
// Names are case-sensitive and compared verbatim.
struct PackageName {
    static Result<PackageName> parse(const std::string& raw);

    const std::string& str() const;

    bool operator==(const PackageName& o) const;
    bool operator!=(const PackageName& o) const;
    bool operator<(const PackageName& o) const;

private:
    std::string name_;
};

} // namespace pkgindex
