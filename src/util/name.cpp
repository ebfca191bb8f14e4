#include <pkgindex/name.hpp>
#include <cctype>

namespace pkgindex {

Result<PackageName> PackageName::parse(const std::string& raw) {
    if (raw.empty()) {
        return IndexError{IndexError::InvalidArg, "empty package name"};
    }

    bool word_has_letter = false;
    size_t word_len = 0;

    for (size_t i = 0; i <= raw.size(); ++i) {
        char c = i < raw.size() ? raw[i] : '-';

        if (c == '-') {
            if (word_len == 0) {
                return IndexError{IndexError::InvalidArg,
                    "invalid package name '" + raw + "'",
                    "words must not be empty (check leading, trailing or doubled '-')"};
            }
            if (!word_has_letter) {
                return IndexError{IndexError::InvalidArg,
                    "invalid package name '" + raw + "'",
                    "every hyphen-separated word needs at least one letter"};
            }
            word_len = 0;
            word_has_letter = false;
            continue;
        }

        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return IndexError{IndexError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in package name '" + raw + "'",
                "allowed: [a-zA-Z0-9-]"};
        }
        if (std::isalpha(static_cast<unsigned char>(c))) word_has_letter = true;
        ++word_len;
    }

    PackageName name;
    name.name_ = raw;
    return Result<PackageName>::ok(std::move(name));
}

const std::string& PackageName::str() const { return name_; }

bool PackageName::operator==(const PackageName& o) const {
    return name_ == o.name_;
}

bool PackageName::operator!=(const PackageName& o) const {
    return !(*this == o);
}

bool PackageName::operator<(const PackageName& o) const {
    return name_ < o.name_;
}

} // namespace pkgindex
