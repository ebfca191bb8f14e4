#pragma once

#include <pkgindex/error.hpp>
#include <string>
#include <utility>
#include <variant>

namespace pkgindex {

template<typename T>
class Result {
    std::variant<T, IndexError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from IndexError so PKGINDEX_TRY can return errors across Result<T> types
    Result(IndexError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(IndexError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<IndexError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    IndexError& error() & { return std::get<IndexError>(data_); }
    const IndexError& error() const& { return std::get<IndexError>(data_); }
    IndexError&& error() && { return std::get<IndexError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    // Point an error at the file it came from, e.g. a config file or an
    // index entry, with an optional message prefix. A file recorded by a
    // deeper layer is kept.
    Result with_file(const std::string& file, const std::string& prefix = "") && {
        if (is_err()) {
            auto& e = error();
            if (e.file.empty()) e.file = file;
            e.message = prefix + e.message;
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PKGINDEX_TRY(expr) \
    do { \
        auto _pkgindex_result = (expr); \
        if (_pkgindex_result.is_err()) return std::move(_pkgindex_result).error(); \
    } while(0)

} // namespace pkgindex
