#pragma once

#include <gitcache/error.hpp>
#include <utility>
#include <variant>

namespace gitcache {

template<typename T>
class Result {
    std::variant<T, GitcacheError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from GitcacheError so GITCACHE_TRY can forward errors
    // between Result<T> types
    Result(GitcacheError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(GitcacheError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<GitcacheError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    GitcacheError& error() & { return std::get<GitcacheError>(data_); }
    const GitcacheError& error() const& { return std::get<GitcacheError>(data_); }
    GitcacheError&& error() && { return std::get<GitcacheError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define GITCACHE_TRY(expr) \
    do { \
        auto _gitcache_result = (expr); \
        if (_gitcache_result.is_err()) return std::move(_gitcache_result).error(); \
    } while(0)

} // namespace gitcache
