#pragma once

#include <stdexcept>
#include <utility>
#include <variant>

namespace airmesh::util {

// Placeholder value for results that only carry success or an error
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
};

inline constexpr Unit unit{};

// Value-or-error return type for operations whose failures are expected
// (malformed frames, rejected ciphertexts, timed out handshakes)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool is_ok() const noexcept { return storage_.index() == 0; }
    bool is_err() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    T& value() & {
        if (is_err()) throw std::logic_error("Result::value() called on an error");
        return std::get<0>(storage_);
    }

    const T& value() const& {
        if (is_err()) throw std::logic_error("Result::value() called on an error");
        return std::get<0>(storage_);
    }

    T&& value() && {
        if (is_err()) throw std::logic_error("Result::value() called on an error");
        return std::get<0>(std::move(storage_));
    }

    const E& error() const {
        if (is_ok()) throw std::logic_error("Result::error() called on a value");
        return std::get<1>(storage_);
    }

    T value_or(T fallback) && {
        if (is_ok()) return std::get<0>(std::move(storage_));
        return fallback;
    }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    template<size_t I, typename V>
    Result(std::in_place_index_t<I> index, V&& v) : storage_(index, std::forward<V>(v)) {}

    std::variant<T, E> storage_;
};

} // namespace airmesh::util
