/**
 * @file Result.hpp
 * @brief Minimal value-or-error return type.
 *
 * Result<T, E> carries either a value of type T or an error of type E.
 * Result<void, E> carries only the error state. The default error type is
 * mc::Error, which holds a human readable message.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace mc {

struct Error {
    Error() = default;
    Error(std::string msg) : message(std::move(msg)) {}
    Error(const char* msg) : message(msg) {}

    std::string message;
};

template <typename T, typename E = Error>
class [[nodiscard]] Result {
public:
    static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool isOk() const {
        return data_.index() == 0;
    }
    bool isErr() const {
        return !isOk();
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() & {
        return std::get<0>(data_);
    }
    const T& value() const& {
        return std::get<0>(data_);
    }
    T&& value() && {
        return std::get<0>(std::move(data_));
    }
    T& operator*() & {
        return value();
    }
    const T& operator*() const& {
        return value();
    }
    T&& operator*() && {
        return std::move(*this).value();
    }
    T* operator->() {
        return &value();
    }
    const T* operator->() const {
        return &value();
    }

    const E& error() const {
        return std::get<1>(data_);
    }

private:
    template <std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

template <typename E>
class [[nodiscard]] Result<void, E> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(E error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool isOk() const {
        return !error_.has_value();
    }
    bool isErr() const {
        return error_.has_value();
    }
    explicit operator bool() const {
        return isOk();
    }

    const E& error() const {
        return *error_;
    }

private:
    Result() = default;
    std::optional<E> error_;
};

} // namespace mc
