#pragma once
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

// Error side of a Result; a distinct type so Result<std::string> stays unambiguous.
template <typename E = std::string>
struct Error {
    E value;
};

[[nodiscard]] inline Error<std::string> Err(std::string msg) {
    return Error<std::string>{std::move(msg)};
}

template <typename T, typename E = std::string>
class Result {
    std::variant<T, Error<E>> storage;

public:
    Result(const T& value)
        : storage(std::in_place_index<0>, value) {}
    Result(T&& value)
        : storage(std::in_place_index<0>, std::move(value)) {}
    Result(const Error<E>& error)
        : storage(std::in_place_index<1>, error) {}
    Result(Error<E>&& error)
        : storage(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool isOk() const noexcept { return storage.index() == 0; }
    [[nodiscard]] bool isErr() const noexcept { return storage.index() == 1; }

    T expect(const std::string& msg) const {
        if (isErr()) throw std::runtime_error(msg + ": " + std::get<1>(storage).value);
        return std::get<0>(storage);
    }

    T unwrap() const { return expect("Called unwrap on error Result"); }

    E unwrapErr() const {
        if (isOk()) throw std::runtime_error("Called unwrapErr on ok Result");
        return std::get<1>(storage).value;
    }

    T unwrapOr(T&& defaultValue) const { return isOk() ? std::get<0>(storage) : std::move(defaultValue); }
};

// Success carries no value.
template <typename E>
class Result<void, E> {
    std::variant<std::monostate, Error<E>> storage;

public:
    Result() = default;
    Result(const Error<E>& error)
        : storage(std::in_place_index<1>, error) {}
    Result(Error<E>&& error)
        : storage(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool isOk() const noexcept { return storage.index() == 0; }
    [[nodiscard]] bool isErr() const noexcept { return storage.index() == 1; }

    void expect(const std::string& msg) const {
        if (isErr()) throw std::runtime_error(msg + ": " + std::get<1>(storage).value);
    }

    E unwrapErr() const {
        if (isOk()) throw std::runtime_error("Called unwrapErr on ok Result");
        return std::get<1>(storage).value;
    }
};

/**
 * Unwrap a Result or throw Ex(context + ": " + error).
 * Used at setup boundaries where a failed step aborts the whole run.
 */
template <typename Ex, typename T, typename E>
T expectOr(const Result<T, E>& res, const std::string& context) {
    if (res.isErr()) throw Ex(context + ": " + res.unwrapErr());
    if constexpr (!std::is_void_v<T>) {
        return res.unwrap();
    }
}
