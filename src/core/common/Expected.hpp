#pragma once

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace Sluice {

template<typename E>
class Unexpected {
public:
    constexpr explicit Unexpected(const E& error) : error_(error) {}
    constexpr explicit Unexpected(E&& error) : error_(std::move(error)) {}

    constexpr const E& error() const& { return error_; }
    constexpr E& error() & { return error_; }
    constexpr E&& error() && { return std::move(error_); }

private:
    E error_;
};

template<typename E>
constexpr Unexpected<std::decay_t<E>> makeUnexpected(E&& error) {
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

namespace detail {
template<typename U>
struct IsUnexpected : std::false_type {};

template<typename G>
struct IsUnexpected<Unexpected<G>> : std::true_type {};
} // namespace detail

// Value-or-error result, modelled on std::expected (C++23).
// Errors are only constructed through makeUnexpected(), which keeps
// Expected<T, T> unambiguous.
template<typename T, typename E>
class Expected {
public:
    template<typename U = T, typename = std::enable_if_t<std::is_default_constructible_v<U>>>
    Expected() : storage_(std::in_place_index<0>) {}

    template<typename U, typename = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, Expected> &&
        !detail::IsUnexpected<std::decay_t<U>>::value &&
        std::is_constructible_v<T, U&&>>>
    Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected)
        : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

    bool hasValue() const noexcept { return storage_.index() == 0; }
    bool hasError() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    const T& value() const& {
        if (!hasValue()) {
            throw std::runtime_error("Expected contains error, not value");
        }
        return std::get<0>(storage_);
    }

    T& value() & {
        if (!hasValue()) {
            throw std::runtime_error("Expected contains error, not value");
        }
        return std::get<0>(storage_);
    }

    T&& value() && {
        if (!hasValue()) {
            throw std::runtime_error("Expected contains error, not value");
        }
        return std::get<0>(std::move(storage_));
    }

    const E& error() const& {
        if (!hasError()) {
            throw std::runtime_error("Expected contains value, not error");
        }
        return std::get<1>(storage_);
    }

    E& error() & {
        if (!hasError()) {
            throw std::runtime_error("Expected contains value, not error");
        }
        return std::get<1>(storage_);
    }

    template<typename U>
    T valueOr(U&& fallback) const& {
        return hasValue() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(fallback));
    }

    template<typename F>
    auto transform(F&& f) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
        if (hasValue()) {
            return std::forward<F>(f)(std::get<0>(storage_));
        }
        return makeUnexpected(std::get<1>(storage_));
    }

    template<typename F>
    auto andThen(F&& f) const& -> std::invoke_result_t<F, const T&> {
        if (hasValue()) {
            return std::forward<F>(f)(std::get<0>(storage_));
        }
        return makeUnexpected(std::get<1>(storage_));
    }

private:
    std::variant<T, E> storage_;
};

template<typename E>
class Expected<void, E> {
public:
    Expected() = default;

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : error_(unexpected.error()) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected) : error_(std::move(unexpected).error()) {}

    bool hasValue() const noexcept { return !error_.has_value(); }
    bool hasError() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return hasValue(); }

    void value() const {
        if (hasError()) {
            throw std::runtime_error("Expected contains error, not value");
        }
    }

    const E& error() const {
        if (!hasError()) {
            throw std::runtime_error("Expected contains value, not error");
        }
        return *error_;
    }

private:
    std::optional<E> error_;
};

} // namespace Sluice
