#pragma once

#include <version>

// Use std::expected when the standard library ships it, otherwise a
// variant-backed stand-in with the subset of the interface we rely on.

#if defined(PARAMROUTE_HAS_STD_EXPECTED) || (defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L)

#include <expected>

namespace paramroute {
    using std::expected;
    using std::unexpected;
    using std::unexpect;
    using std::unexpect_t;
    using std::bad_expected_access;
}

#else

#include <exception>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace paramroute {

struct unexpect_t {
    explicit unexpect_t() = default;
};
inline constexpr unexpect_t unexpect{};

template<typename E>
class unexpected {
    E error_;

public:
    constexpr unexpected(const unexpected&) = default;
    constexpr unexpected(unexpected&&) = default;

    template<typename Err = E>
        requires std::is_constructible_v<E, Err>
    constexpr explicit unexpected(Err&& e)
        : error_(std::forward<Err>(e)) {}

    constexpr const E& error() const& noexcept { return error_; }
    constexpr E& error() & noexcept { return error_; }
    constexpr E&& error() && noexcept { return std::move(error_); }
};

template<typename E>
unexpected(E) -> unexpected<E>;

template<typename E>
class bad_expected_access;

template<>
class bad_expected_access<void> : public std::exception {
public:
    const char* what() const noexcept override {
        return "bad expected access";
    }
};

template<typename E>
class bad_expected_access : public bad_expected_access<void> {
    E error_;
public:
    explicit bad_expected_access(E e) : error_(std::move(e)) {}
    const E& error() const& noexcept { return error_; }
};

template<typename T, typename E>
class expected {
    static_assert(!std::is_void_v<T>, "expected<void, E> is not provided");

    // Index 0 holds the value, index 1 the error.
    std::variant<T, E> storage_;

public:
    using value_type = T;
    using error_type = E;
    using unexpected_type = unexpected<E>;

    constexpr expected()
        requires std::is_default_constructible_v<T>
        : storage_(std::in_place_index<0>) {}

    constexpr expected(const expected&) = default;
    constexpr expected(expected&&) = default;
    expected& operator=(const expected&) = default;
    expected& operator=(expected&&) = default;

    template<typename U = T>
        requires std::is_constructible_v<T, U> &&
                 (!std::is_same_v<std::remove_cvref_t<U>, expected>) &&
                 (!std::is_same_v<std::remove_cvref_t<U>, unexpected<E>>) &&
                 (!std::is_same_v<std::remove_cvref_t<U>, unexpect_t>)
    constexpr expected(U&& v)
        : storage_(std::in_place_index<0>, std::forward<U>(v)) {}

    template<typename G>
        requires std::is_constructible_v<E, const G&>
    constexpr expected(const unexpected<G>& e)
        : storage_(std::in_place_index<1>, e.error()) {}

    template<typename G>
        requires std::is_constructible_v<E, G>
    constexpr expected(unexpected<G>&& e)
        : storage_(std::in_place_index<1>, std::move(e).error()) {}

    template<typename... Args>
        requires std::is_constructible_v<E, Args...>
    constexpr explicit expected(unexpect_t, Args&&... args)
        : storage_(std::in_place_index<1>, std::forward<Args>(args)...) {}

    constexpr bool has_value() const noexcept { return storage_.index() == 0; }
    constexpr explicit operator bool() const noexcept { return has_value(); }

    constexpr const T* operator->() const noexcept { return std::addressof(std::get<0>(storage_)); }
    constexpr T* operator->() noexcept { return std::addressof(std::get<0>(storage_)); }

    constexpr const T& operator*() const& noexcept { return std::get<0>(storage_); }
    constexpr T& operator*() & noexcept { return std::get<0>(storage_); }
    constexpr T&& operator*() && noexcept { return std::move(std::get<0>(storage_)); }

    constexpr const T& value() const& {
        if (!has_value()) throw bad_expected_access<E>(error());
        return std::get<0>(storage_);
    }
    constexpr T& value() & {
        if (!has_value()) throw bad_expected_access<E>(error());
        return std::get<0>(storage_);
    }
    constexpr T&& value() && {
        if (!has_value()) throw bad_expected_access<E>(std::move(error()));
        return std::move(std::get<0>(storage_));
    }

    constexpr const E& error() const& noexcept { return std::get<1>(storage_); }
    constexpr E& error() & noexcept { return std::get<1>(storage_); }
    constexpr E&& error() && noexcept { return std::move(std::get<1>(storage_)); }

    template<typename U>
    constexpr T value_or(U&& fallback) const& {
        return has_value() ? std::get<0>(storage_)
                           : static_cast<T>(std::forward<U>(fallback));
    }
    template<typename U>
    constexpr T value_or(U&& fallback) && {
        return has_value() ? std::move(std::get<0>(storage_))
                           : static_cast<T>(std::forward<U>(fallback));
    }

    template<typename F>
    constexpr auto and_then(F&& f) const& {
        using R = std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
        if (has_value()) return std::invoke(std::forward<F>(f), **this);
        return R(unexpect, error());
    }

    template<typename F>
    constexpr auto and_then(F&& f) && {
        using R = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
        if (has_value()) return std::invoke(std::forward<F>(f), std::move(**this));
        return R(unexpect, std::move(error()));
    }

    template<typename F>
    constexpr auto transform(F&& f) const& {
        using U = std::remove_cv_t<std::invoke_result_t<F, const T&>>;
        if (has_value()) return expected<U, E>(std::invoke(std::forward<F>(f), **this));
        return expected<U, E>(unexpect, error());
    }

    template<typename F>
    constexpr auto transform(F&& f) && {
        using U = std::remove_cv_t<std::invoke_result_t<F, T&&>>;
        if (has_value()) return expected<U, E>(std::invoke(std::forward<F>(f), std::move(**this)));
        return expected<U, E>(unexpect, std::move(error()));
    }

    template<typename F>
    constexpr auto transform_error(F&& f) const& {
        using G = std::remove_cv_t<std::invoke_result_t<F, const E&>>;
        if (has_value()) return expected<T, G>(**this);
        return expected<T, G>(unexpect, std::invoke(std::forward<F>(f), error()));
    }
};

} // namespace paramroute

#endif // PARAMROUTE_HAS_STD_EXPECTED
