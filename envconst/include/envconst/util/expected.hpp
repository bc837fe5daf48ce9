#pragma once

// Cut-down version of the proposed std::expected class
// http://www.open-std.org/jtc1/sc22/wg21/docs/papers/2019/p0323r9.html
//
// Difference from proposal:
//
// * No expected<void, E> specialization.
// * No converting constructors between expected<S, F> and expected<T, E>.
// * Lazy about explicitness of some conversions.

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

namespace envconst {
namespace util {

struct unexpect_t {};
inline constexpr unexpect_t unexpect{};

template <typename E = void>
struct bad_expected_access;

template <>
struct bad_expected_access<void>: std::exception {
    bad_expected_access() {}
    virtual const char* what() const noexcept override { return "bad expected access"; }
};

template <typename E>
struct bad_expected_access: public bad_expected_access<void> {
    explicit bad_expected_access(E error): error_(error) {}

    E& error() & { return error_; }
    const E& error() const& { return error_; }

private:
    E error_;
};

// The unexpected<E> wrapper is mainly boiler-plate for a box that wraps
// a value of type E, with corresponding conversion and assignment semantics.

template <typename E>
struct unexpected {
    unexpected() = default;
    unexpected(const unexpected&) = default;
    unexpected(unexpected&&) = default;

    template <typename... Args>
    explicit unexpected(std::in_place_t, Args&&... args):
        value_(std::forward<Args>(args)...) {}

    template <typename F,
        typename = std::enable_if_t<std::is_constructible<E, F&&>::value>,
        typename = std::enable_if_t<!std::is_same<std::in_place_t, std::decay_t<F>>::value>,
        typename = std::enable_if_t<!std::is_same<unexpected, std::decay_t<F>>::value>
    >
    explicit unexpected(F&& f): value_(std::forward<F>(f)) {}

    unexpected& operator=(const unexpected&) = default;
    unexpected& operator=(unexpected&&) = default;

    E& value() & { return value_; }
    const E& value() const & { return value_; }
    E&& value() && { return std::move(value_); }

    template <typename F>
    bool operator==(const unexpected<F>& other) const { return value()==other.value(); }

    template <typename F>
    bool operator!=(const unexpected<F>& other) const { return value()!=other.value(); }

private:
    E value_;
};

template <typename E>
unexpected(E) -> unexpected<E>;

template <typename E>
unexpected<E> inline make_unexpected(E e) { return unexpected<E>(std::move(e)); }

template <typename T, typename E>
struct expected {
    static_assert(!std::is_void<T>::value, "expected<void, E> is not supported");

    using value_type = T;
    using error_type = E;
    using unexpected_type = unexpected<E>;
    using data_type = std::variant<T, unexpected_type>;

    expected() = default;
    expected(const expected&) = default;
    expected(expected&&) = default;

    template <typename... Args>
    explicit expected(std::in_place_t, Args&&... args):
        data_(std::in_place_index<0>, std::forward<Args>(args)...) {}

    template <typename... Args>
    explicit expected(unexpect_t, Args&&... args):
        data_(std::in_place_index<1>, std::in_place, std::forward<Args>(args)...) {}

    template <
        typename S,
        typename = std::enable_if_t<std::is_constructible<T, S&&>::value>,
        typename = std::enable_if_t<!std::is_same<std::in_place_t, std::decay_t<S>>::value>,
        typename = std::enable_if_t<!std::is_same<expected, std::decay_t<S>>::value>,
        typename = std::enable_if_t<!std::is_same<unexpected<E>, std::decay_t<S>>::value>
    >
    expected(S&& x): data_(std::in_place_index<0>, std::forward<S>(x)) {}

    template <typename F>
    expected(const unexpected<F>& u): data_(std::in_place_index<1>, std::in_place, u.value()) {}

    template <typename F>
    expected(unexpected<F>&& u): data_(std::in_place_index<1>, std::in_place, std::move(u).value()) {}

    expected& operator=(const expected&) = default;
    expected& operator=(expected&&) = default;

    // Accessors.

    bool has_value() const noexcept { return data_.index()==0; }
    explicit operator bool() const noexcept { return has_value(); }

    T& value() & {
        if (*this) return std::get<0>(data_);
        throw bad_expected_access<E>(error());
    }
    const T& value() const& {
        if (*this) return std::get<0>(data_);
        throw bad_expected_access<E>(error());
    }
    T&& value() && {
        if (*this) return std::get<0>(std::move(data_));
        throw bad_expected_access<E>(error());
    }

    const E& error() const& { return std::get<1>(data_).value(); }
    E& error() & { return std::get<1>(data_).value(); }
    E&& error() && { return std::get<1>(std::move(data_)).value(); }

    const T& operator*() const& { return std::get<0>(data_); }
    T& operator*() & { return std::get<0>(data_); }
    T&& operator*() && { return std::get<0>(std::move(data_)); }

    const T* operator->() const { return std::get_if<0>(&data_); }
    T* operator->() { return std::get_if<0>(&data_); }

    template <typename S>
    T value_or(S&& s) const& { return has_value()? value(): static_cast<T>(std::forward<S>(s)); }

private:
    data_type data_;
};

template <typename T1, typename E1, typename T2, typename E2>
inline bool operator==(const expected<T1, E1>& a, const expected<T2, E2>& b) {
    return a? b && a.value()==b.value(): !b && a.error()==b.error();
}

template <typename T1, typename E1, typename T2, typename E2>
inline bool operator!=(const expected<T1, E1>& a, const expected<T2, E2>& b) {
    return !(a==b);
}

} // namespace util
} // namespace envconst
