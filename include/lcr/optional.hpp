#pragma once

#include <cassert>
#include <ostream>
#include <type_traits>
#include <utility>


namespace lcr {

/*
===============================================================================
 lcr::optional<T>
===============================================================================

Value plus an explicit presence tag.

Used where "not given" and "given but empty" must stay distinguishable:
a null byte array versus a zero-length one, or a config key that is missing
versus one that is present with a default-looking value.

T must be default constructible; an absent optional still holds a T{}.
===============================================================================
*/

template <typename T>
class optional {
    static_assert(std::is_default_constructible_v<T>, "lcr::optional<T> requires a default constructible T");

public:
    constexpr optional() noexcept(std::is_nothrow_default_constructible_v<T>)
        : value_{}, has_(false) {}

    constexpr optional(const T& v) : value_(v), has_(true) {}
    constexpr optional(T&& v) noexcept(std::is_nothrow_move_constructible_v<T>)
        : value_(std::move(v)), has_(true) {}

    // Spelled-out absent value for call sites
    [[nodiscard]] static constexpr optional absent() noexcept { return optional{}; }

    [[nodiscard]] constexpr bool has() const noexcept { return has_; }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return has_; }

    [[nodiscard]] constexpr const T& value() const {
        assert(has_ && "lcr::optional::value() on absent value");
        return value_;
    }
    [[nodiscard]] constexpr T& value() {
        assert(has_ && "lcr::optional::value() on absent value");
        return value_;
    }

    [[nodiscard]] constexpr const T& operator*() const { return value(); }
    [[nodiscard]] constexpr T& operator*() { return value(); }

    [[nodiscard]] constexpr T value_or(T fallback) const {
        return has_ ? value_ : fallback;
    }

    void reset() {
        value_ = T{};
        has_ = false;
    }

    optional& operator=(const T& v) {
        value_ = v;
        has_ = true;
        return *this;
    }

    optional& operator=(T&& v) {
        value_ = std::move(v);
        has_ = true;
        return *this;
    }

private:
    T value_;
    bool has_;
};


// Streams the value, or "<absent>"
template <typename T>
    requires requires(std::ostream& os, const T& v) { os << v; }
inline std::ostream& operator<<(std::ostream& os, const optional<T>& opt) {
    if (!opt.has()) {
        return os << "<absent>";
    }
    return os << opt.value();
}

} // namespace lcr
