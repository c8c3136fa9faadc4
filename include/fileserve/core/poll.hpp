#pragma once

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace fileserve {

// ============================================================================
// Waker / Context - how a pending operation asks to be polled again
// ============================================================================

class Waker {
    std::function<void()> wake_;

public:
    Waker() = default;
    explicit Waker(std::function<void()> wake) : wake_(std::move(wake)) {}

    void wake() const {
        if (wake_) wake_();
    }

    static Waker noop() { return Waker{}; }
};

class Context {
    Waker waker_;

public:
    Context() = default;
    explicit Context(Waker waker) : waker_(std::move(waker)) {}

    const Waker& waker() const noexcept { return waker_; }
};

// ============================================================================
// Poll<T> - either Pending or a ready value
// ============================================================================

struct Pending {};
inline constexpr Pending pending{};

template<typename T>
class Poll {
    std::optional<T> value_;

public:
    Poll(Pending) noexcept {}

    template<typename U = T>
        requires std::is_constructible_v<T, U> &&
                 (!std::is_same_v<std::remove_cvref_t<U>, Poll>) &&
                 (!std::is_same_v<std::remove_cvref_t<U>, Pending>)
    Poll(U&& value) : value_(std::in_place, std::forward<U>(value)) {}

    bool is_ready() const noexcept { return value_.has_value(); }
    bool is_pending() const noexcept { return !value_.has_value(); }

    T& value() & { return *value_; }
    const T& value() const& { return *value_; }
    T&& value() && { return std::move(*value_); }
};

} // namespace fileserve
