#pragma once

// std::expected when the library ships it (C++23); otherwise the subset of it
// fileserve relies on: value or error access, value_or and expected<void, E>.

#if defined(FILESERVE_HAS_STD_EXPECTED) || __cpp_lib_expected >= 202202L

#include <expected>

namespace fileserve {
using std::bad_expected_access;
using std::expected;
using std::unexpected;
} // namespace fileserve

#else

#include <exception>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace fileserve {

template <typename E>
class unexpected {
public:
  template <typename Err = E>
    requires(!std::is_same_v<std::remove_cvref_t<Err>, unexpected>) &&
            std::is_constructible_v<E, Err>
  constexpr explicit unexpected(Err &&err) : err_(std::forward<Err>(err)) {}

  constexpr const E &error() const & noexcept { return err_; }
  constexpr E &error() & noexcept { return err_; }
  constexpr E &&error() && noexcept { return std::move(err_); }

private:
  E err_;
};

template <typename E>
unexpected(E) -> unexpected<E>;

template <typename E>
class bad_expected_access : public std::exception {
public:
  explicit bad_expected_access(E err) : err_(std::move(err)) {}
  const char *what() const noexcept override { return "bad expected access"; }
  const E &error() const & noexcept { return err_; }

private:
  E err_;
};

namespace detail {

// Alternative 0 holds the value (std::monostate for void), alternative 1 the error
template <typename V, typename E>
class expected_base {
public:
  constexpr bool has_value() const noexcept { return slot_.index() == 0; }
  constexpr explicit operator bool() const noexcept { return has_value(); }

  constexpr const E &error() const & noexcept { return std::get<1>(slot_); }
  constexpr E &error() & noexcept { return std::get<1>(slot_); }
  constexpr E &&error() && noexcept { return std::get<1>(std::move(slot_)); }

protected:
  template <typename... Args>
  constexpr explicit expected_base(std::in_place_index_t<0> tag, Args &&...args)
      : slot_(tag, std::forward<Args>(args)...) {}

  template <typename G>
  constexpr explicit expected_base(std::in_place_index_t<1> tag, G &&err)
      : slot_(tag, std::forward<G>(err)) {}

  constexpr void require_value() const {
    if (!has_value()) throw bad_expected_access<E>(error());
  }

  std::variant<V, E> slot_;
};

} // namespace detail

template <typename T, typename E>
class expected : public detail::expected_base<T, E> {
  using base = detail::expected_base<T, E>;

public:
  using value_type = T;
  using error_type = E;

  constexpr expected()
    requires std::is_default_constructible_v<T>
      : base(std::in_place_index<0>) {}

  template <typename U = T>
    requires(!std::is_same_v<std::remove_cvref_t<U>, expected>) &&
            (!std::is_same_v<std::remove_cvref_t<U>, unexpected<E>>) &&
            std::is_constructible_v<T, U>
  constexpr expected(U &&value) : base(std::in_place_index<0>, std::forward<U>(value)) {}

  template <typename G>
  constexpr expected(const unexpected<G> &err) : base(std::in_place_index<1>, err.error()) {}

  template <typename G>
  constexpr expected(unexpected<G> &&err)
      : base(std::in_place_index<1>, std::move(err).error()) {}

  constexpr const T &operator*() const & noexcept { return std::get<0>(this->slot_); }
  constexpr T &operator*() & noexcept { return std::get<0>(this->slot_); }
  constexpr T &&operator*() && noexcept { return std::get<0>(std::move(this->slot_)); }

  constexpr const T *operator->() const noexcept { return std::addressof(**this); }
  constexpr T *operator->() noexcept { return std::addressof(**this); }

  constexpr const T &value() const & {
    this->require_value();
    return **this;
  }
  constexpr T &value() & {
    this->require_value();
    return **this;
  }
  constexpr T &&value() && {
    this->require_value();
    return std::move(**this);
  }

  template <typename U>
  constexpr T value_or(U &&fallback) const & {
    return this->has_value() ? **this : static_cast<T>(std::forward<U>(fallback));
  }
  template <typename U>
  constexpr T value_or(U &&fallback) && {
    return this->has_value() ? std::move(**this) : static_cast<T>(std::forward<U>(fallback));
  }
};

template <typename E>
class expected<void, E> : public detail::expected_base<std::monostate, E> {
  using base = detail::expected_base<std::monostate, E>;

public:
  using value_type = void;
  using error_type = E;

  constexpr expected() noexcept : base(std::in_place_index<0>) {}

  template <typename G>
  constexpr expected(const unexpected<G> &err) : base(std::in_place_index<1>, err.error()) {}

  template <typename G>
  constexpr expected(unexpected<G> &&err)
      : base(std::in_place_index<1>, std::move(err).error()) {}

  constexpr void value() const { this->require_value(); }
};

} // namespace fileserve

#endif
