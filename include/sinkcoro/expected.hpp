#pragma once

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

#include <version>
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
#include <expected>
#endif

namespace sinkcoro {

// Compatibility shim for `std::expected` (C++23).
//
// - If the standard library provides `std::expected`, this header aliases it.
// - Otherwise it provides the subset sinkcoro uses: construction from a value or
//   `unexpected`, observers, `value_or`, and the `expected<void, E>` specialization.
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L

template <class E>
using unexpected = std::unexpected<E>;

template <class E>
using bad_expected_access = std::bad_expected_access<E>;

using unexpect_t = std::unexpect_t;
inline constexpr unexpect_t unexpect = std::unexpect;

template <class T, class E>
using expected = std::expected<T, E>;

#else

template <class E>
class bad_expected_access : public std::exception {
 public:
  explicit bad_expected_access(E e) : err_(std::move(e)) {}

  auto error() const& -> E const& { return err_; }
  auto error() && -> E&& { return std::move(err_); }

  const char* what() const noexcept override { return "bad expected access"; }

 private:
  E err_;
};

template <class E>
class unexpected {
 public:
  constexpr explicit unexpected(E const& e) : error_(e) {}
  constexpr explicit unexpected(E&& e) : error_(std::move(e)) {}

  constexpr E const& error() const& noexcept { return error_; }
  constexpr E& error() & noexcept { return error_; }
  constexpr E&& error() && noexcept { return std::move(error_); }

 private:
  E error_;
};

template <class E>
unexpected(E) -> unexpected<E>;

struct unexpect_t {
  explicit unexpect_t() = default;
};
inline constexpr unexpect_t unexpect{};

template <class T, class E>
class expected {
 public:
  using value_type = T;
  using error_type = E;

  constexpr expected() : storage_(std::in_place_index<0>) {}

  constexpr expected(T const& value) : storage_(std::in_place_index<0>, value) {}
  constexpr expected(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}

  template <class G, typename = std::enable_if_t<std::is_convertible_v<G const&, E>>>
  constexpr expected(unexpected<G> const& u) : storage_(std::in_place_index<1>, E(u.error())) {}

  template <class G, typename = std::enable_if_t<std::is_convertible_v<G&&, E>>>
  constexpr expected(unexpected<G>&& u)
      : storage_(std::in_place_index<1>, E(std::move(u).error())) {}

  template <class... Args>
  constexpr explicit expected(std::in_place_t, Args&&... args)
      : storage_(std::in_place_index<0>, std::forward<Args>(args)...) {}

  template <class... Args>
  constexpr explicit expected(unexpect_t, Args&&... args)
      : storage_(std::in_place_index<1>, std::forward<Args>(args)...) {}

  constexpr bool has_value() const noexcept { return storage_.index() == 0; }
  constexpr explicit operator bool() const noexcept { return has_value(); }

  constexpr T& value() & {
    if (!has_value()) {
      throw_bad_expected_access();
    }
    return std::get<0>(storage_);
  }

  constexpr T const& value() const& {
    if (!has_value()) {
      throw_bad_expected_access();
    }
    return std::get<0>(storage_);
  }

  constexpr T&& value() && {
    if (!has_value()) {
      throw_bad_expected_access();
    }
    return std::move(std::get<0>(storage_));
  }

  constexpr E& error() & noexcept { return std::get<1>(storage_); }
  constexpr E const& error() const& noexcept { return std::get<1>(storage_); }
  constexpr E&& error() && noexcept { return std::move(std::get<1>(storage_)); }

  constexpr T& operator*() & noexcept { return std::get<0>(storage_); }
  constexpr T const& operator*() const& noexcept { return std::get<0>(storage_); }
  constexpr T&& operator*() && noexcept { return std::move(std::get<0>(storage_)); }

  constexpr T* operator->() noexcept { return &std::get<0>(storage_); }
  constexpr T const* operator->() const noexcept { return &std::get<0>(storage_); }

  template <class U>
  constexpr T value_or(U&& default_value) const& {
    return has_value() ? **this : static_cast<T>(std::forward<U>(default_value));
  }

  template <class U>
  constexpr T value_or(U&& default_value) && {
    return has_value() ? std::move(**this) : static_cast<T>(std::forward<U>(default_value));
  }

 private:
  std::variant<T, E> storage_;

  [[noreturn]] void throw_bad_expected_access() const { throw bad_expected_access<E>(error()); }
};

/// Specialization for operations that produce no value.
template <class E>
class expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  constexpr expected() : storage_(std::in_place_index<0>) {}

  template <class G, typename = std::enable_if_t<std::is_convertible_v<G const&, E>>>
  constexpr expected(unexpected<G> const& u) : storage_(std::in_place_index<1>, E(u.error())) {}

  template <class G, typename = std::enable_if_t<std::is_convertible_v<G&&, E>>>
  constexpr expected(unexpected<G>&& u)
      : storage_(std::in_place_index<1>, E(std::move(u).error())) {}

  template <class... Args>
  constexpr explicit expected(unexpect_t, Args&&... args)
      : storage_(std::in_place_index<1>, std::forward<Args>(args)...) {}

  constexpr bool has_value() const noexcept { return storage_.index() == 0; }
  constexpr explicit operator bool() const noexcept { return has_value(); }

  constexpr void value() const {
    if (!has_value()) {
      throw bad_expected_access<E>(error());
    }
  }

  constexpr E& error() & noexcept { return std::get<1>(storage_); }
  constexpr E const& error() const& noexcept { return std::get<1>(storage_); }
  constexpr E&& error() && noexcept { return std::move(std::get<1>(storage_)); }

  constexpr void operator*() const noexcept {}

 private:
  std::variant<std::monostate, E> storage_;
};

template <class T, class E>
constexpr bool operator==(expected<T, E> const& lhs, expected<T, E> const& rhs) {
  if (lhs.has_value() != rhs.has_value()) {
    return false;
  }
  if (!lhs.has_value()) {
    return lhs.error() == rhs.error();
  }
  if constexpr (std::is_void_v<T>) {
    return true;
  } else {
    return *lhs == *rhs;
  }
}

template <class T, class E, class G>
constexpr bool operator==(expected<T, E> const& x, unexpected<G> const& e) {
  return !x.has_value() && x.error() == e.error();
}

#endif

}  // namespace sinkcoro
