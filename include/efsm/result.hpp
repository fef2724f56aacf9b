#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace efsm {

// Error wrapper used to construct a failed Result.
template <typename E>
class Unexpected {
 public:
  constexpr explicit Unexpected(E error) : error_(std::move(error)) {}

  [[nodiscard]] constexpr const E& error() const& noexcept { return error_; }
  [[nodiscard]] constexpr E& error() & noexcept { return error_; }
  [[nodiscard]] constexpr E&& error() && noexcept { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
Unexpected(E) -> Unexpected<E>;

namespace detail {

template <typename T>
struct is_unexpected : std::false_type {};

template <typename E>
struct is_unexpected<Unexpected<E>> : std::true_type {};

}  // namespace detail

// Value-or-error return type mirroring std::expected<T, E> for C++20
// (std::expected needs C++23). Covers the subset the engine needs:
// has_value, value, error, value_or. Unexpected plays std::unexpected.
template <typename T, typename E>
class [[nodiscard]] Result {
 public:
  using value_type = T;
  using error_type = E;

  template <typename U = T>
    requires(std::is_constructible_v<T, U &&> &&
             !std::is_same_v<std::remove_cvref_t<U>, Result> &&
             !detail::is_unexpected<std::remove_cvref_t<U>>::value)
  constexpr Result(U&& value)
      : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  template <typename G>
    requires std::is_constructible_v<E, const G&>
  constexpr Result(const Unexpected<G>& failure)
      : storage_(std::in_place_index<1>, failure.error()) {}

  template <typename G>
    requires std::is_constructible_v<E, G &&>
  constexpr Result(Unexpected<G>&& failure)
      : storage_(std::in_place_index<1>, std::move(failure).error()) {}

  [[nodiscard]] constexpr bool has_value() const noexcept {
    return storage_.index() == 0;
  }
  constexpr explicit operator bool() const noexcept { return has_value(); }

  // Accessing the wrong alternative throws std::bad_variant_access.
  [[nodiscard]] constexpr T& value() & { return std::get<0>(storage_); }
  [[nodiscard]] constexpr const T& value() const& {
    return std::get<0>(storage_);
  }
  [[nodiscard]] constexpr T&& value() && {
    return std::get<0>(std::move(storage_));
  }

  [[nodiscard]] constexpr E& error() & { return std::get<1>(storage_); }
  [[nodiscard]] constexpr const E& error() const& {
    return std::get<1>(storage_);
  }
  [[nodiscard]] constexpr E&& error() && {
    return std::get<1>(std::move(storage_));
  }

  constexpr T& operator*() & { return value(); }
  constexpr const T& operator*() const& { return value(); }
  constexpr T* operator->() { return &value(); }
  constexpr const T* operator->() const { return &value(); }

  template <typename U>
  [[nodiscard]] constexpr T value_or(U&& fallback) const& {
    return has_value() ? value() : static_cast<T>(std::forward<U>(fallback));
  }

 private:
  std::variant<T, E> storage_;
};

}  // namespace efsm
