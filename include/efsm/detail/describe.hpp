#pragma once

#include <ostream>
#include <string>
#include <type_traits>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ostr.h>

namespace efsm::detail {

template <typename T>
concept streamable = requires(std::ostream& os, const T& value) {
  { os << value } -> std::convertible_to<std::ostream&>;
};

// Human-readable rendering of an arbitrary state or event value for log
// messages. Prefers fmt, then operator<<, then the underlying enum value.
template <typename T>
[[nodiscard]] std::string describe(const T& value) {
  if constexpr (fmt::is_formattable<T>::value) {
    return fmt::format("{}", value);
  } else if constexpr (streamable<T>) {
    return fmt::format("{}", fmt::streamed(value));
  } else if constexpr (std::is_enum_v<T>) {
    return fmt::format("{}", static_cast<std::underlying_type_t<T>>(value));
  } else {
    return "<?>";
  }
}

}  // namespace efsm::detail
