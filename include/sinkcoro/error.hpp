#pragma once

#include <system_error>
#include <type_traits>

namespace sinkcoro {

/// Status and usage conditions reported by the sink itself.
///
/// Errors produced by the wrapped writer are never mapped onto this enum; they reach the
/// caller as the writer's own `std::error_code`.
enum class error {
  /// The writer accepted no bytes; the pending item is retained for a later drive.
  would_block = 1,

  /// An operation cannot proceed because another operation on the same sink is in-flight.
  busy,

  /// An item was offered while a previous item is still pending.
  not_ready,

  /// The sink has been closed successfully and accepts no further operations.
  sink_closed,

  /// The writer reported an error earlier; the sink is unusable.
  sink_failed,
};

inline auto make_error_code(error e) -> std::error_code;

}  // namespace sinkcoro

namespace std {

template <>
struct is_error_code_enum<sinkcoro::error> : std::true_type {};

}  // namespace std

#include <sinkcoro/impl/error.ipp>
