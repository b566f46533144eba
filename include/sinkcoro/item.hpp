#pragma once

#include <concepts>
#include <cstddef>
#include <ranges>
#include <span>
#include <type_traits>

namespace sinkcoro {

namespace detail {

template <class T>
inline constexpr bool is_byte_like_v =
  std::is_same_v<std::remove_cv_t<T>, std::byte> ||
  std::is_same_v<std::remove_cv_t<T>, unsigned char> || std::is_same_v<std::remove_cv_t<T>, char>;

}  // namespace detail

/// A value a sink can accept: anything movable that can be viewed as a contiguous run of bytes.
///
/// Models: `std::string`, `std::string_view`, `std::vector<std::byte>`, `std::vector<char>`,
/// `std::array<unsigned char, N>`, `std::span<std::byte const>`, ...
///
/// The sink keeps the item itself (not a copy of its bytes) until it has been written, so a
/// view type such as `std::string_view` must outlive the write.
template <class Item>
concept byte_item = std::movable<Item> && std::ranges::contiguous_range<Item const> &&
                    std::ranges::sized_range<Item const> &&
                    detail::is_byte_like_v<std::ranges::range_value_t<Item const>>;

/// View the bytes of an item, in order and unmodified.
template <byte_item Item>
inline auto item_bytes(Item const& item) noexcept -> std::span<std::byte const> {
  auto const* data = std::ranges::data(item);
  auto const size = static_cast<std::size_t>(std::ranges::size(item));
  return std::as_bytes(std::span{data, size});
}

}  // namespace sinkcoro
