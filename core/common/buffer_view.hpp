/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <compare>
#include <ostream>
#include <span>
#include <string_view>

#include <fmt/format.h>

#include "common/hexutil.hpp"
#include "macro/endianness_utils.hpp"

namespace tessera::common {

  /// Non-owning view of contiguous bytes
  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    template <typename T>
      requires std::is_integral_v<std::decay_t<T>> and (sizeof(T) == 1)
    BufferView(std::span<T> other)
        : span(reinterpret_cast<const uint8_t *>(other.data()), other.size()) {}

    std::string toHex() const {
      return hex_lower(*this);
    }

    std::string_view toStringView() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const char *>(data()), size()};
    }

    auto operator<=>(const BufferView &other) const {
      return std::lexicographical_compare_three_way(
          span::begin(), span::end(), other.begin(), other.end());
    }

    bool operator==(const BufferView &other) const {
      return std::equal(
          span::begin(), span::end(), other.begin(), other.end());
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << view.toHex();
  }

}  // namespace tessera::common

namespace tessera {
  using common::BufferView;
}  // namespace tessera

template <>
struct fmt::formatter<tessera::common::BufferView> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = 's';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const tessera::common::BufferView &view, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (view.empty()) {
      static constexpr string_view message("<empty>");
      return std::copy(std::begin(message), std::end(message), ctx.out());
    }

    if (presentation == 's' && view.size() > 5) {
      return fmt::format_to(
          ctx.out(),
          "0x{:04x}…{:04x}",
          // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
          htobe16(*reinterpret_cast<const uint16_t *>(view.data())),
          // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
          htobe16(*reinterpret_cast<const uint16_t *>(view.data() + view.size()
                                                      - sizeof(uint16_t))));
    }

    return fmt::format_to(ctx.out(), "0x{}", view.toHex());
  }
};
