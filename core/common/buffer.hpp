/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <boost/container_hash/hash.hpp>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"
#include "outcome/outcome.hpp"

namespace tessera::common {

  /**
   * @brief Class represents arbitrary (including empty) byte buffer.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    Buffer() = default;

    explicit Buffer(const Base &other) : Base(other) {}
    Buffer(Base &&other) : Base(std::move(other)) {}

    Buffer(const BufferView &s) : Base(s.begin(), s.end()) {}

    Buffer(const uint8_t *begin, const uint8_t *end) : Base(begin, end){};

    using Base::Base;
    using Base::operator=;

    Buffer &operator+=(const BufferView &view) {
      return put(view);
    }

    /**
     * @brief Put a sequence of bytes as view into byte buffer
     * @param view arbitrary span of bytes
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(const BufferView &view) {
      Base::insert(Base::end(), view.begin(), view.end());
      return *this;
    }

    Buffer &put(std::string_view view) {
      Base::insert(Base::end(), view.begin(), view.end());
      return *this;
    }

    const Base &asVector() const {
      return *this;
    }

    /**
     * Returns a copy of a part of the buffer
     * Works alike subspan() of std::span
     */
    Buffer subbuffer(size_t offset = 0, size_t length = -1) const {
      return Buffer(view(offset, length));
    }

    BufferView view(size_t offset = 0, size_t length = -1) const {
      return std::span(*this).subspan(offset, length);
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    static outcome::result<Buffer> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return outcome::success(Buffer(std::move(bytes)));
    }

    std::string_view asString() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return std::string_view(reinterpret_cast<const char *>(Base::data()),
                              Base::size());
    }

    static Buffer fromString(std::string_view src) {
      return {src.begin(), src.end()};
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const Buffer &buffer) {
      return s << static_cast<const Base &>(buffer);
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, Buffer &buffer) {
      return s >> static_cast<Base &>(buffer);
    }
  };

  inline std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << BufferView(buffer);
  }

  namespace literals {
    /// creates a buffer filled with characters from the original string
    inline Buffer operator""_buf(const char *c, size_t s) {
      std::vector<uint8_t> chars(c, c + s);
      return Buffer(std::move(chars));
    }

    inline Buffer operator""_hex2buf(const char *hex, unsigned long size) {
      return Buffer::fromHex(std::string_view{hex, size}).value();
    }
  }  // namespace literals

}  // namespace tessera::common

namespace tessera {
  using common::Buffer;
}  // namespace tessera

template <>
struct std::hash<tessera::common::Buffer> {
  size_t operator()(const tessera::common::Buffer &x) const {
    return boost::hash_range(x.begin(), x.end());
  }
};

template <>
struct fmt::formatter<tessera::common::Buffer>
    : fmt::formatter<tessera::common::BufferView> {};
