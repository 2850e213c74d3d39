/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <type_traits>

#include <openssl/crypto.h>

namespace tessera::crypto {

  /**
   * A wrapper around a span of data
   * that securely cleans up the data when goes out of scope
   */
  template <typename T, size_t Size = std::dynamic_extent>
    requires std::is_standard_layout_v<T>
  struct SecureCleanGuard {
    static_assert(!std::is_const_v<T>,
                  "Secure clean guard must have write access to the data");

    explicit SecureCleanGuard(std::span<T, Size> data) : data{data} {}

    SecureCleanGuard(const SecureCleanGuard &) = delete;
    SecureCleanGuard &operator=(const SecureCleanGuard &) = delete;
    SecureCleanGuard(SecureCleanGuard &&) = delete;
    SecureCleanGuard &operator=(SecureCleanGuard &&) = delete;

    ~SecureCleanGuard() {
      OPENSSL_cleanse(data.data(), data.size_bytes());
    }

    std::span<T, Size> data;
  };

  template <typename T, size_t N>
  SecureCleanGuard(std::array<T, N> &) -> SecureCleanGuard<T, N>;

}  // namespace tessera::crypto
