/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace tessera::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
    UNKNOWN
  };
}  // namespace tessera::common

OUTCOME_HPP_DECLARE_ERROR(tessera::common, UnhexError);

namespace tessera::common {
  /**
   * @brief Converts bytes to hex representation
   * @param bytes to convert
   * @return lowercase hexstring
   */
  std::string hex_lower(std::span<const uint8_t> bytes);

  /**
   * @brief Converts bytes to hex representation with prefix 0x
   */
  std::string hex_lower_0x(std::span<const uint8_t> bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex string, upper or lower case
   * @return result containing array of bytes if input string is hex encoded and
   * has even length
   *
   * @see
   * https://www.boost.org/doc/libs/1_51_0/libs/algorithm/doc/html/the_boost_algorithm_library/Misc/hex.html
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

}  // namespace tessera::common
