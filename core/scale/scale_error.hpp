/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

#include <boost/throw_exception.hpp>

#include "outcome/outcome.hpp"

namespace slashtags::scale {
  /**
   * @brief EncodeError enum provides error codes for Encode methods
   */
  enum class EncodeError {        // 0 is reserved for success
    COMPACT_INTEGER_TOO_BIG = 1,  ///< compact integer can't be more than 2**536
    NEGATIVE_COMPACT_INTEGER,     ///< cannot compact-encode negative integers
    DEREF_NULLPOINTER,            ///< dereferencing a null pointer
  };

  /**
   * @brief DecoderError enum provides codes of errors for Decoder methods
   */
  enum class DecodeError {  // 0 is reserved for success
    NOT_ENOUGH_DATA = 1,    ///< not enough data to decode a value
    UNEXPECTED_VALUE,       ///< unexpected value
    TOO_MANY_ITEMS,         ///< too many items, cannot address them in memory
    WRONG_TYPE_INDEX,       ///< wrong type index, cannot decode variant
    REDUNDANT_DATA,         ///< input has bytes left after the value
  };

}  // namespace slashtags::scale

OUTCOME_HPP_DECLARE_ERROR(slashtags::scale, EncodeError)
OUTCOME_HPP_DECLARE_ERROR(slashtags::scale, DecodeError)

namespace slashtags::scale {
  /**
   * @brief throws error code as exception; streams report errors this way
   * and `scale::encode`/`scale::decode` turn them back into outcome
   */
  template <typename T>
    requires std::is_enum_v<T>
  [[noreturn]] void raise(T t) {
    std::error_code ec = make_error_code(t);
    boost::throw_exception(std::system_error(ec));
  }
}  // namespace slashtags::scale
