/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scale/scale_encoder_stream.hpp"

namespace slashtags::scale {
  namespace {
    // must not use these functions outside encodeCompactInteger
    inline void encodeFirstCategory(uint8_t value, ScaleEncoderStream &out) {
      // only values from [0, kMinUint16) can be put here
      out << static_cast<uint8_t>(value << 2u);
    }

    inline void encodeSecondCategory(uint16_t value, ScaleEncoderStream &out) {
      // only values from [kMinUint16, kMinUint32) can be put here
      auto v = value;
      v <<= 2u;  // v *= 4
      v += 1u;   // set 0b01 flag
      auto minor_byte = static_cast<uint8_t>(v & 0xFFu);
      v >>= 8u;
      auto major_byte = static_cast<uint8_t>(v & 0xFFu);

      out << minor_byte << major_byte;
    }

    inline void encodeThirdCategory(uint32_t value, ScaleEncoderStream &out) {
      // only values from [kMinUint32, kMinBigInteger) can be put here
      uint32_t v = (value << 2u) + 2;
      out << v;
    }

    size_t countBytes(CompactInteger v) {
      size_t counter = 0;
      do {
        ++counter;
      } while ((v >>= 8) != 0);
      return counter;
    }

    void encodeCompactInteger(const CompactInteger &value,
                              ScaleEncoderStream &out) {
      if (value < 0) {
        raise(EncodeError::NEGATIVE_COMPACT_INTEGER);
      }

      if (value < compact::EncodingCategoryLimits::kMinUint16) {
        encodeFirstCategory(value.convert_to<uint8_t>(), out);
        return;
      }

      if (value < compact::EncodingCategoryLimits::kMinUint32) {
        encodeSecondCategory(value.convert_to<uint16_t>(), out);
        return;
      }

      if (value < compact::EncodingCategoryLimits::kMinBigInteger) {
        encodeThirdCategory(value.convert_to<uint32_t>(), out);
        return;
      }

      // number of bytes required to represent value, at least 4
      size_t big_int_length = std::max<size_t>(countBytes(value), 4);

      if (big_int_length > 67) {
        raise(EncodeError::COMPACT_INTEGER_TOO_BIG);
      }

      /* 6 major bits of the header hold the byte count minus 4,
       * minor 2 bits hold the encoding option 0b11 */
      auto header = static_cast<uint8_t>((big_int_length - 4) * 4 + 3);
      out << header;

      CompactInteger v{value};
      for (size_t i = 0; i < big_int_length; ++i) {
        out << static_cast<uint8_t>(v & 0xFF);
        v >>= 8;
      }
    }
  }  // namespace

  ScaleEncoderStream &ScaleEncoderStream::putByte(uint8_t v) {
    stream_.push_back(v);
    return *this;
  }

  ScaleEncoderStream &ScaleEncoderStream::operator<<(const CompactInteger &v) {
    encodeCompactInteger(v, *this);
    return *this;
  }

}  // namespace slashtags::scale
