/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scale/scale_decoder_stream.hpp"

namespace slashtags::scale {
  namespace {
    CompactInteger decodeCompactInteger(ScaleDecoderStream &stream) {
      auto first_byte = stream.nextByte();

      const uint8_t flag = first_byte & 0b00000011u;

      size_t number = 0u;

      switch (flag) {
        case 0b00u: {
          number = static_cast<size_t>(first_byte >> 2u);
          break;
        }

        case 0b01u: {
          auto second_byte = stream.nextByte();

          number = (static_cast<size_t>(first_byte & 0b11111100u)
                    + static_cast<size_t>(second_byte) * 256u)
                   >> 2u;
          break;
        }

        case 0b10u: {
          number = first_byte;
          size_t multiplier = 256u;
          if (!stream.hasMore(3u)) {
            raise(DecodeError::NOT_ENOUGH_DATA);
          }

          for (auto i = 0u; i < 3u; ++i) {
            number += stream.nextByte() * multiplier;
            multiplier = multiplier << 8u;
          }
          number = number >> 2u;
          break;
        }

        default: {
          auto bytes_count = (first_byte >> 2u) + 4u;
          if (!stream.hasMore(bytes_count)) {
            raise(DecodeError::NOT_ENOUGH_DATA);
          }

          CompactInteger multiplier{1u};
          CompactInteger value = 0;
          for (auto i = 0u; i < bytes_count; ++i) {
            value += stream.nextByte() * multiplier;
            multiplier *= 256u;
          }

          return value;
        }
      }

      return CompactInteger{number};
    }
  }  // namespace

  ScaleDecoderStream::ScaleDecoderStream(ByteSpan span)
      : span_{span}, current_index_{0} {}

  bool ScaleDecoderStream::decodeBool() {
    auto byte = nextByte();
    switch (byte) {
      case 0u:
        return false;
      case 1u:
        return true;
      default:
        raise(DecodeError::UNEXPECTED_VALUE);
    }
  }

  size_t ScaleDecoderStream::decodeLength() {
    CompactInteger size{0u};
    *this >> size;
    if (size > span_.size()) {
      raise(DecodeError::TOO_MANY_ITEMS);
    }
    return size.convert_to<size_t>();
  }

  ScaleDecoderStream &ScaleDecoderStream::operator>>(CompactInteger &v) {
    v = decodeCompactInteger(*this);
    return *this;
  }

  ScaleDecoderStream &ScaleDecoderStream::operator>>(std::string &v) {
    std::vector<uint8_t> collection;
    *this >> collection;
    v.assign(collection.begin(), collection.end());
    return *this;
  }

  bool ScaleDecoderStream::hasMore(uint64_t n) const {
    return static_cast<SizeType>(current_index_ + n) <= span_.size();
  }

  uint8_t ScaleDecoderStream::nextByte() {
    if (not hasMore(1)) {
      raise(DecodeError::NOT_ENOUGH_DATA);
    }
    return span_[current_index_++];
  }
}  // namespace slashtags::scale
