/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

#include "scale/scale_error.hpp"
#include "scale/types.hpp"

namespace slashtags::scale {
  /**
   * @class ScaleEncoderStream designed to scale-encode data to stream
   */
  class ScaleEncoderStream {
   public:
    // special tag to differentiate encoding streams from others
    static constexpr auto is_encoder_stream = true;

    ScaleEncoderStream() = default;

    /**
     * @return vector of bytes containing encoded data
     */
    const ByteArray &data() const {
      return stream_;
    }

    ByteArray takeData() {
      return std::move(stream_);
    }

    /**
     * Get amount of encoded data written to the stream
     * @return size in bytes
     */
    size_t size() const {
      return stream_.size();
    }

    /**
     * @brief scale-encodes pair of values
     */
    template <class F, class S>
    ScaleEncoderStream &operator<<(const std::pair<F, S> &p) {
      return *this << p.first << p.second;
    }

    /**
     * @brief scale-encodes tuple
     */
    template <class... Ts>
    ScaleEncoderStream &operator<<(const std::tuple<Ts...> &v) {
      std::apply([this](const auto &...item) { (*this << ... << item); }, v);
      return *this;
    }

    /**
     * @brief scale-encodes variant value as type index followed by the value
     */
    template <class... T>
    ScaleEncoderStream &operator<<(const std::variant<T...> &v) {
      *this << static_cast<uint8_t>(v.index());
      std::visit([this](const auto &item) { *this << item; }, v);
      return *this;
    }

    /**
     * @brief scale-encodes value behind shared_ptr
     */
    template <class T>
    ScaleEncoderStream &operator<<(const std::shared_ptr<T> &v) {
      if (v == nullptr) {
        raise(EncodeError::DEREF_NULLPOINTER);
      }
      return *this << *v;
    }

    /**
     * @brief scale-encodes collection of same type items
     */
    template <class T>
    ScaleEncoderStream &operator<<(const std::vector<T> &c) {
      return encodeCollection(c.size(), c.begin(), c.end());
    }

    /**
     * @brief scale-encodes optional value
     */
    template <class T>
    ScaleEncoderStream &operator<<(const std::optional<T> &v) {
      if (!v.has_value()) {
        return putByte(0u);
      }
      return putByte(1u) << *v;
    }

    /**
     * @brief appends sequence of bytes prefixed by its length
     */
    template <class T>
    ScaleEncoderStream &operator<<(const std::span<T> &v) {
      return encodeCollection(v.size(), v.begin(), v.end());
    }

    /**
     * @brief scale-encodes array of items, no length prefix
     */
    template <typename T, size_t size>
    ScaleEncoderStream &operator<<(const std::array<T, size> &a) {
      for (const auto &e : a) {
        *this << e;
      }
      return *this;
    }

    /**
     * @brief scale-encodes a string view
     */
    ScaleEncoderStream &operator<<(std::string_view sv) {
      return encodeCollection(sv.size(), sv.begin(), sv.end());
    }

    /**
     * @brief scale-encodes enumeration as its underlying integer
     */
    template <typename E>
      requires std::is_enum_v<E>
    ScaleEncoderStream &operator<<(E e) {
      return *this << static_cast<std::underlying_type_t<E>>(e);
    }

    /**
     * @brief scale-encodes any integral type including bool
     */
    template <typename T,
              typename I = std::decay_t<T>,
              typename = std::enable_if_t<std::is_integral<I>::value>>
    ScaleEncoderStream &operator<<(T &&v) {
      if constexpr (std::is_same<I, bool>::value) {
        uint8_t byte = (v ? 1u : 0u);
        return putByte(byte);
      } else if constexpr (sizeof(I) == 1u) {
        return putByte(static_cast<uint8_t>(v));
      } else {
        // little-endian fixed width
        using U = std::make_unsigned_t<I>;
        auto value = static_cast<U>(v);
        for (size_t i = 0; i < sizeof(I); ++i) {
          putByte(static_cast<uint8_t>(value & 0xFFu));
          value = static_cast<U>(value >> 8u);
        }
        return *this;
      }
    }

    /**
     * @brief scale-encodes CompactInteger value as compact integer
     */
    ScaleEncoderStream &operator<<(const CompactInteger &v);

   protected:
    template <class It>
    ScaleEncoderStream &encodeCollection(const CompactInteger &size,
                                         It &&begin,
                                         It &&end) {
      *this << size;
      for (auto &&it = begin; it != end; ++it) {
        *this << *it;
      }
      return *this;
    }

    ScaleEncoderStream &putByte(uint8_t v);

   private:
    ByteArray stream_;
  };

}  // namespace slashtags::scale
