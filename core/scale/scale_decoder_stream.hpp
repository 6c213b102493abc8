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
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include "scale/scale_error.hpp"
#include "scale/types.hpp"

namespace slashtags::scale {
  class ScaleDecoderStream {
   public:
    // special tag to differentiate decoding streams from others
    static constexpr auto is_decoder_stream = true;

    using ByteSpan = std::span<const uint8_t>;
    using SizeType = ByteSpan::size_type;

    explicit ScaleDecoderStream(ByteSpan span);

    /**
     * @brief scale-decodes pair of values
     */
    template <class F, class S>
    ScaleDecoderStream &operator>>(std::pair<F, S> &p) {
      return *this >> p.first >> p.second;
    }

    /**
     * @brief scale-decoding of tuple
     */
    template <class... T>
    ScaleDecoderStream &operator>>(std::tuple<T...> &v) {
      std::apply([this](auto &...item) { (*this >> ... >> item); }, v);
      return *this;
    }

    /**
     * @brief scale-decoding of variant
     */
    template <class... Ts>
    ScaleDecoderStream &operator>>(std::variant<Ts...> &v) {
      // first byte means type index
      uint8_t type_index = 0u;
      *this >> type_index;

      if (type_index >= sizeof...(Ts)) {
        raise(DecodeError::WRONG_TYPE_INDEX);
      }

      tryDecodeAsOneOfVariant<0>(v, type_index);
      return *this;
    }

    /**
     * @brief scale-decodes shared_ptr value
     */
    template <class T>
    ScaleDecoderStream &operator>>(std::shared_ptr<T> &v) {
      using mutableT = std::remove_const_t<T>;
      static_assert(std::is_default_constructible_v<mutableT>);

      auto value = std::make_shared<mutableT>();
      *this >> *value;
      v = std::move(value);
      return *this;
    }

    /**
     * @brief scale-decodes enumeration from its underlying integer
     */
    template <typename E>
      requires std::is_enum_v<E>
    ScaleDecoderStream &operator>>(E &e) {
      std::underlying_type_t<E> value{};
      *this >> value;
      e = static_cast<E>(value);
      return *this;
    }

    /**
     * @brief scale-decodes any integral type including bool
     */
    template <typename T,
              typename I = std::decay_t<T>,
              typename = std::enable_if_t<std::is_integral<I>::value>>
    ScaleDecoderStream &operator>>(T &v) {
      if constexpr (std::is_same<I, bool>::value) {
        v = decodeBool();
      } else if constexpr (sizeof(I) == 1u) {
        v = static_cast<I>(nextByte());
      } else {
        if (not hasMore(sizeof(I))) {
          raise(DecodeError::NOT_ENOUGH_DATA);
        }
        using U = std::make_unsigned_t<I>;
        U value = 0;
        for (size_t i = 0; i < sizeof(I); ++i) {
          value |= static_cast<U>(static_cast<U>(nextByte()) << (8u * i));
        }
        v = static_cast<I>(value);
      }
      return *this;
    }

    /**
     * @brief scale-decodes any optional value
     */
    template <class T>
    ScaleDecoderStream &operator>>(std::optional<T> &v) {
      using mutableT = std::remove_const_t<T>;
      static_assert(std::is_default_constructible_v<mutableT>);

      bool has_value = false;
      *this >> has_value;
      if (!has_value) {
        v.reset();
        return *this;
      }
      v.emplace();
      return *this >> *v;
    }

    /**
     * @brief scale-decodes compact integer value
     */
    ScaleDecoderStream &operator>>(CompactInteger &v);

    /**
     * @brief decodes vector of items
     */
    template <class T>
    ScaleDecoderStream &operator>>(std::vector<T> &v) {
      auto item_count = decodeLength();

      if constexpr (std::is_integral_v<T> and sizeof(T) == 1) {
        if (not hasMore(item_count)) {
          raise(DecodeError::NOT_ENOUGH_DATA);
        }
        auto bytes = span_.subspan(current_index_, item_count);
        v.assign(bytes.begin(), bytes.end());
        current_index_ += item_count;
      } else {
        static_assert(std::is_default_constructible_v<T>);
        // every item takes at least one byte
        if (not hasMore(item_count)) {
          raise(DecodeError::TOO_MANY_ITEMS);
        }
        std::vector<T> vec(item_count);
        for (auto &item : vec) {
          *this >> item;
        }
        v = std::move(vec);
      }
      return *this;
    }

    /**
     * @brief decodes array of items
     */
    template <class T, size_t size>
    ScaleDecoderStream &operator>>(std::array<T, size> &a) {
      for (auto &item : a) {
        *this >> item;
      }
      return *this;
    }

    /**
     * @brief decodes string from stream
     */
    ScaleDecoderStream &operator>>(std::string &v);

    /**
     * @brief hasMore Checks whether n more bytes are available
     */
    bool hasMore(uint64_t n) const;

    /**
     * @brief takes one byte from stream and advances current position
     */
    uint8_t nextByte();

    ByteSpan span() const {
      return span_;
    }

    SizeType currentIndex() const {
      return current_index_;
    }

   private:
    bool decodeBool();

    size_t decodeLength();

    template <size_t I, class... Ts>
    void tryDecodeAsOneOfVariant(std::variant<Ts...> &v, size_t i) {
      using T = std::tuple_element_t<I, std::tuple<Ts...>>;
      static_assert(std::is_default_constructible_v<T>);
      if (I == i) {
        T val;
        *this >> val;
        v = std::move(val);
        return;
      }
      if constexpr (sizeof...(Ts) > I + 1) {
        tryDecodeAsOneOfVariant<I + 1>(v, i);
      }
    }

    ByteSpan span_;
    SizeType current_index_;
  };

}  // namespace slashtags::scale
