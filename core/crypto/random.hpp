/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>

#include "common/blob.hpp"
#include "outcome/outcome.hpp"

namespace slashtags::crypto {

  /**
   * Fills \param out from the OpenSSL CSPRNG
   */
  outcome::result<void> fillRandomly(std::span<uint8_t> out);

  template <size_t N>
  outcome::result<common::Blob<N>> randomBytes() {
    common::Blob<N> blob;
    OUTCOME_TRY(fillRandomly(blob));
    return blob;
  }

}  // namespace slashtags::crypto
