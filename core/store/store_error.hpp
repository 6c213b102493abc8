/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace slashtags::store {

  enum class StoreError {
    CLOSED = 1,
    READ_ONLY,
    MISSING_KEY,
    INVALID_SIGNATURE,
  };

  enum class DriveError {
    MISSING_ENCRYPTION_KEY = 1,
    READ_ONLY,
    NOT_READY,
    CLOSED,
    INVALID_ENTRY,
  };

}  // namespace slashtags::store

OUTCOME_HPP_DECLARE_ERROR(slashtags::store, StoreError);
OUTCOME_HPP_DECLARE_ERROR(slashtags::store, DriveError);
