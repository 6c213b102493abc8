/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "store/store_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(slashtags::store, StoreError, e) {
  using E = slashtags::store::StoreError;
  switch (e) {
    case E::CLOSED:
      return "Core or corestore is closed";
    case E::READ_ONLY:
      return "Core is not writable, its key pair is unknown";
    case E::MISSING_KEY:
      return "Neither key, key pair nor name is given to select a core";
    case E::INVALID_SIGNATURE:
      return "Block signature does not match the core key";
  }
  return "Unknown StoreError";
}

OUTCOME_CPP_DEFINE_CATEGORY(slashtags::store, DriveError, e) {
  using E = slashtags::store::DriveError;
  switch (e) {
    case E::MISSING_ENCRYPTION_KEY:
      return "Encrypted drive can not be opened without encryption key";
    case E::READ_ONLY:
      return "Drive is read-only";
    case E::NOT_READY:
      return "Drive is not ready";
    case E::CLOSED:
      return "Drive is closed";
    case E::INVALID_ENTRY:
      return "Drive entry can not be decoded";
  }
  return "Unknown DriveError";
}
