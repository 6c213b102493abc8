/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "network/connection.hpp"
#include "store/core.hpp"

namespace slashtags::store {

  /**
   * Collection of cores, one in-memory core per key. Namespaces share cores
   * and replication with their root store, but derive different key pairs
   * for the same name.
   */
  class Corestore {
   public:
    virtual ~Corestore() = default;

    virtual std::shared_ptr<Corestore> namespaced(common::BufferView ns) = 0;

    /**
     * @return public key of the core \param options name, without opening it
     */
    virtual outcome::result<PublicKey> resolveKey(
        const CoreOptions &options) const = 0;

    /// opens the core, every successful get() is paired with a release()
    virtual outcome::result<std::shared_ptr<Core>> get(
        const CoreOptions &options) = 0;

    /// drops a single reference taken by get(), no-op once closed
    virtual void release(const std::shared_ptr<Core> &core) = 0;

    /**
     * Replicates every core of the store over \param connection, repeated
     * calls for the same connection are no-op
     */
    virtual void replicate(
        const std::shared_ptr<network::Connection> &connection) = 0;

    /**
     * Closes the cores opened through this namespace, unless some other
     * namespace still has them open
     */
    virtual Coro<void> close() = 0;

    virtual bool closed() const = 0;
  };

}  // namespace slashtags::store
