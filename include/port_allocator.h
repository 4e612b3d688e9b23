// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "session_error.h"
#include "session_types.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace forgefleet {

struct PortLease {
    uint16_t port = 0;
    ContextId context_id;
};

/**
 * @brief Leases camera proxy ports from a fixed inclusive range
 *
 * Selection is smallest-free-first, so a port freed by teardown is the next
 * one handed out. Each context holds at most one lease.
 *
 * Thread-safe; all entry points serialize on one mutex.
 */
class PortAllocator {
  public:
    /**
     * @throws std::invalid_argument if the range is empty or outside 1-65535
     */
    PortAllocator(int first_port, int last_port);

    PortAllocator(const PortAllocator&) = delete;
    PortAllocator& operator=(const PortAllocator&) = delete;

    /**
     * @brief Lease the smallest free port to a context
     *
     * Idempotent: a context that already holds a lease gets the same port.
     *
     * @param context_id Lease owner
     * @param port_out Leased port on success
     * @return POOL_EXHAUSTED when every port is leased
     */
    SessionError acquire(const ContextId& context_id, uint16_t& port_out);

    /**
     * @brief Free the context's lease
     * @return true if a lease was released, false if the context held none
     */
    bool release(const ContextId& context_id);

    [[nodiscard]] std::optional<uint16_t> port_for(const ContextId& context_id) const;
    [[nodiscard]] bool is_leased(uint16_t port) const;
    [[nodiscard]] size_t leased_count() const;
    [[nodiscard]] size_t available_count() const;
    [[nodiscard]] size_t capacity() const;
    [[nodiscard]] std::vector<PortLease> leases() const;

    uint16_t first_port() const {
        return first_port_;
    }
    uint16_t last_port() const {
        return last_port_;
    }

  private:
    const uint16_t first_port_;
    const uint16_t last_port_;

    mutable std::mutex mutex_;
    std::map<uint16_t, ContextId> by_port_;
    std::unordered_map<ContextId, uint16_t> by_context_;
};

} // namespace forgefleet
