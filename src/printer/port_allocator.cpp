// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "port_allocator.h"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace forgefleet {

namespace {

uint16_t checked_port(int port) {
    if (port < 1 || port > 65535) {
        throw std::invalid_argument("Port " + std::to_string(port) + " outside 1-65535");
    }
    return static_cast<uint16_t>(port);
}

} // namespace

PortAllocator::PortAllocator(int first_port, int last_port)
    : first_port_(checked_port(first_port)), last_port_(checked_port(last_port)) {
    if (first_port_ > last_port_) {
        throw std::invalid_argument("Empty port range " + std::to_string(first_port) + "-" +
                                    std::to_string(last_port));
    }
    spdlog::debug("[PortAllocator] Range {}-{} ({} ports)", first_port_, last_port_, capacity());
}

SessionError PortAllocator::acquire(const ContextId& context_id, uint16_t& port_out) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = by_context_.find(context_id);
    if (existing != by_context_.end()) {
        port_out = existing->second;
        return SessionErrorHelper::success();
    }

    // by_port_ is ordered, so the first gap is the smallest free port
    uint32_t candidate = first_port_;
    for (const auto& [port, owner] : by_port_) {
        if (port != candidate) {
            break;
        }
        ++candidate;
    }

    if (candidate > last_port_) {
        spdlog::warn("[PortAllocator] Pool exhausted, {} refused", context_id);
        return SessionErrorHelper::pool_exhausted(first_port_, last_port_);
    }

    auto port = static_cast<uint16_t>(candidate);
    by_port_.emplace(port, context_id);
    by_context_.emplace(context_id, port);
    port_out = port;

    spdlog::debug("[PortAllocator] Leased {} to {} ({} free)", port, context_id,
                  capacity() - by_port_.size());
    return SessionErrorHelper::success();
}

bool PortAllocator::release(const ContextId& context_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = by_context_.find(context_id);
    if (it == by_context_.end()) {
        return false;
    }

    uint16_t port = it->second;
    by_port_.erase(port);
    by_context_.erase(it);

    spdlog::debug("[PortAllocator] Released {} from {}", port, context_id);
    return true;
}

std::optional<uint16_t> PortAllocator::port_for(const ContextId& context_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_context_.find(context_id);
    if (it == by_context_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PortAllocator::is_leased(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_port_.count(port) > 0;
}

size_t PortAllocator::leased_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_port_.size();
}

size_t PortAllocator::available_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity() - by_port_.size();
}

size_t PortAllocator::capacity() const {
    return static_cast<size_t>(last_port_) - first_port_ + 1;
}

std::vector<PortLease> PortAllocator::leases() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PortLease> result;
    result.reserve(by_port_.size());
    for (const auto& [port, owner] : by_port_) {
        result.push_back({port, owner});
    }
    return result;
}

} // namespace forgefleet
