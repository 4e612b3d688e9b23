// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/network_validation.h"

#include <algorithm>
#include <cctype>

namespace forgefleet {

namespace {

constexpr size_t MAX_HOSTNAME_LENGTH = 253; // RFC 1035
constexpr size_t MAX_LABEL_LENGTH = 63;

std::string trim(const std::string& s) {
    auto start =
        std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                   return std::isspace(c);
               }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool looks_like_ipv4(const std::string& address) {
    return std::all_of(address.begin(), address.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '.';
    });
}

bool is_valid_ipv4(const std::string& address) {
    int octets = 0;
    size_t start = 0;
    while (start <= address.size()) {
        size_t dot = address.find('.', start);
        if (dot == std::string::npos) {
            dot = address.size();
        }
        size_t len = dot - start;
        // Empty octet ("10..0.1") or more than three digits
        if (len == 0 || len > 3) {
            return false;
        }
        int value = 0;
        for (size_t i = start; i < dot; ++i) {
            value = value * 10 + (address[i] - '0');
        }
        if (value > 255) {
            return false;
        }
        ++octets;
        start = dot + 1;
    }
    return octets == 4;
}

bool is_valid_hostname(const std::string& address) {
    if (address.size() > MAX_HOSTNAME_LENGTH) {
        return false;
    }
    if (!std::isalnum(static_cast<unsigned char>(address.front()))) {
        return false;
    }
    if (address.back() == '-' || address.back() == '.') {
        return false;
    }

    size_t label_start = 0;
    for (size_t i = 0; i <= address.size(); ++i) {
        if (i == address.size() || address[i] == '.') {
            size_t label_len = i - label_start;
            if (label_len == 0 || label_len > MAX_LABEL_LENGTH) {
                return false;
            }
            if (address[label_start] == '-' || address[i - 1] == '-') {
                return false;
            }
            label_start = i + 1;
        } else if (!std::isalnum(static_cast<unsigned char>(address[i])) && address[i] != '-') {
            return false;
        }
    }
    return true;
}

} // namespace

bool is_valid_device_address(const std::string& address) {
    if (address.empty()) {
        return false;
    }
    if (looks_like_ipv4(address)) {
        return is_valid_ipv4(address);
    }
    return is_valid_hostname(address);
}

std::string normalize_device_address(const std::string& raw) {
    std::string address = trim(raw);
    std::transform(address.begin(), address.end(), address.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return address;
}

} // namespace forgefleet
