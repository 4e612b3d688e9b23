// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>

/**
 * @file session_error.h
 * @brief Error types and helpers for printer session operations
 *
 * Registry, port allocator and connection flow entry points return a
 * SessionError instead of throwing. Polling failures never reach a caller;
 * they are recorded on the context and announced through the event bus.
 */

namespace forgefleet {

/**
 * @brief Session operation result codes
 */
enum class SessionResult {
    SUCCESS = 0, ///< Operation succeeded

    // Registry / allocator contract violations
    DUPLICATE_ADDRESS, ///< A live context already exists for the address
    BUSY,              ///< A flow or context already targets the address
    NOT_FOUND,         ///< Context id is stale or unknown
    POOL_EXHAUSTED,    ///< No camera proxy port left in the range

    // Transport level, terminal for one flow attempt
    CONNECT_TIMEOUT,    ///< Device did not answer within the connect timeout
    CONNECT_REFUSED,    ///< Device refused the connection
    INVALID_CHECK_CODE, ///< Check code missing or rejected by the device

    // Polling
    TRANSIENT_POLL_FAILURE, ///< Recoverable poll failure, drives backoff
    FATAL_DEVICE_ERROR,     ///< Terminal within the current session

    // Generic
    INVALID_ARGUMENT, ///< Malformed address or parameter
    CANCELLED,        ///< Operation cancelled before completion
    SHUT_DOWN         ///< Owning component is shutting down
};

/**
 * @brief Get string representation of a session result
 */
inline const char* session_result_to_string(SessionResult result) {
    switch (result) {
    case SessionResult::SUCCESS:
        return "Success";
    case SessionResult::DUPLICATE_ADDRESS:
        return "Duplicate Address";
    case SessionResult::BUSY:
        return "Busy";
    case SessionResult::NOT_FOUND:
        return "Not Found";
    case SessionResult::POOL_EXHAUSTED:
        return "Pool Exhausted";
    case SessionResult::CONNECT_TIMEOUT:
        return "Connect Timeout";
    case SessionResult::CONNECT_REFUSED:
        return "Connect Refused";
    case SessionResult::INVALID_CHECK_CODE:
        return "Invalid Check Code";
    case SessionResult::TRANSIENT_POLL_FAILURE:
        return "Transient Poll Failure";
    case SessionResult::FATAL_DEVICE_ERROR:
        return "Fatal Device Error";
    case SessionResult::INVALID_ARGUMENT:
        return "Invalid Argument";
    case SessionResult::CANCELLED:
        return "Cancelled";
    case SessionResult::SHUT_DOWN:
        return "Shut Down";
    default:
        return "Unknown";
    }
}

/**
 * @brief Check whether a connect failure is worth retrying later
 *
 * Only used for reporting. The flow manager itself never retries a direct
 * connect; the caller decides.
 */
[[nodiscard]] inline bool session_result_is_retryable(SessionResult result) {
    switch (result) {
    case SessionResult::CONNECT_TIMEOUT:
    case SessionResult::CONNECT_REFUSED:
    case SessionResult::BUSY:
    case SessionResult::TRANSIENT_POLL_FAILURE:
        return true;
    default:
        return false;
    }
}

/**
 * @brief Detailed error information for session operations
 *
 * Combines a result code with technical text for logs and user-facing text
 * for the UI/WebUI layer.
 */
struct SessionError {
    SessionResult result;      ///< Primary error code
    std::string technical_msg; ///< Technical details for logging/debugging
    std::string user_msg;      ///< User-friendly message for display
    std::string suggestion;    ///< Suggested recovery action (optional)

    SessionError(SessionResult r = SessionResult::SUCCESS, const std::string& tech = "",
                 const std::string& user = "", const std::string& suggest = "")
        : result(r), technical_msg(tech), user_msg(user), suggestion(suggest) {}

    [[nodiscard]] bool success() const {
        return result == SessionResult::SUCCESS;
    }

    operator bool() const {
        return success();
    }

    [[nodiscard]] bool is_retryable() const {
        return session_result_is_retryable(result);
    }
};

/**
 * @brief Factory methods for consistently worded session errors
 */
class SessionErrorHelper {
  public:
    static SessionError success() {
        return SessionError(SessionResult::SUCCESS);
    }

    static SessionError duplicate_address(const std::string& address) {
        return SessionError(SessionResult::DUPLICATE_ADDRESS,
                            "Live context already registered for " + address,
                            "This printer is already connected",
                            "Select the existing printer tab instead of connecting again");
    }

    static SessionError busy(const std::string& address) {
        return SessionError(SessionResult::BUSY,
                            "Connection flow or live context already targets " + address,
                            "A connection to this printer is already in progress",
                            "Wait for the current attempt to finish");
    }

    static SessionError not_found(const std::string& context_id) {
        return SessionError(SessionResult::NOT_FOUND, "No live context with id " + context_id,
                            "Printer session no longer exists");
    }

    static SessionError pool_exhausted(uint16_t first_port, uint16_t last_port) {
        return SessionError(SessionResult::POOL_EXHAUSTED,
                            "All camera proxy ports in " + std::to_string(first_port) + "-" +
                                std::to_string(last_port) + " are leased",
                            "Maximum number of connected printers reached",
                            "Disconnect a printer before connecting another one");
    }

    static SessionError connect_timeout(const std::string& address, uint32_t timeout_ms) {
        return SessionError(SessionResult::CONNECT_TIMEOUT,
                            "Connect to " + address + " timed out after " +
                                std::to_string(timeout_ms) + "ms",
                            "Connection timed out",
                            "Check that the printer is powered on and on the same network");
    }

    static SessionError connect_refused(const std::string& address,
                                        const std::string& detail = "") {
        return SessionError(SessionResult::CONNECT_REFUSED,
                            detail.empty() ? "Connection refused by " + address : detail,
                            "Printer refused the connection",
                            "Make sure no other application holds the printer connection");
    }

    static SessionError invalid_check_code(const std::string& address) {
        return SessionError(SessionResult::INVALID_CHECK_CODE,
                            "Check code missing or rejected by " + address,
                            "Invalid pairing code",
                            "Enter the check code shown on the printer's network screen");
    }

    static SessionError transient_poll_failure(const std::string& detail) {
        return SessionError(SessionResult::TRANSIENT_POLL_FAILURE, detail,
                            "Printer did not respond to a status request");
    }

    static SessionError fatal_device_error(const std::string& detail) {
        return SessionError(SessionResult::FATAL_DEVICE_ERROR, detail,
                            "Printer reported an unrecoverable error",
                            "Disconnect and reconnect the printer");
    }

    static SessionError invalid_argument(const std::string& detail) {
        return SessionError(SessionResult::INVALID_ARGUMENT, detail, "Invalid printer details");
    }

    static SessionError cancelled(const std::string& detail = "") {
        return SessionError(SessionResult::CANCELLED,
                            detail.empty() ? "Operation cancelled" : detail,
                            "Connection cancelled");
    }

    static SessionError shut_down() {
        return SessionError(SessionResult::SHUT_DOWN, "Session manager is shutting down",
                            "Application is shutting down");
    }
};

} // namespace forgefleet
