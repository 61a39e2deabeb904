// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                  return "NONE";

        // Parsing
        case ErrorCode::PARSE_ERROR:           return "PARSE_ERROR";
        case ErrorCode::PARSE_BAD_FORMAT:      return "PARSE_BAD_FORMAT";
        case ErrorCode::PARSE_SIG_TOO_SHORT:   return "PARSE_SIG_TOO_SHORT";
        case ErrorCode::PARSE_SEQ_TOO_SHORT:   return "PARSE_SEQ_TOO_SHORT";

        // Validation
        case ErrorCode::VALIDATION_ERROR:      return "VALIDATION_ERROR";
        case ErrorCode::VALIDATION_RANGE:      return "VALIDATION_RANGE";
        case ErrorCode::VALIDATION_PAYLOAD_TOO_LARGE:
            return "VALIDATION_PAYLOAD_TOO_LARGE";

        // Network
        case ErrorCode::NETWORK_ERROR:         return "NETWORK_ERROR";
        case ErrorCode::NETWORK_TIMEOUT:       return "NETWORK_TIMEOUT";
        case ErrorCode::NETWORK_LOOKUP_FAILED: return "NETWORK_LOOKUP_FAILED";
        case ErrorCode::NETWORK_RATE_LIMITED:  return "NETWORK_RATE_LIMITED";
        case ErrorCode::NETWORK_NOT_FOUND:     return "NETWORK_NOT_FOUND";

        // Cryptography
        case ErrorCode::CRYPTO_ERROR:          return "CRYPTO_ERROR";
        case ErrorCode::CRYPTO_INVALID_SIGNATURE:
            return "CRYPTO_INVALID_SIGNATURE";
        case ErrorCode::CRYPTO_KEY_FAIL:       return "CRYPTO_KEY_FAIL";

        // DNS
        case ErrorCode::DNS_ERROR:             return "DNS_ERROR";
        case ErrorCode::DNS_MALFORMED:         return "DNS_MALFORMED";
        case ErrorCode::DNS_TOO_LARGE:         return "DNS_TOO_LARGE";

        // Configuration
        case ErrorCode::CONFIG_ERROR:          return "CONFIG_ERROR";
        case ErrorCode::CONFIG_INVALID:        return "CONFIG_INVALID";

        // Internal
        case ErrorCode::INTERNAL_ERROR:        return "INTERNAL_ERROR";
        case ErrorCode::NOT_IMPLEMENTED:       return "NOT_IMPLEMENTED";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    // Append source location when available (file name is non-empty).
    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line()
            << ':' << location_.column() << ']';
    }

    return oss.str();
}

} // namespace core
