/**
 * @file BLETypes.cpp
 * @brief Error text for logging
 */

#include "BLETypes.h"

namespace Tether { namespace BLE {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:              return "NONE";
        case ErrorCode::NOT_CONNECTED:     return "NOT_CONNECTED";
        case ErrorCode::NO_SERVICES_FOUND: return "NO_SERVICES_FOUND";
        case ErrorCode::POWERED_OFF:       return "POWERED_OFF";
        case ErrorCode::SCAN_TIMEOUT:      return "SCAN_TIMEOUT";
        case ErrorCode::UNSUPPORTED:       return "UNSUPPORTED";
        case ErrorCode::UNAUTHORIZED:      return "UNAUTHORIZED";
        case ErrorCode::RESTORE_FAILED:    return "RESTORE_FAILED";
        case ErrorCode::OPERATION_TIMEOUT: return "OPERATION_TIMEOUT";
        case ErrorCode::NOT_FOUND:         return "NOT_FOUND";
        case ErrorCode::NOT_SUPPORTED:     return "NOT_SUPPORTED";
        case ErrorCode::TRANSPORT:         return "TRANSPORT";
        default:                           return "UNKNOWN";
    }
}

std::string Error::toString() const {
    if (code == ErrorCode::TRANSPORT) {
        return std::string(errorToString(code)) + "(" + std::to_string(status) + ")";
    }
    return errorToString(code);
}

}} // namespace Tether::BLE
