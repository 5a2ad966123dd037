/**
 * @file BLETypes.h
 * @brief Tether BLE central types, constants, and common structures
 *
 * This file defines the core types used throughout the central orchestration
 * layer: timing and retry constants, state and event enumerations, error
 * values, and the data reported by the platform about peripherals.
 */
#pragma once

#include "Bytes.h"
#include "Log.h"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace Tether { namespace BLE {

using RNS::Bytes;

//=============================================================================
// Timing Constants
//=============================================================================

namespace Timing {
    static constexpr double CONNECTION_TIMEOUT = 10.0;        // Seconds before a connect attempt is cancelled
    static constexpr double RSSI_POLL_PERIOD = 10.0;          // Seconds between RSSI polls
    static constexpr double OPERATION_TIMEOUT = 10.0;         // Seconds for a GATT read/write/notify
    static constexpr double NO_TIMEOUT = std::numeric_limits<double>::infinity();
}

//=============================================================================
// Limits
//=============================================================================

namespace Limits {
#ifdef ARDUINO
    static constexpr size_t MAX_DISCOVERED_PERIPHERALS = 16;  // Reduced registry for MCU
    static constexpr size_t STREAM_HISTORY = 4;               // Events replayed to late listeners
#else
    static constexpr size_t MAX_DISCOVERED_PERIPHERALS = 100; // Registry limit
    static constexpr size_t STREAM_HISTORY = 32;              // Events replayed to late listeners
#endif
    static constexpr size_t RSSI_HISTORY = 1;                 // Only the latest reading is replayed
}

namespace Retry {
    // Retry limit meaning "never give up"
    static constexpr uint32_t UNLIMITED = 0xFFFFFFFF;
}

//=============================================================================
// Enumerations
//=============================================================================

/**
 * @brief Central manager power/authorization state as reported by the platform
 */
enum class ManagerState : uint8_t {
    UNKNOWN,
    RESETTING,
    UNSUPPORTED,
    UNAUTHORIZED,
    POWERED_OFF,
    POWERED_ON
};

/**
 * @brief Peripheral connection state
 */
enum class PeripheralState : uint8_t {
    DISCONNECTED,
    CONNECTING,
    CONNECTED
};

/**
 * @brief Events emitted on a connection session stream
 */
enum class ConnectionEvent : uint8_t {
    CONNECT,
    TIMEOUT,
    DISCONNECT,
    FORCE_DISCONNECT,
    GIVE_UP
};

/**
 * @brief GATT operation types for queuing
 */
enum class OperationType : uint8_t {
    READ,
    WRITE,
    WRITE_NO_RESPONSE,
    NOTIFY_ENABLE,
    NOTIFY_DISABLE
};

/**
 * @brief Characteristic property flags
 */
namespace Property {
    static constexpr uint8_t READ              = 0x02;
    static constexpr uint8_t WRITE_NO_RESPONSE = 0x04;
    static constexpr uint8_t WRITE             = 0x08;
    static constexpr uint8_t NOTIFY            = 0x10;
    static constexpr uint8_t INDICATE          = 0x20;
}

/**
 * @brief Error conditions delivered on futures and streams
 */
enum class ErrorCode : uint8_t {
    NONE,
    NOT_CONNECTED,       // Local precondition: peripheral is not connected
    NO_SERVICES_FOUND,   // Service discovery found nothing
    POWERED_OFF,         // Central is not powered on
    SCAN_TIMEOUT,        // Scan timed out with no discoveries
    UNSUPPORTED,         // Platform does not support BLE
    UNAUTHORIZED,        // Application is not authorized to use BLE
    RESTORE_FAILED,      // Platform state restoration was invalid
    OPERATION_TIMEOUT,   // GATT operation got no answer in time
    NOT_FOUND,           // Service or characteristic no longer indexed
    NOT_SUPPORTED,       // Characteristic lacks the required property
    TRANSPORT            // Platform-reported failure, status carried verbatim
};

// Platform status code meaning success
static constexpr int32_t STATUS_OK = 0;
// Status used when the platform refuses a request synchronously
static constexpr int32_t STATUS_REJECTED = -1;

/**
 * @brief Error value: a condition plus the platform status for TRANSPORT errors
 */
struct Error {
    ErrorCode code = ErrorCode::NONE;
    int32_t status = STATUS_OK;

    Error() = default;
    explicit Error(ErrorCode error_code, int32_t platform_status = STATUS_OK)
        : code(error_code), status(platform_status) {}

    /**
     * @brief Map a platform status to an error (NONE for STATUS_OK)
     */
    static Error fromStatus(int32_t platform_status) {
        if (platform_status == STATUS_OK) {
            return Error();
        }
        return Error(ErrorCode::TRANSPORT, platform_status);
    }

    bool ok() const { return code == ErrorCode::NONE; }

    bool operator==(const Error& other) const {
        return code == other.code && status == other.status;
    }
    bool operator!=(const Error& other) const { return !(*this == other); }

    std::string toString() const;
};

//=============================================================================
// Data Structures
//=============================================================================

/**
 * @brief BLE address (6 bytes + type), the opaque peripheral identifier
 */
struct BLEAddress {
    uint8_t addr[6] = {0};
    uint8_t type = 0;  // 0 = public, 1 = random

    BLEAddress() = default;

    BLEAddress(const uint8_t* address, uint8_t addr_type = 0) : type(addr_type) {
        if (address) {
            memcpy(addr, address, 6);
        }
    }

    bool operator==(const BLEAddress& other) const {
        return memcmp(addr, other.addr, 6) == 0 && type == other.type;
    }

    bool operator!=(const BLEAddress& other) const {
        return !(*this == other);
    }

    bool operator<(const BLEAddress& other) const {
        int cmp = memcmp(addr, other.addr, 6);
        if (cmp != 0) return cmp < 0;
        return type < other.type;
    }

    /**
     * @brief Convert to colon-separated hex string (XX:XX:XX:XX:XX:XX)
     */
    std::string toString() const {
        char buf[18];
        snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                 addr[0], addr[1], addr[2], addr[3], addr[4], addr[5]);
        return std::string(buf);
    }
};

/**
 * @brief Advertisement data captured at discovery
 */
struct Advertisement {
    std::string local_name;
    Bytes manufacturer_data;
    bool has_tx_power = false;
    int8_t tx_power = 0;
    bool has_connectable = false;
    bool connectable = false;
    std::vector<std::string> service_uuids;
    std::map<std::string, Bytes> service_data;
    std::vector<std::string> overflow_service_uuids;
    std::vector<std::string> solicited_service_uuids;
};

/**
 * @brief What the platform reports about a peripheral (scan, retrieval, restore)
 */
struct PeripheralInfo {
    BLEAddress address;
    std::string name;
    int8_t rssi = 0;
    PeripheralState state = PeripheralState::DISCONNECTED;
    Advertisement advertisement;
};

/**
 * @brief Characteristic as reported by the platform during discovery
 */
struct CharacteristicInfo {
    std::string uuid;
    uint8_t properties = 0;
};

/**
 * @brief Service with its characteristics, as carried by state restoration
 */
struct RestoredService {
    std::string uuid;
    std::vector<CharacteristicInfo> characteristics;
};

/**
 * @brief Peripheral as carried by state restoration
 */
struct RestoredPeripheral {
    PeripheralInfo info;
    std::vector<RestoredService> services;
};

/**
 * @brief Platform state restoration payload
 *
 * valid is false when the platform could not supply peripherals, scanned
 * services and options together.
 */
struct RestorePayload {
    bool valid = false;
    std::vector<RestoredPeripheral> peripherals;
    std::vector<std::string> scanned_services;
};

/**
 * @brief GATT operation for queuing
 */
struct GATTOperation {
    OperationType type = OperationType::READ;
    std::string service_uuid;
    std::string characteristic_uuid;
    Bytes data;                         // For writes
    double timeout = Timing::OPERATION_TIMEOUT;

    // Completion callback
    std::function<void(const Error&, const Bytes&)> callback;

    // Internal tracking
    double started_at = 0;
};

//=============================================================================
// Configuration
//=============================================================================

/**
 * @brief Central manager configuration
 */
struct CentralConfig {
    std::string name = "central";
    size_t max_peripherals = Limits::MAX_DISCOVERED_PERIPHERALS;
    double operation_timeout = Timing::OPERATION_TIMEOUT;
};

/**
 * @brief Options for a connection session
 *
 * Retry limits of Retry::UNLIMITED retry forever. capacity bounds the event
 * history replayed to late listeners (0 = unbounded).
 */
struct ConnectOptions {
    uint32_t timeout_retries = Retry::UNLIMITED;
    uint32_t disconnect_retries = Retry::UNLIMITED;
    double connection_timeout = Timing::CONNECTION_TIMEOUT;
    size_t capacity = Limits::STREAM_HISTORY;
};

/**
 * @brief Options for a scan session
 */
struct ScanOptions {
    std::vector<std::string> service_uuids;   // Empty = all peripherals
    double timeout = Timing::NO_TIMEOUT;
    size_t capacity = Limits::STREAM_HISTORY;
};

//=============================================================================
// Callback Type Definitions
//=============================================================================

namespace Callbacks {
    using OnStateChanged = std::function<void(ManagerState state)>;
    using OnScanResult = std::function<void(const PeripheralInfo& info)>;

    using OnConnected = std::function<void(const BLEAddress& address)>;
    using OnDisconnected = std::function<void(const BLEAddress& address, int32_t status)>;
    using OnConnectFailed = std::function<void(const BLEAddress& address, int32_t status)>;
    using OnPeripheralStateChanged = std::function<void(const BLEAddress& address, PeripheralState state)>;

    using OnServicesDiscovered = std::function<void(const BLEAddress& address,
                                                    const std::vector<std::string>& service_uuids,
                                                    int32_t status)>;
    using OnCharacteristicsDiscovered = std::function<void(const BLEAddress& address,
                                                           const std::string& service_uuid,
                                                           const std::vector<CharacteristicInfo>& characteristics,
                                                           int32_t status)>;

    using OnValueUpdated = std::function<void(const BLEAddress& address, const std::string& service_uuid,
                                              const std::string& characteristic_uuid, const Bytes& value,
                                              int32_t status)>;
    using OnValueWritten = std::function<void(const BLEAddress& address, const std::string& service_uuid,
                                              const std::string& characteristic_uuid, int32_t status)>;
    using OnNotifyStateChanged = std::function<void(const BLEAddress& address, const std::string& service_uuid,
                                                    const std::string& characteristic_uuid, bool enabled,
                                                    int32_t status)>;

    using OnRSSIRead = std::function<void(const BLEAddress& address, int8_t rssi, int32_t status)>;
    using OnStateRestored = std::function<void(const RestorePayload& payload)>;
}

//=============================================================================
// Utility Functions
//=============================================================================

inline const char* managerStateToString(ManagerState state) {
    switch (state) {
        case ManagerState::UNKNOWN:      return "UNKNOWN";
        case ManagerState::RESETTING:    return "RESETTING";
        case ManagerState::UNSUPPORTED:  return "UNSUPPORTED";
        case ManagerState::UNAUTHORIZED: return "UNAUTHORIZED";
        case ManagerState::POWERED_OFF:  return "POWERED_OFF";
        case ManagerState::POWERED_ON:   return "POWERED_ON";
        default:                         return "INVALID";
    }
}

inline const char* peripheralStateToString(PeripheralState state) {
    switch (state) {
        case PeripheralState::DISCONNECTED: return "DISCONNECTED";
        case PeripheralState::CONNECTING:   return "CONNECTING";
        case PeripheralState::CONNECTED:    return "CONNECTED";
        default:                            return "INVALID";
    }
}

inline const char* connectionEventToString(ConnectionEvent event) {
    switch (event) {
        case ConnectionEvent::CONNECT:          return "CONNECT";
        case ConnectionEvent::TIMEOUT:          return "TIMEOUT";
        case ConnectionEvent::DISCONNECT:       return "DISCONNECT";
        case ConnectionEvent::FORCE_DISCONNECT: return "FORCE_DISCONNECT";
        case ConnectionEvent::GIVE_UP:          return "GIVE_UP";
        default:                                return "INVALID";
    }
}

const char* errorToString(ErrorCode code);

}} // namespace Tether::BLE
