/**
 * @file BLEPlatform.h
 * @brief BLE central Hardware Abstraction Layer (HAL) interface
 *
 * Provides a platform-agnostic interface to the vendor BLE central API.
 * Platform adapters (NimBLE, Bluedroid, CoreBluetooth, BlueZ) implement this
 * interface; the central manager drives it and receives its delegate
 * callbacks.
 *
 * The HAL abstracts:
 * - Power state reporting
 * - Scanning
 * - Connection and cancellation
 * - Service and characteristic discovery
 * - GATT operations (read, write, notify) and RSSI reads
 * - Peripheral retrieval and state restoration
 *
 * Request methods return false when the stack refuses the request outright.
 * Accepted requests are answered later through the matching callback, with a
 * status of STATUS_OK on success or a stack-specific code on failure.
 * cancelConnection() must be answered with OnDisconnected (or OnConnectFailed)
 * even when the connection was never established.
 */
#pragma once

#include "BLETypes.h"
#include "Bytes.h"

#include <memory>
#include <string>
#include <vector>

namespace Tether { namespace BLE {

/**
 * @brief Abstract BLE central platform interface
 */
class IBLEPlatform {
public:
    using Ptr = std::shared_ptr<IBLEPlatform>;

    virtual ~IBLEPlatform() = default;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Current power/authorization state of the local adapter
     */
    virtual ManagerState getState() const = 0;

    //=========================================================================
    // Scanning
    //=========================================================================

    /**
     * @brief Start scanning for peripherals
     *
     * @param service_uuids Only report peripherals advertising these services (empty = all)
     * @return true if scan started successfully
     */
    virtual bool startScan(const std::vector<std::string>& service_uuids) = 0;

    /**
     * @brief Stop scanning
     */
    virtual void stopScan() = 0;

    //=========================================================================
    // Connections
    //=========================================================================

    /**
     * @brief Connect to a peripheral
     * @return true if connection attempt started
     */
    virtual bool connect(const BLEAddress& address) = 0;

    /**
     * @brief Cancel a pending or established connection
     * @return true if cancellation initiated
     */
    virtual bool cancelConnection(const BLEAddress& address) = 0;

    //=========================================================================
    // Discovery
    //=========================================================================

    /**
     * @brief Discover services on a connected peripheral
     *
     * @param service_uuids Services to discover (empty = all)
     * @return true if discovery started
     */
    virtual bool discoverServices(const BLEAddress& address,
                                  const std::vector<std::string>& service_uuids) = 0;

    /**
     * @brief Discover characteristics of a discovered service
     *
     * @param characteristic_uuids Characteristics to discover (empty = all)
     * @return true if discovery started
     */
    virtual bool discoverCharacteristics(const BLEAddress& address,
                                         const std::string& service_uuid,
                                         const std::vector<std::string>& characteristic_uuids) = 0;

    //=========================================================================
    // GATT Operations
    //=========================================================================

    /**
     * @brief Read a characteristic value, answered by OnValueUpdated
     */
    virtual bool read(const BLEAddress& address, const std::string& service_uuid,
                      const std::string& characteristic_uuid) = 0;

    /**
     * @brief Write a characteristic value
     *
     * @param response true for write with response (answered by OnValueWritten),
     *                 false for write without response (not answered)
     */
    virtual bool write(const BLEAddress& address, const std::string& service_uuid,
                       const std::string& characteristic_uuid, const Bytes& data,
                       bool response = true) = 0;

    /**
     * @brief Enable/disable notifications, answered by OnNotifyStateChanged
     */
    virtual bool setNotify(const BLEAddress& address, const std::string& service_uuid,
                           const std::string& characteristic_uuid, bool enable) = 0;

    /**
     * @brief Read the RSSI of a connected peripheral, answered by OnRSSIRead
     */
    virtual bool readRSSI(const BLEAddress& address) = 0;

    //=========================================================================
    // Retrieval
    //=========================================================================

    /**
     * @brief Look up peripherals the platform already knows by identifier
     */
    virtual std::vector<PeripheralInfo> retrievePeripherals(const std::vector<BLEAddress>& addresses) = 0;

    /**
     * @brief Look up peripherals connected to the system with any of these services
     */
    virtual std::vector<PeripheralInfo> retrieveConnectedPeripherals(
        const std::vector<std::string>& service_uuids) = 0;

    //=========================================================================
    // Callback Registration
    //=========================================================================

    virtual void setOnStateChanged(Callbacks::OnStateChanged callback) = 0;
    virtual void setOnScanResult(Callbacks::OnScanResult callback) = 0;
    virtual void setOnConnected(Callbacks::OnConnected callback) = 0;
    virtual void setOnDisconnected(Callbacks::OnDisconnected callback) = 0;
    virtual void setOnConnectFailed(Callbacks::OnConnectFailed callback) = 0;
    virtual void setOnPeripheralStateChanged(Callbacks::OnPeripheralStateChanged callback) = 0;
    virtual void setOnServicesDiscovered(Callbacks::OnServicesDiscovered callback) = 0;
    virtual void setOnCharacteristicsDiscovered(Callbacks::OnCharacteristicsDiscovered callback) = 0;
    virtual void setOnValueUpdated(Callbacks::OnValueUpdated callback) = 0;
    virtual void setOnValueWritten(Callbacks::OnValueWritten callback) = 0;
    virtual void setOnNotifyStateChanged(Callbacks::OnNotifyStateChanged callback) = 0;
    virtual void setOnRSSIRead(Callbacks::OnRSSIRead callback) = 0;
    virtual void setOnStateRestored(Callbacks::OnStateRestored callback) = 0;

    //=========================================================================
    // Platform Info
    //=========================================================================

    /**
     * @brief Get human-readable platform name
     */
    virtual std::string getPlatformName() const = 0;
};

}} // namespace Tether::BLE
