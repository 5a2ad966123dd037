/**
 * @file BLECentralManager.h
 * @brief BLE central orchestration: registry, scanning and power state
 *
 * The manager owns the platform adapter's delegate callbacks, the registry of
 * discovered peripherals and the dispatcher every record runs on. Platform
 * callbacks are routed to the owning record by address; callbacks for
 * addresses not in the registry are dropped.
 *
 * Usage:
 *   BLECentralManager central(platform);
 *   central.whenPoweredOn().onSuccess([&](ManagerState) {
 *       central.startScanning().onSuccess([](BLEPeripheral* peripheral) {
 *           peripheral->connect();
 *       });
 *   });
 *
 *   // Application main loop
 *   central.loop();
 */
#pragma once

#include "BLEDispatcher.h"
#include "BLEFuture.h"
#include "BLEPeripheral.h"
#include "BLEPlatform.h"
#include "BLETypes.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Tether { namespace BLE {

/**
 * @brief Result of platform state restoration
 */
struct RestoredState {
    std::vector<BLEPeripheral*> peripherals;
    std::vector<std::string> scanned_services;
};

class BLECentralManager {
public:
    /**
     * @param platform Platform adapter; the manager installs its callbacks
     * @param config Registry and operation settings
     * @param clock Time source in seconds (default: RNS::Utilities::OS::time)
     */
    explicit BLECentralManager(IBLEPlatform::Ptr platform,
                               const CentralConfig& config = CentralConfig(),
                               BLEDispatcher::Clock clock = BLEDispatcher::Clock());
    ~BLECentralManager();

    BLECentralManager(const BLECentralManager&) = delete;
    BLECentralManager& operator=(const BLECentralManager&) = delete;

    /**
     * @brief Run timers, deferred work and GATT operation timeouts
     *
     * Call periodically from the application main loop.
     */
    void loop();

    //=========================================================================
    // Power State
    //=========================================================================

    ManagerState state() const { return _state; }
    bool poweredOn() const { return _state == ManagerState::POWERED_ON; }

    /**
     * @brief Resolve once the central is powered on
     *
     * Returns the pending waiter if there is one. Fails with UNSUPPORTED or
     * UNAUTHORIZED if the platform reports either while waiting.
     */
    Future<ManagerState> whenPoweredOn();
    Future<ManagerState> whenPoweredOff();

    //=========================================================================
    // Scanning
    //=========================================================================

    /**
     * @brief Start a scan session
     *
     * While a scan is active the existing session stream is returned. When
     * not powered on the returned stream has already failed with POWERED_OFF.
     * A finite timeout fails the stream with SCAN_TIMEOUT if nothing was
     * discovered, and stops scanning either way.
     */
    FutureStream<BLEPeripheral*> startScanning(const ScanOptions& options = ScanOptions());
    void stopScanning();
    bool isScanning() const { return _scanning; }

    //=========================================================================
    // Registry
    //=========================================================================

    /**
     * @brief Registered peripherals, oldest discovery first
     */
    std::vector<BLEPeripheral*> peripherals() const;

    /**
     * @return nullptr if the address is not registered
     */
    BLEPeripheral* peripheral(const BLEAddress& address) const;
    size_t peripheralCount() const { return _peripherals.size(); }

    /**
     * @brief Remove a record from the registry
     *
     * The record stays valid until the end of the next loop() turn, so it may
     * be removed from inside its own listeners.
     */
    bool removePeripheral(const BLEAddress& address);
    void removeAllPeripherals();
    void disconnectAllPeripherals();

    //=========================================================================
    // Retrieval and Restoration
    //=========================================================================

    /**
     * @brief Register peripherals the platform knows by address
     *
     * Existing records are returned as they are.
     */
    std::vector<BLEPeripheral*> retrievePeripherals(const std::vector<BLEAddress>& addresses);

    /**
     * @brief Register peripherals connected to the system with any of these services
     */
    std::vector<BLEPeripheral*> retrieveConnectedPeripherals(const std::vector<std::string>& service_uuids);

    /**
     * @brief Resolve with the peripherals rebuilt from platform state restoration
     *
     * Fails with RESTORE_FAILED when the platform reports an invalid restore.
     */
    Future<RestoredState> whenStateRestored();

    //=========================================================================
    // Record Support
    //=========================================================================

    BLEDispatcher& dispatcher() { return _dispatcher; }
    const IBLEPlatform::Ptr& platform() const { return _platform; }
    const CentralConfig& config() const { return _config; }

    bool connectPeripheral(BLEPeripheral& peripheral);
    bool cancelPeripheralConnection(BLEPeripheral& peripheral);

private:
    void setupCallbacks();
    void clearCallbacks();

    // Platform callback handlers
    void onStateChanged(ManagerState state);
    void onScanResult(const PeripheralInfo& info);
    void onConnected(const BLEAddress& address);
    void onDisconnected(const BLEAddress& address, int32_t status);
    void onConnectFailed(const BLEAddress& address, int32_t status);
    void onPeripheralStateChanged(const BLEAddress& address, PeripheralState state);
    void onServicesDiscovered(const BLEAddress& address, const std::vector<std::string>& service_uuids,
                              int32_t status);
    void onCharacteristicsDiscovered(const BLEAddress& address, const std::string& service_uuid,
                                     const std::vector<CharacteristicInfo>& characteristics, int32_t status);
    void onValueUpdated(const BLEAddress& address, const std::string& service_uuid,
                        const std::string& characteristic_uuid, const Bytes& value, int32_t status);
    void onValueWritten(const BLEAddress& address, const std::string& service_uuid,
                        const std::string& characteristic_uuid, int32_t status);
    void onNotifyStateChanged(const BLEAddress& address, const std::string& service_uuid,
                              const std::string& characteristic_uuid, bool enabled, int32_t status);
    void onRSSIRead(const BLEAddress& address, int8_t rssi, int32_t status);
    void onStateRestored(const RestorePayload& payload);

    void timeoutScan(uint32_t session);
    BLEPeripheral* addPeripheral(const PeripheralInfo& info);
    BLEPeripheral* findPeripheral(const BLEAddress& address, const char* event) const;
    std::vector<BLEPeripheral*> registerRetrieved(const std::vector<PeripheralInfo>& infos);

    IBLEPlatform::Ptr _platform;
    CentralConfig _config;
    BLEDispatcher _dispatcher;

    ManagerState _state = ManagerState::UNKNOWN;
    std::unique_ptr<Promise<ManagerState>> _powered_on_promise;
    std::unique_ptr<Promise<ManagerState>> _powered_off_promise;
    std::unique_ptr<Promise<RestoredState>> _restore_promise;

    // Scan session
    bool _scanning = false;
    uint32_t _scan_session = 0;
    size_t _scan_discoveries = 0;
    std::unique_ptr<StreamPromise<BLEPeripheral*>> _scan_promise;
    BLEDispatcher::TimerId _scan_timer = BLEDispatcher::INVALID_TIMER;

    std::map<BLEAddress, std::unique_ptr<BLEPeripheral>> _peripherals;
    // Removed records, destroyed at the end of loop()
    std::vector<std::unique_ptr<BLEPeripheral>> _retired;
};

}} // namespace Tether::BLE
