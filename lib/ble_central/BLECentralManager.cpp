/**
 * @file BLECentralManager.cpp
 * @brief BLE central orchestration implementation
 */

#include "BLECentralManager.h"
#include "Log.h"

#include <algorithm>
#include <cmath>

namespace Tether { namespace BLE {

namespace {

bool isUnavailable(ManagerState state) {
    return state == ManagerState::UNSUPPORTED || state == ManagerState::UNAUTHORIZED;
}

Error unavailableError(ManagerState state) {
    return Error(state == ManagerState::UNSUPPORTED ? ErrorCode::UNSUPPORTED : ErrorCode::UNAUTHORIZED);
}

}  // namespace

BLECentralManager::BLECentralManager(IBLEPlatform::Ptr platform, const CentralConfig& config,
                                     BLEDispatcher::Clock clock)
    : _platform(platform),
      _config(config),
      _dispatcher(clock) {
    _state = _platform->getState();
    setupCallbacks();

    INFO("BLECentralManager: " + _config.name + " started on " + _platform->getPlatformName() +
         ", state: " + managerStateToString(_state));
}

BLECentralManager::~BLECentralManager() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    clearCallbacks();
    if (_scanning) {
        _platform->stopScan();
        _scanning = false;
    }
    _dispatcher.cancel(_scan_timer);
    _retired.clear();
    _peripherals.clear();
}

void BLECentralManager::loop() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    _dispatcher.loop();

    // Snapshot: operation callbacks may add or remove records
    std::vector<BLEPeripheral*> snapshot = peripherals();
    for (BLEPeripheral* peripheral : snapshot) {
        peripheral->processOperations();
    }

    _retired.clear();
}

//=============================================================================
// Power State
//=============================================================================

Future<ManagerState> BLECentralManager::whenPoweredOn() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    if (_powered_on_promise) {
        return _powered_on_promise->future();
    }

    Promise<ManagerState> promise;
    if (_state == ManagerState::POWERED_ON) {
        promise.success(_state);
    } else if (isUnavailable(_state)) {
        // Terminal states are not reported again
        promise.failure(unavailableError(_state));
    } else {
        _powered_on_promise.reset(new Promise<ManagerState>(promise));
    }
    return promise.future();
}

Future<ManagerState> BLECentralManager::whenPoweredOff() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    if (_powered_off_promise) {
        return _powered_off_promise->future();
    }

    Promise<ManagerState> promise;
    if (_state == ManagerState::POWERED_OFF) {
        promise.success(_state);
    } else if (isUnavailable(_state)) {
        // Terminal states are not reported again
        promise.failure(unavailableError(_state));
    } else {
        _powered_off_promise.reset(new Promise<ManagerState>(promise));
    }
    return promise.future();
}

void BLECentralManager::onStateChanged(ManagerState state) {
    DEBUG("BLECentralManager: State " + std::string(managerStateToString(_state)) + " -> " +
          managerStateToString(state));
    _state = state;

    // Take pending waiters out first: listeners may register new ones
    std::unique_ptr<Promise<ManagerState>> powered_on;
    std::unique_ptr<Promise<ManagerState>> powered_off;

    switch (state) {
        case ManagerState::POWERED_ON:
            powered_on.swap(_powered_on_promise);
            if (powered_on) {
                powered_on->success(state);
            }
            break;

        case ManagerState::POWERED_OFF:
            if (_scanning) {
                WARNING("BLECentralManager: Powered off while scanning");
                StreamPromise<BLEPeripheral*> scan = *_scan_promise;
                stopScanning();
                scan.failure(Error(ErrorCode::POWERED_OFF));
            }
            powered_off.swap(_powered_off_promise);
            if (powered_off) {
                powered_off->success(state);
            }
            break;

        case ManagerState::UNSUPPORTED:
        case ManagerState::UNAUTHORIZED: {
            ERROR("BLECentralManager: BLE " + std::string(managerStateToString(state)));
            Error error = unavailableError(state);
            powered_on.swap(_powered_on_promise);
            powered_off.swap(_powered_off_promise);
            if (powered_on) {
                powered_on->failure(error);
            }
            if (powered_off) {
                powered_off->failure(error);
            }
            break;
        }

        default:
            break;
    }
}

//=============================================================================
// Scanning
//=============================================================================

FutureStream<BLEPeripheral*> BLECentralManager::startScanning(const ScanOptions& options) {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    if (_scanning) {
        DEBUG("BLECentralManager: Already scanning");
        return _scan_promise->stream();
    }

    if (_state != ManagerState::POWERED_ON) {
        WARNING("BLECentralManager: Cannot scan, state: " + std::string(managerStateToString(_state)));
        StreamPromise<BLEPeripheral*> failed(options.capacity);
        failed.failure(Error(ErrorCode::POWERED_OFF));
        return failed.stream();
    }

    _scan_session++;
    _scan_discoveries = 0;
    _scan_promise.reset(new StreamPromise<BLEPeripheral*>(options.capacity));
    FutureStream<BLEPeripheral*> stream = _scan_promise->stream();

    if (!_platform->startScan(options.service_uuids)) {
        WARNING("BLECentralManager: Platform refused to start scan");
        StreamPromise<BLEPeripheral*> failed = *_scan_promise;
        _scan_promise.reset();
        failed.failure(Error(ErrorCode::TRANSPORT, STATUS_REJECTED));
        return stream;
    }

    _scanning = true;
    INFO("BLECentralManager: Scan started, session " + std::to_string(_scan_session) +
         ", services: " + std::to_string(options.service_uuids.size()));

    if (std::isfinite(options.timeout)) {
        uint32_t session = _scan_session;
        _scan_timer = _dispatcher.schedule(options.timeout, [this, session]() {
            timeoutScan(session);
        });
    }

    return stream;
}

void BLECentralManager::stopScanning() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    _dispatcher.cancel(_scan_timer);
    _scan_timer = BLEDispatcher::INVALID_TIMER;

    if (_scanning) {
        _platform->stopScan();
        _scanning = false;
        INFO("BLECentralManager: Scan stopped, " + std::to_string(_scan_discoveries) +
             " peripherals discovered");
    }
    _scan_promise.reset();
}

void BLECentralManager::timeoutScan(uint32_t session) {
    _scan_timer = BLEDispatcher::INVALID_TIMER;

    if (session != _scan_session || !_scanning) {
        DEBUG("BLECentralManager: Stale scan timeout, session " + std::to_string(session) +
              ", current " + std::to_string(_scan_session));
        return;
    }

    if (_scan_discoveries == 0) {
        INFO("BLECentralManager: Scan timed out with no peripherals discovered");
        StreamPromise<BLEPeripheral*> scan = *_scan_promise;
        stopScanning();
        scan.failure(Error(ErrorCode::SCAN_TIMEOUT));
    } else {
        DEBUG("BLECentralManager: Scan timeout, stopping");
        stopScanning();
    }
}

void BLECentralManager::onScanResult(const PeripheralInfo& info) {
    if (!_scanning) {
        DEBUG("BLECentralManager: Dropping scan result for " + info.address.toString() + ", not scanning");
        return;
    }

    if (_peripherals.find(info.address) != _peripherals.end()) {
        TRACE("BLECentralManager: Already discovered " + info.address.toString());
        return;
    }

    BLEPeripheral* peripheral = addPeripheral(info);
    if (!peripheral) {
        return;
    }
    _scan_discoveries++;

    DEBUG("BLECentralManager: Discovered " + peripheral->name() + " " + info.address.toString() +
          " RSSI " + std::to_string(info.rssi));

    StreamPromise<BLEPeripheral*> scan = *_scan_promise;
    scan.success(peripheral);
}

//=============================================================================
// Registry
//=============================================================================

BLEPeripheral* BLECentralManager::addPeripheral(const PeripheralInfo& info) {
    if (_peripherals.size() >= _config.max_peripherals) {
        WARNING("BLECentralManager: Registry full (" + std::to_string(_config.max_peripherals) +
                "), dropping " + info.address.toString());
        return nullptr;
    }

    BLEPeripheral* peripheral = new BLEPeripheral(*this, info, _dispatcher.now());
    _peripherals[info.address] = std::unique_ptr<BLEPeripheral>(peripheral);
    return peripheral;
}

std::vector<BLEPeripheral*> BLECentralManager::peripherals() const {
    std::vector<BLEPeripheral*> result;
    result.reserve(_peripherals.size());
    for (const auto& kv : _peripherals) {
        result.push_back(kv.second.get());
    }
    std::stable_sort(result.begin(), result.end(), [](const BLEPeripheral* a, const BLEPeripheral* b) {
        return a->discoveredAt() < b->discoveredAt();
    });
    return result;
}

BLEPeripheral* BLECentralManager::peripheral(const BLEAddress& address) const {
    auto it = _peripherals.find(address);
    return it != _peripherals.end() ? it->second.get() : nullptr;
}

bool BLECentralManager::removePeripheral(const BLEAddress& address) {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    auto it = _peripherals.find(address);
    if (it == _peripherals.end()) {
        return false;
    }

    DEBUG("BLECentralManager: Removing " + address.toString());
    BLEPeripheral* removed = it->second.get();
    _retired.push_back(std::move(it->second));
    _peripherals.erase(it);
    removed->stopPollingRSSI();
    removed->cancelOperations(Error(ErrorCode::NOT_CONNECTED));
    return true;
}

void BLECentralManager::removeAllPeripherals() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    DEBUG("BLECentralManager: Removing " + std::to_string(_peripherals.size()) + " peripherals");
    std::vector<BLEPeripheral*> removed;
    for (auto& kv : _peripherals) {
        removed.push_back(kv.second.get());
        _retired.push_back(std::move(kv.second));
    }
    _peripherals.clear();
    for (BLEPeripheral* peripheral : removed) {
        peripheral->stopPollingRSSI();
        peripheral->cancelOperations(Error(ErrorCode::NOT_CONNECTED));
    }
}

void BLECentralManager::disconnectAllPeripherals() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    std::vector<BLEPeripheral*> snapshot = peripherals();
    for (BLEPeripheral* peripheral : snapshot) {
        peripheral->disconnect();
    }
}

BLEPeripheral* BLECentralManager::findPeripheral(const BLEAddress& address, const char* event) const {
    BLEPeripheral* found = peripheral(address);
    if (!found) {
        DEBUG("BLECentralManager: Dropping " + std::string(event) + " for unknown peripheral " +
              address.toString());
    }
    return found;
}

bool BLECentralManager::connectPeripheral(BLEPeripheral& peripheral) {
    DEBUG("BLECentralManager: Connecting to " + peripheral.address().toString());
    return _platform->connect(peripheral.address());
}

bool BLECentralManager::cancelPeripheralConnection(BLEPeripheral& peripheral) {
    DEBUG("BLECentralManager: Cancelling connection to " + peripheral.address().toString());
    return _platform->cancelConnection(peripheral.address());
}

//=============================================================================
// Retrieval and Restoration
//=============================================================================

std::vector<BLEPeripheral*> BLECentralManager::retrievePeripherals(const std::vector<BLEAddress>& addresses) {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());
    return registerRetrieved(_platform->retrievePeripherals(addresses));
}

std::vector<BLEPeripheral*> BLECentralManager::retrieveConnectedPeripherals(
        const std::vector<std::string>& service_uuids) {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());
    return registerRetrieved(_platform->retrieveConnectedPeripherals(service_uuids));
}

std::vector<BLEPeripheral*> BLECentralManager::registerRetrieved(const std::vector<PeripheralInfo>& infos) {
    std::vector<BLEPeripheral*> result;
    for (const auto& info : infos) {
        BLEPeripheral* found = peripheral(info.address);
        if (!found) {
            found = addPeripheral(info);
        }
        if (found) {
            result.push_back(found);
        }
    }
    DEBUG("BLECentralManager: Retrieved " + std::to_string(result.size()) + " peripherals");
    return result;
}

Future<RestoredState> BLECentralManager::whenStateRestored() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    if (!_restore_promise) {
        _restore_promise.reset(new Promise<RestoredState>());
    }
    return _restore_promise->future();
}

void BLECentralManager::onStateRestored(const RestorePayload& payload) {
    // Restoration may arrive before anyone asks for it
    if (!_restore_promise) {
        _restore_promise.reset(new Promise<RestoredState>());
    }
    Promise<RestoredState> promise = *_restore_promise;

    if (!payload.valid) {
        WARNING("BLECentralManager: State restoration failed");
        promise.failure(Error(ErrorCode::RESTORE_FAILED));
        return;
    }

    RestoredState restored;
    restored.scanned_services = payload.scanned_services;
    for (const auto& restored_peripheral : payload.peripherals) {
        BLEPeripheral* found = peripheral(restored_peripheral.info.address);
        if (!found) {
            found = addPeripheral(restored_peripheral.info);
        }
        if (!found) {
            continue;
        }
        found->didRestore(restored_peripheral);
        restored.peripherals.push_back(found);
    }

    INFO("BLECentralManager: Restored " + std::to_string(restored.peripherals.size()) + " peripherals");
    promise.success(restored);
}

//=============================================================================
// Platform Callbacks
//=============================================================================

void BLECentralManager::setupCallbacks() {
    _platform->setOnStateChanged([this](ManagerState state) {
        _dispatcher.dispatch([this, state]() { onStateChanged(state); });
    });

    _platform->setOnScanResult([this](const PeripheralInfo& info) {
        _dispatcher.dispatch([this, &info]() { onScanResult(info); });
    });

    _platform->setOnConnected([this](const BLEAddress& address) {
        _dispatcher.dispatch([this, &address]() { onConnected(address); });
    });

    _platform->setOnDisconnected([this](const BLEAddress& address, int32_t status) {
        _dispatcher.dispatch([this, &address, status]() { onDisconnected(address, status); });
    });

    _platform->setOnConnectFailed([this](const BLEAddress& address, int32_t status) {
        _dispatcher.dispatch([this, &address, status]() { onConnectFailed(address, status); });
    });

    _platform->setOnPeripheralStateChanged([this](const BLEAddress& address, PeripheralState state) {
        _dispatcher.dispatch([this, &address, state]() { onPeripheralStateChanged(address, state); });
    });

    _platform->setOnServicesDiscovered([this](const BLEAddress& address,
                                              const std::vector<std::string>& service_uuids,
                                              int32_t status) {
        _dispatcher.dispatch([this, &address, &service_uuids, status]() {
            onServicesDiscovered(address, service_uuids, status);
        });
    });

    _platform->setOnCharacteristicsDiscovered([this](const BLEAddress& address, const std::string& service_uuid,
                                                     const std::vector<CharacteristicInfo>& characteristics,
                                                     int32_t status) {
        _dispatcher.dispatch([this, &address, &service_uuid, &characteristics, status]() {
            onCharacteristicsDiscovered(address, service_uuid, characteristics, status);
        });
    });

    _platform->setOnValueUpdated([this](const BLEAddress& address, const std::string& service_uuid,
                                        const std::string& characteristic_uuid, const Bytes& value,
                                        int32_t status) {
        _dispatcher.dispatch([this, &address, &service_uuid, &characteristic_uuid, &value, status]() {
            onValueUpdated(address, service_uuid, characteristic_uuid, value, status);
        });
    });

    _platform->setOnValueWritten([this](const BLEAddress& address, const std::string& service_uuid,
                                        const std::string& characteristic_uuid, int32_t status) {
        _dispatcher.dispatch([this, &address, &service_uuid, &characteristic_uuid, status]() {
            onValueWritten(address, service_uuid, characteristic_uuid, status);
        });
    });

    _platform->setOnNotifyStateChanged([this](const BLEAddress& address, const std::string& service_uuid,
                                              const std::string& characteristic_uuid, bool enabled,
                                              int32_t status) {
        _dispatcher.dispatch([this, &address, &service_uuid, &characteristic_uuid, enabled, status]() {
            onNotifyStateChanged(address, service_uuid, characteristic_uuid, enabled, status);
        });
    });

    _platform->setOnRSSIRead([this](const BLEAddress& address, int8_t rssi, int32_t status) {
        _dispatcher.dispatch([this, &address, rssi, status]() { onRSSIRead(address, rssi, status); });
    });

    _platform->setOnStateRestored([this](const RestorePayload& payload) {
        _dispatcher.dispatch([this, &payload]() { onStateRestored(payload); });
    });
}

void BLECentralManager::clearCallbacks() {
    _platform->setOnStateChanged(nullptr);
    _platform->setOnScanResult(nullptr);
    _platform->setOnConnected(nullptr);
    _platform->setOnDisconnected(nullptr);
    _platform->setOnConnectFailed(nullptr);
    _platform->setOnPeripheralStateChanged(nullptr);
    _platform->setOnServicesDiscovered(nullptr);
    _platform->setOnCharacteristicsDiscovered(nullptr);
    _platform->setOnValueUpdated(nullptr);
    _platform->setOnValueWritten(nullptr);
    _platform->setOnNotifyStateChanged(nullptr);
    _platform->setOnRSSIRead(nullptr);
    _platform->setOnStateRestored(nullptr);
}

void BLECentralManager::onConnected(const BLEAddress& address) {
    BLEPeripheral* found = findPeripheral(address, "connect");
    if (found) {
        found->didConnect();
    }
}

void BLECentralManager::onDisconnected(const BLEAddress& address, int32_t status) {
    BLEPeripheral* found = findPeripheral(address, "disconnect");
    if (found) {
        found->didDisconnect(Error::fromStatus(status));
    }
}

void BLECentralManager::onConnectFailed(const BLEAddress& address, int32_t status) {
    BLEPeripheral* found = findPeripheral(address, "connect failure");
    if (found) {
        found->didFailToConnect(Error::fromStatus(status));
    }
}

void BLECentralManager::onPeripheralStateChanged(const BLEAddress& address, PeripheralState state) {
    BLEPeripheral* found = findPeripheral(address, "state change");
    if (found) {
        found->didUpdateState(state);
    }
}

void BLECentralManager::onServicesDiscovered(const BLEAddress& address,
                                             const std::vector<std::string>& service_uuids, int32_t status) {
    BLEPeripheral* found = findPeripheral(address, "services");
    if (found) {
        found->didDiscoverServices(service_uuids, Error::fromStatus(status));
    }
}

void BLECentralManager::onCharacteristicsDiscovered(const BLEAddress& address, const std::string& service_uuid,
                                                    const std::vector<CharacteristicInfo>& characteristics,
                                                    int32_t status) {
    BLEPeripheral* found = findPeripheral(address, "characteristics");
    if (found) {
        found->didDiscoverCharacteristics(service_uuid, characteristics, Error::fromStatus(status));
    }
}

void BLECentralManager::onValueUpdated(const BLEAddress& address, const std::string& service_uuid,
                                       const std::string& characteristic_uuid, const Bytes& value,
                                       int32_t status) {
    BLEPeripheral* found = findPeripheral(address, "value update");
    if (found) {
        found->didUpdateValue(service_uuid, characteristic_uuid, value, Error::fromStatus(status));
    }
}

void BLECentralManager::onValueWritten(const BLEAddress& address, const std::string& service_uuid,
                                       const std::string& characteristic_uuid, int32_t status) {
    BLEPeripheral* found = findPeripheral(address, "write");
    if (found) {
        found->didWriteValue(service_uuid, characteristic_uuid, Error::fromStatus(status));
    }
}

void BLECentralManager::onNotifyStateChanged(const BLEAddress& address, const std::string& service_uuid,
                                             const std::string& characteristic_uuid, bool enabled,
                                             int32_t status) {
    BLEPeripheral* found = findPeripheral(address, "notify state");
    if (found) {
        found->didUpdateNotificationState(service_uuid, characteristic_uuid, enabled,
                                          Error::fromStatus(status));
    }
}

void BLECentralManager::onRSSIRead(const BLEAddress& address, int8_t rssi, int32_t status) {
    BLEPeripheral* found = findPeripheral(address, "RSSI");
    if (found) {
        found->didReadRSSI(rssi, Error::fromStatus(status));
    }
}

}} // namespace Tether::BLE
