/**
 * @file BLEService.cpp
 * @brief GATT service implementation
 */

#include "BLEService.h"
#include "BLEPeripheral.h"
#include "Log.h"

namespace Tether { namespace BLE {

BLEService::BLEService(BLEPeripheral& peripheral, const std::string& uuid)
    : _peripheral(peripheral),
      _uuid(uuid) {
}

std::vector<BLECharacteristic*> BLEService::characteristics() const {
    std::vector<BLECharacteristic*> result;
    result.reserve(_characteristics.size());
    for (const auto& characteristic : _characteristics) {
        result.push_back(characteristic.get());
    }
    return result;
}

BLECharacteristic* BLEService::characteristic(const std::string& uuid) const {
    for (const auto& characteristic : _characteristics) {
        if (characteristic->uuid() == uuid) {
            return characteristic.get();
        }
    }
    return nullptr;
}

Future<BLEService*> BLEService::discoverCharacteristics(const std::vector<std::string>& characteristic_uuids) {
    std::lock_guard<std::recursive_mutex> lock(_peripheral.dispatcher().mutex());

    _characteristics_promise = Promise<BLEService*>();
    Future<BLEService*> future = _characteristics_promise.future();

    if (_peripheral.state() != PeripheralState::CONNECTED) {
        DEBUG("BLEService: Cannot discover characteristics of " + _uuid + ", peripheral not connected");
        _characteristics_promise.failure(Error(ErrorCode::NOT_CONNECTED));
        return future;
    }

    DEBUG("BLEService: Discovering characteristics of " + _uuid + " on " +
          _peripheral.address().toString());

    if (!_peripheral.platform().discoverCharacteristics(_peripheral.address(), _uuid, characteristic_uuids)) {
        WARNING("BLEService: Platform refused characteristic discovery for " + _uuid);
        _characteristics_promise.failure(Error(ErrorCode::TRANSPORT, STATUS_REJECTED));
    }
    return future;
}

Future<BLEService*> BLEService::discoverAllCharacteristics() {
    return discoverCharacteristics(std::vector<std::string>());
}

void BLEService::setCharacteristics(const std::vector<CharacteristicInfo>& characteristics) {
    _characteristics.clear();
    for (const auto& info : characteristics) {
        if (characteristic(info.uuid)) {
            DEBUG("BLEService: Ignoring duplicate characteristic " + info.uuid + " in " + _uuid);
            continue;
        }
        _characteristics.push_back(std::unique_ptr<BLECharacteristic>(new BLECharacteristic(*this, info)));
    }
}

void BLEService::didDiscoverCharacteristics(const Error& error) {
    // Listeners may start a new discovery, which replaces the member promise
    Promise<BLEService*> promise = _characteristics_promise;
    if (error.ok()) {
        DEBUG("BLEService: Discovered " + std::to_string(_characteristics.size()) +
              " characteristics in " + _uuid);
        promise.success(this);
    } else {
        DEBUG("BLEService: Characteristic discovery failed for " + _uuid + ": " + error.toString());
        promise.failure(error);
    }
}

}} // namespace Tether::BLE
