/**
 * @file BLEService.h
 * @brief Discovered GATT service of a peripheral
 */
#pragma once

#include "BLECharacteristic.h"
#include "BLEFuture.h"
#include "BLETypes.h"

#include <memory>
#include <string>
#include <vector>

namespace Tether { namespace BLE {

class BLEPeripheral;

class BLEService {
public:
    BLEService(BLEPeripheral& peripheral, const std::string& uuid);

    BLEService(const BLEService&) = delete;
    BLEService& operator=(const BLEService&) = delete;

    const std::string& uuid() const { return _uuid; }
    BLEPeripheral& peripheral() const { return _peripheral; }

    /**
     * @brief Discovered characteristics in the order the platform reported them
     */
    std::vector<BLECharacteristic*> characteristics() const;

    /**
     * @brief Find a discovered characteristic by UUID
     * @return nullptr if not discovered
     */
    BLECharacteristic* characteristic(const std::string& uuid) const;

    /**
     * @brief Discover characteristics of this service
     *
     * Fails immediately with NOT_CONNECTED unless the peripheral is connected.
     * On success the characteristic index is replaced by the platform's answer.
     *
     * @param characteristic_uuids Characteristics to discover (empty = all)
     */
    Future<BLEService*> discoverCharacteristics(const std::vector<std::string>& characteristic_uuids);
    Future<BLEService*> discoverAllCharacteristics();

private:
    friend class BLEPeripheral;

    void setCharacteristics(const std::vector<CharacteristicInfo>& characteristics);
    void didDiscoverCharacteristics(const Error& error);

    BLEPeripheral& _peripheral;
    std::string _uuid;
    std::vector<std::unique_ptr<BLECharacteristic>> _characteristics;
    Promise<BLEService*> _characteristics_promise;
};

}} // namespace Tether::BLE
