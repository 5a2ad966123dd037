/**
 * @file BLECharacteristic.h
 * @brief Discovered GATT characteristic of a peripheral service
 *
 * Reads, writes and notification-state changes are queued on the owning
 * peripheral's operation queue, so at most one is in flight per peripheral.
 * Each returns a Future completed with this characteristic once the platform
 * answers, or with an Error:
 * - NOT_SUPPORTED if the characteristic lacks the required property
 * - NOT_CONNECTED if the peripheral is not connected (or disconnects first)
 * - TRANSPORT if the platform refuses or fails the operation
 * - OPERATION_TIMEOUT if the platform does not answer in time
 */
#pragma once

#include "BLEFuture.h"
#include "BLEOperationQueue.h"
#include "BLETypes.h"
#include "Bytes.h"

#include <memory>
#include <string>

namespace Tether { namespace BLE {

class BLEService;
class BLEPeripheral;

class BLECharacteristic {
public:
    BLECharacteristic(BLEService& service, const CharacteristicInfo& info);

    BLECharacteristic(const BLECharacteristic&) = delete;
    BLECharacteristic& operator=(const BLECharacteristic&) = delete;

    const std::string& uuid() const { return _uuid; }
    uint8_t properties() const { return _properties; }
    BLEService& service() const { return _service; }

    bool canRead() const { return (_properties & Property::READ) != 0; }
    bool canWrite() const { return (_properties & Property::WRITE) != 0; }
    bool canWriteWithoutResponse() const { return (_properties & Property::WRITE_NO_RESPONSE) != 0; }
    bool canNotify() const { return (_properties & (Property::NOTIFY | Property::INDICATE)) != 0; }

    /**
     * @brief Last value read or notified
     */
    const Bytes& value() const { return _value; }

    bool isNotifying() const { return _notifying; }

    //=========================================================================
    // Operations
    //=========================================================================

    /**
     * @brief Read the value from the peripheral
     * @param timeout Seconds to wait for the answer (0 = manager default)
     */
    Future<BLECharacteristic*> read(double timeout = 0);

    /**
     * @brief Write a value to the peripheral
     *
     * @param type OperationType::WRITE or OperationType::WRITE_NO_RESPONSE.
     *             A write without response completes once the platform accepts it.
     * @param timeout Seconds to wait for the answer (0 = manager default)
     */
    Future<BLECharacteristic*> write(const Bytes& data, OperationType type = OperationType::WRITE,
                                     double timeout = 0);

    Future<BLECharacteristic*> startNotifying();
    Future<BLECharacteristic*> stopNotifying();

    /**
     * @brief Stream of values notified while notifying is enabled
     *
     * @param capacity Values replayed to late listeners (0 = all)
     */
    FutureStream<Bytes> receiveNotificationUpdates(size_t capacity = Limits::STREAM_HISTORY);
    void stopNotificationUpdates();

private:
    friend class BLEPeripheral;

    // Notification (value update not answering a queued read)
    void didUpdateValue(const Bytes& value, const Error& error);

    Error checkAccess(uint8_t required_properties) const;
    Future<BLECharacteristic*> enqueue(GATTOperationBuilder& builder, const Promise<BLECharacteristic*>& promise,
                                       std::function<void(BLECharacteristic&, const Bytes&)> apply);

    BLEService& _service;
    std::string _uuid;
    uint8_t _properties = 0;
    Bytes _value;
    bool _notifying = false;
    std::unique_ptr<StreamPromise<Bytes>> _notification_promise;
};

}} // namespace Tether::BLE
