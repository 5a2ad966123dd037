/**
 * @file BLECharacteristic.cpp
 * @brief GATT characteristic implementation
 */

#include "BLECharacteristic.h"
#include "BLEPeripheral.h"
#include "BLEService.h"
#include "Log.h"

namespace Tether { namespace BLE {

BLECharacteristic::BLECharacteristic(BLEService& service, const CharacteristicInfo& info)
    : _service(service),
      _uuid(info.uuid),
      _properties(info.properties) {
}

Future<BLECharacteristic*> BLECharacteristic::read(double timeout) {
    std::lock_guard<std::recursive_mutex> lock(_service.peripheral().dispatcher().mutex());

    Promise<BLECharacteristic*> promise;
    Error error = checkAccess(Property::READ);
    if (!error.ok()) {
        promise.failure(error);
        return promise.future();
    }

    GATTOperationBuilder builder;
    builder.read(_service.uuid(), _uuid).withTimeout(timeout);
    return enqueue(builder, promise, [](BLECharacteristic& characteristic, const Bytes& data) {
        characteristic._value = data;
    });
}

Future<BLECharacteristic*> BLECharacteristic::write(const Bytes& data, OperationType type, double timeout) {
    std::lock_guard<std::recursive_mutex> lock(_service.peripheral().dispatcher().mutex());

    Promise<BLECharacteristic*> promise;
    Error error;
    if (type == OperationType::WRITE) {
        error = checkAccess(Property::WRITE);
    } else if (type == OperationType::WRITE_NO_RESPONSE) {
        error = checkAccess(Property::WRITE_NO_RESPONSE);
    } else {
        error = Error(ErrorCode::NOT_SUPPORTED);
    }
    if (!error.ok()) {
        promise.failure(error);
        return promise.future();
    }

    GATTOperationBuilder builder;
    if (type == OperationType::WRITE) {
        builder.write(_service.uuid(), _uuid, data);
    } else {
        builder.writeNoResponse(_service.uuid(), _uuid, data);
    }
    builder.withTimeout(timeout);
    return enqueue(builder, promise, nullptr);
}

Future<BLECharacteristic*> BLECharacteristic::startNotifying() {
    std::lock_guard<std::recursive_mutex> lock(_service.peripheral().dispatcher().mutex());

    Promise<BLECharacteristic*> promise;
    Error error = checkAccess(Property::NOTIFY | Property::INDICATE);
    if (!error.ok()) {
        promise.failure(error);
        return promise.future();
    }

    GATTOperationBuilder builder;
    builder.enableNotify(_service.uuid(), _uuid);
    return enqueue(builder, promise, [](BLECharacteristic& characteristic, const Bytes&) {
        characteristic._notifying = true;
    });
}

Future<BLECharacteristic*> BLECharacteristic::stopNotifying() {
    std::lock_guard<std::recursive_mutex> lock(_service.peripheral().dispatcher().mutex());

    Promise<BLECharacteristic*> promise;
    Error error = checkAccess(Property::NOTIFY | Property::INDICATE);
    if (!error.ok()) {
        promise.failure(error);
        return promise.future();
    }

    GATTOperationBuilder builder;
    builder.disableNotify(_service.uuid(), _uuid);
    return enqueue(builder, promise, [](BLECharacteristic& characteristic, const Bytes&) {
        characteristic._notifying = false;
    });
}

FutureStream<Bytes> BLECharacteristic::receiveNotificationUpdates(size_t capacity) {
    std::lock_guard<std::recursive_mutex> lock(_service.peripheral().dispatcher().mutex());
    _notification_promise.reset(new StreamPromise<Bytes>(capacity));
    return _notification_promise->stream();
}

void BLECharacteristic::stopNotificationUpdates() {
    std::lock_guard<std::recursive_mutex> lock(_service.peripheral().dispatcher().mutex());
    _notification_promise.reset();
}

void BLECharacteristic::didUpdateValue(const Bytes& value, const Error& error) {
    if (!error.ok()) {
        DEBUG("BLECharacteristic: Update failed for " + _uuid + ": " + error.toString());
        if (_notification_promise) {
            StreamPromise<Bytes> promise = *_notification_promise;
            promise.failure(error);
        }
        return;
    }

    _value = value;

    if (!_notifying || !_notification_promise) {
        TRACE("BLECharacteristic: Unsolicited update for " + _uuid);
        return;
    }

    // Listeners may drop the stream; keep the shared state alive while emitting
    StreamPromise<Bytes> promise = *_notification_promise;
    promise.success(value);
}

Error BLECharacteristic::checkAccess(uint8_t required_properties) const {
    if ((_properties & required_properties) == 0) {
        return Error(ErrorCode::NOT_SUPPORTED);
    }
    if (_service.peripheral().state() != PeripheralState::CONNECTED) {
        return Error(ErrorCode::NOT_CONNECTED);
    }
    return Error();
}

Future<BLECharacteristic*> BLECharacteristic::enqueue(
        GATTOperationBuilder& builder, const Promise<BLECharacteristic*>& promise,
        std::function<void(BLECharacteristic&, const Bytes&)> apply) {
    // The characteristic may be re-created by a later discovery, so look it up on completion
    BLEPeripheral* peripheral = &_service.peripheral();
    std::string service_uuid = _service.uuid();
    std::string uuid = _uuid;
    Promise<BLECharacteristic*> result = promise;

    builder.withCallback([peripheral, service_uuid, uuid, result, apply](const Error& error,
                                                                          const Bytes& data) mutable {
        if (!error.ok()) {
            result.failure(error);
            return;
        }
        BLECharacteristic* characteristic = peripheral->characteristic(service_uuid, uuid);
        if (!characteristic) {
            result.failure(Error(ErrorCode::NOT_FOUND));
            return;
        }
        if (apply) {
            apply(*characteristic, data);
        }
        result.success(characteristic);
    });

    peripheral->enqueueOperation(builder.build());
    return promise.future();
}

}} // namespace Tether::BLE
