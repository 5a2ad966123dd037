/**
 * @file BLEPeripheral.cpp
 * @brief Peripheral record implementation
 */

#include "BLEPeripheral.h"
#include "BLECentralManager.h"
#include "Log.h"

#include <cmath>

namespace Tether { namespace BLE {

//=============================================================================
// Operation Queue
//=============================================================================

BLEPeripheral::OperationQueue::OperationQueue(BLEPeripheral& peripheral)
    : BLEOperationQueue(peripheral._dispatcher.clock()),
      _peripheral(peripheral) {
}

bool BLEPeripheral::OperationQueue::executeOperation(const GATTOperation& op) {
    if (_peripheral._state != PeripheralState::CONNECTED) {
        return false;
    }

    IBLEPlatform& platform = *_peripheral._platform;
    const BLEAddress& address = _peripheral._address;

    switch (op.type) {
        case OperationType::READ:
            return platform.read(address, op.service_uuid, op.characteristic_uuid);
        case OperationType::WRITE:
            return platform.write(address, op.service_uuid, op.characteristic_uuid, op.data, true);
        case OperationType::WRITE_NO_RESPONSE:
            return platform.write(address, op.service_uuid, op.characteristic_uuid, op.data, false);
        case OperationType::NOTIFY_ENABLE:
            return platform.setNotify(address, op.service_uuid, op.characteristic_uuid, true);
        case OperationType::NOTIFY_DISABLE:
            return platform.setNotify(address, op.service_uuid, op.characteristic_uuid, false);
    }
    return false;
}

//=============================================================================
// Construction
//=============================================================================

BLEPeripheral::BLEPeripheral(BLECentralManager& central, const PeripheralInfo& info, double discovered_at)
    : _central(central),
      _dispatcher(central.dispatcher()),
      _platform(central.platform()),
      _address(info.address),
      _name(info.name.empty() ? "Unknown" : info.name),
      _rssi(info.rssi),
      _advertisement(info.advertisement),
      _state(info.state),
      _discovered_at(discovered_at),
      _operation_timeout(central.config().operation_timeout),
      _queue(*this) {
}

BLEPeripheral::~BLEPeripheral() {
    // Queued operations are dropped without callbacks
    _dispatcher.cancel(_connection_timer);
    _dispatcher.cancel(_poll_timer);
}

//=============================================================================
// Connection
//=============================================================================

FutureStream<ConnectionUpdate> BLEPeripheral::connect(const ConnectOptions& options) {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    _connection_promise = StreamPromise<ConnectionUpdate>(options.capacity);
    _timeout_retries = options.timeout_retries;
    _disconnect_retries = options.disconnect_retries;
    _connection_timeout = options.connection_timeout;

    DEBUG("BLEPeripheral: connect " + _name + " " + _address.toString());

    FutureStream<ConnectionUpdate> stream = _connection_promise.stream();
    reconnect();
    return stream;
}

void BLEPeripheral::reconnect() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    if (_state != PeripheralState::DISCONNECTED) {
        DEBUG("BLEPeripheral: " + _address.toString() + " not disconnected (" +
              peripheralStateToString(_state) + "), ignoring reconnect");
        return;
    }

    _sequence++;
    _forced_disconnect = false;
    _timeout_pending = false;
    _connect_refused = false;
    _state = PeripheralState::CONNECTING;

    DEBUG("BLEPeripheral: reconnect " + _name + " " + _address.toString() +
          ", sequence " + std::to_string(_sequence));

    uint32_t sequence = _sequence;
    if (std::isfinite(_connection_timeout)) {
        _connection_timer = _dispatcher.schedule(_connection_timeout, [this, sequence]() {
            timeoutConnection(sequence);
        });
    }

    if (!_central.connectPeripheral(*this)) {
        WARNING("BLEPeripheral: Platform refused connection to " + _address.toString());
        _state = PeripheralState::DISCONNECTED;
        _dispatcher.cancel(_connection_timer);
        _connection_timer = BLEDispatcher::INVALID_TIMER;
        _connect_refused = true;

        // Report on the next turn so listeners can reconnect without recursing.
        // The record may be removed before then, so look it up again.
        BLECentralManager& central = _central;
        BLEAddress address = _address;
        _dispatcher.post([&central, address, sequence]() {
            BLEPeripheral* peripheral = central.peripheral(address);
            if (peripheral) {
                peripheral->reportRefusedConnection(sequence);
            }
        });
    }
}

void BLEPeripheral::disconnect() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    _forced_disconnect = true;
    stopPollingRSSI();

    if (_state != PeripheralState::DISCONNECTED) {
        DEBUG("BLEPeripheral: disconnecting " + _name + " " + _address.toString());
        if (!_central.cancelPeripheralConnection(*this)) {
            WARNING("BLEPeripheral: Platform refused to cancel connection to " + _address.toString());
            didDisconnect(Error());
        }
    } else {
        DEBUG("BLEPeripheral: already disconnected " + _name + " " + _address.toString());
        didDisconnect(Error(ErrorCode::NOT_CONNECTED));
    }
}

void BLEPeripheral::terminate() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    BLEAddress address = _address;
    BLECentralManager& central = _central;
    disconnect();
    central.removePeripheral(address);
}

void BLEPeripheral::timeoutConnection(uint32_t sequence) {
    // A stale timer must not forget the current attempt's timer
    if (sequence == _sequence) {
        _connection_timer = BLEDispatcher::INVALID_TIMER;
    }

    if (_state != PeripheralState::CONNECTED && sequence == _sequence && !_forced_disconnect) {
        DEBUG("BLEPeripheral: timing out " + _name + " " + _address.toString() +
              ", sequence " + std::to_string(sequence));
        _timeout_pending = true;
        if (!_central.cancelPeripheralConnection(*this)) {
            WARNING("BLEPeripheral: Platform refused to cancel connection to " + _address.toString());
            didDisconnect(Error());
        }
    } else {
        DEBUG("BLEPeripheral: timeout expired " + _address.toString() + ", sequence " +
              std::to_string(sequence) + ", current " + std::to_string(_sequence) +
              ", state " + peripheralStateToString(_state));
    }
}

void BLEPeripheral::reportRefusedConnection(uint32_t sequence) {
    if (_connect_refused && sequence == _sequence && _state == PeripheralState::DISCONNECTED) {
        didDisconnect(Error(ErrorCode::TRANSPORT, STATUS_REJECTED));
    }
}

//=============================================================================
// Retry Policy
//=============================================================================

void BLEPeripheral::shouldFailOrGiveUp(const Error& error) {
    DEBUG("BLEPeripheral: " + _address.toString() + " disconnect count " +
          std::to_string(_disconnect_count) + ", retries " + std::to_string(_disconnect_retries));

    if (_disconnect_retries != Retry::UNLIMITED && _disconnect_count >= _disconnect_retries) {
        _disconnect_count = 0;
        INFO("BLEPeripheral: Giving up on " + _address.toString() + " after " + error.toString());
        emit(ConnectionEvent::GIVE_UP);
        return;
    }

    if (_disconnect_retries != Retry::UNLIMITED) {
        _disconnect_count++;
    }
    StreamPromise<ConnectionUpdate> promise = _connection_promise;
    promise.failure(error);
}

void BLEPeripheral::shouldTimeoutOrGiveUp() {
    DEBUG("BLEPeripheral: " + _address.toString() + " timeout count " +
          std::to_string(_timeout_count) + ", retries " + std::to_string(_timeout_retries));

    if (_timeout_retries == Retry::UNLIMITED) {
        emit(ConnectionEvent::TIMEOUT);
    } else if (_timeout_count < _timeout_retries) {
        _timeout_count++;
        emit(ConnectionEvent::TIMEOUT);
    } else {
        _timeout_count = 0;
        INFO("BLEPeripheral: Giving up on " + _address.toString() + " after " +
             std::to_string(_timeout_retries) + " timeouts");
        emit(ConnectionEvent::GIVE_UP);
    }
}

void BLEPeripheral::shouldDisconnectOrGiveUp() {
    DEBUG("BLEPeripheral: " + _address.toString() + " disconnect count " +
          std::to_string(_disconnect_count) + ", retries " + std::to_string(_disconnect_retries));

    if (_disconnect_retries == Retry::UNLIMITED) {
        emit(ConnectionEvent::DISCONNECT);
    } else if (_disconnect_count < _disconnect_retries) {
        _disconnect_count++;
        emit(ConnectionEvent::DISCONNECT);
    } else {
        _disconnect_count = 0;
        INFO("BLEPeripheral: Giving up on " + _address.toString() + " after " +
             std::to_string(_disconnect_retries) + " disconnects");
        emit(ConnectionEvent::GIVE_UP);
    }
}

void BLEPeripheral::emit(ConnectionEvent event) {
    TRACE("BLEPeripheral: " + _address.toString() + " event " + connectionEventToString(event));
    // Listeners may start a new session, which replaces the member promise
    StreamPromise<ConnectionUpdate> promise = _connection_promise;
    promise.success(ConnectionUpdate(this, event));
}

//=============================================================================
// Discovery
//=============================================================================

Future<BLEPeripheral*> BLEPeripheral::discoverServices(const std::vector<std::string>& service_uuids) {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    _services_promise = Promise<BLEPeripheral*>();
    Future<BLEPeripheral*> future = _services_promise.future();

    if (_state != PeripheralState::CONNECTED) {
        DEBUG("BLEPeripheral: Cannot discover services of " + _address.toString() + ", not connected");
        _services_promise.failure(Error(ErrorCode::NOT_CONNECTED));
        return future;
    }

    DEBUG("BLEPeripheral: Discovering services of " + _name + " " + _address.toString());

    if (!_platform->discoverServices(_address, service_uuids)) {
        WARNING("BLEPeripheral: Platform refused service discovery for " + _address.toString());
        _services_promise.failure(Error(ErrorCode::TRANSPORT, STATUS_REJECTED));
    }
    return future;
}

Future<BLEPeripheral*> BLEPeripheral::discoverAllServices() {
    return discoverServices(std::vector<std::string>());
}

Future<BLEPeripheral*> BLEPeripheral::discoverPeripheralServices(const std::vector<std::string>& service_uuids) {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    Promise<BLEPeripheral*> promise;
    Future<BLEPeripheral*> future = promise.future();

    Future<BLEPeripheral*> services_discovered = discoverServices(service_uuids);
    services_discovered.onSuccess([this, promise](BLEPeripheral*) mutable {
        // Walk a snapshot; a concurrent rediscovery may replace the services
        std::vector<std::string> uuids;
        for (const auto& service : _services) {
            uuids.push_back(service->uuid());
        }
        if (uuids.empty()) {
            DEBUG("BLEPeripheral: No services found on " + _address.toString());
            promise.failure(Error(ErrorCode::NO_SERVICES_FOUND));
            return;
        }
        discoverService(uuids, 0, promise);
    });
    services_discovered.onFailure([promise](const Error& error) mutable {
        promise.failure(error);
    });

    return future;
}

Future<BLEPeripheral*> BLEPeripheral::discoverAllPeripheralServices() {
    return discoverPeripheralServices(std::vector<std::string>());
}

void BLEPeripheral::discoverService(const std::vector<std::string>& service_uuids, size_t index,
                                    Promise<BLEPeripheral*> promise) {
    BLEService* service = this->service(service_uuids[index]);
    if (!service) {
        DEBUG("BLEPeripheral: Service " + service_uuids[index] + " no longer discovered on " +
              _address.toString());
        promise.failure(Error(ErrorCode::NOT_FOUND));
        return;
    }

    DEBUG("BLEPeripheral: Discovering service " + service->uuid() + " (" +
          std::to_string(index + 1) + "/" + std::to_string(service_uuids.size()) + ")");

    Future<BLEService*> discovered = service->discoverAllCharacteristics();
    discovered.onSuccess([this, service_uuids, index, promise](BLEService*) mutable {
        if (index + 1 < service_uuids.size()) {
            discoverService(service_uuids, index + 1, promise);
        } else {
            promise.success(this);
        }
    });
    discovered.onFailure([promise](const Error& error) mutable {
        promise.failure(error);
    });
}

std::vector<BLEService*> BLEPeripheral::services() const {
    std::vector<BLEService*> result;
    result.reserve(_services.size());
    for (const auto& service : _services) {
        result.push_back(service.get());
    }
    return result;
}

BLEService* BLEPeripheral::service(const std::string& uuid) const {
    for (const auto& service : _services) {
        if (service->uuid() == uuid) {
            return service.get();
        }
    }
    return nullptr;
}

BLECharacteristic* BLEPeripheral::characteristic(const std::string& uuid) const {
    auto it = _characteristics.find(uuid);
    return it != _characteristics.end() ? it->second : nullptr;
}

BLECharacteristic* BLEPeripheral::characteristic(const std::string& service_uuid, const std::string& uuid) const {
    BLEService* found = service(service_uuid);
    return found ? found->characteristic(uuid) : nullptr;
}

void BLEPeripheral::clearServices() {
    std::vector<std::unique_ptr<BLEService>> removed;
    removed.swap(_services);
    _characteristics.clear();

    // Fail characteristic discoveries still waiting on the removed services
    for (auto& service : removed) {
        Promise<BLEService*> pending = service->_characteristics_promise;
        pending.failure(Error(ErrorCode::NOT_FOUND));
    }
}

void BLEPeripheral::indexCharacteristics(BLEService* service) {
    for (BLECharacteristic* characteristic : service->characteristics()) {
        _characteristics[characteristic->uuid()] = characteristic;
    }
}

void BLEPeripheral::unindexCharacteristics(BLEService* service) {
    for (auto it = _characteristics.begin(); it != _characteristics.end();) {
        if (&it->second->service() == service) {
            it = _characteristics.erase(it);
        } else {
            ++it;
        }
    }
}

//=============================================================================
// RSSI
//=============================================================================

Future<int8_t> BLEPeripheral::readRSSI() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    _rssi_promise = Promise<int8_t>();
    Future<int8_t> future = _rssi_promise.future();

    if (_state != PeripheralState::CONNECTED) {
        _rssi_promise.failure(Error(ErrorCode::NOT_CONNECTED));
    } else if (!_platform->readRSSI(_address)) {
        WARNING("BLEPeripheral: Platform refused RSSI read for " + _address.toString());
        _rssi_promise.failure(Error(ErrorCode::TRANSPORT, STATUS_REJECTED));
    }
    return future;
}

FutureStream<int8_t> BLEPeripheral::startPollingRSSI(double period, size_t capacity) {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    _dispatcher.cancel(_poll_timer);
    _poll_timer = BLEDispatcher::INVALID_TIMER;
    _poll_promise.reset(new StreamPromise<int8_t>(capacity));
    _poll_period = period > 0 ? period : Timing::RSSI_POLL_PERIOD;

    DEBUG("BLEPeripheral: Polling RSSI of " + _address.toString() + " every " +
          std::to_string(_poll_period) + "s");

    FutureStream<int8_t> stream = _poll_promise->stream();
    requestRSSI();
    if (_poll_promise) {
        _poll_timer = _dispatcher.schedule(_poll_period, [this]() { pollRSSI(); });
    }
    return stream;
}

void BLEPeripheral::stopPollingRSSI() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    _dispatcher.cancel(_poll_timer);
    _poll_timer = BLEDispatcher::INVALID_TIMER;
    _poll_promise.reset();
}

void BLEPeripheral::pollRSSI() {
    _poll_timer = BLEDispatcher::INVALID_TIMER;
    if (!_poll_promise) {
        return;
    }

    requestRSSI();
    if (_poll_promise) {
        _poll_timer = _dispatcher.schedule(_poll_period, [this]() { pollRSSI(); });
    }
}

void BLEPeripheral::requestRSSI() {
    if (_state != PeripheralState::CONNECTED) {
        StreamPromise<int8_t> promise = *_poll_promise;
        promise.failure(Error(ErrorCode::NOT_CONNECTED));
    } else if (!_platform->readRSSI(_address)) {
        WARNING("BLEPeripheral: Platform refused RSSI read for " + _address.toString());
        StreamPromise<int8_t> promise = *_poll_promise;
        promise.failure(Error(ErrorCode::TRANSPORT, STATUS_REJECTED));
    }
}

//=============================================================================
// Statistics
//=============================================================================

double BLEPeripheral::secondsConnected() const {
    if (_has_connected_at && !_has_disconnected_at) {
        return _dispatcher.now() - _connected_at;
    }
    return _last_session_seconds;
}

double BLEPeripheral::cumulativeSecondsConnected() const {
    if (_has_connected_at && !_has_disconnected_at) {
        return _total_seconds_connected + (_dispatcher.now() - _connected_at);
    }
    return _total_seconds_connected;
}

double BLEPeripheral::cumulativeSecondsDisconnected() const {
    return (_dispatcher.now() - _discovered_at) - cumulativeSecondsConnected();
}

//=============================================================================
// GATT Operations
//=============================================================================

void BLEPeripheral::enqueueOperation(GATTOperation op) {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    if (op.timeout <= 0) {
        op.timeout = _operation_timeout;
    }
    _queue.enqueue(std::move(op));
    _queue.process();
}

void BLEPeripheral::processOperations() {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());

    _queue.process();
    // A timed out or refused operation leaves the queue idle until the next call
    if (!_queue.isBusy() && _queue.depth() > 0) {
        _queue.process();
    }
}

void BLEPeripheral::cancelOperations(const Error& error) {
    std::lock_guard<std::recursive_mutex> lock(_dispatcher.mutex());
    _queue.clear(error);
}

size_t BLEPeripheral::pendingOperations() const {
    return _queue.depth() + (_queue.isBusy() ? 1 : 0);
}

bool BLEPeripheral::completeOperation(OperationType type, const std::string& service_uuid,
                                      const std::string& characteristic_uuid, const Error& error,
                                      const Bytes& data) {
    const GATTOperation* op = _queue.currentOperation();
    if (!op || op->type != type || op->service_uuid != service_uuid ||
        op->characteristic_uuid != characteristic_uuid) {
        return false;
    }

    _queue.complete(error, data);
    _queue.process();
    return true;
}

//=============================================================================
// Platform Notifications
//=============================================================================

void BLEPeripheral::didConnect() {
    _dispatcher.cancel(_connection_timer);
    _connection_timer = BLEDispatcher::INVALID_TIMER;

    // The link survived a timeout cancel; its next disconnect is not a timeout
    _timeout_pending = false;
    _state = PeripheralState::CONNECTED;
    _connected_at = _dispatcher.now();
    _has_connected_at = true;
    _disconnected_at = 0;
    _has_disconnected_at = false;
    _timeout_count = 0;

    INFO("BLEPeripheral: Connected to " + _name + " " + _address.toString());
    emit(ConnectionEvent::CONNECT);
}

void BLEPeripheral::didDisconnect(const Error& error) {
    _dispatcher.cancel(_connection_timer);
    _connection_timer = BLEDispatcher::INVALID_TIMER;

    bool was_connected = _has_connected_at && !_has_disconnected_at;
    _connect_refused = false;
    _state = PeripheralState::DISCONNECTED;
    _disconnected_at = _dispatcher.now();
    _has_disconnected_at = true;
    if (was_connected) {
        _last_session_seconds = _disconnected_at - _connected_at;
        _total_seconds_connected += _last_session_seconds;
    }

    _queue.clear(Error(ErrorCode::NOT_CONNECTED));

    if (_timeout_pending) {
        _timeout_pending = false;
        INFO("BLEPeripheral: Connection to " + _address.toString() + " timed out");
        shouldTimeoutOrGiveUp();
    } else if (!error.ok()) {
        INFO("BLEPeripheral: Disconnected from " + _address.toString() + " with " + error.toString());
        shouldFailOrGiveUp(error);
    } else if (_forced_disconnect) {
        _forced_disconnect = false;
        INFO("BLEPeripheral: Disconnect forced for " + _address.toString());
        emit(ConnectionEvent::FORCE_DISCONNECT);
    } else {
        INFO("BLEPeripheral: Disconnected from " + _address.toString());
        shouldDisconnectOrGiveUp();
    }
}

void BLEPeripheral::didFailToConnect(const Error& error) {
    DEBUG("BLEPeripheral: Failed to connect to " + _address.toString() + ": " + error.toString());
    didDisconnect(error);
}

void BLEPeripheral::didUpdateState(PeripheralState state) {
    if (state == _state) {
        return;
    }
    DEBUG("BLEPeripheral: " + _address.toString() + " state " + peripheralStateToString(_state) +
          " -> " + peripheralStateToString(state));
    _state = state;
}

void BLEPeripheral::didDiscoverServices(const std::vector<std::string>& service_uuids, const Error& error) {
    Promise<BLEPeripheral*> promise = _services_promise;
    clearServices();

    if (!error.ok()) {
        DEBUG("BLEPeripheral: Service discovery failed for " + _address.toString() + ": " +
              error.toString());
        promise.failure(error);
        return;
    }

    for (const auto& uuid : service_uuids) {
        if (service(uuid)) {
            continue;
        }
        _services.push_back(std::unique_ptr<BLEService>(new BLEService(*this, uuid)));
        DEBUG("BLEPeripheral: Discovered service " + uuid + " on " + _address.toString());
    }
    promise.success(this);
}

void BLEPeripheral::didDiscoverCharacteristics(const std::string& service_uuid,
                                               const std::vector<CharacteristicInfo>& characteristics,
                                               const Error& error) {
    BLEService* found = service(service_uuid);
    if (!found) {
        DEBUG("BLEPeripheral: Characteristics for unknown service " + service_uuid + " on " +
              _address.toString());
        return;
    }

    if (error.ok()) {
        unindexCharacteristics(found);
        found->setCharacteristics(characteristics);
        indexCharacteristics(found);
    }
    found->didDiscoverCharacteristics(error);
}

void BLEPeripheral::didUpdateValue(const std::string& service_uuid, const std::string& characteristic_uuid,
                                   const Bytes& value, const Error& error) {
    if (completeOperation(OperationType::READ, service_uuid, characteristic_uuid, error, value)) {
        return;
    }

    BLECharacteristic* found = characteristic(service_uuid, characteristic_uuid);
    if (!found) {
        DEBUG("BLEPeripheral: Value for unknown characteristic " + characteristic_uuid);
        return;
    }
    found->didUpdateValue(value, error);
}

void BLEPeripheral::didWriteValue(const std::string& service_uuid, const std::string& characteristic_uuid,
                                  const Error& error) {
    if (!completeOperation(OperationType::WRITE, service_uuid, characteristic_uuid, error)) {
        DEBUG("BLEPeripheral: Unexpected write answer for " + characteristic_uuid);
    }
}

void BLEPeripheral::didUpdateNotificationState(const std::string& service_uuid,
                                               const std::string& characteristic_uuid,
                                               bool enabled, const Error& error) {
    OperationType type = enabled ? OperationType::NOTIFY_ENABLE : OperationType::NOTIFY_DISABLE;
    const GATTOperation* op = _queue.currentOperation();
    if (op && (op->type == OperationType::NOTIFY_ENABLE || op->type == OperationType::NOTIFY_DISABLE)) {
        type = op->type;
    }
    if (completeOperation(type, service_uuid, characteristic_uuid, error)) {
        return;
    }

    BLECharacteristic* found = characteristic(service_uuid, characteristic_uuid);
    if (found && error.ok()) {
        found->_notifying = enabled;
    }
}

void BLEPeripheral::didReadRSSI(int8_t rssi, const Error& error) {
    Promise<int8_t> read_promise = _rssi_promise;

    if (!error.ok()) {
        DEBUG("BLEPeripheral: RSSI read failed for " + _address.toString() + ": " + error.toString());
        read_promise.failure(error);
        if (_poll_promise) {
            StreamPromise<int8_t> poll_promise = *_poll_promise;
            poll_promise.failure(error);
        }
        return;
    }

    _rssi = rssi;
    TRACE("BLEPeripheral: RSSI " + std::to_string(rssi) + " for " + _address.toString());
    read_promise.success(rssi);
    if (_poll_promise) {
        StreamPromise<int8_t> poll_promise = *_poll_promise;
        poll_promise.success(rssi);
    }
}

void BLEPeripheral::didRestore(const RestoredPeripheral& restored) {
    const PeripheralInfo& info = restored.info;
    if (!info.name.empty()) {
        _name = info.name;
    }
    _rssi = info.rssi;
    _advertisement = info.advertisement;
    _state = info.state;
    if (_state == PeripheralState::CONNECTED && !(_has_connected_at && !_has_disconnected_at)) {
        _connected_at = _dispatcher.now();
        _has_connected_at = true;
        _has_disconnected_at = false;
    }

    clearServices();
    for (const auto& restored_service : restored.services) {
        if (service(restored_service.uuid)) {
            continue;
        }
        BLEService* added = new BLEService(*this, restored_service.uuid);
        _services.push_back(std::unique_ptr<BLEService>(added));
        added->setCharacteristics(restored_service.characteristics);
        indexCharacteristics(added);
    }

    DEBUG("BLEPeripheral: Restored " + _address.toString() + " with " +
          std::to_string(_services.size()) + " services");
}

}} // namespace Tether::BLE
