/**
 * @file BLEPeripheral.h
 * @brief Peripheral record: connection state machine, discovery and RSSI
 *
 * Records are created and owned by BLECentralManager. Futures and streams
 * carry raw BLEPeripheral pointers that stay valid until the record is removed
 * from the registry and the manager's next loop() turn.
 *
 * Connection lifecycle:
 *
 *   DISCONNECTED --connect()--> CONNECTING --didConnect--> CONNECTED
 *        ^                          |                          |
 *        +------- didDisconnect / didFailToConnect ------------+
 *
 * Each connect attempt schedules a timeout check. When it fires for the
 * current attempt while not connected (and the disconnect was not forced),
 * the attempt is cancelled and the resulting disconnect is reported as
 * TIMEOUT. Timeouts and disconnects are retried by the caller until the
 * configured retry limits are exhausted, when GIVE_UP is emitted instead.
 */
#pragma once

#include "BLEDispatcher.h"
#include "BLEFuture.h"
#include "BLEOperationQueue.h"
#include "BLEPlatform.h"
#include "BLEService.h"
#include "BLETypes.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Tether { namespace BLE {

class BLECentralManager;
class BLEPeripheral;

/**
 * @brief Event emitted on a connection session stream
 */
struct ConnectionUpdate {
    BLEPeripheral* peripheral = nullptr;
    ConnectionEvent event = ConnectionEvent::CONNECT;

    ConnectionUpdate() = default;
    ConnectionUpdate(BLEPeripheral* update_peripheral, ConnectionEvent update_event)
        : peripheral(update_peripheral), event(update_event) {}
};

class BLEPeripheral {
public:
    BLEPeripheral(BLECentralManager& central, const PeripheralInfo& info, double discovered_at);
    ~BLEPeripheral();

    BLEPeripheral(const BLEPeripheral&) = delete;
    BLEPeripheral& operator=(const BLEPeripheral&) = delete;

    //=========================================================================
    // Identity
    //=========================================================================

    const BLEAddress& address() const { return _address; }
    const std::string& name() const { return _name; }
    int8_t rssi() const { return _rssi; }
    const Advertisement& advertisement() const { return _advertisement; }
    PeripheralState state() const { return _state; }

    //=========================================================================
    // Connection
    //=========================================================================

    /**
     * @brief Start a connection session and issue the first attempt
     *
     * Replaces any previous session stream. The caller drives retries by
     * calling reconnect() on TIMEOUT, DISCONNECT or error events.
     */
    FutureStream<ConnectionUpdate> connect(const ConnectOptions& options = ConnectOptions());

    /**
     * @brief Issue another attempt within the current session
     *
     * Only valid while DISCONNECTED; ignored otherwise.
     */
    void reconnect();

    /**
     * @brief Disconnect on request, reported as FORCE_DISCONNECT
     *
     * While disconnected the disconnect is reported immediately with a
     * NOT_CONNECTED error.
     */
    void disconnect();

    /**
     * @brief Disconnect and remove this record from the registry
     *
     * The record must not be used after this returns.
     */
    void terminate();

    //=========================================================================
    // Discovery
    //=========================================================================

    /**
     * @brief Discover services, replacing the service and characteristic index
     * @param service_uuids Services to discover (empty = all)
     */
    Future<BLEPeripheral*> discoverServices(const std::vector<std::string>& service_uuids);
    Future<BLEPeripheral*> discoverAllServices();

    /**
     * @brief Discover services, then the characteristics of each service in order
     *
     * Fails with NO_SERVICES_FOUND when no services are found, or with the
     * first service discovery error.
     */
    Future<BLEPeripheral*> discoverPeripheralServices(const std::vector<std::string>& service_uuids);
    Future<BLEPeripheral*> discoverAllPeripheralServices();

    /**
     * @brief Discovered services in the order the platform reported them
     */
    std::vector<BLEService*> services() const;
    BLEService* service(const std::string& uuid) const;

    /**
     * @brief Find a discovered characteristic by UUID across all services
     */
    BLECharacteristic* characteristic(const std::string& uuid) const;
    BLECharacteristic* characteristic(const std::string& service_uuid, const std::string& uuid) const;

    //=========================================================================
    // RSSI
    //=========================================================================

    Future<int8_t> readRSSI();

    /**
     * @brief Read RSSI now and then every period seconds
     *
     * Ticks while not connected fail the stream with NOT_CONNECTED; polling
     * continues until stopPollingRSSI() or disconnect().
     */
    FutureStream<int8_t> startPollingRSSI(double period = Timing::RSSI_POLL_PERIOD,
                                          size_t capacity = Limits::RSSI_HISTORY);
    void stopPollingRSSI();

    //=========================================================================
    // Statistics
    //=========================================================================

    double discoveredAt() const { return _discovered_at; }
    // 0 if never connected
    double connectedAt() const { return _has_connected_at ? _connected_at : 0; }
    // 0 if not disconnected since the last connect
    double disconnectedAt() const { return _has_disconnected_at ? _disconnected_at : 0; }

    /**
     * @brief Length of the current connection, or of the last one when disconnected
     */
    double secondsConnected() const;
    double cumulativeSecondsConnected() const;
    double cumulativeSecondsDisconnected() const;

    // Connection attempts made, also the current attempt sequence number
    uint32_t numberOfConnections() const { return _sequence; }
    uint32_t timeoutCount() const { return _timeout_count; }
    uint32_t disconnectCount() const { return _disconnect_count; }

    //=========================================================================
    // Execution Context
    //=========================================================================

    BLEDispatcher& dispatcher() const { return _dispatcher; }
    IBLEPlatform& platform() const { return *_platform; }

    /**
     * @brief Queue a GATT operation for this peripheral
     *
     * Operations with no timeout use the manager's operation timeout.
     */
    void enqueueOperation(GATTOperation op);

    /**
     * @brief Start queued operations and time out the one in flight
     */
    void processOperations();

    size_t pendingOperations() const;

    /**
     * @brief Fail the operation in flight and every queued one
     */
    void cancelOperations(const Error& error);

    //=========================================================================
    // Platform Notifications (called by BLECentralManager)
    //=========================================================================

    void didConnect();
    void didDisconnect(const Error& error);
    void didFailToConnect(const Error& error);
    void didUpdateState(PeripheralState state);
    void didDiscoverServices(const std::vector<std::string>& service_uuids, const Error& error);
    void didDiscoverCharacteristics(const std::string& service_uuid,
                                    const std::vector<CharacteristicInfo>& characteristics,
                                    const Error& error);
    void didUpdateValue(const std::string& service_uuid, const std::string& characteristic_uuid,
                        const Bytes& value, const Error& error);
    void didWriteValue(const std::string& service_uuid, const std::string& characteristic_uuid,
                       const Error& error);
    void didUpdateNotificationState(const std::string& service_uuid, const std::string& characteristic_uuid,
                                    bool enabled, const Error& error);
    void didReadRSSI(int8_t rssi, const Error& error);
    void didRestore(const RestoredPeripheral& restored);

private:
    class OperationQueue : public BLEOperationQueue {
    public:
        explicit OperationQueue(BLEPeripheral& peripheral);

    protected:
        virtual bool executeOperation(const GATTOperation& op) override;

    private:
        BLEPeripheral& _peripheral;
    };

    void timeoutConnection(uint32_t sequence);
    void reportRefusedConnection(uint32_t sequence);
    void pollRSSI();
    void requestRSSI();

    void shouldFailOrGiveUp(const Error& error);
    void shouldTimeoutOrGiveUp();
    void shouldDisconnectOrGiveUp();
    void emit(ConnectionEvent event);

    void discoverService(const std::vector<std::string>& service_uuids, size_t index,
                         Promise<BLEPeripheral*> promise);
    void clearServices();
    void indexCharacteristics(BLEService* service);
    void unindexCharacteristics(BLEService* service);
    bool completeOperation(OperationType type, const std::string& service_uuid,
                           const std::string& characteristic_uuid, const Error& error,
                           const Bytes& data = Bytes());

    BLECentralManager& _central;
    BLEDispatcher& _dispatcher;
    IBLEPlatform::Ptr _platform;

    BLEAddress _address;
    std::string _name;
    int8_t _rssi = 0;
    Advertisement _advertisement;
    PeripheralState _state = PeripheralState::DISCONNECTED;

    // Statistics
    double _discovered_at = 0;
    double _connected_at = 0;
    double _disconnected_at = 0;
    bool _has_connected_at = false;
    bool _has_disconnected_at = false;
    double _last_session_seconds = 0;
    double _total_seconds_connected = 0;

    // Connection session
    uint32_t _sequence = 0;
    bool _forced_disconnect = false;
    bool _timeout_pending = false;
    bool _connect_refused = false;
    uint32_t _timeout_retries = Retry::UNLIMITED;
    uint32_t _disconnect_retries = Retry::UNLIMITED;
    double _connection_timeout = Timing::CONNECTION_TIMEOUT;
    uint32_t _timeout_count = 0;
    uint32_t _disconnect_count = 0;
    StreamPromise<ConnectionUpdate> _connection_promise;
    BLEDispatcher::TimerId _connection_timer = BLEDispatcher::INVALID_TIMER;

    // Discovery
    Promise<BLEPeripheral*> _services_promise;
    std::vector<std::unique_ptr<BLEService>> _services;
    std::map<std::string, BLECharacteristic*> _characteristics;

    // RSSI
    Promise<int8_t> _rssi_promise;
    std::unique_ptr<StreamPromise<int8_t>> _poll_promise;
    double _poll_period = Timing::RSSI_POLL_PERIOD;
    BLEDispatcher::TimerId _poll_timer = BLEDispatcher::INVALID_TIMER;

    double _operation_timeout = Timing::OPERATION_TIMEOUT;
    OperationQueue _queue;
};

}} // namespace Tether::BLE
