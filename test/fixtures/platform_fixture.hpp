#pragma once

#include "catch2/catch.hpp"

#include "BLECentralManager.h"
#include "BLEPlatform.h"
#include "BLETypes.h"

#include <memory>
#include <string>
#include <vector>

namespace Tether { namespace BLE {

/**
 * Scripted platform: records every request and lets tests fire the delegate
 * callbacks the way a BLE stack would.
 */
class MockPlatform : public IBLEPlatform {
public:
    struct Request {
        BLEAddress address;
        std::string service_uuid;
        std::string characteristic_uuid;
        Bytes data;
        bool flag = false;   // write with response / notify enable
    };

    ManagerState state = ManagerState::POWERED_ON;

    // Request acceptance
    bool accept_scan = true;
    bool accept_connect = true;
    bool accept_cancel = true;
    bool accept_requests = true;

    // Recorded requests
    int scan_starts = 0;
    int scan_stops = 0;
    bool scanning = false;
    std::vector<std::string> scan_services;
    std::vector<BLEAddress> connects;
    std::vector<BLEAddress> cancels;
    std::vector<Request> service_discoveries;
    std::vector<Request> characteristic_discoveries;
    std::vector<Request> reads;
    std::vector<Request> writes;
    std::vector<Request> notifies;
    std::vector<BLEAddress> rssi_reads;

    // Retrieval answers
    std::vector<PeripheralInfo> known_peripherals;
    std::vector<PeripheralInfo> connected_peripherals;

    //=========================================================================
    // IBLEPlatform
    //=========================================================================

    virtual ManagerState getState() const override { return state; }

    virtual bool startScan(const std::vector<std::string>& service_uuids) override {
        if (!accept_scan) return false;
        scan_starts++;
        scanning = true;
        scan_services = service_uuids;
        return true;
    }

    virtual void stopScan() override {
        scan_stops++;
        scanning = false;
    }

    virtual bool connect(const BLEAddress& address) override {
        if (!accept_connect) return false;
        connects.push_back(address);
        return true;
    }

    virtual bool cancelConnection(const BLEAddress& address) override {
        if (!accept_cancel) return false;
        cancels.push_back(address);
        return true;
    }

    virtual bool discoverServices(const BLEAddress& address,
                                  const std::vector<std::string>& service_uuids) override {
        if (!accept_requests) return false;
        service_discoveries.push_back(request(address, std::string(), std::string(), Bytes(),
                                              service_uuids.empty()));
        return true;
    }

    virtual bool discoverCharacteristics(const BLEAddress& address, const std::string& service_uuid,
                                         const std::vector<std::string>&) override {
        if (!accept_requests) return false;
        characteristic_discoveries.push_back(request(address, service_uuid, std::string(), Bytes(), false));
        return true;
    }

    virtual bool read(const BLEAddress& address, const std::string& service_uuid,
                      const std::string& characteristic_uuid) override {
        if (!accept_requests) return false;
        reads.push_back(request(address, service_uuid, characteristic_uuid, Bytes(), false));
        return true;
    }

    virtual bool write(const BLEAddress& address, const std::string& service_uuid,
                       const std::string& characteristic_uuid, const Bytes& data,
                       bool response) override {
        if (!accept_requests) return false;
        writes.push_back(request(address, service_uuid, characteristic_uuid, data, response));
        return true;
    }

    virtual bool setNotify(const BLEAddress& address, const std::string& service_uuid,
                           const std::string& characteristic_uuid, bool enable) override {
        if (!accept_requests) return false;
        notifies.push_back(request(address, service_uuid, characteristic_uuid, Bytes(), enable));
        return true;
    }

    virtual bool readRSSI(const BLEAddress& address) override {
        if (!accept_requests) return false;
        rssi_reads.push_back(address);
        return true;
    }

    virtual std::vector<PeripheralInfo> retrievePeripherals(const std::vector<BLEAddress>& addresses) override {
        std::vector<PeripheralInfo> result;
        for (const auto& info : known_peripherals) {
            for (const auto& address : addresses) {
                if (info.address == address) {
                    result.push_back(info);
                }
            }
        }
        return result;
    }

    virtual std::vector<PeripheralInfo> retrieveConnectedPeripherals(const std::vector<std::string>&) override {
        return connected_peripherals;
    }

    virtual void setOnStateChanged(Callbacks::OnStateChanged callback) override { _on_state_changed = callback; }
    virtual void setOnScanResult(Callbacks::OnScanResult callback) override { _on_scan_result = callback; }
    virtual void setOnConnected(Callbacks::OnConnected callback) override { _on_connected = callback; }
    virtual void setOnDisconnected(Callbacks::OnDisconnected callback) override { _on_disconnected = callback; }
    virtual void setOnConnectFailed(Callbacks::OnConnectFailed callback) override { _on_connect_failed = callback; }
    virtual void setOnPeripheralStateChanged(Callbacks::OnPeripheralStateChanged callback) override {
        _on_peripheral_state_changed = callback;
    }
    virtual void setOnServicesDiscovered(Callbacks::OnServicesDiscovered callback) override {
        _on_services_discovered = callback;
    }
    virtual void setOnCharacteristicsDiscovered(Callbacks::OnCharacteristicsDiscovered callback) override {
        _on_characteristics_discovered = callback;
    }
    virtual void setOnValueUpdated(Callbacks::OnValueUpdated callback) override { _on_value_updated = callback; }
    virtual void setOnValueWritten(Callbacks::OnValueWritten callback) override { _on_value_written = callback; }
    virtual void setOnNotifyStateChanged(Callbacks::OnNotifyStateChanged callback) override {
        _on_notify_state_changed = callback;
    }
    virtual void setOnRSSIRead(Callbacks::OnRSSIRead callback) override { _on_rssi_read = callback; }
    virtual void setOnStateRestored(Callbacks::OnStateRestored callback) override { _on_state_restored = callback; }

    virtual std::string getPlatformName() const override { return "Mock"; }

    //=========================================================================
    // Delegate callbacks
    //=========================================================================

    void changeState(ManagerState new_state) {
        state = new_state;
        _on_state_changed(new_state);
    }

    void advertise(const PeripheralInfo& info) { _on_scan_result(info); }
    void connected(const BLEAddress& address) { _on_connected(address); }
    void disconnected(const BLEAddress& address, int32_t status = STATUS_OK) {
        _on_disconnected(address, status);
    }
    void connectFailed(const BLEAddress& address, int32_t status) { _on_connect_failed(address, status); }
    void peripheralState(const BLEAddress& address, PeripheralState peripheral_state) {
        _on_peripheral_state_changed(address, peripheral_state);
    }
    void servicesDiscovered(const BLEAddress& address, const std::vector<std::string>& uuids,
                            int32_t status = STATUS_OK) {
        _on_services_discovered(address, uuids, status);
    }
    void characteristicsDiscovered(const BLEAddress& address, const std::string& service_uuid,
                                   const std::vector<CharacteristicInfo>& characteristics,
                                   int32_t status = STATUS_OK) {
        _on_characteristics_discovered(address, service_uuid, characteristics, status);
    }
    void valueUpdated(const BLEAddress& address, const std::string& service_uuid,
                      const std::string& characteristic_uuid, const Bytes& value, int32_t status = STATUS_OK) {
        _on_value_updated(address, service_uuid, characteristic_uuid, value, status);
    }
    void valueWritten(const BLEAddress& address, const std::string& service_uuid,
                      const std::string& characteristic_uuid, int32_t status = STATUS_OK) {
        _on_value_written(address, service_uuid, characteristic_uuid, status);
    }
    void notifyStateChanged(const BLEAddress& address, const std::string& service_uuid,
                            const std::string& characteristic_uuid, bool enabled, int32_t status = STATUS_OK) {
        _on_notify_state_changed(address, service_uuid, characteristic_uuid, enabled, status);
    }
    void rssiRead(const BLEAddress& address, int8_t rssi, int32_t status = STATUS_OK) {
        _on_rssi_read(address, rssi, status);
    }
    void restore(const RestorePayload& payload) { _on_state_restored(payload); }

private:
    static Request request(const BLEAddress& address, const std::string& service_uuid,
                           const std::string& characteristic_uuid, const Bytes& data, bool flag) {
        Request result;
        result.address = address;
        result.service_uuid = service_uuid;
        result.characteristic_uuid = characteristic_uuid;
        result.data = data;
        result.flag = flag;
        return result;
    }

    Callbacks::OnStateChanged _on_state_changed;
    Callbacks::OnScanResult _on_scan_result;
    Callbacks::OnConnected _on_connected;
    Callbacks::OnDisconnected _on_disconnected;
    Callbacks::OnConnectFailed _on_connect_failed;
    Callbacks::OnPeripheralStateChanged _on_peripheral_state_changed;
    Callbacks::OnServicesDiscovered _on_services_discovered;
    Callbacks::OnCharacteristicsDiscovered _on_characteristics_discovered;
    Callbacks::OnValueUpdated _on_value_updated;
    Callbacks::OnValueWritten _on_value_written;
    Callbacks::OnNotifyStateChanged _on_notify_state_changed;
    Callbacks::OnRSSIRead _on_rssi_read;
    Callbacks::OnStateRestored _on_state_restored;
};

/**
 * Manually advanced time source for the dispatcher.
 */
class FakeClock {
public:
    explicit FakeClock(double start = 1000.0) : _now(std::make_shared<double>(start)) {}

    BLEDispatcher::Clock clock() const {
        std::shared_ptr<double> now = _now;
        return [now]() { return *now; };
    }

    double now() const { return *_now; }
    void advance(double seconds) { *_now += seconds; }

private:
    std::shared_ptr<double> _now;
};

inline BLEAddress TestAddress(uint8_t id) {
    uint8_t bytes[6] = {0xAA, 0xBB, 0xCC, 0xDD, 0xEE, id};
    return BLEAddress(bytes);
}

inline PeripheralInfo TestPeripheral(uint8_t id, const std::string& name = "peer") {
    PeripheralInfo info;
    info.address = TestAddress(id);
    info.name = name;
    info.rssi = -60;
    return info;
}

inline CharacteristicInfo TestCharacteristic(const std::string& uuid, uint8_t properties = Property::READ) {
    CharacteristicInfo info;
    info.uuid = uuid;
    info.properties = properties;
    return info;
}

inline std::shared_ptr<MockPlatform> TestPlatform(ManagerState state) {
    std::shared_ptr<MockPlatform> platform = std::make_shared<MockPlatform>();
    platform->state = state;
    return platform;
}

/**
 * A powered-on central over a mock platform with a fake clock.
 */
class CentralFixture {
public:
    explicit CentralFixture(ManagerState state = ManagerState::POWERED_ON,
                            const CentralConfig& config = CentralConfig())
        : platform(TestPlatform(state)),
          central(platform, config, clock.clock()) {}

    std::shared_ptr<MockPlatform> platform;
    FakeClock clock;
    BLECentralManager central;

    // Advance time and run one central loop turn
    void advance(double seconds) {
        clock.advance(seconds);
        central.loop();
    }

    // Register a peripheral through a scan result
    BLEPeripheral* discover(uint8_t id, const std::string& name = "peer") {
        if (!central.isScanning()) {
            central.startScanning();
        }
        platform->advertise(TestPeripheral(id, name));
        BLEPeripheral* peripheral = central.peripheral(TestAddress(id));
        REQUIRE(peripheral != nullptr);
        return peripheral;
    }

    // Register and connect a peripheral
    BLEPeripheral* connect(uint8_t id, const ConnectOptions& options = ConnectOptions()) {
        BLEPeripheral* peripheral = discover(id);
        peripheral->connect(options);
        platform->connected(peripheral->address());
        REQUIRE(peripheral->state() == PeripheralState::CONNECTED);
        return peripheral;
    }
};

/**
 * Collects connection events and errors from a session stream.
 */
struct ConnectionRecorder {
    std::vector<ConnectionEvent> events;
    std::vector<Error> errors;

    void attach(FutureStream<ConnectionUpdate> stream) {
        stream.onSuccess([this](const ConnectionUpdate& update) { events.push_back(update.event); });
        stream.onFailure([this](const Error& error) { errors.push_back(error); });
    }
};

}} // namespace Tether::BLE
