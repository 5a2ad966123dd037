#include "BLECentralManager.h"

#include <memory>
#include <string>
#include <vector>

#include "catch2/catch.hpp"
#include "platform_fixture.hpp"

namespace Tether { namespace BLE {

namespace {

struct ScanRecorder {
    std::vector<BLEPeripheral*> discovered;
    std::vector<Error> errors;

    void attach(FutureStream<BLEPeripheral*> stream) {
        stream.onSuccess([this](BLEPeripheral* const& peripheral) { discovered.push_back(peripheral); });
        stream.onFailure([this](const Error& error) { errors.push_back(error); });
    }
};

ScanOptions ScanFor(double timeout) {
    ScanOptions options;
    options.timeout = timeout;
    return options;
}

}  // namespace

TEST_CASE("scanning", "[unit]") {
    CentralFixture fixture;
    ScanRecorder recorder;

    SECTION("discovered peripherals are registered and emitted") {
        recorder.attach(fixture.central.startScanning());
        REQUIRE(fixture.platform->scan_starts == 1);
        CHECK(fixture.central.isScanning());

        fixture.platform->advertise(TestPeripheral(1, "sensor"));

        REQUIRE(recorder.discovered.size() == 1);
        BLEPeripheral* peripheral = recorder.discovered[0];
        CHECK(peripheral == fixture.central.peripheral(TestAddress(1)));
        CHECK(peripheral->name() == "sensor");
        CHECK(peripheral->rssi() == -60);
        CHECK(peripheral->state() == PeripheralState::DISCONNECTED);
    }

    SECTION("unnamed peripherals are called Unknown") {
        recorder.attach(fixture.central.startScanning());
        fixture.platform->advertise(TestPeripheral(1, ""));

        REQUIRE(recorder.discovered.size() == 1);
        CHECK(recorder.discovered[0]->name() == "Unknown");
    }

    SECTION("starting an active scan returns the same session") {
        FutureStream<BLEPeripheral*> first = fixture.central.startScanning();
        FutureStream<BLEPeripheral*> second = fixture.central.startScanning();

        CHECK(first.sameStream(second));
        CHECK(fixture.platform->scan_starts == 1);
    }

    SECTION("a new scan after stopping is a new session") {
        FutureStream<BLEPeripheral*> first = fixture.central.startScanning();
        fixture.central.stopScanning();
        FutureStream<BLEPeripheral*> second = fixture.central.startScanning();

        CHECK_FALSE(first.sameStream(second));
        CHECK(fixture.platform->scan_starts == 2);
        CHECK(fixture.platform->scan_stops == 1);
    }

    SECTION("a rediscovered peripheral is not emitted again") {
        recorder.attach(fixture.central.startScanning());
        fixture.platform->advertise(TestPeripheral(1));
        fixture.platform->advertise(TestPeripheral(1));

        CHECK(recorder.discovered.size() == 1);
        CHECK(fixture.central.peripheralCount() == 1);
    }

    SECTION("results after stopping are dropped") {
        recorder.attach(fixture.central.startScanning());
        fixture.central.stopScanning();
        CHECK_FALSE(fixture.platform->scanning);

        fixture.platform->advertise(TestPeripheral(1));

        CHECK(recorder.discovered.empty());
        CHECK(fixture.central.peripheralCount() == 0);
    }

    SECTION("the service filter is passed to the platform") {
        ScanOptions options;
        options.service_uuids.push_back("180D");
        fixture.central.startScanning(options);

        REQUIRE(fixture.platform->scan_services.size() == 1);
        CHECK(fixture.platform->scan_services[0] == "180D");
    }

    SECTION("a refused scan fails the session") {
        fixture.platform->accept_scan = false;
        recorder.attach(fixture.central.startScanning());

        REQUIRE(recorder.errors.size() == 1);
        CHECK(recorder.errors[0] == Error(ErrorCode::TRANSPORT, STATUS_REJECTED));
        CHECK_FALSE(fixture.central.isScanning());
    }
}

TEST_CASE("scan timeouts", "[unit]") {
    CentralFixture fixture;
    ScanRecorder recorder;

    SECTION("a scan with no discoveries fails with SCAN_TIMEOUT") {
        recorder.attach(fixture.central.startScanning(ScanFor(5)));

        fixture.advance(4);
        CHECK(fixture.central.isScanning());

        fixture.advance(1);
        REQUIRE(recorder.errors.size() == 1);
        CHECK(recorder.errors[0].code == ErrorCode::SCAN_TIMEOUT);
        CHECK_FALSE(fixture.central.isScanning());
        CHECK(fixture.platform->scan_stops == 1);
    }

    SECTION("a scan with discoveries stops without an error") {
        recorder.attach(fixture.central.startScanning(ScanFor(5)));
        fixture.platform->advertise(TestPeripheral(1));

        fixture.advance(5);
        CHECK(recorder.errors.empty());
        CHECK(recorder.discovered.size() == 1);
        CHECK_FALSE(fixture.central.isScanning());
        CHECK(fixture.central.peripheralCount() == 1);
    }

    SECTION("the timeout of an earlier session does not stop a later one") {
        fixture.central.startScanning(ScanFor(5));
        fixture.advance(2);
        fixture.central.stopScanning();

        recorder.attach(fixture.central.startScanning(ScanFor(10)));
        fixture.advance(5);

        CHECK(fixture.central.isScanning());
        CHECK(recorder.errors.empty());
    }

    SECTION("scans without a timeout run until stopped") {
        fixture.central.startScanning();
        fixture.advance(3600);
        CHECK(fixture.central.isScanning());
    }
}

TEST_CASE("power state", "[unit]") {
    SECTION("waiting for power on") {
        CentralFixture fixture(ManagerState::POWERED_OFF);
        CHECK_FALSE(fixture.central.poweredOn());

        int first = 0;
        int second = 0;
        fixture.central.whenPoweredOn().onSuccess([&](const ManagerState&) { first++; });
        fixture.central.whenPoweredOn().onSuccess([&](const ManagerState&) { second++; });
        CHECK(first == 0);

        fixture.platform->changeState(ManagerState::POWERED_ON);
        CHECK(first == 1);
        CHECK(second == 1);
        CHECK(fixture.central.poweredOn());

        fixture.platform->changeState(ManagerState::POWERED_OFF);
        fixture.platform->changeState(ManagerState::POWERED_ON);
        CHECK(first == 1);
        CHECK(second == 1);
    }

    SECTION("already powered on resolves immediately") {
        CentralFixture fixture;
        Future<ManagerState> powered_on = fixture.central.whenPoweredOn();

        REQUIRE(powered_on.succeeded());
        CHECK(powered_on.value() == ManagerState::POWERED_ON);
    }

    SECTION("waiting for power off") {
        CentralFixture fixture;
        Future<ManagerState> powered_off = fixture.central.whenPoweredOff();
        CHECK_FALSE(powered_off.completed());

        fixture.platform->changeState(ManagerState::RESETTING);
        CHECK_FALSE(powered_off.completed());

        fixture.platform->changeState(ManagerState::POWERED_OFF);
        CHECK(powered_off.succeeded());
    }

    SECTION("scanning requires power") {
        CentralFixture fixture(ManagerState::POWERED_OFF);
        ScanRecorder recorder;
        recorder.attach(fixture.central.startScanning());

        REQUIRE(recorder.errors.size() == 1);
        CHECK(recorder.errors[0].code == ErrorCode::POWERED_OFF);
        CHECK(fixture.platform->scan_starts == 0);
        CHECK_FALSE(fixture.central.isScanning());
    }

    SECTION("powering off ends the scan") {
        CentralFixture fixture;
        ScanRecorder recorder;
        recorder.attach(fixture.central.startScanning());

        fixture.platform->changeState(ManagerState::POWERED_OFF);

        REQUIRE(recorder.errors.size() == 1);
        CHECK(recorder.errors[0].code == ErrorCode::POWERED_OFF);
        CHECK_FALSE(fixture.central.isScanning());
        CHECK(fixture.platform->scan_stops == 1);
    }
}

TEST_CASE("unsupported and unauthorized fail the power waiters", "[unit]") {
    ManagerState state = GENERATE(ManagerState::UNSUPPORTED, ManagerState::UNAUTHORIZED);
    ErrorCode code = state == ManagerState::UNSUPPORTED ? ErrorCode::UNSUPPORTED : ErrorCode::UNAUTHORIZED;

    CentralFixture fixture(ManagerState::UNKNOWN);
    Future<ManagerState> powered_on = fixture.central.whenPoweredOn();
    Future<ManagerState> powered_off = fixture.central.whenPoweredOff();

    fixture.platform->changeState(state);

    REQUIRE(powered_on.failed());
    CHECK(powered_on.error().code == code);
    REQUIRE(powered_off.failed());
    CHECK(powered_off.error().code == code);
}

TEST_CASE("an unavailable platform fails new power waiters", "[unit]") {
    ManagerState state = GENERATE(ManagerState::UNSUPPORTED, ManagerState::UNAUTHORIZED);
    ErrorCode code = state == ManagerState::UNSUPPORTED ? ErrorCode::UNSUPPORTED : ErrorCode::UNAUTHORIZED;

    CentralFixture fixture(state);
    Future<ManagerState> powered_on = fixture.central.whenPoweredOn();
    Future<ManagerState> powered_off = fixture.central.whenPoweredOff();

    REQUIRE(powered_on.failed());
    CHECK(powered_on.error().code == code);
    REQUIRE(powered_off.failed());
    CHECK(powered_off.error().code == code);

    fixture.platform->changeState(ManagerState::POWERED_ON);
    CHECK(fixture.central.whenPoweredOn().succeeded());
}

TEST_CASE("registry", "[unit]") {
    CentralConfig config;
    config.max_peripherals = 2;
    CentralFixture fixture(ManagerState::POWERED_ON, config);

    SECTION("the registry is bounded") {
        ScanRecorder recorder;
        recorder.attach(fixture.central.startScanning());
        fixture.platform->advertise(TestPeripheral(1));
        fixture.platform->advertise(TestPeripheral(2));
        fixture.platform->advertise(TestPeripheral(3));

        CHECK(fixture.central.peripheralCount() == 2);
        CHECK(recorder.discovered.size() == 2);
        CHECK(fixture.central.peripheral(TestAddress(3)) == nullptr);
    }

    SECTION("peripherals are listed oldest discovery first") {
        BLEPeripheral* earlier = fixture.discover(9);
        fixture.clock.advance(1);
        BLEPeripheral* later = fixture.discover(1);

        std::vector<BLEPeripheral*> peripherals = fixture.central.peripherals();
        REQUIRE(peripherals.size() == 2);
        CHECK(peripherals[0] == earlier);
        CHECK(peripherals[1] == later);
    }

    SECTION("a removed record stays usable until the next turn") {
        BLEPeripheral* peripheral = fixture.discover(1);

        CHECK(fixture.central.removePeripheral(TestAddress(1)));
        CHECK_FALSE(fixture.central.removePeripheral(TestAddress(1)));
        CHECK(fixture.central.peripheral(TestAddress(1)) == nullptr);
        CHECK(peripheral->address() == TestAddress(1));

        fixture.advance(0);
        CHECK(fixture.central.peripheralCount() == 0);
    }

    SECTION("a record may terminate itself from its own listener") {
        BLEPeripheral* peripheral = fixture.discover(1);
        std::vector<ConnectionEvent> events;
        peripheral->connect().onSuccess([&](const ConnectionUpdate& update) {
            events.push_back(update.event);
            update.peripheral->terminate();
        });

        fixture.platform->connected(TestAddress(1));

        REQUIRE(events.size() == 1);
        CHECK(fixture.platform->cancels.size() == 1);
        CHECK(fixture.central.peripheralCount() == 0);
        fixture.advance(0);
    }

    SECTION("remove all") {
        fixture.discover(1);
        fixture.discover(2);

        fixture.central.removeAllPeripherals();
        CHECK(fixture.central.peripheralCount() == 0);
        CHECK(fixture.central.peripherals().empty());

        // Rediscovery registers a fresh record
        fixture.platform->advertise(TestPeripheral(1));
        CHECK(fixture.central.peripheralCount() == 1);
    }

    SECTION("disconnect all") {
        BLEPeripheral* first = fixture.connect(1);
        BLEPeripheral* second = fixture.discover(2);

        ConnectionRecorder first_events;
        first_events.attach(first->connect());
        second->connect();

        fixture.central.disconnectAllPeripherals();

        CHECK(fixture.platform->cancels.size() == 2);
        fixture.platform->disconnected(TestAddress(1));
        REQUIRE_FALSE(first_events.events.empty());
        CHECK(first_events.events.back() == ConnectionEvent::FORCE_DISCONNECT);
    }

    SECTION("callbacks for unknown peripherals are dropped") {
        fixture.platform->connected(TestAddress(7));
        fixture.platform->disconnected(TestAddress(7), 8);
        fixture.platform->rssiRead(TestAddress(7), -70);
        fixture.platform->valueUpdated(TestAddress(7), "180F", "2A19", Bytes());

        CHECK(fixture.central.peripheralCount() == 0);
    }
}

TEST_CASE("retrieval", "[unit]") {
    CentralFixture fixture;

    SECTION("known peripherals are registered once") {
        fixture.platform->known_peripherals.push_back(TestPeripheral(1, "known"));
        fixture.platform->known_peripherals.push_back(TestPeripheral(2));

        std::vector<BLEAddress> addresses;
        addresses.push_back(TestAddress(1));
        addresses.push_back(TestAddress(3));

        std::vector<BLEPeripheral*> retrieved = fixture.central.retrievePeripherals(addresses);
        REQUIRE(retrieved.size() == 1);
        CHECK(retrieved[0]->name() == "known");
        CHECK(fixture.central.peripheral(TestAddress(1)) == retrieved[0]);

        std::vector<BLEPeripheral*> again = fixture.central.retrievePeripherals(addresses);
        REQUIRE(again.size() == 1);
        CHECK(again[0] == retrieved[0]);
        CHECK(fixture.central.peripheralCount() == 1);
    }

    SECTION("connected peripherals keep their connection state") {
        PeripheralInfo info = TestPeripheral(4);
        info.state = PeripheralState::CONNECTED;
        fixture.platform->connected_peripherals.push_back(info);

        std::vector<std::string> services;
        services.push_back("180D");
        std::vector<BLEPeripheral*> retrieved = fixture.central.retrieveConnectedPeripherals(services);

        REQUIRE(retrieved.size() == 1);
        CHECK(retrieved[0]->state() == PeripheralState::CONNECTED);
        CHECK(fixture.central.peripheralCount() == 1);
    }
}

TEST_CASE("state restoration", "[unit]") {
    CentralFixture fixture;

    RestoredService service;
    service.uuid = "180F";
    service.characteristics.push_back(TestCharacteristic("2A19"));

    RestoredPeripheral restored;
    restored.info = TestPeripheral(5, "restored");
    restored.info.state = PeripheralState::CONNECTED;
    restored.services.push_back(service);

    RestorePayload payload;
    payload.valid = true;
    payload.peripherals.push_back(restored);
    payload.scanned_services.push_back("180F");

    SECTION("restored peripherals are rebuilt with their services") {
        Future<RestoredState> future = fixture.central.whenStateRestored();
        fixture.platform->restore(payload);

        REQUIRE(future.succeeded());
        const RestoredState& state = future.value();
        REQUIRE(state.peripherals.size() == 1);
        REQUIRE(state.scanned_services.size() == 1);
        CHECK(state.scanned_services[0] == "180F");

        BLEPeripheral* peripheral = state.peripherals[0];
        CHECK(peripheral == fixture.central.peripheral(TestAddress(5)));
        CHECK(peripheral->name() == "restored");
        CHECK(peripheral->state() == PeripheralState::CONNECTED);
        CHECK(peripheral->characteristic("180F", "2A19") != nullptr);
    }

    SECTION("an existing record is updated in place") {
        BLEPeripheral* existing = fixture.discover(5);
        Future<RestoredState> future = fixture.central.whenStateRestored();
        fixture.platform->restore(payload);

        REQUIRE(future.succeeded());
        CHECK(future.value().peripherals[0] == existing);
        CHECK(fixture.central.peripheralCount() == 1);
    }

    SECTION("an invalid restore fails") {
        Future<RestoredState> future = fixture.central.whenStateRestored();
        payload.valid = false;
        fixture.platform->restore(payload);

        REQUIRE(future.failed());
        CHECK(future.error().code == ErrorCode::RESTORE_FAILED);
        CHECK(fixture.central.peripheralCount() == 0);
    }

    SECTION("a restore before anyone waits is kept") {
        fixture.platform->restore(payload);
        Future<RestoredState> future = fixture.central.whenStateRestored();

        REQUIRE(future.succeeded());
        CHECK(future.value().peripherals.size() == 1);
    }
}

TEST_CASE("destroying the central stops the scan", "[unit]") {
    std::shared_ptr<MockPlatform> platform = TestPlatform(ManagerState::POWERED_ON);
    FakeClock clock;
    {
        BLECentralManager central(platform, CentralConfig(), clock.clock());
        central.startScanning();
        REQUIRE(platform->scanning);
    }
    CHECK_FALSE(platform->scanning);
    CHECK(platform->scan_stops == 1);
}

}} // namespace Tether::BLE
