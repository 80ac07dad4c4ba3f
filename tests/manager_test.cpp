#include "fake_transport.hpp"

#include <core/manager.hpp>
#include <protocol/identity.hpp>
#include <gtest/gtest.h>

#include <numeric>
#include <tuple>
#include <vector>

using namespace accessory;
using accessory::testing::FakeTransport;
using accessory::testing::MemoryKnownDeviceStore;
using Kind = TransportEvent::Kind;

namespace {

constexpr const char* ADDRESS = "AA:BB:CC:DD:EE:FF";
constexpr const char* DEVICE = "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF";
constexpr const char* OTHER_ADDRESS = "00:11:22:33:44:55";
constexpr const char* OTHER_DEVICE = "/org/bluez/hci0/dev_00_11_22_33_44_55";

const std::string PAIRING = std::string(DEVICE) + "/service0010/char0011";
const std::string INBOUND = std::string(DEVICE) + "/service0010/char0013";
const std::string OUTBOUND = std::string(DEVICE) + "/service0010/char0016";

class ManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Callbacks callbacks;
        callbacks.on_registry_changed = [this](size_t position, uint32_t id, bool inserted) {
            registry_changes.emplace_back(position, id, inserted);
        };
        callbacks.on_pairing_payload = [this](const std::vector<uint8_t>& bytes, uint32_t id) {
            pairing_payloads.emplace_back(bytes, id);
        };
        callbacks.on_connected = [this](uint32_t id) { connected.push_back(id); };
        callbacks.on_disconnected = [this](uint32_t id) { disconnected.push_back(id); };
        callbacks.on_data_payload = [this](const std::vector<uint8_t>& bytes,
                                           const std::string& name, uint32_t id) {
            data_payloads.emplace_back(bytes, name, id);
        };
        manager.set_callbacks(std::move(callbacks));
    }

    static uint32_t id_of(const char* address) {
        return *identity::unique_id_for(address);
    }

    void discover(const char* device = DEVICE, const char* address = ADDRESS,
                  const std::string& name = "Tag", int64_t timestamp = 1000) {
        manager.handle(TransportEvent::device_found(device, address, name, timestamp));
    }

    const DeviceRecord& record(const char* address = ADDRESS) {
        const DeviceRecord* found = manager.registry().lookup(id_of(address));
        EXPECT_NE(found, nullptr);
        return *found;
    }

    // connect -> link up -> services -> characteristics -> notifications active
    void bring_up() {
        ASSERT_EQ(manager.connect(id_of(ADDRESS)), Error::None);
        manager.handle(TransportEvent::for_device(Kind::Connected, DEVICE));
        manager.handle(TransportEvent::for_device(Kind::ServicesFound, DEVICE));
        manager.handle(TransportEvent::characteristics_found(
            DEVICE, std::string(DEVICE) + "/service0010",
            {{ChannelRole::Pairing, PAIRING},
             {ChannelRole::Inbound, INBOUND},
             {ChannelRole::Outbound, OUTBOUND}}));
        manager.handle(TransportEvent::notify_state_changed(DEVICE, ChannelRole::Inbound, true));
    }

    int64_t now = 0;
    FakeTransport transport;
    MemoryKnownDeviceStore store;
    Manager manager{transport, store, Config{}, [this] { return now; }};

    std::vector<std::tuple<size_t, uint32_t, bool>> registry_changes;
    std::vector<std::pair<std::vector<uint8_t>, uint32_t>> pairing_payloads;
    std::vector<uint32_t> connected;
    std::vector<uint32_t> disconnected;
    std::vector<std::tuple<std::vector<uint8_t>, std::string, uint32_t>> data_payloads;
};

} // namespace

// ----------------------------------------------------------------------------
// Discovery
// ----------------------------------------------------------------------------

TEST_F(ManagerTest, DiscoveryInsertsRecordWithStableId) {
    discover();

    ASSERT_EQ(manager.registry().size(), 1u);
    const DeviceRecord& r = record();
    EXPECT_EQ(r.unique_id, 388131615u);
    EXPECT_EQ(r.display_name, "Tag");
    EXPECT_EQ(r.status, DeviceStatus::Discovered);
    EXPECT_EQ(r.last_seen_ms, 1000);
    EXPECT_FALSE(r.any_channel_resolved());

    ASSERT_EQ(registry_changes.size(), 1u);
    EXPECT_EQ(registry_changes[0], std::make_tuple(size_t{0}, 388131615u, true));
}

TEST_F(ManagerTest, RepeatedAdvertisementOnlyRefreshesLastSeen) {
    discover(DEVICE, ADDRESS, "Tag", 1000);
    discover(DEVICE, ADDRESS, "Tag", 3000);
    discover(DEVICE, ADDRESS, "Tag", 2000);

    EXPECT_EQ(manager.registry().size(), 1u);
    EXPECT_EQ(record().last_seen_ms, 3000);
    EXPECT_EQ(registry_changes.size(), 1u);
}

TEST_F(ManagerTest, AdvertisementWithoutNameIsIgnored) {
    discover(DEVICE, ADDRESS, "", 1000);

    EXPECT_TRUE(manager.registry().empty());
    EXPECT_TRUE(registry_changes.empty());
}

TEST_F(ManagerTest, UnparsableAddressIsIgnored) {
    discover(DEVICE, "not-an-address", "Tag", 1000);
    EXPECT_TRUE(manager.registry().empty());
}

TEST_F(ManagerTest, KnownDeviceKeepsStoredName) {
    store.set(id_of(ADDRESS), "Keys");
    discover();

    EXPECT_EQ(record().display_name, "Keys");
}

// ----------------------------------------------------------------------------
// Staleness sweep
// ----------------------------------------------------------------------------

TEST_F(ManagerTest, SweepEvictsStaleDiscoveredRecords) {
    discover(DEVICE, ADDRESS, "Tag", 0);

    EXPECT_EQ(manager.sweep(5000), 0u);
    EXPECT_EQ(manager.registry().size(), 1u);

    EXPECT_EQ(manager.sweep(6000), 1u);
    EXPECT_TRUE(manager.registry().empty());
    EXPECT_EQ(registry_changes.back(), std::make_tuple(size_t{0}, id_of(ADDRESS), false));
}

TEST_F(ManagerTest, SweepUsesClockWhenNoTimeGiven) {
    discover(DEVICE, ADDRESS, "Tag", 1000);

    now = 6000;
    EXPECT_EQ(manager.sweep(), 0u);
    now = 6001;
    EXPECT_EQ(manager.sweep(), 1u);
}

TEST_F(ManagerTest, SweepKeepsConnectedRecords) {
    discover(DEVICE, ADDRESS, "Tag", 0);
    ASSERT_EQ(manager.connect(id_of(ADDRESS)), Error::None);

    EXPECT_EQ(manager.sweep(100000), 0u);
    EXPECT_EQ(manager.registry().size(), 1u);
}

TEST_F(ManagerTest, SweepResolvesPositionsAtRemovalTime) {
    discover(DEVICE, ADDRESS, "Tag", 0);
    discover(OTHER_DEVICE, OTHER_ADDRESS, "Other", 0);

    EXPECT_EQ(manager.sweep(10000), 2u);

    ASSERT_EQ(registry_changes.size(), 4u);
    EXPECT_EQ(registry_changes[2], std::make_tuple(size_t{0}, id_of(ADDRESS), false));
    EXPECT_EQ(registry_changes[3], std::make_tuple(size_t{0}, id_of(OTHER_ADDRESS), false));
}

TEST_F(ManagerTest, ReentrantSweepIsSuppressed) {
    discover(DEVICE, ADDRESS, "Tag", 0);
    discover(OTHER_DEVICE, OTHER_ADDRESS, "Other", 0);

    std::vector<size_t> nested;
    Callbacks callbacks;
    callbacks.on_registry_changed = [&](size_t, uint32_t, bool inserted) {
        if (!inserted) nested.push_back(manager.sweep(10000));
    };
    manager.set_callbacks(std::move(callbacks));

    EXPECT_EQ(manager.sweep(10000), 2u);
    EXPECT_EQ(nested, (std::vector<size_t>{0, 0}));
    EXPECT_TRUE(manager.registry().empty());
}

// ----------------------------------------------------------------------------
// Connection state machine
// ----------------------------------------------------------------------------

TEST_F(ManagerTest, ConnectUnknownDevice) {
    EXPECT_EQ(manager.connect(42), Error::UnknownDevice);
    EXPECT_EQ(manager.disconnect(42), Error::UnknownDevice);
    EXPECT_EQ(manager.pair(42), Error::UnknownDevice);
    EXPECT_TRUE(transport.connects.empty());
}

TEST_F(ManagerTest, ConnectIsOptimisticAndIdempotent) {
    discover();

    EXPECT_EQ(manager.connect(id_of(ADDRESS)), Error::None);
    EXPECT_EQ(record().status, DeviceStatus::Connected);
    EXPECT_TRUE(connected.empty());

    EXPECT_EQ(manager.connect(id_of(ADDRESS)), Error::None);
    ASSERT_EQ(transport.connects.size(), 1u);
    EXPECT_EQ(transport.connects[0], DEVICE);
}

TEST_F(ManagerTest, ConnectRequestFailureReverts) {
    discover();
    transport.fail_connect = true;
    now = 4000;

    EXPECT_EQ(manager.connect(id_of(ADDRESS)), Error::TransportError);
    EXPECT_EQ(record().status, DeviceStatus::Discovered);
    EXPECT_EQ(record().last_seen_ms, 4000);
}

TEST_F(ManagerTest, ConnectFailedEventReverts) {
    discover();
    ASSERT_EQ(manager.connect(id_of(ADDRESS)), Error::None);

    now = 8000;
    manager.handle(TransportEvent::for_device(Kind::ConnectFailed, DEVICE, "le-connection-abort"));

    EXPECT_EQ(record().status, DeviceStatus::Discovered);
    EXPECT_EQ(record().last_seen_ms, 8000);
    EXPECT_TRUE(disconnected.empty());
}

TEST_F(ManagerTest, BringUpFiresConnectedOncePerLink) {
    discover();
    bring_up();

    const DeviceRecord& r = record();
    EXPECT_EQ(r.status, DeviceStatus::Connected);
    EXPECT_EQ(r.pairing_channel.handle(), PAIRING);
    EXPECT_EQ(r.inbound_channel.handle(), INBOUND);
    EXPECT_EQ(r.outbound_channel.handle(), OUTBOUND);
    EXPECT_TRUE(r.notifying);

    ASSERT_EQ(transport.service_discoveries.size(), 1u);
    ASSERT_EQ(transport.characteristic_discoveries.size(), 1u);
    ASSERT_EQ(transport.notifies.size(), 1u);
    EXPECT_EQ(transport.notifies[0].channel, INBOUND);
    EXPECT_TRUE(transport.notifies[0].enable);

    manager.handle(TransportEvent::notify_state_changed(DEVICE, ChannelRole::Inbound, true));
    EXPECT_EQ(connected, std::vector<uint32_t>{id_of(ADDRESS)});
}

TEST_F(ManagerTest, LinkUpWithoutCommandPromotesRecord) {
    discover();
    manager.handle(TransportEvent::for_device(Kind::Connected, DEVICE));

    EXPECT_EQ(record().status, DeviceStatus::Connected);
    EXPECT_EQ(transport.service_discoveries.size(), 1u);
}

TEST_F(ManagerTest, EventsForDiscoveredRecordAreIgnored) {
    discover();
    manager.handle(TransportEvent::characteristics_found(
        DEVICE, "svc", {{ChannelRole::Outbound, OUTBOUND}}));
    manager.handle(TransportEvent::notify_state_changed(DEVICE, ChannelRole::Inbound, true));
    manager.handle(TransportEvent::value_updated(DEVICE, ChannelRole::Inbound, {1, 2}));

    EXPECT_FALSE(record().any_channel_resolved());
    EXPECT_FALSE(record().notifying);
    EXPECT_TRUE(connected.empty());
    EXPECT_TRUE(data_payloads.empty());
}

TEST_F(ManagerTest, CharacteristicDiscoveryErrorCleansUp) {
    discover();
    ASSERT_EQ(manager.connect(id_of(ADDRESS)), Error::None);
    manager.handle(TransportEvent::for_device(Kind::Connected, DEVICE));
    manager.handle(TransportEvent::characteristics_found(DEVICE, "", {}, "accessory service not found"));

    EXPECT_FALSE(record().any_channel_resolved());
    EXPECT_TRUE(transport.notifies.empty());
}

TEST_F(ManagerTest, DisconnectCommandWaitsForLinkDown) {
    discover();
    bring_up();

    EXPECT_EQ(manager.disconnect(id_of(ADDRESS)), Error::None);
    EXPECT_EQ(transport.disconnects.size(), 1u);
    EXPECT_EQ(record().status, DeviceStatus::Connected);

    manager.handle(TransportEvent::for_device(Kind::Disconnected, DEVICE));
    EXPECT_EQ(record().status, DeviceStatus::Discovered);
    EXPECT_EQ(disconnected, std::vector<uint32_t>{id_of(ADDRESS)});
}

TEST_F(ManagerTest, DisconnectWhenDiscoveredIsNoop) {
    discover();
    EXPECT_EQ(manager.disconnect(id_of(ADDRESS)), Error::None);
    EXPECT_TRUE(transport.disconnects.empty());
}

TEST_F(ManagerTest, LinkLossWhileRangingReturnsToDiscovered) {
    discover();
    bring_up();
    ASSERT_EQ(manager.mark_ranging(id_of(ADDRESS)), Error::None);
    ASSERT_EQ(record().status, DeviceStatus::Ranging);

    now = 20000;
    manager.handle(TransportEvent::for_device(Kind::Disconnected, DEVICE, "link loss"));

    const DeviceRecord& r = record();
    EXPECT_EQ(r.status, DeviceStatus::Discovered);
    EXPECT_FALSE(r.any_channel_resolved());
    EXPECT_FALSE(r.notifying);
    EXPECT_EQ(r.last_seen_ms, 20000);
    EXPECT_EQ(disconnected, std::vector<uint32_t>{id_of(ADDRESS)});

    // Inbound subscription rolled back
    ASSERT_EQ(transport.notifies.size(), 2u);
    EXPECT_EQ(transport.notifies[1].channel, INBOUND);
    EXPECT_FALSE(transport.notifies[1].enable);
}

TEST_F(ManagerTest, ReconnectFiresConnectedAgain) {
    discover();
    bring_up();
    manager.handle(TransportEvent::for_device(Kind::Disconnected, DEVICE));
    bring_up();

    EXPECT_EQ(connected.size(), 2u);
}

TEST_F(ManagerTest, MarkRangingOnlyFromConnected) {
    discover();
    EXPECT_EQ(manager.mark_ranging(id_of(ADDRESS)), Error::None);
    EXPECT_EQ(record().status, DeviceStatus::Discovered);
    EXPECT_EQ(manager.mark_ranging(42), Error::UnknownDevice);
}

TEST_F(ManagerTest, ReportDistance) {
    discover();
    EXPECT_EQ(manager.report_distance(id_of(ADDRESS), 1.5f), Error::None);
    EXPECT_EQ(record().reported_distance, 1.5f);
    EXPECT_EQ(manager.report_distance(42, 1.0f), Error::UnknownDevice);
}

TEST_F(ManagerTest, ServicesInvalidatedRediscovers) {
    discover();
    bring_up();

    manager.handle(TransportEvent::for_device(Kind::ServicesInvalidated, DEVICE));

    EXPECT_FALSE(record().any_channel_resolved());
    EXPECT_EQ(record().status, DeviceStatus::Connected);
    EXPECT_EQ(transport.service_discoveries.size(), 2u);
}

// ----------------------------------------------------------------------------
// Scanning, adapter readiness and iteration limits
// ----------------------------------------------------------------------------

TEST_F(ManagerTest, StartBeforeAdapterReadyIsReplayedOnce) {
    manager.start();
    EXPECT_TRUE(manager.start_pending());
    EXPECT_EQ(transport.start_scans, 0);

    manager.handle(TransportEvent::adapter_ready());
    EXPECT_FALSE(manager.start_pending());
    EXPECT_TRUE(manager.scanning());
    EXPECT_EQ(transport.start_scans, 1);

    manager.handle(TransportEvent::adapter_ready());
    EXPECT_EQ(transport.start_scans, 1);
}

TEST_F(ManagerTest, StopCancelsPendingStart) {
    manager.start();
    manager.stop();
    manager.handle(TransportEvent::adapter_ready());

    EXPECT_EQ(transport.start_scans, 0);
    EXPECT_FALSE(manager.scanning());
}

TEST_F(ManagerTest, StopEndsScan) {
    manager.handle(TransportEvent::adapter_ready());
    manager.start();
    manager.stop();

    EXPECT_EQ(transport.stop_scans, 1);
    EXPECT_FALSE(manager.scanning());
}

TEST_F(ManagerTest, ScanResumesUntilIterationLimit) {
    manager.handle(TransportEvent::adapter_ready());
    manager.start();
    discover();
    ASSERT_EQ(transport.start_scans, 1);

    for (int i = 0; i < 5; ++i) {
        ASSERT_EQ(manager.connect(id_of(ADDRESS)), Error::None);
        manager.handle(TransportEvent::for_device(Kind::Connected, DEVICE));
        manager.handle(TransportEvent::for_device(Kind::Disconnected, DEVICE));
    }

    // Resumed after the first four drops, not after the fifth
    EXPECT_EQ(manager.connection_iterations(), 5u);
    EXPECT_EQ(transport.start_scans, 5);

    manager.start();
    EXPECT_EQ(manager.connection_iterations(), 0u);
    EXPECT_EQ(transport.start_scans, 6);
}

// ----------------------------------------------------------------------------
// Pairing and data
// ----------------------------------------------------------------------------

TEST_F(ManagerTest, PairReadsPairingChannel) {
    discover();
    bring_up();

    EXPECT_EQ(manager.pair(id_of(ADDRESS)), Error::None);
    ASSERT_EQ(transport.reads.size(), 1u);
    EXPECT_EQ(transport.reads[0].first, ChannelRole::Pairing);
    EXPECT_EQ(transport.reads[0].second, PAIRING);

    manager.handle(TransportEvent::value_updated(DEVICE, ChannelRole::Pairing, {0xde, 0xad}));
    ASSERT_EQ(pairing_payloads.size(), 1u);
    EXPECT_EQ(pairing_payloads[0].first, (std::vector<uint8_t>{0xde, 0xad}));
    EXPECT_EQ(pairing_payloads[0].second, id_of(ADDRESS));
    EXPECT_TRUE(data_payloads.empty());
}

TEST_F(ManagerTest, PairWhenNotConnectedIsNoop) {
    discover();
    EXPECT_EQ(manager.pair(id_of(ADDRESS)), Error::None);
    EXPECT_TRUE(transport.reads.empty());
}

TEST_F(ManagerTest, PairBeforeDiscoveryFinishes) {
    discover();
    ASSERT_EQ(manager.connect(id_of(ADDRESS)), Error::None);

    EXPECT_EQ(manager.pair(id_of(ADDRESS)), Error::UnknownDevice);
}

TEST_F(ManagerTest, PairReadFailure) {
    discover();
    bring_up();
    transport.fail_read = true;

    EXPECT_EQ(manager.pair(id_of(ADDRESS)), Error::TransportError);
}

TEST_F(ManagerTest, InboundDataFansOutWithName) {
    discover();
    bring_up();

    manager.handle(TransportEvent::value_updated(DEVICE, ChannelRole::Inbound, {1, 2, 3}));

    ASSERT_EQ(data_payloads.size(), 1u);
    EXPECT_EQ(std::get<0>(data_payloads[0]), (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_EQ(std::get<1>(data_payloads[0]), "Tag");
    EXPECT_EQ(std::get<2>(data_payloads[0]), id_of(ADDRESS));
}

TEST_F(ManagerTest, OutboundValueChangeIsNotData) {
    discover();
    bring_up();

    std::vector<uint8_t> payload{1, 2, 3};
    ASSERT_EQ(manager.send(payload, id_of(ADDRESS)), Error::None);
    manager.handle(TransportEvent::value_updated(DEVICE, ChannelRole::Outbound, {1, 2, 3}));

    EXPECT_TRUE(data_payloads.empty());
    EXPECT_TRUE(pairing_payloads.empty());
}

TEST_F(ManagerTest, OnePairingReadSurfacesOnePayload) {
    discover();
    bring_up();

    ASSERT_EQ(manager.pair(id_of(ADDRESS)), Error::None);
    manager.handle(TransportEvent::value_updated(DEVICE, ChannelRole::Pairing, {9}));
    manager.handle(TransportEvent::value_updated(DEVICE, ChannelRole::Pairing, {9}));

    ASSERT_EQ(pairing_payloads.size(), 1u);
    EXPECT_EQ(pairing_payloads[0].first, (std::vector<uint8_t>{9}));
    EXPECT_TRUE(data_payloads.empty());

    // A second read surfaces again
    ASSERT_EQ(manager.pair(id_of(ADDRESS)), Error::None);
    manager.handle(TransportEvent::value_updated(DEVICE, ChannelRole::Pairing, {10}));
    EXPECT_EQ(pairing_payloads.size(), 2u);
}

TEST_F(ManagerTest, UnrequestedPairingValueIsDropped) {
    discover();
    bring_up();

    manager.handle(TransportEvent::value_updated(DEVICE, ChannelRole::Pairing, {9}));

    EXPECT_TRUE(pairing_payloads.empty());
    EXPECT_TRUE(data_payloads.empty());
}

TEST_F(ManagerTest, SendSplitsPayload) {
    discover();
    bring_up();
    transport.max_write = 185;

    std::vector<uint8_t> payload(1000);
    std::iota(payload.begin(), payload.end(), uint8_t{0});

    EXPECT_EQ(manager.send(payload, id_of(ADDRESS)), Error::None);
    ASSERT_EQ(transport.writes.size(), 6u);
    EXPECT_EQ(transport.writes.back().bytes.size(), 85u);
    EXPECT_EQ(transport.writes[0].channel, OUTBOUND);
    EXPECT_EQ(manager.write_iterations(), 6u);

    // A new link starts the count over
    manager.handle(TransportEvent::for_device(Kind::Disconnected, DEVICE));
    ASSERT_EQ(manager.connect(id_of(ADDRESS)), Error::None);
    manager.handle(TransportEvent::for_device(Kind::Connected, DEVICE));
    EXPECT_EQ(manager.write_iterations(), 0u);
}

TEST_F(ManagerTest, SendWithoutOutboundChannel) {
    discover();
    std::vector<uint8_t> payload{1, 2, 3};

    EXPECT_EQ(manager.send(payload, id_of(ADDRESS)), Error::UnknownDevice);
    EXPECT_EQ(manager.send(payload, 42), Error::UnknownDevice);
    EXPECT_TRUE(transport.writes.empty());
}

// ----------------------------------------------------------------------------
// Known devices
// ----------------------------------------------------------------------------

TEST_F(ManagerTest, RememberRecallForget) {
    EXPECT_FALSE(manager.is_known(7));
    EXPECT_FALSE(manager.recall(7).has_value());

    manager.remember(7, "Bag");
    EXPECT_TRUE(manager.is_known(7));
    EXPECT_EQ(manager.recall(7), "Bag");

    manager.forget_all();
    EXPECT_FALSE(manager.is_known(7));
}

TEST_F(ManagerTest, RenameUpdatesKnownEntry) {
    discover();
    uint32_t id = id_of(ADDRESS);

    EXPECT_EQ(manager.rename(id, "Wallet"), Error::None);
    EXPECT_EQ(record().display_name, "Wallet");
    EXPECT_FALSE(store.exists(id));

    manager.remember(id, "Wallet");
    EXPECT_EQ(manager.rename(id, "Backpack"), Error::None);
    EXPECT_EQ(store.get(id), "Backpack");

    EXPECT_EQ(manager.rename(42, "x"), Error::UnknownDevice);
}
