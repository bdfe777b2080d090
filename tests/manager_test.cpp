#include <discocap/decoder.hpp>
#include <discocap/manager.hpp>

#include "test_util.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace {

DiscoveredDevice make_device(const std::string& mac, const std::string& ip, const std::string& name = "AP") {
    DiscoveredDevice dev;
    dev.brand = "Ubiquiti";
    dev.mac = mac;
    dev.ip = ip;
    dev.name = name;
    return dev;
}

OwnedFrame ubnt_frame(const Bytes& mac, const std::string& source_ip) {
    return OwnedFrame{source_ip, UBIQUITI_PORT, UBIQUITI_PORT, ubnt_packet({
        ubnt_tlv(UBNT_TLV_MAC_ADDRESS, mac),
        ubnt_tlv(UBNT_TLV_HOSTNAME, str_bytes("AP1")),
    })};
}

OwnedFrame mndp_frame(const Bytes& mac, const std::string& source_ip) {
    return OwnedFrame{source_ip, MNDP_PORT, MNDP_PORT, mndp_packet({
        mndp_tlv(MNDP_TLV_MAC_ADDRESS, mac),
        mndp_tlv(MNDP_TLV_IDENTITY, str_bytes("router")),
        mndp_tlv(MNDP_TLV_PLATFORM, str_bytes("MikroTik")),
    })};
}

class ThrowingScanner : public Scanner {
  public:
    uint16_t port() const override { return UBIQUITI_PORT; }
    std::string brand() const override { return "Broken"; }
    std::optional<DiscoveredDevice> decode(const uint8_t*, size_t, std::string_view) const override {
        throw std::runtime_error("decoder exploded");
    }
};

// Keeps returning from run() for a while after being told to stop.
class LingeringSource : public PacketSource {
  private:
    std::chrono::milliseconds linger_;

  public:
    std::atomic<int> runs{0};
    std::atomic<int> finished{0};

    explicit LingeringSource(std::chrono::milliseconds linger) : linger_(linger) {}

    CaptureResult run(const std::string&, const std::optional<std::string>&,
                      const FrameHandler&, const StopPredicate& should_stop) override {
        ++runs;
        while (!should_stop()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        std::this_thread::sleep_for(linger_);
        ++finished;
        return CaptureResult::ok;
    }

    void interrupt() override {}
};

class DiscoveryManagerTest : public ::testing::Test {
  protected:
    FakePacketSource source_;
    DiscoveryManager manager_{source_};

    void register_defaults() {
        manager_.register_scanner(std::make_unique<UbiquitiScanner>());
        manager_.register_scanner(std::make_unique<MndpScanner>());
    }
};

}

TEST_F(DiscoveryManagerTest, DeduplicatesByMacIgnoringCase) {
    auto first = make_device("aa:bb:cc:dd:ee:ff", "10.0.0.1");
    manager_.on_discovered(first);
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    manager_.on_discovered(make_device("AA:BB:CC:DD:EE:FF", "10.0.0.2", "renamed"));

    auto devices = manager_.get_devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(manager_.get_device_count(), 1u);
    EXPECT_EQ(devices[0].mac, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(devices[0].ip, "10.0.0.2");
    EXPECT_EQ(devices[0].name, "AP");
    EXPECT_EQ(devices[0].discovered_at, first.discovered_at);
    EXPECT_GT(devices[0].last_seen, devices[0].discovered_at);
}

TEST_F(DiscoveryManagerTest, LastSeenIsMonotonic) {
    manager_.on_discovered(make_device("00:0C:42:00:00:01", "10.0.0.1"));
    auto previous = manager_.get_devices().front().last_seen;
    for (int i = 0; i < 20; ++i) {
        manager_.on_discovered(make_device("00:0c:42:00:00:01", "10.0.0.1"));
        auto dev = manager_.get_devices().front();
        EXPECT_GE(dev.last_seen, previous);
        EXPECT_GE(dev.last_seen, dev.discovered_at);
        previous = dev.last_seen;
    }
}

TEST_F(DiscoveryManagerTest, NewAndUpdatedNotifications) {
    std::vector<DiscoveredDevice> added;
    std::vector<DiscoveredDevice> updated;
    manager_.set_on_new_device([&added](const DiscoveredDevice& dev) { added.push_back(dev); });
    manager_.set_on_device_updated([&updated](const DiscoveredDevice& dev) { updated.push_back(dev); });

    manager_.on_discovered(make_device("AA:BB:CC:DD:EE:01", "10.0.0.1"));
    manager_.on_discovered(make_device("AA:BB:CC:DD:EE:02", "10.0.0.2"));
    manager_.on_discovered(make_device("aa:bb:cc:dd:ee:01", "10.0.0.9"));

    ASSERT_EQ(added.size(), 2u);
    ASSERT_EQ(updated.size(), 1u);
    EXPECT_EQ(updated[0].mac, "AA:BB:CC:DD:EE:01");
    EXPECT_EQ(updated[0].ip, "10.0.0.9");
}

TEST_F(DiscoveryManagerTest, CallbacksMayQueryTheRegistry) {
    size_t seen_count = 0;
    manager_.set_on_new_device([this, &seen_count](const DiscoveredDevice&) {
        seen_count = manager_.get_devices().size();
    });
    manager_.set_on_device_updated([this](const DiscoveredDevice& dev) {
        manager_.on_discovered(make_device("11:22:33:44:55:66", dev.ip));
    });

    manager_.on_discovered(make_device("AA:BB:CC:DD:EE:01", "10.0.0.1"));
    EXPECT_EQ(seen_count, 1u);

    manager_.set_on_new_device(nullptr);
    manager_.on_discovered(make_device("AA:BB:CC:DD:EE:01", "10.0.0.1"));
    EXPECT_EQ(manager_.get_device_count(), 2u);
}

TEST_F(DiscoveryManagerTest, SnapshotsAreCopies) {
    manager_.on_discovered(make_device("AA:BB:CC:DD:EE:01", "10.0.0.1"));
    auto devices = manager_.get_devices();
    devices[0].ip = "0.0.0.0";
    devices.clear();
    auto fresh = manager_.get_devices();
    ASSERT_EQ(fresh.size(), 1u);
    EXPECT_EQ(fresh[0].ip, "10.0.0.1");
}

TEST_F(DiscoveryManagerTest, ClearDevices) {
    manager_.on_discovered(make_device("AA:BB:CC:DD:EE:01", "10.0.0.1"));
    manager_.on_discovered(make_device("AA:BB:CC:DD:EE:02", "10.0.0.2"));
    manager_.clear_devices();
    EXPECT_EQ(manager_.get_device_count(), 0u);
    EXPECT_TRUE(manager_.get_devices().empty());

    int added = 0;
    manager_.set_on_new_device([&added](const DiscoveredDevice&) { ++added; });
    manager_.on_discovered(make_device("AA:BB:CC:DD:EE:01", "10.0.0.1"));
    EXPECT_EQ(added, 1);
}

TEST_F(DiscoveryManagerTest, CapturedFramesReachTheRegistry) {
    register_defaults();
    EXPECT_EQ(manager_.filter(), "udp and (port 10001 or port 5678)");
    EXPECT_EQ(manager_.scanner_brands(), (std::vector<std::string>{"Ubiquiti", "Mikrotik/Mimosa"}));

    manager_.start();
    EXPECT_TRUE(manager_.is_running());
    source_.push(ubnt_frame(TEST_MAC, "10.0.0.5"));
    source_.push(mndp_frame({0x00, 0x0c, 0x42, 0x01, 0x02, 0x03}, "10.0.0.6"));
    source_.push(ubnt_frame(TEST_MAC, "10.0.0.7"));
    ASSERT_TRUE(wait_until([this] {
        auto devices = manager_.get_devices();
        return devices.size() == 2 && std::any_of(devices.begin(), devices.end(), [](const auto& dev) {
            return dev.ip == "10.0.0.7";
        });
    }));
    manager_.stop();
    EXPECT_FALSE(manager_.is_running());
    EXPECT_EQ(source_.last_filter, "udp and (port 10001 or port 5678)");

    for (const auto& dev : manager_.get_devices()) {
        if (dev.mac == "AA:BB:CC:DD:EE:FF") {
            EXPECT_EQ(dev.brand, "Ubiquiti");
            EXPECT_EQ(dev.name, "AP1");
        } else {
            EXPECT_EQ(dev.mac, "00:0C:42:01:02:03");
            EXPECT_EQ(dev.brand, "Mikrotik");
            EXPECT_EQ(dev.ip, "10.0.0.6");
        }
    }
}

TEST_F(DiscoveryManagerTest, StopThenStartKeepsDevices) {
    register_defaults();
    manager_.start();
    source_.push(ubnt_frame(TEST_MAC, "10.0.0.5"));
    ASSERT_TRUE(wait_until([this] { return manager_.get_device_count() == 1; }));

    manager_.stop();
    EXPECT_FALSE(manager_.is_running());
    EXPECT_GE(source_.interrupts.load(), 1);
    auto before = manager_.get_devices();

    manager_.start();
    EXPECT_TRUE(manager_.is_running());
    ASSERT_TRUE(wait_until([this] { return source_.runs.load() == 2; }));
    auto after = manager_.get_devices();
    ASSERT_EQ(after.size(), before.size());
    EXPECT_EQ(after[0].mac, before[0].mac);
    EXPECT_EQ(after[0].discovered_at, before[0].discovered_at);
    manager_.stop();
}

TEST_F(DiscoveryManagerTest, StartWhileRunningIsIgnored) {
    register_defaults();
    manager_.start();
    ASSERT_TRUE(wait_until([this] { return source_.runs.load() == 1; }));
    manager_.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(source_.runs.load(), 1);
    manager_.stop();
}

TEST_F(DiscoveryManagerTest, StartsWithoutScanners) {
    manager_.start("eth0");
    EXPECT_TRUE(manager_.is_running());
    ASSERT_TRUE(wait_until([this] { return source_.runs.load() == 1; }));
    EXPECT_EQ(source_.last_filter, "udp");
    manager_.stop();
    EXPECT_FALSE(manager_.is_running());
}

TEST_F(DiscoveryManagerTest, StopWithoutStartIsHarmless) {
    EXPECT_NO_THROW(manager_.stop());
    EXPECT_FALSE(manager_.is_running());
}

TEST_F(DiscoveryManagerTest, PermissionErrorEndsLoopAndKeepsDevices) {
    register_defaults();
    manager_.on_discovered(make_device("AA:BB:CC:DD:EE:01", "10.0.0.1"));
    source_.fail_with(CaptureResult::permission_denied);
    manager_.start();
    ASSERT_TRUE(wait_until([this] { return !manager_.is_running(); }));
    EXPECT_EQ(manager_.get_device_count(), 1u);

    source_.fail_with(CaptureResult::error);
    manager_.start();
    ASSERT_TRUE(wait_until([this] { return !manager_.is_running(); }));
    EXPECT_EQ(source_.runs.load(), 2);
    EXPECT_EQ(manager_.get_device_count(), 1u);
    manager_.stop();
}

TEST_F(DiscoveryManagerTest, ThrowingScannerDoesNotStopCapture) {
    manager_.register_scanner(std::make_unique<ThrowingScanner>());
    manager_.register_scanner(std::make_unique<UbiquitiScanner>());
    manager_.start();
    source_.push(ubnt_frame(TEST_MAC, "10.0.0.5"));
    source_.push(ubnt_frame({0x00, 0x27, 0x22, 0x00, 0x00, 0x01}, "10.0.0.8"));
    ASSERT_TRUE(wait_until([this] { return manager_.get_device_count() == 2; }));
    EXPECT_TRUE(manager_.is_running());
    manager_.stop();
}

TEST_F(DiscoveryManagerTest, ConcurrentReadersSeeConsistentRecords) {
    register_defaults();
    manager_.start();
    std::atomic<bool> done{false};
    std::thread reader([this, &done] {
        while (!done.load()) {
            for (const auto& dev : manager_.get_devices()) {
                EXPECT_FALSE(dev.mac.empty());
                EXPECT_GE(dev.last_seen, dev.discovered_at);
            }
        }
    });
    for (int i = 0; i < 50; ++i) {
        source_.push(ubnt_frame({0x00, 0x27, 0x22, 0x00, 0x00, static_cast<uint8_t>(i % 5)},
                                "10.0.0." + std::to_string(i)));
    }
    EXPECT_TRUE(wait_until([this] {
        auto devices = manager_.get_devices();
        return devices.size() == 5 && std::any_of(devices.begin(), devices.end(), [](const auto& dev) {
            return dev.ip == "10.0.0.49";
        });
    }));
    done.store(true);
    reader.join();
    manager_.stop();
}

TEST(DiscoveryManagerRestart, StartDoesNotWaitForLingeringLoop) {
    LingeringSource source{std::chrono::milliseconds(600)};
    DiscoveryManager manager{source};
    manager.register_scanner(std::make_unique<UbiquitiScanner>());
    manager.set_stop_timeout(std::chrono::milliseconds(50));

    manager.start();
    ASSERT_TRUE(wait_until([&source] { return source.runs.load() == 1; }));
    manager.stop();
    EXPECT_FALSE(manager.is_running());

    auto begin = std::chrono::steady_clock::now();
    manager.start();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);
    EXPECT_LT(elapsed.count(), 200);
    EXPECT_TRUE(manager.is_running());
    ASSERT_TRUE(wait_until([&source] { return source.runs.load() == 2; }));

    // The old loop ending must not mark the new one as stopped.
    ASSERT_TRUE(wait_until([&source] { return source.finished.load() == 1; }));
    EXPECT_TRUE(manager.is_running());
    EXPECT_EQ(source.finished.load(), 1);

    manager.stop();
    EXPECT_FALSE(manager.is_running());
}

TEST_F(DiscoveryManagerTest, CallbackMayRestartCapture) {
    register_defaults();
    std::atomic<bool> restarted{false};
    manager_.set_on_new_device([this, &restarted](const DiscoveredDevice&) {
        if (!restarted.exchange(true)) {
            manager_.stop();
            manager_.start();
        }
    });

    manager_.start();
    source_.push(ubnt_frame(TEST_MAC, "10.0.0.5"));
    ASSERT_TRUE(wait_until([&restarted] { return restarted.load(); }));
    ASSERT_TRUE(wait_until([this] { return source_.runs.load() == 2; }));
    EXPECT_TRUE(manager_.is_running());

    source_.push(ubnt_frame({0x00, 0x27, 0x22, 0x00, 0x00, 0x02}, "10.0.0.6"));
    ASSERT_TRUE(wait_until([this] { return manager_.get_device_count() == 2; }));
    manager_.stop();
    EXPECT_FALSE(manager_.is_running());
}

TEST_F(DiscoveryManagerTest, CallbackMayStopCapture) {
    register_defaults();
    manager_.set_on_new_device([this](const DiscoveredDevice&) { manager_.stop(); });

    manager_.start();
    source_.push(ubnt_frame(TEST_MAC, "10.0.0.5"));
    ASSERT_TRUE(wait_until([this] { return manager_.get_device_count() == 1; }));
    ASSERT_TRUE(wait_until([this] { return !manager_.is_running(); }));

    manager_.set_on_new_device(nullptr);
    manager_.start();
    EXPECT_TRUE(manager_.is_running());
    ASSERT_TRUE(wait_until([this] { return source_.runs.load() == 2; }));
    manager_.stop();
}
