#include "core/transport/impl/BleTransport.hpp"
#include "core/transport/impl/SerialTransport.hpp"
#include "core/types/Error.hpp"
#include "support/Fakes.hpp"

#include <gtest/gtest.h>

using core::device::DeviceProfile;
using core::device::ResolvedDevice;
using core::types::Deadline;
using namespace std::chrono_literals;

namespace {
    ResolvedDevice device(const std::string &address, int mtu, int intervalMs) {
        DeviceProfile profile;
        profile.model = "X6";
        profile.imageMtuBytes = mtu;
        profile.writeIntervalMs = intervalMs;
        return {address, "X6-01", profile};
    }

    std::vector<uint8_t> stream(size_t size) {
        std::vector<uint8_t> data(size);
        for (size_t i = 0; i < size; ++i) data[i] = static_cast<uint8_t>(i * 7);
        return data;
    }

    std::vector<uint8_t> joined(const std::vector<std::vector<uint8_t>> &chunks) {
        std::vector<uint8_t> all;
        for (const auto &chunk: chunks) all.insert(all.end(), chunk.begin(), chunk.end());
        return all;
    }
}

TEST(BleTransportTest, WritesEveryChunkToTheTiMiniCharacteristic) {
    auto link = std::make_shared<fakes::FakeBleLink>();
    core::transport::BleTransport transport(link);
    auto data = stream(105);

    transport.deliver(device("AA:BB:CC:DD:EE:FF", 20, 0), data, Deadline::unbounded());

    EXPECT_EQ(link->lastAddress, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(link->lastCharacteristic, "0000ae01-0000-1000-8000-00805f9b34fb");
    EXPECT_EQ(link->writes.size(), 6u);
    EXPECT_EQ(joined(link->writes), data);
    EXPECT_EQ(link->disconnects.load(), 1);
    EXPECT_FALSE(link->connected);
}

TEST(BleTransportTest, ConnectFailureIsATransportError) {
    auto link = std::make_shared<fakes::FakeBleLink>();
    link->failConnect = true;
    core::transport::BleTransport transport(link);

    EXPECT_THROW(transport.deliver(device("AA:BB:CC:DD:EE:FF", 20, 0), stream(40), Deadline::unbounded()),
                 core::types::TransportError);
    EXPECT_GE(link->disconnects.load(), 1);
}

TEST(BleTransportTest, WriteFailureStillDisconnects) {
    auto link = std::make_shared<fakes::FakeBleLink>();
    link->failAtWrite = 2;
    core::transport::BleTransport transport(link);

    try {
        transport.deliver(device("AA:BB:CC:DD:EE:FF", 20, 0), stream(100), Deadline::unbounded());
        FAIL() << "expected TransportError";
    } catch (const core::types::TransportError &e) {
        EXPECT_NE(std::string(e.what()).find("link lost"), std::string::npos);
    }
    EXPECT_EQ(link->writes.size(), 2u);
    EXPECT_FALSE(link->connected);
}

TEST(BleTransportTest, DeadlineExpiryIsReportedAsTimeout) {
    auto link = std::make_shared<fakes::FakeBleLink>();
    core::transport::BleTransport transport(link);

    EXPECT_THROW(transport.deliver(device("AA:BB:CC:DD:EE:FF", 20, 30), stream(400), Deadline::after(50ms)),
                 core::types::TimeoutError);
    EXPECT_LT(link->writeCount(), 20u);
    EXPECT_FALSE(link->connected);
}

TEST(BleTransportTest, WriteThatNeverYieldsIsCutOffAtTheDeadline) {
    auto link = std::make_shared<fakes::FakeBleLink>();
    link->writeStall = 600ms;
    link->stallEndsOnDisconnect = false;
    core::transport::BleTransport transport(link);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(transport.deliver(device("AA:BB:CC:DD:EE:FF", 20, 0), stream(60), Deadline::after(60ms)),
                 core::types::TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 400ms);
    EXPECT_FALSE(link->connected);

    // The stalled write still owns the link, a short job cannot start yet
    EXPECT_THROW(transport.deliver(device("AA:BB:CC:DD:EE:FF", 20, 0), stream(20), Deadline::after(20ms)),
                 core::types::TimeoutError);

    transport.deliver(device("AA:BB:CC:DD:EE:FF", 20, 0), stream(20), Deadline::after(2000ms));
    EXPECT_EQ(link->connects.load(), 2);
}

TEST(BleTransportTest, ForcedDisconnectReleasesAStalledWrite) {
    auto link = std::make_shared<fakes::FakeBleLink>();
    link->writeStall = 5000ms;
    core::transport::BleTransport transport(link);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(transport.deliver(device("AA:BB:CC:DD:EE:FF", 20, 0), stream(60), Deadline::after(50ms)),
                 core::types::TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);

    transport.deliver(device("AA:BB:CC:DD:EE:FF", 20, 0), stream(40), Deadline::after(1000ms));
    EXPECT_EQ(link->writeCount(), 2u);
}

TEST(SerialTransportTest, OpensWritesAndCloses) {
    auto port = std::make_shared<fakes::FakeSerialPort>();
    core::transport::SerialTransport transport(port, 9600);
    auto data = stream(400);

    transport.deliver(device("/dev/rfcomm0", 180, 0), data, Deadline::unbounded());

    EXPECT_EQ(port->lastPath, "/dev/rfcomm0");
    EXPECT_EQ(port->lastBaudrate, 9600u);
    ASSERT_EQ(port->writes.size(), 3u);
    EXPECT_EQ(port->writes[0].size(), 180u);
    EXPECT_EQ(port->writes[2].size(), 40u);
    EXPECT_EQ(joined(port->writes), data);
    EXPECT_EQ(port->closes, 1);
    EXPECT_FALSE(port->isOpen());
}

TEST(SerialTransportTest, OpenFailurePropagatesAsTransportError) {
    auto port = std::make_shared<fakes::FakeSerialPort>();
    port->failOpen = true;
    core::transport::SerialTransport transport(port);

    EXPECT_THROW(transport.deliver(device("/dev/missing", 180, 0), stream(10), Deadline::unbounded()),
                 core::types::TransportError);
    EXPECT_TRUE(port->writes.empty());
}
