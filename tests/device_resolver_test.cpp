#include "core/device/DeviceResolver.hpp"
#include "core/device/JsonProfileRegistry.hpp"
#include "core/types/Error.hpp"
#include "support/Fakes.hpp"

#include <gtest/gtest.h>

using core::device::DeviceResolver;
using core::device::ResolverOptions;
using core::device::TargetSpec;
using core::types::Deadline;
using namespace std::chrono_literals;

class DeviceResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<core::device::JsonProfileRegistry> registry =
            std::make_shared<core::device::JsonProfileRegistry>();
    std::shared_ptr<fakes::FakeScanner> scanner = std::make_shared<fakes::FakeScanner>();

    DeviceResolver resolver(bool strict = false) {
        ResolverOptions options;
        options.scanTimeout = 5000ms;
        options.strictAddress = strict;
        return DeviceResolver(registry, scanner, options);
    }
};

TEST_F(DeviceResolverTest, NamePrefixPicksFirstMatchIgnoringCase) {
    scanner->devices = {{"Headphones", "11:11:11:11:11:11"},
                        {"timini-X6-01", "AA:BB:CC:DD:EE:01"},
                        {"TiMini-X6-02", "AA:BB:CC:DD:EE:02"}};

    auto device = resolver().resolve(TargetSpec::ble("TiMini", std::string("X6")), Deadline::unbounded());

    EXPECT_EQ(scanner->scans, 1);
    EXPECT_EQ(device.address, "AA:BB:CC:DD:EE:01");
    EXPECT_EQ(device.advertisedName, "timini-X6-01");
    EXPECT_EQ(device.profile.model, "X6");
}

TEST_F(DeviceResolverTest, NoMatchingNameIsDeviceNotFound) {
    scanner->devices = {{"Headphones", "11:11:11:11:11:11"}};

    EXPECT_THROW(resolver().resolve(TargetSpec::ble("TiMini"), Deadline::unbounded()),
                 core::types::DeviceNotFoundError);
}

TEST_F(DeviceResolverTest, ModelInferredFromAdvertisedName) {
    scanner->devices = {{"X6h-7F3C", "AA:BB:CC:DD:EE:FF"}};

    auto device = resolver().resolve(TargetSpec::ble("X6"), Deadline::unbounded());

    EXPECT_EQ(device.profile.model, "X6h");
    EXPECT_EQ(device.profile.imageMtuBytes.value_or(0), 180);
}

TEST_F(DeviceResolverTest, BleDefaultsFilledIn) {
    scanner->devices = {{"GB02", "AA:BB:CC:DD:EE:FF"}};

    auto device = resolver().resolve(TargetSpec::ble("GB"), Deadline::unbounded());

    EXPECT_EQ(device.profile.imageMtuBytes.value_or(0), core::device::DEFAULT_BLE_MTU);
    EXPECT_EQ(device.profile.writeIntervalMs.value_or(0), core::device::DEFAULT_WRITE_INTERVAL_MS);
}

TEST_F(DeviceResolverTest, UnknownInferredModel) {
    scanner->devices = {{"TiMini", "AA:BB:CC:DD:EE:FF"}};

    EXPECT_THROW(resolver().resolve(TargetSpec::ble("TiMini"), Deadline::unbounded()),
                 core::types::UnknownModelError);
}

TEST_F(DeviceResolverTest, UnknownOverrideModel) {
    scanner->devices = {{"X6-01", "AA:BB:CC:DD:EE:FF"}};

    EXPECT_THROW(resolver().resolve(TargetSpec::ble("X6", std::string("Z99")), Deadline::unbounded()),
                 core::types::UnknownModelError);
}

TEST_F(DeviceResolverTest, AddressTargetLearnsNameFromScan) {
    scanner->devices = {{"MX06-1234", "aa:bb:cc:dd:ee:ff"}};

    auto device = resolver().resolve(TargetSpec::ble("AA:BB:CC:DD:EE:FF"), Deadline::unbounded());

    EXPECT_EQ(device.address, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(device.advertisedName, "MX06-1234");
    EXPECT_EQ(device.profile.model, "MX06");
}

TEST_F(DeviceResolverTest, SilentAddressUsesOverrideWhenLenient) {
    auto device = resolver().resolve(TargetSpec::ble("AA:BB:CC:DD:EE:FF", std::string("GT01")),
                                     Deadline::unbounded());

    EXPECT_EQ(device.address, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(device.advertisedName, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(device.profile.model, "GT01");
}

TEST_F(DeviceResolverTest, SilentAddressWithoutOverrideCannotInferModel) {
    EXPECT_THROW(resolver().resolve(TargetSpec::ble("AA:BB:CC:DD:EE:FF"), Deadline::unbounded()),
                 core::types::UnknownModelError);
}

TEST_F(DeviceResolverTest, SilentAddressFailsInStrictMode) {
    EXPECT_THROW(resolver(true).resolve(TargetSpec::ble("AA:BB:CC:DD:EE:FF", std::string("GT01")),
                                        Deadline::unbounded()),
                 core::types::DeviceNotFoundError);
}

TEST_F(DeviceResolverTest, SerialWithoutModelFailsBeforeAnyIo) {
    EXPECT_THROW(resolver().resolve(TargetSpec::serial("/dev/rfcomm0"), Deadline::unbounded()),
                 core::types::ModelRequiredError);
    EXPECT_EQ(scanner->scans, 0);
}

TEST_F(DeviceResolverTest, SerialUsesOverrideAndSerialDefaults) {
    auto device = resolver().resolve(TargetSpec::serial("/dev/rfcomm0", std::string("x6")), Deadline::unbounded());

    EXPECT_EQ(scanner->scans, 0);
    EXPECT_EQ(device.address, "/dev/rfcomm0");
    EXPECT_EQ(device.profile.model, "X6");
    EXPECT_EQ(device.profile.imageMtuBytes.value_or(0), core::device::DEFAULT_SERIAL_MTU);
}

TEST_F(DeviceResolverTest, ScanTimeoutClampedToDeadline) {
    scanner->devices = {{"X6-01", "AA:BB:CC:DD:EE:FF"}};

    resolver().resolve(TargetSpec::ble("X6"), Deadline::after(1000ms));

    EXPECT_LE(scanner->lastTimeout, 1000ms);
}

TEST_F(DeviceResolverTest, ExpiredDeadlineStopsBeforeScanning) {
    EXPECT_THROW(resolver().resolve(TargetSpec::ble("X6"), Deadline::after(0ms)), core::types::TimeoutError);
    EXPECT_EQ(scanner->scans, 0);
}

TEST_F(DeviceResolverTest, BleWithoutScannerIsATransportError) {
    DeviceResolver noScanner(registry, nullptr);
    EXPECT_THROW(noScanner.resolve(TargetSpec::ble("X6"), Deadline::unbounded()), core::types::TransportError);
}
