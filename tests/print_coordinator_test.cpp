#include "core/print/PrintCoordinator.hpp"
#include "core/transport/impl/BleTransport.hpp"
#include "support/PipelineFixture.hpp"

#include <gtest/gtest.h>
#include <thread>

using core::device::TargetSpec;
using core::print::JobState;
using core::print::PrintRequest;
using core::types::ResultCode;
using namespace std::chrono_literals;

class PrintCoordinatorTest : public ::testing::Test {
protected:
    fakes::Pipeline pipeline;
};

TEST_F(PrintCoordinatorTest, SerialJobRunsThroughEveryState) {
    auto coordinator = pipeline.coordinator(TargetSpec::serial("/dev/rfcomm0", std::string("X6")));
    std::vector<JobState> seen;
    coordinator->addObserver([&seen](uint64_t, JobState, JobState to) { seen.push_back(to); });

    auto result = coordinator->print(PrintRequest::make("Box 1", std::string("http://x/box/1")));

    ASSERT_TRUE(result.isSuccess()) << result.message;
    std::vector<JobState> expected = {JobState::COMPOSING, JobState::ENCODING, JobState::DELIVERING, JobState::DONE};
    EXPECT_EQ(seen, expected);
    EXPECT_EQ(pipeline.composer->lastWidth, 384);
    EXPECT_EQ(pipeline.composer->lastText, "Box 1");
    EXPECT_EQ(pipeline.composer->lastQr.value_or(""), "http://x/box/1");
    ASSERT_EQ(pipeline.transport->deliveries(), 1u);
    EXPECT_EQ(pipeline.transport->devices[0].address, "/dev/rfcomm0");
    EXPECT_EQ(coordinator->currentState(), JobState::IDLE);
    EXPECT_EQ(coordinator->jobsStarted(), 1u);
}

TEST_F(PrintCoordinatorTest, SerialWithoutModelFailsBeforeComposition) {
    auto coordinator = pipeline.coordinator(TargetSpec::serial("/dev/rfcomm0"));
    std::vector<JobState> seen;
    coordinator->addObserver([&seen](uint64_t, JobState, JobState to) { seen.push_back(to); });

    auto result = coordinator->print(PrintRequest::make("hello", std::nullopt));

    EXPECT_EQ(result.code, ResultCode::ModelRequired);
    EXPECT_TRUE(result.isResolutionFailure());
    EXPECT_EQ(pipeline.composer->calls, 0);
    EXPECT_EQ(pipeline.transport->deliveries(), 0u);
    std::vector<JobState> expected = {JobState::COMPOSING, JobState::FAILED};
    EXPECT_EQ(seen, expected);
}

TEST_F(PrintCoordinatorTest, BleDiscoveryFeedsTheTransport) {
    pipeline.scanner->devices = {{"GB03-AB12", "AA:BB:CC:DD:EE:FF"}};
    auto coordinator = pipeline.coordinator(TargetSpec::ble("GB"));

    auto result = coordinator->print(PrintRequest::make("hello", std::nullopt));

    ASSERT_TRUE(result.isSuccess()) << result.message;
    ASSERT_EQ(pipeline.transport->deliveries(), 1u);
    EXPECT_EQ(pipeline.transport->devices[0].address, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(pipeline.transport->devices[0].profile.model, "GB03");
    EXPECT_EQ(pipeline.transport->streamSizes[0], 8u * 4u);
}

TEST_F(PrintCoordinatorTest, MapsFailuresToResultCodes) {
    auto coordinator = pipeline.coordinator(TargetSpec::ble("TiMini"));
    EXPECT_EQ(coordinator->print(PrintRequest::make("x", std::nullopt)).code, ResultCode::DeviceNotFound);

    pipeline.scanner->devices = {{"TiMini", "AA:BB:CC:DD:EE:FF"}};
    EXPECT_EQ(coordinator->print(PrintRequest::make("x", std::nullopt)).code, ResultCode::UnknownModel);

    auto serial = pipeline.coordinator(TargetSpec::serial("/dev/ttyUSB0", std::string("X6")));
    pipeline.composer->failWith = "no font";
    EXPECT_EQ(serial->print(PrintRequest::make("x", std::nullopt)).code, ResultCode::RenderError);

    pipeline.composer->failWith.reset();
    pipeline.transport->hook = [](const core::types::Deadline &) {
        throw core::types::TransportError("write refused");
    };
    auto result = serial->print(PrintRequest::make("x", std::nullopt));
    EXPECT_EQ(result.code, ResultCode::TransportError);
    EXPECT_NE(result.message.find("write refused"), std::string::npos);
}

TEST_F(PrintCoordinatorTest, BleJobAbandonedAtDeadlineReleasesTheLock) {
    pipeline.scanner->devices = {{"X6-01", "AA:BB:CC:DD:EE:FF"}};
    auto coordinator = pipeline.coordinator(TargetSpec::ble("X6"), 40ms);

    pipeline.transport->hook = [](const core::types::Deadline &deadline) {
        deadline.sleepFor(5000ms, "delivery");
    };
    auto start = std::chrono::steady_clock::now();
    auto result = coordinator->print(PrintRequest::make("slow", std::nullopt));

    EXPECT_TRUE(result.isTimeout());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2000ms);

    pipeline.transport->hook = nullptr;
    EXPECT_TRUE(coordinator->print(PrintRequest::make("next", std::nullopt)).isSuccess());
}

TEST_F(PrintCoordinatorTest, StalledBleWriteCannotHoldTheJobPastItsDeadline) {
    pipeline.scanner->devices = {{"X6-01", "AA:BB:CC:DD:EE:FF"}};
    auto link = std::make_shared<fakes::FakeBleLink>();
    link->writeStall = 5000ms;
    auto transport = std::make_shared<core::transport::BleTransport>(link);
    auto coordinator = pipeline.coordinator(TargetSpec::ble("X6"), 100ms, transport);

    auto start = std::chrono::steady_clock::now();
    auto result = coordinator->print(PrintRequest::make("stuck", std::nullopt));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.isTimeout()) << result.message;
    EXPECT_LT(elapsed, 500ms);
    EXPECT_EQ(coordinator->currentState(), JobState::IDLE);

    auto next = coordinator->print(PrintRequest::make("next", std::nullopt));
    EXPECT_TRUE(next.isSuccess()) << next.message;
    EXPECT_GT(link->writeCount(), 0u);
}

TEST_F(PrintCoordinatorTest, SerialJobsHaveNoDeadline) {
    auto coordinator = pipeline.coordinator(TargetSpec::serial("/dev/rfcomm0", std::string("X6")), 1ms);
    bool bounded = true;
    pipeline.transport->hook = [&bounded](const core::types::Deadline &deadline) {
        bounded = deadline.isBounded();
        std::this_thread::sleep_for(20ms);
        deadline.checkpoint("delivery");
    };

    EXPECT_TRUE(coordinator->print(PrintRequest::make("x", std::nullopt)).isSuccess());
    EXPECT_FALSE(bounded);
}

TEST_F(PrintCoordinatorTest, ConcurrentJobsNeverOverlap) {
    auto coordinator = pipeline.coordinator(TargetSpec::serial("/dev/rfcomm0", std::string("X6")));

    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    coordinator->addObserver([&](uint64_t, JobState, JobState to) {
        if (to == JobState::COMPOSING) {
            int now = ++active;
            int seen = maxActive.load();
            while (now > seen && !maxActive.compare_exchange_weak(seen, now)) {}
        } else if (core::print::isTerminal(to)) {
            --active;
        }
    });
    pipeline.transport->hook = [](const core::types::Deadline &) {
        std::this_thread::sleep_for(30ms);
    };

    std::vector<std::thread> clients;
    for (int i = 0; i < 4; ++i) {
        clients.emplace_back([&coordinator, i]() {
            coordinator->print(PrintRequest::make("job " + std::to_string(i), std::nullopt));
        });
    }
    for (auto &client: clients) client.join();

    EXPECT_EQ(maxActive.load(), 1);
    EXPECT_EQ(pipeline.transport->deliveries(), 4u);
    EXPECT_EQ(coordinator->jobsStarted(), 4u);
}
