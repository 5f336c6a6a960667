#include <gtest/gtest.h>
#include "bootstrap/HealthGate.hpp"
#include "util/Cancellation.hpp"
#include "FakeEngineClient.hpp"

#include <thread>

using namespace kw;
using namespace kw::bootstrap;
using namespace kw::test;

TEST(HealthGateTest, ReleasesOnceEngineReportsOk) {
    FakeEngineClient engine;
    (void)engine.initialize(1, 1);
    engine.sealed = false;
    engine.healthScript = {503L, 500L, std::nullopt};

    util::Cancellation cancellation;
    HealthGate gate(engine, std::chrono::milliseconds(1));

    EXPECT_TRUE(gate.waitUntilReady(cancellation));
    EXPECT_EQ(engine.healthChecks, 4);
    EXPECT_FALSE(gate.isRunning());
}

TEST(HealthGateTest, CancellationUnblocksTheWait) {
    FakeEngineClient engine; // never initialized, so never ready

    util::Cancellation cancellation;
    HealthGate gate(engine, std::chrono::milliseconds(5));

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancellation.cancel();
    });

    EXPECT_FALSE(gate.waitUntilReady(cancellation));
    canceller.join();
    EXPECT_FALSE(gate.isRunning());
    EXPECT_GE(engine.healthChecks, 1);
}

TEST(CancellationTest, SleepReturnsFalseWhenCancelled) {
    util::Cancellation cancellation;
    EXPECT_TRUE(cancellation.sleepFor(std::chrono::milliseconds(1)));

    cancellation.cancel();
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(cancellation.sleepFor(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}
