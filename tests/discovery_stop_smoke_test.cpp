// Smoke test for DiscoveryService::stop() reliability.
//
// The listener thread polls its socket in short slices, so stop() must return
// promptly even while the multicast group is silent.

#include "securexfer/DiscoveryService.h"

#include <gtest/gtest.h>

#include <chrono>

TEST(DiscoveryStopSmokeTest, StopCompletesQuicklyWhenStarted)
{
    SecureXfer::LocalIdentity identity;
    identity.processId = "smoke-test";
    identity.displayName = "smoke";
    identity.material.fingerprint = std::string(64, 'C');

    SecureXfer::DiscoveryService discovery(identity);

    std::string error;
    if (!discovery.start(error)) {
        GTEST_SKIP() << "DiscoveryService could not start (multicast unavailable): " << error;
    }
    EXPECT_TRUE(discovery.isRunning());

    discovery.discover();

    const auto t0 = std::chrono::steady_clock::now();
    discovery.stop();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();

    EXPECT_FALSE(discovery.isRunning());
    EXPECT_LT(ms, 5000) << "DiscoveryService::stop() took too long (" << ms << "ms).";
}

TEST(DiscoveryStopSmokeTest, StopWithoutStartIsHarmless)
{
    SecureXfer::LocalIdentity identity;
    identity.processId = "never-started";
    SecureXfer::DiscoveryService discovery(identity);
    discovery.stop();
    EXPECT_FALSE(discovery.isRunning());
}
