#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>
#include "common/Error.hpp"
#include "lock/AcquireLockOptions.hpp"
#include "lock/AutoRenewer.hpp"
#include "lock/Lock.hpp"
#include "lock/LockClient.hpp"
#include "lock/FaultyLeaseStore.hpp"

using zlease::AcquireLockOptions;
using zlease::AutoRenewer;
using zlease::ErrorCode;
using zlease::Lock;
using zlease::LockClient;

class AutoRenewTest : public ::testing::Test {
protected:
    FaultyLeaseStore store;
    LockClient client {store};

    AcquireLockOptions options(std::chrono::seconds lease, bool autoRenew = true) {
        AcquireLockOptions o;
        o.shardKey = "shard";
        o.name = "auto";
        o.leaseDuration = lease;
        o.autoRenew = autoRenew;
        return o;
    }
};

TEST_F(AutoRenewTest, PeriodIsAThirdOfTheLease) {
    auto lock = client.acquire(options(std::chrono::seconds{2L}, false));
    ASSERT_TRUE(lock.has_value());
    const AutoRenewer renewer {client, *lock.value()};
    EXPECT_EQ(renewer.period(), std::chrono::microseconds{666666L});
    EXPECT_EQ(renewer.state(), AutoRenewer::State::Stopped);
}

TEST_F(AutoRenewTest, KeepsLeaseAlivePastItsDuration) {
    auto lock = client.acquire(options(std::chrono::seconds{2L}));
    ASSERT_TRUE(lock.has_value());
    EXPECT_TRUE(lock.value()->autoRenewing());
    std::this_thread::sleep_for(std::chrono::milliseconds{2300L});
    // Ticks near 0.67s, 1.33s and 2s.
    EXPECT_GE(store.replaces.load(), 2);
    EXPECT_LE(store.replaces.load(), 4);
    EXPECT_TRUE(lock.value()->isAcquired());
    EXPECT_TRUE(lock.value()->autoRenewing());
    EXPECT_EQ(store.inner.size(), 1);
    ASSERT_TRUE(client.release(*lock.value()).has_value());
}

TEST_F(AutoRenewTest, RenewalTimeIsTakenOutOfTheNextInterval) {
    store.delayReplaceBy(std::chrono::milliseconds{400L});
    auto lock = client.acquire(options(std::chrono::seconds{3L}));
    ASSERT_TRUE(lock.has_value());
    // Renewals start near 1s, 2s and 3s. Waiting a full period after each
    // 400ms call would start them at 1s, 2.4s and 3.8s instead.
    std::this_thread::sleep_for(std::chrono::milliseconds{3200L});
    EXPECT_EQ(store.replaces.load(), 3);
    EXPECT_TRUE(lock.value()->isAcquired());
    EXPECT_TRUE(lock.value()->autoRenewing());
    ASSERT_TRUE(client.release(*lock.value()).has_value());
}

TEST_F(AutoRenewTest, RenewalSlowerThanPeriodRunsBackToBack) {
    store.delayReplaceBy(std::chrono::milliseconds{1200L});
    auto lock = client.acquire(options(std::chrono::seconds{3L}));
    ASSERT_TRUE(lock.has_value());
    // Renewals start near 1s, 2.2s and 3.4s, each right after the previous one returns.
    std::this_thread::sleep_for(std::chrono::milliseconds{4000L});
    EXPECT_EQ(store.replaces.load(), 3);
    EXPECT_TRUE(lock.value()->isAcquired());
    EXPECT_TRUE(lock.value()->autoRenewing());
    EXPECT_EQ(store.inner.size(), 1);
    ASSERT_TRUE(client.release(*lock.value()).has_value());
    EXPECT_LE(store.replaces.load(), 4);
}

TEST_F(AutoRenewTest, StopsOnceLeaseLapsesWhileRenewalsFail) {
    auto lock = client.acquire(options(std::chrono::seconds{1L}));
    ASSERT_TRUE(lock.has_value());
    store.failWith(ErrorCode::ServiceTemporarilyUnavailable);
    std::this_thread::sleep_for(std::chrono::milliseconds{2000L});
    EXPECT_FALSE(lock.value()->isAcquired());
    EXPECT_FALSE(lock.value()->autoRenewing());
    const int attempts = store.replaces.load();
    EXPECT_GE(attempts, 2);
    EXPECT_LE(attempts, 4);
    std::this_thread::sleep_for(std::chrono::milliseconds{700L});
    EXPECT_EQ(store.replaces.load(), attempts);
}

TEST_F(AutoRenewTest, LostLeaseStopsOnNextTick) {
    auto lock = client.acquire(options(std::chrono::seconds{1L}));
    ASSERT_TRUE(lock.has_value());
    store.failWith(ErrorCode::VersionMismatch);
    std::this_thread::sleep_for(std::chrono::milliseconds{2000L});
    EXPECT_FALSE(lock.value()->isAcquired());
    EXPECT_FALSE(lock.value()->autoRenewing());
    store.clearFailure();
    const int attempts = store.replaces.load();
    std::this_thread::sleep_for(std::chrono::milliseconds{700L});
    EXPECT_EQ(store.replaces.load(), attempts);
}

TEST_F(AutoRenewTest, ReleaseStopsRenewals) {
    auto lock = client.acquire(options(std::chrono::seconds{1L}));
    ASSERT_TRUE(lock.has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds{500L});
    ASSERT_TRUE(client.release(*lock.value()).has_value());
    EXPECT_FALSE(lock.value()->autoRenewing());
    EXPECT_FALSE(lock.value()->isAcquired());
    const int renewals = store.replaces.load();
    std::this_thread::sleep_for(std::chrono::milliseconds{1000L});
    EXPECT_EQ(store.replaces.load(), renewals);
    EXPECT_EQ(store.inner.size(), 0);
}

TEST_F(AutoRenewTest, DestroyingHandleStopsRenewals) {
    auto lock = client.acquire(options(std::chrono::seconds{1L}));
    ASSERT_TRUE(lock.has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds{400L});
    lock.value().reset();
    const int renewals = store.replaces.load();
    std::this_thread::sleep_for(std::chrono::milliseconds{800L});
    EXPECT_EQ(store.replaces.load(), renewals);
}
