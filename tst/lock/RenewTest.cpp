#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>
#include <utility>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "lock/AcquireLockOptions.hpp"
#include "lock/Lock.hpp"
#include "lock/LockClient.hpp"
#include "lock/FaultyLeaseStore.hpp"

using zlease::AcquireLockOptions;
using zlease::ErrorCode;
using zlease::Key;
using zlease::Lock;
using zlease::LockClient;

class RenewTest : public ::testing::Test {
protected:
    FaultyLeaseStore store;
    LockClient client {store};

    std::unique_ptr<Lock> acquire(std::chrono::seconds lease) {
        AcquireLockOptions o;
        o.shardKey = "shard";
        o.name = "renewed";
        o.leaseDuration = lease;
        auto lock = client.acquire(o);
        if (!lock.has_value()) {
            ADD_FAILURE() << "acquire failed: " << lock.error().what;
            return nullptr;
        }
        return std::move(lock.value());
    }
};

TEST_F(RenewTest, RenewAdvancesTimeAndToken) {
    auto lock = acquire(std::chrono::seconds{60L});
    ASSERT_NE(lock.get(), nullptr);
    const auto acquiredAt = lock->timeAcquired();
    const auto token = lock->versionToken();
    std::this_thread::sleep_for(std::chrono::milliseconds{20L});
    ASSERT_TRUE(client.renew(*lock).has_value());
    EXPECT_GT(lock->timeAcquired(), acquiredAt);
    EXPECT_NE(lock->versionToken(), token);
    EXPECT_TRUE(lock->isAcquired());
}

TEST_F(RenewTest, RenewKeepsLeaseAlivePastItsDuration) {
    auto lock = acquire(std::chrono::seconds{1L});
    ASSERT_NE(lock.get(), nullptr);
    for (int i = 0; i < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds{500L});
        ASSERT_TRUE(client.renew(*lock).has_value());
    }
    EXPECT_TRUE(lock->isAcquired());
    EXPECT_EQ(store.inner.size(), 1);
}

TEST_F(RenewTest, RenewAfterExpiryFailsWithLockReleased) {
    auto lock = acquire(std::chrono::seconds{1L});
    ASSERT_NE(lock.get(), nullptr);
    std::this_thread::sleep_for(std::chrono::milliseconds{1100L});
    auto r = client.renew(*lock);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::LockReleased);
    EXPECT_FALSE(lock->isAcquired());
    EXPECT_EQ(store.replaces.load(), 0);
}

// The local clock starts before the create lands, so the store copy outlives the
// local estimate. A renew in that gap must not bring the handle back.
TEST_F(RenewTest, RenewDoesNotReviveLapsedHandleWhileStoreItemLives) {
    store.delayCreateBy(std::chrono::milliseconds{150L});
    auto lock = acquire(std::chrono::seconds{1L});
    ASSERT_NE(lock.get(), nullptr);
    std::this_thread::sleep_for(std::chrono::milliseconds{900L});
    ASSERT_FALSE(lock->isAcquired());
    ASSERT_EQ(store.inner.size(), 1);
    auto r = client.renew(*lock);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::LockReleased);
    EXPECT_FALSE(lock->isAcquired());
    EXPECT_EQ(store.replaces.load(), 0);
}

TEST_F(RenewTest, RenewLapsingMidCallFailsWithLockReleased) {
    store.delayCreateBy(std::chrono::milliseconds{400L});
    auto lock = acquire(std::chrono::seconds{1L});
    ASSERT_NE(lock.get(), nullptr);
    std::this_thread::sleep_for(std::chrono::milliseconds{400L});
    ASSERT_TRUE(lock->isAcquired());
    store.delayReplaceBy(std::chrono::milliseconds{400L});
    const auto acquiredAt = lock->timeAcquired();
    auto r = client.renew(*lock);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::LockReleased);
    EXPECT_EQ(r.error().cause.get(), nullptr);
    EXPECT_EQ(lock->timeAcquired(), acquiredAt);
    EXPECT_FALSE(lock->isAcquired());
    EXPECT_EQ(store.replaces.load(), 1);
}

TEST_F(RenewTest, RenewAfterTakeoverFailsWithLockReleased) {
    auto first = acquire(std::chrono::seconds{60L});
    ASSERT_NE(first.get(), nullptr);
    ASSERT_TRUE(store.inner.erase(Key {"shard", "renewed"}, first->versionToken()).has_value());
    auto second = acquire(std::chrono::seconds{60L});
    ASSERT_NE(second.get(), nullptr);
    ASSERT_TRUE(first->isAcquired());
    auto r = client.renew(*first);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::LockReleased);
    ASSERT_NE(r.error().cause.get(), nullptr);
    EXPECT_EQ(r.error().cause->code, ErrorCode::VersionMismatch);
    EXPECT_TRUE(second->isAcquired());
}

TEST_F(RenewTest, RenewAfterStoreDropsItemFailsWithLockReleased) {
    auto lock = acquire(std::chrono::seconds{60L});
    ASSERT_NE(lock.get(), nullptr);
    ASSERT_TRUE(store.inner.erase(Key {"shard", "renewed"}, lock->versionToken()).has_value());
    auto r = client.renew(*lock);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::LockReleased);
    ASSERT_NE(r.error().cause.get(), nullptr);
    EXPECT_EQ(r.error().cause->code, ErrorCode::KeyNotFound);
}

TEST_F(RenewTest, StoreFailurePropagatesAndKeepsState) {
    auto lock = acquire(std::chrono::seconds{60L});
    ASSERT_NE(lock.get(), nullptr);
    const auto token = lock->versionToken();
    store.failWith(ErrorCode::Timeout);
    auto r = client.renew(*lock);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_EQ(lock->versionToken(), token);
    store.clearFailure();
    EXPECT_TRUE(client.renew(*lock).has_value());
}
