#ifndef FAULTY_LEASE_STORE_H
#define FAULTY_LEASE_STORE_H

#include <atomic>
#include <chrono>
#include <expected>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "storage/InMemoryLeaseStore.hpp"
#include "storage/LeaseStore.hpp"

// Counts calls into an InMemoryLeaseStore, can fail the next ones with a chosen code,
// and can stall creates or replaces before they reach the store.
class FaultyLeaseStore : public zlease::LeaseStore {
public:
    explicit FaultyLeaseStore(zlease::ConsistencyLevel account = zlease::ConsistencyLevel::Strong,
                              std::optional<zlease::ConsistencyLevel> client = std::nullopt)
        : inner {account, client} {}

    std::expected<zlease::VersionToken, zlease::Error> create(const zlease::Key& key, const zlease::LeaseItem& item) override {
        ++creates;
        std::this_thread::sleep_for(createDelay.load());
        if (auto e = injected(); e.has_value()) {
            return std::unexpected {e.value()};
        }
        return inner.create(key, item);
    }

    std::expected<zlease::VersionToken, zlease::Error> replace(const zlease::Key& key, const zlease::LeaseItem& item, const zlease::VersionToken& expected) override {
        ++replaces;
        std::this_thread::sleep_for(replaceDelay.load());
        if (auto e = injected(); e.has_value()) {
            return std::unexpected {e.value()};
        }
        return inner.replace(key, item, expected);
    }

    std::expected<std::monostate, zlease::Error> erase(const zlease::Key& key, const zlease::VersionToken& expected) override {
        ++erases;
        if (auto e = injected(); e.has_value()) {
            return std::unexpected {e.value()};
        }
        return inner.erase(key, expected);
    }

    std::expected<zlease::ConsistencyLevel, zlease::Error> consistencyLevel() const override {
        return inner.consistencyLevel();
    }

    std::optional<zlease::ConsistencyLevel> clientConsistencyLevel() const override {
        return inner.clientConsistencyLevel();
    }

    // Fails every following write until clearFailure.
    void failWith(zlease::ErrorCode code) {
        const std::lock_guard lock {m};
        failure = code;
    }

    void clearFailure() {
        const std::lock_guard lock {m};
        failure.reset();
    }

    void delayCreateBy(std::chrono::milliseconds d) {
        createDelay = d;
    }

    void delayReplaceBy(std::chrono::milliseconds d) {
        replaceDelay = d;
    }

    zlease::InMemoryLeaseStore inner;
    std::atomic<int> creates {0};
    std::atomic<int> replaces {0};
    std::atomic<int> erases {0};
private:
    std::optional<zlease::Error> injected() {
        const std::lock_guard lock {m};
        if (failure.has_value()) {
            return zlease::Error {failure.value(), "injected"};
        }
        return std::nullopt;
    }
    std::mutex m;
    std::optional<zlease::ErrorCode> failure;
    std::atomic<std::chrono::milliseconds> createDelay {std::chrono::milliseconds::zero()};
    std::atomic<std::chrono::milliseconds> replaceDelay {std::chrono::milliseconds::zero()};
};

#endif // FAULTY_LEASE_STORE_H
