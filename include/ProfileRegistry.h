#pragma once

#include "Profile.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * @brief Exclusive hold on one dataset id, released on destruction.
 * @details Move-only. Holders for different ids never contend.
 */
class DatasetLock {
public:
    DatasetLock(DatasetLock&& other) noexcept = default;
    DatasetLock& operator=(DatasetLock&& other) noexcept;
    DatasetLock(const DatasetLock&) = delete;
    DatasetLock& operator=(const DatasetLock&) = delete;
    ~DatasetLock() = default;

    const std::string& datasetId() const noexcept { return datasetId_; }
    bool ownsLock() const noexcept { return lock_.owns_lock(); }
    void unlock();

private:
    friend class ProfileRegistry;
    DatasetLock(std::string datasetId, std::shared_ptr<std::mutex> mutex);

    std::string datasetId_;
    // Declared before lock_ so the mutex outlives the lock during destruction.
    std::shared_ptr<std::mutex> mutex_;
    std::unique_lock<std::mutex> lock_;
};

/**
 * @brief Thread-safe cache of immutable profiles keyed by dataset id, with optional expiry.
 */
class ProfileRegistry {
public:
    using Clock = std::chrono::steady_clock;
    using ProfilePtr = std::shared_ptr<const DatasetProfile>;

    // ttl of zero disables expiry. clock is injectable for tests.
    explicit ProfileRegistry(std::chrono::seconds ttl = std::chrono::seconds(300),
                             std::function<Clock::time_point()> clock = &Clock::now);

    /**
     * @brief Blocks until the dataset's mutex is held by the returned handle.
     */
    DatasetLock lockDataset(const std::string& datasetId);

    /**
     * @brief Returns the cached profile, computing and storing it on a miss.
     * @details The dataset lock is held while compute runs, so concurrent callers for
     * one id compute once. Exceptions from compute propagate and nothing is stored.
     */
    ProfilePtr getOrCompute(const std::string& datasetId, const std::function<DatasetProfile()>& compute);

    void put(const std::string& datasetId, DatasetProfile profile);
    ProfilePtr get(const std::string& datasetId) const;
    bool erase(const std::string& datasetId);
    void clear();
    size_t size() const;

    // Drops expired entries now; storing a profile also does this. Returns the number dropped.
    size_t purgeExpired();

private:
    struct Entry {
        ProfilePtr profile;
        Clock::time_point storedAt;
    };

    bool expired(const Entry& entry, Clock::time_point now) const;
    void store(const std::string& datasetId, ProfilePtr profile);
    size_t purgeExpiredLocked(Clock::time_point now);

    std::chrono::seconds ttl_;
    std::function<Clock::time_point()> clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<std::string, std::weak_ptr<std::mutex>> datasetMutexes_;
};
