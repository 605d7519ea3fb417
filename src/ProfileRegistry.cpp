#include "ProfileRegistry.h"
#include "Logger.h"

DatasetLock::DatasetLock(std::string datasetId, std::shared_ptr<std::mutex> mutex)
    : datasetId_(std::move(datasetId)), mutex_(std::move(mutex)), lock_(*mutex_) {}

DatasetLock& DatasetLock::operator=(DatasetLock&& other) noexcept {
    if (this == &other) return *this;
    // Release our mutex before dropping the last reference to it.
    if (lock_.owns_lock()) lock_.unlock();
    lock_ = std::move(other.lock_);
    mutex_ = std::move(other.mutex_);
    datasetId_ = std::move(other.datasetId_);
    return *this;
}

void DatasetLock::unlock() {
    if (lock_.owns_lock()) lock_.unlock();
}

ProfileRegistry::ProfileRegistry(std::chrono::seconds ttl, std::function<Clock::time_point()> clock)
    : ttl_(ttl), clock_(std::move(clock)) {
    if (!clock_) clock_ = &Clock::now;
}

DatasetLock ProfileRegistry::lockDataset(const std::string& datasetId) {
    std::shared_ptr<std::mutex> mutex;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto& slot = datasetMutexes_[datasetId];
        mutex = slot.lock();
        if (!mutex) {
            mutex = std::make_shared<std::mutex>();
            slot = mutex;
        }
        // Drop ids nobody holds any more.
        for (auto it = datasetMutexes_.begin(); it != datasetMutexes_.end();) {
            if (it->second.expired()) it = datasetMutexes_.erase(it);
            else ++it;
        }
    }
    // Blocking happens outside the registry mutex so other ids stay available.
    return DatasetLock(datasetId, std::move(mutex));
}

bool ProfileRegistry::expired(const Entry& entry, Clock::time_point now) const {
    if (ttl_.count() == 0) return false;
    return now - entry.storedAt >= ttl_;
}

size_t ProfileRegistry::purgeExpiredLocked(Clock::time_point now) {
    size_t dropped = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (expired(it->second, now)) {
            it = entries_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

size_t ProfileRegistry::purgeExpired() {
    std::lock_guard<std::mutex> guard(mutex_);
    return purgeExpiredLocked(clock_());
}

void ProfileRegistry::store(const std::string& datasetId, ProfilePtr profile) {
    std::lock_guard<std::mutex> guard(mutex_);
    const Clock::time_point now = clock_();
    purgeExpiredLocked(now);
    entries_[datasetId] = Entry{std::move(profile), now};
}

ProfileRegistry::ProfilePtr ProfileRegistry::getOrCompute(const std::string& datasetId,
                                                          const std::function<DatasetProfile()>& compute) {
    if (ProfilePtr hit = get(datasetId)) return hit;

    DatasetLock lock = lockDataset(datasetId);
    // Another caller may have finished while we waited.
    if (ProfilePtr hit = get(datasetId)) return hit;

    Logger::debug("Registry", "computing profile for '" + datasetId + "'");
    ProfilePtr computed = std::make_shared<const DatasetProfile>(compute());
    store(datasetId, computed);
    return computed;
}

void ProfileRegistry::put(const std::string& datasetId, DatasetProfile profile) {
    DatasetLock lock = lockDataset(datasetId);
    store(datasetId, std::make_shared<const DatasetProfile>(std::move(profile)));
}

ProfileRegistry::ProfilePtr ProfileRegistry::get(const std::string& datasetId) const {
    std::lock_guard<std::mutex> guard(mutex_);
    const auto it = entries_.find(datasetId);
    if (it == entries_.end()) return nullptr;
    if (expired(it->second, clock_())) return nullptr;
    return it->second.profile;
}

bool ProfileRegistry::erase(const std::string& datasetId) {
    DatasetLock lock = lockDataset(datasetId);
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_.erase(datasetId) > 0;
}

void ProfileRegistry::clear() {
    std::lock_guard<std::mutex> guard(mutex_);
    entries_.clear();
}

size_t ProfileRegistry::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    const Clock::time_point now = clock_();
    size_t live = 0;
    for (const auto& [id, entry] : entries_) {
        if (!expired(entry, now)) ++live;
    }
    return live;
}
