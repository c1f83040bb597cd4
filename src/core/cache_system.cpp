// EN: Implementation of the CacheSystem class. In-memory TTL cache with LRU eviction and zlib storage.
// FR: Implémentation de la classe CacheSystem. Cache mémoire TTL avec éviction LRU et stockage zlib.

#include "core/cache_system.hpp"
#include "infrastructure/logging/logger.hpp"

#include <zlib.h>

#include <cstring>

namespace LRP {

CacheSystem::CacheSystem(const CacheConfig& config) : config_(config) {}

CacheSystem::~CacheSystem() {
    stopCleanupThread();
}

std::optional<std::string> CacheSystem::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.total_requests++;

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        stats_.cache_misses++;
        triggerEvent("miss", key);
        return std::nullopt;
    }

    const auto now = Clock::now();
    if (isExpired(it->second, now)) {
        // EN: Lazy expiry: the entry is reclaimed on the read that observes it.
        // FR: Expiration paresseuse : l'entrée est récupérée par la lecture qui l'observe.
        cache_.erase(it);
        stats_.cache_misses++;
        stats_.expirations++;
        triggerEvent("expired", key);
        return std::nullopt;
    }

    CacheEntry& entry = it->second;
    std::string value;
    if (entry.compressed) {
        try {
            value = decompress(entry.value);
        } catch (const CacheError&) {
            cache_.erase(it);
            stats_.cache_misses++;
            throw;
        }
    } else {
        value = entry.value;
    }

    entry.last_accessed = now;
    entry.access_count++;
    stats_.cache_hits++;
    triggerEvent("hit", key);
    return value;
}

void CacheSystem::set(const std::string& key, const std::string& value,
                      std::optional<std::chrono::milliseconds> ttl) {
    CacheEntry entry;
    if (config_.enable_compression && value.size() >= config_.compression_threshold) {
        entry.value = compress(value);
        entry.compressed = true;
    } else {
        entry.value = value;
    }

    const auto now = Clock::now();
    entry.last_accessed = now;
    if (ttl) {
        entry.expires_at = now + *ttl;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        it->second = std::move(entry);
        return;
    }

    if (config_.max_entries > 0 && cache_.size() >= config_.max_entries) {
        // EN: Reclaim expired entries first; evict only if still full.
        // FR: Récupère d'abord les entrées expirées ; évince seulement si encore plein.
        cleanupUnlocked(now);
        if (cache_.size() >= config_.max_entries) {
            evictLRU();
        }
    }
    cache_.emplace(key, std::move(entry));
}

bool CacheSystem::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    const bool live = !isExpired(it->second, Clock::now());
    cache_.erase(it);
    return live;
}

bool CacheSystem::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    if (isExpired(it->second, Clock::now())) {
        cache_.erase(it);
        stats_.expirations++;
        triggerEvent("expired", key);
        return false;
    }
    return true;
}

void CacheSystem::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t count = cache_.size();
    cache_.clear();
    LOG_DEBUG("cache", "Cleared " + std::to_string(count) + " entries");
}

size_t CacheSystem::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    return cleanupUnlocked(Clock::now());
}

size_t CacheSystem::cleanupUnlocked(Clock::time_point now) {
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (isExpired(it->second, now)) {
            it = cache_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    stats_.expirations += removed;
    return removed;
}

size_t CacheSystem::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

CacheStats CacheSystem::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats = stats_;
    stats.entries_count = cache_.size();
    stats.memory_usage_bytes = 0;
    for (const auto& [key, entry] : cache_) {
        stats.memory_usage_bytes += key.size() + entry.value.size() + sizeof(CacheEntry);
    }
    stats.hit_ratio = stats.total_requests > 0
        ? static_cast<double>(stats.cache_hits) / static_cast<double>(stats.total_requests)
        : 0.0;
    return stats;
}

void CacheSystem::setEventCallback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    event_callback_ = std::move(callback);
}

void CacheSystem::enableAutoCleanup(bool enabled, std::chrono::milliseconds interval) {
    stopCleanupThread();
    if (!enabled) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        stop_cleanup_ = false;
    }
    cleanup_thread_ = std::thread(&CacheSystem::cleanupLoop, this, interval);
    LOG_DEBUG("cache", "Auto cleanup enabled every " + std::to_string(interval.count()) + "ms");
}

bool CacheSystem::isExpired(const CacheEntry& entry, Clock::time_point now) const {
    return entry.expires_at && now > *entry.expires_at;
}

// EN: Evict least recently used entry when cache is full.
// FR: Évince l'entrée la moins récemment utilisée quand le cache est plein.
void CacheSystem::evictLRU() {
    if (cache_.empty()) {
        return;
    }

    auto lru_it = cache_.begin();
    for (auto it = cache_.begin(); it != cache_.end(); ++it) {
        if (it->second.last_accessed < lru_it->second.last_accessed) {
            lru_it = it;
        }
    }

    const std::string evicted_key = lru_it->first;
    cache_.erase(lru_it);
    stats_.evictions++;
    triggerEvent("evicted", evicted_key);
}

void CacheSystem::triggerEvent(const std::string& event, const std::string& key) {
    if (event_callback_) {
        event_callback_(event, key);
    }
}

std::string CacheSystem::compress(const std::string& content) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    if (deflateInit(&zs, Z_DEFAULT_COMPRESSION) != Z_OK) {
        throw CacheError("deflateInit failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(content.data()));
    zs.avail_in = static_cast<uInt>(content.size());

    std::string compressed;
    char buffer[32768];
    int result = Z_OK;

    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);

        result = deflate(&zs, Z_FINISH);
        if (result == Z_STREAM_ERROR) {
            deflateEnd(&zs);
            throw CacheError("deflate failed");
        }
        compressed.append(buffer, sizeof(buffer) - zs.avail_out);
    } while (result != Z_STREAM_END);

    deflateEnd(&zs);
    return compressed;
}

std::string CacheSystem::decompress(const std::string& compressed_content) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    if (inflateInit(&zs) != Z_OK) {
        throw CacheError("inflateInit failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed_content.data()));
    zs.avail_in = static_cast<uInt>(compressed_content.size());

    std::string decompressed;
    char buffer[32768];
    int result = Z_OK;

    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);

        result = inflate(&zs, Z_NO_FLUSH);
        if (result == Z_STREAM_ERROR || result == Z_DATA_ERROR ||
            result == Z_MEM_ERROR || result == Z_NEED_DICT) {
            inflateEnd(&zs);
            throw CacheError("Corrupt cache payload: inflate returned " + std::to_string(result));
        }
        decompressed.append(buffer, sizeof(buffer) - zs.avail_out);
        if (result == Z_BUF_ERROR && zs.avail_in == 0) {
            inflateEnd(&zs);
            throw CacheError("Corrupt cache payload: truncated stream");
        }
    } while (result != Z_STREAM_END);

    inflateEnd(&zs);
    return decompressed;
}

void CacheSystem::stopCleanupThread() {
    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        stop_cleanup_ = true;
    }
    cleanup_condition_.notify_all();
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }
}

void CacheSystem::cleanupLoop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(cleanup_mutex_);
    while (!stop_cleanup_) {
        if (cleanup_condition_.wait_for(lock, interval, [this] { return stop_cleanup_; })) {
            break;
        }
        lock.unlock();
        const size_t removed = cleanup();
        if (removed > 0) {
            LOG_DEBUG("cache", "Background cleanup removed " + std::to_string(removed) + " entries");
        }
        lock.lock();
    }
}

} // namespace LRP
