#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>

namespace LRP {

// EN: Storage-layer fault (e.g. a payload that fails to decompress). Callers treat it as a miss.
// FR: Défaut de la couche de stockage (ex. payload non décompressable). Traité comme un miss.
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Key/value store with optional per-entry expiry. Every operation is atomic per key.
// FR: Stockage clé/valeur avec expiration optionnelle par entrée. Chaque opération est atomique par clé.
class Cache {
public:
    virtual ~Cache() = default;

    // EN: Value for key, or nullopt if absent or expired. May throw CacheError.
    // FR: Valeur pour la clé, ou nullopt si absente ou expirée. Peut lancer CacheError.
    virtual std::optional<std::string> get(const std::string& key) = 0;

    // EN: Store value; a missing ttl means the entry never expires.
    // FR: Stocke la valeur ; sans ttl l'entrée n'expire jamais.
    virtual void set(const std::string& key, const std::string& value,
                     std::optional<std::chrono::milliseconds> ttl = std::nullopt) = 0;

    // EN: Remove key; returns true if a live entry was removed.
    // FR: Supprime la clé ; retourne true si une entrée valide a été supprimée.
    virtual bool remove(const std::string& key) = 0;

    // EN: Same expiry rule as get().
    // FR: Même règle d'expiration que get().
    virtual bool exists(const std::string& key) = 0;

    virtual void clear() = 0;
};

// EN: Configuration for cache limits and storage.
// FR: Configuration des limites et du stockage du cache.
struct CacheConfig {
    // EN: Maximum number of entries before LRU eviction, 0 means unbounded.
    // FR: Nombre maximum d'entrées avant éviction LRU, 0 pour illimité.
    size_t max_entries = 10000;

    // EN: Compress values with zlib when they reach compression_threshold bytes.
    // FR: Compresse les valeurs avec zlib à partir de compression_threshold octets.
    bool enable_compression = false;
    size_t compression_threshold = 1024;
};

// EN: Statistics for cache monitoring.
// FR: Statistiques pour le monitoring du cache.
struct CacheStats {
    size_t total_requests = 0;
    size_t cache_hits = 0;
    size_t cache_misses = 0;
    size_t expirations = 0;
    size_t evictions = 0;
    size_t entries_count = 0;
    size_t memory_usage_bytes = 0;
    double hit_ratio = 0.0;
};

// EN: Thread-safe in-memory cache with lazy TTL expiry, LRU eviction and optional compression.
// FR: Cache mémoire thread-safe avec expiration TTL paresseuse, éviction LRU et compression optionnelle.
class CacheSystem : public Cache {
public:
    using EventCallback = std::function<void(const std::string& event, const std::string& key)>;

    explicit CacheSystem(const CacheConfig& config = CacheConfig{});
    ~CacheSystem() override;

    CacheSystem(const CacheSystem&) = delete;
    CacheSystem& operator=(const CacheSystem&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt) override;
    bool remove(const std::string& key) override;
    bool exists(const std::string& key) override;
    void clear() override;

    // EN: Remove every expired entry now; returns how many were removed.
    // FR: Supprime immédiatement les entrées expirées ; retourne leur nombre.
    size_t cleanup();

    // EN: Number of stored entries, expired ones included until they are reclaimed.
    // FR: Nombre d'entrées stockées, expirées incluses tant qu'elles ne sont pas récupérées.
    size_t size() const;

    CacheStats getStats() const;

    const CacheConfig& getConfig() const { return config_; }

    // EN: Events: "hit", "miss", "expired", "evicted". Invoked under the cache lock, so the
    //     callback must not call back into this cache.
    // FR: Événements : "hit", "miss", "expired", "evicted". Appelé sous le verrou du cache,
    //     le callback ne doit pas rappeler ce cache.
    void setEventCallback(EventCallback callback);

    // EN: Periodic background cleanup of expired entries.
    // FR: Nettoyage périodique en arrière-plan des entrées expirées.
    void enableAutoCleanup(bool enabled, std::chrono::milliseconds interval = std::chrono::seconds{300});

private:
    using Clock = std::chrono::steady_clock;

    struct CacheEntry {
        std::string value;
        bool compressed = false;
        std::optional<Clock::time_point> expires_at;
        Clock::time_point last_accessed;
        size_t access_count = 0;
    };

    bool isExpired(const CacheEntry& entry, Clock::time_point now) const;
    void evictLRU();
    size_t cleanupUnlocked(Clock::time_point now);
    void triggerEvent(const std::string& event, const std::string& key);

    static std::string compress(const std::string& content);
    static std::string decompress(const std::string& compressed_content);

    void stopCleanupThread();
    void cleanupLoop(std::chrono::milliseconds interval);

    CacheConfig config_;
    std::unordered_map<std::string, CacheEntry> cache_;
    mutable std::mutex mutex_;
    CacheStats stats_;
    EventCallback event_callback_;

    std::thread cleanup_thread_;
    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_condition_;
    bool stop_cleanup_ = false;
};

} // namespace LRP
