#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace docmap {

/// Source artifacts a cached value depends on.
using watch_list = std::set<std::string>;

// ============================================================================
// metadata_cache - keyed cache invalidated by changes to watched sources
//
// A source is either a file path (its modification time is recorded when the
// value is cached) or an opaque name that callers signal with notify_changed().
// ============================================================================

class metadata_cache {
public:
    using listener_t = std::function<void(const std::string& key)>;
    using listener_id = uint64_t;

    metadata_cache() = default;
    metadata_cache(const metadata_cache&) = delete;
    metadata_cache& operator=(const metadata_cache&) = delete;

    /// Returns the cached value for `key` unless a watched source changed since
    /// it was stored. Otherwise runs `producer`, which fills in its watch list,
    /// and stores the result. The producer runs without the cache lock held, so
    /// it may itself call cached() for other keys.
    template<typename T>
    std::shared_ptr<T> cached(const std::string& key,
                              const std::function<std::shared_ptr<T>(watch_list&)>& producer) {
        if (auto hit = lookup(key)) {
            return std::static_pointer_cast<T>(hit);
        }
        watch_list sources;
        std::shared_ptr<T> produced = producer(sources);
        store(key, produced, sources);
        return produced;
    }

    bool contains(const std::string& key) const;

    /// Drops every entry watching `source`.
    void notify_changed(const std::string& source);

    /// Re-stats every watched file and drops entries whose sources changed.
    /// Returns the number of invalidated entries.
    size_t check_sources();

    void invalidate(const std::string& key);
    void clear();

    listener_id on_invalidate(listener_t listener);
    void remove_listener(listener_id id);

private:
    using stamp_t = std::optional<std::filesystem::file_time_type>;

    struct entry {
        std::shared_ptr<void> value;
        std::map<std::string, stamp_t> sources;
    };

    static stamp_t stamp_of(const std::string& source);
    static bool is_stale(const entry& e);

    std::shared_ptr<void> lookup(const std::string& key);
    void store(const std::string& key, std::shared_ptr<void> value, const watch_list& sources);
    void notify(const std::vector<std::string>& keys);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, entry> entries_;

    std::mutex listeners_mutex_;
    std::map<listener_id, listener_t> listeners_;
    listener_id next_listener_ = 1;
};

} // namespace docmap

#endif // __cplusplus
