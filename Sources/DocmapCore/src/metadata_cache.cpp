#include "docmap/metadata_cache.hpp"
#include "docmap/log.hpp"

namespace docmap {

metadata_cache::stamp_t metadata_cache::stamp_of(const std::string& source) {
    std::error_code ec;
    if (source.empty() || !std::filesystem::exists(source, ec) || ec) {
        return std::nullopt;
    }
    auto t = std::filesystem::last_write_time(source, ec);
    if (ec) {
        return std::nullopt;
    }
    return t;
}

bool metadata_cache::is_stale(const entry& e) {
    for (const auto& [source, stamp] : e.sources) {
        if (stamp_of(source) != stamp) {
            return true;
        }
    }
    return false;
}

std::shared_ptr<void> metadata_cache::lookup(const std::string& key) {
    bool stale = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return nullptr;
        }
        if (!is_stale(it->second)) {
            return it->second.value;
        }
        entries_.erase(it);
        stale = true;
    }
    if (stale) {
        LOG_DEBUG("cache", "Entry %s is stale", key.c_str());
        notify({key});
    }
    return nullptr;
}

void metadata_cache::store(const std::string& key, std::shared_ptr<void> value,
                           const watch_list& sources) {
    entry e;
    e.value = std::move(value);
    for (const auto& source : sources) {
        e.sources.emplace(source, stamp_of(source));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = std::move(e);
}

bool metadata_cache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key) != 0;
}

void metadata_cache::notify_changed(const std::string& source) {
    std::vector<std::string> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.sources.count(source)) {
                dropped.push_back(it->first);
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }
    LOG_INFO("cache", "Source %s changed, %zu entries invalidated", source.c_str(), dropped.size());
    notify(dropped);
}

size_t metadata_cache::check_sources() {
    std::vector<std::string> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (is_stale(it->second)) {
                dropped.push_back(it->first);
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }
    notify(dropped);
    return dropped.size();
}

void metadata_cache::invalidate(const std::string& key) {
    size_t erased;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        erased = entries_.erase(key);
    }
    if (erased) {
        notify({key});
    }
}

void metadata_cache::clear() {
    std::vector<std::string> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, _] : entries_) {
            dropped.push_back(key);
        }
        entries_.clear();
    }
    notify(dropped);
}

metadata_cache::listener_id metadata_cache::on_invalidate(listener_t listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto id = next_listener_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void metadata_cache::remove_listener(listener_id id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

void metadata_cache::notify(const std::vector<std::string>& keys) {
    if (keys.empty()) return;

    // Copy so listeners can (un)register without deadlocking
    std::vector<listener_t> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [_, l] : listeners_) {
            listeners.push_back(l);
        }
    }
    for (const auto& key : keys) {
        for (const auto& l : listeners) {
            l(key);
        }
    }
}

} // namespace docmap
