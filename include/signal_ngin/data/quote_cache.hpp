// include/signal_ngin/data/quote_cache.hpp
#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Configuration for quote memoization
 */
struct QuoteCacheConfig : public ConfigBase {
    int64_t ttl_ms{5000};
    size_t max_entries{100};

    nlohmann::json to_json() const override {
        return nlohmann::json{{"ttl_ms", ttl_ms}, {"max_entries", max_entries}};
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("ttl_ms"))
            ttl_ms = j.at("ttl_ms").get<int64_t>();
        if (j.contains("max_entries"))
            max_entries = j.at("max_entries").get<size_t>();
    }
};

/**
 * @brief Thread-safe TTL cache with oldest-insert eviction
 *
 * An entry is served while now - stored_at < ttl. Once more than
 * max_entries keys are held, the key inserted first is dropped.
 */
template <typename V>
class QuoteCache {
public:
    using Clock = std::function<Timestamp()>;

    explicit QuoteCache(QuoteCacheConfig config,
                        Clock clock = []() { return std::chrono::system_clock::now(); })
        : config_(std::move(config)), clock_(std::move(clock)) {}

    std::optional<V> get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (clock_() - it->second.stored_at >= std::chrono::milliseconds(config_.ttl_ms)) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void put(const std::string& key, V value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.value = std::move(value);
            it->second.stored_at = clock_();
            return;
        }

        entries_.emplace(key, Entry{std::move(value), clock_()});
        insertion_order_.push_back(key);

        while (entries_.size() > config_.max_entries && !insertion_order_.empty()) {
            entries_.erase(insertion_order_.front());
            insertion_order_.pop_front();
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        insertion_order_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    const QuoteCacheConfig& config() const {
        return config_;
    }

private:
    struct Entry {
        V value;
        Timestamp stored_at;
    };

    QuoteCacheConfig config_;
    Clock clock_;
    std::unordered_map<std::string, Entry> entries_;
    std::deque<std::string> insertion_order_;
    mutable std::mutex mutex_;
};

}  // namespace signal_ngin
