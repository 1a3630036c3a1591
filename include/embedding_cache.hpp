#pragma once

#include <cstddef>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ragcore {

/**
 * @brief Bounded least-recently-used store of vectors returned by a remote
 * embedding model, keyed by (model, text).
 *
 * A model's output for a given text never changes, so entries do not expire;
 * they only leave when capacity is exceeded. Capacity 0 disables caching.
 */
class EmbeddingCache {
public:
    explicit EmbeddingCache(size_t capacity = 1000) : capacity_(capacity) {}

    std::optional<std::vector<float>> get(const std::string& model, const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(Key{model, text});
        if (it == entries_.end()) {
            ++misses_;
            return std::nullopt;
        }
        recency_.splice(recency_.begin(), recency_, it->second.recency);
        ++hits_;
        return it->second.embedding;
    }

    void put(const std::string& model, const std::string& text, std::vector<float> embedding) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity_ == 0) return;

        Key key{model, text};
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.embedding = std::move(embedding);
            recency_.splice(recency_.begin(), recency_, it->second.recency);
            return;
        }

        while (entries_.size() >= capacity_) {
            entries_.erase(recency_.back());
            recency_.pop_back();
        }
        recency_.push_front(key);
        entries_.emplace(std::move(key), Entry{std::move(embedding), recency_.begin()});
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        recency_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t capacity() const { return capacity_; }

    size_t hits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

    size_t misses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return misses_;
    }

private:
    using Key = std::pair<std::string, std::string>;

    struct Entry {
        std::vector<float> embedding;
        std::list<Key>::iterator recency;
    };

    size_t capacity_;
    std::list<Key> recency_;  // front is most recent
    std::map<Key, Entry> entries_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    mutable std::mutex mutex_;
};

} // namespace ragcore
