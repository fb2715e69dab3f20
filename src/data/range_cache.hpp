#pragma once

#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <data/byte_source.hpp>

// LRU cache over another ByteSource, keyed by the exact (start, end) range.
// A hit moves the range to the front; a miss past capacity evicts the least
// recently used range. Safe to share between threads; concurrent requests for
// the same missing range are served by a single underlying fetch.
class CachedByteSource : public ByteSource {
public:
    // max_entries <= 0 disables caching (every fetch goes to inner).
    CachedByteSource(std::shared_ptr<ByteSource> inner, int max_entries);

    uint64_t size() const override { return inner_->size(); }
    ByteBuffer fetch_range(uint64_t start, uint64_t end) override;
    std::string describe() const override;

    void clear();

    size_t entries() const;
    uint64_t hits() const;
    uint64_t misses() const;
    int capacity() const { return max_entries_; }

private:
    using Key = std::pair<uint64_t, uint64_t>;
    struct Entry {
        Key key;
        ByteBuffer data;
    };

    std::shared_ptr<ByteSource> inner_;
    int max_entries_;

    mutable std::mutex mutex_;
    std::list<Entry> lru_;                              // front = most recent
    std::map<Key, std::list<Entry>::iterator> by_range_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};
