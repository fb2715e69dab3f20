#include "range_cache.hpp"
#include <fmt/format.h>
#include <stdexcept>

CachedByteSource::CachedByteSource(std::shared_ptr<ByteSource> inner, int max_entries)
    : inner_(std::move(inner)), max_entries_(max_entries) {
    if (!inner_) throw std::invalid_argument("CachedByteSource needs an inner source");
}

ByteBuffer CachedByteSource::fetch_range(uint64_t start, uint64_t end) {
    if (start > end) {
        throw std::invalid_argument(fmt::format("Invalid byte range [{}, {})", start, end));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (max_entries_ <= 0) {
        misses_++;
        return inner_->fetch_range(start, end);
    }

    Key key{start, end};
    auto it = by_range_.find(key);
    if (it != by_range_.end()) {
        hits_++;
        lru_.splice(lru_.begin(), lru_, it->second);
        return it->second->data;
    }

    misses_++;
    ByteBuffer data = inner_->fetch_range(start, end);

    if (static_cast<int>(lru_.size()) >= max_entries_) {
        by_range_.erase(lru_.back().key);
        lru_.pop_back();
    }
    lru_.push_front(Entry{key, data});
    by_range_[key] = lru_.begin();

    return data;
}

std::string CachedByteSource::describe() const {
    return fmt::format("cached({})", inner_->describe());
}

void CachedByteSource::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    by_range_.clear();
}

size_t CachedByteSource::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

uint64_t CachedByteSource::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

uint64_t CachedByteSource::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}
