#include "byte_source.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

static void check_range(uint64_t start, uint64_t end) {
    if (start > end) {
        throw std::invalid_argument(fmt::format("Invalid byte range [{}, {})", start, end));
    }
}

MemoryByteSource::MemoryByteSource(ByteBuffer data) : data_(std::move(data)) {}

ByteBuffer MemoryByteSource::fetch_range(uint64_t start, uint64_t end) {
    check_range(start, end);
    uint64_t size = data_.size();
    uint64_t s = std::min(start, size);
    uint64_t e = std::min(end, size);
    return ByteBuffer(data_.begin() + s, data_.begin() + e);
}

FileByteSource::FileByteSource(const fs::path& path)
    : path_(path), in_(path, std::ios::binary) {
    if (!in_) {
        throw std::runtime_error("Failed to open snapshot file: " + path.string());
    }
    in_.seekg(0, std::ios::end);
    auto end = in_.tellg();
    if (end < 0) {
        throw std::runtime_error("Failed to size snapshot file: " + path.string());
    }
    size_ = static_cast<uint64_t>(end);
}

ByteBuffer FileByteSource::fetch_range(uint64_t start, uint64_t end) {
    check_range(start, end);
    uint64_t s = std::min(start, size_);
    uint64_t e = std::min(end, size_);

    ByteBuffer out(static_cast<size_t>(e - s));
    if (out.empty()) return out;

    std::lock_guard<std::mutex> lock(mutex_);
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(s));
    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    auto got = in_.gcount();
    if (got < 0 || static_cast<uint64_t>(got) != out.size()) {
        throw std::runtime_error(fmt::format("Short read from {}: wanted {} bytes at {}, got {}",
                                             path_.string(), out.size(), s, got));
    }
    return out;
}
