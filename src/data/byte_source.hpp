#pragma once

#include <cstdint>
#include <string>
#include <fstream>
#include <mutex>
#include <filesystem>
#include <format/byte_order.hpp>
#include <format/snapshot_decoder.hpp>

using vizbin::ByteBuffer;
using vizbin::ByteRange;

// Supplies bytes of one snapshot file by absolute range. The decoder never
// touches I/O itself; everything it reads comes through one of these.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Total size of the underlying file in bytes.
    virtual uint64_t size() const = 0;

    // Bytes in [start, end), clamped to size(): a range running past the end
    // returns the bytes that exist. Throws std::invalid_argument if start > end.
    virtual ByteBuffer fetch_range(uint64_t start, uint64_t end) = 0;

    // Short label for log lines ("file:/path", "memory").
    virtual std::string describe() const = 0;

    ByteBuffer fetch(const ByteRange& range) { return fetch_range(range.start, range.end); }
};

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(ByteBuffer data);

    uint64_t size() const override { return data_.size(); }
    ByteBuffer fetch_range(uint64_t start, uint64_t end) override;
    std::string describe() const override { return "memory"; }

private:
    ByteBuffer data_;
};

class FileByteSource : public ByteSource {
public:
    // Throws std::runtime_error if the file cannot be opened.
    explicit FileByteSource(const std::filesystem::path& path);

    uint64_t size() const override { return size_; }
    ByteBuffer fetch_range(uint64_t start, uint64_t end) override;
    std::string describe() const override { return "file:" + path_.string(); }

private:
    std::filesystem::path path_;
    std::ifstream in_;
    uint64_t size_ = 0;
    std::mutex mutex_;      // one read position shared by all callers
};
