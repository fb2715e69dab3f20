#pragma once

#include <cstdint>
#include <cstring>
#include <cstddef>
#include <vector>
#include <type_traits>

namespace vizbin {

using ByteBuffer = std::vector<uint8_t>;

// ── Little-endian loads ─────────────────────────────────────
// Assembled byte by byte so results do not depend on host byte order.
// Callers guarantee p points at sizeof(T) readable bytes.

template <typename T>
inline T load_le(const uint8_t* p) {
    static_assert(std::is_unsigned<T>::value, "load_le reads unsigned integers");
    T value = 0;
    for (size_t i = 0; i < sizeof(T); i++) {
        value |= static_cast<T>(static_cast<T>(p[i]) << (8 * i));
    }
    return value;
}

inline float load_f32(const uint8_t* p) {
    uint32_t bits = load_le<uint32_t>(p);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

// ── Little-endian stores ────────────────────────────────────

template <typename T>
inline void store_le(uint8_t* p, T value) {
    static_assert(std::is_unsigned<T>::value, "store_le writes unsigned integers");
    for (size_t i = 0; i < sizeof(T); i++) {
        p[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

template <typename T>
inline void append_le(ByteBuffer& out, T value) {
    size_t at = out.size();
    out.resize(at + sizeof(T));
    store_le<T>(out.data() + at, value);
}

inline void append_f32(ByteBuffer& out, float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    append_le<uint32_t>(out, bits);
}

// True if [offset, offset + length) lies inside bytes. Overflow-safe.
inline bool range_fits(const ByteBuffer& bytes, uint64_t offset, uint64_t length) {
    uint64_t size = bytes.size();
    return offset <= size && length <= size - offset;
}

} // namespace vizbin
