#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace pagekv {

// ── Little-endian encoding helpers ──────────────────────────────────────────
//
// Append-style writers grow a byte vector; store/load variants operate on a
// fixed buffer (pages) and never check bounds, callers do.

inline void write_u8(std::vector<uint8_t>& buf, uint8_t v) {
    buf.push_back(v);
}

inline void write_u16_le(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

inline void write_u32_le(std::vector<uint8_t>& buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

inline void write_u64_le(std::vector<uint8_t>& buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

inline void append_raw(std::vector<uint8_t>& buf, std::string_view bytes) {
    const auto* p = reinterpret_cast<const uint8_t*>(bytes.data());
    buf.insert(buf.end(), p, p + bytes.size());
}

inline void store_u16_le(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
}

inline void store_u32_le(uint8_t* p, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<uint8_t>(v >> (i * 8));
    }
}

inline void store_u64_le(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<uint8_t>(v >> (i * 8));
    }
}

inline uint16_t load_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0]) |
           static_cast<uint16_t>(static_cast<uint16_t>(p[1]) << 8);
}

inline uint32_t load_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline uint64_t load_u64_le(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(p[i]) << (i * 8);
    }
    return v;
}

// Bounds-checked cursor reads: return false if not enough data.
inline bool read_u8(const uint8_t*& ptr, const uint8_t* end, uint8_t& out) {
    if (end - ptr < 1) return false;
    out = *ptr++;
    return true;
}

inline bool read_u32_le(const uint8_t*& ptr, const uint8_t* end, uint32_t& out) {
    if (end - ptr < 4) return false;
    out = load_u32_le(ptr);
    ptr += 4;
    return true;
}

inline bool read_u64_le(const uint8_t*& ptr, const uint8_t* end, uint64_t& out) {
    if (end - ptr < 8) return false;
    out = load_u64_le(ptr);
    ptr += 8;
    return true;
}

} // namespace pagekv
