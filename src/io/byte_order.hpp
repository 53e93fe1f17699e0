// ============================================================================
// io/byte_order.hpp - Endian-agnostic field access into raw block buffers
// ============================================================================
#pragma once
#include <cstdint>

namespace accelio {
namespace bytes {

inline uint16_t u16le(const uint8_t* p) {
    return uint16_t(p[0] | (uint16_t(p[1]) << 8));
}

inline int16_t i16le(const uint8_t* p) { return int16_t(u16le(p)); }

inline uint32_t u32le(const uint8_t* p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
}

inline void put_u16le(uint8_t* p, uint16_t v) {
    p[0] = uint8_t(v & 0xff);
    p[1] = uint8_t(v >> 8);
}

inline void put_u32le(uint8_t* p, uint32_t v) {
    for (int i = 0; i < 4; ++i) p[i] = uint8_t((v >> (8 * i)) & 0xff);
}

// Sign-extend the low `bits` bits of v.
inline int32_t sign_extend(uint32_t v, int bits) {
    uint32_t m = 1u << (bits - 1);
    v &= (1u << bits) - 1;
    return int32_t(v ^ m) - int32_t(m);
}

} // namespace bytes
} // namespace accelio
