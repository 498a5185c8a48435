/**
 * @file endian.hh
 * @brief Host byte order helpers for the PCM codec
 * @ingroup sdk
 */
#ifndef AUDIOCORE_SDK_ENDIAN_HH
#define AUDIOCORE_SDK_ENDIAN_HH

#include <audiocore/sdk/types.hh>
#include <audiocore/sdk/audiocore_config.h>
#include <cstring>

namespace audiocore {

#if AUDIOCORE_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

inline uint16_t swap16(uint16_t x) {
    return static_cast<uint16_t>((x << 8) | (x >> 8));
}

inline uint32_t swap32(uint32_t x) {
    return ((x << 24) | ((x << 8) & 0x00FF0000) |
            ((x >> 8) & 0x0000FF00) | (x >> 24));
}

inline uint64_t swap64(uint64_t x) {
    return ((x << 56) |
            ((x << 40) & 0x00FF000000000000ULL) |
            ((x << 24) & 0x0000FF0000000000ULL) |
            ((x << 8)  & 0x000000FF00000000ULL) |
            ((x >> 8)  & 0x00000000FF000000ULL) |
            ((x >> 24) & 0x0000000000FF0000ULL) |
            ((x >> 40) & 0x000000000000FF00ULL) |
            (x >> 56));
}

// PCM wire data is little-endian; these convert host <-> wire order
inline uint16_t swap16le(uint16_t x) {
    return is_little_endian ? x : swap16(x);
}

inline uint32_t swap32le(uint32_t x) {
    return is_little_endian ? x : swap32(x);
}

inline uint64_t swap64le(uint64_t x) {
    return is_little_endian ? x : swap64(x);
}

inline void store_le16(uint8_t* dst, uint16_t v) {
    v = swap16le(v);
    std::memcpy(dst, &v, sizeof(v));
}

inline void store_le32(uint8_t* dst, uint32_t v) {
    v = swap32le(v);
    std::memcpy(dst, &v, sizeof(v));
}

inline void store_le64(uint8_t* dst, uint64_t v) {
    v = swap64le(v);
    std::memcpy(dst, &v, sizeof(v));
}

inline uint16_t load_le16(const uint8_t* src) {
    uint16_t v;
    std::memcpy(&v, src, sizeof(v));
    return swap16le(v);
}

inline uint32_t load_le32(const uint8_t* src) {
    uint32_t v;
    std::memcpy(&v, src, sizeof(v));
    return swap32le(v);
}

inline uint64_t load_le64(const uint8_t* src) {
    uint64_t v;
    std::memcpy(&v, src, sizeof(v));
    return swap64le(v);
}

} // namespace audiocore

#endif // AUDIOCORE_SDK_ENDIAN_HH
