/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include <type_traits>

#if (defined(__BYTE_ORDER__) && (__BYTE_ORDER__ == __ORDER_BIG_ENDIAN__)) || (defined(__BIG_ENDIAN__) && __BIG_ENDIAN__)
namespace tempo {
static constexpr bool little_endian = false;
}  // namespace tempo
#else
namespace tempo {
static constexpr bool little_endian = true;
}  // namespace tempo
#endif

namespace tempo {

/**
 * @tparam Type The type of the value to swap. Must be 1, 2, 4 or 8 bytes in size.
 * @param value The value to swap.
 * @return The value with the bytes swapped.
 */
template<typename Type, std::enable_if_t<std::is_integral_v<Type>, bool> = true>
Type swap_bytes(Type value) {
    if constexpr (sizeof(Type) == 1) {
        return value;
    } else if constexpr (sizeof(Type) == 2) {
        return static_cast<Type>(__builtin_bswap16(static_cast<uint16_t>(value)));
    } else if constexpr (sizeof(Type) == 4) {
        return static_cast<Type>(__builtin_bswap32(static_cast<uint32_t>(value)));
    } else {
        static_assert(sizeof(Type) == 8, "Unsupported integer size");
        return static_cast<Type>(__builtin_bswap64(static_cast<uint64_t>(value)));
    }
}

/**
 * Reads a big-endian (network order) value from the given data.
 * @tparam Type The type of the value to read.
 * @param data The data which holds the encoded value.
 * @return The decoded value.
 */
template<typename Type, std::enable_if_t<std::is_integral_v<Type>, bool> = true>
Type read_be(const uint8_t* data) {
    Type value;
    std::memcpy(std::addressof(value), data, sizeof(Type));
    if constexpr (little_endian) {
        return swap_bytes(value);
    } else {
        return value;
    }
}

/**
 * Writes a big-endian (network order) value to the given destination.
 * @tparam Type The type of the value to write.
 * @param dst The destination where the value should be written.
 * @param value The value to write.
 */
template<typename Type, std::enable_if_t<std::is_integral_v<Type>, bool> = true>
void write_be(uint8_t* dst, Type value) {
    if constexpr (little_endian) {
        value = swap_bytes(value);
    }
    std::memcpy(dst, std::addressof(value), sizeof(Type));
}

/**
 * Reads a 48 bit unsigned big-endian value, as used by PTP timestamps.
 * @param data The data which holds the encoded value, at least 6 bytes.
 * @return The decoded value.
 */
inline uint64_t read_be_uint48(const uint8_t* data) {
    return static_cast<uint64_t>(read_be<uint16_t>(data)) << 32 | read_be<uint32_t>(data + 2);
}

/**
 * Writes a 48 bit unsigned big-endian value. The upper 16 bits of value are discarded.
 * @param dst The destination, at least 6 bytes.
 * @param value The value to write.
 */
inline void write_be_uint48(uint8_t* dst, const uint64_t value) {
    write_be<uint16_t>(dst, static_cast<uint16_t>(value >> 32));
    write_be<uint32_t>(dst + 2, static_cast<uint32_t>(value & 0xffffffff));
}

}  // namespace tempo
