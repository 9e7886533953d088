/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities for chunk framing
 * @author Igor
 * @date 12/08/2025
 */

#pragma once

#include <cstddef>
#include <cstring>
#include <pngchunk/endian.hh>

namespace pngchunk {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) for reading/writing multi-byte values
     */
    enum class byte_order {
        little, ///< Little-endian
        big     ///< Big-endian (network order, used by every PNG integer field)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     *
     * This is used to determine if byte swapping is needed when reading
     * or writing multi-byte values.
     */
    constexpr bool byte_order_native(byte_order bo) noexcept {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }

    /**
     * @brief Decode an integer stored at @p src in the given byte order
     * @tparam T Integral type of 1, 2 or 4 bytes
     * @param src Pointer to at least sizeof(T) bytes
     * @param bo Byte order of the stored value
     */
    template<typename T>
    T load(const void* src, byte_order bo) noexcept {
        T value;
        std::memcpy(&value, src, sizeof(T));
        if constexpr (sizeof(T) > 1) {
            if (!byte_order_native(bo)) {
                value = swap_byte_order(value);
            }
        }
        return value;
    }

    /**
     * @brief Encode @p value at @p dst in the given byte order
     * @tparam T Integral type of 1, 2 or 4 bytes
     * @param dst Pointer to at least sizeof(T) writable bytes
     * @param value Value to store
     * @param bo Byte order to store in
     */
    template<typename T>
    void store(void* dst, T value, byte_order bo) noexcept {
        if constexpr (sizeof(T) > 1) {
            if (!byte_order_native(bo)) {
                value = swap_byte_order(value);
            }
        }
        std::memcpy(dst, &value, sizeof(T));
    }
}
