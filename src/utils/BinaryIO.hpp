/**
 * @file BinaryIO.hpp
 * @brief Central utility functions for binary I/O.
 *
 * This file provides a single source of truth for the low-level
 * little-endian conversions used by both the buffered fast paths and
 * the byte-by-byte fallback paths of the reader, so the two always
 * agree bit for bit.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include "blobio/Errors.hpp"

namespace blobio
{
namespace utils
{
    /// Encoded width limits of the base-128 varints.
    inline constexpr size_t kMaxVIntBytes = 5;
    inline constexpr size_t kMaxVLongBytes = 9;

    /**
     * @brief Reads a 16-bit little-endian short from a byte buffer.
     * @param b A pointer to at least 2 bytes of data.
     * @return The platform-native int16_t.
     */
    inline int16_t readLeShort(const uint8_t* b)
    {
        return static_cast<int16_t>(
            static_cast<uint16_t>(b[0]) |
            (static_cast<uint16_t>(b[1]) << 8)
        );
    }

    /**
     * @brief Reads a 32-bit little-endian integer from a byte buffer.
     * @param b A pointer to at least 4 bytes of data.
     * @return The platform-native int32_t.
     */
    inline int32_t readLeInt(const uint8_t* b)
    {
        return static_cast<int32_t>(
            static_cast<uint32_t>(b[0]) |
            (static_cast<uint32_t>(b[1]) << 8) |
            (static_cast<uint32_t>(b[2]) << 16) |
            (static_cast<uint32_t>(b[3]) << 24)
        );
    }

    /**
     * @brief Reads a 64-bit little-endian long from a byte buffer.
     * @param b A pointer to at least 8 bytes of data.
     * @return The platform-native int64_t.
     */
    inline int64_t readLeLong(const uint8_t* b)
    {
        return static_cast<int64_t>(
            static_cast<uint64_t>(b[0]) |
            (static_cast<uint64_t>(b[1]) << 8) |
            (static_cast<uint64_t>(b[2]) << 16) |
            (static_cast<uint64_t>(b[3]) << 24) |
            (static_cast<uint64_t>(b[4]) << 32) |
            (static_cast<uint64_t>(b[5]) << 40) |
            (static_cast<uint64_t>(b[6]) << 48) |
            (static_cast<uint64_t>(b[7]) << 56)
        );
    }

    /**
     * @brief True if a varint byte carries the continuation flag.
     */
    inline bool hasMore(uint8_t b)
    {
        return (b & 0x80) != 0;
    }

    /**
     * @brief Decodes a vInt from a byte source.
     *
     * The same routine serves the in-window fast path and the
     * refill-aware fallback, so both decode identically.
     *
     * @param next Callable returning the next uint8_t of the encoding.
     * @throws MalformedVarintError if a 5th byte uses bits 4-7.
     */
    template <typename NextByte>
    int32_t decodeVInt(NextByte&& next)
    {
        uint8_t b = next();
        if (!hasMore(b)) return b;
        uint32_t i = b & 0x7F;
        for (unsigned shift = 7; shift <= 21; shift += 7)
        {
            b = next();
            i |= static_cast<uint32_t>(b & 0x7F) << shift;
            if (!hasMore(b)) return static_cast<int32_t>(i);
        }
        b = next();
        // Only the low nibble of the 5th byte fits in 32 bits.
        i |= static_cast<uint32_t>(b & 0x0F) << 28;
        if ((b & 0xF0) == 0) return static_cast<int32_t>(i);
        throw MalformedVarintError("Invalid vInt detected (too many bits)");
    }

    /**
     * @brief Decodes a non-negative vLong from a byte source.
     * @param next Callable returning the next uint8_t of the encoding.
     * @throws MalformedVarintError if the 9th byte has its continuation bit set.
     */
    template <typename NextByte>
    int64_t decodeVLong(NextByte&& next)
    {
        uint8_t b = next();
        if (!hasMore(b)) return b;
        uint64_t i = b & 0x7F;
        for (unsigned shift = 7; shift <= 56; shift += 7)
        {
            b = next();
            i |= static_cast<uint64_t>(b & 0x7F) << shift;
            if (!hasMore(b)) return static_cast<int64_t>(i);
        }
        throw MalformedVarintError("Invalid vLong detected (negative values disallowed)");
    }

} // namespace utils
} // namespace blobio
