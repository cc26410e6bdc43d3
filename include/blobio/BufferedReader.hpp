/**
 * @file BufferedReader.hpp
 * @brief The main user-facing API: a buffered, random-access reader.
 *
 * A BufferedReader keeps one fixed-size window over a BackingStore and
 * decodes little-endian integers and base-128 varints from it. It
 * supports sequential reads, positional reads that reuse the window
 * where possible, seeking and cheap cloning.
 */

#pragma once

#include "BackingStore.hpp"
#include "BufferSizes.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace blobio
{
    /**
     * @class BufferedReader
     * @brief Windowed reader over a BackingStore.
     *
     * A reader is not thread-safe. Give each concurrent consumer its own
     * clone(); clones share the store's underlying handle but nothing else.
     *
     * The window memory is allocated on the first read, so creating a
     * reader (or a clone) that is never read from costs no buffer.
     */
    class BufferedReader
    {
    public:
        /**
         * @brief Creates a reader over a store cursor.
         *
         * The store's cursor is moved to offset 0.
         *
         * @param store The cursor to read through. Must not be null.
         * @param bufferSize Window size in bytes.
         * @throws InvalidConfigurationError if bufferSize < kMinBufferSize.
         * @throws std::invalid_argument if store is null.
         */
        explicit BufferedReader(std::unique_ptr<BackingStore> store,
                                int32_t bufferSize = kBufferSize);

        /**
         * @brief Creates a reader sized for an access pattern.
         * @see bufferSizeFor
         */
        BufferedReader(std::unique_ptr<BackingStore> store, IOContext context);

        ~BufferedReader();

        BufferedReader(BufferedReader&&) noexcept;
        BufferedReader& operator=(BufferedReader&&) noexcept;

        BufferedReader(const BufferedReader&) = delete;
        BufferedReader& operator=(const BufferedReader&) = delete;

        // --- Sequential Reads ---

        /**
         * @brief Reads one byte.
         * @throws EndOfDataError at the end of the store.
         */
        uint8_t readByte();

        /**
         * @brief Reads @p length bytes into @p dest starting at @p offset.
         *
         * Short remainders go through the window. Large ones, or any
         * remainder when @p useBuffer is false, are fetched directly into
         * @p dest and leave the window empty.
         *
         * @throws EndOfDataError if the store ends first. Bytes copied
         * before the shortfall was found stay in @p dest.
         */
        void readBytes(uint8_t* dest, int32_t offset, int32_t length, bool useBuffer = true);

        /** @brief Reads a 2-byte little-endian short. */
        int16_t readShort();

        /** @brief Reads a 4-byte little-endian integer. */
        int32_t readInt();

        /** @brief Reads an 8-byte little-endian long. */
        int64_t readLong();

        /**
         * @brief Reads a variable-length int of 1 to 5 bytes.
         * @throws MalformedVarintError if the 5th byte has any of bits 4-7 set.
         */
        int32_t readVInt();

        /**
         * @brief Reads a variable-length, non-negative long of 1 to 9 bytes.
         * @throws MalformedVarintError if a 9th byte still asks for more.
         */
        int64_t readVLong();

        // --- Positional Reads ---
        // These reuse the current window when it covers the requested
        // bytes and otherwise reload it around pos.

        uint8_t readByte(int64_t pos);
        int16_t readShort(int64_t pos);
        int32_t readInt(int64_t pos);
        int64_t readLong(int64_t pos);

        // --- Cursor ---

        /**
         * @brief Gets the current absolute offset.
         */
        int64_t getPosition() const;

        /**
         * @brief Moves to an absolute offset.
         *
         * Offsets inside the window are reached without I/O. Anything
         * else repositions the store and defers the fetch to the next read.
         *
         * @throws std::invalid_argument if pos is negative.
         */
        void seek(int64_t pos);

        // --- Lifecycle ---

        /**
         * @brief Creates an independent reader at the current position.
         *
         * The clone reads through a new cursor over the same store handle
         * and owns an empty window of the same size.
         */
        BufferedReader clone() const;

        int32_t getBufferSize() const;

        /**
         * @brief Total length of the backing store in bytes.
         */
        int64_t length() const;

        /**
         * @brief Description of the backing store.
         */
        std::string toString() const;

    private:
        /**
         * @struct Impl
         * @brief Private implementation (PIMPL) idiom.
         */
        struct Impl;
        std::unique_ptr<Impl> m_impl;
    };

} // namespace blobio
