/**
 * @file BackingStore.hpp
 * @brief Abstract byte source that a BufferedReader windows over.
 *
 * A BackingStore is a cursor over some externally owned handle (a byte
 * span, a file descriptor, a remote blob). The reader only ever asks
 * it for three things: fill a region from the cursor, move the cursor,
 * and report the total length.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace blobio
{
    /**
     * @class BackingStore
     * @brief Cursor-addressed byte source.
     *
     * Implementations never own the lifetime of the underlying handle
     * beyond what clone() needs to share it. Calls block until the data
     * is available or an error is thrown.
     */
    class BackingStore
    {
    public:
        virtual ~BackingStore() = default;

        /**
         * @brief Fills exactly @p length bytes starting at the cursor.
         *
         * The cursor advances by @p length. A store that cannot deliver
         * every requested byte must throw; it may not return short.
         *
         * @param dst Destination region of at least @p length bytes.
         * @param length Number of bytes to fill.
         */
        virtual void fetch(uint8_t* dst, size_t length) = 0;

        /**
         * @brief Moves the cursor to an absolute offset. No data transfer.
         * @param offset The absolute byte offset.
         */
        virtual void reposition(int64_t offset) = 0;

        /**
         * @brief Total addressable byte length. Fixed for the store's lifetime.
         */
        virtual int64_t length() const = 0;

        /**
         * @brief Creates a new cursor, positioned at 0, over the same handle.
         *
         * The handle is shared, not duplicated. Cursors obtained this way
         * may be used from different threads if the handle supports
         * concurrent positioned reads.
         */
        virtual std::unique_ptr<BackingStore> clone() const = 0;

        /**
         * @brief Human readable description, used in error messages.
         */
        virtual std::string describe() const = 0;
    };

} // namespace blobio
