/**
 * @file BufferedReader.cpp
 * @brief Implementation of the BufferedReader class.
 */

#include "blobio/BufferedReader.hpp"
#include "blobio/Errors.hpp"
#include "blobio/Logging.hpp"
#include "ByteWindow.hpp"
#include "utils/BinaryIO.hpp"
#include <algorithm>
#include <stdexcept>

namespace blobio
{
    /**
     * @struct BufferedReader::Impl
     * @brief Private implementation (PIMPL) struct for BufferedReader.
     *
     * Invariants kept between calls:
     *  - bufferStart + window.position() is the logical offset;
     *  - bufferStart + window.limit() <= store->length();
     *  - once the window is exhausted (position == limit) the store's
     *    cursor sits at bufferStart + window.limit().
     */
    struct BufferedReader::Impl
    {
        std::unique_ptr<BackingStore> store;
        ByteWindow window; // Empty until the first refill
        int64_t bufferStart = 0;
        int32_t bufferSize;

        Impl(std::unique_ptr<BackingStore> s, int32_t size)
            : store(std::move(s)), bufferSize(size)
        {
            store->reposition(0);
        }

        int64_t position() const
        {
            return bufferStart + window.position();
        }

        /**
         * @brief Loads the next window, starting at the logical offset.
         * @throws EndOfDataError if nothing is left to read.
         */
        void refill();

        /**
         * @brief Maps an absolute offset to a window index covering
         * @p width bytes, reloading the window if needed.
         */
        int32_t resolve(int64_t pos, int32_t width);

        uint8_t readByte()
        {
            if (!window.hasRemaining())
            {
                refill();
            }
            return window.get();
        }
    };

    void BufferedReader::Impl::refill()
    {
        const int64_t start = position();
        const int64_t end = std::min(start + bufferSize, store->length()); // never past EOF
        const int64_t newLength = end - start;
        if (newLength <= 0)
        {
            throw EndOfDataError(store->describe());
        }

        if (!window.isAllocated())
        {
            window.allocate(bufferSize);
            store->reposition(bufferStart);
        }

        try
        {
            store->fetch(window.data(), static_cast<size_t>(newLength));
        }
        catch (...)
        {
            // The region may hold a partial fill; drop it but keep the
            // logical offset where the caller left it.
            bufferStart = start;
            window.clear();
            store->reposition(start);
            throw;
        }

        bufferStart = start;
        window.setLimit(static_cast<int32_t>(newLength));
        window.setPosition(0);

        if (logger().should_log(spdlog::level::trace))
        {
            logger().trace("refill {} [{}, {})", store->describe(), start, end);
        }
    }

    int32_t BufferedReader::Impl::resolve(int64_t pos, int32_t width)
    {
        if (pos < 0)
        {
            throw std::invalid_argument("negative position " + std::to_string(pos));
        }

        const int64_t index = pos - bufferStart;
        if (index >= 0 && index <= window.limit() - width)
        {
            return static_cast<int32_t>(index);
        }

        if (index < 0)
        {
            // Moving backwards: load the page before the current one rather
            // than starting at pos, so a run of small backward steps does not
            // reload the same bytes each time. pos + width must still fit.
            bufferStart = std::max(bufferStart - bufferSize, pos + width - bufferSize);
            bufferStart = std::max<int64_t>(bufferStart, 0);
            bufferStart = std::min(bufferStart, pos);
        }
        else
        {
            bufferStart = pos;
        }

        if (logger().should_log(spdlog::level::trace))
        {
            logger().trace("reload {} at {} for read of {} bytes at {}",
                           store->describe(), bufferStart, width, pos);
        }

        window.clear();
        store->reposition(bufferStart);
        refill();

        const int64_t resolved = pos - bufferStart;
        if (resolved + width > window.limit())
        {
            throw EndOfDataError(store->describe());
        }
        return static_cast<int32_t>(resolved);
    }


    // --- Construction ---

    namespace
    {
        int32_t checkBufferSize(int32_t bufferSize)
        {
            if (bufferSize < kMinBufferSize)
            {
                throw InvalidConfigurationError(
                    "bufferSize must be at least MIN_BUFFER_SIZE (got " +
                    std::to_string(bufferSize) + ")"
                );
            }
            return bufferSize;
        }
    } // namespace

    BufferedReader::BufferedReader(std::unique_ptr<BackingStore> store, int32_t bufferSize)
    {
        if (!store)
        {
            throw std::invalid_argument("BufferedReader requires a backing store");
        }
        m_impl = std::make_unique<Impl>(std::move(store), checkBufferSize(bufferSize));
    }

    BufferedReader::BufferedReader(std::unique_ptr<BackingStore> store, IOContext context)
        : BufferedReader(std::move(store), bufferSizeFor(context))
    {
    }

    BufferedReader::~BufferedReader() = default;

    BufferedReader::BufferedReader(BufferedReader&&) noexcept = default;
    BufferedReader& BufferedReader::operator=(BufferedReader&&) noexcept = default;


    // --- Sequential Reads ---

    uint8_t BufferedReader::readByte()
    {
        return m_impl->readByte();
    }

    void BufferedReader::readBytes(uint8_t* dest, int32_t offset, int32_t length, bool useBuffer)
    {
        if (offset < 0 || length < 0)
        {
            throw std::invalid_argument(
                "invalid readBytes range: offset " + std::to_string(offset) +
                ", length " + std::to_string(length)
            );
        }

        Impl& s = *m_impl;
        int32_t available = s.window.remaining();
        if (length <= available)
        {
            // A zero-length read never touches dest, which may then be null.
            if (length > 0)
            {
                s.window.get(dest + offset, length);
            }
            return;
        }

        // Serve what the window holds first.
        if (available > 0)
        {
            s.window.get(dest + offset, available);
            offset += available;
            length -= available;
        }

        if (useBuffer && length < s.bufferSize)
        {
            s.refill();
            int32_t got = s.window.remaining();
            if (got < length)
            {
                s.window.get(dest + offset, got);
                throw EndOfDataError(s.store->describe());
            }
            s.window.get(dest + offset, length);
            return;
        }

        // Large or unbuffered remainder: fetch straight into dest. The store
        // cursor is already at the logical offset since the window is drained.
        const int64_t after = s.position() + length;
        if (after > s.store->length())
        {
            throw EndOfDataError(s.store->describe());
        }
        s.store->fetch(dest + offset, static_cast<size_t>(length));
        s.bufferStart = after;
        s.window.clear();

        if (logger().should_log(spdlog::level::trace))
        {
            logger().trace("direct read {} [{}, {})", s.store->describe(), after - length, after);
        }
    }

    int16_t BufferedReader::readShort()
    {
        if (static_cast<int32_t>(sizeof(int16_t)) <= m_impl->window.remaining())
        {
            return m_impl->window.getShort();
        }
        uint8_t b[2];
        b[0] = m_impl->readByte();
        b[1] = m_impl->readByte();
        return utils::readLeShort(b);
    }

    int32_t BufferedReader::readInt()
    {
        if (static_cast<int32_t>(sizeof(int32_t)) <= m_impl->window.remaining())
        {
            return m_impl->window.getInt();
        }
        uint8_t b[4];
        for (auto& byte : b) byte = m_impl->readByte();
        return utils::readLeInt(b);
    }

    int64_t BufferedReader::readLong()
    {
        if (static_cast<int32_t>(sizeof(int64_t)) <= m_impl->window.remaining())
        {
            return m_impl->window.getLong();
        }
        uint8_t b[8];
        for (auto& byte : b) byte = m_impl->readByte();
        return utils::readLeLong(b);
    }

    int32_t BufferedReader::readVInt()
    {
        Impl& s = *m_impl;
        if (static_cast<int32_t>(utils::kMaxVIntBytes) <= s.window.remaining())
        {
            // Enough headroom for the longest encoding: no per-byte checks.
            return utils::decodeVInt([&s]() { return s.window.get(); });
        }
        return utils::decodeVInt([&s]() { return s.readByte(); });
    }

    int64_t BufferedReader::readVLong()
    {
        Impl& s = *m_impl;
        if (static_cast<int32_t>(utils::kMaxVLongBytes) <= s.window.remaining())
        {
            return utils::decodeVLong([&s]() { return s.window.get(); });
        }
        return utils::decodeVLong([&s]() { return s.readByte(); });
    }


    // --- Positional Reads ---

    uint8_t BufferedReader::readByte(int64_t pos)
    {
        int32_t index = m_impl->resolve(pos, sizeof(uint8_t));
        return m_impl->window.get(index);
    }

    int16_t BufferedReader::readShort(int64_t pos)
    {
        int32_t index = m_impl->resolve(pos, sizeof(int16_t));
        return m_impl->window.getShort(index);
    }

    int32_t BufferedReader::readInt(int64_t pos)
    {
        int32_t index = m_impl->resolve(pos, sizeof(int32_t));
        return m_impl->window.getInt(index);
    }

    int64_t BufferedReader::readLong(int64_t pos)
    {
        int32_t index = m_impl->resolve(pos, sizeof(int64_t));
        return m_impl->window.getLong(index);
    }


    // --- Cursor ---

    int64_t BufferedReader::getPosition() const
    {
        return m_impl->position();
    }

    void BufferedReader::seek(int64_t pos)
    {
        if (pos < 0)
        {
            throw std::invalid_argument("negative seek position " + std::to_string(pos));
        }

        Impl& s = *m_impl;
        if (pos >= s.bufferStart && pos < s.bufferStart + s.window.limit())
        {
            s.window.setPosition(static_cast<int32_t>(pos - s.bufferStart));
        }
        else
        {
            s.bufferStart = pos;
            s.window.clear(); // next read refills
            s.store->reposition(pos);
        }
    }


    // --- Lifecycle ---

    BufferedReader BufferedReader::clone() const
    {
        const int64_t pos = getPosition();

        BufferedReader copy(m_impl->store->clone(), m_impl->bufferSize);
        copy.m_impl->bufferStart = pos;
        copy.m_impl->store->reposition(pos);

        logger().debug("clone of {} at {}", m_impl->store->describe(), pos);
        return copy;
    }

    int32_t BufferedReader::getBufferSize() const
    {
        return m_impl->bufferSize;
    }

    int64_t BufferedReader::length() const
    {
        return m_impl->store->length();
    }

    std::string BufferedReader::toString() const
    {
        return m_impl->store->describe();
    }

} // namespace blobio
