/**
 * @file ByteWindow.hpp
 * @brief Internal owning byte region with an explicit position and limit.
 *
 * This class holds the reader's single window over the backing store.
 * It owns its memory, which is allocated lazily, and exposes relative
 * reads (advancing the position) as well as absolute reads by index.
 * It is an internal implementation detail of BufferedReader.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include "utils/BinaryIO.hpp"

namespace blobio
{
    class ByteWindow
    {
    public:
        ByteWindow() = default;

        ByteWindow(ByteWindow&&) noexcept = default;
        ByteWindow& operator=(ByteWindow&&) noexcept = default;

        ByteWindow(const ByteWindow&) = delete;
        ByteWindow& operator=(const ByteWindow&) = delete;

        /**
         * @brief Allocates the backing memory. Position and limit are reset.
         * @param capacity Number of bytes the window can hold.
         */
        void allocate(int32_t capacity)
        {
            m_data = std::make_unique<uint8_t[]>(static_cast<size_t>(capacity));
            m_capacity = capacity;
            m_position = 0;
            m_limit = 0;
        }

        bool isAllocated() const { return m_data != nullptr; }

        int32_t capacity() const { return m_capacity; }
        int32_t position() const { return m_position; }
        int32_t limit() const { return m_limit; }
        int32_t remaining() const { return m_limit - m_position; }
        bool hasRemaining() const { return m_position < m_limit; }

        /**
         * @brief Sets the cursor. Caller guarantees 0 <= position <= limit.
         */
        void setPosition(int32_t position) { m_position = position; }

        /**
         * @brief Sets the valid length, pulling the position back if it
         * would lie beyond the new limit.
         */
        void setLimit(int32_t limit)
        {
            m_limit = limit;
            if (m_position > limit) m_position = limit;
        }

        /**
         * @brief Marks the window as empty so the next read triggers a refill.
         */
        void clear()
        {
            m_position = 0;
            m_limit = 0;
        }

        /// @brief Writable pointer to the start of the region, for refills.
        uint8_t* data() { return m_data.get(); }

        // --- Relative reads (advance the position) ---

        uint8_t get()
        {
            return m_data[m_position++];
        }

        int16_t getShort()
        {
            int16_t v = utils::readLeShort(m_data.get() + m_position);
            m_position += 2;
            return v;
        }

        int32_t getInt()
        {
            int32_t v = utils::readLeInt(m_data.get() + m_position);
            m_position += 4;
            return v;
        }

        int64_t getLong()
        {
            int64_t v = utils::readLeLong(m_data.get() + m_position);
            m_position += 8;
            return v;
        }

        /**
         * @brief Copies @p length bytes out of the window and advances.
         */
        void get(uint8_t* dest, int32_t length)
        {
            std::memcpy(dest, m_data.get() + m_position, static_cast<size_t>(length));
            m_position += length;
        }

        // --- Absolute reads (position unchanged) ---

        uint8_t get(int32_t index) const { return m_data[index]; }

        int16_t getShort(int32_t index) const
        {
            return utils::readLeShort(m_data.get() + index);
        }

        int32_t getInt(int32_t index) const
        {
            return utils::readLeInt(m_data.get() + index);
        }

        int64_t getLong(int32_t index) const
        {
            return utils::readLeLong(m_data.get() + index);
        }

    private:
        std::unique_ptr<uint8_t[]> m_data;
        int32_t m_capacity = 0;
        int32_t m_position = 0;
        int32_t m_limit = 0;
    };

} // namespace blobio
