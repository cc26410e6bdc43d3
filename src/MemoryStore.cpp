/**
 * @file MemoryStore.cpp
 * @brief Implementation of the MemoryStore class.
 */

#include "blobio/MemoryStore.hpp"
#include "blobio/Errors.hpp"
#include <cstring>
#include <utility>

namespace blobio
{
    MemoryStore::MemoryStore(std::span<const uint8_t> data, std::string name)
        : m_data(data), m_name(std::move(name))
    {
    }

    void MemoryStore::fetch(uint8_t* dst, size_t length)
    {
        int64_t size = static_cast<int64_t>(m_data.size());
        if (m_cursor < 0 || m_cursor > size ||
            static_cast<int64_t>(length) > size - m_cursor)
        {
            throw BackingStoreError(
                "short read from " + m_name + ": wanted " + std::to_string(length) +
                " bytes at offset " + std::to_string(m_cursor) +
                ", size is " + std::to_string(size)
            );
        }
        if (length > 0)
        {
            std::memcpy(dst, m_data.data() + m_cursor, length);
        }
        m_cursor += static_cast<int64_t>(length);
    }

    void MemoryStore::reposition(int64_t offset)
    {
        m_cursor = offset;
    }

    int64_t MemoryStore::length() const
    {
        return static_cast<int64_t>(m_data.size());
    }

    std::unique_ptr<BackingStore> MemoryStore::clone() const
    {
        return std::make_unique<MemoryStore>(m_data, m_name);
    }

    std::string MemoryStore::describe() const
    {
        return m_name;
    }

} // namespace blobio
