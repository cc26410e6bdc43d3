/**
 * @file MemoryStore.hpp
 * @brief BackingStore over a caller-owned block of memory.
 */

#pragma once

#include "BackingStore.hpp"
#include <span>
#include <string>

namespace blobio
{
    /**
     * @class MemoryStore
     * @brief Cursor over a non-owning view of bytes.
     *
     * The viewed memory must outlive the store and all of its clones.
     */
    class MemoryStore : public BackingStore
    {
    public:
        /**
         * @param data The bytes to serve.
         * @param name Resource description used in error messages.
         */
        explicit MemoryStore(std::span<const uint8_t> data, std::string name = "memory");

        void fetch(uint8_t* dst, size_t length) override;
        void reposition(int64_t offset) override;
        int64_t length() const override;
        std::unique_ptr<BackingStore> clone() const override;
        std::string describe() const override;

        /// @brief Current cursor offset.
        int64_t cursor() const { return m_cursor; }

    private:
        std::span<const uint8_t> m_data;
        std::string m_name;
        int64_t m_cursor = 0;
    };

} // namespace blobio
