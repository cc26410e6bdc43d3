/**
 * @file FileStore.hpp
 * @brief BackingStore over an already open POSIX file descriptor.
 */

#pragma once

#include "BackingStore.hpp"
#include <string>

namespace blobio
{
    /**
     * @class FileStore
     * @brief Cursor over a file descriptor, read with pread(2).
     *
     * The descriptor is neither opened nor closed here. Because every
     * fetch is a positioned read, clones of one FileStore can be used
     * concurrently on the same descriptor.
     */
    class FileStore : public BackingStore
    {
    public:
        /**
         * @brief Binds to a descriptor and records its current size.
         * @param fd An open, readable file descriptor.
         * @param name Resource description used in error messages.
         * @throws BackingStoreError if fstat(2) fails.
         */
        FileStore(int fd, std::string name);

        /**
         * @brief Binds to a descriptor whose size is already known.
         *
         * Reads are bounded by @p length rather than the file's current size.
         */
        FileStore(int fd, std::string name, int64_t length);

        void fetch(uint8_t* dst, size_t length) override;
        void reposition(int64_t offset) override;
        int64_t length() const override;
        std::unique_ptr<BackingStore> clone() const override;
        std::string describe() const override;

    private:
        int m_fd;
        std::string m_name;
        int64_t m_length;
        int64_t m_cursor = 0;
    };

} // namespace blobio
