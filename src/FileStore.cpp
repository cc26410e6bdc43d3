/**
 * @file FileStore.cpp
 * @brief Implementation of the FileStore class.
 */

#include "blobio/FileStore.hpp"
#include "blobio/Errors.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <utility>

namespace blobio
{
    namespace
    {
        int64_t descriptorSize(int fd, const std::string& name)
        {
            struct stat st;
            if (::fstat(fd, &st) != 0)
            {
                throw BackingStoreError("fstat failed for '" + name + "': " + std::strerror(errno));
            }
            return static_cast<int64_t>(st.st_size);
        }
    } // namespace

    FileStore::FileStore(int fd, std::string name)
        : m_fd(fd), m_name(std::move(name)), m_length(descriptorSize(fd, m_name))
    {
    }

    FileStore::FileStore(int fd, std::string name, int64_t length)
        : m_fd(fd), m_name(std::move(name)), m_length(length)
    {
    }

    void FileStore::fetch(uint8_t* dst, size_t length)
    {
        size_t done = 0;
        while (done < length)
        {
            ssize_t n = ::pread(m_fd, dst + done, length - done,
                                static_cast<off_t>(m_cursor + static_cast<int64_t>(done)));
            if (n < 0)
            {
                if (errno == EINTR) continue;
                throw BackingStoreError("pread failed for '" + m_name + "': " + std::strerror(errno));
            }
            if (n == 0)
            {
                throw BackingStoreError(
                    "short read from '" + m_name + "': wanted " + std::to_string(length) +
                    " bytes at offset " + std::to_string(m_cursor) +
                    ", got " + std::to_string(done)
                );
            }
            done += static_cast<size_t>(n);
        }
        m_cursor += static_cast<int64_t>(length);
    }

    void FileStore::reposition(int64_t offset)
    {
        m_cursor = offset;
    }

    int64_t FileStore::length() const
    {
        return m_length;
    }

    std::unique_ptr<BackingStore> FileStore::clone() const
    {
        // Same descriptor, same recorded length, fresh cursor.
        return std::make_unique<FileStore>(m_fd, m_name, m_length);
    }

    std::string FileStore::describe() const
    {
        return m_name;
    }

} // namespace blobio
