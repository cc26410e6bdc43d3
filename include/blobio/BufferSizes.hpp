/**
 * @file BufferSizes.hpp
 * @brief Buffer-size presets and their selection by access pattern.
 */

#pragma once

#include <cstdint>

namespace blobio
{
    /// Default window size.
    inline constexpr int32_t kBufferSize = 1024;

    /// Window size for merges and other bulk scans. Kept modest because
    /// many readers tend to be open at once during a merge.
    inline constexpr int32_t kMergeBufferSize = 4096;

    /// Smallest window a reader accepts (one 64-bit value).
    inline constexpr int32_t kMinBufferSize = 8;

    /**
     * @enum IOContext
     * @brief Hint describing how a reader is about to be used.
     */
    enum class IOContext
    {
        Default,
        Merge,
        Flush,
        Read
    };

    /**
     * @brief Picks the buffer size preset for an access pattern.
     * @param context The intended access pattern.
     * @return kMergeBufferSize for merges, kBufferSize otherwise.
     */
    constexpr int32_t bufferSizeFor(IOContext context)
    {
        switch (context)
        {
            case IOContext::Merge:
                return kMergeBufferSize;
            case IOContext::Default:
            case IOContext::Flush:
            case IOContext::Read:
            default:
                return kBufferSize;
        }
    }

} // namespace blobio
