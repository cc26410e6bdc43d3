/**
 * @file Errors.hpp
 * @brief Exception types raised by the reader and the stock stores.
 *
 * All errors are reported synchronously by throwing. The reader never
 * retries and never wraps an exception thrown by a backing store; it
 * simply lets it propagate.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace blobio
{
    /**
     * @class EndOfDataError
     * @brief A read needed bytes beyond the end of the backing store.
     *
     * Bytes already copied into a caller buffer before the shortfall was
     * detected remain copied.
     */
    class EndOfDataError : public std::runtime_error
    {
    public:
        EndOfDataError()
            : std::runtime_error("read past EOF") {}

        explicit EndOfDataError(const std::string& resource)
            : std::runtime_error("read past EOF: " + resource) {}
    };

    /**
     * @class MalformedVarintError
     * @brief A vInt or vLong encoding carries more bits than its type allows.
     */
    class MalformedVarintError : public std::runtime_error
    {
    public:
        explicit MalformedVarintError(const std::string& what)
            : std::runtime_error(what) {}
    };

    /**
     * @class InvalidConfigurationError
     * @brief A reader was constructed with an unusable buffer size.
     */
    class InvalidConfigurationError : public std::invalid_argument
    {
    public:
        explicit InvalidConfigurationError(const std::string& what)
            : std::invalid_argument(what) {}
    };

    /**
     * @class BackingStoreError
     * @brief I/O failure raised by a stock backing store.
     *
     * Custom stores may throw any exception type; the reader does not
     * depend on this one.
     */
    class BackingStoreError : public std::runtime_error
    {
    public:
        explicit BackingStoreError(const std::string& what)
            : std::runtime_error(what) {}
    };

} // namespace blobio
