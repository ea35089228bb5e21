#pragma once
#include <stdexcept>
#include <string>

namespace rcache {

    // Base of every error raised by the cache layer.
    class CacheError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Transport or connection failure, including pool acquisition and I/O timeouts.
    class StoreUnavailable : public CacheError {
    public:
        using CacheError::CacheError;
    };

    // Value could not be encoded, or stored bytes could not be decoded.
    class SerializationError : public CacheError {
    public:
        using CacheError::CacheError;
    };

    // A region or factory was used before it was properly initialized.
    class RegionStateError : public CacheError {
    public:
        using CacheError::CacheError;
    };

    // An explicit commit lost an optimistic-concurrency race.
    class TransactionAborted : public CacheError {
    public:
        using CacheError::CacheError;
    };

    // The store answered with an error reply (-ERR, -WRONGTYPE, -EXECABORT ...).
    class CommandError : public CacheError {
    public:
        using CacheError::CacheError;
    };

} // namespace rcache
