#pragma once
#include <stdexcept>
#include <string>

namespace vecshard {

    class StoreError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Missing or malformed on-disk components, bad configuration.
    class ValidationError : public StoreError {
    public:
        using StoreError::StoreError;
    };

    class DuplicateKeyError : public StoreError {
    public:
        using StoreError::StoreError;
    };

    class DuplicateIdError : public StoreError {
    public:
        using StoreError::StoreError;
    };

    class NotFoundError : public StoreError {
    public:
        using StoreError::StoreError;
    };

    class ReadOnlyError : public StoreError {
    public:
        using StoreError::StoreError;
    };

    class ClosedError : public StoreError {
    public:
        using StoreError::StoreError;
    };

    class DimensionMismatchError : public StoreError {
    public:
        using StoreError::StoreError;
    };

    // Disk, mapping or SQLite failure.
    class IoError : public StoreError {
    public:
        using StoreError::StoreError;
    };

}
