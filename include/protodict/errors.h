// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types thrown by protodict.
///
/// Every error derives from protodict::Error, itself a std::runtime_error,
/// so callers can catch the whole family at once.

#pragma once

#include <protodict/api.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace protodict {

class PROTODICT_API Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A value's runtime type cannot be classified (strict mode only).
class PROTODICT_API TypeError : public Error {
public:
    using Error::Error;
};

/// Wire bytes are malformed or truncated.
class PROTODICT_API DecodeError : public Error {
public:
    using Error::Error;
};

/// Missing mapping key on read.
class PROTODICT_API KeyError : public Error {
public:
    explicit KeyError(std::string key)
        : Error("key not found: '" + key + "'")
        , key_(std::move(key))
    {}

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/// Out-of-range sequence index.
class PROTODICT_API IndexError : public Error {
public:
    IndexError(std::size_t index, std::size_t size)
        : Error("index " + std::to_string(index) + " out of range (size " + std::to_string(size) + ")")
        , index_(index)
        , size_(size)
    {}

    [[nodiscard]] std::size_t index() const noexcept { return index_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

private:
    std::size_t index_;
    std::size_t size_;
};

/// A value cannot be coerced into a constrained sequence's element type.
class PROTODICT_API ValueError : public Error {
public:
    using Error::Error;
};

} // namespace protodict
