// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file wire_codec.h
/// @brief Tag-prefixed binary encoding of TypedValue trees.
///
/// Every value is one tag byte followed by its body. Multi-byte integers
/// are little-endian; strings and byte strings carry a u32 length prefix;
/// containers carry a u32 element count.
///
/// | Tag  | Kind        | Body                                             |
/// |------|-------------|--------------------------------------------------|
/// | 0x00 | Null        | -                                                |
/// | 0x01 | Bool        | u8 (0 or 1)                                      |
/// | 0x02 | Integer     | i64                                              |
/// | 0x03 | Float       | f64                                              |
/// | 0x04 | Text        | u32 length + UTF-8                               |
/// | 0x05 | Bytes       | u32 length + data                                |
/// | 0x06 | DomainValue | name, payload, u8 has_age, [i64 age]             |
/// | 0x07 | Mapping     | u32 count + (key, value)*                        |
/// | 0x08 | Sequence    | u32 count + value*                               |
/// | 0x09 | Unsupported | u32 length + description                         |
///
/// Decoding is all-or-nothing: malformed input throws DecodeError and no
/// partial value is returned.

#pragma once

#include <protodict/protodict_config.h>
#include <protodict/api.h>
#include <protodict/fwd.h>
#include <protodict/typed_value.h>

#include <cstddef>
#include <cstdint>

namespace protodict {

enum class WireTag : uint8_t {
    Null        = 0x00,
    Bool        = 0x01,
    Integer     = 0x02,
    Float       = 0x03,
    Text        = 0x04,
    Bytes       = 0x05,
    Domain      = 0x06,
    Mapping     = 0x07,
    Sequence    = 0x08,
    Unsupported = 0x09,
};

struct DecodeOptions {
    /// Maximum container nesting accepted; 0 means unlimited.
    /// Set a bound when decoding untrusted bytes.
    std::size_t max_depth = 0;
};

/// Encode a TypedValue to bytes
[[nodiscard]] PROTODICT_API ByteBuffer encode(const TypedValue& value);

/// Decode bytes to a TypedValue; throws DecodeError
[[nodiscard]] PROTODICT_API TypedValue decode(const ByteBuffer& buffer, const DecodeOptions& options = {});

[[nodiscard]] PROTODICT_API TypedValue decode(const uint8_t* data,
                                              std::size_t size,
                                              const DecodeOptions& options = {});

/// Exact number of bytes encode() produces for @p value
[[nodiscard]] PROTODICT_API std::size_t encoded_size(const TypedValue& value);

/// Encode into a caller-provided buffer.
/// @return bytes written
/// @throws Error if @p capacity is smaller than encoded_size(value)
PROTODICT_API std::size_t encode_to(const TypedValue& value, uint8_t* buffer, std::size_t capacity);

} // namespace protodict
