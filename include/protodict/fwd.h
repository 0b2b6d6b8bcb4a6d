// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file fwd.h
/// @brief Forward declarations for protodict types
///
/// Lets headers declare functions using these types without including the
/// full definitions.

#pragma once

#include <protodict/protodict_config.h>

#include <immer/memory_policy.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace protodict {

// ============================================================
// Memory Policy
// ============================================================

using unsafe_memory_policy = immer::memory_policy<immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
                                                  immer::unsafe_refcount_policy, immer::no_lock_policy>;

using thread_safe_memory_policy = immer::default_memory_policy;

#if PROTODICT_ENABLE_THREAD_SAFE
using memory_policy = thread_safe_memory_policy;
#else
using memory_policy = unsafe_memory_policy;
#endif

/// @brief Byte buffer type for binary serialization
using ByteBuffer = std::vector<uint8_t>;

struct TypedValue;
struct Object;
struct Bytes;
class DomainObject;
class DomainRegistry;
class OrderedMap;
class TypedSequence;
class EmbeddedValue;

using DomainPtr = std::shared_ptr<DomainObject>;

/// Policy for values that cannot be represented
enum class ClassifyMode : uint8_t {
    Strict,   ///< throw TypeError
    Lenient,  ///< substitute an Unsupported marker
};

} // namespace protodict
