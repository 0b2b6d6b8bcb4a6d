// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <protodict/errors.h>
#include <protodict/wire_codec.h>

#include <immer/flex_vector_transient.hpp>

#include <bit>
#include <cstring>
#include <limits>
#include <string>

namespace protodict {

// Integers are copied in native byte order
static_assert(std::endian::native == std::endian::little, "wire format is little-endian");

namespace {

// Helper: write bytes to a growing buffer
// memcpy batch writes instead of per-byte push_back
class ByteWriter {
public:
    ByteBuffer buffer;

    void write_u8(uint8_t v) {
        buffer.push_back(v);
    }

    void write_raw(const void* src, std::size_t n) {
        std::size_t old_size = buffer.size();
        buffer.resize(old_size + n);
        if (n > 0) {
            std::memcpy(buffer.data() + old_size, src, n);
        }
    }
};

// Helper: write bytes to a caller-provided buffer
class DirectByteWriter {
public:
    uint8_t* buffer;
    std::size_t capacity;
    std::size_t pos = 0;

    DirectByteWriter(uint8_t* buf, std::size_t cap) : buffer(buf), capacity(cap) {}

    void write_u8(uint8_t v) {
        if (pos >= capacity) throw Error("Buffer overflow");
        buffer[pos++] = v;
    }

    void write_raw(const void* src, std::size_t n) {
        if (pos + n > capacity) throw Error("Buffer overflow");
        if (n > 0) {
            std::memcpy(buffer + pos, src, n);
        }
        pos += n;
    }
};

template <typename Writer>
void write_u32(Writer& w, uint32_t v) {
    w.write_raw(&v, sizeof(v));
}

template <typename Writer>
void write_i64(Writer& w, int64_t v) {
    w.write_raw(&v, sizeof(v));
}

template <typename Writer>
void write_f64(Writer& w, double v) {
    w.write_raw(&v, sizeof(v));
}

uint32_t checked_length(std::size_t n) {
    if (n > std::numeric_limits<uint32_t>::max()) {
        throw Error("length " + std::to_string(n) + " exceeds the 32-bit wire limit");
    }
    return static_cast<uint32_t>(n);
}

template <typename Writer>
void write_blob(Writer& w, const void* data, std::size_t n) {
    write_u32(w, checked_length(n));
    w.write_raw(data, n);
}

template <typename Writer>
void write_string(Writer& w, const std::string& s) {
    write_blob(w, s.data(), s.size());
}

template <typename Writer>
void write_tag(Writer& w, WireTag tag) {
    w.write_u8(static_cast<uint8_t>(tag));
}

template <typename Writer>
void encode_value(Writer& w, const TypedValue& val) {
    std::visit([&w](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            write_tag(w, WireTag::Null);
        } else if constexpr (std::is_same_v<T, bool>) {
            write_tag(w, WireTag::Bool);
            w.write_u8(arg ? 0x01 : 0x00);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            write_tag(w, WireTag::Integer);
            write_i64(w, arg);
        } else if constexpr (std::is_same_v<T, double>) {
            write_tag(w, WireTag::Float);
            write_f64(w, arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            write_tag(w, WireTag::Text);
            write_string(w, arg);
        } else if constexpr (std::is_same_v<T, Bytes>) {
            write_tag(w, WireTag::Bytes);
            write_blob(w, arg.data.data(), arg.data.size());
        } else if constexpr (std::is_same_v<T, DomainValue>) {
            write_tag(w, WireTag::Domain);
            write_string(w, arg.type_name);
            write_blob(w, arg.payload.data(), arg.payload.size());
            w.write_u8(arg.age ? 0x01 : 0x00);
            if (arg.age) {
                write_i64(w, *arg.age);
            }
        } else if constexpr (std::is_same_v<T, Mapping>) {
            write_tag(w, WireTag::Mapping);
            write_u32(w, checked_length(arg.size()));
            for (const auto& entry : arg) {
                write_string(w, entry.key);
                encode_value(w, *entry.value);
            }
        } else if constexpr (std::is_same_v<T, Sequence>) {
            write_tag(w, WireTag::Sequence);
            write_u32(w, checked_length(arg.size()));
            for (const auto& item : arg) {
                encode_value(w, *item);
            }
        } else if constexpr (std::is_same_v<T, Unsupported>) {
            write_tag(w, WireTag::Unsupported);
            write_string(w, arg.description);
        }
    }, val.data);
}

std::size_t calc_encoded_size(const TypedValue& val) {
    std::size_t size = 1; // tag

    std::visit([&size](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            // no body
        } else if constexpr (std::is_same_v<T, bool>) {
            size += 1;
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            size += 8;
        } else if constexpr (std::is_same_v<T, std::string>) {
            size += 4 + arg.size();
        } else if constexpr (std::is_same_v<T, Bytes>) {
            size += 4 + arg.size();
        } else if constexpr (std::is_same_v<T, DomainValue>) {
            size += 4 + arg.type_name.size();
            size += 4 + arg.payload.size();
            size += 1 + (arg.age ? 8 : 0);
        } else if constexpr (std::is_same_v<T, Mapping>) {
            size += 4; // count
            for (const auto& entry : arg) {
                size += 4 + entry.key.size();
                size += calc_encoded_size(*entry.value);
            }
        } else if constexpr (std::is_same_v<T, Sequence>) {
            size += 4; // count
            for (const auto& item : arg) {
                size += calc_encoded_size(*item);
            }
        } else if constexpr (std::is_same_v<T, Unsupported>) {
            size += 4 + arg.description.size();
        }
    }, val.data);

    return size;
}

// Helper: read bytes from buffer; every read is bounds-checked
class ByteReader {
public:
    const uint8_t* data;
    std::size_t size;
    std::size_t pos = 0;

    ByteReader(const uint8_t* d, std::size_t s) : data(d), size(s) {}

    std::size_t remaining() const {
        return size - pos;
    }

    void require(std::size_t n, const char* what) const {
        if (n > remaining()) {
            throw DecodeError(std::string("truncated input reading ") + what + " at offset " +
                              std::to_string(pos));
        }
    }

    uint8_t read_u8(const char* what) {
        require(1, what);
        return data[pos++];
    }

    uint32_t read_u32(const char* what) {
        require(sizeof(uint32_t), what);
        uint32_t v;
        std::memcpy(&v, data + pos, sizeof(v));
        pos += sizeof(v);
        return v;
    }

    int64_t read_i64(const char* what) {
        require(sizeof(int64_t), what);
        int64_t v;
        std::memcpy(&v, data + pos, sizeof(v));
        pos += sizeof(v);
        return v;
    }

    double read_f64(const char* what) {
        require(sizeof(double), what);
        double v;
        std::memcpy(&v, data + pos, sizeof(v));
        pos += sizeof(v);
        return v;
    }

    bool read_flag(const char* what) {
        const std::size_t at = pos;
        uint8_t v = read_u8(what);
        if (v > 1) {
            throw DecodeError(std::string("invalid ") + what + " byte " + std::to_string(v) +
                              " at offset " + std::to_string(at));
        }
        return v == 1;
    }

    std::string read_string(const char* what) {
        uint32_t len = read_u32(what);
        require(len, what);
        std::string s(reinterpret_cast<const char*>(data + pos), len);
        pos += len;
        return s;
    }

    ByteBuffer read_blob(const char* what) {
        uint32_t len = read_u32(what);
        require(len, what);
        ByteBuffer b(data + pos, data + pos + len);
        pos += len;
        return b;
    }

    /// Element count; each element needs at least @p min_element_size bytes
    uint32_t read_count(std::size_t min_element_size, const char* what) {
        uint32_t count = read_u32(what);
        if (static_cast<uint64_t>(count) * min_element_size > remaining()) {
            throw DecodeError(std::string(what) + " count " + std::to_string(count) +
                              " exceeds remaining input");
        }
        return count;
    }
};

TypedValue decode_value(ByteReader& r, const DecodeOptions& options, std::size_t depth) {
    const std::size_t tag_pos = r.pos;
    const uint8_t tag = r.read_u8("tag");

    switch (static_cast<WireTag>(tag)) {
        case WireTag::Null:
            return TypedValue{};

        case WireTag::Bool:
            return TypedValue{r.read_flag("bool")};

        case WireTag::Integer:
            return TypedValue{r.read_i64("integer")};

        case WireTag::Float:
            return TypedValue{r.read_f64("float")};

        case WireTag::Text:
            return TypedValue{r.read_string("text")};

        case WireTag::Bytes:
            return TypedValue{Bytes{r.read_blob("bytes")}};

        case WireTag::Domain: {
            DomainValue value;
            value.type_name = r.read_string("domain type name");
            value.payload   = r.read_blob("domain payload");
            if (r.read_flag("domain age flag")) {
                value.age = r.read_i64("domain age");
            }
            return TypedValue{std::move(value)};
        }

        case WireTag::Mapping:
        case WireTag::Sequence: {
            if (options.max_depth != 0 && depth >= options.max_depth) {
                throw DecodeError("nesting exceeds max_depth " + std::to_string(options.max_depth));
            }
            if (static_cast<WireTag>(tag) == WireTag::Sequence) {
                uint32_t count = r.read_count(1, "sequence");
                auto transient = Sequence{}.transient();
                for (uint32_t i = 0; i < count; ++i) {
                    transient.push_back(TypedValueBox{decode_value(r, options, depth + 1)});
                }
                return TypedValue{transient.persistent()};
            }

            // key length prefix + value tag
            uint32_t count = r.read_count(5, "mapping");
            Mapping result;
            for (uint32_t i = 0; i < count; ++i) {
                std::string key = r.read_string("mapping key");
                if (result.contains(key)) {
                    throw DecodeError("duplicate mapping key '" + key + "'");
                }
                TypedValue value = decode_value(r, options, depth + 1);
                result = result.set(std::move(key), std::move(value));
            }
            return TypedValue{std::move(result)};
        }

        case WireTag::Unsupported:
            return TypedValue{Unsupported{r.read_string("unsupported description")}};
    }

    throw DecodeError("unknown type tag " + std::to_string(tag) + " at offset " + std::to_string(tag_pos));
}

} // anonymous namespace

ByteBuffer encode(const TypedValue& value) {
    ByteWriter w;
    w.buffer.reserve(calc_encoded_size(value));
    encode_value(w, value);
    return std::move(w.buffer);
}

TypedValue decode(const ByteBuffer& buffer, const DecodeOptions& options) {
    return decode(buffer.data(), buffer.size(), options);
}

TypedValue decode(const uint8_t* data, std::size_t size, const DecodeOptions& options) {
    if (size == 0) {
        throw DecodeError("empty input");
    }
    ByteReader r(data, size);
    try {
        TypedValue result = decode_value(r, options, 0);
        if (r.remaining() != 0) {
            throw DecodeError(std::to_string(r.remaining()) + " trailing bytes after value");
        }
        return result;
    } catch (const DecodeError& e) {
        detail::log_error("decode", e.what());
        throw;
    }
}

std::size_t encoded_size(const TypedValue& value) {
    return calc_encoded_size(value);
}

std::size_t encode_to(const TypedValue& value, uint8_t* buffer, std::size_t capacity) {
    std::size_t required = calc_encoded_size(value);
    if (required > capacity) {
        throw Error("Buffer too small: need " + std::to_string(required) +
                    " bytes, got " + std::to_string(capacity));
    }
    DirectByteWriter w(buffer, capacity);
    encode_value(w, value);
    return w.pos;
}

} // namespace protodict
